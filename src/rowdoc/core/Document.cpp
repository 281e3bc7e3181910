#include "rowdoc/core/Document.hpp"
#include "rowdoc/core/Exception.hpp"

namespace rowdoc {
namespace core {

void Document::setProperty(const std::string& name, const std::string& value) {
    for (auto& property : properties_) {
        if (property.first == name) {
            property.second.assign(1, value);
            return;
        }
    }
    properties_.emplace_back(name, std::vector<std::string>{value});
}

void Document::addProperty(const std::string& name, const std::string& value) {
    for (auto& property : properties_) {
        if (property.first == name) {
            property.second.push_back(value);
            return;
        }
    }
    properties_.emplace_back(name, std::vector<std::string>{value});
}

std::optional<std::string> Document::findProperty(const std::string& name) const {
    const auto* values = findValues(name);
    if (!values || values->empty()) {
        return std::nullopt;
    }
    return values->front();
}

const std::vector<std::string>* Document::findValues(const std::string& name) const {
    for (const auto& property : properties_) {
        if (property.first == name) {
            return &property.second;
        }
    }
    return nullptr;
}

std::vector<std::string> Document::getPropertyNames() const {
    std::vector<std::string> names;
    names.reserve(properties_.size());
    for (const auto& property : properties_) {
        names.push_back(property.first);
    }
    return names;
}

std::unique_ptr<std::istream> Document::openContent() const {
    if (!content_) {
        throw ContentException("Document has no content", findProperty(PropertyNames::DOCID).value_or(""),
                               ErrorCode::ContentUnavailable, __FILE__, __LINE__);
    }
    return content_->open();
}

std::string Document::readContent() const {
    auto stream = openContent();
    return readAll(*stream, content_->describe());
}

}} // namespace rowdoc::core
