#include "XMLStreamWriter.hpp"
#include "rowdoc/core/Exception.hpp"
#include "rowdoc/utils/ModuleLoggers.hpp"
#include <fmt/format.h>

namespace rowdoc {
namespace xml {

namespace {

void requireName(std::string_view name, const char* what) {
    if (name.empty()) {
        throw core::RowDocException(std::string(what) + " name cannot be empty",
                                    core::ErrorCode::InvalidArgument, __FILE__, __LINE__);
    }
}

void requireValidChars(std::string_view text, const char* where) {
    const size_t pos = XMLStreamWriter::findInvalidChar(text);
    if (pos != std::string_view::npos) {
        throw core::SerializationException(
            fmt::format("{} contains character 0x{:02x} at offset {}, which is not allowed in XML",
                        where, static_cast<unsigned>(static_cast<unsigned char>(text[pos])), pos),
            "", core::ErrorCode::SerializationFailure, __FILE__, __LINE__);
    }
}

} // namespace

XMLStreamWriter::~XMLStreamWriter() {
    if (!open_.empty()) {
        XML_DEBUG("XML writer discarded with {} open elements, innermost <{}>", open_.size(), open_.back());
    }
}

void XMLStreamWriter::startDocument(std::string_view encoding) {
    out_ += "<?xml version=\"1.0\" encoding=\"";
    out_ += encoding;
    out_ += "\"?>\n";
}

void XMLStreamWriter::endDocument() {
    if (!open_.empty()) {
        XML_DEBUG("Closing {} open elements at end of document", open_.size());
    }
    while (!open_.empty()) {
        endElement();
    }
}

void XMLStreamWriter::startElement(std::string_view name) {
    requireName(name, "Element");
    closeStartTag();
    out_ += '<';
    out_ += name;
    open_.emplace_back(name);
    start_tag_open_ = true;
}

void XMLStreamWriter::endElement() {
    if (open_.empty()) {
        throw core::RowDocException("endElement without matching startElement",
                                    core::ErrorCode::InvalidArgument, __FILE__, __LINE__);
    }
    if (start_tag_open_) {
        out_ += " />";
        start_tag_open_ = false;
    } else {
        out_ += "</";
        out_ += open_.back();
        out_ += '>';
    }
    open_.pop_back();
}

void XMLStreamWriter::writeEmptyElement(std::string_view name) {
    startElement(name);
    endElement();
}

void XMLStreamWriter::writeAttribute(std::string_view name, std::string_view value) {
    if (!start_tag_open_) {
        throw core::RowDocException("Attribute written outside of a start tag",
                                    core::ErrorCode::InvalidArgument, __FILE__, __LINE__);
    }
    requireName(name, "Attribute");
    requireValidChars(value, "Attribute value");

    out_ += ' ';
    out_ += name;
    out_ += "=\"";
    appendEscaped(value);
    out_ += '"';
}

void XMLStreamWriter::writeText(std::string_view text) {
    if (text.empty()) {
        return;
    }
    requireValidChars(text, "Text");
    closeStartTag();
    appendEscaped(text);
}

size_t XMLStreamWriter::findInvalidChar(std::string_view text) {
    for (size_t i = 0; i < text.size(); ++i) {
        const auto c = static_cast<unsigned char>(text[i]);
        if (c < 0x20 && c != '\t' && c != '\n' && c != '\r') {
            return i;
        }
    }
    return std::string_view::npos;
}

void XMLStreamWriter::closeStartTag() {
    if (start_tag_open_) {
        out_ += '>';
        start_tag_open_ = false;
    }
}

void XMLStreamWriter::appendEscaped(std::string_view text) {
    for (char c : text) {
        switch (c) {
            case '<':  out_ += "&lt;";   break;
            case '>':  out_ += "&gt;";   break;
            case '&':  out_ += "&amp;";  break;
            case '"':  out_ += "&quot;"; break;
            case '\'': out_ += "&apos;"; break;
            default:   out_ += c;        break;
        }
    }
}

}} // namespace rowdoc::xml
