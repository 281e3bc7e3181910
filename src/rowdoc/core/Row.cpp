#include "rowdoc/core/Row.hpp"
#include <algorithm>
#include <cctype>

namespace rowdoc {
namespace core {

bool equalsIgnoreCase(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

Row::Row(std::initializer_list<Column> columns) {
    columns_.reserve(columns.size());
    for (const auto& column : columns) {
        set(column.first, column.second);
    }
}

Row& Row::set(const std::string& name, Value value) {
    for (auto& column : columns_) {
        if (column.first == name) {
            column.second = std::move(value);
            return *this;
        }
    }
    columns_.emplace_back(name, std::move(value));
    return *this;
}

const Value* Row::find(const std::string& name) const {
    for (const auto& column : columns_) {
        if (column.first == name) {
            return &column.second;
        }
    }
    return nullptr;
}

std::optional<std::string> Row::resolveColumn(const std::string& name) const {
    if (find(name)) {
        return name;
    }
    for (const auto& column : columns_) {
        if (equalsIgnoreCase(column.first, name)) {
            return column.first;
        }
    }
    return std::nullopt;
}

std::vector<std::string> Row::columnNames() const {
    std::vector<std::string> names;
    names.reserve(columns_.size());
    for (const auto& column : columns_) {
        names.push_back(column.first);
    }
    return names;
}

}} // namespace rowdoc::core
