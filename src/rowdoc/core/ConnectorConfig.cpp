#include "rowdoc/core/ConnectorConfig.hpp"
#include "rowdoc/core/Exception.hpp"
#include <algorithm>
#include <cctype>

namespace rowdoc {
namespace core {

namespace {

bool isBlank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](char c) {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    });
}

} // namespace

const char* toString(ExtMetadataType type) noexcept {
    switch (type) {
        case ExtMetadataType::None:        return ExtMetadataTypeNames::NO_EXT_METADATA;
        case ExtMetadataType::CompleteUrl: return ExtMetadataTypeNames::COMPLETE_URL;
        case ExtMetadataType::DocId:       return ExtMetadataTypeNames::DOC_ID;
        case ExtMetadataType::Lob:         return ExtMetadataTypeNames::BLOB_CLOB;
    }
    return ExtMetadataTypeNames::NO_EXT_METADATA;
}

std::optional<ExtMetadataType> parseExtMetadataType(const std::string& name) {
    if (isBlank(name) || equalsIgnoreCase(name, ExtMetadataTypeNames::NO_EXT_METADATA)) {
        return ExtMetadataType::None;
    }
    if (equalsIgnoreCase(name, ExtMetadataTypeNames::COMPLETE_URL)) {
        return ExtMetadataType::CompleteUrl;
    }
    if (equalsIgnoreCase(name, ExtMetadataTypeNames::DOC_ID)) {
        return ExtMetadataType::DocId;
    }
    if (equalsIgnoreCase(name, ExtMetadataTypeNames::BLOB_CLOB)) {
        return ExtMetadataType::Lob;
    }
    return std::nullopt;
}

bool TraversalContext::isMimeTypeExcluded(const std::string& mime_type) const {
    return std::any_of(excluded_mime_types.begin(), excluded_mime_types.end(),
                       [&](const std::string& excluded) {
                           return equalsIgnoreCase(excluded, mime_type);
                       });
}

PrimaryKey ConnectorConfig::getPrimaryKeyColumns(const Row& row) const {
    PrimaryKey key;
    key.reserve(primary_keys.size());
    for (const auto& configured : primary_keys) {
        auto actual = row.resolveColumn(configured);
        if (!actual) {
            throw RowException("Primary key column not found in row",
                               configured, ErrorCode::MissingPrimaryKeyColumn, __FILE__, __LINE__);
        }
        key.push_back(*actual);
    }
    return key;
}

void ConnectorConfig::validate() const {
    if (isBlank(connector_name)) {
        throw ConfigException("Connector name must not be empty",
                              "connector_name", ErrorCode::InvalidConfiguration, __FILE__, __LINE__);
    }
    if (primary_keys.empty()) {
        throw ConfigException("At least one primary key column is required",
                              "primary_keys", ErrorCode::InvalidConfiguration, __FILE__, __LINE__);
    }
    for (const auto& key : primary_keys) {
        if (isBlank(key)) {
            throw ConfigException("Primary key column name must not be blank",
                                  "primary_keys", ErrorCode::InvalidConfiguration, __FILE__, __LINE__);
        }
    }
}

bool ConnectorConfig::isConfigured(const std::optional<std::string>& field) {
    return field.has_value() && !isBlank(*field);
}

}} // namespace rowdoc::core
