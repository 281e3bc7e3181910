#include "rowdoc/builder/BuilderSupport.hpp"
#include "rowdoc/core/Exception.hpp"
#include "rowdoc/utils/Digest.hpp"
#include "rowdoc/utils/ModuleLoggers.hpp"
#include <fmt/format.h>

namespace rowdoc {
namespace builder {

BuilderSupport::BuilderSupport(std::shared_ptr<const core::ConnectorConfig> config,
                               std::shared_ptr<const xml::RowSerializer> serializer)
    : config_(std::move(config)), serializer_(std::move(serializer)) {
    if (!config_ || !serializer_) {
        throw core::RowDocException("Builder requires a configuration and a row serializer",
                                    core::ErrorCode::InvalidArgument, __FILE__, __LINE__);
    }
    skip_columns_ = config_->skip_columns;
    if (core::ConnectorConfig::isConfigured(config_->last_modified_field)) {
        skip_columns_.push_back(*config_->last_modified_field);
    }
}

std::string BuilderSupport::getXmlDoc(const core::Row& row,
                                      const std::vector<std::string>& own_columns) const {
    if (own_columns.empty()) {
        return serializer_->serialize(config_->connector_name, row, skip_columns_);
    }
    std::vector<std::string> excluded = skip_columns_;
    excluded.insert(excluded.end(), own_columns.begin(), own_columns.end());
    return serializer_->serialize(config_->connector_name, row, excluded);
}

std::string BuilderSupport::getChecksum(const core::Row& row) const {
    return checksum(getXmlDoc(row));
}

std::string BuilderSupport::getDisplayUrl(const std::string& doc_id) const {
    return fmt::format("dbconnector://{}.localhost/{}", config_->connector_name, doc_id);
}

void BuilderSupport::setMetaInfo(core::Document& doc, const core::Row& row,
                                 const std::vector<std::string>& own_columns) const {
    for (const auto& column : row) {
        const std::string& name = column.first;
        const core::Value& value = column.second;

        if (xml::isExcludedColumn(name, skip_columns_) || xml::isExcludedColumn(name, own_columns)) {
            BUILDER_DEBUG("Skipping metadata indexing of column {}", name);
            continue;
        }
        if (value.isNull()) {
            BUILDER_TRACE("Column {} is null, no metadata", name);
            continue;
        }
        if (value.isLargeObject()) {
            BUILDER_DEBUG("Skipping large object column {} as metadata", name);
            continue;
        }
        doc.addProperty(name, value.toString());
    }
}

void BuilderSupport::setLastModified(core::Document& doc, const core::Row& row) const {
    if (!core::ConnectorConfig::isConfigured(config_->last_modified_field)) {
        return;
    }
    auto column = row.resolveColumn(*config_->last_modified_field);
    if (!column) {
        return;
    }
    const core::Value* value = row.find(*column);
    if (value && value->isTimestamp()) {
        doc.setProperty(core::PropertyNames::LASTMODIFIED, value->asTimestamp().toIso8601());
    }
}

std::string BuilderSupport::checksum(std::string_view bytes) {
    return utils::Sha1Digest::hex(bytes);
}

}} // namespace rowdoc::builder
