#include "rowdoc/builder/UrlDocumentBuilder.hpp"
#include "rowdoc/core/Exception.hpp"
#include "rowdoc/utils/ModuleLoggers.hpp"

namespace rowdoc {
namespace builder {

UrlDocumentBuilder::UrlDocumentBuilder(std::shared_ptr<const core::ConnectorConfig> config,
                                       std::shared_ptr<const xml::RowSerializer> serializer,
                                       UrlType url_type)
    : support_(std::move(config), std::move(serializer)), url_type_(url_type) {
    const auto& field = url_type_ == UrlType::CompleteUrl
        ? support_.config().document_url_field
        : support_.config().document_id_field;
    if (!core::ConnectorConfig::isConfigured(field)) {
        throw core::ConfigException("URL source column is not configured",
                                    url_type_ == UrlType::CompleteUrl ? "document_url_field" : "document_id_field",
                                    core::ErrorCode::InvalidConfiguration, __FILE__, __LINE__);
    }
    url_column_ = *field;
}

ContentHolder UrlDocumentBuilder::getContentHolder(const core::Row& row,
                                                   const core::PrimaryKey& /*primary_key*/,
                                                   const std::string& doc_id) const {
    ContentHolder holder;
    holder.checksum = support_.getChecksum(row);
    holder.reference_url = getReferenceUrl(row);

    BUILDER_TRACE("Reference URL for {}: {}", doc_id, *holder.reference_url);
    return holder;
}

core::Document UrlDocumentBuilder::getDocument(const core::Row& row, const std::string& doc_id,
                                               const ContentHolder& content) const {
    const std::string url = content.reference_url ? *content.reference_url : getReferenceUrl(row);

    core::Document doc;
    doc.setProperty(core::PropertyNames::DOCID, doc_id);
    support_.setMetaInfo(doc, row, {url_column_});
    support_.setLastModified(doc, row);
    doc.setProperty(core::PropertyNames::SEARCHURL, url);
    doc.setProperty(core::PropertyNames::DISPLAYURL, url);
    return doc;
}

std::string UrlDocumentBuilder::getReferenceUrl(const core::Row& row) const {
    auto column = row.resolveColumn(url_column_);
    if (!column) {
        throw core::RowException("URL column not found in row", url_column_,
                                 core::ErrorCode::MissingColumn, __FILE__, __LINE__);
    }
    const core::Value* value = row.find(*column);
    if (value->isNull()) {
        throw core::RowException("URL column value is null", *column,
                                 core::ErrorCode::MissingColumn, __FILE__, __LINE__);
    }
    if (value->isLargeObject()) {
        throw core::SerializationException("Large object cannot be used as a URL", *column,
                                           core::ErrorCode::UnsupportedValueType, __FILE__, __LINE__);
    }

    if (url_type_ == UrlType::CompleteUrl) {
        return value->toString();
    }
    return support_.config().base_url + value->toString();
}

}} // namespace rowdoc::builder
