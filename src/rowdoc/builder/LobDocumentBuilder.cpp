#include "rowdoc/builder/LobDocumentBuilder.hpp"
#include "rowdoc/core/Exception.hpp"
#include "rowdoc/utils/Digest.hpp"
#include "rowdoc/utils/MimeSniffer.hpp"
#include "rowdoc/utils/ModuleLoggers.hpp"
#include <fmt/format.h>

namespace rowdoc {
namespace builder {

LobDocumentBuilder::LobDocumentBuilder(std::shared_ptr<const core::ConnectorConfig> config,
                                       std::shared_ptr<const xml::RowSerializer> serializer)
    : support_(std::move(config), std::move(serializer)) {
    if (!core::ConnectorConfig::isConfigured(support_.config().lob_field)) {
        throw core::ConfigException("Large object column is not configured", "lob_field",
                                    core::ErrorCode::InvalidConfiguration, __FILE__, __LINE__);
    }
    lob_column_ = *support_.config().lob_field;
}

ContentHolder LobDocumentBuilder::getContentHolder(const core::Row& row,
                                                   const core::PrimaryKey& /*primary_key*/,
                                                   const std::string& doc_id) const {
    const std::string xml_doc = support_.getXmlDoc(row, {lob_column_});
    core::LargeObjectPtr lob = getLargeObject(row);

    ContentHolder holder;
    if (!lob) {
        BUILDER_DEBUG("Large object column {} is null for {}, metadata only", lob_column_, doc_id);
        holder.checksum = BuilderSupport::checksum(xml_doc);
        return holder;
    }

    utils::Sha1Digest digest;
    std::string head;
    std::uint64_t size = 0;
    {
        // 流在作用域结束（包括异常）时关闭
        std::unique_ptr<std::istream> in = lob->open();
        size = digest.update(*in, &head, utils::MimeSniffer::kSniffLength);
    }
    digest.update(xml_doc);
    holder.checksum = digest.finishHex();

    const std::string mime_type = detectMimeType(head, lob->kind());
    holder.mime_type = mime_type;

    const core::TraversalContext& traversal = support_.config().traversal;
    if (size > traversal.max_document_size) {
        holder.body_skipped_reason = fmt::format("content size {} exceeds limit {}",
                                                 size, traversal.max_document_size);
    } else if (traversal.isMimeTypeExcluded(mime_type)) {
        holder.body_skipped_reason = fmt::format("MIME type {} is excluded", mime_type);
    }

    if (holder.body_skipped_reason) {
        BUILDER_WARN("Skipping content of {} (column {}): {}; sending metadata only",
                     doc_id, lob_column_, *holder.body_skipped_reason);
    } else {
        holder.content = std::move(lob);
    }
    return holder;
}

core::Document LobDocumentBuilder::getDocument(const core::Row& row, const std::string& doc_id,
                                               const ContentHolder& content) const {
    core::Document doc;
    doc.setProperty(core::PropertyNames::DOCID, doc_id);
    support_.setMetaInfo(doc, row, {lob_column_});
    support_.setLastModified(doc, row);
    doc.setProperty(core::PropertyNames::DISPLAYURL, support_.getDisplayUrl(doc_id));
    if (content.hasContent()) {
        if (content.mime_type) {
            doc.setProperty(core::PropertyNames::MIMETYPE, *content.mime_type);
        }
        doc.setContent(content.content);
    }
    return doc;
}

core::LargeObjectPtr LobDocumentBuilder::getLargeObject(const core::Row& row) const {
    auto column = row.resolveColumn(lob_column_);
    if (!column) {
        throw core::RowException("Large object column not found in row", lob_column_,
                                 core::ErrorCode::MissingColumn, __FILE__, __LINE__);
    }
    const core::Value* value = row.find(*column);
    switch (value->type()) {
        case core::Value::Type::Null:
            return nullptr;
        case core::Value::Type::LargeObject:
            return value->asLargeObject();
        case core::Value::Type::String:
            return core::makeClob(value->asString());
        default:
            throw core::SerializationException(
                fmt::format("Unsupported large object value type {}",
                            core::Value::typeName(value->type())),
                *column, core::ErrorCode::UnsupportedValueType, __FILE__, __LINE__);
    }
}

std::string LobDocumentBuilder::detectMimeType(const std::string& head,
                                               core::LargeObject::Kind kind) const {
    if (auto sniffed = utils::MimeSniffer::sniff(head)) {
        return *sniffed;
    }
    if (core::ConnectorConfig::isConfigured(support_.config().lob_mime_type)) {
        return *support_.config().lob_mime_type;
    }
    return kind == core::LargeObject::Kind::Character ? kCharacterMimeType : kBinaryMimeType;
}

}} // namespace rowdoc::builder
