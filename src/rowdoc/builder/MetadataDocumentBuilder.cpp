#include "rowdoc/builder/MetadataDocumentBuilder.hpp"
#include "rowdoc/core/LargeObject.hpp"
#include "rowdoc/utils/ModuleLoggers.hpp"

namespace rowdoc {
namespace builder {

MetadataDocumentBuilder::MetadataDocumentBuilder(std::shared_ptr<const core::ConnectorConfig> config,
                                                 std::shared_ptr<const xml::RowSerializer> serializer)
    : support_(std::move(config), std::move(serializer)) {
}

ContentHolder MetadataDocumentBuilder::getContentHolder(const core::Row& row,
                                                        const core::PrimaryKey& /*primary_key*/,
                                                        const std::string& doc_id) const {
    std::string xml_doc = support_.getXmlDoc(row);

    ContentHolder holder;
    holder.checksum = BuilderSupport::checksum(xml_doc);
    holder.content = core::makeClob(std::move(xml_doc));
    holder.mime_type = core::PropertyNames::DEFAULT_MIMETYPE;

    BUILDER_TRACE("Metadata content for {}: {} bytes, sum {}", doc_id,
                  holder.content->size(), holder.checksum);
    return holder;
}

core::Document MetadataDocumentBuilder::getDocument(const core::Row& row, const std::string& doc_id,
                                                    const ContentHolder& content) const {
    core::Document doc;
    doc.setProperty(core::PropertyNames::DOCID, doc_id);
    support_.setMetaInfo(doc, row);
    support_.setLastModified(doc, row);
    doc.setProperty(core::PropertyNames::MIMETYPE,
                    content.mime_type.value_or(core::PropertyNames::DEFAULT_MIMETYPE));
    doc.setProperty(core::PropertyNames::DISPLAYURL, support_.getDisplayUrl(doc_id));
    doc.setContent(content.content);
    return doc;
}

}} // namespace rowdoc::builder
