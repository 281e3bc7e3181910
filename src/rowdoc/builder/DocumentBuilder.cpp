#include "rowdoc/builder/DocumentBuilder.hpp"
#include "rowdoc/builder/Snapshot.hpp"
#include "rowdoc/core/Exception.hpp"
#include "rowdoc/utils/DocIdUtil.hpp"
#include "rowdoc/utils/ModuleLoggers.hpp"

namespace rowdoc {
namespace builder {

Snapshot buildSnapshot(const DocumentBuilderPtr& builder, const core::Row& row) {
    if (!builder) {
        throw core::RowDocException("Document builder is null",
                                    core::ErrorCode::InvalidArgument, __FILE__, __LINE__);
    }

    core::PrimaryKey primary_key = configOf(*builder).getPrimaryKeyColumns(row);
    std::string doc_id = utils::DocIdUtil::generateDocId(primary_key, row);

    ContentHolder content;
    try {
        content = std::visit([&](const auto& strategy) {
            return strategy.getContentHolder(row, primary_key, doc_id);
        }, *builder);
    } catch (core::RowDocException& e) {
        e.addContext("document " + doc_id);
        throw;
    }

    std::string json = Snapshot::makeJson(doc_id, content.checksum);
    std::shared_ptr<const DocumentHolder> holder(
        new DocumentHolder(builder, row, std::move(primary_key), std::move(doc_id), std::move(content)));

    BUILDER_TRACE("Snapshot: {}", json);
    return Snapshot(std::move(holder), std::move(json));
}

Handle buildHandle(const DocumentHolder& holder) {
    core::Document document = std::visit([&](const auto& strategy) {
        return strategy.getDocument(holder.row(), holder.docId(), holder.content());
    }, holder.builder());
    return Handle(std::move(document));
}

core::ExtMetadataType modeOf(const DocumentBuilder& builder) {
    if (const auto* url = std::get_if<UrlDocumentBuilder>(&builder)) {
        return url->urlType() == UrlDocumentBuilder::UrlType::CompleteUrl
            ? core::ExtMetadataType::CompleteUrl
            : core::ExtMetadataType::DocId;
    }
    if (std::holds_alternative<LobDocumentBuilder>(builder)) {
        return core::ExtMetadataType::Lob;
    }
    return core::ExtMetadataType::None;
}

const core::ConnectorConfig& configOf(const DocumentBuilder& builder) {
    return std::visit([](const auto& strategy) -> const core::ConnectorConfig& {
        return strategy.support().config();
    }, builder);
}

}} // namespace rowdoc::builder
