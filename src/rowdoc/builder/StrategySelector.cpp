#include "rowdoc/builder/StrategySelector.hpp"
#include "rowdoc/core/Exception.hpp"
#include "rowdoc/utils/ModuleLoggers.hpp"

namespace rowdoc {
namespace builder {

namespace {

ConfigurationMismatch missingField(const std::string& requested, const char* field) {
    ConfigurationMismatch mismatch;
    mismatch.requested_type = requested;
    mismatch.missing_field = field;
    mismatch.reason = std::string("required field ") + field + " is not configured";
    return mismatch;
}

} // namespace

ModeSelection selectDocumentBuilder(const core::ConnectorConfig& config,
                                    std::shared_ptr<const xml::RowSerializer> serializer) {
    config.validate();
    if (!serializer) {
        throw core::RowDocException("Row serializer is null",
                                    core::ErrorCode::InvalidArgument, __FILE__, __LINE__);
    }

    auto shared_config = std::make_shared<const core::ConnectorConfig>(config);

    ModeSelection selection;
    selection.requested = config.ext_metadata_type;

    const std::optional<core::ExtMetadataType> requested = core::parseExtMetadataType(config.ext_metadata_type);
    if (!requested) {
        ConfigurationMismatch mismatch;
        mismatch.requested_type = config.ext_metadata_type;
        mismatch.reason = "unknown external metadata type";
        selection.mismatch = std::move(mismatch);
    } else {
        switch (*requested) {
            case core::ExtMetadataType::CompleteUrl:
                if (core::ConnectorConfig::isConfigured(config.document_url_field)) {
                    BUILDER_INFO("Running in external metadata feed mode with complete document URL");
                    selection.builder = std::make_shared<const DocumentBuilder>(
                        std::in_place_type<UrlDocumentBuilder>, shared_config, serializer,
                        UrlDocumentBuilder::UrlType::CompleteUrl);
                } else {
                    selection.mismatch = missingField(config.ext_metadata_type, "document_url_field");
                }
                break;
            case core::ExtMetadataType::DocId:
                if (core::ConnectorConfig::isConfigured(config.document_id_field)) {
                    BUILDER_INFO("Running in external metadata feed mode with base URL and document ID");
                    selection.builder = std::make_shared<const DocumentBuilder>(
                        std::in_place_type<UrlDocumentBuilder>, shared_config, serializer,
                        UrlDocumentBuilder::UrlType::BaseUrl);
                } else {
                    selection.mismatch = missingField(config.ext_metadata_type, "document_id_field");
                }
                break;
            case core::ExtMetadataType::Lob:
                if (core::ConnectorConfig::isConfigured(config.lob_field)) {
                    BUILDER_INFO("Running in content feed mode for BLOB/CLOB data");
                    selection.builder = std::make_shared<const DocumentBuilder>(
                        std::in_place_type<LobDocumentBuilder>, shared_config, serializer);
                } else {
                    selection.mismatch = missingField(config.ext_metadata_type, "lob_field");
                }
                break;
            case core::ExtMetadataType::None:
                break;
        }
    }

    if (!selection.builder) {
        if (selection.mismatch) {
            BUILDER_WARN("External metadata type '{}' cannot be used ({}), falling back to {}",
                         selection.mismatch->requested_type, selection.mismatch->reason,
                         core::toString(core::ExtMetadataType::None));
        }
        BUILDER_INFO("Running in content feed mode for text data");
        selection.builder = std::make_shared<const DocumentBuilder>(
            std::in_place_type<MetadataDocumentBuilder>, shared_config, serializer);
    }

    selection.effective = modeOf(*selection.builder);
    return selection;
}

}} // namespace rowdoc::builder
