#pragma once

#include <memory>
#include <string>
#include "rowdoc/builder/BuilderSupport.hpp"
#include "rowdoc/builder/ContentHolder.hpp"
#include "rowdoc/core/ConnectorConfig.hpp"
#include "rowdoc/core/Document.hpp"

namespace rowdoc {
namespace builder {

/**
 * @brief 元数据策略：行的序列化结果既是正文也是校验和输入
 */
class MetadataDocumentBuilder {
public:
    MetadataDocumentBuilder(std::shared_ptr<const core::ConnectorConfig> config,
                            std::shared_ptr<const xml::RowSerializer> serializer);

    ContentHolder getContentHolder(const core::Row& row, const core::PrimaryKey& primary_key,
                                   const std::string& doc_id) const;

    core::Document getDocument(const core::Row& row, const std::string& doc_id,
                               const ContentHolder& content) const;

    const BuilderSupport& support() const { return support_; }

private:
    BuilderSupport support_;
};

}} // namespace rowdoc::builder
