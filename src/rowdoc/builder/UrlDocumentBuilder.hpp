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
 * @brief 外部元数据策略：文档只携带URL引用，不推送正文
 *
 * 校验和仍覆盖整行元数据，任何列的变化都会触发重新推送。
 */
class UrlDocumentBuilder {
public:
    enum class UrlType {
        CompleteUrl,  // 列值即完整URL
        BaseUrl       // base_url + 文档ID列
    };

    UrlDocumentBuilder(std::shared_ptr<const core::ConnectorConfig> config,
                       std::shared_ptr<const xml::RowSerializer> serializer,
                       UrlType url_type);

    UrlType urlType() const { return url_type_; }

    /**
     * @brief URL 来源列（document_url_field 或 document_id_field）
     */
    const std::string& urlColumn() const { return url_column_; }

    /**
     * @throws RowException URL 来源列缺失或为空
     */
    ContentHolder getContentHolder(const core::Row& row, const core::PrimaryKey& primary_key,
                                   const std::string& doc_id) const;

    core::Document getDocument(const core::Row& row, const std::string& doc_id,
                               const ContentHolder& content) const;

    const BuilderSupport& support() const { return support_; }

private:
    std::string getReferenceUrl(const core::Row& row) const;

    BuilderSupport support_;
    UrlType url_type_;
    std::string url_column_;
};

}} // namespace rowdoc::builder
