#pragma once

#include <string>
#include "rowdoc/builder/ContentHolder.hpp"
#include "rowdoc/builder/DocumentBuilder.hpp"
#include "rowdoc/core/ConnectorConfig.hpp"
#include "rowdoc/core/Row.hpp"

namespace rowdoc {
namespace builder {

/**
 * @brief 连接快照和句柄的不可变数据
 *
 * 只能由 buildSnapshot 创建。保存行的副本，之后外部对行的修改不会
 * 影响已经计算出的校验和。
 */
class DocumentHolder {
public:
    const DocumentBuilder& builder() const { return *builder_; }
    const core::Row& row() const { return row_; }
    const core::PrimaryKey& primaryKey() const { return primary_key_; }
    const std::string& docId() const { return doc_id_; }
    const ContentHolder& content() const { return content_; }

private:
    friend Snapshot buildSnapshot(const DocumentBuilderPtr& builder, const core::Row& row);

    DocumentHolder(DocumentBuilderPtr builder, core::Row row, core::PrimaryKey primary_key,
                   std::string doc_id, ContentHolder content)
        : builder_(std::move(builder)), row_(std::move(row)),
          primary_key_(std::move(primary_key)), doc_id_(std::move(doc_id)),
          content_(std::move(content)) {}

    DocumentBuilderPtr builder_;
    core::Row row_;
    core::PrimaryKey primary_key_;
    std::string doc_id_;
    ContentHolder content_;
};

}} // namespace rowdoc::builder
