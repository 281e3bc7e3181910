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
 * @brief 内容推送策略：BLOB/CLOB 列作为文档正文
 *
 * 校验和 = SHA-1(大对象字节 + 元数据序列化)，内容或元数据变化都会触发
 * 重新推送。大对象在快照阶段流式读取一次，正文保存为可重新打开的定位
 * 器，句柄阶段再次打开，不在内存中整体缓存。
 */
class LobDocumentBuilder {
public:
    static constexpr const char* kCharacterMimeType = "text/plain";
    static constexpr const char* kBinaryMimeType = "application/octet-stream";

    LobDocumentBuilder(std::shared_ptr<const core::ConnectorConfig> config,
                       std::shared_ptr<const xml::RowSerializer> serializer);

    const std::string& lobColumn() const { return lob_column_; }

    /**
     * @throws RowException 大对象列不存在
     * @throws SerializationException 列值不是大对象或字符串
     * @throws ContentException 大对象无法打开或读取
     */
    ContentHolder getContentHolder(const core::Row& row, const core::PrimaryKey& primary_key,
                                   const std::string& doc_id) const;

    core::Document getDocument(const core::Row& row, const std::string& doc_id,
                               const ContentHolder& content) const;

    const BuilderSupport& support() const { return support_; }

private:
    core::LargeObjectPtr getLargeObject(const core::Row& row) const;
    std::string detectMimeType(const std::string& head, core::LargeObject::Kind kind) const;

    BuilderSupport support_;
    std::string lob_column_;
};

}} // namespace rowdoc::builder
