#pragma once

#include <memory>
#include <string>
#include "rowdoc/builder/DocumentHolder.hpp"
#include "rowdoc/core/Document.hpp"

namespace rowdoc {
namespace builder {

/**
 * @brief 变更检测单元：文档ID + 校验和
 *
 * 序列化形式固定为 {"google:docid":...,"google:sum":...}，键顺序不变。
 * 校验和只出现在这里，不会成为文档属性。
 */
class Snapshot {
public:
    const std::string& getDocumentId() const { return holder_->docId(); }
    const std::string& getChecksum() const { return holder_->content().checksum; }

    /**
     * @brief 规范的紧凑 JSON 形式
     */
    const std::string& toJson() const { return json_; }

    const DocumentHolder& holder() const { return *holder_; }

    /**
     * @brief 构建对应的句柄，等价于 buildHandle(holder())
     */
    Handle getDocumentHandle() const;

    /**
     * @brief 生成快照 JSON
     * @throws InvariantException JSON 构建失败
     */
    static std::string makeJson(const std::string& doc_id, const std::string& checksum);

private:
    friend Snapshot buildSnapshot(const DocumentBuilderPtr& builder, const core::Row& row);

    Snapshot(std::shared_ptr<const DocumentHolder> holder, std::string json)
        : holder_(std::move(holder)), json_(std::move(json)) {}

    std::shared_ptr<const DocumentHolder> holder_;
    std::string json_;
};

/**
 * @brief 推送给索引端的完整文档
 */
class Handle {
public:
    explicit Handle(core::Document document) : document_(std::move(document)) {}

    const core::Document& getDocument() const { return document_; }

    std::string getDocumentId() const;

private:
    core::Document document_;
};

}} // namespace rowdoc::builder
