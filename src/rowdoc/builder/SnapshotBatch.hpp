#pragma once

#include <optional>
#include <vector>
#include "rowdoc/builder/Snapshot.hpp"
#include "rowdoc/core/ErrorCode.hpp"
#include "rowdoc/core/Row.hpp"

namespace rowdoc {
namespace utils {
class ThreadPool;
}

namespace builder {

/**
 * @brief 单行的构建结果：快照或错误
 */
struct SnapshotResult {
    size_t index = 0;
    std::optional<Snapshot> snapshot;
    core::Error error;

    bool ok() const { return snapshot.has_value(); }
};

/**
 * @brief 批量构建快照
 *
 * 行级错误（缺少主键列、序列化失败、大对象读取失败）收集为 core::Error，
 * 其余行继续处理。结果顺序与输入一致。InvariantException 不被收集。
 */
class SnapshotBatch {
public:
    explicit SnapshotBatch(DocumentBuilderPtr builder, utils::ThreadPool* pool = nullptr);

    std::vector<SnapshotResult> build(const std::vector<core::Row>& rows) const;

    static size_t countFailures(const std::vector<SnapshotResult>& results);

private:
    SnapshotResult buildOne(size_t index, const core::Row& row) const;

    DocumentBuilderPtr builder_;
    utils::ThreadPool* pool_;  // 不拥有
};

}} // namespace rowdoc::builder
