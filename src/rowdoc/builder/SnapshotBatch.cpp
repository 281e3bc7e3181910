#include "rowdoc/builder/SnapshotBatch.hpp"
#include "rowdoc/core/Exception.hpp"
#include "rowdoc/utils/ModuleLoggers.hpp"
#include "rowdoc/utils/ThreadPool.hpp"
#include <future>

namespace rowdoc {
namespace builder {

SnapshotBatch::SnapshotBatch(DocumentBuilderPtr builder, utils::ThreadPool* pool)
    : builder_(std::move(builder)), pool_(pool) {
    if (!builder_) {
        throw core::RowDocException("Document builder is null",
                                    core::ErrorCode::InvalidArgument, __FILE__, __LINE__);
    }
}

std::vector<SnapshotResult> SnapshotBatch::build(const std::vector<core::Row>& rows) const {
    std::vector<SnapshotResult> results;
    results.reserve(rows.size());

    if (pool_ && rows.size() > 1) {
        std::vector<std::future<SnapshotResult>> futures;
        futures.reserve(rows.size());
        for (size_t i = 0; i < rows.size(); ++i) {
            futures.push_back(pool_->submit([this, i, &rows]() {
                return buildOne(i, rows[i]);
            }));
        }
        // 先等全部完成：任务引用 rows 和 this，异常返回前不能留下运行中的任务
        for (auto& future : futures) {
            future.wait();
        }
        // 按提交顺序取结果，保持输入顺序
        for (auto& future : futures) {
            results.push_back(future.get());
        }
    } else {
        for (size_t i = 0; i < rows.size(); ++i) {
            results.push_back(buildOne(i, rows[i]));
        }
    }

    const size_t failures = countFailures(results);
    BUILDER_DEBUG("Built {} snapshots, {} rows failed", rows.size() - failures, failures);
    return results;
}

size_t SnapshotBatch::countFailures(const std::vector<SnapshotResult>& results) {
    size_t failures = 0;
    for (const auto& result : results) {
        if (!result.ok()) {
            ++failures;
        }
    }
    return failures;
}

SnapshotResult SnapshotBatch::buildOne(size_t index, const core::Row& row) const {
    SnapshotResult result;
    result.index = index;
    try {
        result.snapshot = buildSnapshot(builder_, row);
    } catch (const core::InvariantException&) {
        throw;
    } catch (const core::RowDocException& e) {
        result.error = e.toError();
        BUILDER_ERROR("Row {} failed: {}", index, e.getDetailedMessage());
    }
    return result;
}

}} // namespace rowdoc::builder
