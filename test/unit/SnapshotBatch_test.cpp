// RowDoc 库
// 组件：批量快照构建测试

#include "rowdoc/builder/SnapshotBatch.hpp"
#include "rowdoc/builder/StrategySelector.hpp"
#include "rowdoc/utils/ThreadPool.hpp"
#include "rowdoc/core/Exception.hpp"
#include <gtest/gtest.h>

namespace rowdoc {
namespace builder {

class SnapshotBatchTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.connector_name = "testconnector";
        config.primary_keys = {"id", "lastName"};
        builder = selectDocumentBuilder(config).builder;

        for (int i = 0; i < 20; ++i) {
            core::Row row{{"id", i}, {"lastName", "name_" + std::to_string(i)}};
            rows.push_back(row);
        }
        // 第 7 行缺少主键列，第 13 行包含非法字符
        rows[7] = core::Row{{"id", 7}};
        rows[13].set("note", std::string("bad\x01"));
    }

    core::ConnectorConfig config;
    DocumentBuilderPtr builder;
    std::vector<core::Row> rows;
};

TEST_F(SnapshotBatchTest, FailuresCollectedAndTraversalContinues) {
    SnapshotBatch batch(builder);
    std::vector<SnapshotResult> results = batch.build(rows);

    ASSERT_EQ(results.size(), rows.size());
    EXPECT_EQ(SnapshotBatch::countFailures(results), 2u);

    for (size_t i = 0; i < results.size(); ++i) {
        EXPECT_EQ(results[i].index, i);
    }

    EXPECT_FALSE(results[7].ok());
    EXPECT_EQ(results[7].error.code, core::ErrorCode::MissingPrimaryKeyColumn);
    EXPECT_FALSE(results[13].ok());
    EXPECT_EQ(results[13].error.code, core::ErrorCode::SerializationFailure);

    ASSERT_TRUE(results[0].ok());
    EXPECT_EQ(results[0].snapshot->toJson(), buildSnapshot(builder, rows[0]).toJson());
    EXPECT_TRUE(results[0].error.isOk());
}

TEST_F(SnapshotBatchTest, ParallelMatchesSequential) {
    utils::ThreadPool pool(4);
    std::vector<SnapshotResult> parallel = SnapshotBatch(builder, &pool).build(rows);
    std::vector<SnapshotResult> sequential = SnapshotBatch(builder).build(rows);

    ASSERT_EQ(parallel.size(), sequential.size());
    for (size_t i = 0; i < parallel.size(); ++i) {
        EXPECT_EQ(parallel[i].index, i);
        ASSERT_EQ(parallel[i].ok(), sequential[i].ok()) << i;
        if (parallel[i].ok()) {
            EXPECT_EQ(parallel[i].snapshot->toJson(), sequential[i].snapshot->toJson());
        } else {
            EXPECT_EQ(parallel[i].error.code, sequential[i].error.code);
        }
    }
}

TEST_F(SnapshotBatchTest, EmptyInput) {
    SnapshotBatch batch(builder);
    EXPECT_TRUE(batch.build({}).empty());
}

TEST_F(SnapshotBatchTest, NullBuilderRejected) {
    EXPECT_THROW({ SnapshotBatch batch(nullptr); }, core::RowDocException);
}

}} // namespace rowdoc::builder
