// RowDoc 库
// 组件：日志级别与观察者测试

#include "rowdoc/utils/Logger.hpp"
#include "rowdoc/builder/SnapshotBatch.hpp"
#include "rowdoc/builder/StrategySelector.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <mutex>
#include <utility>
#include <vector>

namespace rowdoc {

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        saved_level = Logger::getInstance().getLevel();
        Logger::getInstance().setObserver([this](Logger::Level level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex);
            captured.emplace_back(level, message);
        });
    }

    void TearDown() override {
        Logger::getInstance().setObserver(nullptr);
        Logger::getInstance().setLevel(saved_level);
    }

    size_t count(Logger::Level level, const std::string& needle) {
        std::lock_guard<std::mutex> lock(mutex);
        size_t n = 0;
        for (const auto& entry : captured) {
            if (entry.first == level && entry.second.find(needle) != std::string::npos) ++n;
        }
        return n;
    }

    Logger::Level saved_level = Logger::Level::INFO;
    std::mutex mutex;
    std::vector<std::pair<Logger::Level, std::string>> captured;
};

TEST_F(LoggerTest, ParseLevel) {
    EXPECT_EQ(Logger::parseLevel("debug"), Logger::Level::DEBUG);
    EXPECT_EQ(Logger::parseLevel("Warning"), Logger::Level::WARN);
    EXPECT_EQ(Logger::parseLevel("OFF"), Logger::Level::OFF);
    EXPECT_EQ(Logger::parseLevel("verbose"), Logger::Level::INFO);
    EXPECT_STREQ(Logger::levelName(Logger::Level::CRITICAL), "CRITICAL");
}

TEST_F(LoggerTest, LevelFilter) {
    Logger::getInstance().setLevel(Logger::Level::WARN);
    ROWDOC_LOG_INFO("hidden {}", 1);
    ROWDOC_LOG_WARN("shown {}", 2);

    EXPECT_EQ(count(Logger::Level::INFO, "hidden"), 0u);
    EXPECT_EQ(count(Logger::Level::WARN, "shown 2"), 1u);
}

TEST_F(LoggerTest, FallbackIsReportedAsWarning) {
    core::ConnectorConfig config;
    config.connector_name = "testconnector";
    config.primary_keys = {"id"};
    config.ext_metadata_type = "BLOB_CLOB";

    builder::ModeSelection selection = builder::selectDocumentBuilder(config);
    ASSERT_TRUE(selection.isFallback());
    EXPECT_EQ(count(Logger::Level::WARN, "BLOB_CLOB"), 1u);
}

TEST_F(LoggerTest, FailedRowIsReportedAsError) {
    core::ConnectorConfig config;
    config.connector_name = "testconnector";
    config.primary_keys = {"id"};
    builder::DocumentBuilderPtr builder = builder::selectDocumentBuilder(config).builder;

    std::vector<core::Row> rows{core::Row{{"id", 1}}, core::Row{{"other", 2}}};
    std::vector<builder::SnapshotResult> results = builder::SnapshotBatch(builder).build(rows);

    ASSERT_EQ(builder::SnapshotBatch::countFailures(results), 1u);
    EXPECT_EQ(count(Logger::Level::ERROR, "Row 1 failed"), 1u);
}

TEST_F(LoggerTest, FileSinkRotatesBySize) {
    namespace fs = std::filesystem;
    const fs::path dir = fs::temp_directory_path() / "rowdoc_logger_rotation";
    fs::remove_all(dir);
    const std::string path = (dir / "rotate.log").string();

    Logger& logger = Logger::getInstance();
    logger.shutdown();
    logger.initialize(path, Logger::Level::INFO, false, 1024, 3);

    const std::string payload(200, 'x');
    for (int i = 0; i < 40; ++i) {
        ROWDOC_LOG_INFO("line {} {}", i, payload);
    }
    logger.shutdown();

    EXPECT_TRUE(fs::exists(path));
    EXPECT_TRUE(fs::exists(path + ".1"));
    EXPECT_TRUE(fs::exists(path + ".2"));
    EXPECT_FALSE(fs::exists(path + ".3"));
    EXPECT_LT(fs::file_size(path + ".1"), 1024u + 512u);
    EXPECT_EQ(count(Logger::Level::INFO, "line 39"), 1u);

    // 恢复 test_main 中的日志配置
    logger.initialize("logs/rowdoc_tests.log", Logger::Level::DEBUG, false);
    fs::remove_all(dir);
}

} // namespace rowdoc
