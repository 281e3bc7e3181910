#pragma once

// RowDoc - 数据库行到可增量推送文档的转换库

#include <string>

#include "rowdoc/core/ConnectorConfig.hpp"
#include "rowdoc/core/Document.hpp"
#include "rowdoc/core/Exception.hpp"
#include "rowdoc/core/LargeObject.hpp"
#include "rowdoc/core/Row.hpp"
#include "rowdoc/core/Value.hpp"
#include "rowdoc/builder/DocumentBuilder.hpp"
#include "rowdoc/builder/Snapshot.hpp"
#include "rowdoc/builder/SnapshotBatch.hpp"
#include "rowdoc/builder/StrategySelector.hpp"
#include "rowdoc/config/ConfigLoader.hpp"
#include "rowdoc/utils/Logger.hpp"

// 版本信息
#define ROWDOC_VERSION_MAJOR 1
#define ROWDOC_VERSION_MINOR 0
#define ROWDOC_VERSION_PATCH 0
#define ROWDOC_VERSION_STRING "1.0.0"

namespace rowdoc {

inline std::string getVersion() {
    return ROWDOC_VERSION_STRING;
}

/**
 * @brief 按配置初始化日志系统
 * @return 初始化是否成功
 */
bool initialize(const config::LogSettings& settings = config::LogSettings());

/**
 * @brief 清理库资源（刷新并关闭日志）
 */
void cleanup();

} // namespace rowdoc
