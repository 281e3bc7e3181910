#pragma once

#include <string>
#include "rowdoc/core/ConnectorConfig.hpp"
#include "rowdoc/utils/Logger.hpp"

namespace rowdoc {
namespace config {

/**
 * @brief 配置文件中的日志设置
 */
struct LogSettings {
    std::string file = "logs/rowdoc.log";
    Logger::Level level = Logger::Level::INFO;
    bool console = true;
};

struct LoadedConfig {
    core::ConnectorConfig connector;
    LogSettings logging;
};

/**
 * @brief 从 JSON 读取连接器配置
 *
 * 示例:
 * {
 *   "connector_name": "testconnector",
 *   "primary_keys": ["id", "lastName"],
 *   "ext_metadata_type": "BLOB_CLOB",
 *   "lob_field": "content",
 *   "skip_columns": ["internal_note"],
 *   "max_document_size": 1048576,
 *   "logging": {"file": "logs/rowdoc.log", "level": "debug", "console": false}
 * }
 */
class ConfigLoader {
public:
    /**
     * @throws ConfigException 文件不存在(FileNotFound)或格式错误(ConfigParseError)
     */
    static LoadedConfig loadFile(const std::string& path);

    /**
     * @throws ConfigException 格式错误或字段类型不符
     */
    static LoadedConfig fromJson(const std::string& text);
};

}} // namespace rowdoc::config
