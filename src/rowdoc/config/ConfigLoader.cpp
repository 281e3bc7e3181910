#include "rowdoc/config/ConfigLoader.hpp"
#include "rowdoc/core/Exception.hpp"
#include "rowdoc/utils/ModuleLoggers.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace rowdoc {
namespace config {

namespace {

using nlohmann::json;

std::string trim(const std::string& s) {
    const auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    const auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

// 字符串数组，或逗号分隔的字符串
std::vector<std::string> readStringList(const json& j, const char* key) {
    std::vector<std::string> result;
    if (!j.contains(key) || j.at(key).is_null()) {
        return result;
    }
    const json& value = j.at(key);
    if (value.is_string()) {
        std::istringstream ss(value.get<std::string>());
        std::string item;
        while (std::getline(ss, item, ',')) {
            item = trim(item);
            if (!item.empty()) {
                result.push_back(item);
            }
        }
        return result;
    }
    if (value.is_array()) {
        for (const auto& item : value) {
            if (!item.is_string()) {
                throw core::ConfigException("List entries must be strings", key,
                                            core::ErrorCode::ConfigParseError, __FILE__, __LINE__);
            }
            result.push_back(item.get<std::string>());
        }
        return result;
    }
    throw core::ConfigException("Expected a string or an array of strings", key,
                                core::ErrorCode::ConfigParseError, __FILE__, __LINE__);
}

std::optional<std::string> readOptionalString(const json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) {
        return std::nullopt;
    }
    if (!j.at(key).is_string()) {
        throw core::ConfigException("Expected a string", key,
                                    core::ErrorCode::ConfigParseError, __FILE__, __LINE__);
    }
    return j.at(key).get<std::string>();
}

// 非负整数；缺省时返回默认值
std::uint64_t readSize(const json& j, const char* key, std::uint64_t default_value) {
    if (!j.contains(key) || j.at(key).is_null()) {
        return default_value;
    }
    const json& value = j.at(key);
    if (value.is_number_unsigned()) {
        return value.get<std::uint64_t>();
    }
    if (value.is_number_integer() && value.get<std::int64_t>() >= 0) {
        return static_cast<std::uint64_t>(value.get<std::int64_t>());
    }
    throw core::ConfigException("Expected a non-negative integer", key,
                                core::ErrorCode::ConfigParseError, __FILE__, __LINE__);
}

LogSettings readLogSettings(const json& j) {
    LogSettings settings;
    if (!j.contains("logging")) {
        return settings;
    }
    const json& logging = j.at("logging");
    if (!logging.is_object()) {
        throw core::ConfigException("Expected an object", "logging",
                                    core::ErrorCode::ConfigParseError, __FILE__, __LINE__);
    }
    settings.file = logging.value("file", settings.file);
    settings.console = logging.value("console", settings.console);
    if (logging.contains("level")) {
        settings.level = Logger::parseLevel(logging.at("level").get<std::string>());
    }
    return settings;
}

} // namespace

LoadedConfig ConfigLoader::loadFile(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        throw core::ConfigException("Configuration file not found: " + path, "",
                                    core::ErrorCode::FileNotFound, __FILE__, __LINE__);
    }
    std::ifstream in(path);
    if (!in) {
        throw core::ConfigException("Cannot open configuration file: " + path, "",
                                    core::ErrorCode::FileNotFound, __FILE__, __LINE__);
    }
    std::ostringstream content;
    content << in.rdbuf();

    CONFIG_DEBUG("Loading connector configuration from {}", path);
    try {
        return fromJson(content.str());
    } catch (core::ConfigException& e) {
        e.addContext("file " + path);
        throw;
    }
}

LoadedConfig ConfigLoader::fromJson(const std::string& text) {
    LoadedConfig loaded;
    core::ConnectorConfig& config = loaded.connector;

    try {
        const json j = json::parse(text);
        if (!j.is_object()) {
            throw core::ConfigException("Configuration must be a JSON object", "",
                                        core::ErrorCode::ConfigParseError, __FILE__, __LINE__);
        }

        config.connector_name = j.value("connector_name", std::string());
        config.primary_keys = readStringList(j, "primary_keys");
        config.ext_metadata_type = j.value("ext_metadata_type", std::string());
        config.document_url_field = readOptionalString(j, "document_url_field");
        config.document_id_field = readOptionalString(j, "document_id_field");
        config.base_url = j.value("base_url", std::string());
        config.lob_field = readOptionalString(j, "lob_field");
        config.last_modified_field = readOptionalString(j, "last_modified_field");
        config.skip_columns = readStringList(j, "skip_columns");
        config.lob_mime_type = readOptionalString(j, "lob_mime_type");
        config.traversal.max_document_size =
            readSize(j, "max_document_size", core::TraversalContext::kDefaultMaxDocumentSize);
        config.traversal.excluded_mime_types = readStringList(j, "excluded_mime_types");

        loaded.logging = readLogSettings(j);
    } catch (const json::exception& e) {
        throw core::ConfigException(std::string("Invalid configuration JSON: ") + e.what(), "",
                                    core::ErrorCode::ConfigParseError, __FILE__, __LINE__);
    }

    config.validate();
    CONFIG_INFO("Connector '{}': {} primary key column(s), mode '{}'",
                config.connector_name, config.primary_keys.size(), config.ext_metadata_type);
    return loaded;
}

}} // namespace rowdoc::config
