#include "rowdoc/io/JsonRowReader.hpp"
#include "rowdoc/core/Exception.hpp"
#include "rowdoc/core/LargeObject.hpp"
#include "rowdoc/utils/ModuleLoggers.hpp"
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>

namespace rowdoc {
namespace io {

namespace {

using nlohmann::ordered_json;

core::Value toValue(const ordered_json& j, const std::string& column, const std::filesystem::path& base_dir) {
    switch (j.type()) {
        case ordered_json::value_t::null:
            return core::Value();
        case ordered_json::value_t::boolean:
            return core::Value(j.get<bool>());
        case ordered_json::value_t::number_integer:
            return core::Value(j.get<std::int64_t>());
        case ordered_json::value_t::number_unsigned: {
            const std::uint64_t value = j.get<std::uint64_t>();
            if (value > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                throw core::SerializationException(
                    fmt::format("Integer {} exceeds the 64-bit signed range", value), column,
                    core::ErrorCode::UnsupportedValueType, __FILE__, __LINE__);
            }
            return core::Value(static_cast<std::int64_t>(value));
        }
        case ordered_json::value_t::number_float:
            return core::Value(j.get<double>());
        case ordered_json::value_t::string:
            return core::Value(j.get<std::string>());
        case ordered_json::value_t::object:
            if (j.contains("timestamp")) {
                return core::Value(core::Timestamp::fromEpochMillis(j.at("timestamp").get<std::int64_t>()));
            }
            if (j.contains("lob")) {
                std::filesystem::path path = j.at("lob").get<std::string>();
                if (path.is_relative()) {
                    path = base_dir / path;
                }
                const std::string type = j.value("type", std::string("binary"));
                const auto kind = core::equalsIgnoreCase(type, "character")
                    ? core::LargeObject::Kind::Character
                    : core::LargeObject::Kind::Binary;
                return core::Value(std::make_shared<const core::FileLargeObject>(path.string(), kind));
            }
            if (j.contains("blob")) {
                return core::Value(core::makeBlob(j.at("blob").get<std::string>()));
            }
            if (j.contains("clob")) {
                return core::Value(core::makeClob(j.at("clob").get<std::string>()));
            }
            break;
        default:
            break;
    }
    throw core::SerializationException("Unsupported JSON value in row", column,
                                       core::ErrorCode::UnsupportedValueType, __FILE__, __LINE__);
}

} // namespace

JsonRowReader::JsonRowReader(std::string base_dir)
    : base_dir_(std::move(base_dir)) {
}

std::vector<core::Row> JsonRowReader::readFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw core::ContentException("Cannot open row file", path,
                                     core::ErrorCode::ContentUnavailable, __FILE__, __LINE__);
    }
    std::ostringstream content;
    content << in.rdbuf();

    std::filesystem::path parent = std::filesystem::path(path).parent_path();
    JsonRowReader reader(parent.empty() ? "." : parent.string());
    return reader.parse(content.str());
}

std::vector<core::Row> JsonRowReader::parse(const std::string& text) const {
    std::vector<core::Row> rows;
    try {
        const ordered_json j = ordered_json::parse(text);
        if (!j.is_array()) {
            throw core::SerializationException("Row input must be a JSON array", "",
                                               core::ErrorCode::SerializationFailure, __FILE__, __LINE__);
        }
        rows.reserve(j.size());
        for (const auto& object : j) {
            if (!object.is_object()) {
                throw core::SerializationException("Each row must be a JSON object", "",
                                                   core::ErrorCode::SerializationFailure, __FILE__, __LINE__);
            }
            core::Row row;
            for (const auto& item : object.items()) {
                row.set(item.key(), toValue(item.value(), item.key(), base_dir_));
            }
            rows.push_back(std::move(row));
        }
    } catch (const ordered_json::exception& e) {
        throw core::SerializationException(std::string("Invalid row JSON: ") + e.what(), "",
                                           core::ErrorCode::SerializationFailure, __FILE__, __LINE__);
    }

    UTILS_DEBUG("Read {} rows", rows.size());
    return rows;
}

}} // namespace rowdoc::io
