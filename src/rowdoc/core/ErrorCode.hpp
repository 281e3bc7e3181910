#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <fmt/format.h>

namespace rowdoc {
namespace core {

/**
 * @brief rowdoc统一错误码
 *
 * 按出错环节分段编码，行级错误只影响当前行，遍历继续。
 */
enum class ErrorCode : uint8_t {
    // 成功
    Ok = 0,

    // 通用错误 (1-9)
    InvalidArgument = 1,
    InternalError = 2,

    // 配置错误 (10-19)
    ConfigurationMismatch = 10,
    InvalidConfiguration = 11,
    FileNotFound = 12,
    ConfigParseError = 13,

    // 行数据错误 (20-29)
    MissingPrimaryKeyColumn = 20,
    NullPrimaryKeyValue = 21,
    MissingColumn = 22,

    // 序列化错误 (30-39)
    SerializationFailure = 30,
    UnsupportedValueType = 31,

    // 大对象内容错误 (40-49)
    ContentUnavailable = 40,
    ContentReadError = 41,

    // 内部不变量 (50-59)
    EncodingInvariantViolation = 50
};

/**
 * @brief 错误码的可读描述
 */
const char* toString(ErrorCode code) noexcept;

/**
 * @brief 行级错误的值形式，批量构建时代替异常返回
 */
struct Error {
    ErrorCode code = ErrorCode::Ok;
    std::string message;
    std::string context;  // 以 "; " 连接的上下文，如 "document MSxs..."

    Error() = default;
    Error(ErrorCode c, std::string msg, std::string ctx = std::string())
        : code(c), message(std::move(msg)), context(std::move(ctx)) {}

    bool isOk() const noexcept { return code == ErrorCode::Ok; }

    // "消息 [上下文]"
    std::string fullMessage() const {
        return context.empty() ? message : fmt::format("{} [{}]", message, context);
    }
};

}} // namespace rowdoc::core
