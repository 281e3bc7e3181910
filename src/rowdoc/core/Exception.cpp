/**
 * @file Exception.cpp
 * @brief rowdoc异常类实现
 */

#include "Exception.hpp"
#include <fmt/format.h>

namespace rowdoc {
namespace core {

RowDocException::RowDocException(const std::string& message,
                                 ErrorCode code,
                                 const char* file,
                                 int line)
    : std::runtime_error(message)
    , error_code_(code)
    , file_(file)
    , line_(line) {
}

std::string RowDocException::getErrorCodeString() const {
    return toString(error_code_);
}

std::string RowDocException::getDetailedMessage() const {
    // 单行输出，便于按行检索日志
    std::string detail = fmt::format("{} [{}]", what(), getErrorCodeString());
    for (auto it = context_.rbegin(); it != context_.rend(); ++it) {
        detail += fmt::format(" <- {}", *it);
    }
    if (file_ && line_ > 0) {
        detail += fmt::format(" @{}:{}", file_, line_);
    }
    return detail;
}

void RowDocException::addContext(const std::string& context) {
    context_.push_back(context);
}

Error RowDocException::toError() const {
    std::string ctx;
    for (const auto& c : context_) {
        if (!ctx.empty()) {
            ctx += "; ";
        }
        ctx += c;
    }
    return Error(error_code_, what(), ctx);
}

ConfigException::ConfigException(const std::string& message,
                                 const std::string& key,
                                 ErrorCode code, const char* file, int line)
    : RowDocException(key.empty() ? message : fmt::format("{} (key: {})", message, key),
                      code, file, line)
    , key_(key) {
}

RowException::RowException(const std::string& message,
                           const std::string& column,
                           ErrorCode code, const char* file, int line)
    : RowDocException(fmt::format("{} (column: {})", message, column), code, file, line)
    , column_(column) {
}

SerializationException::SerializationException(const std::string& message,
                                               const std::string& column,
                                               ErrorCode code, const char* file, int line)
    : RowDocException(column.empty() ? message : fmt::format("{} (column: {})", message, column),
                      code, file, line)
    , column_(column) {
}

ContentException::ContentException(const std::string& message,
                                   const std::string& source,
                                   ErrorCode code, const char* file, int line)
    : RowDocException(source.empty() ? message : fmt::format("{} (source: {})", message, source),
                      code, file, line)
    , source_(source) {
}

InvariantException::InvariantException(const std::string& message,
                                       const char* file, int line)
    : RowDocException(message, ErrorCode::EncodingInvariantViolation, file, line) {
}

} // namespace core
} // namespace rowdoc
