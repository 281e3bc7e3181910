/**
 * @file Exception.hpp
 * @brief rowdoc异常类定义
 */

#ifndef ROWDOC_EXCEPTION_HPP
#define ROWDOC_EXCEPTION_HPP

#include <stdexcept>
#include <string>
#include <vector>
#include "ErrorCode.hpp"

namespace rowdoc {
namespace core {

/**
 * @brief rowdoc基础异常类
 */
class RowDocException : public std::runtime_error {
public:
    /**
     * @brief 构造函数
     * @param message 错误消息
     * @param code 错误代码
     * @param file 发生错误的文件名
     * @param line 发生错误的行号
     */
    RowDocException(const std::string& message,
                    ErrorCode code = ErrorCode::InternalError,
                    const char* file = nullptr,
                    int line = 0);

    ErrorCode getErrorCode() const noexcept { return error_code_; }

    std::string getErrorCodeString() const;

    /**
     * @brief 获取详细错误信息（错误码、位置、上下文）
     */
    std::string getDetailedMessage() const;

    const char* getFile() const noexcept { return file_; }
    int getLine() const noexcept { return line_; }

    void addContext(const std::string& context);
    const std::vector<std::string>& getContext() const { return context_; }

    /**
     * @brief 转为值语义的 Error
     */
    Error toError() const;

private:
    ErrorCode error_code_;
    const char* file_;
    int line_;
    std::vector<std::string> context_;
};

/**
 * @brief 配置相关异常
 */
class ConfigException : public RowDocException {
public:
    ConfigException(const std::string& message,
                    const std::string& key = "",
                    ErrorCode code = ErrorCode::InvalidConfiguration,
                    const char* file = nullptr, int line = 0);

    const std::string& getKey() const { return key_; }

private:
    std::string key_;
};

/**
 * @brief 行数据异常：主键列缺失、主键值为空、必需列缺失
 */
class RowException : public RowDocException {
public:
    RowException(const std::string& message,
                 const std::string& column,
                 ErrorCode code = ErrorCode::MissingPrimaryKeyColumn,
                 const char* file = nullptr, int line = 0);

    const std::string& getColumn() const { return column_; }

private:
    std::string column_;
};

/**
 * @brief 行无法规范化序列化
 */
class SerializationException : public RowDocException {
public:
    SerializationException(const std::string& message,
                           const std::string& column = "",
                           ErrorCode code = ErrorCode::SerializationFailure,
                           const char* file = nullptr, int line = 0);

    const std::string& getColumn() const { return column_; }

private:
    std::string column_;
};

/**
 * @brief 大对象内容无法打开或读取
 */
class ContentException : public RowDocException {
public:
    ContentException(const std::string& message,
                     const std::string& source = "",
                     ErrorCode code = ErrorCode::ContentUnavailable,
                     const char* file = nullptr, int line = 0);

    const std::string& getSource() const { return source_; }

private:
    std::string source_;
};

/**
 * @brief 内部不变量被破坏，不可恢复
 */
class InvariantException : public RowDocException {
public:
    InvariantException(const std::string& message,
                       const char* file = nullptr, int line = 0);
};

} // namespace core
} // namespace rowdoc

#endif // ROWDOC_EXCEPTION_HPP
