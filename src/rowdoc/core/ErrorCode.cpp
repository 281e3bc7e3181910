#include "rowdoc/core/ErrorCode.hpp"

namespace rowdoc {
namespace core {

const char* toString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Ok:
            return "Success";

        // 通用错误
        case ErrorCode::InvalidArgument:
            return "Invalid argument";
        case ErrorCode::InternalError:
            return "Internal error";

        // 配置错误
        case ErrorCode::ConfigurationMismatch:
            return "Configuration mismatch";
        case ErrorCode::InvalidConfiguration:
            return "Invalid configuration";
        case ErrorCode::FileNotFound:
            return "File not found";
        case ErrorCode::ConfigParseError:
            return "Configuration parse error";

        // 行数据错误
        case ErrorCode::MissingPrimaryKeyColumn:
            return "Missing primary key column";
        case ErrorCode::NullPrimaryKeyValue:
            return "Null primary key value";
        case ErrorCode::MissingColumn:
            return "Missing column";

        // 序列化错误
        case ErrorCode::SerializationFailure:
            return "Serialization failure";
        case ErrorCode::UnsupportedValueType:
            return "Unsupported value type";

        // 大对象内容错误
        case ErrorCode::ContentUnavailable:
            return "Content unavailable";
        case ErrorCode::ContentReadError:
            return "Content read error";

        case ErrorCode::EncodingInvariantViolation:
            return "Encoding invariant violation";

        default:
            return "Unknown error";
    }
}

}} // namespace rowdoc::core
