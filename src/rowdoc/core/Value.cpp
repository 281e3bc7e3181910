#include "rowdoc/core/Value.hpp"
#include "rowdoc/core/LargeObject.hpp"
#include "rowdoc/core/Exception.hpp"
#include <ctime>
#include <fmt/format.h>
#include <fmt/chrono.h>

namespace rowdoc {
namespace core {

namespace {

// 拆分为秒和毫秒，毫秒恒为非负
void splitMillis(std::int64_t millis, std::time_t& seconds, int& ms) {
    std::int64_t secs = millis / 1000;
    std::int64_t rem = millis % 1000;
    if (rem < 0) {
        rem += 1000;
        --secs;
    }
    seconds = static_cast<std::time_t>(secs);
    ms = static_cast<int>(rem);
}

} // namespace

Timestamp Timestamp::fromEpochMillis(std::int64_t millis) {
    if (millis < kMinEpochMillis || millis > kMaxEpochMillis) {
        throw SerializationException(fmt::format("Timestamp out of range: {} ms since epoch", millis), "",
                                     ErrorCode::UnsupportedValueType, __FILE__, __LINE__);
    }
    return Timestamp{TimePoint(std::chrono::milliseconds(millis))};
}

std::int64_t Timestamp::epochMillis() const {
    return time.time_since_epoch().count();
}

std::string Timestamp::toString() const {
    std::time_t seconds;
    int ms;
    splitMillis(epochMillis(), seconds, ms);
    return fmt::format("{:%Y-%m-%d %H:%M:%S}.{:03d}", fmt::gmtime(seconds), ms);
}

std::string Timestamp::toIso8601() const {
    std::time_t seconds;
    int ms;
    splitMillis(epochMillis(), seconds, ms);
    return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:03d}Z", fmt::gmtime(seconds), ms);
}

Value::Value(LargeObjectPtr v) {
    if (v) {
        data_ = std::move(v);
    }
}

Value::Type Value::type() const {
    switch (data_.index()) {
        case 1: return Type::Boolean;
        case 2: return Type::Integer;
        case 3: return Type::Double;
        case 4: return Type::String;
        case 5: return Type::Timestamp;
        case 6: return Type::LargeObject;
        default: return Type::Null;
    }
}

std::string Value::toString() const {
    switch (type()) {
        case Type::Null:
            return std::string();
        case Type::Boolean:
            return asBoolean() ? "true" : "false";
        case Type::Integer:
            return fmt::format("{}", asInteger());
        case Type::Double:
            return fmt::format("{}", asDouble());
        case Type::String:
            return asString();
        case Type::Timestamp:
            return asTimestamp().toString();
        case Type::LargeObject:
            return asLargeObject()->describe();
    }
    return std::string();
}

const char* Value::typeName(Type type) {
    switch (type) {
        case Type::Null:        return "null";
        case Type::Boolean:     return "boolean";
        case Type::Integer:     return "integer";
        case Type::Double:      return "double";
        case Type::String:      return "string";
        case Type::Timestamp:   return "timestamp";
        case Type::LargeObject: return "large object";
    }
    return "unknown";
}

}} // namespace rowdoc::core
