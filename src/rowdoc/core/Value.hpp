#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include "rowdoc/core/LargeObject.hpp"

namespace rowdoc {
namespace core {

/**
 * @brief 时间戳列值（UTC，毫秒精度）
 *
 * 取值范围为 0000-01-01 至 9999-12-31，保证四位年份的 ISO 形式。
 */
struct Timestamp {
    using TimePoint = std::chrono::time_point<std::chrono::system_clock, std::chrono::milliseconds>;

    TimePoint time;

    static constexpr std::int64_t kMinEpochMillis = -62167219200000LL;
    static constexpr std::int64_t kMaxEpochMillis = 253402300799999LL;

    /**
     * @throws SerializationException 超出取值范围时
     */
    static Timestamp fromEpochMillis(std::int64_t millis);
    std::int64_t epochMillis() const;

    /**
     * @brief "YYYY-MM-DD HH:MM:SS.mmm"，用于元数据字符串化
     */
    std::string toString() const;

    /**
     * @brief ISO-8601 形式 "YYYY-MM-DDTHH:MM:SS.mmmZ"，用于最后修改时间属性
     */
    std::string toIso8601() const;

    bool operator==(const Timestamp& other) const { return time == other.time; }
    bool operator!=(const Timestamp& other) const { return time != other.time; }
};

/**
 * @brief 单个列值
 *
 * 标量值或大对象引用；构造后不可修改。
 */
class Value {
public:
    enum class Type {
        Null,
        Boolean,
        Integer,
        Double,
        String,
        Timestamp,
        LargeObject
    };

    Value() = default;
    Value(bool v) : data_(v) {}
    Value(int v) : data_(static_cast<std::int64_t>(v)) {}
    Value(std::int64_t v) : data_(v) {}
    Value(double v) : data_(v) {}
    Value(const char* v) : data_(std::string(v)) {}
    Value(std::string v) : data_(std::move(v)) {}
    Value(core::Timestamp v) : data_(v) {}
    Value(LargeObjectPtr v);

    Type type() const;
    bool isNull() const { return std::holds_alternative<std::monostate>(data_); }
    bool isLargeObject() const { return std::holds_alternative<LargeObjectPtr>(data_); }
    bool isTimestamp() const { return std::holds_alternative<core::Timestamp>(data_); }
    bool isString() const { return std::holds_alternative<std::string>(data_); }

    // 类型不符时抛出 std::bad_variant_access
    bool asBoolean() const { return std::get<bool>(data_); }
    std::int64_t asInteger() const { return std::get<std::int64_t>(data_); }
    double asDouble() const { return std::get<double>(data_); }
    const std::string& asString() const { return std::get<std::string>(data_); }
    const core::Timestamp& asTimestamp() const { return std::get<core::Timestamp>(data_); }
    const LargeObjectPtr& asLargeObject() const { return std::get<LargeObjectPtr>(data_); }

    /**
     * @brief 标量值的字符串形式；空值为空串，大对象为描述串
     */
    std::string toString() const;

    static const char* typeName(Type type);

private:
    std::variant<std::monostate, bool, std::int64_t, double, std::string,
                 core::Timestamp, LargeObjectPtr> data_;
};

}} // namespace rowdoc::core
