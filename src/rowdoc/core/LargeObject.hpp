#pragma once

#include <cstdint>
#include <istream>
#include <memory>
#include <string>

namespace rowdoc {
namespace core {

/**
 * @brief 大对象定位器
 *
 * 只保存“如何取到内容”，每次 open() 都返回一个新的流，
 * 因此快照阶段算完校验和之后，句柄阶段仍可按需重新打开。
 * 实现必须可被多个线程同时 open()。
 */
class LargeObject {
public:
    enum class Kind {
        Binary,     // BLOB
        Character   // CLOB，内容按 UTF-8 处理
    };

    virtual ~LargeObject() = default;

    virtual Kind kind() const = 0;

    /**
     * @brief 内容字节数
     * @throws ContentException 无法获取大小时
     */
    virtual std::uint64_t size() const = 0;

    /**
     * @brief 打开一个新的只读流
     * @throws ContentException 无法打开时
     */
    virtual std::unique_ptr<std::istream> open() const = 0;

    /**
     * @brief 日志/调试用描述
     */
    virtual std::string describe() const = 0;
};

/**
 * @brief 内存中的大对象（已物化的内容）
 */
class MemoryLargeObject : public LargeObject {
public:
    MemoryLargeObject(std::string bytes, Kind kind = Kind::Binary)
        : bytes_(std::move(bytes)), kind_(kind) {}

    Kind kind() const override { return kind_; }
    std::uint64_t size() const override { return bytes_.size(); }
    std::unique_ptr<std::istream> open() const override;
    std::string describe() const override;

    const std::string& bytes() const { return bytes_; }

private:
    std::string bytes_;
    Kind kind_;
};

/**
 * @brief 文件支撑的大对象，每次 open() 重新打开文件
 */
class FileLargeObject : public LargeObject {
public:
    explicit FileLargeObject(std::string path, Kind kind = Kind::Binary)
        : path_(std::move(path)), kind_(kind) {}

    Kind kind() const override { return kind_; }
    std::uint64_t size() const override;
    std::unique_ptr<std::istream> open() const override;
    std::string describe() const override;

    const std::string& path() const { return path_; }

private:
    std::string path_;
    Kind kind_;
};

using LargeObjectPtr = std::shared_ptr<const LargeObject>;

inline LargeObjectPtr makeBlob(std::string bytes) {
    return std::make_shared<MemoryLargeObject>(std::move(bytes), LargeObject::Kind::Binary);
}

inline LargeObjectPtr makeClob(std::string text) {
    return std::make_shared<MemoryLargeObject>(std::move(text), LargeObject::Kind::Character);
}

/**
 * @brief 把流中剩余内容全部读出
 * @throws ContentException 读取出错时
 */
std::string readAll(std::istream& in, const std::string& source);

}} // namespace rowdoc::core
