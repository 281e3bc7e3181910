#pragma once

#include <string>
#include <vector>
#include "rowdoc/core/Row.hpp"

namespace rowdoc {
namespace io {

/**
 * @brief 从 JSON 数组读取行
 *
 * 每个对象是一行，列顺序与对象中的键顺序一致。值的映射：
 * - 字符串/整数/浮点/布尔/null 直接对应
 * - {"timestamp": 毫秒} -> 时间戳
 * - {"lob": "路径", "type": "binary"|"character"} -> 文件大对象，
 *   相对路径以 JSON 文件所在目录为基准
 * - {"blob": "文本"} / {"clob": "文本"} -> 内存大对象
 */
class JsonRowReader {
public:
    explicit JsonRowReader(std::string base_dir = ".");

    /**
     * @throws ContentException 文件无法读取
     * @throws SerializationException JSON 格式错误或值无法映射
     */
    static std::vector<core::Row> readFile(const std::string& path);

    std::vector<core::Row> parse(const std::string& text) const;

private:
    std::string base_dir_;
};

}} // namespace rowdoc::io
