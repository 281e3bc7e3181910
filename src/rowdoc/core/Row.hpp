#pragma once

#include <initializer_list>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "rowdoc/core/Value.hpp"

namespace rowdoc {
namespace core {

/**
 * @brief 一行源数据：有序的 列名 -> 值
 *
 * 值语义。交给构建器之后按值拷贝保存，外部后续修改不会影响已算出的校验和。
 */
class Row {
public:
    using Column = std::pair<std::string, Value>;
    using const_iterator = std::vector<Column>::const_iterator;

    Row() = default;
    Row(std::initializer_list<Column> columns);

    /**
     * @brief 设置列值；同名列（精确匹配）被替换且保留原位置
     */
    Row& set(const std::string& name, Value value);

    /**
     * @brief 按精确列名查找
     * @return 不存在返回 nullptr
     */
    const Value* find(const std::string& name) const;

    /**
     * @brief 把配置里的列名解析为行中的实际列名
     *
     * 先精确匹配，再不区分大小写匹配。
     */
    std::optional<std::string> resolveColumn(const std::string& name) const;

    bool contains(const std::string& name) const { return find(name) != nullptr; }

    std::vector<std::string> columnNames() const;

    size_t size() const { return columns_.size(); }
    bool empty() const { return columns_.empty(); }

    const_iterator begin() const { return columns_.begin(); }
    const_iterator end() const { return columns_.end(); }

private:
    std::vector<Column> columns_;
};

/**
 * @brief 不区分大小写（ASCII）的列名比较
 */
bool equalsIgnoreCase(const std::string& a, const std::string& b);

}} // namespace rowdoc::core
