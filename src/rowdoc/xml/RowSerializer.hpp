#pragma once

#include <memory>
#include <string>
#include <vector>
#include "rowdoc/core/Row.hpp"

namespace rowdoc {
namespace xml {

/**
 * @brief 行到规范字节形式的序列化器
 *
 * 输出既是元数据正文，也是校验和的输入，因此必须是输入的纯函数。
 * 实现需可被多个线程同时调用。
 */
class RowSerializer {
public:
    virtual ~RowSerializer() = default;

    /**
     * @param connector_name 连接器名
     * @param row 行数据
     * @param excluded_columns 不参与序列化的列（不区分大小写）
     * @throws SerializationException 行无法序列化
     */
    virtual std::string serialize(const std::string& connector_name,
                                  const core::Row& row,
                                  const std::vector<std::string>& excluded_columns) const = 0;
};

/**
 * @brief 默认序列化器：XHTML 表格，每列一行 "列名=值"
 *
 * 空值和大对象列不输出。
 */
class XhtmlRowSerializer : public RowSerializer {
public:
    std::string serialize(const std::string& connector_name,
                          const core::Row& row,
                          const std::vector<std::string>& excluded_columns) const override;
};

std::shared_ptr<const RowSerializer> defaultRowSerializer();

/**
 * @brief 列是否在排除列表中（不区分大小写）
 */
bool isExcludedColumn(const std::string& column, const std::vector<std::string>& excluded_columns);

}} // namespace rowdoc::xml
