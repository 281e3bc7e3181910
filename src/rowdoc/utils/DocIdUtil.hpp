#pragma once

#include <string>
#include "rowdoc/core/ConnectorConfig.hpp"
#include "rowdoc/core/Row.hpp"

namespace rowdoc {
namespace utils {

/**
 * @brief 文档标识生成
 *
 * docid = base64(主键值按顺序以 ',' 连接)。值中的 '\' 与 ',' 先转义为
 * "\\" 与 "\,"，保证不同的主键元组不会得到相同的标识。
 */
class DocIdUtil {
public:
    static constexpr char kDelimiter = ',';
    static constexpr char kEscape = '\\';

    /**
     * @throws RowException 主键列缺失或值为空
     * @throws SerializationException 主键值是大对象
     */
    static std::string generateDocId(const core::PrimaryKey& primary_key, const core::Row& row);

    /**
     * @brief 未编码的连接形式
     */
    static std::string joinKeyValues(const core::PrimaryKey& primary_key, const core::Row& row);

private:
    static void appendEscaped(std::string& target, const std::string& value);
};

}} // namespace rowdoc::utils
