#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "rowdoc/core/Row.hpp"

namespace rowdoc {
namespace core {

/**
 * @brief 外部元数据模式
 */
enum class ExtMetadataType {
    None,         // 行元数据作为正文（内容推送）
    CompleteUrl,  // 某列保存完整文档URL
    DocId,        // 基础URL + 文档ID列
    Lob           // BLOB/CLOB 列作为正文
};

// 配置中使用的模式字符串
struct ExtMetadataTypeNames {
    inline static constexpr char NO_EXT_METADATA[] = "NO_EXT_METADATA";
    inline static constexpr char COMPLETE_URL[]    = "COMPLETE_URL";
    inline static constexpr char DOC_ID[]          = "DOC_ID";
    inline static constexpr char BLOB_CLOB[]       = "BLOB_CLOB";
};

const char* toString(ExtMetadataType type) noexcept;

/**
 * @brief 解析模式字符串（不区分大小写，空白视为 None）
 * @return 无法识别返回 nullopt
 */
std::optional<ExtMetadataType> parseExtMetadataType(const std::string& name);

using PrimaryKey = std::vector<std::string>;

/**
 * @brief 遍历上下文：索引端对正文的限制
 */
struct TraversalContext {
    static constexpr std::uint64_t kDefaultMaxDocumentSize = 30 * 1024 * 1024;

    std::uint64_t max_document_size = kDefaultMaxDocumentSize;
    std::vector<std::string> excluded_mime_types;

    bool isMimeTypeExcluded(const std::string& mime_type) const;
};

/**
 * @brief 连接器配置
 *
 * 启动时加载一次，之后只读；构建器不会修改它。
 */
struct ConnectorConfig {
    std::string connector_name;
    std::vector<std::string> primary_keys;
    std::string ext_metadata_type;

    std::optional<std::string> document_url_field;
    std::optional<std::string> document_id_field;
    std::string base_url;
    std::optional<std::string> lob_field;
    std::optional<std::string> last_modified_field;

    std::vector<std::string> skip_columns;
    std::optional<std::string> lob_mime_type;

    TraversalContext traversal;

    /**
     * @brief 按配置顺序把主键列解析为行中的实际列名
     * @throws RowException 行中缺少某个主键列
     */
    PrimaryKey getPrimaryKeyColumns(const Row& row) const;

    /**
     * @brief 基本校验：连接器名、主键列表不能为空
     * @throws ConfigException
     */
    void validate() const;

    /**
     * @brief 可选列名字段是否真正配置了（非空白）
     */
    static bool isConfigured(const std::optional<std::string>& field);
};

}} // namespace rowdoc::core
