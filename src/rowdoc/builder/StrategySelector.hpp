#pragma once

#include <memory>
#include <optional>
#include <string>
#include "rowdoc/builder/DocumentBuilder.hpp"
#include "rowdoc/core/ConnectorConfig.hpp"
#include "rowdoc/xml/RowSerializer.hpp"

namespace rowdoc {
namespace builder {

/**
 * @brief 请求的模式缺少必需字段，回退到元数据模式时产生的事件
 */
struct ConfigurationMismatch {
    std::string requested_type;  // 配置中的原始模式字符串
    std::string missing_field;   // 缺失的配置项，模式无法识别时为空
    std::string reason;
};

struct ModeSelection {
    DocumentBuilderPtr builder;
    std::string requested;
    core::ExtMetadataType effective = core::ExtMetadataType::None;
    std::optional<ConfigurationMismatch> mismatch;

    bool isFallback() const { return mismatch.has_value(); }
};

/**
 * @brief 根据配置选择唯一的构建策略
 *
 * - COMPLETE_URL 且配置了URL列 -> Url（完整URL）
 * - DOC_ID 且配置了文档ID列 -> Url（基础URL + ID）
 * - BLOB_CLOB 且配置了大对象列 -> Lob
 * - 其他 -> Metadata；请求了其他模式时返回 mismatch 并记录警告
 *
 * 不修改传入的配置。
 *
 * @throws ConfigException 配置本身无效（如没有主键列）
 */
ModeSelection selectDocumentBuilder(const core::ConnectorConfig& config,
                                    std::shared_ptr<const xml::RowSerializer> serializer = xml::defaultRowSerializer());

}} // namespace rowdoc::builder
