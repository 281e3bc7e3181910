#pragma once

#include <memory>
#include <variant>
#include "rowdoc/builder/LobDocumentBuilder.hpp"
#include "rowdoc/builder/MetadataDocumentBuilder.hpp"
#include "rowdoc/builder/UrlDocumentBuilder.hpp"
#include "rowdoc/core/ConnectorConfig.hpp"
#include "rowdoc/core/Row.hpp"

namespace rowdoc {
namespace builder {

/**
 * @brief 行到文档的构建策略
 *
 * 启动时由 selectDocumentBuilder 选定一次，之后对每一行复用。
 * 每种策略提供 getContentHolder（快照阶段）和 getDocument（句柄阶段）。
 */
using DocumentBuilder = std::variant<MetadataDocumentBuilder, UrlDocumentBuilder, LobDocumentBuilder>;
using DocumentBuilderPtr = std::shared_ptr<const DocumentBuilder>;

class DocumentHolder;
class Snapshot;
class Handle;

/**
 * @brief 第一阶段：由行构建快照
 *
 * 解析主键列、生成文档ID、由策略计算内容和校验和，并把构建句柄所需的
 * 一切保存到快照的 DocumentHolder 中。
 *
 * @throws RowException 缺少主键列等行级错误
 * @throws SerializationException 行无法序列化
 * @throws ContentException 大对象无法读取
 */
Snapshot buildSnapshot(const DocumentBuilderPtr& builder, const core::Row& row);

/**
 * @brief 第二阶段：只能由快照持有的 DocumentHolder 构建句柄
 */
Handle buildHandle(const DocumentHolder& holder);

/**
 * @brief 策略实际运行的外部元数据模式
 */
core::ExtMetadataType modeOf(const DocumentBuilder& builder);

const core::ConnectorConfig& configOf(const DocumentBuilder& builder);

}} // namespace rowdoc::builder
