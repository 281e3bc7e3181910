#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include "rowdoc/core/ConnectorConfig.hpp"
#include "rowdoc/core/Document.hpp"
#include "rowdoc/core/Row.hpp"
#include "rowdoc/xml/RowSerializer.hpp"

namespace rowdoc {
namespace builder {

/**
 * @brief 三种策略共用的构建步骤
 *
 * 只持有不可变的配置和序列化器，可被多个线程同时使用。
 */
class BuilderSupport {
public:
    BuilderSupport(std::shared_ptr<const core::ConnectorConfig> config,
                   std::shared_ptr<const xml::RowSerializer> serializer);

    const core::ConnectorConfig& config() const { return *config_; }
    const std::string& connectorName() const { return config_->connector_name; }

    /**
     * @brief 不参与序列化和元数据的列：配置的跳过列 + 最后修改时间列
     */
    const std::vector<std::string>& skipColumns() const { return skip_columns_; }

    /**
     * @brief 行的规范序列化（不含跳过列和大对象）
     * @param own_columns 额外排除的列
     */
    std::string getXmlDoc(const core::Row& row, const std::vector<std::string>& own_columns = {}) const;

    /**
     * @brief 元数据序列化的 SHA-1
     */
    std::string getChecksum(const core::Row& row) const;

    // dbconnector://<connector>.localhost/<docid>
    std::string getDisplayUrl(const std::string& doc_id) const;

    /**
     * @brief 把每个非空列写成文档属性
     * @param own_columns 策略自己消费的列，同样不作为元数据
     */
    void setMetaInfo(core::Document& doc, const core::Row& row,
                     const std::vector<std::string>& own_columns = {}) const;

    /**
     * @brief 配置的最后修改时间列是时间戳时，设置 google:lastmodified
     */
    void setLastModified(core::Document& doc, const core::Row& row) const;

    static std::string checksum(std::string_view bytes);

private:
    std::shared_ptr<const core::ConnectorConfig> config_;
    std::shared_ptr<const xml::RowSerializer> serializer_;
    std::vector<std::string> skip_columns_;
};

}} // namespace rowdoc::builder
