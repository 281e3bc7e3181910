#pragma once

#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "rowdoc/core/LargeObject.hpp"

namespace rowdoc {
namespace core {

// 文档属性名常量（索引端约定的保留名）
struct PropertyNames {
    inline static constexpr char DOCID[]        = "google:docid";
    inline static constexpr char CHECKSUM[]     = "google:sum";      // 只出现在快照里
    inline static constexpr char MIMETYPE[]     = "google:mimetype";
    inline static constexpr char DISPLAYURL[]   = "google:displayurl";
    inline static constexpr char SEARCHURL[]    = "google:searchurl";
    inline static constexpr char LASTMODIFIED[] = "google:lastmodified";

    inline static constexpr char DEFAULT_MIMETYPE[] = "text/html";
};

/**
 * @brief 交付给索引端的文档
 *
 * 有序的多值属性表，外加可选的正文内容。正文以大对象定位器的形式保存，
 * 消费方通过 openContent() 流式读取，不要求整体驻留内存。
 */
class Document {
public:
    using Property = std::pair<std::string, std::vector<std::string>>;

    /**
     * @brief 设置属性（替换已有值）
     */
    void setProperty(const std::string& name, const std::string& value);

    /**
     * @brief 追加一个属性值
     */
    void addProperty(const std::string& name, const std::string& value);

    /**
     * @brief 第一个值；属性不存在返回 nullopt
     */
    std::optional<std::string> findProperty(const std::string& name) const;

    const std::vector<std::string>* findValues(const std::string& name) const;

    std::vector<std::string> getPropertyNames() const;

    const std::vector<Property>& properties() const { return properties_; }

    void setContent(LargeObjectPtr content) { content_ = std::move(content); }
    bool hasContent() const { return content_ != nullptr; }
    const LargeObjectPtr& content() const { return content_; }

    /**
     * @brief 打开正文流
     * @throws ContentException 无正文或无法打开时
     */
    std::unique_ptr<std::istream> openContent() const;

    /**
     * @brief 读出全部正文，仅用于小文档和测试
     */
    std::string readContent() const;

private:
    std::vector<Property> properties_;
    LargeObjectPtr content_;
};

}} // namespace rowdoc::core
