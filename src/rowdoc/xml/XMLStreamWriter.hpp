/**
 * @file XMLStreamWriter.hpp
 * @brief 行序列化使用的内存 XML 写入器
 */

#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace rowdoc {
namespace xml {

/**
 * @brief 顺序写出 XML 的写入器，结果保存在内存字符串中
 *
 * 起始标签保持打开直到写入内容或子元素，因此属性可以紧跟 startElement 写入；
 * 没有内容的元素以 `<name />` 结束。
 * XML 1.0 不允许的控制字符直接拒绝，不做静默过滤，避免不同的行得到相同的输出。
 */
class XMLStreamWriter {
public:
    XMLStreamWriter() = default;
    ~XMLStreamWriter();

    XMLStreamWriter(const XMLStreamWriter&) = delete;
    XMLStreamWriter& operator=(const XMLStreamWriter&) = delete;

    void startDocument(std::string_view encoding = "UTF-8");
    /// 关闭所有仍然打开的元素
    void endDocument();

    void startElement(std::string_view name);
    void endElement();
    void writeEmptyElement(std::string_view name);

    /**
     * @brief 给当前打开的起始标签追加属性
     * @throws RowDocException 没有打开的起始标签
     * @throws SerializationException 值中含非法控制字符
     */
    void writeAttribute(std::string_view name, std::string_view value);

    /**
     * @throws SerializationException 含非法控制字符
     */
    void writeText(std::string_view text);

    const std::string& toString() const { return out_; }
    size_t depth() const { return open_.size(); }

    /**
     * @brief 第一个 XML 1.0 非法字符的位置，合法时返回 npos
     */
    static size_t findInvalidChar(std::string_view text);

private:
    void closeStartTag();
    void appendEscaped(std::string_view text);

    std::string out_;
    std::vector<std::string> open_;
    bool start_tag_open_ = false;
};

}} // namespace rowdoc::xml
