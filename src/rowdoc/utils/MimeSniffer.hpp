#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace rowdoc {
namespace utils {

/**
 * @brief 按文件头魔数识别 MIME 类型
 */
class MimeSniffer {
public:
    // 嗅探所需的最多字节数
    static constexpr size_t kSniffLength = 512;

    /**
     * @param head 内容开头的若干字节
     * @return 无法判断返回 nullopt
     */
    static std::optional<std::string> sniff(std::string_view head);

private:
    static bool startsWith(std::string_view data, std::string_view prefix);
    static bool startsWithIgnoreCase(std::string_view data, std::string_view prefix);
    static std::string_view skipLeadingWhitespace(std::string_view data);
};

}} // namespace rowdoc::utils
