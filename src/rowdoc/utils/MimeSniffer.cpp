#include "rowdoc/utils/MimeSniffer.hpp"
#include <cctype>

namespace rowdoc {
namespace utils {

std::optional<std::string> MimeSniffer::sniff(std::string_view head) {
    if (head.empty()) {
        return std::nullopt;
    }

    // PDF: %PDF-
    if (startsWith(head, "%PDF-")) {
        return std::string("application/pdf");
    }

    // PNG: 89 50 4E 47 0D 0A 1A 0A
    if (startsWith(head, std::string_view("\x89PNG\r\n\x1A\n", 8))) {
        return std::string("image/png");
    }

    // JPEG: FF D8 FF
    if (startsWith(head, "\xFF\xD8\xFF")) {
        return std::string("image/jpeg");
    }

    // GIF: GIF87a or GIF89a
    if (startsWith(head, "GIF87a") || startsWith(head, "GIF89a")) {
        return std::string("image/gif");
    }

    // ZIP 容器（含 OOXML）: PK 03 04
    if (startsWith(head, "PK\x03\x04")) {
        return std::string("application/zip");
    }

    // OLE2 复合文档（旧版 Office）: D0 CF 11 E0 A1 B1 1A E1
    if (startsWith(head, "\xD0\xCF\x11\xE0\xA1\xB1\x1A\xE1")) {
        return std::string("application/msword");
    }

    // gzip: 1F 8B
    if (startsWith(head, "\x1F\x8B")) {
        return std::string("application/x-gzip");
    }

    // RTF: {\rtf
    if (startsWith(head, "{\\rtf")) {
        return std::string("application/rtf");
    }

    // 文本类：允许前导空白和 UTF-8 BOM
    std::string_view text = head;
    if (startsWith(text, "\xEF\xBB\xBF")) {
        text.remove_prefix(3);
    }
    text = skipLeadingWhitespace(text);

    if (startsWithIgnoreCase(text, "<!DOCTYPE html") || startsWithIgnoreCase(text, "<html")) {
        return std::string("text/html");
    }
    if (startsWith(text, "<?xml")) {
        return std::string("text/xml");
    }

    return std::nullopt;
}

bool MimeSniffer::startsWith(std::string_view data, std::string_view prefix) {
    return data.size() >= prefix.size() && data.compare(0, prefix.size(), prefix) == 0;
}

bool MimeSniffer::startsWithIgnoreCase(std::string_view data, std::string_view prefix) {
    if (data.size() < prefix.size()) {
        return false;
    }
    for (size_t i = 0; i < prefix.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(data[i])) !=
            std::tolower(static_cast<unsigned char>(prefix[i]))) {
            return false;
        }
    }
    return true;
}

std::string_view MimeSniffer::skipLeadingWhitespace(std::string_view data) {
    size_t i = 0;
    while (i < data.size() && std::isspace(static_cast<unsigned char>(data[i]))) {
        ++i;
    }
    return data.substr(i);
}

}} // namespace rowdoc::utils
