#pragma once

#include <optional>
#include <string>
#include "rowdoc/core/LargeObject.hpp"

namespace rowdoc {
namespace builder {

/**
 * @brief 策略计算出的内容与校验和
 *
 * checksum 只由参与变更检测的内容决定。content 为空表示文档没有正文
 * （Url 策略，或大对象正文被跳过）。
 */
struct ContentHolder {
    std::string checksum;
    core::LargeObjectPtr content;
    std::optional<std::string> mime_type;
    std::optional<std::string> reference_url;

    // 正文被跳过时的原因，如超过大小限制
    std::optional<std::string> body_skipped_reason;

    bool hasContent() const { return content != nullptr; }
    bool isBodySkipped() const { return body_skipped_reason.has_value(); }
};

}} // namespace rowdoc::builder
