/**
 * @file Digest.hpp
 * @brief 校验和与编码工具（基于 OpenSSL EVP）
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <istream>
#include <memory>
#include <string>
#include <string_view>

struct evp_md_ctx_st;

namespace rowdoc {
namespace utils {

/**
 * @brief 增量 SHA-1 摘要
 *
 * 160位，输出为40个小写十六进制字符。finish() 之后不可再 update()。
 */
class Sha1Digest {
public:
    static constexpr size_t kDigestLength = 20;
    static constexpr size_t kHexLength = 40;

    Sha1Digest();
    ~Sha1Digest();

    Sha1Digest(const Sha1Digest&) = delete;
    Sha1Digest& operator=(const Sha1Digest&) = delete;

    void update(const void* data, size_t length);
    void update(std::string_view data) { update(data.data(), data.size()); }

    /**
     * @brief 读完整个流并计入摘要
     * @param head 若非空，保存流开头最多 head_limit 个字节（用于内容嗅探）
     * @return 读取的字节数
     */
    std::uint64_t update(std::istream& in, std::string* head = nullptr, size_t head_limit = 0);

    std::string finishHex();

    /**
     * @brief 一次性计算
     */
    static std::string hex(std::string_view data);

private:
    struct CtxDeleter {
        void operator()(evp_md_ctx_st* ctx) const noexcept;
    };
    std::unique_ptr<evp_md_ctx_st, CtxDeleter> ctx_;
    bool finished_ = false;
};

/**
 * @brief 标准字母表 base64 编码（带 '=' 填充）
 */
std::string base64Encode(std::string_view data);

}} // namespace rowdoc::utils
