#include "rowdoc/utils/Digest.hpp"
#include "rowdoc/core/Exception.hpp"
#include <openssl/evp.h>
#include <algorithm>
#include <vector>
#include <fmt/format.h>

namespace rowdoc {
namespace utils {

namespace {

constexpr size_t kReadChunkSize = 64 * 1024;

[[noreturn]] void throwDigestFailure(const char* step) {
    throw core::RowDocException(fmt::format("OpenSSL digest failure in {}", step),
                                core::ErrorCode::InternalError, __FILE__, __LINE__);
}

} // namespace

void Sha1Digest::CtxDeleter::operator()(evp_md_ctx_st* ctx) const noexcept {
    EVP_MD_CTX_free(ctx);
}

Sha1Digest::Sha1Digest() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) {
        throwDigestFailure("EVP_MD_CTX_new");
    }
    if (EVP_DigestInit_ex(ctx_.get(), EVP_sha1(), nullptr) != 1) {
        throwDigestFailure("EVP_DigestInit_ex");
    }
}

Sha1Digest::~Sha1Digest() = default;

void Sha1Digest::update(const void* data, size_t length) {
    if (finished_) {
        throw core::RowDocException("Sha1Digest updated after finish",
                                    core::ErrorCode::InternalError, __FILE__, __LINE__);
    }
    if (length == 0) {
        return;
    }
    if (EVP_DigestUpdate(ctx_.get(), data, length) != 1) {
        throwDigestFailure("EVP_DigestUpdate");
    }
}

std::uint64_t Sha1Digest::update(std::istream& in, std::string* head, size_t head_limit) {
    std::vector<char> buffer(kReadChunkSize);
    std::uint64_t total = 0;

    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize got = in.gcount();
        if (got <= 0) {
            break;
        }
        if (head && head->size() < head_limit) {
            size_t take = std::min(head_limit - head->size(), static_cast<size_t>(got));
            head->append(buffer.data(), take);
        }
        update(buffer.data(), static_cast<size_t>(got));
        total += static_cast<std::uint64_t>(got);
    }

    if (in.bad()) {
        throw core::ContentException("Stream read failed while computing checksum", "",
                                     core::ErrorCode::ContentReadError, __FILE__, __LINE__);
    }
    return total;
}

std::string Sha1Digest::finishHex() {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx_.get(), digest, &length) != 1 || length != kDigestLength) {
        throwDigestFailure("EVP_DigestFinal_ex");
    }
    finished_ = true;

    std::string result;
    result.reserve(kHexLength);
    for (unsigned int i = 0; i < length; ++i) {
        result += fmt::format("{:02x}", digest[i]);
    }
    return result;
}

std::string Sha1Digest::hex(std::string_view data) {
    Sha1Digest digest;
    digest.update(data);
    return digest.finishHex();
}

std::string base64Encode(std::string_view data) {
    if (data.empty()) {
        return std::string();
    }
    // 每3字节输出4字符，外加结尾 '\0'
    std::string out(4 * ((data.size() + 2) / 3) + 1, '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                  reinterpret_cast<const unsigned char*>(data.data()),
                                  static_cast<int>(data.size()));
    if (written < 0) {
        throwDigestFailure("EVP_EncodeBlock");
    }
    out.resize(static_cast<size_t>(written));
    return out;
}

}} // namespace rowdoc::utils
