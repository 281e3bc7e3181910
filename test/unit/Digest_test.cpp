// RowDoc 库
// 组件：SHA-1 与 base64 工具测试

#include "rowdoc/utils/Digest.hpp"
#include "rowdoc/core/Exception.hpp"
#include <gtest/gtest.h>
#include <sstream>
#include <string>

namespace rowdoc {
namespace utils {

TEST(DigestTest, KnownSha1Vectors) {
    EXPECT_EQ(Sha1Digest::hex("abc"), "a9993e364706816aba3e25717850c26c9cd0d89d");
    EXPECT_EQ(Sha1Digest::hex(""), "da39a3ee5e6b4b0d3255bfef95601890afd80709");
}

TEST(DigestTest, IncrementalUpdateMatchesOneShot) {
    Sha1Digest digest;
    digest.update("a");
    digest.update("bc");
    EXPECT_EQ(digest.finishHex(), Sha1Digest::hex("abc"));
}

TEST(DigestTest, StreamUpdateCapturesHead) {
    std::string data(200 * 1024, 'x');
    data[0] = '%';
    std::istringstream in(data);

    Sha1Digest digest;
    std::string head;
    std::uint64_t total = digest.update(in, &head, 16);

    EXPECT_EQ(total, data.size());
    EXPECT_EQ(head, data.substr(0, 16));
    EXPECT_EQ(digest.finishHex(), Sha1Digest::hex(data));
}

TEST(DigestTest, HexIsFortyLowercaseChars) {
    std::string hex = Sha1Digest::hex("row");
    ASSERT_EQ(hex.size(), Sha1Digest::kHexLength);
    for (char c : hex) {
        EXPECT_TRUE((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f')) << c;
    }
}

TEST(DigestTest, UpdateAfterFinishThrows) {
    Sha1Digest digest;
    digest.update("abc");
    digest.finishHex();
    EXPECT_THROW(digest.update("more"), core::RowDocException);
}

TEST(DigestTest, Base64StandardAlphabet) {
    EXPECT_EQ(base64Encode("1,last_01"), "MSxsYXN0XzAx");
    EXPECT_EQ(base64Encode(""), "");
    EXPECT_EQ(base64Encode("f"), "Zg==");
    EXPECT_EQ(base64Encode("fo"), "Zm8=");
    EXPECT_EQ(base64Encode("foo"), "Zm9v");
    EXPECT_EQ(base64Encode(std::string("\xfb\xff", 2)), "+/8=");
}

}} // namespace rowdoc::utils
