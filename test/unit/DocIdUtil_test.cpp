// RowDoc 库
// 组件：文档ID生成测试

#include "rowdoc/utils/DocIdUtil.hpp"
#include "rowdoc/core/Exception.hpp"
#include "rowdoc/core/LargeObject.hpp"
#include <gtest/gtest.h>

namespace rowdoc {
namespace utils {

TEST(DocIdUtilTest, StandardRow) {
    core::Row row{{"id", 1}, {"lastName", "last_01"}};
    EXPECT_EQ(DocIdUtil::generateDocId({"id", "lastName"}, row), "MSxsYXN0XzAx");
}

TEST(DocIdUtilTest, KeyOrderFollowsPrimaryKey) {
    core::Row row{{"id", 1}, {"lastName", "last_01"}};
    EXPECT_EQ(DocIdUtil::joinKeyValues({"lastName", "id"}, row), "last_01,1");
}

TEST(DocIdUtilTest, Deterministic) {
    core::Row a{{"id", 7}, {"name", "x"}};
    core::Row b{{"name", "x"}, {"id", 7}};
    EXPECT_EQ(DocIdUtil::generateDocId({"id", "name"}, a),
              DocIdUtil::generateDocId({"id", "name"}, b));
}

// 分隔符出现在值中时必须转义，避免不同元组得到相同ID
TEST(DocIdUtilTest, DelimiterInValuesDoesNotCollide) {
    core::Row a{{"k1", "a,b"}, {"k2", "c"}};
    core::Row b{{"k1", "a"}, {"k2", "b,c"}};

    EXPECT_EQ(DocIdUtil::joinKeyValues({"k1", "k2"}, a), "a\\,b,c");
    EXPECT_EQ(DocIdUtil::joinKeyValues({"k1", "k2"}, b), "a,b\\,c");
    EXPECT_NE(DocIdUtil::generateDocId({"k1", "k2"}, a),
              DocIdUtil::generateDocId({"k1", "k2"}, b));
}

TEST(DocIdUtilTest, EscapeCharacterIsEscaped) {
    core::Row a{{"k1", "a\\"}, {"k2", "b"}};
    core::Row b{{"k1", "a"}, {"k2", "\\b"}};
    EXPECT_NE(DocIdUtil::joinKeyValues({"k1", "k2"}, a),
              DocIdUtil::joinKeyValues({"k1", "k2"}, b));
}

TEST(DocIdUtilTest, MissingKeyColumn) {
    core::Row row{{"id", 1}};
    try {
        DocIdUtil::generateDocId({"id", "lastName"}, row);
        FAIL() << "expected RowException";
    } catch (const core::RowException& e) {
        EXPECT_EQ(e.getErrorCode(), core::ErrorCode::MissingPrimaryKeyColumn);
        EXPECT_EQ(e.getColumn(), "lastName");
    }
}

TEST(DocIdUtilTest, NullKeyValue) {
    core::Row row{{"id", 1}, {"lastName", core::Value()}};
    try {
        DocIdUtil::generateDocId({"id", "lastName"}, row);
        FAIL() << "expected RowException";
    } catch (const core::RowException& e) {
        EXPECT_EQ(e.getErrorCode(), core::ErrorCode::NullPrimaryKeyValue);
    }
}

TEST(DocIdUtilTest, LargeObjectKeyRejected) {
    core::Row row{{"id", core::Value(core::makeBlob("x"))}};
    EXPECT_THROW(DocIdUtil::generateDocId({"id"}, row), core::SerializationException);
}

}} // namespace rowdoc::utils
