// RowDoc 库
// 组件：JSON 行输入测试

#include "rowdoc/io/JsonRowReader.hpp"
#include "rowdoc/core/Exception.hpp"
#include "rowdoc/core/LargeObject.hpp"
#include <gtest/gtest.h>

namespace rowdoc {
namespace io {

TEST(JsonRowReaderTest, ScalarValuesKeepColumnOrder) {
    JsonRowReader reader;
    std::vector<core::Row> rows = reader.parse(R"([
        {"zeta": 1, "alpha": "a", "score": 2.5, "active": false, "none": null}
    ])");

    ASSERT_EQ(rows.size(), 1u);
    const core::Row& row = rows[0];
    EXPECT_EQ(row.columnNames(), (std::vector<std::string>{"zeta", "alpha", "score", "active", "none"}));
    EXPECT_EQ(row.find("zeta")->asInteger(), 1);
    EXPECT_EQ(row.find("alpha")->asString(), "a");
    EXPECT_DOUBLE_EQ(row.find("score")->asDouble(), 2.5);
    EXPECT_FALSE(row.find("active")->asBoolean());
    EXPECT_TRUE(row.find("none")->isNull());
}

TEST(JsonRowReaderTest, TimestampAndInlineLargeObjects) {
    JsonRowReader reader;
    std::vector<core::Row> rows = reader.parse(R"([
        {"ts": {"timestamp": 1300000000123}, "b": {"blob": "bytes"}, "c": {"clob": "text"}}
    ])");

    const core::Row& row = rows.at(0);
    ASSERT_TRUE(row.find("ts")->isTimestamp());
    EXPECT_EQ(row.find("ts")->asTimestamp().epochMillis(), 1300000000123LL);

    ASSERT_TRUE(row.find("b")->isLargeObject());
    EXPECT_EQ(row.find("b")->asLargeObject()->kind(), core::LargeObject::Kind::Binary);
    EXPECT_EQ(row.find("b")->asLargeObject()->size(), 5u);
    EXPECT_EQ(row.find("c")->asLargeObject()->kind(), core::LargeObject::Kind::Character);
}

TEST(JsonRowReaderTest, FileLargeObjectRelativeToBaseDir) {
    JsonRowReader reader("/data/rows");
    std::vector<core::Row> rows = reader.parse(R"([{"doc": {"lob": "files/a.pdf", "type": "binary"}}])");

    auto lob = std::dynamic_pointer_cast<const core::FileLargeObject>(rows[0].find("doc")->asLargeObject());
    ASSERT_TRUE(lob);
    EXPECT_EQ(lob->path(), "/data/rows/files/a.pdf");
    EXPECT_EQ(lob->kind(), core::LargeObject::Kind::Binary);
}

TEST(JsonRowReaderTest, InvalidInput) {
    JsonRowReader reader;
    EXPECT_THROW(reader.parse("{\"id\": 1}"), core::SerializationException);
    EXPECT_THROW(reader.parse("[1, 2]"), core::SerializationException);
    EXPECT_THROW(reader.parse("[{\"id\": [1]}]"), core::SerializationException);
    EXPECT_THROW(reader.parse("[{"), core::SerializationException);
}

TEST(JsonRowReaderTest, IntegerAboveSignedRangeIsRejected) {
    JsonRowReader reader;
    std::vector<core::Row> rows = reader.parse("[{\"id\": 9223372036854775807}]");
    EXPECT_EQ(rows[0].find("id")->asInteger(), 9223372036854775807LL);

    try {
        reader.parse("[{\"id\": 18446744073709551615}, {\"id\": -1}]");
        FAIL() << "expected SerializationException";
    } catch (const core::SerializationException& e) {
        EXPECT_EQ(e.getErrorCode(), core::ErrorCode::UnsupportedValueType);
        EXPECT_EQ(e.getColumn(), "id");
    }
}

TEST(JsonRowReaderTest, TimestampOutOfRangeIsRejected) {
    JsonRowReader reader;
    EXPECT_THROW(reader.parse("[{\"t\": {\"timestamp\": 300000000000000}}]"), core::SerializationException);
}

TEST(JsonRowReaderTest, SampleFile) {
    std::vector<core::Row> rows = JsonRowReader::readFile(std::string(ROWDOC_TEST_DATA_DIR) + "/rows.json");
    ASSERT_EQ(rows.size(), 4u);

    const core::LargeObjectPtr& lob = rows[0].find("content")->asLargeObject();
    EXPECT_EQ(lob->kind(), core::LargeObject::Kind::Character);
    auto in = lob->open();
    EXPECT_EQ(core::readAll(*in, "sample"), "hello world");
    EXPECT_TRUE(rows[2].find("content")->isNull());
}

TEST(JsonRowReaderTest, MissingFile) {
    EXPECT_THROW(JsonRowReader::readFile("/nonexistent/rowdoc/rows.json"), core::ContentException);
}

}} // namespace rowdoc::io
