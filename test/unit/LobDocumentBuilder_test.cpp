// RowDoc 库
// 组件：BLOB/CLOB 构建策略测试

#include "rowdoc/builder/StrategySelector.hpp"
#include "rowdoc/builder/Snapshot.hpp"
#include "rowdoc/core/Exception.hpp"
#include "rowdoc/core/LargeObject.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

namespace rowdoc {
namespace builder {

namespace {
// 元数据序列化与标准行相同，大对象列不参与序列化
const char* kMetadataChecksum = "1954267ee3c4fca41c5b5a8141149f7c647dfcf4";
// SHA-1("hello world" + 元数据序列化)
const char* kHelloChecksum = "991a4b142b9b8395c1f31789e5a3d825b68dfe7c";
// SHA-1("hello world!" + 元数据序列化)
const char* kHelloBangChecksum = "6669c045c35490bb9c63035e1c7b536711f4b32c";
}

class LobDocumentBuilderTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.connector_name = "testconnector";
        config.primary_keys = {"id", "lastName"};
        config.ext_metadata_type = "BLOB_CLOB";
        config.lob_field = "content";
    }

    void TearDown() override {
        if (!temp_file.empty()) {
            std::error_code ec;
            std::filesystem::remove(temp_file, ec);
        }
    }

    DocumentBuilderPtr builder() const {
        return selectDocumentBuilder(config).builder;
    }

    static core::Row rowWith(core::Value content) {
        core::Row row{{"id", 1}, {"lastName", "last_01"}};
        row.set("content", std::move(content));
        return row;
    }

    std::string writeTempFile(const std::string& bytes) {
        temp_file = (std::filesystem::temp_directory_path() /
                     ("rowdoc_lob_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name())))
                        .string();
        std::ofstream out(temp_file, std::ios::binary);
        out << bytes;
        return temp_file;
    }

    core::ConnectorConfig config;
    std::string temp_file;
};

TEST_F(LobDocumentBuilderTest, BlobContent) {
    Snapshot snapshot = buildSnapshot(builder(), rowWith(core::makeBlob("hello world")));

    EXPECT_EQ(snapshot.getDocumentId(), "MSxsYXN0XzAx");
    EXPECT_EQ(snapshot.getChecksum(), kHelloChecksum);

    const core::Document doc = snapshot.getDocumentHandle().getDocument();
    EXPECT_EQ(doc.findProperty(core::PropertyNames::MIMETYPE), "application/octet-stream");
    EXPECT_EQ(doc.findProperty(core::PropertyNames::DISPLAYURL),
              "dbconnector://testconnector.localhost/MSxsYXN0XzAx");
    EXPECT_EQ(doc.findProperty("id"), "1");
    EXPECT_EQ(doc.findProperty("lastName"), "last_01");
    EXPECT_FALSE(doc.findProperty("content").has_value());
    EXPECT_FALSE(doc.findProperty(core::PropertyNames::CHECKSUM).has_value());
    ASSERT_TRUE(doc.hasContent());
    EXPECT_EQ(doc.readContent(), "hello world");
}

TEST_F(LobDocumentBuilderTest, ContentChangeChangesChecksum) {
    auto b = builder();
    EXPECT_EQ(buildSnapshot(b, rowWith(core::makeBlob("hello world!"))).getChecksum(), kHelloBangChecksum);

    // 元数据模式不读取大对象列
    config.ext_metadata_type.clear();
    auto metadata = builder();
    EXPECT_EQ(buildSnapshot(metadata, rowWith(core::makeBlob("hello world"))).getChecksum(), kMetadataChecksum);
    EXPECT_EQ(buildSnapshot(metadata, rowWith(core::makeBlob("hello world!"))).getChecksum(), kMetadataChecksum);
}

TEST_F(LobDocumentBuilderTest, MetadataChangeChangesChecksum) {
    core::Row row = rowWith(core::makeBlob("hello world"));
    row.set("title", "new");
    EXPECT_NE(buildSnapshot(builder(), row).getChecksum(), kHelloChecksum);
}

TEST_F(LobDocumentBuilderTest, ClobAsPlainString) {
    Snapshot snapshot = buildSnapshot(builder(), rowWith("hello world"));
    EXPECT_EQ(snapshot.getChecksum(), kHelloChecksum);

    const core::Document doc = snapshot.getDocumentHandle().getDocument();
    EXPECT_EQ(doc.findProperty(core::PropertyNames::MIMETYPE), "text/plain");
    EXPECT_FALSE(doc.findProperty("content").has_value());
    EXPECT_EQ(doc.readContent(), "hello world");
}

TEST_F(LobDocumentBuilderTest, SniffedTypeWinsOverOverride) {
    config.lob_mime_type = "application/vnd.custom";
    auto b = builder();

    const core::Document pdf =
        buildSnapshot(b, rowWith(core::makeBlob("%PDF-1.7 ..."))).getDocumentHandle().getDocument();
    EXPECT_EQ(pdf.findProperty(core::PropertyNames::MIMETYPE), "application/pdf");

    const core::Document other =
        buildSnapshot(b, rowWith(core::makeBlob("hello world"))).getDocumentHandle().getDocument();
    EXPECT_EQ(other.findProperty(core::PropertyNames::MIMETYPE), "application/vnd.custom");
}

TEST_F(LobDocumentBuilderTest, NullLobIsMetadataOnly) {
    Snapshot snapshot = buildSnapshot(builder(), rowWith(core::Value()));
    EXPECT_EQ(snapshot.getChecksum(), kMetadataChecksum);
    EXPECT_FALSE(snapshot.holder().content().hasContent());

    const core::Document doc = snapshot.getDocumentHandle().getDocument();
    EXPECT_FALSE(doc.hasContent());
    EXPECT_FALSE(doc.findProperty(core::PropertyNames::MIMETYPE).has_value());
    EXPECT_EQ(doc.findProperty("lastName"), "last_01");
}

TEST_F(LobDocumentBuilderTest, OversizedBodySkipped) {
    config.traversal.max_document_size = 5;
    Snapshot snapshot = buildSnapshot(builder(), rowWith(core::makeBlob("hello world")));

    // 校验和仍然覆盖内容
    EXPECT_EQ(snapshot.getChecksum(), kHelloChecksum);
    const ContentHolder& content = snapshot.holder().content();
    EXPECT_TRUE(content.isBodySkipped());
    EXPECT_FALSE(content.hasContent());

    const core::Document doc = snapshot.getDocumentHandle().getDocument();
    EXPECT_FALSE(doc.hasContent());
    EXPECT_EQ(doc.findProperty("id"), "1");
    EXPECT_THROW(doc.openContent(), core::ContentException);
}

TEST_F(LobDocumentBuilderTest, ExcludedMimeTypeSkipsBody) {
    config.traversal.excluded_mime_types = {"application/pdf"};
    auto b = builder();

    Snapshot pdf = buildSnapshot(b, rowWith(core::makeBlob("%PDF-1.7")));
    EXPECT_TRUE(pdf.holder().content().isBodySkipped());
    EXPECT_FALSE(pdf.getDocumentHandle().getDocument().hasContent());

    Snapshot text = buildSnapshot(b, rowWith(core::makeBlob("hello world")));
    EXPECT_FALSE(text.holder().content().isBodySkipped());
    EXPECT_TRUE(text.getDocumentHandle().getDocument().hasContent());
}

TEST_F(LobDocumentBuilderTest, FileBackedLobIsReopenedForHandle) {
    const std::string path = writeTempFile("hello world");
    core::LargeObjectPtr lob = std::make_shared<const core::FileLargeObject>(path, core::LargeObject::Kind::Binary);

    Snapshot snapshot = buildSnapshot(builder(), rowWith(lob));
    EXPECT_EQ(snapshot.getChecksum(), kHelloChecksum);

    // 句柄阶段重新打开文件
    const core::Document doc = snapshot.getDocumentHandle().getDocument();
    EXPECT_EQ(doc.readContent(), "hello world");
    EXPECT_EQ(doc.readContent(), "hello world");
}

TEST_F(LobDocumentBuilderTest, UnavailableLobFailsRow) {
    core::LargeObjectPtr lob = std::make_shared<const core::FileLargeObject>("/nonexistent/rowdoc/missing.bin");
    try {
        buildSnapshot(builder(), rowWith(lob));
        FAIL() << "expected ContentException";
    } catch (const core::ContentException& e) {
        EXPECT_EQ(e.getErrorCode(), core::ErrorCode::ContentUnavailable);
        EXPECT_FALSE(e.getContext().empty());
    }
}

TEST_F(LobDocumentBuilderTest, UnsupportedValueType) {
    try {
        buildSnapshot(builder(), rowWith(42));
        FAIL() << "expected SerializationException";
    } catch (const core::SerializationException& e) {
        EXPECT_EQ(e.getErrorCode(), core::ErrorCode::UnsupportedValueType);
        EXPECT_EQ(e.getColumn(), "content");
    }
}

TEST_F(LobDocumentBuilderTest, MissingLobColumn) {
    core::Row row{{"id", 1}, {"lastName", "last_01"}};
    try {
        buildSnapshot(builder(), row);
        FAIL() << "expected RowException";
    } catch (const core::RowException& e) {
        EXPECT_EQ(e.getErrorCode(), core::ErrorCode::MissingColumn);
    }
}

}} // namespace rowdoc::builder
