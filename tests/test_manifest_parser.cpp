#include <gtest/gtest.h>

#include "util/manifest_parser.hpp"
#include "util/transfer_manifest.hpp"

#include <string>

namespace batchsync {

class ManifestParserTest : public ::testing::Test {
  protected:
    ManifestParser parser;
};

TEST_F(ManifestParserTest, ParsesSerializedManifest) {
    TransferManifest m;
    m.label = "Daily_2024-03-10";
    m.source_endpoint = "src";
    m.dest_endpoint = "dst";
    m.policy.sync_level = SyncLevel::Mtime;
    m.policy.verify_checksum = false;
    m.items.push_back({.source = "/stage/Daily_2024-03-10/a.tar",
                       .destination = "/dest/a.tar",
                       .kind = TransferKind::ArchivedBundle,
                       .size_bytes = 20480,
                       .sha256 = "abc123"});
    m.items.push_back({.source = "/src/b/big.bin",
                       .destination = "/dest/b/big_20240310_120000.bin",
                       .kind = TransferKind::RawFile,
                       .size_bytes = 209715200});

    auto parsed = parser.Parse(SerializeManifest(m));
    ASSERT_TRUE(parsed.has_value()) << parsed.error();

    EXPECT_EQ(parsed->label, m.label);
    EXPECT_EQ(parsed->source_endpoint, "src");
    EXPECT_EQ(parsed->dest_endpoint, "dst");
    EXPECT_EQ(parsed->policy.sync_level, SyncLevel::Mtime);
    EXPECT_FALSE(parsed->policy.verify_checksum);
    EXPECT_TRUE(parsed->policy.preserve_timestamp);
    ASSERT_EQ(parsed->items.size(), 2u);
    EXPECT_EQ(parsed->items[0].kind, TransferKind::ArchivedBundle);
    EXPECT_EQ(parsed->items[0].sha256, "abc123");
    EXPECT_EQ(parsed->items[1].destination, "/dest/b/big_20240310_120000.bin");
    EXPECT_EQ(parsed->items[1].size_bytes, 209715200u);
    EXPECT_TRUE(parsed->items[1].sha256.empty());
    EXPECT_EQ(parsed->TotalBytes(), 20480u + 209715200u);
}

TEST_F(ManifestParserTest, ItemsAreOptional) {
    auto parsed = parser.Parse(R"({"label": "Monthly_May_2024"})");
    ASSERT_TRUE(parsed.has_value()) << parsed.error();
    EXPECT_TRUE(parsed->empty());
}

TEST_F(ManifestParserTest, ParseEmptyInput) {
    auto result = parser.Parse("  \n ");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), "Empty input");
}

TEST_F(ManifestParserTest, ParseSyntaxError) {
    auto result = parser.Parse(R"({"label": "x",)");
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().find("Syntax Error"), std::string::npos);
}

TEST_F(ManifestParserTest, RootMustBeObject) {
    auto result = parser.Parse("[]");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), "JSON root must be an object");
}

TEST_F(ManifestParserTest, MissingLabelIsRejected) {
    auto result = parser.Parse(R"({"items": []})");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), "manifest missing label");
}

TEST_F(ManifestParserTest, UnknownKindIsRejected) {
    auto result = parser.Parse(R"({"label": "x", "items": [
        {"kind": "folder", "source": "/a", "destination": "/b"}]})");
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().find("folder"), std::string::npos);
}

TEST_F(ManifestParserTest, ItemWithoutDestinationIsRejected) {
    auto result = parser.Parse(R"({"label": "x", "items": [
        {"kind": "raw-file", "source": "/a"}]})");
    ASSERT_FALSE(result.has_value());
}

TEST_F(ManifestParserTest, WrongFieldTypeIsReportedNotThrown) {
    auto result = parser.Parse(R"({"label": 42})");
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().find("Internal Error"), std::string::npos);
}

} // namespace batchsync
