#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <memory>
#include <string>

#include "clipvault/store/content_store.hpp"
#include "clipvault/store/legacy_import.hpp"
#include "common/test_helpers.hpp"

using namespace clipvault;
using namespace clipvault::store;

namespace {
// "PNG" in base64
constexpr const char* kImageValue = "UE5H";
}  // namespace

class LegacyImportTest : public ::testing::Test {
protected:
    void SetUp() override {
        store = ContentStore::open(dir.path());
        legacyFile = dir.path() / std::string(kLegacyFileName);
    }

    void writeLegacy(const std::string& body) {
        std::ofstream out(legacyFile);
        out << body;
    }

    clipvault::test::TempDir dir;
    std::unique_ptr<ContentStore> store;
    std::filesystem::path legacyFile;
    const std::string textId = "7C6B2E4A-1F3D-4E5B-9A8C-0D1E2F3A4B5C";
    const std::string imageId = "11111111-2222-4333-8444-555555555555";
};

TEST_F(LegacyImportTest, MissingFileImportsNothing) {
    auto result = importLegacyHistory(*store, legacyFile);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, 0U);
    EXPECT_EQ(store->count(), 0U);
}

TEST_F(LegacyImportTest, ImportsRecordsAndRemovesFile) {
    writeLegacy(R"([
        {"id": ")" + textId + R"(",
         "content": {"type": "text", "value": "hello"},
         "timestamp": "2024-01-15T10:30:00Z",
         "programName": "Notes"},
        {"id": ")" + imageId + R"(",
         "content": {"type": "image", "value": ")" + kImageValue + R"("},
         "timestamp": "2024-01-15T10:31:00Z"}
    ])");

    auto result = importLegacyHistory(*store, legacyFile);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, 2U);
    EXPECT_FALSE(std::filesystem::exists(legacyFile));

    auto all = store->fetchAll();
    ASSERT_EQ(all.size(), 2U);
    EXPECT_EQ(all[0].id.toString(), imageId);
    EXPECT_EQ(all[0].content, clipvault::test::image("PNG"));
    EXPECT_EQ(all[0].sourceProgram, "Unknown");
    EXPECT_EQ(all[1].content, clipvault::test::text("hello"));
    EXPECT_EQ(all[1].sourceProgram, "Notes");
    EXPECT_TRUE(clipvault::test::closeInTime(
        all[1].timestamp, utils::fromEpochSeconds(1705314600.0)));
}

TEST_F(LegacyImportTest, MalformedJsonLeavesFileInPlace) {
    writeLegacy(R"([{"id": "broken")");

    auto result = importLegacyHistory(*store, legacyFile);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), ErrorCode::LegacyImportFailed);
    EXPECT_TRUE(std::filesystem::exists(legacyFile));
    EXPECT_EQ(store->count(), 0U);
}

TEST_F(LegacyImportTest, OneBadRecordImportsNothing) {
    writeLegacy(R"([
        {"id": ")" + textId + R"(",
         "content": {"type": "text", "value": "fine"},
         "timestamp": "2024-01-15T10:30:00Z"},
        {"id": ")" + imageId + R"(",
         "content": {"type": "image", "value": "not*base64"},
         "timestamp": "2024-01-15T10:31:00Z"}
    ])");

    auto result = importLegacyHistory(*store, legacyFile);
    EXPECT_FALSE(result.has_value());
    EXPECT_TRUE(std::filesystem::exists(legacyFile));
    EXPECT_EQ(store->count(), 0U);
}

TEST_F(LegacyImportTest, EqualContentIsImportedOnce) {
    const std::string newerId = "AAAAAAAA-BBBB-4CCC-8DDD-EEEEEEEEEEEE";
    const std::string storedId = "99999999-8888-4777-8666-555555555555";
    auto existing = model::makeEntry(clipvault::test::text("already"), "Mail");
    store->insert(existing);

    writeLegacy(R"([
        {"id": ")" + textId + R"(",
         "content": {"type": "text", "value": "hello"},
         "timestamp": "2024-01-15T10:30:00Z"},
        {"id": ")" + newerId + R"(",
         "content": {"type": "text", "value": "hello"},
         "timestamp": "2024-01-15T11:00:00Z",
         "programName": "Terminal"},
        {"id": ")" + storedId + R"(",
         "content": {"type": "text", "value": "already"},
         "timestamp": "2024-01-15T09:00:00Z"}
    ])");

    auto result = importLegacyHistory(*store, legacyFile);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, 1U);
    EXPECT_FALSE(std::filesystem::exists(legacyFile));

    EXPECT_EQ(store->count(), 2U);
    auto hello = store->findByContent(clipvault::test::text("hello"));
    ASSERT_TRUE(hello.has_value());
    EXPECT_EQ(hello->id.toString(), newerId);
    EXPECT_EQ(hello->sourceProgram, "Terminal");
    auto already = store->findByContent(clipvault::test::text("already"));
    ASSERT_TRUE(already.has_value());
    EXPECT_EQ(already->id, existing.id);
}

TEST(LegacyParseTest, RejectsUnknownContentType) {
    clipvault::test::TempDir dir;
    const auto file = dir.path() / "legacy.json";
    {
        std::ofstream out(file);
        out << R"([{"id": "7C6B2E4A-1F3D-4E5B-9A8C-0D1E2F3A4B5C",
                   "content": {"type": "video", "value": ""},
                   "timestamp": "2024-01-15T10:30:00Z"}])";
    }
    EXPECT_THROW(parseLegacyFile(file), StoreException);
}

TEST(LegacyParseTest, RejectsNonArrayDocument) {
    clipvault::test::TempDir dir;
    const auto file = dir.path() / "legacy.json";
    {
        std::ofstream out(file);
        out << R"({"items": []})";
    }
    EXPECT_THROW(parseLegacyFile(file), StoreException);
}
