#include <gtest/gtest.h>

#include "clipvault/model/content.hpp"
#include "clipvault/model/entry.hpp"
#include "common/test_helpers.hpp"

using namespace clipvault::model;
using clipvault::test::files;
using clipvault::test::image;
using clipvault::test::text;

TEST(ContentTest, DerivesCategories) {
    EXPECT_EQ(deriveCategory(text("hello")), Category::Text);
    EXPECT_EQ(deriveCategory(text("https://example.com")), Category::Link);
    EXPECT_EQ(deriveCategory(text("http://example.com")), Category::Link);
    EXPECT_EQ(deriveCategory(text("see https://example.com")), Category::Text);
    EXPECT_EQ(deriveCategory(text("ftp://example.com")), Category::Text);
    EXPECT_EQ(deriveCategory(image("png")), Category::Image);
    EXPECT_EQ(deriveCategory(files({"/tmp/a.txt"})), Category::File);
}

TEST(ContentTest, FilterMatchesExactCategory) {
    EXPECT_TRUE(matchesFilter(CategoryFilter::All, image("x")));
    EXPECT_TRUE(matchesFilter(CategoryFilter::Links, text("https://a.b")));
    EXPECT_FALSE(matchesFilter(CategoryFilter::Text, text("https://a.b")));
    EXPECT_TRUE(matchesFilter(CategoryFilter::Text, text("plain")));
    EXPECT_FALSE(matchesFilter(CategoryFilter::Images, files({"/a"})));
    EXPECT_TRUE(matchesFilter(CategoryFilter::Files, files({"/a"})));
}

TEST(ContentTest, EqualityIsPerVariant) {
    EXPECT_EQ(text("a"), text("a"));
    EXPECT_NE(text("a"), text("A"));
    EXPECT_EQ(image("\x01\x02"), image("\x01\x02"));
    EXPECT_NE(image("\x01\x02"), image("\x01\x03"));
    EXPECT_NE(files({"/a", "/b"}), files({"/b", "/a"}));
    EXPECT_NE(text("image"), image("image"));
}

TEST(ContentTest, PathsJoinAndSplit) {
    const std::vector<std::string> paths{"/Users/me/a.txt", "/tmp/b c.png"};
    const std::string joined = joinPaths(paths);
    EXPECT_EQ(joined, "/Users/me/a.txt\n/tmp/b c.png");
    EXPECT_EQ(splitPaths(joined), paths);
    EXPECT_TRUE(splitPaths("").empty());
}

TEST(ContentTest, LastPathComponent) {
    EXPECT_EQ(lastPathComponent("/Users/me/report.pdf"), "report.pdf");
    EXPECT_EQ(lastPathComponent("/Users/me/folder/"), "folder");
    EXPECT_EQ(lastPathComponent("name"), "name");
    EXPECT_EQ(lastPathComponent("/"), "/");
}

TEST(ContentTest, StorageTags) {
    EXPECT_EQ(storageTag(text("a")), "text");
    EXPECT_EQ(storageTag(image("a")), "image");
    EXPECT_EQ(storageTag(files({"/a"})), "file");
}

TEST(ContentTest, DescribeIsShort) {
    EXPECT_EQ(describe(text("hi")), "text \"hi\"");
    EXPECT_EQ(describe(image("abcd")), "image (4 bytes)");
    EXPECT_EQ(describe(files({"/tmp/a.txt"})), "file a.txt");
    EXPECT_EQ(describe(files({"/a", "/b"})), "2 files");
}

TEST(EntryTest, MakeEntryAssignsFreshIdAndDefaults) {
    auto first = makeEntry(text("x"), "Notes");
    auto second = makeEntry(text("x"), "");
    EXPECT_NE(first.id, second.id);
    EXPECT_FALSE(first.id.isNil());
    EXPECT_EQ(first.sourceProgram, "Notes");
    EXPECT_EQ(second.sourceProgram, "Unknown");
    EXPECT_FALSE(first.isPinned);
    EXPECT_FALSE(first.groupId.has_value());
    EXPECT_EQ(first.category(), Category::Text);
}
