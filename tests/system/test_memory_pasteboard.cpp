#include <gtest/gtest.h>

#include "clipvault/model/classifier.hpp"
#include "clipvault/system/memory_pasteboard.hpp"
#include "common/test_helpers.hpp"

using namespace clipvault;
using namespace clipvault::system;
using clipvault::test::bytesOf;
using clipvault::test::files;
using clipvault::test::image;
using clipvault::test::text;

class MemoryPasteboardTest : public ::testing::Test {
protected:
    MemoryPasteboard pasteboard;
};

TEST_F(MemoryPasteboardTest, StartsEmptyAtZero) {
    EXPECT_EQ(pasteboard.changeCount(), 0);
    auto payload = readPayload(pasteboard);
    EXPECT_FALSE(payload.text.has_value());
    EXPECT_FALSE(payload.fileUrls.has_value());
    EXPECT_FALSE(payload.png.has_value());
    EXPECT_FALSE(model::classify(payload).has_value());
}

TEST_F(MemoryPasteboardTest, EveryWriteBumpsTheCounter) {
    EXPECT_EQ(pasteboard.simulateExternalCopy("a"), 1);
    EXPECT_EQ(pasteboard.touch(), 2);
    auto written = pasteboard.write(text("b"));
    ASSERT_TRUE(written.has_value());
    EXPECT_EQ(*written, 3);
    auto plain = pasteboard.writePlainText("c");
    ASSERT_TRUE(plain.has_value());
    EXPECT_EQ(*plain, 4);
    EXPECT_EQ(pasteboard.changeCount(), 4);
}

TEST_F(MemoryPasteboardTest, WrittenContentClassifiesBack) {
    ASSERT_TRUE(pasteboard.write(image("png-bytes")).has_value());
    EXPECT_EQ(model::classify(readPayload(pasteboard)), image("png-bytes"));

    ASSERT_TRUE(pasteboard.write(files({"/tmp/My File.txt"})).has_value());
    auto contents = pasteboard.contents();
    ASSERT_TRUE(contents.fileUrls.has_value());
    EXPECT_EQ(contents.fileUrls->front(), "file:///tmp/My%20File.txt");
    EXPECT_EQ(model::classify(readPayload(pasteboard)),
              files({"/tmp/My File.txt"}));
}

TEST_F(MemoryPasteboardTest, ExternalCopyReplacesAllRepresentations) {
    model::RawPayload payload;
    payload.text = "caption";
    payload.tiff = bytesOf("tiff");
    pasteboard.simulateExternalCopy(payload);
    pasteboard.simulateExternalCopy("only text");

    auto contents = pasteboard.contents();
    EXPECT_EQ(contents.text, "only text");
    EXPECT_FALSE(contents.tiff.has_value());
}

TEST_F(MemoryPasteboardTest, ReadFailureIsReportedAndTreatedAsAbsent) {
    pasteboard.simulateExternalCopy("secret");
    pasteboard.setReadFailure(true);

    auto read = pasteboard.readText();
    ASSERT_FALSE(read.has_value());
    EXPECT_EQ(read.error(), ErrorCode::ClipboardUnavailable);
    EXPECT_FALSE(model::classify(readPayload(pasteboard)).has_value());

    pasteboard.setReadFailure(false);
    EXPECT_EQ(model::classify(readPayload(pasteboard)), text("secret"));
}

TEST_F(MemoryPasteboardTest, WriteFailureLeavesCounterAlone) {
    pasteboard.setWriteFailure(true);
    auto result = pasteboard.write(text("x"));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), ErrorCode::ClipboardWriteFailed);
    EXPECT_EQ(pasteboard.changeCount(), 0);
}

TEST(PathToFileUrlTest, EncodesReservedBytes) {
    EXPECT_EQ(pathToFileUrl("/a/b.txt"), "file:///a/b.txt");
    EXPECT_EQ(pathToFileUrl("/a b/c#d"), "file:///a%20b/c%23d");
    EXPECT_EQ(model::fileUrlToPath(pathToFileUrl("/x/%y z")), "/x/%y z");
}

TEST(StaticFrontmostAppTest, ReturnsConfiguredApp) {
    StaticFrontmostApp provider(AppInfo{"Notes", "com.apple.Notes"});
    auto app = provider.frontmostApp();
    ASSERT_TRUE(app.has_value());
    EXPECT_EQ(app->bundleId, "com.apple.Notes");

    provider.setFailure(true);
    EXPECT_FALSE(provider.frontmostApp().has_value());
}
