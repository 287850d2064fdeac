#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <thread>

#include "clipvault/core/clipboard_watcher.hpp"
#include "clipvault/system/memory_pasteboard.hpp"
#include "common/test_helpers.hpp"

using namespace clipvault;
using namespace clipvault::core;
using namespace std::chrono_literals;
using clipvault::test::text;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;

namespace {

template <typename Predicate>
bool waitFor(Predicate predicate, std::chrono::milliseconds timeout = 2s) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(5ms);
    }
    return predicate();
}

// Hands out whatever it holds, bypassing StaticSettings validation.
class UncheckedSettings : public config::SettingsProvider {
public:
    [[nodiscard]] config::Settings current() const override { return value; }

    config::Settings value;
};

}  // namespace

class ClipboardWatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings.update([](config::Settings& s) { s.pollIntervalMs = 10; });
        store = store::ContentStore::openInMemory(
            std::make_unique<store::FileBlobStore>(dir.path() / "images"));
        history = std::make_unique<ClipboardHistory>(*store, pasteboard,
                                                     settings, executor);
        ASSERT_TRUE(history->load());
        ON_CALL(privacy, isMonitoringPaused()).WillByDefault(Return(false));
        ON_CALL(privacy, isAppIgnored(_)).WillByDefault(Return(false));
    }

    void TearDown() override {
        watcher.reset();
        executor.stop();
    }

    ClipboardWatcher& makeWatcher() {
        watcher = std::make_unique<ClipboardWatcher>(*history, pasteboard,
                                                     privacy, apps, settings);
        return *watcher;
    }

    clipvault::test::TempDir dir;
    config::StaticSettings settings;
    system::MemoryPasteboard pasteboard;
    system::StaticFrontmostApp apps{system::AppInfo{"Notes", "com.apple.Notes"}};
    NiceMock<clipvault::test::MockPrivacyFilter> privacy;
    async::SerialExecutor executor;
    std::unique_ptr<store::ContentStore> store;
    std::unique_ptr<ClipboardHistory> history;
    std::unique_ptr<ClipboardWatcher> watcher;
};

TEST_F(ClipboardWatcherTest, ContentPresentAtStartupIsNotCaptured) {
    pasteboard.simulateExternalCopy("already there");
    auto& w = makeWatcher();
    EXPECT_EQ(w.observedChangeCount(), pasteboard.changeCount());
    w.poll();
    EXPECT_EQ(history->size(), 0U);
}

TEST_F(ClipboardWatcherTest, ExternalChangeIsCapturedOnce) {
    auto& w = makeWatcher();
    pasteboard.simulateExternalCopy("hello");
    w.poll();
    w.poll();

    EXPECT_EQ(w.captureCount(), 1U);
    ASSERT_EQ(history->size(), 1U);
    EXPECT_EQ(history->entries()[0].content, text("hello"));
    EXPECT_EQ(history->entries()[0].sourceProgram, "Notes");
}

TEST_F(ClipboardWatcherTest, PausedChangeIsConsumedNotDeferred) {
    auto& w = makeWatcher();
    EXPECT_CALL(privacy, isMonitoringPaused())
        .WillOnce(Return(true))
        .WillRepeatedly(Return(false));

    pasteboard.simulateExternalCopy("secret");
    w.poll();
    EXPECT_EQ(history->size(), 0U);
    EXPECT_EQ(w.observedChangeCount(), pasteboard.changeCount());

    // Resumed, but the counter has not moved since it was observed.
    w.poll();
    EXPECT_EQ(history->size(), 0U);

    pasteboard.simulateExternalCopy("public");
    w.poll();
    ASSERT_EQ(history->size(), 1U);
    EXPECT_EQ(history->entries()[0].content, text("public"));
}

TEST_F(ClipboardWatcherTest, IgnoredApplicationIsSkipped) {
    auto& w = makeWatcher();
    apps.set(system::AppInfo{"Vault", "com.example.vault"});
    EXPECT_CALL(privacy, isAppIgnored(std::optional<std::string>(
                             "com.example.vault")))
        .WillRepeatedly(Return(true));

    pasteboard.simulateExternalCopy("password");
    w.poll();
    EXPECT_EQ(history->size(), 0U);
    EXPECT_EQ(w.observedChangeCount(), pasteboard.changeCount());
}

TEST_F(ClipboardWatcherTest, UnknownFrontmostAppStillCaptures) {
    auto& w = makeWatcher();
    apps.setFailure(true);
    pasteboard.simulateExternalCopy("orphan");
    w.poll();
    ASSERT_EQ(history->size(), 1U);
    EXPECT_EQ(history->entries()[0].sourceProgram, "Unknown");
}

TEST_F(ClipboardWatcherTest, OwnWritesAreNotRecaptured) {
    auto& w = makeWatcher();
    pasteboard.simulateExternalCopy("first");
    w.poll();
    pasteboard.simulateExternalCopy("second");
    w.poll();
    ASSERT_EQ(w.captureCount(), 2U);

    const auto first = history->entries()[1];
    ASSERT_TRUE(history->copyToClipboard(first.id));
    EXPECT_EQ(w.observedChangeCount(), pasteboard.changeCount());

    w.poll();
    EXPECT_EQ(w.captureCount(), 2U);
    EXPECT_EQ(history->entries()[0].id, first.id);
}

TEST_F(ClipboardWatcherTest, BlankOrUnreadableChangesAreDropped) {
    auto& w = makeWatcher();
    pasteboard.simulateExternalCopy("   \n\t");
    w.poll();
    EXPECT_EQ(history->size(), 0U);

    pasteboard.setReadFailure(true);
    pasteboard.simulateExternalCopy("unreadable");
    w.poll();
    EXPECT_EQ(history->size(), 0U);
    EXPECT_EQ(w.observedChangeCount(), pasteboard.changeCount());
}

TEST_F(ClipboardWatcherTest, StartAndStopAreIdempotent) {
    auto& w = makeWatcher();
    EXPECT_TRUE(w.start());
    EXPECT_TRUE(w.start());
    EXPECT_TRUE(w.isRunning());
    EXPECT_TRUE(executor.hasTick());

    pasteboard.simulateExternalCopy("ticked");
    EXPECT_TRUE(waitFor([&w] { return w.captureCount() == 1; }));

    w.stop();
    w.stop();
    EXPECT_FALSE(w.isRunning());
    EXPECT_FALSE(executor.hasTick());

    pasteboard.simulateExternalCopy("after stop");
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(w.captureCount(), 1U);
    EXPECT_EQ(history->size(), 1U);
}

TEST_F(ClipboardWatcherTest, RejectedStartLeavesWatcherRestartable) {
    UncheckedSettings raw;
    raw.value.pollIntervalMs = 0;
    watcher = std::make_unique<ClipboardWatcher>(*history, pasteboard, privacy,
                                                 apps, raw);

    auto started = watcher->start();
    ASSERT_FALSE(started);
    EXPECT_EQ(started.error(), ErrorCode::ConfigInvalid);
    EXPECT_FALSE(watcher->isRunning());
    EXPECT_FALSE(executor.hasTick());

    raw.value.pollIntervalMs = 10;
    EXPECT_TRUE(watcher->start());
    EXPECT_TRUE(watcher->isRunning());
    EXPECT_TRUE(executor.hasTick());

    pasteboard.simulateExternalCopy("after restart");
    EXPECT_TRUE(waitFor([this] { return watcher->captureCount() == 1; }));
    watcher.reset();
}

TEST_F(ClipboardWatcherTest, StartFailsOnceEngineHasStopped) {
    auto& w = makeWatcher();
    executor.stop();

    auto started = w.start();
    ASSERT_FALSE(started);
    EXPECT_EQ(started.error(), ErrorCode::StoreUnavailable);
    EXPECT_FALSE(w.isRunning());
    EXPECT_NO_THROW(w.poll());
    EXPECT_NO_THROW(w.stop());
}

TEST_F(ClipboardWatcherTest, UnchangedCounterSkipsEveryRead) {
    NiceMock<clipvault::test::MockPasteboard> mock;
    ON_CALL(mock, changeCount()).WillByDefault(Return(42));
    EXPECT_CALL(mock, readText()).Times(0);
    EXPECT_CALL(mock, readFileUrls()).Times(0);
    EXPECT_CALL(mock, readData(_)).Times(0);
    EXPECT_CALL(privacy, isMonitoringPaused()).Times(0);

    ClipboardWatcher w(*history, mock, privacy, apps, settings);
    w.poll();
    w.poll();
    EXPECT_EQ(w.captureCount(), 0U);
}
