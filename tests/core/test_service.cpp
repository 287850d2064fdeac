#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <thread>

#include "clipvault/core/service.hpp"
#include "clipvault/store/legacy_import.hpp"
#include "clipvault/system/memory_pasteboard.hpp"
#include "common/test_helpers.hpp"

using namespace clipvault;
using namespace clipvault::core;
using namespace std::chrono_literals;
using clipvault::test::text;

class ClipVaultServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings.update([](config::Settings& s) { s.pollIntervalMs = 10; });
    }

    std::filesystem::path legacyFile() const {
        return dir.path() / std::string(store::kLegacyFileName);
    }

    void writeLegacy(const std::string& body) {
        std::ofstream out(legacyFile());
        out << body;
    }

    clipvault::test::TempDir dir;
    config::StaticSettings settings;
    system::MemoryPasteboard pasteboard;
    system::StaticFrontmostApp apps{system::AppInfo{"Terminal", "com.apple.Terminal"}};
};

TEST_F(ClipVaultServiceTest, CapturesWhileRunning) {
    ClipVaultService service(settings, pasteboard, apps, dir.path());
    ASSERT_TRUE(service.start());
    pasteboard.simulateExternalCopy("ls -la");

    const auto deadline = std::chrono::steady_clock::now() + 2s;
    while (service.history().size() == 0 &&
           std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    ASSERT_EQ(service.history().size(), 1U);
    EXPECT_EQ(service.history().entries()[0].sourceProgram, "Terminal");
    service.stop();
    EXPECT_FALSE(service.watcher().isRunning());
}

TEST_F(ClipVaultServiceTest, HistorySurvivesRestart) {
    {
        ClipVaultService service(settings, pasteboard, apps, dir.path());
        ASSERT_TRUE(service.history().capture(text("persisted"), "Notes"));
    }
    ClipVaultService reopened(settings, pasteboard, apps, dir.path());
    ASSERT_EQ(reopened.history().size(), 1U);
    EXPECT_EQ(reopened.history().entries()[0].content, text("persisted"));
}

TEST_F(ClipVaultServiceTest, ImportsLegacyHistoryOnFirstStart) {
    // The export is older than any retention window.
    settings.update([](config::Settings& s) { s.retentionDays.reset(); });
    writeLegacy(R"([{"id": "7C6B2E4A-1F3D-4E5B-9A8C-0D1E2F3A4B5C",
                     "content": {"type": "text", "value": "from json"},
                     "timestamp": "2024-01-15T10:30:00Z"}])");

    ClipVaultService service(settings, pasteboard, apps, dir.path());
    EXPECT_FALSE(std::filesystem::exists(legacyFile()));
    ASSERT_EQ(service.history().size(), 1U);
    EXPECT_EQ(service.history().entries()[0].content, text("from json"));
}

TEST_F(ClipVaultServiceTest, BrokenLegacyFileDoesNotBlockStartup) {
    writeLegacy("{ definitely not an array");
    ClipVaultService service(settings, pasteboard, apps, dir.path());
    EXPECT_TRUE(std::filesystem::exists(legacyFile()));
    EXPECT_EQ(service.history().size(), 0U);
}

TEST_F(ClipVaultServiceTest, PauseSettingAppliesAtStartup) {
    settings.update([](config::Settings& s) { s.monitoringPaused = true; });
    ClipVaultService service(settings, pasteboard, apps, dir.path());
    EXPECT_TRUE(service.privacy().isMonitoringPaused());

    pasteboard.simulateExternalCopy("while paused");
    service.watcher().poll();
    EXPECT_EQ(service.history().size(), 0U);
}

TEST_F(ClipVaultServiceTest, UnsupportedSchemaAbortsStartup) {
    {
        store::SqliteDB db((dir.path() / "clipboard.db").string());
        db.executeScript(
            "CREATE TABLE schema_version (version INTEGER PRIMARY KEY);"
            "INSERT INTO schema_version (version) VALUES (42);");
    }
    EXPECT_THROW(ClipVaultService(settings, pasteboard, apps, dir.path()),
                 MigrationException);
}
