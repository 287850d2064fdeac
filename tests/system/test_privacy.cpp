#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <future>
#include <memory>
#include <stdexcept>
#include <thread>

#include "clipvault/store/content_store.hpp"
#include "clipvault/system/privacy.hpp"
#include "common/test_helpers.hpp"

using namespace clipvault;
using namespace clipvault::system;

class PrivacyManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto database = std::make_unique<store::SqliteDB>(":memory:");
        db = database.get();
        store = std::make_unique<store::ContentStore>(
            std::move(database),
            std::make_unique<store::FileBlobStore>(dir.path() / "images"));
        privacy = std::make_unique<PrivacyManager>(*store, executor);
    }

    void TearDown() override {
        privacy.reset();
        executor.stop();
    }

    clipvault::test::TempDir dir;
    async::SerialExecutor executor;
    store::SqliteDB* db = nullptr;
    std::unique_ptr<store::ContentStore> store;
    std::unique_ptr<PrivacyManager> privacy;
};

TEST_F(PrivacyManagerTest, UnknownOrMissingBundleIsNotIgnored) {
    EXPECT_FALSE(privacy->isAppIgnored(std::string("com.example.editor")));
    EXPECT_FALSE(privacy->isAppIgnored(std::nullopt));
}

TEST_F(PrivacyManagerTest, AddAndRemoveIgnoredApp) {
    privacy->addIgnoredApp("com.example.vault", "Vault");
    privacy->addIgnoredApp("com.example.vault", "Vault Again");
    EXPECT_TRUE(privacy->isAppIgnored(std::string("com.example.vault")));

    auto apps = privacy->ignoredApps();
    ASSERT_EQ(apps.size(), 1U);
    EXPECT_EQ(apps[0].displayName, "Vault");

    privacy->removeIgnoredApp("com.example.vault");
    EXPECT_FALSE(privacy->isAppIgnored(std::string("com.example.vault")));
    EXPECT_TRUE(privacy->ignoredApps().empty());
}

TEST_F(PrivacyManagerTest, IgnoreListIsReloadedFromStore) {
    privacy->addIgnoredApp("com.example.vault", "Vault");
    PrivacyManager reopened(*store, executor);
    EXPECT_TRUE(reopened.isAppIgnored(std::string("com.example.vault")));
}

TEST_F(PrivacyManagerTest, PasswordManagerPresetIsIdempotent) {
    privacy->addDefaultPasswordManagers();
    privacy->addDefaultPasswordManagers();

    const auto& presets = defaultPasswordManagers();
    EXPECT_EQ(privacy->ignoredApps().size(), presets.size());
    EXPECT_TRUE(privacy->isAppIgnored(std::string("com.bitwarden.desktop")));

    auto apps = privacy->ignoredApps();
    EXPECT_TRUE(std::is_sorted(apps.begin(), apps.end(),
                               [](const auto& a, const auto& b) {
                                   return std::lexicographical_compare(
                                       a.displayName.begin(), a.displayName.end(),
                                       b.displayName.begin(), b.displayName.end(),
                                       [](char x, char y) {
                                           return std::tolower(x) <
                                                  std::tolower(y);
                                       });
                               }));
}

TEST_F(PrivacyManagerTest, PauseFlag) {
    EXPECT_FALSE(privacy->isMonitoringPaused());
    privacy->setMonitoringPaused(true);
    EXPECT_TRUE(privacy->isMonitoringPaused());
    privacy->setMonitoringPaused(false);
    EXPECT_FALSE(privacy->isMonitoringPaused());
}

TEST_F(PrivacyManagerTest, IgnoredAppWriteWaitsForEngineTransaction) {
    std::promise<void> gate;
    auto released = gate.get_future().share();
    std::atomic<bool> rolledBack{false};
    ASSERT_TRUE(executor.post([this, released, &rolledBack] {
        try {
            db->withTransaction([&released] {
                released.wait();
                throw std::runtime_error("capture failed");
            });
        } catch (const std::runtime_error&) {
            rolledBack = true;
        }
    }));

    std::thread ui(
        [this] { privacy->addIgnoredApp("com.example.vault", "Vault"); });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    gate.set_value();
    ui.join();

    EXPECT_TRUE(rolledBack.load());
    EXPECT_TRUE(privacy->isAppIgnored(std::string("com.example.vault")));
    ASSERT_EQ(privacy->ignoredApps().size(), 1U);
    EXPECT_EQ(store->fetchIgnoredApps().size(), 1U);
}

TEST_F(PrivacyManagerTest, StoppedExecutorReportsStoreUnavailable) {
    executor.stop();
    try {
        privacy->addIgnoredApp("com.example.vault", "Vault");
        FAIL() << "expected StoreException";
    } catch (const StoreException& e) {
        EXPECT_EQ(e.code(), ErrorCode::StoreUnavailable);
    }
    EXPECT_FALSE(privacy->isAppIgnored(std::string("com.example.vault")));
}
