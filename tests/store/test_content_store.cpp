#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <memory>

#include "clipvault/store/content_store.hpp"
#include "common/test_helpers.hpp"

using namespace clipvault;
using namespace clipvault::store;
using namespace std::chrono_literals;
using clipvault::test::bytesOf;
using clipvault::test::closeInTime;
using clipvault::test::files;
using clipvault::test::image;
using clipvault::test::text;
using ::testing::_;
using ::testing::Return;
using ::testing::Throw;

class ContentStoreTest : public ::testing::Test {
protected:
    void SetUp() override { store = ContentStore::open(dir.path()); }

    model::ClipboardEntry entryAt(model::Content content,
                                  utils::Timestamp timestamp) {
        return model::makeEntry(std::move(content), "Tests", timestamp);
    }

    std::filesystem::path imagePath(const model::EntryId& id) const {
        return dir.path() / "images" / ContentStore::imageKeyFor(id);
    }

    clipvault::test::TempDir dir;
    std::unique_ptr<ContentStore> store;
    utils::Timestamp now = utils::Clock::now();
};

TEST_F(ContentStoreTest, FreshStoreIsEmptyAtCurrentSchema) {
    EXPECT_EQ(store->count(), 0U);
    EXPECT_TRUE(store->fetchAll().empty());
    EXPECT_EQ(store->schemaVersion(), ContentStore::kSchemaVersion);
    EXPECT_TRUE(std::filesystem::exists(dir.path() / "clipboard.db"));
}

TEST_F(ContentStoreTest, FetchAllIsNewestFirst) {
    auto oldest = entryAt(text("one"), now - 2h);
    auto middle = entryAt(files({"/tmp/a", "/tmp/b"}), now - 1h);
    auto newest = entryAt(text("three"), now);
    store->insert(middle);
    store->insert(newest);
    store->insert(oldest);

    auto all = store->fetchAll();
    ASSERT_EQ(all.size(), 3U);
    EXPECT_EQ(all[0].id, newest.id);
    EXPECT_EQ(all[1].id, middle.id);
    EXPECT_EQ(all[2].id, oldest.id);
    EXPECT_EQ(all[1].content, middle.content);
    EXPECT_EQ(all[0].sourceProgram, "Tests");
    EXPECT_TRUE(closeInTime(all[0].timestamp, newest.timestamp));
}

TEST_F(ContentStoreTest, InsertIsUpsertById) {
    auto entry = entryAt(text("v1"), now);
    store->insert(entry);
    entry.content = text("v2");
    store->insert(entry);

    EXPECT_EQ(store->count(), 1U);
    auto found = store->findById(entry.id);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->content, text("v2"));
}

TEST_F(ContentStoreTest, FindByContentPerVariant) {
    auto t = entryAt(text("hello"), now);
    auto i = entryAt(image("\x89PNG-data"), now);
    auto f = entryAt(files({"/a/b.txt", "/c/d.txt"}), now);
    store->insert(t);
    store->insert(i);
    store->insert(f);

    EXPECT_EQ(store->findByContent(text("hello"))->id, t.id);
    EXPECT_EQ(store->findByContent(image("\x89PNG-data"))->id, i.id);
    EXPECT_EQ(store->findByContent(files({"/a/b.txt", "/c/d.txt"}))->id, f.id);

    EXPECT_FALSE(store->findByContent(text("Hello")).has_value());
    EXPECT_FALSE(store->findByContent(image("\x89PNG-other")).has_value());
    EXPECT_FALSE(
        store->findByContent(files({"/c/d.txt", "/a/b.txt"})).has_value());
}

TEST_F(ContentStoreTest, ImageBlobLivesBesideTheDatabase) {
    auto entry = entryAt(image("pixels"), now);
    store->insert(entry);
    EXPECT_TRUE(std::filesystem::exists(imagePath(entry.id)));

    auto found = store->findById(entry.id);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->content, image("pixels"));

    EXPECT_TRUE(store->remove(entry.id));
    EXPECT_FALSE(std::filesystem::exists(imagePath(entry.id)));
    EXPECT_FALSE(store->remove(entry.id));
}

TEST_F(ContentStoreTest, RemoveAllClearsRowsAndBlobs) {
    auto entry = entryAt(image("pixels"), now);
    store->insert(entry);
    store->insert(entryAt(text("x"), now));
    store->removeAll();
    EXPECT_EQ(store->count(), 0U);
    EXPECT_FALSE(std::filesystem::exists(imagePath(entry.id)));
}

TEST_F(ContentStoreTest, RemoveOlderThanSparesPinnedAndDropsBlobs) {
    auto expired = entryAt(image("old"), now - 48h);
    auto pinned = entryAt(text("keep me"), now - 48h);
    pinned.isPinned = true;
    auto fresh = entryAt(text("fresh"), now - 1h);
    store->insert(expired);
    store->insert(pinned);
    store->insert(fresh);

    EXPECT_EQ(store->removeOlderThan(now - 24h), 1U);
    EXPECT_FALSE(store->findById(expired.id).has_value());
    EXPECT_FALSE(std::filesystem::exists(imagePath(expired.id)));
    EXPECT_TRUE(store->findById(pinned.id).has_value());
    EXPECT_TRUE(store->findById(fresh.id).has_value());

    EXPECT_EQ(store->removeOlderThan(now - 24h, false), 1U);
    EXPECT_FALSE(store->findById(pinned.id).has_value());
}

TEST_F(ContentStoreTest, TargetedUpdates) {
    auto entry = entryAt(text("x"), now - 1h);
    store->insert(entry);
    const auto group = utils::UUID::generateV4();

    EXPECT_TRUE(store->updateTimestamp(entry.id, now));
    EXPECT_TRUE(store->updatePinned(entry.id, true));
    EXPECT_TRUE(store->updateGroup(entry.id, group));

    auto found = store->findById(entry.id);
    ASSERT_TRUE(found.has_value());
    EXPECT_TRUE(closeInTime(found->timestamp, now));
    EXPECT_TRUE(found->isPinned);
    EXPECT_EQ(found->groupId, group);

    EXPECT_TRUE(store->updateGroup(entry.id, std::nullopt));
    EXPECT_FALSE(store->findById(entry.id)->groupId.has_value());

    EXPECT_FALSE(store->updatePinned(utils::UUID::generateV4(), true));
}

TEST_F(ContentStoreTest, ReplaceSwapsEntriesAndOldBlob) {
    auto old = entryAt(image("same"), now - 1h);
    store->insert(old);
    auto replacement = entryAt(image("same"), now);
    store->replace(old.id, replacement);

    EXPECT_EQ(store->count(), 1U);
    EXPECT_FALSE(store->findById(old.id).has_value());
    EXPECT_TRUE(store->findById(replacement.id).has_value());
    EXPECT_FALSE(std::filesystem::exists(imagePath(old.id)));
    EXPECT_TRUE(std::filesystem::exists(imagePath(replacement.id)));
}

TEST_F(ContentStoreTest, GroupsCrudAndDeleteDetachesMembers) {
    model::Group work{utils::UUID::generateV4(), "Work", now - 1h, 1};
    model::Group home{utils::UUID::generateV4(), "Home", now, 0};
    store->insertGroup(work);
    store->insertGroup(home);

    auto groups = store->fetchGroups();
    ASSERT_EQ(groups.size(), 2U);
    EXPECT_EQ(groups[0].name, "Home");
    EXPECT_EQ(groups[1].name, "Work");

    work.name = "Office";
    work.sortOrder = -1;
    EXPECT_TRUE(store->updateGroup(work));
    groups = store->fetchGroups();
    EXPECT_EQ(groups[0].name, "Office");

    auto member = entryAt(text("grouped"), now);
    member.groupId = work.id;
    store->insert(member);

    EXPECT_TRUE(store->deleteGroup(work.id));
    EXPECT_FALSE(store->deleteGroup(work.id));
    EXPECT_EQ(store->fetchGroups().size(), 1U);
    auto found = store->findById(member.id);
    ASSERT_TRUE(found.has_value());
    EXPECT_FALSE(found->groupId.has_value());
}

TEST_F(ContentStoreTest, IgnoredAppsSortedByName) {
    EXPECT_TRUE(store->insertIgnoredApp({"com.b", "Zeta", now}));
    EXPECT_TRUE(store->insertIgnoredApp({"com.a", "alpha", now}));
    EXPECT_FALSE(store->insertIgnoredApp({"com.a", "Other", now}));

    auto apps = store->fetchIgnoredApps();
    ASSERT_EQ(apps.size(), 2U);
    EXPECT_EQ(apps[0].bundleIdentifier, "com.a");
    EXPECT_EQ(apps[0].displayName, "alpha");
    EXPECT_EQ(apps[1].displayName, "Zeta");

    EXPECT_TRUE(store->deleteIgnoredApp("com.a"));
    EXPECT_FALSE(store->deleteIgnoredApp("com.a"));
    EXPECT_EQ(store->fetchIgnoredApps().size(), 1U);
}

TEST_F(ContentStoreTest, EntriesSurviveReopen) {
    auto entry = entryAt(image("persisted"), now);
    entry.isPinned = true;
    store->insert(entry);
    store.reset();

    store = ContentStore::open(dir.path());
    auto found = store->findById(entry.id);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->content, image("persisted"));
    EXPECT_TRUE(found->isPinned);
}

// ============================================================================
// Failure handling with injected collaborators
// ============================================================================

class ContentStoreFailureTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto blobMock = std::make_unique<::testing::NiceMock<test::MockBlobStore>>();
        blobs = blobMock.get();
        auto database = std::make_unique<SqliteDB>(":memory:");
        db = database.get();
        store = std::make_unique<ContentStore>(std::move(database),
                                               std::move(blobMock));
    }

    void failRowWrites() {
        db->executeScript(
            "CREATE TRIGGER reject_insert BEFORE INSERT ON clipboard_items "
            "BEGIN SELECT RAISE(ABORT, 'disk full'); END;");
    }

    test::MockBlobStore* blobs = nullptr;
    SqliteDB* db = nullptr;
    std::unique_ptr<ContentStore> store;
};

TEST_F(ContentStoreFailureTest, BlobWriteFailureKeepsImageInMemory) {
    EXPECT_CALL(*blobs, write(_, _))
        .WillOnce(Throw(StoreException(ErrorCode::BlobWriteFailed, "no space")));
    EXPECT_CALL(*blobs, read(_)).Times(0);

    auto entry = model::makeEntry(image("volatile"), "Preview");
    EXPECT_NO_THROW(store->insert(entry));

    auto found = store->findById(entry.id);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->content, image("volatile"));
    EXPECT_EQ(store->findByContent(image("volatile"))->id, entry.id);
}

TEST_F(ContentStoreFailureTest, UnreadableBlobSkipsEntry) {
    ON_CALL(*blobs, read(_))
        .WillByDefault(Return(Result<model::ImageBytes>(ErrorCode::BlobReadFailed)));
    store->insert(model::makeEntry(image("lost"), "Preview"));
    store->insert(model::makeEntry(text("kept"), "Notes"));

    auto all = store->fetchAll();
    ASSERT_EQ(all.size(), 1U);
    EXPECT_EQ(all[0].content, text("kept"));
    EXPECT_EQ(store->count(), 2U);
}

TEST_F(ContentStoreFailureTest, RowWriteFailureThrowsAndDropsBlob) {
    failRowWrites();
    auto entry = model::makeEntry(image("orphan"), "Preview");
    const std::string key = ContentStore::imageKeyFor(entry.id);
    EXPECT_CALL(*blobs, write(std::string_view(key), _));
    EXPECT_CALL(*blobs, remove(std::string_view(key)));

    EXPECT_THROW(store->insert(entry), StoreException);
    EXPECT_EQ(store->count(), 0U);
}

TEST_F(ContentStoreFailureTest, FailedReplaceKeepsOldEntry) {
    auto old = model::makeEntry(text("same"), "Notes");
    store->insert(old);
    failRowWrites();

    EXPECT_THROW(store->replace(old.id, model::makeEntry(text("same"), "Notes")),
                 StoreException);
    EXPECT_TRUE(store->findById(old.id).has_value());
    EXPECT_EQ(store->count(), 1U);
}
