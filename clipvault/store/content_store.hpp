/*
 * content_store.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-6-4

Description: Durable storage for clipboard entries, groups and ignored
applications, backed by SQLite with image payloads in a blob store

**************************************************/

#ifndef CLIPVAULT_STORE_CONTENT_STORE_HPP
#define CLIPVAULT_STORE_CONTENT_STORE_HPP

#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "clipvault/model/entry.hpp"
#include "clipvault/store/blob_store.hpp"
#include "clipvault/store/sqlite_db.hpp"

namespace clipvault::store {

/**
 * @class ContentStore
 * @brief Owns the on-disk state: entry rows, groups, ignored apps and the
 * image blobs referenced by image entries.
 *
 * Row failures throw StoreException. Blob write failures are logged and the
 * image bytes are kept in memory for the rest of the session.
 */
class ContentStore {
public:
    static constexpr int kSchemaVersion = 3;
    static constexpr std::string_view kDatabaseFileName = "clipboard.db";
    static constexpr std::string_view kImageDirectoryName = "images";

    /**
     * @brief Takes ownership of an open database and a blob store, then
     * creates or migrates the schema.
     * @throws MigrationException if the schema cannot be brought to
     * kSchemaVersion
     */
    ContentStore(std::unique_ptr<SqliteDB> db, std::unique_ptr<BlobStore> blobs);

    /**
     * @brief Opens clipboard.db and images/ under dataDirectory, creating
     * the directory when missing.
     * @throws StoreException if the database cannot be opened
     * @throws MigrationException on an unsupported schema
     */
    static std::unique_ptr<ContentStore> open(
        const std::filesystem::path& dataDirectory);

    /**
     * @brief In-memory database with the given blob store, for tests and
     * throwaway sessions.
     */
    static std::unique_ptr<ContentStore> openInMemory(
        std::unique_ptr<BlobStore> blobs);

    ContentStore(const ContentStore&) = delete;
    ContentStore& operator=(const ContentStore&) = delete;

    // Entries

    /// Upsert by id.
    void insert(const model::ClipboardEntry& entry);

    /**
     * @brief Deletes oldId and inserts entry in one transaction. The old
     * image blob is removed only after the commit.
     */
    void replace(const model::EntryId& oldId, const model::ClipboardEntry& entry);

    [[nodiscard]] std::optional<model::ClipboardEntry> findByContent(
        const model::Content& content);
    [[nodiscard]] std::optional<model::ClipboardEntry> findById(
        const model::EntryId& id);

    /// All entries, newest first.
    [[nodiscard]] std::vector<model::ClipboardEntry> fetchAll();

    [[nodiscard]] std::size_t count();

    /// @return false if no row had this id
    bool remove(const model::EntryId& id);
    void removeAll();

    /**
     * @brief Deletes entries with timestamp < cutoff together with their
     * blobs.
     * @return number of rows deleted
     */
    std::size_t removeOlderThan(utils::Timestamp cutoff,
                                bool excludePinned = true);

    bool updateTimestamp(const model::EntryId& id, utils::Timestamp timestamp);
    bool updatePinned(const model::EntryId& id, bool pinned);
    bool updateGroup(const model::EntryId& id,
                     const std::optional<model::GroupId>& groupId);

    // Groups

    void insertGroup(const model::Group& group);
    bool updateGroup(const model::Group& group);

    /// Deletes the group and clears group_id on its member entries.
    bool deleteGroup(const model::GroupId& id);

    /// Ordered by sort_order, then created_at.
    [[nodiscard]] std::vector<model::Group> fetchGroups();

    // Ignored applications

    /// @return false if the bundle id was already present
    bool insertIgnoredApp(const model::IgnoredApp& app);
    bool deleteIgnoredApp(std::string_view bundleIdentifier);

    /// Ordered by display name.
    [[nodiscard]] std::vector<model::IgnoredApp> fetchIgnoredApps();

    [[nodiscard]] int schemaVersion();

    /// Runs operations in one transaction; used by the legacy importer.
    void withTransaction(const std::function<void()>& operations);

    [[nodiscard]] static std::string imageKeyFor(const model::EntryId& id);

private:
    void migrate();
    void writeImage(const model::EntryId& id, const model::ImageBytes& bytes);
    [[nodiscard]] std::optional<model::ImageBytes> loadImage(
        const std::string& key) const;
    void forgetImage(const std::string& key);
    [[nodiscard]] std::optional<model::ClipboardEntry> decodeRow(
        const SqliteDB::RowData& row) const;

    std::unique_ptr<SqliteDB> db_;
    std::unique_ptr<BlobStore> blobs_;
    // Images whose blob could not be written, keyed by blob name.
    std::unordered_map<std::string, model::ImageBytes> pendingImages_;
};

}  // namespace clipvault::store

#endif  // CLIPVAULT_STORE_CONTENT_STORE_HPP
