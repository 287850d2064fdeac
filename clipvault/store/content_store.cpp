/*
 * content_store.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "content_store.hpp"

#include <system_error>

#include <spdlog/spdlog.h>

namespace clipvault::store {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kSelectColumns =
    "SELECT id, content_type, text_content, image_filename, file_paths, "
    "timestamp, program_name, is_pinned, group_id FROM clipboard_items";

enum Column {
    kId = 0,
    kContentType,
    kTextContent,
    kImageFilename,
    kFilePaths,
    kTimestamp,
    kProgramName,
    kIsPinned,
    kGroupId,
    kColumnCount
};

std::string selectEntries(std::string_view tail) {
    return fmt::format("{} {}", kSelectColumns, tail);
}

std::optional<std::string> groupIdText(
    const std::optional<model::GroupId>& groupId) {
    if (!groupId) {
        return std::nullopt;
    }
    return groupId->toString();
}

}  // namespace

ContentStore::ContentStore(std::unique_ptr<SqliteDB> db,
                           std::unique_ptr<BlobStore> blobs)
    : db_(std::move(db)), blobs_(std::move(blobs)) {
    if (!db_ || !blobs_) {
        throw StoreException(ErrorCode::StoreUnavailable,
                             "ContentStore needs a database and a blob store");
    }
    migrate();
}

std::unique_ptr<ContentStore> ContentStore::open(
    const fs::path& dataDirectory) {
    std::error_code ec;
    fs::create_directories(dataDirectory, ec);
    if (ec) {
        throw StoreException(
            ErrorCode::StoreUnavailable,
            fmt::format("Cannot create data directory {}: {}",
                        dataDirectory.string(), ec.message()));
    }
    auto db = std::make_unique<SqliteDB>(
        (dataDirectory / std::string(kDatabaseFileName)).string());
    auto blobs = std::make_unique<FileBlobStore>(
        dataDirectory / std::string(kImageDirectoryName));
    spdlog::info("Opened content store at {}", dataDirectory.string());
    return std::make_unique<ContentStore>(std::move(db), std::move(blobs));
}

std::unique_ptr<ContentStore> ContentStore::openInMemory(
    std::unique_ptr<BlobStore> blobs) {
    return std::make_unique<ContentStore>(std::make_unique<SqliteDB>(":memory:"),
                                          std::move(blobs));
}

// Every step is additive and guarded, so a half-migrated database (crash
// between ALTERs of an older build) converges on the next open.
void ContentStore::migrate() {
    int stored = 0;
    try {
        db_->executeScript(
            "CREATE TABLE IF NOT EXISTS schema_version ("
            "version INTEGER PRIMARY KEY)");
        stored = static_cast<int>(
            db_->selectInt("SELECT COALESCE(MAX(version), 0) FROM schema_version")
                .value_or(0));
    } catch (const StoreException& e) {
        spdlog::critical("Cannot read schema version: {}", e.what());
        throw MigrationException(
            fmt::format("Cannot read schema version: {}", e.what()));
    }

    if (stored > kSchemaVersion) {
        spdlog::critical("Database schema version {} is newer than supported {}",
                         stored, kSchemaVersion);
        throw MigrationException(fmt::format(
            "Database schema version {} is newer than supported version {}",
            stored, kSchemaVersion));
    }

    try {
        db_->withTransaction([this] {
            db_->executeScript(
                "CREATE TABLE IF NOT EXISTS clipboard_items ("
                "id TEXT PRIMARY KEY, "
                "content_type TEXT NOT NULL, "
                "text_content TEXT, "
                "image_filename TEXT, "
                "timestamp REAL NOT NULL, "
                "program_name TEXT);"
                "CREATE TABLE IF NOT EXISTS ignored_apps ("
                "bundle_id TEXT PRIMARY KEY, "
                "app_name TEXT NOT NULL, "
                "added_at REAL NOT NULL);");
            if (!db_->tableExists("clipboard_items") ||
                !db_->tableExists("ignored_apps")) {
                throw MigrationException("Base tables are missing after creation");
            }
            db_->execute("INSERT OR IGNORE INTO schema_version (version) VALUES (?)",
                         1);

            // v2: file lists and pinning
            if (!db_->columnExists("clipboard_items", "file_paths")) {
                db_->executeScript(
                    "ALTER TABLE clipboard_items ADD COLUMN file_paths TEXT");
            }
            if (!db_->columnExists("clipboard_items", "is_pinned")) {
                db_->executeScript(
                    "ALTER TABLE clipboard_items ADD COLUMN is_pinned INTEGER "
                    "NOT NULL DEFAULT 0");
            }
            db_->execute("INSERT OR IGNORE INTO schema_version (version) VALUES (?)",
                         2);

            // v3: groups
            if (!db_->columnExists("clipboard_items", "group_id")) {
                db_->executeScript(
                    "ALTER TABLE clipboard_items ADD COLUMN group_id TEXT");
            }
            db_->executeScript(
                "CREATE TABLE IF NOT EXISTS item_groups ("
                "id TEXT PRIMARY KEY, "
                "name TEXT NOT NULL, "
                "created_at REAL NOT NULL, "
                "sort_order INTEGER NOT NULL DEFAULT 0);"
                "CREATE INDEX IF NOT EXISTS idx_timestamp ON "
                "clipboard_items(timestamp DESC);"
                "CREATE INDEX IF NOT EXISTS idx_pinned ON "
                "clipboard_items(is_pinned);"
                "CREATE INDEX IF NOT EXISTS idx_group ON "
                "clipboard_items(group_id);");
            db_->execute("INSERT OR IGNORE INTO schema_version (version) VALUES (?)",
                         3);
        });
    } catch (const MigrationException&) {
        throw;
    } catch (const StoreException& e) {
        spdlog::critical("Schema migration failed: {}", e.what());
        throw MigrationException(
            fmt::format("Migration from version {} failed: {}", stored, e.what()));
    }

    if (stored < kSchemaVersion) {
        spdlog::info("Database schema migrated from version {} to {}", stored,
                     kSchemaVersion);
    }
}

std::string ContentStore::imageKeyFor(const model::EntryId& id) {
    return id.toString() + ".png";
}

void ContentStore::writeImage(const model::EntryId& id,
                              const model::ImageBytes& bytes) {
    const std::string key = imageKeyFor(id);
    try {
        blobs_->write(key, bytes);
        pendingImages_.erase(key);
    } catch (const StoreException& e) {
        spdlog::warn("Image blob write failed for {}, keeping it in memory: {}",
                     key, e.what());
        pendingImages_[key] = bytes;
    }
}

std::optional<model::ImageBytes> ContentStore::loadImage(
    const std::string& key) const {
    if (auto it = pendingImages_.find(key); it != pendingImages_.end()) {
        return it->second;
    }
    auto bytes = blobs_->read(key);
    if (!bytes) {
        spdlog::warn("Image blob {} unavailable: {}", key,
                     bytes.error().message());
        return std::nullopt;
    }
    return std::move(bytes).value();
}

void ContentStore::forgetImage(const std::string& key) {
    pendingImages_.erase(key);
    blobs_->remove(key);
}

std::optional<model::ClipboardEntry> ContentStore::decodeRow(
    const SqliteDB::RowData& row) const {
    if (row.size() < kColumnCount) {
        return std::nullopt;
    }
    auto idText = SqliteDB::asText(row[kId]);
    auto id = idText ? utils::UUID::fromString(*idText) : std::nullopt;
    auto type = SqliteDB::asText(row[kContentType]);
    if (!id || !type) {
        spdlog::warn("Skipping row with malformed id or type");
        return std::nullopt;
    }

    model::ClipboardEntry entry;
    entry.id = *id;
    if (*type == "text") {
        entry.content =
            model::TextContent{SqliteDB::asText(row[kTextContent]).value_or("")};
    } else if (*type == "image") {
        auto key = SqliteDB::asText(row[kImageFilename]);
        auto bytes = key ? loadImage(*key) : std::nullopt;
        if (!bytes) {
            return std::nullopt;
        }
        entry.content = model::ImageContent{std::move(*bytes)};
    } else if (*type == "file") {
        entry.content = model::FileListContent{
            model::splitPaths(SqliteDB::asText(row[kFilePaths]).value_or(""))};
    } else {
        spdlog::warn("Skipping row {} with unknown content type '{}'", *idText,
                     *type);
        return std::nullopt;
    }

    entry.timestamp =
        utils::fromEpochSeconds(SqliteDB::asReal(row[kTimestamp]).value_or(0.0));
    entry.sourceProgram = SqliteDB::asText(row[kProgramName])
                              .value_or(std::string(model::kUnknownProgram));
    entry.isPinned = SqliteDB::asInt(row[kIsPinned]).value_or(0) != 0;
    if (auto group = SqliteDB::asText(row[kGroupId])) {
        entry.groupId = utils::UUID::fromString(*group);
    }
    return entry;
}

void ContentStore::insert(const model::ClipboardEntry& entry) {
    std::optional<std::string> text;
    std::optional<std::string> imageKey;
    std::optional<std::string> filePaths;

    if (const auto* t = std::get_if<model::TextContent>(&entry.content)) {
        text = t->text;
    } else if (const auto* f =
                   std::get_if<model::FileListContent>(&entry.content)) {
        filePaths = model::joinPaths(f->paths);
    } else if (const auto* image =
                   std::get_if<model::ImageContent>(&entry.content)) {
        imageKey = imageKeyFor(entry.id);
        writeImage(entry.id, image->bytes);
    }

    try {
        db_->execute(
            "INSERT OR REPLACE INTO clipboard_items (id, content_type, "
            "text_content, image_filename, file_paths, timestamp, program_name, "
            "is_pinned, group_id) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)",
            entry.id.toString(), model::storageTag(entry.content), text,
            imageKey, filePaths, utils::toEpochSeconds(entry.timestamp),
            entry.sourceProgram, entry.isPinned, groupIdText(entry.groupId));
    } catch (const StoreException& e) {
        spdlog::error("Failed to save entry {}: {}", entry.id.toString(),
                      e.what());
        if (imageKey) {
            forgetImage(*imageKey);
        }
        throw;
    }
}

void ContentStore::replace(const model::EntryId& oldId,
                           const model::ClipboardEntry& entry) {
    std::optional<std::string> oldImage;
    db_->withTransaction([&] {
        auto rows = db_->select(
            "SELECT image_filename FROM clipboard_items WHERE id = ?",
            oldId.toString());
        if (!rows.empty()) {
            oldImage = SqliteDB::asText(rows.front().front());
        }
        db_->execute("DELETE FROM clipboard_items WHERE id = ?",
                     oldId.toString());
        insert(entry);
    });
    if (oldImage && *oldImage != imageKeyFor(entry.id)) {
        forgetImage(*oldImage);
    }
}

std::optional<model::ClipboardEntry> ContentStore::findByContent(
    const model::Content& content) {
    SqliteDB::ResultSet rows;
    if (const auto* t = std::get_if<model::TextContent>(&content)) {
        rows = db_->select(
            selectEntries("WHERE content_type = 'text' AND text_content = ? LIMIT 1"),
            t->text);
    } else if (const auto* f = std::get_if<model::FileListContent>(&content)) {
        rows = db_->select(
            selectEntries("WHERE content_type = 'file' AND file_paths = ? LIMIT 1"),
            model::joinPaths(f->paths));
    } else {
        // Images are compared byte for byte after loading each blob.
        const auto& wanted = std::get<model::ImageContent>(content).bytes;
        for (auto& row : db_->select(selectEntries(
                 "WHERE content_type = 'image' ORDER BY timestamp DESC"))) {
            auto entry = decodeRow(row);
            if (entry &&
                std::get<model::ImageContent>(entry->content).bytes == wanted) {
                return entry;
            }
        }
        return std::nullopt;
    }

    for (auto& row : rows) {
        if (auto entry = decodeRow(row)) {
            return entry;
        }
    }
    return std::nullopt;
}

std::optional<model::ClipboardEntry> ContentStore::findById(
    const model::EntryId& id) {
    auto rows = db_->select(selectEntries("WHERE id = ?"), id.toString());
    if (rows.empty()) {
        return std::nullopt;
    }
    return decodeRow(rows.front());
}

std::vector<model::ClipboardEntry> ContentStore::fetchAll() {
    std::vector<model::ClipboardEntry> entries;
    auto rows = db_->select(selectEntries("ORDER BY timestamp DESC"));
    entries.reserve(rows.size());
    for (auto& row : rows) {
        if (auto entry = decodeRow(row)) {
            entries.push_back(std::move(*entry));
        }
    }
    return entries;
}

std::size_t ContentStore::count() {
    return static_cast<std::size_t>(
        db_->selectInt("SELECT COUNT(*) FROM clipboard_items").value_or(0));
}

bool ContentStore::remove(const model::EntryId& id) {
    auto rows = db_->select(
        "SELECT image_filename FROM clipboard_items WHERE id = ?",
        id.toString());
    if (rows.empty()) {
        return false;
    }
    db_->execute("DELETE FROM clipboard_items WHERE id = ?", id.toString());
    if (auto key = SqliteDB::asText(rows.front().front())) {
        forgetImage(*key);
    }
    return true;
}

void ContentStore::removeAll() {
    db_->execute("DELETE FROM clipboard_items");
    pendingImages_.clear();
    blobs_->removeAll();
    spdlog::info("Cleared all clipboard entries");
}

std::size_t ContentStore::removeOlderThan(utils::Timestamp cutoff,
                                          bool excludePinned) {
    const double cutoffSeconds = utils::toEpochSeconds(cutoff);
    const std::string filter =
        excludePinned ? "timestamp < ? AND is_pinned = 0" : "timestamp < ?";

    auto images = db_->select(
        fmt::format("SELECT image_filename FROM clipboard_items WHERE {} AND "
                    "image_filename IS NOT NULL",
                    filter),
        cutoffSeconds);
    const int removed = db_->execute(
        fmt::format("DELETE FROM clipboard_items WHERE {}", filter),
        cutoffSeconds);
    for (const auto& row : images) {
        if (auto key = SqliteDB::asText(row.front())) {
            forgetImage(*key);
        }
    }
    if (removed > 0) {
        spdlog::info("Evicted {} expired entries", removed);
    }
    return static_cast<std::size_t>(removed);
}

bool ContentStore::updateTimestamp(const model::EntryId& id,
                                   utils::Timestamp timestamp) {
    return db_->execute("UPDATE clipboard_items SET timestamp = ? WHERE id = ?",
                        utils::toEpochSeconds(timestamp), id.toString()) > 0;
}

bool ContentStore::updatePinned(const model::EntryId& id, bool pinned) {
    return db_->execute("UPDATE clipboard_items SET is_pinned = ? WHERE id = ?",
                        pinned, id.toString()) > 0;
}

bool ContentStore::updateGroup(const model::EntryId& id,
                               const std::optional<model::GroupId>& groupId) {
    return db_->execute("UPDATE clipboard_items SET group_id = ? WHERE id = ?",
                        groupIdText(groupId), id.toString()) > 0;
}

void ContentStore::insertGroup(const model::Group& group) {
    db_->execute(
        "INSERT INTO item_groups (id, name, created_at, sort_order) "
        "VALUES (?, ?, ?, ?)",
        group.id.toString(), group.name, utils::toEpochSeconds(group.createdAt),
        group.sortOrder);
}

bool ContentStore::updateGroup(const model::Group& group) {
    return db_->execute(
               "UPDATE item_groups SET name = ?, sort_order = ? WHERE id = ?",
               group.name, group.sortOrder, group.id.toString()) > 0;
}

bool ContentStore::deleteGroup(const model::GroupId& id) {
    bool removed = false;
    const std::string key = id.toString();
    db_->withTransaction([&] {
        db_->execute("UPDATE clipboard_items SET group_id = NULL WHERE group_id = ?",
                     key);
        removed = db_->execute("DELETE FROM item_groups WHERE id = ?", key) > 0;
    });
    return removed;
}

std::vector<model::Group> ContentStore::fetchGroups() {
    std::vector<model::Group> groups;
    for (const auto& row : db_->select(
             "SELECT id, name, created_at, sort_order FROM item_groups "
             "ORDER BY sort_order ASC, created_at ASC")) {
        auto id = SqliteDB::asText(row[0]);
        auto uuid = id ? utils::UUID::fromString(*id) : std::nullopt;
        if (!uuid) {
            spdlog::warn("Skipping group with malformed id");
            continue;
        }
        groups.push_back(model::Group{
            *uuid, SqliteDB::asText(row[1]).value_or(""),
            utils::fromEpochSeconds(SqliteDB::asReal(row[2]).value_or(0.0)),
            static_cast<int>(SqliteDB::asInt(row[3]).value_or(0))});
    }
    return groups;
}

bool ContentStore::insertIgnoredApp(const model::IgnoredApp& app) {
    return db_->execute(
               "INSERT OR IGNORE INTO ignored_apps (bundle_id, app_name, "
               "added_at) VALUES (?, ?, ?)",
               app.bundleIdentifier, app.displayName,
               utils::toEpochSeconds(app.addedAt)) > 0;
}

bool ContentStore::deleteIgnoredApp(std::string_view bundleIdentifier) {
    return db_->execute("DELETE FROM ignored_apps WHERE bundle_id = ?",
                        bundleIdentifier) > 0;
}

std::vector<model::IgnoredApp> ContentStore::fetchIgnoredApps() {
    std::vector<model::IgnoredApp> apps;
    for (const auto& row : db_->select(
             "SELECT bundle_id, app_name, added_at FROM ignored_apps "
             "ORDER BY app_name COLLATE NOCASE ASC")) {
        apps.push_back(model::IgnoredApp{
            SqliteDB::asText(row[0]).value_or(""),
            SqliteDB::asText(row[1]).value_or(""),
            utils::fromEpochSeconds(SqliteDB::asReal(row[2]).value_or(0.0))});
    }
    return apps;
}

int ContentStore::schemaVersion() {
    return static_cast<int>(
        db_->selectInt("SELECT COALESCE(MAX(version), 0) FROM schema_version")
            .value_or(0));
}

void ContentStore::withTransaction(const std::function<void()>& operations) {
    db_->withTransaction(operations);
}

}  // namespace clipvault::store
