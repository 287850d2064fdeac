/*
 * sqlite_db.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "sqlite_db.hpp"

#include <sqlite3.h>

#include <atomic>
#include <chrono>
#include <unordered_map>

#include <spdlog/spdlog.h>

namespace clipvault::store {

namespace {

class StatementCache {
public:
    struct CachedStatement {
        sqlite3_stmt* stmt = nullptr;
        std::chrono::steady_clock::time_point lastUsed;
    };

    explicit StatementCache(size_t maxSize = 64) : maxCacheSize(maxSize) {}

    ~StatementCache() { clear(); }

    StatementCache(const StatementCache&) = delete;
    StatementCache& operator=(const StatementCache&) = delete;

    sqlite3_stmt* get(sqlite3* db, std::string_view query) {
        std::string key(query);
        auto it = cache.find(key);
        if (it != cache.end()) {
            it->second.lastUsed = std::chrono::steady_clock::now();
            sqlite3_reset(it->second.stmt);
            sqlite3_clear_bindings(it->second.stmt);
            return it->second.stmt;
        }

        sqlite3_stmt* stmt = nullptr;
        int rc = sqlite3_prepare_v2(db, key.c_str(),
                                    static_cast<int>(key.size()), &stmt,
                                    nullptr);
        if (rc != SQLITE_OK) {
            spdlog::error("Failed to prepare statement: {}, Query: {}",
                          sqlite3_errmsg(db), key);
            return nullptr;
        }

        if (cache.size() >= maxCacheSize) {
            evictOldest();
        }
        cache.emplace(std::move(key),
                      CachedStatement{stmt, std::chrono::steady_clock::now()});
        return stmt;
    }

    void clear() {
        for (auto& [query, cached] : cache) {
            if (cached.stmt != nullptr) {
                sqlite3_finalize(cached.stmt);
            }
        }
        cache.clear();
    }

private:
    void evictOldest() {
        auto oldest = cache.begin();
        for (auto it = cache.begin(); it != cache.end(); ++it) {
            if (it->second.lastUsed < oldest->second.lastUsed) {
                oldest = it;
            }
        }
        if (oldest != cache.end()) {
            sqlite3_finalize(oldest->second.stmt);
            cache.erase(oldest);
        }
    }

    std::unordered_map<std::string, CachedStatement> cache;
    size_t maxCacheSize;
};

// Resets the cached statement when a query finishes or throws.
class StatementGuard {
public:
    explicit StatementGuard(sqlite3_stmt* stmt) : stmt_(stmt) {}
    ~StatementGuard() {
        if (stmt_ != nullptr) {
            sqlite3_reset(stmt_);
            sqlite3_clear_bindings(stmt_);
        }
    }
    StatementGuard(const StatementGuard&) = delete;
    StatementGuard& operator=(const StatementGuard&) = delete;

private:
    sqlite3_stmt* stmt_;
};

void bindParameters(sqlite3_stmt* stmt, const std::vector<SqliteDB::Value>& params) {
    int index = 1;
    for (const auto& param : params) {
        int rc = std::visit(
            [stmt, index](const auto& value) -> int {
                using T = std::decay_t<decltype(value)>;
                if constexpr (std::is_same_v<T, std::monostate>) {
                    return sqlite3_bind_null(stmt, index);
                } else if constexpr (std::is_same_v<T, int64_t>) {
                    return sqlite3_bind_int64(stmt, index, value);
                } else if constexpr (std::is_same_v<T, double>) {
                    return sqlite3_bind_double(stmt, index, value);
                } else {
                    return sqlite3_bind_text(stmt, index, value.data(),
                                             static_cast<int>(value.size()),
                                             SQLITE_TRANSIENT);
                }
            },
            param);
        if (rc != SQLITE_OK) {
            throw SqliteException(
                fmt::format("Failed to bind parameter at index {}: {}", index,
                            sqlite3_errmsg(sqlite3_db_handle(stmt))));
        }
        ++index;
    }
}

SqliteDB::Value readColumn(sqlite3_stmt* stmt, int column) {
    switch (sqlite3_column_type(stmt, column)) {
        case SQLITE_NULL:
            return std::monostate{};
        case SQLITE_INTEGER:
            return static_cast<int64_t>(sqlite3_column_int64(stmt, column));
        case SQLITE_FLOAT:
            return sqlite3_column_double(stmt, column);
        default: {
            const auto* data = static_cast<const char*>(
                sqlite3_column_blob(stmt, column));
            int size = sqlite3_column_bytes(stmt, column);
            return data != nullptr ? std::string(data, static_cast<size_t>(size))
                                   : std::string();
        }
    }
}

}  // namespace

class SqliteDB::Impl {
public:
    sqlite3* db{nullptr};
    std::atomic<bool> inTransaction{false};
    StatementCache stmtCache;

    ~Impl() {
        stmtCache.clear();
        if (db != nullptr) {
            if (sqlite3_close_v2(db) != SQLITE_OK) {
                spdlog::error("Failed to close database cleanly: {}",
                              sqlite3_errmsg(db));
            } else {
                spdlog::debug("Database closed");
            }
            db = nullptr;
        }
    }

    void open(std::string_view dbPath) {
        if (dbPath.empty()) {
            throw SqliteException(ErrorCode::StoreUnavailable,
                                  "Database path cannot be empty");
        }
        std::string path(dbPath);
        int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE |
                    SQLITE_OPEN_FULLMUTEX;
        int rc = sqlite3_open_v2(path.c_str(), &db, flags, nullptr);
        if (rc != SQLITE_OK) {
            std::string error = db != nullptr ? sqlite3_errmsg(db)
                                              : "out of memory";
            sqlite3_close(db);
            db = nullptr;
            throw SqliteException(
                ErrorCode::StoreUnavailable,
                fmt::format("Failed to open database {}: {}", path, error));
        }

        if (path != ":memory:") {
            executeSimple("PRAGMA journal_mode = WAL");
        }
        executeSimple("PRAGMA synchronous = NORMAL");
        executeSimple("PRAGMA foreign_keys = ON");
        executeSimple("PRAGMA busy_timeout = 5000");
        spdlog::debug("Opened database: {}", path);
    }

    void executeSimple(std::string_view query) {
        if (db == nullptr) {
            throw SqliteException(ErrorCode::StoreUnavailable,
                                  "Database not connected");
        }
        std::string sql(query);
        char* errorMessage = nullptr;
        int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &errorMessage);
        if (rc != SQLITE_OK) {
            std::string error =
                errorMessage != nullptr ? errorMessage : "Unknown SQLite error";
            sqlite3_free(errorMessage);
            spdlog::error("SQLite Error: {}", error);
            throw SqliteException(error);
        }
    }

    sqlite3_stmt* prepare(std::string_view query, ErrorCode code) {
        if (db == nullptr) {
            throw SqliteException(ErrorCode::StoreUnavailable,
                                  "Database not connected");
        }
        sqlite3_stmt* stmt = stmtCache.get(db, query);
        if (stmt == nullptr) {
            throw SqliteException(
                code, fmt::format("Failed to prepare statement: {}",
                                  sqlite3_errmsg(db)));
        }
        return stmt;
    }
};

SqliteDB::SqliteDB(std::string_view dbPath) : pImpl(std::make_unique<Impl>()) {
    pImpl->open(dbPath);
}

SqliteDB::~SqliteDB() = default;

void SqliteDB::executeScript(std::string_view sql) {
    std::lock_guard lock(mtx);
    pImpl->executeSimple(sql);
}

int SqliteDB::executeImpl(std::string_view query, std::vector<Value> params) {
    std::lock_guard lock(mtx);
    sqlite3_stmt* stmt = pImpl->prepare(query, ErrorCode::StoreWriteFailed);
    StatementGuard guard(stmt);
    bindParameters(stmt, params);

    int rc = sqlite3_step(stmt);
    while (rc == SQLITE_ROW) {
        rc = sqlite3_step(stmt);
    }
    if (rc != SQLITE_DONE) {
        std::string error = sqlite3_errmsg(pImpl->db);
        spdlog::error("Failed to execute query: {} ({})", query, error);
        throw SqliteException(ErrorCode::StoreWriteFailed,
                              fmt::format("Failed to execute query: {}", error));
    }
    return sqlite3_changes(pImpl->db);
}

SqliteDB::ResultSet SqliteDB::selectImpl(std::string_view query,
                                         std::vector<Value> params) {
    std::lock_guard lock(mtx);
    sqlite3_stmt* stmt = pImpl->prepare(query, ErrorCode::StoreReadFailed);
    StatementGuard guard(stmt);
    bindParameters(stmt, params);

    ResultSet results;
    const int columnCount = sqlite3_column_count(stmt);
    int rc = SQLITE_OK;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        RowData row;
        row.reserve(static_cast<size_t>(columnCount));
        for (int i = 0; i < columnCount; ++i) {
            row.push_back(readColumn(stmt, i));
        }
        results.push_back(std::move(row));
    }
    if (rc != SQLITE_DONE) {
        std::string error = sqlite3_errmsg(pImpl->db);
        spdlog::error("Failed to read rows: {} ({})", query, error);
        throw SqliteException(ErrorCode::StoreReadFailed,
                              fmt::format("Failed to read rows: {}", error));
    }
    return results;
}

void SqliteDB::beginTransaction() {
    std::lock_guard lock(mtx);
    if (pImpl->inTransaction.load()) {
        throw SqliteException("Transaction already in progress");
    }
    pImpl->executeSimple("BEGIN IMMEDIATE TRANSACTION");
    pImpl->inTransaction = true;
}

void SqliteDB::commitTransaction() {
    std::lock_guard lock(mtx);
    if (!pImpl->inTransaction.load()) {
        throw SqliteException("No transaction in progress");
    }
    pImpl->executeSimple("COMMIT TRANSACTION");
    pImpl->inTransaction = false;
}

void SqliteDB::rollbackTransaction() noexcept {
    std::lock_guard lock(mtx);
    if (!pImpl->inTransaction.load() || pImpl->db == nullptr) {
        return;
    }
    char* errorMessage = nullptr;
    if (sqlite3_exec(pImpl->db, "ROLLBACK TRANSACTION", nullptr, nullptr,
                     &errorMessage) != SQLITE_OK) {
        spdlog::error("Rollback failed: {}",
                      errorMessage != nullptr ? errorMessage : "unknown");
    }
    sqlite3_free(errorMessage);
    pImpl->inTransaction = false;
}

void SqliteDB::withTransaction(const std::function<void()>& operations) {
    beginTransaction();
    try {
        operations();
        commitTransaction();
    } catch (...) {
        rollbackTransaction();
        throw;
    }
}

bool SqliteDB::tableExists(std::string_view tableName) {
    auto count = selectInt(
        "SELECT COUNT(*) FROM sqlite_master WHERE type='table' AND name=?",
        tableName);
    return count.value_or(0) > 0;
}

bool SqliteDB::columnExists(std::string_view tableName,
                            std::string_view columnName) {
    auto count = selectInt(
        "SELECT COUNT(*) FROM pragma_table_info(?) WHERE name=?", tableName,
        columnName);
    return count.value_or(0) > 0;
}

std::optional<std::string> SqliteDB::asText(const Value& value) {
    if (const auto* text = std::get_if<std::string>(&value)) {
        return *text;
    }
    if (const auto* integer = std::get_if<int64_t>(&value)) {
        return std::to_string(*integer);
    }
    return std::nullopt;
}

std::optional<int64_t> SqliteDB::asInt(const Value& value) {
    if (const auto* integer = std::get_if<int64_t>(&value)) {
        return *integer;
    }
    if (const auto* real = std::get_if<double>(&value)) {
        return static_cast<int64_t>(*real);
    }
    return std::nullopt;
}

std::optional<double> SqliteDB::asReal(const Value& value) {
    if (const auto* real = std::get_if<double>(&value)) {
        return *real;
    }
    if (const auto* integer = std::get_if<int64_t>(&value)) {
        return static_cast<double>(*integer);
    }
    return std::nullopt;
}

}  // namespace clipvault::store
