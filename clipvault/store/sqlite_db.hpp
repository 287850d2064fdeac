/*
 * sqlite_db.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef CLIPVAULT_STORE_SQLITE_DB_HPP
#define CLIPVAULT_STORE_SQLITE_DB_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

#include "clipvault/error/error.hpp"

namespace clipvault::store {

/**
 * @brief Raised when an SQLite call fails. Carries StoreReadFailed or
 * StoreWriteFailed.
 */
class SqliteException : public StoreException {
public:
    SqliteException(ErrorCode code, const std::string& message)
        : StoreException(code, message) {}

    explicit SqliteException(const std::string& message)
        : StoreException(ErrorCode::StoreWriteFailed, message) {}
};

/**
 * @class SqliteDB
 * @brief SQLite connection with a prepared statement cache and typed
 * parameter binding.
 *
 * Values come back typed: NULL is std::monostate, INTEGER is int64_t, REAL
 * is double, TEXT and BLOB are std::string.
 */
class SqliteDB {
public:
    using Value = std::variant<std::monostate, int64_t, double, std::string>;
    using RowData = std::vector<Value>;
    using ResultSet = std::vector<RowData>;

    /**
     * @brief Opens (creating if needed) the database at dbPath. ":memory:"
     * opens a private in-memory database.
     * @throws SqliteException if the database cannot be opened
     */
    explicit SqliteDB(std::string_view dbPath);
    ~SqliteDB();

    SqliteDB(const SqliteDB&) = delete;
    SqliteDB& operator=(const SqliteDB&) = delete;

    /**
     * @brief Runs one or more statements without parameters.
     * @throws SqliteException on error
     */
    void executeScript(std::string_view sql);

    /**
     * @brief Runs one parameterized statement.
     * @return Number of rows changed.
     * @throws SqliteException on error
     */
    template <typename... Args>
    int execute(std::string_view query, Args&&... params) {
        return executeImpl(query, {toValue(std::forward<Args>(params))...});
    }

    /**
     * @brief Runs a parameterized SELECT and returns all rows.
     * @throws SqliteException on error
     */
    template <typename... Args>
    [[nodiscard]] ResultSet select(std::string_view query, Args&&... params) {
        return selectImpl(query, {toValue(std::forward<Args>(params))...});
    }

    /**
     * @brief First column of the first row as an integer, if any.
     */
    template <typename... Args>
    [[nodiscard]] std::optional<int64_t> selectInt(std::string_view query,
                                                   Args&&... params) {
        auto rows = select(query, std::forward<Args>(params)...);
        if (rows.empty() || rows.front().empty()) {
            return std::nullopt;
        }
        if (const auto* v = std::get_if<int64_t>(&rows.front().front())) {
            return *v;
        }
        return std::nullopt;
    }

    void beginTransaction();
    void commitTransaction();

    /**
     * @brief Never throws, so it is safe in error paths.
     */
    void rollbackTransaction() noexcept;

    /**
     * @brief Runs operations inside BEGIN IMMEDIATE/COMMIT, rolling back and
     * rethrowing if they throw.
     */
    void withTransaction(const std::function<void()>& operations);

    [[nodiscard]] bool tableExists(std::string_view tableName);
    [[nodiscard]] bool columnExists(std::string_view tableName,
                                    std::string_view columnName);

    static std::optional<std::string> asText(const Value& value);
    static std::optional<int64_t> asInt(const Value& value);
    static std::optional<double> asReal(const Value& value);

private:
    static Value toValue(std::nullptr_t) { return std::monostate{}; }
    static Value toValue(bool v) { return static_cast<int64_t>(v ? 1 : 0); }
    static Value toValue(int v) { return static_cast<int64_t>(v); }
    static Value toValue(int64_t v) { return v; }
    static Value toValue(double v) { return v; }
    static Value toValue(const char* v) { return std::string(v); }
    static Value toValue(std::string_view v) { return std::string(v); }
    static Value toValue(const std::string& v) { return v; }
    static Value toValue(std::string&& v) { return std::move(v); }

    template <typename T>
    static Value toValue(const std::optional<T>& v) {
        if (!v) {
            return std::monostate{};
        }
        return toValue(*v);
    }

    int executeImpl(std::string_view query, std::vector<Value> params);
    ResultSet selectImpl(std::string_view query, std::vector<Value> params);

    class Impl;
    std::unique_ptr<Impl> pImpl;
    mutable std::mutex mtx;
};

}  // namespace clipvault::store

#endif  // CLIPVAULT_STORE_SQLITE_DB_HPP
