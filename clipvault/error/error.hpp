/*
 * error.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-6-2

Description: Error codes, exceptions and Result<T> for clipvault

**************************************************/

#ifndef CLIPVAULT_ERROR_ERROR_HPP
#define CLIPVAULT_ERROR_ERROR_HPP

#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

#include <fmt/format.h>

namespace clipvault {

/**
 * @brief Error categories for history engine operations
 */
enum class ErrorCode {
    Success = 0,
    StoreUnavailable,
    StoreWriteFailed,
    StoreReadFailed,
    SchemaMismatch,
    MigrationFailed,
    BlobWriteFailed,
    BlobReadFailed,
    NotFound,
    InvalidArgument,
    ClipboardUnavailable,
    ClipboardWriteFailed,
    LegacyImportFailed,
    ConfigInvalid
};

}  // namespace clipvault

namespace std {
template <>
struct is_error_code_enum<clipvault::ErrorCode> : true_type {};
}  // namespace std

namespace clipvault {

class ErrorCategory : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override {
        return "clipvault";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<ErrorCode>(ev)) {
            case ErrorCode::Success:
                return "Success";
            case ErrorCode::StoreUnavailable:
                return "Content store is not open";
            case ErrorCode::StoreWriteFailed:
                return "Failed to write to content store";
            case ErrorCode::StoreReadFailed:
                return "Failed to read from content store";
            case ErrorCode::SchemaMismatch:
                return "Unexpected schema state";
            case ErrorCode::MigrationFailed:
                return "Schema migration failed";
            case ErrorCode::BlobWriteFailed:
                return "Failed to write image blob";
            case ErrorCode::BlobReadFailed:
                return "Failed to read image blob";
            case ErrorCode::NotFound:
                return "Item not found";
            case ErrorCode::InvalidArgument:
                return "Invalid argument";
            case ErrorCode::ClipboardUnavailable:
                return "Clipboard content unavailable";
            case ErrorCode::ClipboardWriteFailed:
                return "Failed to write to clipboard";
            case ErrorCode::LegacyImportFailed:
                return "Legacy history import failed";
            case ErrorCode::ConfigInvalid:
                return "Invalid configuration";
            default:
                return "Unknown error";
        }
    }
};

[[nodiscard]] inline const ErrorCategory& error_category() noexcept {
    static const ErrorCategory instance;
    return instance;
}

[[nodiscard]] inline std::error_code make_error_code(ErrorCode e) noexcept {
    return {static_cast<int>(e), error_category()};
}

/**
 * @brief Base exception for clipvault, carrying a std::error_code
 */
class ClipVaultException : public std::runtime_error {
private:
    std::error_code error_code_;

public:
    explicit ClipVaultException(ErrorCode code)
        : std::runtime_error(make_error_code(code).message()),
          error_code_(make_error_code(code)) {}

    ClipVaultException(ErrorCode code, const std::string& message)
        : std::runtime_error(
              fmt::format("{}: {}", make_error_code(code).message(), message)),
          error_code_(make_error_code(code)) {}

    explicit ClipVaultException(const std::error_code& ec)
        : std::runtime_error(ec.message()), error_code_(ec) {}

    [[nodiscard]] const std::error_code& code() const noexcept {
        return error_code_;
    }
};

class StoreException : public ClipVaultException {
public:
    using ClipVaultException::ClipVaultException;

    explicit StoreException(const std::string& message)
        : ClipVaultException(ErrorCode::StoreWriteFailed, message) {}
};

/**
 * @brief Raised when the on-disk schema cannot be brought to the supported
 * version. Fatal at startup.
 */
class MigrationException : public ClipVaultException {
public:
    explicit MigrationException(const std::string& message)
        : ClipVaultException(ErrorCode::MigrationFailed, message) {}
};

class ClipboardException : public ClipVaultException {
public:
    using ClipVaultException::ClipVaultException;
};

class ConfigException : public ClipVaultException {
public:
    explicit ConfigException(const std::string& message)
        : ClipVaultException(ErrorCode::ConfigInvalid, message) {}
};

/**
 * @brief Value-or-error result for operations that report failure without
 * throwing
 */
template <typename T>
class Result {
private:
    std::optional<T> m_value;
    std::error_code m_error;

public:
    Result(T&& value) noexcept(std::is_nothrow_move_constructible_v<T>)
        : m_value(std::move(value)) {}
    Result(const T& value) : m_value(value) {}
    Result(std::error_code error) noexcept : m_error(error) {}
    Result(ErrorCode error) noexcept : m_error(make_error_code(error)) {}

    [[nodiscard]] bool has_value() const noexcept {
        return m_value.has_value();
    }
    explicit operator bool() const noexcept { return has_value(); }

    const T& value() const& {
        if (!has_value()) {
            throw ClipVaultException(m_error);
        }
        return *m_value;
    }

    T& value() & {
        if (!has_value()) {
            throw ClipVaultException(m_error);
        }
        return *m_value;
    }

    T&& value() && {
        if (!has_value()) {
            throw ClipVaultException(m_error);
        }
        return std::move(*m_value);
    }

    const T& operator*() const& noexcept { return *m_value; }
    T& operator*() & noexcept { return *m_value; }
    T&& operator*() && noexcept { return std::move(*m_value); }

    const T* operator->() const noexcept { return &*m_value; }
    T* operator->() noexcept { return &*m_value; }

    [[nodiscard]] std::error_code error() const noexcept { return m_error; }

    template <typename U>
    T value_or(U&& fallback) const& {
        return has_value() ? *m_value : static_cast<T>(std::forward<U>(fallback));
    }

    template <typename U>
    T value_or(U&& fallback) && {
        return has_value() ? std::move(*m_value)
                           : static_cast<T>(std::forward<U>(fallback));
    }
};

template <>
class Result<void> {
private:
    std::error_code m_error;

public:
    Result() noexcept = default;
    Result(std::error_code error) noexcept : m_error(error) {}
    Result(ErrorCode error) noexcept : m_error(make_error_code(error)) {}

    [[nodiscard]] bool has_value() const noexcept { return !m_error; }
    explicit operator bool() const noexcept { return has_value(); }

    void value() const {
        if (!has_value()) {
            throw ClipVaultException(m_error);
        }
    }

    [[nodiscard]] std::error_code error() const noexcept { return m_error; }
};

template <typename T>
inline constexpr bool isResult = false;

template <typename T>
inline constexpr bool isResult<Result<T>> = true;

}  // namespace clipvault

#endif  // CLIPVAULT_ERROR_ERROR_HPP
