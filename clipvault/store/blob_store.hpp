/*
 * blob_store.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef CLIPVAULT_STORE_BLOB_STORE_HPP
#define CLIPVAULT_STORE_BLOB_STORE_HPP

#include <filesystem>
#include <string>
#include <string_view>

#include "clipvault/error/error.hpp"
#include "clipvault/model/content.hpp"

namespace clipvault::store {

/**
 * @brief Key to bytes side-store for image payloads.
 *
 * Keys are plain file names (no directory separators).
 */
class BlobStore {
public:
    virtual ~BlobStore() = default;

    /**
     * @throws StoreException with BlobWriteFailed
     */
    virtual void write(std::string_view key, const model::ImageBytes& bytes) = 0;

    [[nodiscard]] virtual Result<model::ImageBytes> read(
        std::string_view key) const = 0;

    /// Missing keys are ignored.
    virtual void remove(std::string_view key) noexcept = 0;

    virtual void removeAll() noexcept = 0;
};

/**
 * @brief Stores each blob as one file under a directory. Writes go through a
 * temporary file and a rename so a crash never leaves a truncated blob.
 */
class FileBlobStore : public BlobStore {
public:
    explicit FileBlobStore(std::filesystem::path directory);

    void write(std::string_view key, const model::ImageBytes& bytes) override;
    [[nodiscard]] Result<model::ImageBytes> read(
        std::string_view key) const override;
    void remove(std::string_view key) noexcept override;
    void removeAll() noexcept override;

    [[nodiscard]] const std::filesystem::path& directory() const noexcept {
        return directory_;
    }

private:
    [[nodiscard]] std::filesystem::path pathFor(std::string_view key) const;

    std::filesystem::path directory_;
};

}  // namespace clipvault::store

#endif  // CLIPVAULT_STORE_BLOB_STORE_HPP
