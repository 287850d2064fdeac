/*
 * blob_store.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "blob_store.hpp"

#include <fstream>
#include <system_error>

#include <spdlog/spdlog.h>

namespace clipvault::store {

namespace fs = std::filesystem;

FileBlobStore::FileBlobStore(fs::path directory)
    : directory_(std::move(directory)) {
    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec) {
        spdlog::warn("Cannot create blob directory {}: {}", directory_.string(),
                     ec.message());
    }
}

fs::path FileBlobStore::pathFor(std::string_view key) const {
    if (key.empty() || key.find('/') != std::string_view::npos ||
        key == "." || key == "..") {
        throw StoreException(ErrorCode::InvalidArgument,
                             fmt::format("Invalid blob key '{}'", key));
    }
    return directory_ / std::string(key);
}

void FileBlobStore::write(std::string_view key, const model::ImageBytes& bytes) {
    const fs::path target = pathFor(key);
    fs::path temp = target;
    temp += ".tmp";

    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw StoreException(
                ErrorCode::BlobWriteFailed,
                fmt::format("Cannot open {} for writing", temp.string()));
        }
        out.write(reinterpret_cast<const char*>(bytes.data()),
                  static_cast<std::streamsize>(bytes.size()));
        out.flush();
        if (!out) {
            std::error_code ignored;
            fs::remove(temp, ignored);
            throw StoreException(
                ErrorCode::BlobWriteFailed,
                fmt::format("Short write to {}", temp.string()));
        }
    }

    std::error_code ec;
    fs::rename(temp, target, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(temp, ignored);
        throw StoreException(ErrorCode::BlobWriteFailed,
                             fmt::format("Cannot move blob into place at {}: {}",
                                         target.string(), ec.message()));
    }
}

Result<model::ImageBytes> FileBlobStore::read(std::string_view key) const {
    fs::path path;
    try {
        path = pathFor(key);
    } catch (const StoreException& e) {
        spdlog::warn("{}", e.what());
        return ErrorCode::InvalidArgument;
    }

    std::ifstream in(path, std::ios::binary | std::ios::ate);
    if (!in) {
        return ErrorCode::BlobReadFailed;
    }
    const auto size = in.tellg();
    if (size < 0) {
        return ErrorCode::BlobReadFailed;
    }
    model::ImageBytes bytes(static_cast<size_t>(size));
    in.seekg(0);
    in.read(reinterpret_cast<char*>(bytes.data()), size);
    if (!in) {
        return ErrorCode::BlobReadFailed;
    }
    return bytes;
}

void FileBlobStore::remove(std::string_view key) noexcept {
    if (key.empty() || key.find('/') != std::string_view::npos) {
        return;
    }
    std::error_code ec;
    fs::remove(directory_ / std::string(key), ec);
    if (ec) {
        spdlog::warn("Failed to remove blob {}: {}", key, ec.message());
    }
}

void FileBlobStore::removeAll() noexcept {
    std::error_code ec;
    for (fs::directory_iterator it(directory_, ec), end; !ec && it != end;
         it.increment(ec)) {
        std::error_code removeError;
        fs::remove(it->path(), removeError);
        if (removeError) {
            spdlog::warn("Failed to remove blob {}: {}", it->path().string(),
                         removeError.message());
        }
    }
    if (ec) {
        spdlog::warn("Failed to enumerate blob directory {}: {}",
                     directory_.string(), ec.message());
    }
}

}  // namespace clipvault::store
