/*
 * legacy_import.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef CLIPVAULT_STORE_LEGACY_IMPORT_HPP
#define CLIPVAULT_STORE_LEGACY_IMPORT_HPP

#include <cstddef>
#include <filesystem>
#include <string_view>
#include <vector>

#include "clipvault/error/error.hpp"
#include "clipvault/model/entry.hpp"

namespace clipvault::store {

class ContentStore;

inline constexpr std::string_view kLegacyFileName = "clipboardItems.json";

/**
 * @brief Parses a legacy flat-file export.
 *
 * The file is a JSON array of
 * {"id", "content": {"type": "text"|"image", "value"}, "timestamp",
 * "programName"}; image values are base64 and timestamps ISO-8601.
 *
 * @throws StoreException with LegacyImportFailed on any malformed record
 */
[[nodiscard]] std::vector<model::ClipboardEntry> parseLegacyFile(
    const std::filesystem::path& file);

/**
 * @brief One-time import of a legacy export into the store.
 *
 * A missing file is a successful import of zero entries. Records with equal
 * content collapse into the newest one, and a record whose content is
 * already stored is skipped. On success the file is deleted. On a parse or write failure nothing is imported, the
 * failure is logged and the file is left in place.
 *
 * @return number of imported entries, or LegacyImportFailed
 */
Result<std::size_t> importLegacyHistory(ContentStore& store,
                                        const std::filesystem::path& file);

}  // namespace clipvault::store

#endif  // CLIPVAULT_STORE_LEGACY_IMPORT_HPP
