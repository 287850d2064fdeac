/*
 * content.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-6-3

Description: Clipboard content sum type and derived categories

**************************************************/

#ifndef CLIPVAULT_MODEL_CONTENT_HPP
#define CLIPVAULT_MODEL_CONTENT_HPP

#include <cstddef>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace clipvault::model {

using ImageBytes = std::vector<std::byte>;

struct TextContent {
    std::string text;

    bool operator==(const TextContent&) const = default;
};

struct ImageContent {
    ImageBytes bytes;

    bool operator==(const ImageContent&) const = default;
};

/**
 * @brief Ordered list of absolute file system paths.
 */
struct FileListContent {
    std::vector<std::string> paths;

    bool operator==(const FileListContent&) const = default;
};

/**
 * @brief Captured clipboard payload. Equality is value equality per
 * alternative; it is the deduplication key.
 */
using Content = std::variant<TextContent, ImageContent, FileListContent>;

enum class Category { Text, Link, Image, File };

enum class CategoryFilter { All, Text, Links, Images, Files };

/**
 * @brief Text starting with http:// or https:// is a Link, other text is
 * Text.
 */
[[nodiscard]] Category deriveCategory(const Content& content) noexcept;

[[nodiscard]] std::string_view categoryName(Category category) noexcept;

[[nodiscard]] std::string_view filterName(CategoryFilter filter) noexcept;

/**
 * @brief Exact match of the derived category; All passes everything.
 */
[[nodiscard]] bool matchesFilter(CategoryFilter filter,
                                 const Content& content) noexcept;

[[nodiscard]] bool isLink(std::string_view text) noexcept;

/**
 * @brief Discriminator stored in the content_type column.
 */
[[nodiscard]] std::string_view storageTag(const Content& content) noexcept;

/**
 * @brief Newline-joined path list, the stored and compared form of a file
 * list.
 */
[[nodiscard]] std::string joinPaths(const std::vector<std::string>& paths);

[[nodiscard]] std::vector<std::string> splitPaths(std::string_view joined);

/**
 * @brief Final component of a path ("/a/b/c.txt" -> "c.txt"); trailing
 * slashes are ignored.
 */
[[nodiscard]] std::string_view lastPathComponent(std::string_view path) noexcept;

/**
 * @brief Human-readable one-line summary for logs and menus.
 */
[[nodiscard]] std::string describe(const Content& content);

}  // namespace clipvault::model

#endif  // CLIPVAULT_MODEL_CONTENT_HPP
