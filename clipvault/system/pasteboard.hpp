/*
 * pasteboard.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-6-5

Description: System clipboard and frontmost application interfaces

**************************************************/

#ifndef CLIPVAULT_SYSTEM_PASTEBOARD_HPP
#define CLIPVAULT_SYSTEM_PASTEBOARD_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "clipvault/error/error.hpp"
#include "clipvault/model/classifier.hpp"
#include "clipvault/model/content.hpp"

namespace clipvault::system {

/**
 * @brief Opaque counter that changes on every clipboard write
 */
using ChangeCount = std::int64_t;

/**
 * @brief Strong type for binary pasteboard representations
 */
struct PasteboardFormat {
    unsigned int value;

    constexpr explicit PasteboardFormat(unsigned int v) noexcept : value(v) {}

    constexpr bool operator==(const PasteboardFormat& other) const noexcept =
        default;
};

namespace formats {
constexpr PasteboardFormat PNG{1};
constexpr PasteboardFormat TIFF{2};
}  // namespace formats

/**
 * @brief The system clipboard as seen by the watcher.
 *
 * Reads return an empty value when the representation is absent and an
 * error when the clipboard could not be read at all.
 */
class Pasteboard {
public:
    virtual ~Pasteboard() = default;

    [[nodiscard]] virtual ChangeCount changeCount() const = 0;

    /// File URLs ("file:///...") in clipboard order.
    [[nodiscard]] virtual Result<std::vector<std::string>> readFileUrls() const = 0;
    [[nodiscard]] virtual Result<std::string> readText() const = 0;
    [[nodiscard]] virtual Result<model::ImageBytes> readData(
        PasteboardFormat format) const = 0;

    /**
     * @brief Replaces the clipboard with content.
     * @return the change counter after the write
     */
    virtual Result<ChangeCount> write(const model::Content& content) = 0;
    virtual Result<ChangeCount> writePlainText(std::string_view text) = 0;
};

struct AppInfo {
    std::optional<std::string> displayName;
    std::optional<std::string> bundleId;
};

class FrontmostAppProvider {
public:
    virtual ~FrontmostAppProvider() = default;
    [[nodiscard]] virtual Result<AppInfo> frontmostApp() const = 0;
};

/**
 * @brief Reads every representation the classifier looks at. A failed read
 * is logged and treated as absent.
 */
[[nodiscard]] model::RawPayload readPayload(const Pasteboard& pasteboard);

/**
 * @brief "file://" URL for an absolute path, percent-encoding bytes outside
 * the unreserved set.
 */
[[nodiscard]] std::string pathToFileUrl(std::string_view path);

}  // namespace clipvault::system

#endif  // CLIPVAULT_SYSTEM_PASTEBOARD_HPP
