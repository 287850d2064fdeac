/*
 * classifier.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef CLIPVAULT_MODEL_CLASSIFIER_HPP
#define CLIPVAULT_MODEL_CLASSIFIER_HPP

#include <optional>
#include <string>
#include <vector>

#include "clipvault/model/content.hpp"

namespace clipvault::model {

/**
 * @brief Everything one poll cycle read from the pasteboard. An empty
 * optional means the representation was absent or unreadable.
 */
struct RawPayload {
    std::optional<std::vector<std::string>> fileUrls;
    std::optional<std::string> text;
    std::optional<ImageBytes> png;
    std::optional<ImageBytes> tiff;
};

/**
 * @brief Picks the single representation to capture.
 *
 * Priority is file references, then plain text, then PNG, then TIFF. File
 * references count only when every URL is a local file. Empty or
 * whitespace-only text and zero-length images are skipped.
 *
 * @return std::nullopt when nothing capturable is present.
 */
[[nodiscard]] std::optional<Content> classify(const RawPayload& payload);

/**
 * @brief Converts "file:///a%20b" or "/a b" to a local path.
 * @return std::nullopt for any other scheme.
 */
[[nodiscard]] std::optional<std::string> fileUrlToPath(const std::string& url);

[[nodiscard]] bool isBlank(std::string_view text) noexcept;

}  // namespace clipvault::model

#endif  // CLIPVAULT_MODEL_CLASSIFIER_HPP
