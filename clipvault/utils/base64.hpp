/*
 * base64.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef CLIPVAULT_UTILS_BASE64_HPP
#define CLIPVAULT_UTILS_BASE64_HPP

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace clipvault::utils {

/**
 * @brief Encodes bytes as padded standard Base64.
 */
[[nodiscard]] auto base64Encode(std::span<const std::byte> input)
    -> std::string;

/**
 * @brief Decodes standard Base64, ignoring whitespace.
 * @return std::nullopt on an invalid character or truncated quantum.
 */
[[nodiscard]] auto base64Decode(std::string_view input)
    -> std::optional<std::vector<std::byte>>;

}  // namespace clipvault::utils

#endif  // CLIPVAULT_UTILS_BASE64_HPP
