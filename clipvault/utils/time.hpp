/*
 * time.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef CLIPVAULT_UTILS_TIME_HPP
#define CLIPVAULT_UTILS_TIME_HPP

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace clipvault::utils {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

/**
 * @brief Seconds since the Unix epoch, with sub-second precision. This is
 * the representation stored in the database.
 */
[[nodiscard]] auto toEpochSeconds(Timestamp tp) noexcept -> double;

[[nodiscard]] auto fromEpochSeconds(double seconds) noexcept -> Timestamp;

/**
 * @brief Parses an ISO-8601 date-time such as "2024-05-01T10:20:30Z",
 * "2024-05-01T10:20:30.250+02:00".
 * @return std::nullopt when the string is not a complete date-time.
 */
[[nodiscard]] auto parseIso8601(std::string_view text)
    -> std::optional<Timestamp>;

/**
 * @brief Short local date/time for display, e.g. "2024-05-01 10:20".
 */
[[nodiscard]] auto formatTimestamp(Timestamp tp) -> std::string;

}  // namespace clipvault::utils

#endif  // CLIPVAULT_UTILS_TIME_HPP
