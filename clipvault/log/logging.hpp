/*
 * logging.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-6-2

Description: Default spdlog logger setup for clipvault

**************************************************/

#ifndef CLIPVAULT_LOG_LOGGING_HPP
#define CLIPVAULT_LOG_LOGGING_HPP

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace clipvault::log {

inline constexpr std::string_view kLoggerName = "clipvault";

struct LogConfig {
    spdlog::level::level_enum level = spdlog::level::info;
    std::optional<std::filesystem::path> filePath;
    std::size_t maxFileSize = 1048576;
    std::size_t maxFiles = 5;
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v";
};

/**
 * @brief Maps a level name ("trace", "debug", ... "off") to an spdlog level.
 * Unknown names map to info.
 */
[[nodiscard]] spdlog::level::level_enum parseLevel(std::string_view name);

/**
 * @brief Installs the "clipvault" logger as the spdlog default logger.
 *
 * Always attaches a colored console sink; adds a rotating file sink when
 * config.filePath is set. Safe to call more than once, the previous logger
 * is replaced.
 */
std::shared_ptr<spdlog::logger> configureLogging(const LogConfig& config);

}  // namespace clipvault::log

#endif  // CLIPVAULT_LOG_LOGGING_HPP
