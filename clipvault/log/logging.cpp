/*
 * logging.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "logging.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace clipvault::log {

spdlog::level::level_enum parseLevel(std::string_view name) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    static constexpr std::array<std::pair<std::string_view,
                                          spdlog::level::level_enum>,
                                8>
        kLevels = {{{"trace", spdlog::level::trace},
                    {"debug", spdlog::level::debug},
                    {"info", spdlog::level::info},
                    {"warn", spdlog::level::warn},
                    {"warning", spdlog::level::warn},
                    {"error", spdlog::level::err},
                    {"critical", spdlog::level::critical},
                    {"off", spdlog::level::off}}};

    for (const auto& [key, level] : kLevels) {
        if (key == lowered) {
            return level;
        }
    }
    return spdlog::level::info;
}

std::shared_ptr<spdlog::logger> configureLogging(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    if (config.filePath) {
        std::error_code ec;
        std::filesystem::create_directories(config.filePath->parent_path(), ec);
        if (ec) {
            spdlog::warn("Cannot create log directory {}: {}",
                         config.filePath->parent_path().string(),
                         ec.message());
        } else {
            sinks.push_back(
                std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    config.filePath->string(), config.maxFileSize,
                    config.maxFiles));
        }
    }

    auto logger = std::make_shared<spdlog::logger>(
        std::string(kLoggerName), sinks.begin(), sinks.end());
    logger->set_level(config.level);
    logger->set_pattern(config.pattern);
    logger->flush_on(spdlog::level::warn);

    spdlog::drop(std::string(kLoggerName));
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);
    return logger;
}

}  // namespace clipvault::log
