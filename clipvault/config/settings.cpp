/*
 * settings.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "settings.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <system_error>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "clipvault/error/error.hpp"

namespace clipvault::config {

namespace fs = std::filesystem;
using json = nlohmann::json;

std::optional<int> retentionDaysFor(RetentionPeriod period) noexcept {
    switch (period) {
        case RetentionPeriod::OneDay:
            return 1;
        case RetentionPeriod::ThreeDays:
            return 3;
        case RetentionPeriod::OneWeek:
            return 7;
        case RetentionPeriod::TwoWeeks:
            return 14;
        case RetentionPeriod::OneMonth:
            return 30;
        case RetentionPeriod::Forever:
            return std::nullopt;
    }
    return std::nullopt;
}

std::string_view retentionName(RetentionPeriod period) noexcept {
    switch (period) {
        case RetentionPeriod::OneDay:
            return "1 Day";
        case RetentionPeriod::ThreeDays:
            return "3 Days";
        case RetentionPeriod::OneWeek:
            return "1 Week";
        case RetentionPeriod::TwoWeeks:
            return "2 Weeks";
        case RetentionPeriod::OneMonth:
            return "1 Month";
        case RetentionPeriod::Forever:
            return "Forever";
    }
    return "Unknown";
}

namespace {

template <typename T>
void readField(const json& doc, const char* key, T& out) {
    auto it = doc.find(key);
    if (it == doc.end()) {
        return;
    }
    try {
        out = it->get<T>();
    } catch (const json::exception& e) {
        throw ConfigException(
            fmt::format("setting '{}' has the wrong type: {}", key, e.what()));
    }
}

void requirePositive(const char* key, int value) {
    if (value <= 0) {
        throw ConfigException(
            fmt::format("setting '{}' must be positive, got {}", key, value));
    }
}

}  // namespace

void validate(const Settings& settings) {
    if (settings.retentionDays) {
        requirePositive("retentionDays", *settings.retentionDays);
    }
    requirePositive("pollIntervalMs", settings.pollIntervalMs);
}

StaticSettings::StaticSettings(Settings settings) {
    validate(settings);
    settings_ = std::move(settings);
}

Settings StaticSettings::current() const {
    std::lock_guard lock(mutex_);
    return settings_;
}

void StaticSettings::set(Settings settings) {
    validate(settings);
    std::lock_guard lock(mutex_);
    settings_ = std::move(settings);
}

void StaticSettings::update(const std::function<void(Settings&)>& mutator) {
    std::lock_guard lock(mutex_);
    Settings next = settings_;
    mutator(next);
    validate(next);
    settings_ = std::move(next);
}

Settings JsonSettingsStore::fromJson(std::string_view text) {
    json doc;
    try {
        doc = json::parse(text);
    } catch (const json::parse_error& e) {
        throw ConfigException(fmt::format("invalid JSON: {}", e.what()));
    }
    if (!doc.is_object()) {
        throw ConfigException("settings document must be a JSON object");
    }

    Settings settings;
    if (auto it = doc.find("retentionDays"); it != doc.end()) {
        if (it->is_null()) {
            settings.retentionDays = std::nullopt;
        } else if (it->is_number_integer()) {
            settings.retentionDays = it->get<int>();
        } else {
            throw ConfigException("setting 'retentionDays' must be an integer or null");
        }
    }
    readField(doc, "pollIntervalMs", settings.pollIntervalMs);
    readField(doc, "maxQueueSize", settings.maxQueueSize);
    readField(doc, "autoClearAfterComplete", settings.autoClearAfterComplete);
    readField(doc, "keepPastedItemsVisible", settings.keepPastedItemsVisible);
    readField(doc, "monitoringPaused", settings.monitoringPaused);
    readField(doc, "logLevel", settings.logLevel);

    std::string dataDirectory;
    readField(doc, "dataDirectory", dataDirectory);
    if (!dataDirectory.empty()) {
        settings.dataDirectory = dataDirectory;
    }
    validate(settings);
    return settings;
}

std::string JsonSettingsStore::toJson(const Settings& settings) {
    json doc = {
        {"pollIntervalMs", settings.pollIntervalMs},
        {"maxQueueSize", settings.maxQueueSize},
        {"autoClearAfterComplete", settings.autoClearAfterComplete},
        {"keepPastedItemsVisible", settings.keepPastedItemsVisible},
        {"monitoringPaused", settings.monitoringPaused},
        {"logLevel", settings.logLevel},
    };
    if (settings.retentionDays) {
        doc["retentionDays"] = *settings.retentionDays;
    } else {
        doc["retentionDays"] = nullptr;
    }
    if (!settings.dataDirectory.empty()) {
        doc["dataDirectory"] = settings.dataDirectory.string();
    }
    return doc.dump(4);
}

JsonSettingsStore::JsonSettingsStore(fs::path file) : file_(std::move(file)) {}

void JsonSettingsStore::load() {
    std::ifstream in(file_);
    if (!in) {
        std::error_code ec;
        if (fs::exists(file_, ec)) {
            throw ConfigException(
                fmt::format("cannot read settings file {}", file_.string()));
        }
        spdlog::info("No settings file at {}, using defaults", file_.string());
        return;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    Settings loaded;
    try {
        loaded = fromJson(buffer.str());
    } catch (const ConfigException& e) {
        spdlog::error("Rejecting settings file {}: {}", file_.string(), e.what());
        throw;
    }
    std::lock_guard lock(mutex_);
    settings_ = std::move(loaded);
}

void JsonSettingsStore::save() const {
    std::string text;
    {
        std::lock_guard lock(mutex_);
        text = toJson(settings_);
    }
    std::error_code ec;
    if (file_.has_parent_path()) {
        fs::create_directories(file_.parent_path(), ec);
    }
    std::ofstream out(file_, std::ios::trunc);
    if (!out) {
        throw ConfigException(
            fmt::format("cannot write settings file {}", file_.string()));
    }
    out << text << '\n';
    if (!out) {
        throw ConfigException(
            fmt::format("short write to settings file {}", file_.string()));
    }
}

void JsonSettingsStore::update(const std::function<void(Settings&)>& mutator) {
    {
        std::lock_guard lock(mutex_);
        Settings next = settings_;
        mutator(next);
        try {
            validate(next);
        } catch (const ConfigException& e) {
            spdlog::error("Rejecting settings change: {}", e.what());
            throw;
        }
        settings_ = std::move(next);
    }
    save();
}

Settings JsonSettingsStore::current() const {
    std::lock_guard lock(mutex_);
    return settings_;
}

fs::path defaultDataDirectory() {
    if (const char* xdg = std::getenv("XDG_DATA_HOME"); xdg && *xdg) {
        return fs::path(xdg) / "clipvault";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return fs::path(home) / ".local" / "share" / "clipvault";
    }
    return fs::current_path() / "clipvault";
}

}  // namespace clipvault::config
