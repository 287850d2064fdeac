/*
 * settings.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-6-4

Description: User settings read by the history engine at decision time

**************************************************/

#ifndef CLIPVAULT_CONFIG_SETTINGS_HPP
#define CLIPVAULT_CONFIG_SETTINGS_HPP

#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace clipvault::config {

/**
 * @brief Retention presets offered to the user.
 */
enum class RetentionPeriod { OneDay, ThreeDays, OneWeek, TwoWeeks, OneMonth, Forever };

/// @return number of days, or std::nullopt for Forever
[[nodiscard]] std::optional<int> retentionDaysFor(RetentionPeriod period) noexcept;

[[nodiscard]] std::string_view retentionName(RetentionPeriod period) noexcept;

inline constexpr int kDefaultMaxQueueSize = 50;
inline constexpr int kDefaultPollIntervalMs = 500;

struct Settings {
    std::optional<int> retentionDays = 7;
    int pollIntervalMs = kDefaultPollIntervalMs;
    int maxQueueSize = kDefaultMaxQueueSize;
    bool autoClearAfterComplete = true;
    bool keepPastedItemsVisible = true;
    bool monitoringPaused = false;
    std::filesystem::path dataDirectory;
    std::string logLevel = "info";

    /// maxQueueSize with non-positive values mapped to the default.
    [[nodiscard]] int effectiveMaxQueueSize() const noexcept {
        return maxQueueSize > 0 ? maxQueueSize : kDefaultMaxQueueSize;
    }

    bool operator==(const Settings&) const = default;
};

/**
 * @brief Rejects a non-positive retentionDays or pollIntervalMs.
 * @throws ConfigException naming the offending setting
 */
void validate(const Settings& settings);

/**
 * @brief Source of the current settings. Callers read it at every decision
 * instead of caching values.
 */
class SettingsProvider {
public:
    virtual ~SettingsProvider() = default;
    [[nodiscard]] virtual Settings current() const = 0;
};

/**
 * @brief Settings held in memory only.
 *
 * set() and update() validate before committing; a rejected change leaves
 * the previous settings in place.
 */
class StaticSettings : public SettingsProvider {
public:
    StaticSettings() = default;
    /// @throws ConfigException if settings are invalid
    explicit StaticSettings(Settings settings);

    [[nodiscard]] Settings current() const override;
    /// @throws ConfigException if settings are invalid
    void set(Settings settings);
    /// @throws ConfigException if the mutated settings are invalid
    void update(const std::function<void(Settings&)>& mutator);

private:
    mutable std::mutex mutex_;
    Settings settings_;
};

/**
 * @brief Settings persisted as a JSON document.
 *
 * Unknown keys are ignored and absent keys keep their defaults. A value of
 * the wrong type or out of range makes load() throw ConfigException.
 */
class JsonSettingsStore : public SettingsProvider {
public:
    explicit JsonSettingsStore(std::filesystem::path file);

    /**
     * @brief Reads the file, keeping defaults when it does not exist.
     * @throws ConfigException on malformed content
     */
    void load();

    /**
     * @brief Writes the current settings, creating parent directories.
     * @throws ConfigException if the file cannot be written
     */
    void save() const;

    /**
     * @brief Applies mutator, validates and saves. Nothing changes when the
     * result is invalid.
     * @throws ConfigException on invalid settings or a failed write
     */
    void update(const std::function<void(Settings&)>& mutator);

    [[nodiscard]] Settings current() const override;

    [[nodiscard]] const std::filesystem::path& path() const noexcept {
        return file_;
    }

    [[nodiscard]] static Settings fromJson(std::string_view text);
    [[nodiscard]] static std::string toJson(const Settings& settings);

private:
    std::filesystem::path file_;
    mutable std::mutex mutex_;
    Settings settings_;
};

/**
 * @brief $XDG_DATA_HOME/clipvault, falling back to
 * $HOME/.local/share/clipvault, then ./clipvault.
 */
[[nodiscard]] std::filesystem::path defaultDataDirectory();

}  // namespace clipvault::config

#endif  // CLIPVAULT_CONFIG_SETTINGS_HPP
