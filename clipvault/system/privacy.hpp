/*
 * privacy.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef CLIPVAULT_SYSTEM_PRIVACY_HPP
#define CLIPVAULT_SYSTEM_PRIVACY_HPP

#include <atomic>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "clipvault/async/serial_executor.hpp"
#include "clipvault/model/entry.hpp"

namespace clipvault::store {
class ContentStore;
}

namespace clipvault::system {

/**
 * @brief Read-only predicates consulted by the watcher on every tick
 */
class PrivacyFilter {
public:
    virtual ~PrivacyFilter() = default;
    [[nodiscard]] virtual bool isMonitoringPaused() const = 0;
    [[nodiscard]] virtual bool isAppIgnored(
        const std::optional<std::string>& bundleId) const = 0;
};

struct KnownApp {
    std::string_view bundleId;
    std::string_view name;
};

/// Password managers offered as one-click ignore entries.
[[nodiscard]] const std::vector<KnownApp>& defaultPasswordManagers();

/**
 * @class PrivacyManager
 * @brief Ignore list persisted in the content store, plus the pause flag.
 *
 * The ignore list is mirrored in memory so isAppIgnored() never touches the
 * database. Store access runs on the executor shared with the history
 * engine, so it never interleaves with an engine transaction.
 */
class PrivacyManager : public PrivacyFilter {
public:
    /**
     * @throws StoreException if the ignore list cannot be loaded
     */
    PrivacyManager(store::ContentStore& store, async::SerialExecutor& executor);

    [[nodiscard]] bool isMonitoringPaused() const override;
    [[nodiscard]] bool isAppIgnored(
        const std::optional<std::string>& bundleId) const override;

    void setMonitoringPaused(bool paused);

    /**
     * @brief No-op if bundleId is already ignored.
     * @throws StoreException on a failed write, or StoreUnavailable once the
     * executor has stopped
     */
    void addIgnoredApp(const std::string& bundleId, const std::string& name);
    void removeIgnoredApp(const std::string& bundleId);
    [[nodiscard]] std::vector<model::IgnoredApp> ignoredApps() const;

    void addDefaultPasswordManagers();

private:
    template <typename F>
    auto onStoreThread(F&& func) const -> std::invoke_result_t<F>;

    store::ContentStore& store_;
    async::SerialExecutor& executor_;
    std::atomic<bool> paused_{false};
    mutable std::mutex mutex_;
    std::unordered_set<std::string> ignored_;
};

}  // namespace clipvault::system

#endif  // CLIPVAULT_SYSTEM_PRIVACY_HPP
