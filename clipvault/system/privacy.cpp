/*
 * privacy.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "privacy.hpp"

#include <spdlog/spdlog.h>

#include "clipvault/error/error.hpp"
#include "clipvault/store/content_store.hpp"

namespace clipvault::system {

const std::vector<KnownApp>& defaultPasswordManagers() {
    static const std::vector<KnownApp> apps = {
        {"com.agilebits.onepassword7", "1Password 7"},
        {"com.1password.1password", "1Password"},
        {"com.lastpass.LastPass", "LastPass"},
        {"com.apple.keychainaccess", "Keychain Access"},
        {"com.bitwarden.desktop", "Bitwarden"},
        {"com.dashlane.Dashlane", "Dashlane"},
        {"com.keepersecurity.keeper", "Keeper"},
        {"org.nickvision.keyring", "Keyring"},
    };
    return apps;
}

template <typename F>
auto PrivacyManager::onStoreThread(F&& func) const -> std::invoke_result_t<F> {
    try {
        return executor_.runSync(std::forward<F>(func));
    } catch (const async::ExecutorStoppedError& e) {
        throw StoreException(ErrorCode::StoreUnavailable, e.what());
    }
}

PrivacyManager::PrivacyManager(store::ContentStore& store,
                               async::SerialExecutor& executor)
    : store_(store), executor_(executor) {
    auto apps = onStoreThread([this] { return store_.fetchIgnoredApps(); });
    for (const auto& app : apps) {
        ignored_.insert(app.bundleIdentifier);
    }
}

bool PrivacyManager::isMonitoringPaused() const { return paused_.load(); }

bool PrivacyManager::isAppIgnored(
    const std::optional<std::string>& bundleId) const {
    if (!bundleId) {
        return false;
    }
    std::lock_guard lock(mutex_);
    return ignored_.contains(*bundleId);
}

void PrivacyManager::setMonitoringPaused(bool paused) {
    if (paused_.exchange(paused) != paused) {
        spdlog::info("Clipboard monitoring {}", paused ? "paused" : "resumed");
    }
}

// The mirror is only mutated on the executor; mutex_ guards it against the
// watcher's reads, and is never held across runSync.
void PrivacyManager::addIgnoredApp(const std::string& bundleId,
                                   const std::string& name) {
    onStoreThread([&] {
        {
            std::lock_guard lock(mutex_);
            if (ignored_.contains(bundleId)) {
                return;
            }
        }
        store_.insertIgnoredApp(
            model::IgnoredApp{bundleId, name, utils::Clock::now()});
        {
            std::lock_guard lock(mutex_);
            ignored_.insert(bundleId);
        }
        spdlog::info("Ignoring clipboard changes from {} ({})", name, bundleId);
    });
}

void PrivacyManager::removeIgnoredApp(const std::string& bundleId) {
    onStoreThread([&] {
        store_.deleteIgnoredApp(bundleId);
        std::lock_guard lock(mutex_);
        ignored_.erase(bundleId);
    });
}

std::vector<model::IgnoredApp> PrivacyManager::ignoredApps() const {
    return onStoreThread([this] { return store_.fetchIgnoredApps(); });
}

void PrivacyManager::addDefaultPasswordManagers() {
    for (const auto& app : defaultPasswordManagers()) {
        addIgnoredApp(std::string(app.bundleId), std::string(app.name));
    }
}

}  // namespace clipvault::system
