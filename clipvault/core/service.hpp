/*
 * service.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef CLIPVAULT_CORE_SERVICE_HPP
#define CLIPVAULT_CORE_SERVICE_HPP

#include <filesystem>
#include <memory>

#include "clipvault/async/serial_executor.hpp"
#include "clipvault/config/settings.hpp"
#include "clipvault/core/clipboard_history.hpp"
#include "clipvault/core/clipboard_watcher.hpp"
#include "clipvault/store/content_store.hpp"
#include "clipvault/system/pasteboard.hpp"
#include "clipvault/system/privacy.hpp"

namespace clipvault::core {

/**
 * @class ClipVaultService
 * @brief Wires the store, privacy manager, history engine and watcher once
 * at process start.
 *
 * Construction opens (and migrates) the store under dataDirectory, imports
 * a legacy clipboardItems.json found there, and loads the history. The
 * watcher is not started until start().
 *
 * @throws MigrationException when the on-disk schema is unusable
 */
class ClipVaultService {
public:
    ClipVaultService(const config::SettingsProvider& settings,
                     system::Pasteboard& pasteboard,
                     const system::FrontmostAppProvider& apps,
                     const std::filesystem::path& dataDirectory);
    ~ClipVaultService();

    ClipVaultService(const ClipVaultService&) = delete;
    ClipVaultService& operator=(const ClipVaultService&) = delete;

    /// Starts the watcher; see ClipboardWatcher::start().
    Result<void> start();
    void stop();

    [[nodiscard]] ClipboardHistory& history() noexcept { return *history_; }
    [[nodiscard]] ClipboardWatcher& watcher() noexcept { return *watcher_; }
    [[nodiscard]] system::PrivacyManager& privacy() noexcept {
        return *privacy_;
    }
    [[nodiscard]] store::ContentStore& store() noexcept { return *store_; }

private:
    async::SerialExecutor executor_;
    std::unique_ptr<store::ContentStore> store_;
    std::unique_ptr<system::PrivacyManager> privacy_;
    std::unique_ptr<ClipboardHistory> history_;
    std::unique_ptr<ClipboardWatcher> watcher_;
};

}  // namespace clipvault::core

#endif  // CLIPVAULT_CORE_SERVICE_HPP
