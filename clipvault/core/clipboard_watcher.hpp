/*
 * clipboard_watcher.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef CLIPVAULT_CORE_CLIPBOARD_WATCHER_HPP
#define CLIPVAULT_CORE_CLIPBOARD_WATCHER_HPP

#include <atomic>
#include <cstdint>
#include <mutex>

#include "clipvault/async/signal.hpp"
#include "clipvault/config/settings.hpp"
#include "clipvault/core/clipboard_history.hpp"
#include "clipvault/error/error.hpp"
#include "clipvault/system/pasteboard.hpp"
#include "clipvault/system/privacy.hpp"

namespace clipvault::core {

/**
 * @class ClipboardWatcher
 * @brief Polls the pasteboard change counter and feeds new content to the
 * history engine.
 *
 * The observed counter is updated before any other work, including when
 * monitoring is paused or the source application is ignored, so a change is
 * processed at most once. Writes made by the engine itself are recorded
 * through its selfWrite signal and never captured.
 */
class ClipboardWatcher {
public:
    /**
     * @brief Starts from the pasteboard's current counter, so content that
     * was on the clipboard before construction is not captured.
     */
    ClipboardWatcher(ClipboardHistory& history, system::Pasteboard& pasteboard,
                     const system::PrivacyFilter& privacy,
                     const system::FrontmostAppProvider& apps,
                     const config::SettingsProvider& settings);
    ~ClipboardWatcher();

    ClipboardWatcher(const ClipboardWatcher&) = delete;
    ClipboardWatcher& operator=(const ClipboardWatcher&) = delete;

    /**
     * @brief Schedules poll() every pollIntervalMs. No-op when already
     * running.
     * @return ConfigInvalid for a non-positive interval, StoreUnavailable
     * once the engine's executor has stopped; the watcher stays stopped.
     */
    Result<void> start();

    /// No-op when not running.
    void stop();

    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }

    /// One poll cycle, run on the engine's logical thread.
    void poll();

    /// Marks counter as already seen.
    void noteSelfWrite(system::ChangeCount counter);

    [[nodiscard]] system::ChangeCount observedChangeCount() const noexcept {
        return observed_.load();
    }

    /// Number of cycles that produced a capture.
    [[nodiscard]] std::uint64_t captureCount() const noexcept {
        return captures_.load();
    }

private:
    void pollImpl();

    ClipboardHistory& history_;
    system::Pasteboard& pasteboard_;
    const system::PrivacyFilter& privacy_;
    const system::FrontmostAppProvider& apps_;
    const config::SettingsProvider& settings_;

    std::atomic<system::ChangeCount> observed_;
    std::mutex lifecycleMutex_;
    std::atomic<bool> running_{false};
    std::atomic<std::uint64_t> captures_{0};
    async::ConnectionId selfWriteConnection_;
};

}  // namespace clipvault::core

#endif  // CLIPVAULT_CORE_CLIPBOARD_WATCHER_HPP
