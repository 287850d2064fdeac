/*
 * clipboard_history.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-6-6

Description: Clipboard history engine. Captures, deduplicates, persists and
prunes entries, and serves every read and mutation on one logical thread.

**************************************************/

#ifndef CLIPVAULT_CORE_CLIPBOARD_HISTORY_HPP
#define CLIPVAULT_CORE_CLIPBOARD_HISTORY_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include "clipvault/async/serial_executor.hpp"
#include "clipvault/async/signal.hpp"
#include "clipvault/config/settings.hpp"
#include "clipvault/error/error.hpp"
#include "clipvault/history/history_model.hpp"
#include "clipvault/history/paste_queue.hpp"
#include "clipvault/store/content_store.hpp"
#include "clipvault/system/pasteboard.hpp"

namespace clipvault::core {

/**
 * @class ClipboardHistory
 * @brief Owns the in-memory history and keeps it consistent with the store.
 *
 * Every public member runs on the executor's worker thread (inline when
 * already there), so UI callbacks, the watcher tick and queue operations
 * never interleave. Store failures are logged and reported as a failed
 * Result; the in-memory view is only changed after the store write
 * succeeded.
 *
 * Recapturing content that is already in the history replaces the old entry
 * with a fresh one (new id, new timestamp, unpinned, no group).
 */
class ClipboardHistory {
public:
    ClipboardHistory(store::ContentStore& store, system::Pasteboard& pasteboard,
                     const config::SettingsProvider& settings,
                     async::SerialExecutor& executor);

    ClipboardHistory(const ClipboardHistory&) = delete;
    ClipboardHistory& operator=(const ClipboardHistory&) = delete;

    /**
     * @brief Loads the store into memory and drops entries that expired
     * while the process was not running.
     */
    Result<void> load();

    /**
     * @brief Records newly classified clipboard content.
     * @return the entry now at the front of the history
     */
    Result<model::ClipboardEntry> capture(model::Content content,
                                          std::string sourceProgram);

    /// Writes the entry to the clipboard, refreshes its timestamp and moves
    /// it to the front.
    Result<void> copyToClipboard(const model::EntryId& id);

    /// Text as-is, file lists as newline separated paths. Images give
    /// InvalidArgument and leave the clipboard alone.
    Result<void> copyAsPlainText(const model::EntryId& id);

    Result<void> remove(const model::EntryId& id);
    Result<void> clearAll();

    /// @return the new pinned state
    Result<bool> togglePinned(const model::EntryId& id);
    Result<void> setGroup(const model::EntryId& id,
                          std::optional<model::GroupId> groupId);

    /// @return number of evicted entries
    Result<std::size_t> pruneExpired(utils::Timestamp now = utils::Clock::now());

    /// Reloads the in-memory view from the store.
    Result<void> refresh();

    Result<model::Group> createGroup(std::string name);
    Result<void> renameGroup(const model::GroupId& id, std::string name);
    Result<void> reorderGroup(const model::GroupId& id, int sortOrder);
    Result<void> deleteGroup(const model::GroupId& id);

    /// Ordered by sortOrder, then createdAt.
    [[nodiscard]] Result<std::vector<model::Group>> groups();

    [[nodiscard]] std::vector<model::ClipboardEntry> entries();
    [[nodiscard]] std::vector<model::ClipboardEntry> filtered(
        std::string_view searchText, model::CategoryFilter filter);
    [[nodiscard]] std::vector<model::ClipboardEntry> itemsInGroup(
        const model::GroupId& groupId);
    [[nodiscard]] std::vector<model::ClipboardEntry> pinnedItems();
    [[nodiscard]] std::optional<model::ClipboardEntry> find(
        const model::EntryId& id);
    [[nodiscard]] std::size_t size();

    /**
     * @brief Runs func(PasteQueue&) on the logical thread.
     */
    template <typename F>
    auto withQueue(F&& func) {
        return serialized(
            [this, &func]() { return std::forward<F>(func)(queue_); });
    }

    async::SerialExecutor& executor() noexcept { return executor_; }

    /// Emitted after every successful capture.
    async::Signal<> contentChanged;

    /// Emitted with the new change counter after the engine itself wrote
    /// to the clipboard.
    async::Signal<system::ChangeCount> selfWrite;

private:
    /**
     * @brief runSync that reports a stopped executor as StoreUnavailable, or
     * an empty value for members that do not return Result.
     */
    template <typename F>
    auto serialized(F&& func) -> std::invoke_result_t<F> {
        using R = std::invoke_result_t<F>;
        try {
            return executor_.runSync(std::forward<F>(func));
        } catch (const async::ExecutorStoppedError& e) {
            logUnavailable(e);
            if constexpr (isResult<R>) {
                return ErrorCode::StoreUnavailable;
            } else if constexpr (!std::is_void_v<R>) {
                return R{};
            }
        }
    }

    static void logUnavailable(const std::exception& e);

    Result<void> writeToClipboard(const model::ClipboardEntry& entry);
    Result<void> copyToClipboardImpl(const model::EntryId& id);
    bool pasteQueued(const model::ClipboardEntry& entry);
    std::size_t pruneImpl(utils::Timestamp now);
    void reloadImpl();

    store::ContentStore& store_;
    system::Pasteboard& pasteboard_;
    const config::SettingsProvider& settings_;
    async::SerialExecutor& executor_;
    history::HistoryModel model_;
    history::PasteQueue queue_;
};

}  // namespace clipvault::core

#endif  // CLIPVAULT_CORE_CLIPBOARD_HISTORY_HPP
