/*
 * paste_queue.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-6-6

Description: Ordered queue of captured entries for sequential pasting

**************************************************/

#ifndef CLIPVAULT_HISTORY_PASTE_QUEUE_HPP
#define CLIPVAULT_HISTORY_PASTE_QUEUE_HPP

#include <cstddef>
#include <functional>
#include <optional>
#include <vector>

#include "clipvault/async/signal.hpp"
#include "clipvault/config/settings.hpp"
#include "clipvault/model/entry.hpp"

namespace clipvault::history {

/**
 * @brief One queued capture. Holds a copy of the entry, so later edits to the
 * history do not show up here.
 */
struct QueuedItem {
    utils::UUID id;
    model::ClipboardEntry entry;
    bool isPasted = false;
    std::size_t order = 0;
};

/**
 * @class PasteQueue
 * @brief Inactive/Active state machine collecting captures for sequential
 * pasting.
 *
 * Queue settings (maxQueueSize, autoClearAfterComplete,
 * keepPastedItemsVisible) are read from the provider at every decision.
 * Not thread-safe: all calls happen on the history engine's logical thread.
 */
class PasteQueue {
public:
    /// Puts an entry on the system clipboard; returns false on failure.
    using Writer = std::function<bool(const model::ClipboardEntry&)>;

    explicit PasteQueue(const config::SettingsProvider& settings,
                        Writer writer = {});

    void setWriter(Writer writer);

    /// Clears previous items and starts collecting. No-op when active.
    void activate();

    /// Stops collecting; keeps items only if keepPastedItemsVisible is set.
    void deactivate();
    void toggle();
    [[nodiscard]] bool isActive() const noexcept { return active_; }

    /**
     * @brief Appends a capture while active and below maxQueueSize.
     * @return false if the entry was dropped
     */
    bool append(const model::ClipboardEntry& entry);

    /**
     * @brief Pastes the first unpasted item. When nothing is left and
     * autoClearAfterComplete is set, the queue deactivates.
     */
    std::optional<model::ClipboardEntry> pasteNext();

    /**
     * @brief Pastes items()[index]. Out-of-range or already pasted indices
     * return std::nullopt and change nothing.
     */
    std::optional<model::ClipboardEntry> pasteAt(std::size_t index);

    /**
     * @brief Moves the item at from so it lands before the item currently at
     * to; to may equal totalCount() to move to the end.
     */
    bool reorder(std::size_t from, std::size_t to);

    /// Reverses the unpasted items in place; pasted items keep their slots.
    bool flipOrder();

    bool removeItem(std::size_t index);
    void clearQueue();

    /// Marks every item unpasted so the queue can be pasted again.
    void resetQueue();

    [[nodiscard]] const std::vector<QueuedItem>& items() const noexcept {
        return items_;
    }

    /// Index of the first unpasted item, or totalCount() if none.
    [[nodiscard]] std::size_t nextPasteIndex() const;
    [[nodiscard]] std::size_t remainingCount() const;
    [[nodiscard]] std::size_t totalCount() const noexcept {
        return items_.size();
    }

    async::Signal<> queueUpdated;
    async::Signal<> activated;
    async::Signal<> deactivated;
    async::Signal<std::size_t> itemPasted;

private:
    void renumber() noexcept;

    const config::SettingsProvider& settings_;
    Writer writer_;
    bool active_ = false;
    std::vector<QueuedItem> items_;
};

}  // namespace clipvault::history

#endif  // CLIPVAULT_HISTORY_PASTE_QUEUE_HPP
