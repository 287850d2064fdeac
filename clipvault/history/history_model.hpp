/*
 * history_model.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-6-5

Description: In-memory, newest-first view of the clipboard history

**************************************************/

#ifndef CLIPVAULT_HISTORY_HISTORY_MODEL_HPP
#define CLIPVAULT_HISTORY_HISTORY_MODEL_HPP

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

#include "clipvault/history/dedup_index.hpp"
#include "clipvault/model/entry.hpp"

namespace clipvault::history {

/**
 * @class HistoryModel
 * @brief Entries ordered by timestamp, newest first.
 *
 * Not thread-safe; owned by the history engine and touched only on its
 * logical thread. The deduplication index is kept in step with every
 * mutation.
 */
class HistoryModel {
public:
    [[nodiscard]] const std::vector<model::ClipboardEntry>& entries()
        const noexcept {
        return entries_;
    }
    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

    [[nodiscard]] const model::ClipboardEntry* find(
        const model::EntryId& id) const;
    [[nodiscard]] std::optional<std::size_t> indexOf(
        const model::EntryId& id) const;

    /// Entry with exactly this content, if one is loaded.
    [[nodiscard]] const model::ClipboardEntry* findByContent(
        const model::Content& content) const;

    void insertFront(model::ClipboardEntry entry);

    /// @return the removed entry
    std::optional<model::ClipboardEntry> remove(const model::EntryId& id);

    /**
     * @brief Sets the entry's timestamp and moves it to index 0 without
     * reloading anything.
     */
    bool moveToFront(const model::EntryId& id, utils::Timestamp timestamp);

    bool setPinned(const model::EntryId& id, bool pinned);
    bool setGroup(const model::EntryId& id,
                  const std::optional<model::GroupId>& groupId);

    /// Clears groupId on every member of the group.
    std::size_t clearGroup(const model::GroupId& groupId);

    /// Drops every entry isEvictable() selects; returns their ids.
    std::vector<model::EntryId> pruneExpired(std::optional<int> retentionDays,
                                             utils::Timestamp now);

    /// Replaces the contents, sorting newest first.
    void reset(std::vector<model::ClipboardEntry> entries);
    void clear() noexcept;

    /**
     * @brief Case-insensitive search composed with a category filter.
     *
     * Text entries match on their text, image entries on the word "image",
     * file entries on the last path component of any file. An empty search
     * matches everything.
     */
    [[nodiscard]] std::vector<model::ClipboardEntry> filtered(
        std::string_view searchText, model::CategoryFilter filter) const;

    [[nodiscard]] std::vector<model::ClipboardEntry> itemsInGroup(
        const model::GroupId& groupId) const;
    [[nodiscard]] std::vector<model::ClipboardEntry> pinnedItems() const;

private:
    model::ClipboardEntry* findMutable(const model::EntryId& id);

    std::vector<model::ClipboardEntry> entries_;
    DeduplicationIndex dedup_;
};

/// Search predicate used by HistoryModel::filtered.
[[nodiscard]] bool matchesSearch(const model::Content& content,
                                 std::string_view searchText);

}  // namespace clipvault::history

#endif  // CLIPVAULT_HISTORY_HISTORY_MODEL_HPP
