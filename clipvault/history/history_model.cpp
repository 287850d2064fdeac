/*
 * history_model.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "history_model.hpp"

#include <algorithm>
#include <iterator>

#include <boost/algorithm/string/predicate.hpp>

#include "clipvault/history/retention_policy.hpp"

namespace clipvault::history {

namespace {
constexpr std::string_view kImageSearchToken = "image";
}

bool matchesSearch(const model::Content& content, std::string_view searchText) {
    if (searchText.empty()) {
        return true;
    }
    if (const auto* text = std::get_if<model::TextContent>(&content)) {
        return boost::algorithm::icontains(text->text, searchText);
    }
    if (std::holds_alternative<model::ImageContent>(content)) {
        return boost::algorithm::icontains(kImageSearchToken, searchText);
    }
    const auto& files = std::get<model::FileListContent>(content);
    return std::any_of(files.paths.begin(), files.paths.end(),
                       [searchText](const std::string& path) {
                           return boost::algorithm::icontains(
                               model::lastPathComponent(path), searchText);
                       });
}

const model::ClipboardEntry* HistoryModel::find(const model::EntryId& id) const {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&id](const auto& entry) { return entry.id == id; });
    return it != entries_.end() ? &*it : nullptr;
}

model::ClipboardEntry* HistoryModel::findMutable(const model::EntryId& id) {
    return const_cast<model::ClipboardEntry*>(
        static_cast<const HistoryModel*>(this)->find(id));
}

std::optional<std::size_t> HistoryModel::indexOf(const model::EntryId& id) const {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&id](const auto& entry) { return entry.id == id; });
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(std::distance(entries_.begin(), it));
}

const model::ClipboardEntry* HistoryModel::findByContent(
    const model::Content& content) const {
    auto id = dedup_.find(content, [this](const model::EntryId& candidate) {
        return find(candidate);
    });
    return id ? find(*id) : nullptr;
}

void HistoryModel::insertFront(model::ClipboardEntry entry) {
    dedup_.add(entry);
    entries_.insert(entries_.begin(), std::move(entry));
}

std::optional<model::ClipboardEntry> HistoryModel::remove(
    const model::EntryId& id) {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&id](const auto& entry) { return entry.id == id; });
    if (it == entries_.end()) {
        return std::nullopt;
    }
    model::ClipboardEntry removed = std::move(*it);
    entries_.erase(it);
    dedup_.remove(removed);
    return removed;
}

bool HistoryModel::moveToFront(const model::EntryId& id,
                               utils::Timestamp timestamp) {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&id](const auto& entry) { return entry.id == id; });
    if (it == entries_.end()) {
        return false;
    }
    it->timestamp = timestamp;
    std::rotate(entries_.begin(), it, std::next(it));
    return true;
}

bool HistoryModel::setPinned(const model::EntryId& id, bool pinned) {
    auto* entry = findMutable(id);
    if (entry == nullptr) {
        return false;
    }
    entry->isPinned = pinned;
    return true;
}

bool HistoryModel::setGroup(const model::EntryId& id,
                            const std::optional<model::GroupId>& groupId) {
    auto* entry = findMutable(id);
    if (entry == nullptr) {
        return false;
    }
    entry->groupId = groupId;
    return true;
}

std::size_t HistoryModel::clearGroup(const model::GroupId& groupId) {
    std::size_t cleared = 0;
    for (auto& entry : entries_) {
        if (entry.groupId == groupId) {
            entry.groupId.reset();
            ++cleared;
        }
    }
    return cleared;
}

std::vector<model::EntryId> HistoryModel::pruneExpired(
    std::optional<int> retentionDays, utils::Timestamp now) {
    std::vector<model::EntryId> pruned;
    auto expired = [retentionDays, now](const model::ClipboardEntry& entry) {
        return isEvictable(entry, retentionDays, now);
    };
    for (const auto& entry : entries_) {
        if (expired(entry)) {
            pruned.push_back(entry.id);
            dedup_.remove(entry);
        }
    }
    std::erase_if(entries_, expired);
    return pruned;
}

void HistoryModel::reset(std::vector<model::ClipboardEntry> entries) {
    std::stable_sort(entries.begin(), entries.end(),
                     [](const auto& lhs, const auto& rhs) {
                         return lhs.timestamp > rhs.timestamp;
                     });
    entries_ = std::move(entries);
    dedup_.clear();
    for (const auto& entry : entries_) {
        dedup_.add(entry);
    }
}

void HistoryModel::clear() noexcept {
    entries_.clear();
    dedup_.clear();
}

std::vector<model::ClipboardEntry> HistoryModel::filtered(
    std::string_view searchText, model::CategoryFilter filter) const {
    std::vector<model::ClipboardEntry> result;
    for (const auto& entry : entries_) {
        if (model::matchesFilter(filter, entry.content) &&
            matchesSearch(entry.content, searchText)) {
            result.push_back(entry);
        }
    }
    return result;
}

std::vector<model::ClipboardEntry> HistoryModel::itemsInGroup(
    const model::GroupId& groupId) const {
    std::vector<model::ClipboardEntry> result;
    std::copy_if(entries_.begin(), entries_.end(), std::back_inserter(result),
                 [&groupId](const auto& entry) {
                     return entry.groupId == groupId;
                 });
    return result;
}

std::vector<model::ClipboardEntry> HistoryModel::pinnedItems() const {
    std::vector<model::ClipboardEntry> result;
    std::copy_if(entries_.begin(), entries_.end(), std::back_inserter(result),
                 [](const auto& entry) { return entry.isPinned; });
    return result;
}

}  // namespace clipvault::history
