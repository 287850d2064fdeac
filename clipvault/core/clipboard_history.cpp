/*
 * clipboard_history.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "clipboard_history.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "clipvault/history/retention_policy.hpp"

namespace clipvault::core {

ClipboardHistory::ClipboardHistory(store::ContentStore& store,
                                   system::Pasteboard& pasteboard,
                                   const config::SettingsProvider& settings,
                                   async::SerialExecutor& executor)
    : store_(store),
      pasteboard_(pasteboard),
      settings_(settings),
      executor_(executor),
      queue_(settings, [this](const model::ClipboardEntry& entry) {
          return pasteQueued(entry);
      }) {}

Result<void> ClipboardHistory::load() {
    return serialized([this]() -> Result<void> {
        try {
            reloadImpl();
            pruneImpl(utils::Clock::now());
            spdlog::info("Loaded {} clipboard entries", model_.size());
            return {};
        } catch (const ClipVaultException& e) {
            spdlog::error("Failed to load clipboard history: {}", e.what());
            return e.code();
        }
    });
}

void ClipboardHistory::logUnavailable(const std::exception& e) {
    spdlog::error("History engine unavailable: {}", e.what());
}

void ClipboardHistory::reloadImpl() { model_.reset(store_.fetchAll()); }

std::size_t ClipboardHistory::pruneImpl(utils::Timestamp now) {
    const auto retentionDays = settings_.current().retentionDays;
    auto cutoff = history::retentionCutoff(retentionDays, now);
    if (!cutoff) {
        return 0;
    }
    const std::size_t removed = store_.removeOlderThan(*cutoff, true);
    model_.pruneExpired(retentionDays, now);
    return removed;
}

Result<model::ClipboardEntry> ClipboardHistory::capture(
    model::Content content, std::string sourceProgram) {
    return serialized([&]() -> Result<model::ClipboardEntry> {
        std::optional<model::EntryId> previous;
        if (const auto* loaded = model_.findByContent(content)) {
            previous = loaded->id;
        }

        model::ClipboardEntry entry =
            model::makeEntry(std::move(content), std::move(sourceProgram));

        try {
            if (!previous) {
                // Rows whose image could not be loaded are not in the model.
                if (auto stored = store_.findByContent(entry.content)) {
                    previous = stored->id;
                }
            }
            if (previous) {
                store_.replace(*previous, entry);
            } else {
                store_.insert(entry);
            }
        } catch (const ClipVaultException& e) {
            spdlog::error("Capture not recorded: {}", e.what());
            return e.code();
        }

        if (previous) {
            model_.remove(*previous);
            spdlog::debug("Recaptured existing content, replaced {}",
                          previous->toString());
        }
        model_.insertFront(entry);
        spdlog::info("Captured {} from {}",
                     model::categoryName(entry.category()),
                     entry.sourceProgram);
        spdlog::debug("Captured entry {}: {}", entry.id.toString(),
                      model::describe(entry.content));

        if (queue_.isActive()) {
            queue_.append(entry);
        }

        try {
            pruneImpl(utils::Clock::now());
        } catch (const ClipVaultException& e) {
            spdlog::error("Retention pruning failed: {}", e.what());
        }

        contentChanged.emit();
        return entry;
    });
}

Result<void> ClipboardHistory::writeToClipboard(
    const model::ClipboardEntry& entry) {
    auto written = pasteboard_.write(entry.content);
    if (!written) {
        spdlog::warn("Clipboard write failed: {}", written.error().message());
        return ErrorCode::ClipboardWriteFailed;
    }
    selfWrite.emit(*written);
    return {};
}

Result<void> ClipboardHistory::copyToClipboardImpl(const model::EntryId& id) {
    const auto* entry = model_.find(id);
    if (entry == nullptr) {
        return ErrorCode::NotFound;
    }
    if (auto written = writeToClipboard(*entry); !written) {
        return written;
    }

    const auto now = utils::Clock::now();
    try {
        store_.updateTimestamp(id, now);
    } catch (const ClipVaultException& e) {
        spdlog::error("Failed to touch entry {}: {}", id.toString(), e.what());
        return e.code();
    }
    model_.moveToFront(id, now);
    return {};
}

Result<void> ClipboardHistory::copyToClipboard(const model::EntryId& id) {
    return serialized([&]() { return copyToClipboardImpl(id); });
}

bool ClipboardHistory::pasteQueued(const model::ClipboardEntry& entry) {
    // The queue holds a snapshot; the entry may have left the history.
    if (model_.find(entry.id) != nullptr) {
        return copyToClipboardImpl(entry.id).has_value();
    }
    return writeToClipboard(entry).has_value();
}

Result<void> ClipboardHistory::copyAsPlainText(const model::EntryId& id) {
    return serialized([&]() -> Result<void> {
        const auto* entry = model_.find(id);
        if (entry == nullptr) {
            return ErrorCode::NotFound;
        }

        std::string text;
        if (const auto* t = std::get_if<model::TextContent>(&entry->content)) {
            text = t->text;
        } else if (const auto* files =
                       std::get_if<model::FileListContent>(&entry->content)) {
            text = model::joinPaths(files->paths);
        } else {
            return ErrorCode::InvalidArgument;
        }

        auto written = pasteboard_.writePlainText(text);
        if (!written) {
            spdlog::warn("Clipboard write failed: {}",
                         written.error().message());
            return ErrorCode::ClipboardWriteFailed;
        }
        selfWrite.emit(*written);
        return {};
    });
}

Result<void> ClipboardHistory::remove(const model::EntryId& id) {
    return serialized([&]() -> Result<void> {
        try {
            if (!store_.remove(id) && model_.find(id) == nullptr) {
                return ErrorCode::NotFound;
            }
        } catch (const ClipVaultException& e) {
            spdlog::error("Failed to delete entry {}: {}", id.toString(),
                          e.what());
            return e.code();
        }
        model_.remove(id);
        return {};
    });
}

Result<void> ClipboardHistory::clearAll() {
    return serialized([&]() -> Result<void> {
        try {
            store_.removeAll();
        } catch (const ClipVaultException& e) {
            spdlog::error("Failed to clear history: {}", e.what());
            return e.code();
        }
        model_.clear();
        return {};
    });
}

Result<bool> ClipboardHistory::togglePinned(const model::EntryId& id) {
    return serialized([&]() -> Result<bool> {
        const auto* entry = model_.find(id);
        if (entry == nullptr) {
            return ErrorCode::NotFound;
        }
        const bool pinned = !entry->isPinned;
        try {
            store_.updatePinned(id, pinned);
        } catch (const ClipVaultException& e) {
            spdlog::error("Failed to update pin state of {}: {}", id.toString(),
                          e.what());
            return e.code();
        }
        model_.setPinned(id, pinned);
        return pinned;
    });
}

Result<void> ClipboardHistory::setGroup(const model::EntryId& id,
                                        std::optional<model::GroupId> groupId) {
    return serialized([&]() -> Result<void> {
        if (model_.find(id) == nullptr) {
            return ErrorCode::NotFound;
        }
        try {
            store_.updateGroup(id, groupId);
        } catch (const ClipVaultException& e) {
            spdlog::error("Failed to set group of {}: {}", id.toString(),
                          e.what());
            return e.code();
        }
        model_.setGroup(id, groupId);
        return {};
    });
}

Result<std::size_t> ClipboardHistory::pruneExpired(utils::Timestamp now) {
    return serialized([&]() -> Result<std::size_t> {
        try {
            return pruneImpl(now);
        } catch (const ClipVaultException& e) {
            spdlog::error("Retention pruning failed: {}", e.what());
            return e.code();
        }
    });
}

Result<void> ClipboardHistory::refresh() {
    return serialized([&]() -> Result<void> {
        try {
            reloadImpl();
        } catch (const ClipVaultException& e) {
            spdlog::error("Failed to reload history: {}", e.what());
            return e.code();
        }
        return {};
    });
}

Result<model::Group> ClipboardHistory::createGroup(std::string name) {
    return serialized([&]() -> Result<model::Group> {
        if (name.empty()) {
            return ErrorCode::InvalidArgument;
        }
        try {
            auto existing = store_.fetchGroups();
            int maxOrder = -1;
            for (const auto& group : existing) {
                maxOrder = std::max(maxOrder, group.sortOrder);
            }
            model::Group group{utils::UUID::generateV4(), std::move(name),
                               utils::Clock::now(), maxOrder + 1};
            store_.insertGroup(group);
            return group;
        } catch (const ClipVaultException& e) {
            spdlog::error("Failed to create group: {}", e.what());
            return e.code();
        }
    });
}

Result<void> ClipboardHistory::renameGroup(const model::GroupId& id,
                                           std::string name) {
    return serialized([&]() -> Result<void> {
        if (name.empty()) {
            return ErrorCode::InvalidArgument;
        }
        try {
            for (auto& group : store_.fetchGroups()) {
                if (group.id == id) {
                    group.name = std::move(name);
                    store_.updateGroup(group);
                    return {};
                }
            }
        } catch (const ClipVaultException& e) {
            spdlog::error("Failed to rename group {}: {}", id.toString(),
                          e.what());
            return e.code();
        }
        return ErrorCode::NotFound;
    });
}

Result<void> ClipboardHistory::reorderGroup(const model::GroupId& id,
                                            int sortOrder) {
    return serialized([&]() -> Result<void> {
        try {
            for (auto& group : store_.fetchGroups()) {
                if (group.id == id) {
                    group.sortOrder = sortOrder;
                    store_.updateGroup(group);
                    return {};
                }
            }
        } catch (const ClipVaultException& e) {
            spdlog::error("Failed to reorder group {}: {}", id.toString(),
                          e.what());
            return e.code();
        }
        return ErrorCode::NotFound;
    });
}

Result<void> ClipboardHistory::deleteGroup(const model::GroupId& id) {
    return serialized([&]() -> Result<void> {
        try {
            if (!store_.deleteGroup(id)) {
                return ErrorCode::NotFound;
            }
        } catch (const ClipVaultException& e) {
            spdlog::error("Failed to delete group {}: {}", id.toString(),
                          e.what());
            return e.code();
        }
        model_.clearGroup(id);
        return {};
    });
}

Result<std::vector<model::Group>> ClipboardHistory::groups() {
    return serialized([&]() -> Result<std::vector<model::Group>> {
        try {
            return store_.fetchGroups();
        } catch (const ClipVaultException& e) {
            spdlog::error("Failed to read groups: {}", e.what());
            return e.code();
        }
    });
}

std::vector<model::ClipboardEntry> ClipboardHistory::entries() {
    return serialized([&]() { return model_.entries(); });
}

std::vector<model::ClipboardEntry> ClipboardHistory::filtered(
    std::string_view searchText, model::CategoryFilter filter) {
    return serialized(
        [&]() { return model_.filtered(searchText, filter); });
}

std::vector<model::ClipboardEntry> ClipboardHistory::itemsInGroup(
    const model::GroupId& groupId) {
    return serialized([&]() { return model_.itemsInGroup(groupId); });
}

std::vector<model::ClipboardEntry> ClipboardHistory::pinnedItems() {
    return serialized([&]() { return model_.pinnedItems(); });
}

std::optional<model::ClipboardEntry> ClipboardHistory::find(
    const model::EntryId& id) {
    return serialized([&]() -> std::optional<model::ClipboardEntry> {
        if (const auto* entry = model_.find(id)) {
            return *entry;
        }
        return std::nullopt;
    });
}

std::size_t ClipboardHistory::size() {
    return serialized([&]() { return model_.size(); });
}

}  // namespace clipvault::core
