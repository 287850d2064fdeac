/*
 * paste_queue.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "paste_queue.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace clipvault::history {

PasteQueue::PasteQueue(const config::SettingsProvider& settings, Writer writer)
    : settings_(settings), writer_(std::move(writer)) {}

void PasteQueue::setWriter(Writer writer) { writer_ = std::move(writer); }

void PasteQueue::activate() {
    if (active_) {
        return;
    }
    active_ = true;
    items_.clear();
    spdlog::info("Paste queue activated");
    activated.emit();
}

void PasteQueue::deactivate() {
    if (!active_) {
        return;
    }
    active_ = false;
    if (!settings_.current().keepPastedItemsVisible) {
        items_.clear();
    }
    spdlog::info("Paste queue deactivated");
    deactivated.emit();
}

void PasteQueue::toggle() {
    if (active_) {
        deactivate();
    } else {
        activate();
    }
}

bool PasteQueue::append(const model::ClipboardEntry& entry) {
    if (!active_) {
        return false;
    }
    const auto limit =
        static_cast<std::size_t>(settings_.current().effectiveMaxQueueSize());
    if (items_.size() >= limit) {
        spdlog::debug("Paste queue full ({} items), dropping capture", limit);
        return false;
    }
    items_.push_back(
        QueuedItem{utils::UUID::generateV4(), entry, false, items_.size()});
    queueUpdated.emit();
    return true;
}

std::optional<model::ClipboardEntry> PasteQueue::pasteNext() {
    const std::size_t index = nextPasteIndex();
    if (index == items_.size()) {
        if (settings_.current().autoClearAfterComplete) {
            deactivate();
        }
        return std::nullopt;
    }
    return pasteAt(index);
}

std::optional<model::ClipboardEntry> PasteQueue::pasteAt(std::size_t index) {
    if (index >= items_.size() || items_[index].isPasted) {
        return std::nullopt;
    }

    model::ClipboardEntry entry = items_[index].entry;
    if (writer_ && !writer_(entry)) {
        spdlog::warn("Failed to paste queue item {}", index);
        return std::nullopt;
    }
    items_[index].isPasted = true;

    itemPasted.emit(index);
    queueUpdated.emit();

    if (remainingCount() == 0 && settings_.current().autoClearAfterComplete) {
        deactivate();
    }
    return entry;
}

bool PasteQueue::reorder(std::size_t from, std::size_t to) {
    if (from == to || from >= items_.size() || to > items_.size()) {
        return false;
    }
    QueuedItem item = std::move(items_[from]);
    items_.erase(items_.begin() + static_cast<std::ptrdiff_t>(from));
    const std::size_t destination = to > from ? to - 1 : to;
    items_.insert(items_.begin() + static_cast<std::ptrdiff_t>(destination),
                  std::move(item));
    renumber();
    queueUpdated.emit();
    return true;
}

bool PasteQueue::flipOrder() {
    std::vector<std::size_t> slots;
    for (std::size_t i = 0; i < items_.size(); ++i) {
        if (!items_[i].isPasted) {
            slots.push_back(i);
        }
    }
    if (slots.size() < 2) {
        return false;
    }
    for (std::size_t lo = 0, hi = slots.size() - 1; lo < hi; ++lo, --hi) {
        std::swap(items_[slots[lo]], items_[slots[hi]]);
    }
    renumber();
    queueUpdated.emit();
    return true;
}

bool PasteQueue::removeItem(std::size_t index) {
    if (index >= items_.size()) {
        return false;
    }
    items_.erase(items_.begin() + static_cast<std::ptrdiff_t>(index));
    renumber();
    queueUpdated.emit();
    return true;
}

void PasteQueue::clearQueue() {
    items_.clear();
    queueUpdated.emit();
}

void PasteQueue::resetQueue() {
    for (auto& item : items_) {
        item.isPasted = false;
    }
    queueUpdated.emit();
}

std::size_t PasteQueue::nextPasteIndex() const {
    auto it = std::find_if(items_.begin(), items_.end(),
                           [](const QueuedItem& item) { return !item.isPasted; });
    return static_cast<std::size_t>(std::distance(items_.begin(), it));
}

std::size_t PasteQueue::remainingCount() const {
    return static_cast<std::size_t>(
        std::count_if(items_.begin(), items_.end(),
                      [](const QueuedItem& item) { return !item.isPasted; }));
}

void PasteQueue::renumber() noexcept {
    for (std::size_t i = 0; i < items_.size(); ++i) {
        items_[i].order = i;
    }
}

}  // namespace clipvault::history
