/*
 * retention_policy.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "retention_policy.hpp"

#include <chrono>

namespace clipvault::history {

std::optional<utils::Timestamp> retentionCutoff(std::optional<int> retentionDays,
                                                utils::Timestamp now) {
    if (!retentionDays) {
        return std::nullopt;
    }
    return now - std::chrono::hours(24) * (*retentionDays);
}

bool isEvictable(const model::ClipboardEntry& entry,
                 std::optional<int> retentionDays, utils::Timestamp now) {
    if (entry.isPinned) {
        return false;
    }
    auto cutoff = retentionCutoff(retentionDays, now);
    return cutoff && entry.timestamp < *cutoff;
}

}  // namespace clipvault::history
