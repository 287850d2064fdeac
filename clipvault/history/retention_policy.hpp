/*
 * retention_policy.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef CLIPVAULT_HISTORY_RETENTION_POLICY_HPP
#define CLIPVAULT_HISTORY_RETENTION_POLICY_HPP

#include <optional>

#include "clipvault/model/entry.hpp"

namespace clipvault::history {

/**
 * @brief Oldest timestamp an unpinned entry may carry and still be kept.
 * @return std::nullopt when retentionDays is unset (keep forever)
 */
[[nodiscard]] std::optional<utils::Timestamp> retentionCutoff(
    std::optional<int> retentionDays, utils::Timestamp now);

/**
 * @brief True iff retentionDays is set, the entry is older than the cutoff
 * and it is not pinned.
 */
[[nodiscard]] bool isEvictable(const model::ClipboardEntry& entry,
                               std::optional<int> retentionDays,
                               utils::Timestamp now);

}  // namespace clipvault::history

#endif  // CLIPVAULT_HISTORY_RETENTION_POLICY_HPP
