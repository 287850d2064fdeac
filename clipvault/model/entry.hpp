/*
 * entry.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef CLIPVAULT_MODEL_ENTRY_HPP
#define CLIPVAULT_MODEL_ENTRY_HPP

#include <optional>
#include <string>

#include "clipvault/model/content.hpp"
#include "clipvault/utils/time.hpp"
#include "clipvault/utils/uuid.hpp"

namespace clipvault::model {

using EntryId = utils::UUID;
using GroupId = utils::UUID;

inline constexpr std::string_view kUnknownProgram = "Unknown";

/**
 * @brief One item of clipboard history.
 *
 * id and content never change after creation. timestamp is the creation or
 * last reactivation time and drives the most-recent-first ordering.
 */
struct ClipboardEntry {
    EntryId id;
    Content content;
    utils::Timestamp timestamp;
    std::string sourceProgram{kUnknownProgram};
    bool isPinned = false;
    std::optional<GroupId> groupId;

    [[nodiscard]] Category category() const noexcept {
        return deriveCategory(content);
    }

    bool operator==(const ClipboardEntry&) const = default;
};

/**
 * @brief Creates an entry with a fresh id.
 */
[[nodiscard]] ClipboardEntry makeEntry(Content content, std::string sourceProgram,
                                       utils::Timestamp timestamp = utils::Clock::now());

struct Group {
    GroupId id;
    std::string name;
    utils::Timestamp createdAt;
    int sortOrder = 0;

    bool operator==(const Group&) const = default;
};

struct IgnoredApp {
    std::string bundleIdentifier;
    std::string displayName;
    utils::Timestamp addedAt;

    bool operator==(const IgnoredApp&) const = default;
};

}  // namespace clipvault::model

#endif  // CLIPVAULT_MODEL_ENTRY_HPP
