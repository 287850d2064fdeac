/*
 * dedup_index.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef CLIPVAULT_HISTORY_DEDUP_INDEX_HPP
#define CLIPVAULT_HISTORY_DEDUP_INDEX_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <unordered_map>

#include "clipvault/model/entry.hpp"

namespace clipvault::history {

/**
 * @class DeduplicationIndex
 * @brief Fingerprint to entry id lookup used to collapse re-copies.
 *
 * Fingerprints may collide, so lookups confirm every candidate against the
 * real content through the resolver passed to find().
 */
class DeduplicationIndex {
public:
    using Fingerprint = std::uint64_t;
    using Resolver =
        std::function<const model::ClipboardEntry*(const model::EntryId&)>;

    /// 64-bit FNV-1a over the storage tag and the payload.
    [[nodiscard]] static Fingerprint fingerprint(const model::Content& content);

    void add(const model::ClipboardEntry& entry);
    void remove(const model::ClipboardEntry& entry);
    void clear() noexcept;

    [[nodiscard]] std::optional<model::EntryId> find(
        const model::Content& content, const Resolver& resolve) const;

    [[nodiscard]] std::size_t size() const noexcept { return index_.size(); }

private:
    std::unordered_multimap<Fingerprint, model::EntryId> index_;
};

}  // namespace clipvault::history

#endif  // CLIPVAULT_HISTORY_DEDUP_INDEX_HPP
