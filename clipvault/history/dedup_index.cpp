/*
 * dedup_index.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "dedup_index.hpp"

#include <type_traits>
#include <variant>

namespace clipvault::history {

namespace {

constexpr std::uint64_t kFnvOffset = 14695981039346656037ULL;
constexpr std::uint64_t kFnvPrime = 1099511628211ULL;

void mix(std::uint64_t& hash, const void* data, std::size_t size) {
    const auto* bytes = static_cast<const unsigned char*>(data);
    for (std::size_t i = 0; i < size; ++i) {
        hash ^= bytes[i];
        hash *= kFnvPrime;
    }
}

}  // namespace

DeduplicationIndex::Fingerprint DeduplicationIndex::fingerprint(
    const model::Content& content) {
    std::uint64_t hash = kFnvOffset;
    const auto tag = model::storageTag(content);
    mix(hash, tag.data(), tag.size());
    std::visit(
        [&hash](const auto& value) {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, model::TextContent>) {
                mix(hash, value.text.data(), value.text.size());
            } else if constexpr (std::is_same_v<T, model::ImageContent>) {
                mix(hash, value.bytes.data(), value.bytes.size());
            } else {
                for (const auto& path : value.paths) {
                    mix(hash, path.data(), path.size());
                    const char separator = '\n';
                    mix(hash, &separator, 1);
                }
            }
        },
        content);
    return hash;
}

void DeduplicationIndex::add(const model::ClipboardEntry& entry) {
    index_.emplace(fingerprint(entry.content), entry.id);
}

void DeduplicationIndex::remove(const model::ClipboardEntry& entry) {
    auto [first, last] = index_.equal_range(fingerprint(entry.content));
    for (auto it = first; it != last; ++it) {
        if (it->second == entry.id) {
            index_.erase(it);
            return;
        }
    }
}

void DeduplicationIndex::clear() noexcept { index_.clear(); }

std::optional<model::EntryId> DeduplicationIndex::find(
    const model::Content& content, const Resolver& resolve) const {
    auto [first, last] = index_.equal_range(fingerprint(content));
    for (auto it = first; it != last; ++it) {
        const auto* entry = resolve(it->second);
        if (entry != nullptr && entry->content == content) {
            return it->second;
        }
    }
    return std::nullopt;
}

}  // namespace clipvault::history
