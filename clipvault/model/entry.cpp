/*
 * entry.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "entry.hpp"

#include <utility>

namespace clipvault::model {

ClipboardEntry makeEntry(Content content, std::string sourceProgram,
                         utils::Timestamp timestamp) {
    ClipboardEntry entry;
    entry.id = utils::UUID::generateV4();
    entry.content = std::move(content);
    entry.timestamp = timestamp;
    entry.sourceProgram = sourceProgram.empty() ? std::string(kUnknownProgram)
                                                : std::move(sourceProgram);
    return entry;
}

}  // namespace clipvault::model
