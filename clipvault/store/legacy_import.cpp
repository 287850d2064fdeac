/*
 * legacy_import.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "legacy_import.hpp"

#include <algorithm>
#include <fstream>
#include <system_error>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "clipvault/store/content_store.hpp"
#include "clipvault/utils/base64.hpp"

namespace clipvault::store {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

[[noreturn]] void fail(std::size_t index, std::string_view what) {
    throw StoreException(ErrorCode::LegacyImportFailed,
                         fmt::format("record {}: {}", index, what));
}

model::ClipboardEntry decodeRecord(const json& record, std::size_t index) {
    if (!record.is_object()) {
        fail(index, "not an object");
    }

    model::ClipboardEntry entry;

    auto id = utils::UUID::fromString(record.at("id").get<std::string>());
    if (!id) {
        fail(index, "invalid id");
    }
    entry.id = *id;

    const auto& content = record.at("content");
    const auto type = content.at("type").get<std::string>();
    const auto value = content.at("value").get<std::string>();
    if (type == "text") {
        entry.content = model::TextContent{value};
    } else if (type == "image") {
        auto bytes = utils::base64Decode(value);
        if (!bytes) {
            fail(index, "image value is not valid base64");
        }
        entry.content = model::ImageContent{std::move(*bytes)};
    } else {
        fail(index, fmt::format("unknown content type '{}'", type));
    }

    auto timestamp =
        utils::parseIso8601(record.at("timestamp").get<std::string>());
    if (!timestamp) {
        fail(index, "invalid timestamp");
    }
    entry.timestamp = *timestamp;

    auto program = record.value("programName", std::string());
    entry.sourceProgram =
        program.empty() ? std::string(model::kUnknownProgram) : program;
    return entry;
}

std::vector<model::ClipboardEntry> newestPerContent(
    std::vector<model::ClipboardEntry> records) {
    std::stable_sort(records.begin(), records.end(),
                     [](const auto& a, const auto& b) {
                         return a.timestamp > b.timestamp;
                     });
    std::vector<model::ClipboardEntry> unique;
    unique.reserve(records.size());
    for (auto& record : records) {
        const bool seen =
            std::any_of(unique.begin(), unique.end(), [&record](const auto& kept) {
                return kept.content == record.content;
            });
        if (!seen) {
            unique.push_back(std::move(record));
        }
    }
    return unique;
}

}  // namespace

std::vector<model::ClipboardEntry> parseLegacyFile(const fs::path& file) {
    std::ifstream in(file);
    if (!in) {
        throw StoreException(ErrorCode::LegacyImportFailed,
                             fmt::format("cannot open {}", file.string()));
    }

    std::vector<model::ClipboardEntry> entries;
    try {
        const json document = json::parse(in);
        if (!document.is_array()) {
            throw StoreException(ErrorCode::LegacyImportFailed,
                                 "top-level value is not an array");
        }
        entries.reserve(document.size());
        for (std::size_t i = 0; i < document.size(); ++i) {
            entries.push_back(decodeRecord(document[i], i));
        }
    } catch (const json::exception& e) {
        throw StoreException(ErrorCode::LegacyImportFailed, e.what());
    }
    return entries;
}

Result<std::size_t> importLegacyHistory(ContentStore& store,
                                        const fs::path& file) {
    std::error_code ec;
    if (!fs::exists(file, ec)) {
        return std::size_t{0};
    }

    std::vector<model::ClipboardEntry> entries;
    std::size_t imported = 0;
    try {
        entries = newestPerContent(parseLegacyFile(file));
        store.withTransaction([&] {
            for (const auto& entry : entries) {
                if (store.findByContent(entry.content)) {
                    spdlog::debug("Legacy record {} already stored, skipped",
                                  entry.id.toString());
                    continue;
                }
                store.insert(entry);
                ++imported;
            }
        });
    } catch (const StoreException& e) {
        spdlog::error("Legacy import from {} failed, file left in place: {}",
                      file.string(), e.what());
        return ErrorCode::LegacyImportFailed;
    }

    fs::remove(file, ec);
    if (ec) {
        spdlog::warn("Imported legacy history but could not remove {}: {}",
                     file.string(), ec.message());
    }
    spdlog::info("Imported {} entries from legacy file {}", imported,
                 file.string());
    return imported;
}

}  // namespace clipvault::store
