/*
 * pasteboard.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "pasteboard.hpp"

#include <cctype>

#include <spdlog/spdlog.h>

namespace clipvault::system {

model::RawPayload readPayload(const Pasteboard& pasteboard) {
    model::RawPayload payload;

    if (auto urls = pasteboard.readFileUrls(); !urls) {
        spdlog::warn("Failed to read file URLs from pasteboard: {}",
                     urls.error().message());
    } else if (!urls->empty()) {
        payload.fileUrls = std::move(*urls);
    }

    if (auto text = pasteboard.readText(); !text) {
        spdlog::warn("Failed to read text from pasteboard: {}",
                     text.error().message());
    } else if (!text->empty()) {
        payload.text = std::move(*text);
    }

    if (auto png = pasteboard.readData(formats::PNG); !png) {
        spdlog::warn("Failed to read PNG from pasteboard: {}",
                     png.error().message());
    } else if (!png->empty()) {
        payload.png = std::move(*png);
    }

    if (auto tiff = pasteboard.readData(formats::TIFF); !tiff) {
        spdlog::warn("Failed to read TIFF from pasteboard: {}",
                     tiff.error().message());
    } else if (!tiff->empty()) {
        payload.tiff = std::move(*tiff);
    }

    return payload;
}

std::string pathToFileUrl(std::string_view path) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string url = "file://";
    url.reserve(url.size() + path.size());
    for (char c : path) {
        const auto byte = static_cast<unsigned char>(c);
        if (std::isalnum(byte) || c == '/' || c == '-' || c == '_' ||
            c == '.' || c == '~') {
            url.push_back(c);
        } else {
            url.push_back('%');
            url.push_back(kHex[byte >> 4]);
            url.push_back(kHex[byte & 0x0F]);
        }
    }
    return url;
}

}  // namespace clipvault::system
