/*
 * classifier.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "classifier.hpp"

#include <algorithm>
#include <cctype>

namespace clipvault::model {

namespace {
constexpr std::string_view kFileScheme = "file://";

int hexDigit(char c) noexcept {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

std::optional<std::string> percentDecode(std::string_view in) {
    std::string out;
    out.reserve(in.size());
    for (std::size_t i = 0; i < in.size(); ++i) {
        if (in[i] != '%') {
            out.push_back(in[i]);
            continue;
        }
        if (i + 2 >= in.size()) {
            return std::nullopt;
        }
        const int hi = hexDigit(in[i + 1]);
        const int lo = hexDigit(in[i + 2]);
        if (hi < 0 || lo < 0) {
            return std::nullopt;
        }
        out.push_back(static_cast<char>((hi << 4) | lo));
        i += 2;
    }
    return out;
}
}  // namespace

bool isBlank(std::string_view text) noexcept {
    return std::all_of(text.begin(), text.end(), [](unsigned char c) {
        return std::isspace(c) != 0;
    });
}

std::optional<std::string> fileUrlToPath(const std::string& url) {
    if (url.starts_with('/')) {
        return url;
    }
    if (!url.starts_with(kFileScheme)) {
        return std::nullopt;
    }

    std::string_view rest(url);
    rest.remove_prefix(kFileScheme.size());
    if (rest.starts_with("localhost/")) {
        rest.remove_prefix(std::string_view("localhost").size());
    }
    if (!rest.starts_with('/')) {
        return std::nullopt;
    }
    auto path = percentDecode(rest);
    if (!path || path->empty()) {
        return std::nullopt;
    }
    return path;
}

std::optional<Content> classify(const RawPayload& payload) {
    if (payload.fileUrls && !payload.fileUrls->empty()) {
        FileListContent files;
        files.paths.reserve(payload.fileUrls->size());
        bool allLocal = true;
        for (const auto& url : *payload.fileUrls) {
            auto path = fileUrlToPath(url);
            if (!path) {
                allLocal = false;
                break;
            }
            files.paths.push_back(std::move(*path));
        }
        if (allLocal) {
            return Content{std::move(files)};
        }
    }

    if (payload.text && !payload.text->empty() && !isBlank(*payload.text)) {
        return Content{TextContent{*payload.text}};
    }

    if (payload.png && !payload.png->empty()) {
        return Content{ImageContent{*payload.png}};
    }
    if (payload.tiff && !payload.tiff->empty()) {
        return Content{ImageContent{*payload.tiff}};
    }

    return std::nullopt;
}

}  // namespace clipvault::model
