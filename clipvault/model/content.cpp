/*
 * content.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "content.hpp"

#include <fmt/format.h>

namespace clipvault::model {

namespace {
template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

constexpr std::size_t kDescribeLimit = 60;
}  // namespace

bool isLink(std::string_view text) noexcept {
    return text.starts_with("http://") || text.starts_with("https://");
}

Category deriveCategory(const Content& content) noexcept {
    return std::visit(
        Overloaded{
            [](const TextContent& t) {
                return isLink(t.text) ? Category::Link : Category::Text;
            },
            [](const ImageContent&) { return Category::Image; },
            [](const FileListContent&) { return Category::File; }},
        content);
}

std::string_view categoryName(Category category) noexcept {
    switch (category) {
        case Category::Text:
            return "Text";
        case Category::Link:
            return "Link";
        case Category::Image:
            return "Image";
        case Category::File:
            return "File";
    }
    return "Unknown";
}

std::string_view filterName(CategoryFilter filter) noexcept {
    switch (filter) {
        case CategoryFilter::All:
            return "All";
        case CategoryFilter::Text:
            return "Text";
        case CategoryFilter::Links:
            return "Links";
        case CategoryFilter::Images:
            return "Images";
        case CategoryFilter::Files:
            return "Files";
    }
    return "Unknown";
}

bool matchesFilter(CategoryFilter filter, const Content& content) noexcept {
    const Category category = deriveCategory(content);
    switch (filter) {
        case CategoryFilter::All:
            return true;
        case CategoryFilter::Text:
            return category == Category::Text;
        case CategoryFilter::Links:
            return category == Category::Link;
        case CategoryFilter::Images:
            return category == Category::Image;
        case CategoryFilter::Files:
            return category == Category::File;
    }
    return false;
}

std::string_view storageTag(const Content& content) noexcept {
    return std::visit(
        Overloaded{[](const TextContent&) { return std::string_view("text"); },
                   [](const ImageContent&) { return std::string_view("image"); },
                   [](const FileListContent&) {
                       return std::string_view("file");
                   }},
        content);
}

std::string joinPaths(const std::vector<std::string>& paths) {
    std::string joined;
    for (std::size_t i = 0; i < paths.size(); ++i) {
        if (i > 0) {
            joined.push_back('\n');
        }
        joined += paths[i];
    }
    return joined;
}

std::vector<std::string> splitPaths(std::string_view joined) {
    std::vector<std::string> paths;
    std::size_t start = 0;
    while (start <= joined.size()) {
        const std::size_t end = joined.find('\n', start);
        const auto piece = joined.substr(
            start, end == std::string_view::npos ? std::string_view::npos
                                                 : end - start);
        if (!piece.empty()) {
            paths.emplace_back(piece);
        }
        if (end == std::string_view::npos) {
            break;
        }
        start = end + 1;
    }
    return paths;
}

std::string_view lastPathComponent(std::string_view path) noexcept {
    while (path.size() > 1 && path.back() == '/') {
        path.remove_suffix(1);
    }
    const auto slash = path.find_last_of('/');
    if (slash == std::string_view::npos || path.size() == 1) {
        return path;
    }
    return path.substr(slash + 1);
}

std::string describe(const Content& content) {
    return std::visit(
        Overloaded{
            [](const TextContent& t) {
                if (t.text.size() <= kDescribeLimit) {
                    return fmt::format("{} \"{}\"",
                                       isLink(t.text) ? "link" : "text",
                                       t.text);
                }
                return fmt::format("{} \"{}...\" ({} bytes)",
                                   isLink(t.text) ? "link" : "text",
                                   t.text.substr(0, kDescribeLimit),
                                   t.text.size());
            },
            [](const ImageContent& i) {
                return fmt::format("image ({} bytes)", i.bytes.size());
            },
            [](const FileListContent& f) {
                if (f.paths.size() == 1) {
                    return fmt::format("file {}",
                                       lastPathComponent(f.paths.front()));
                }
                return fmt::format("{} files", f.paths.size());
            }},
        content);
}

}  // namespace clipvault::model
