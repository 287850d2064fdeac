/*
 * memory_pasteboard.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "memory_pasteboard.hpp"

#include <type_traits>
#include <variant>

namespace clipvault::system {

ChangeCount MemoryPasteboard::changeCount() const {
    std::lock_guard lock(mutex_);
    return changeCount_;
}

Result<std::vector<std::string>> MemoryPasteboard::readFileUrls() const {
    std::lock_guard lock(mutex_);
    if (readFailure_) {
        return ErrorCode::ClipboardUnavailable;
    }
    return payload_.fileUrls.value_or(std::vector<std::string>{});
}

Result<std::string> MemoryPasteboard::readText() const {
    std::lock_guard lock(mutex_);
    if (readFailure_) {
        return ErrorCode::ClipboardUnavailable;
    }
    return payload_.text.value_or(std::string{});
}

Result<model::ImageBytes> MemoryPasteboard::readData(
    PasteboardFormat format) const {
    std::lock_guard lock(mutex_);
    if (readFailure_) {
        return ErrorCode::ClipboardUnavailable;
    }
    if (format == formats::PNG) {
        return payload_.png.value_or(model::ImageBytes{});
    }
    if (format == formats::TIFF) {
        return payload_.tiff.value_or(model::ImageBytes{});
    }
    return ErrorCode::InvalidArgument;
}

Result<ChangeCount> MemoryPasteboard::write(const model::Content& content) {
    {
        std::lock_guard lock(mutex_);
        if (writeFailure_) {
            return ErrorCode::ClipboardWriteFailed;
        }
    }
    model::RawPayload payload;
    std::visit(
        [&payload](const auto& value) {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, model::TextContent>) {
                payload.text = value.text;
            } else if constexpr (std::is_same_v<T, model::ImageContent>) {
                payload.png = value.bytes;
            } else {
                std::vector<std::string> urls;
                urls.reserve(value.paths.size());
                for (const auto& path : value.paths) {
                    urls.push_back(pathToFileUrl(path));
                }
                payload.fileUrls = std::move(urls);
            }
        },
        content);
    return replace(std::move(payload));
}

Result<ChangeCount> MemoryPasteboard::writePlainText(std::string_view text) {
    {
        std::lock_guard lock(mutex_);
        if (writeFailure_) {
            return ErrorCode::ClipboardWriteFailed;
        }
    }
    model::RawPayload payload;
    payload.text = std::string(text);
    return replace(std::move(payload));
}

ChangeCount MemoryPasteboard::simulateExternalCopy(model::RawPayload payload) {
    return replace(std::move(payload));
}

ChangeCount MemoryPasteboard::simulateExternalCopy(std::string_view text) {
    model::RawPayload payload;
    payload.text = std::string(text);
    return replace(std::move(payload));
}

ChangeCount MemoryPasteboard::touch() {
    std::lock_guard lock(mutex_);
    return ++changeCount_;
}

void MemoryPasteboard::clear() { replace(model::RawPayload{}); }

void MemoryPasteboard::setReadFailure(bool failing) {
    std::lock_guard lock(mutex_);
    readFailure_ = failing;
}

void MemoryPasteboard::setWriteFailure(bool failing) {
    std::lock_guard lock(mutex_);
    writeFailure_ = failing;
}

model::RawPayload MemoryPasteboard::contents() const {
    std::lock_guard lock(mutex_);
    return payload_;
}

ChangeCount MemoryPasteboard::replace(model::RawPayload payload) {
    std::lock_guard lock(mutex_);
    payload_ = std::move(payload);
    return ++changeCount_;
}

Result<AppInfo> StaticFrontmostApp::frontmostApp() const {
    std::lock_guard lock(mutex_);
    if (failure_) {
        return ErrorCode::ClipboardUnavailable;
    }
    return app_;
}

void StaticFrontmostApp::set(AppInfo app) {
    std::lock_guard lock(mutex_);
    app_ = std::move(app);
}

void StaticFrontmostApp::setFailure(bool failing) {
    std::lock_guard lock(mutex_);
    failure_ = failing;
}

}  // namespace clipvault::system
