/*
 * memory_pasteboard.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef CLIPVAULT_SYSTEM_MEMORY_PASTEBOARD_HPP
#define CLIPVAULT_SYSTEM_MEMORY_PASTEBOARD_HPP

#include <mutex>

#include "clipvault/system/pasteboard.hpp"

namespace clipvault::system {

/**
 * @class MemoryPasteboard
 * @brief Thread-safe in-process pasteboard. Every write, internal or
 * simulated, increments the change counter.
 */
class MemoryPasteboard : public Pasteboard {
public:
    [[nodiscard]] ChangeCount changeCount() const override;

    [[nodiscard]] Result<std::vector<std::string>> readFileUrls() const override;
    [[nodiscard]] Result<std::string> readText() const override;
    [[nodiscard]] Result<model::ImageBytes> readData(
        PasteboardFormat format) const override;

    Result<ChangeCount> write(const model::Content& content) override;
    Result<ChangeCount> writePlainText(std::string_view text) override;

    /// Replaces all representations as another application would.
    ChangeCount simulateExternalCopy(model::RawPayload payload);
    ChangeCount simulateExternalCopy(std::string_view text);

    /// Bumps the counter without changing content.
    ChangeCount touch();

    void clear();

    /// While set, every read fails with ClipboardUnavailable.
    void setReadFailure(bool failing);

    /// While set, writes fail with ClipboardWriteFailed.
    void setWriteFailure(bool failing);

    /// Current representations, for inspection in tests.
    [[nodiscard]] model::RawPayload contents() const;

private:
    ChangeCount replace(model::RawPayload payload);

    mutable std::mutex mutex_;
    model::RawPayload payload_;
    ChangeCount changeCount_ = 0;
    bool readFailure_ = false;
    bool writeFailure_ = false;
};

/**
 * @brief FrontmostAppProvider returning a fixed, settable application.
 */
class StaticFrontmostApp : public FrontmostAppProvider {
public:
    StaticFrontmostApp() = default;
    explicit StaticFrontmostApp(AppInfo app) : app_(std::move(app)) {}

    [[nodiscard]] Result<AppInfo> frontmostApp() const override;

    void set(AppInfo app);
    void setFailure(bool failing);

private:
    mutable std::mutex mutex_;
    AppInfo app_;
    bool failure_ = false;
};

}  // namespace clipvault::system

#endif  // CLIPVAULT_SYSTEM_MEMORY_PASTEBOARD_HPP
