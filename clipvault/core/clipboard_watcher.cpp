/*
 * clipboard_watcher.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "clipboard_watcher.hpp"

#include <chrono>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "clipvault/model/classifier.hpp"

namespace clipvault::core {

ClipboardWatcher::ClipboardWatcher(ClipboardHistory& history,
                                   system::Pasteboard& pasteboard,
                                   const system::PrivacyFilter& privacy,
                                   const system::FrontmostAppProvider& apps,
                                   const config::SettingsProvider& settings)
    : history_(history),
      pasteboard_(pasteboard),
      privacy_(privacy),
      apps_(apps),
      settings_(settings),
      observed_(pasteboard.changeCount()) {
    selfWriteConnection_ = history_.selfWrite.connect(
        [this](system::ChangeCount counter) { noteSelfWrite(counter); });
}

ClipboardWatcher::~ClipboardWatcher() {
    stop();
    history_.selfWrite.disconnect(selfWriteConnection_);
}

Result<void> ClipboardWatcher::start() {
    std::lock_guard lock(lifecycleMutex_);
    if (running_.load()) {
        return {};
    }
    const int intervalMs = settings_.current().pollIntervalMs;
    if (intervalMs <= 0) {
        spdlog::error("Cannot start clipboard monitoring: poll interval {} ms",
                      intervalMs);
        return ErrorCode::ConfigInvalid;
    }
    auto& executor = history_.executor();
    if (!executor.isRunning()) {
        spdlog::error("Cannot start clipboard monitoring: engine stopped");
        return ErrorCode::StoreUnavailable;
    }
    const auto interval = std::chrono::milliseconds(intervalMs);
    try {
        executor.schedule(interval, [this] { pollImpl(); });
    } catch (const std::invalid_argument& e) {
        spdlog::error("Cannot start clipboard monitoring: {}", e.what());
        return ErrorCode::InvalidArgument;
    }
    running_.store(true);
    spdlog::info("Clipboard monitoring started ({} ms interval)",
                 interval.count());
    return {};
}

void ClipboardWatcher::stop() {
    std::lock_guard lock(lifecycleMutex_);
    if (!running_.exchange(false)) {
        return;
    }
    auto& executor = history_.executor();
    try {
        // Cancel on the worker so no tick is mid-flight when this returns.
        executor.runSync([&executor] { executor.cancelTick(); });
    } catch (const async::ExecutorStoppedError&) {
        executor.cancelTick();
    }
    spdlog::info("Clipboard monitoring stopped");
}

void ClipboardWatcher::poll() {
    try {
        history_.executor().runSync([this] { pollImpl(); });
    } catch (const async::ExecutorStoppedError& e) {
        spdlog::warn("Clipboard poll skipped: {}", e.what());
    }
}

void ClipboardWatcher::noteSelfWrite(system::ChangeCount counter) {
    observed_.store(counter);
}

void ClipboardWatcher::pollImpl() {
    const system::ChangeCount current = pasteboard_.changeCount();
    if (current == observed_.load()) {
        return;
    }
    observed_.store(current);

    if (privacy_.isMonitoringPaused()) {
        spdlog::debug("Monitoring paused, skipping change {}", current);
        return;
    }

    system::AppInfo app;
    if (auto frontmost = apps_.frontmostApp(); frontmost) {
        app = *frontmost;
    } else {
        spdlog::warn("Cannot resolve frontmost application: {}",
                     frontmost.error().message());
    }

    if (privacy_.isAppIgnored(app.bundleId)) {
        spdlog::debug("Ignoring change {} from {}", current,
                      app.bundleId.value_or(""));
        return;
    }

    auto content = model::classify(system::readPayload(pasteboard_));
    if (!content) {
        spdlog::debug("Change {} carried no capturable content", current);
        return;
    }

    auto captured = history_.capture(
        std::move(*content),
        app.displayName.value_or(std::string(model::kUnknownProgram)));
    if (captured) {
        captures_.fetch_add(1);
    } else {
        spdlog::warn("Change {} was not recorded: {}", current,
                     captured.error().message());
    }
}

}  // namespace clipvault::core
