/*
 * service.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "service.hpp"

#include <spdlog/spdlog.h>

#include "clipvault/store/legacy_import.hpp"

namespace clipvault::core {

ClipVaultService::ClipVaultService(const config::SettingsProvider& settings,
                                   system::Pasteboard& pasteboard,
                                   const system::FrontmostAppProvider& apps,
                                   const std::filesystem::path& dataDirectory)
    : store_(store::ContentStore::open(dataDirectory)) {
    auto imported = store::importLegacyHistory(
        *store_, dataDirectory / std::string(store::kLegacyFileName));
    if (!imported) {
        spdlog::warn("Continuing without legacy history");
    }

    privacy_ = std::make_unique<system::PrivacyManager>(*store_, executor_);
    privacy_->setMonitoringPaused(settings.current().monitoringPaused);

    history_ = std::make_unique<ClipboardHistory>(*store_, pasteboard, settings,
                                                  executor_);
    if (auto loaded = history_->load(); !loaded) {
        throw StoreException(loaded.error());
    }

    watcher_ = std::make_unique<ClipboardWatcher>(*history_, pasteboard,
                                                  *privacy_, apps, settings);
}

ClipVaultService::~ClipVaultService() {
    if (watcher_) {
        watcher_->stop();
    }
    watcher_.reset();
    executor_.stop();
}

Result<void> ClipVaultService::start() { return watcher_->start(); }

void ClipVaultService::stop() { watcher_->stop(); }

}  // namespace clipvault::core
