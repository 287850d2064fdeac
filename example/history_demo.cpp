/*
 * history_demo.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <chrono>
#include <filesystem>
#include <string>
#include <thread>

#include <spdlog/spdlog.h>

#include "clipvault/config/settings.hpp"
#include "clipvault/core/service.hpp"
#include "clipvault/log/logging.hpp"
#include "clipvault/model/content.hpp"
#include "clipvault/system/memory_pasteboard.hpp"
#include "clipvault/utils/time.hpp"

using namespace clipvault;
using namespace std::chrono_literals;

namespace {

void listEntries(core::ClipboardHistory& history, std::string_view search = "",
                 model::CategoryFilter filter = model::CategoryFilter::All) {
    auto entries = history.filtered(search, filter);
    spdlog::info("{} entries (search \"{}\", filter {})", entries.size(), search,
                 model::filterName(filter));
    for (const auto& entry : entries) {
        spdlog::info("  [{}] {}{} from {}", utils::formatTimestamp(entry.timestamp),
                     entry.isPinned ? "* " : "", model::describe(entry.content),
                     entry.sourceProgram);
    }
}

// Waits for the watcher tick to pick up the last simulated copy.
void settle(core::ClipVaultService& service) {
    const auto target = service.watcher().observedChangeCount() + 1;
    for (int i = 0; i < 100 && service.watcher().observedChangeCount() < target;
         ++i) {
        std::this_thread::sleep_for(10ms);
    }
}

}  // namespace

int main(int argc, char** argv) {
    const std::filesystem::path dataDirectory =
        argc > 1 ? std::filesystem::path(argv[1])
                 : std::filesystem::temp_directory_path() / "clipvault-demo";

    config::JsonSettingsStore settings(dataDirectory / "settings.json");
    try {
        settings.load();
    } catch (const ConfigException& e) {
        spdlog::error("Invalid settings, using defaults: {}", e.what());
    }

    log::LogConfig logConfig;
    logConfig.level = log::parseLevel(settings.current().logLevel);
    logConfig.filePath = dataDirectory / "clipvault.log";
    log::configureLogging(logConfig);

    system::MemoryPasteboard pasteboard;
    system::StaticFrontmostApp apps(system::AppInfo{"Notes", "com.apple.Notes"});

    try {
        core::ClipVaultService service(settings, pasteboard, apps, dataDirectory);
        auto& engine = service.history();
        service.privacy().addDefaultPasswordManagers();
        if (auto started = service.start(); !started) {
            spdlog::critical("Cannot start monitoring: {}",
                             started.error().message());
            return 1;
        }

        pasteboard.simulateExternalCopy("hello");
        settle(service);
        pasteboard.simulateExternalCopy("https://example.com");
        settle(service);

        model::RawPayload screenshot;
        screenshot.png = model::ImageBytes{std::byte{0x89}, std::byte{'P'},
                                           std::byte{'N'}, std::byte{'G'}};
        pasteboard.simulateExternalCopy(screenshot);
        settle(service);

        apps.set(system::AppInfo{"Bitwarden", "com.bitwarden.desktop"});
        pasteboard.simulateExternalCopy("correct horse battery staple");
        settle(service);
        apps.set(system::AppInfo{"Notes", "com.apple.Notes"});

        pasteboard.simulateExternalCopy("hello");
        settle(service);
        listEntries(engine);
        listEntries(engine, "", model::CategoryFilter::Links);

        auto entries = engine.entries();
        if (!entries.empty()) {
            if (auto pinned = engine.togglePinned(entries.back().id); !pinned) {
                spdlog::warn("Pin failed: {}", pinned.error().message());
            }
        }

        engine.withQueue([](history::PasteQueue& queue) { queue.activate(); });
        for (const char* step : {"step one", "step two", "step three"}) {
            pasteboard.simulateExternalCopy(step);
            settle(service);
        }
        engine.withQueue([](history::PasteQueue& queue) {
            queue.pasteNext();
            queue.flipOrder();
            while (auto entry = queue.pasteNext()) {
                spdlog::info("Pasted {}", model::describe(entry->content));
            }
        });

        listEntries(engine, "step");
        service.stop();
    } catch (const ClipVaultException& e) {
        spdlog::critical("ClipVault failed to start: {}", e.what());
        return 1;
    }

    try {
        settings.save();
    } catch (const ConfigException& e) {
        spdlog::error("Could not save settings: {}", e.what());
    }
    return 0;
}
