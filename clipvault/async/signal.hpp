/*
 * signal.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef CLIPVAULT_ASYNC_SIGNAL_HPP
#define CLIPVAULT_ASYNC_SIGNAL_HPP

#include <cstddef>
#include <exception>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace clipvault::async {

class SlotConnectionError : public std::runtime_error {
public:
    explicit SlotConnectionError(const std::string& message)
        : std::runtime_error(message) {}
};

using ConnectionId = std::size_t;

/**
 * @brief Observer list that publishes an event to zero or more slots.
 *
 * Slots are invoked on the emitting thread, in connection order. The slot
 * list is copied before invocation so a slot may connect or disconnect
 * during emission. A throwing slot is logged and does not stop the
 * remaining slots from running.
 *
 * @tparam Args The argument types for the slots.
 */
template <typename... Args>
class Signal {
public:
    using SlotType = std::function<void(Args...)>;

    /**
     * @brief Connect a slot to the signal.
     *
     * @param slot The slot to connect.
     * @return Id to pass to disconnect().
     * @throws SlotConnectionError if the slot is empty
     */
    ConnectionId connect(SlotType slot) noexcept(false) {
        if (!slot) {
            throw SlotConnectionError("Cannot connect invalid slot");
        }

        std::lock_guard lock(mutex_);
        const ConnectionId id = nextId_++;
        slots_.emplace_back(id, std::move(slot));
        return id;
    }

    bool disconnect(ConnectionId id) noexcept {
        std::lock_guard lock(mutex_);
        for (auto it = slots_.begin(); it != slots_.end(); ++it) {
            if (it->first == id) {
                slots_.erase(it);
                return true;
            }
        }
        return false;
    }

    void emit(Args... args) const {
        std::vector<std::pair<ConnectionId, SlotType>> snapshot;
        {
            std::lock_guard lock(mutex_);
            snapshot = slots_;
        }

        for (const auto& [id, slot] : snapshot) {
            try {
                slot(args...);
            } catch (const std::exception& e) {
                spdlog::error("Slot {} threw during emission: {}", id,
                              e.what());
            }
        }
    }

    void clear() noexcept {
        std::lock_guard lock(mutex_);
        slots_.clear();
    }

    [[nodiscard]] std::size_t size() const noexcept {
        std::lock_guard lock(mutex_);
        return slots_.size();
    }

    [[nodiscard]] bool empty() const noexcept {
        std::lock_guard lock(mutex_);
        return slots_.empty();
    }

private:
    std::vector<std::pair<ConnectionId, SlotType>> slots_;
    ConnectionId nextId_{1};
    mutable std::mutex mutex_;
};

}  // namespace clipvault::async

#endif  // CLIPVAULT_ASYNC_SIGNAL_HPP
