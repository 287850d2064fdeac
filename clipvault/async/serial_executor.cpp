/*
 * serial_executor.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "serial_executor.hpp"

#include <exception>
#include <stdexcept>

#include <spdlog/spdlog.h>

namespace clipvault::async {

SerialExecutor::SerialExecutor() noexcept(false) {
    try {
        m_thread = std::jthread(
            [this](std::stop_token stopToken) { run(stopToken); });
    } catch (const std::exception& e) {
        throw std::runtime_error(
            std::string("Failed to create executor thread: ") + e.what());
    }
}

SerialExecutor::~SerialExecutor() noexcept { stop(); }

bool SerialExecutor::post(Task task) noexcept(false) {
    if (!task) {
        throw std::invalid_argument("Task cannot be null");
    }
    {
        std::lock_guard lock(m_mutex);
        if (m_stopped) {
            return false;
        }
        m_tasks.push_back(std::move(task));
    }
    m_cond.notify_all();
    return true;
}

void SerialExecutor::schedule(std::chrono::milliseconds interval,
                              Task tick) noexcept(false) {
    if (interval.count() <= 0) {
        throw std::invalid_argument("Tick interval must be greater than 0");
    }
    if (!tick) {
        throw std::invalid_argument("Tick cannot be null");
    }
    {
        std::lock_guard lock(m_mutex);
        m_tick = Tick{interval, std::move(tick),
                      std::chrono::steady_clock::now() + interval};
    }
    m_cond.notify_all();
}

void SerialExecutor::cancelTick() noexcept {
    {
        std::lock_guard lock(m_mutex);
        m_tick.reset();
    }
    m_cond.notify_all();
}

bool SerialExecutor::hasTick() const noexcept {
    std::lock_guard lock(m_mutex);
    return m_tick.has_value();
}

void SerialExecutor::stop() noexcept {
    {
        std::lock_guard lock(m_mutex);
        if (m_stopped) {
            return;
        }
        m_stopped = true;
        m_tasks.clear();
        m_tick.reset();
    }
    m_thread.request_stop();
    m_cond.notify_all();
    if (m_thread.joinable() &&
        std::this_thread::get_id() != m_thread.get_id()) {
        m_thread.join();
    }
}

bool SerialExecutor::isRunning() const noexcept {
    std::lock_guard lock(m_mutex);
    return !m_stopped;
}

bool SerialExecutor::runsOnExecutorThread() const noexcept {
    return std::this_thread::get_id() == m_thread.get_id();
}

void SerialExecutor::run(std::stop_token stopToken) {
    while (!stopToken.stop_requested()) {
        Task work;
        {
            std::unique_lock lock(m_mutex);
            while (!stopToken.stop_requested() && m_tasks.empty()) {
                if (m_tick) {
                    const auto deadline = m_tick->next;
                    if (std::chrono::steady_clock::now() >= deadline) {
                        break;
                    }
                    m_cond.wait_until(lock, stopToken, deadline, [&] {
                        return !m_tasks.empty() || !m_tick ||
                               m_tick->next != deadline;
                    });
                } else {
                    m_cond.wait(lock, stopToken,
                                [this] {
                                    return !m_tasks.empty() ||
                                           m_tick.has_value();
                                });
                }
            }
            if (stopToken.stop_requested()) {
                return;
            }

            if (!m_tasks.empty()) {
                work = std::move(m_tasks.front());
                m_tasks.pop_front();
            } else if (m_tick) {
                work = m_tick->func;
                m_tick->next =
                    std::chrono::steady_clock::now() + m_tick->interval;
            }
        }

        if (!work) {
            continue;
        }

        try {
            work();
        } catch (const std::exception& e) {
            spdlog::error("Executor task failed: {}", e.what());
        }
    }
}

}  // namespace clipvault::async
