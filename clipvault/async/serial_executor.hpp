/*
 * serial_executor.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-6-3

Description: Single worker thread running posted tasks and a repeating
tick one at a time

**************************************************/

#ifndef CLIPVAULT_ASYNC_SERIAL_EXECUTOR_HPP
#define CLIPVAULT_ASYNC_SERIAL_EXECUTOR_HPP

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <utility>

namespace clipvault::async {

/**
 * @brief Thrown by submit() and runSync() when the executor has stopped, or
 * stopped before running the task.
 */
class ExecutorStoppedError : public std::runtime_error {
public:
    ExecutorStoppedError() : std::runtime_error("SerialExecutor is stopped") {}
};

/**
 * @class SerialExecutor
 * @brief The logical thread all history mutations run on.
 *
 * Posted tasks and the repeating tick never overlap: the worker runs one
 * callable at a time and only waits between them. Posted tasks are run
 * before a due tick.
 */
class SerialExecutor {
public:
    using Task = std::function<void()>;

    SerialExecutor() noexcept(false);
    ~SerialExecutor() noexcept;

    SerialExecutor(const SerialExecutor&) = delete;
    SerialExecutor& operator=(const SerialExecutor&) = delete;
    SerialExecutor(SerialExecutor&&) = delete;
    SerialExecutor& operator=(SerialExecutor&&) = delete;

    /**
     * @brief Queue a task for the worker.
     * @return false if the executor has been stopped.
     * @throws std::invalid_argument if task is empty
     */
    bool post(Task task) noexcept(false);

    /**
     * @brief Queue a callable and get a future for its result.
     * @throws ExecutorStoppedError if the executor has been stopped
     */
    template <typename F>
    auto submit(F&& func) -> std::future<std::invoke_result_t<F>>;

    /**
     * @brief Run func on the worker and wait for it. Runs inline when called
     * from the worker itself. Exceptions thrown by func reach the caller.
     * @throws ExecutorStoppedError if the task was never run
     */
    template <typename F>
    auto runSync(F&& func) -> std::invoke_result_t<F>;

    /**
     * @brief Install (or replace) the repeating tick. The first run is one
     * interval from now.
     * @throws std::invalid_argument if interval is not positive or tick empty
     */
    void schedule(std::chrono::milliseconds interval, Task tick) noexcept(false);

    void cancelTick() noexcept;

    [[nodiscard]] bool hasTick() const noexcept;

    /**
     * @brief Stop the worker after the task in progress; pending tasks are
     * dropped. Idempotent.
     */
    void stop() noexcept;

    [[nodiscard]] bool isRunning() const noexcept;

    [[nodiscard]] bool runsOnExecutorThread() const noexcept;

private:
    struct Tick {
        std::chrono::milliseconds interval;
        Task func;
        std::chrono::steady_clock::time_point next;
    };

    void run(std::stop_token stopToken);

    mutable std::mutex m_mutex;
    std::condition_variable_any m_cond;
    std::deque<Task> m_tasks;
    std::optional<Tick> m_tick;
    bool m_stopped{false};
    std::jthread m_thread;
};

template <typename F>
auto SerialExecutor::submit(F&& func) -> std::future<std::invoke_result_t<F>> {
    using ReturnType = std::invoke_result_t<F>;
    auto task = std::make_shared<std::packaged_task<ReturnType()>>(
        std::forward<F>(func));
    std::future<ReturnType> result = task->get_future();
    if (!post([task]() { (*task)(); })) {
        throw ExecutorStoppedError();
    }
    return result;
}

template <typename F>
auto SerialExecutor::runSync(F&& func) -> std::invoke_result_t<F> {
    if (runsOnExecutorThread()) {
        return std::forward<F>(func)();
    }
    auto result = submit(std::forward<F>(func));
    try {
        return result.get();
    } catch (const std::future_error& e) {
        // stop() drops queued tasks unrun.
        if (e.code() == std::future_errc::broken_promise) {
            throw ExecutorStoppedError();
        }
        throw;
    }
}

}  // namespace clipvault::async

#endif  // CLIPVAULT_ASYNC_SERIAL_EXECUTOR_HPP
