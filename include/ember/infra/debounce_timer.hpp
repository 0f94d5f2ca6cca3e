/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file debounce_timer.hpp
 * @brief Restartable single-shot timer backing coalesced notifications.
 *
 * @details
 * This header defines the `DebounceTimer` class. A timer owns one worker
 * thread for its whole lifetime. Every call to `restart()` pushes the
 * deadline `window` into the future; the task runs once the deadline passes
 * without another restart. Destroying the timer stops and joins the worker
 * without running a pending task, so no callback can outlive its owner.
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

namespace ember::infra {

/**
 * @class DebounceTimer
 * @brief A trailing-edge debounce timer driven by a dedicated worker thread.
 *
 * @details
 * **Concurrency Model:**
 * - **Producers:** Any thread may call `restart()` or `cancel()`.
 * - **Consumer:** The worker sleeps on a condition variable until it is armed,
 *   then waits for the deadline and runs the task outside the lock.
 */
class DebounceTimer {
  public:
    using Clock = std::chrono::steady_clock;

    /**
     * @brief Spawns the worker thread in the disarmed state.
     *
     * @param window Quiet period that must elapse after the last restart.
     * @param task The callable fired when the window elapses.
     */
    DebounceTimer(std::chrono::milliseconds window, std::function<void()> task);

    /**
     * @brief Stops the worker and joins it. A pending task is not run.
     *
     * @note Blocking: waits for a task that is already executing to return.
     */
    ~DebounceTimer();

    DebounceTimer(const DebounceTimer&) = delete;
    DebounceTimer& operator=(const DebounceTimer&) = delete;

    /**
     * @brief Arms the timer, or moves its deadline to `now + window`.
     */
    void restart();

    /**
     * @brief Disarms the timer without running the task.
     */
    void cancel();

    /// @brief True while a deadline is pending.
    bool armed() const;

    /// @brief The configured quiet period.
    std::chrono::milliseconds window() const { return window_; }

  private:
    void run();

    std::chrono::milliseconds window_;
    std::function<void()> task_;

    mutable std::mutex mutex_;
    std::condition_variable condition_;
    Clock::time_point deadline_;
    bool armed_ = false;
    bool stop_ = false;

    /// @brief Declared last so every other member is initialized before it starts.
    std::thread worker_;
};

} // namespace ember::infra
