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
 * @file debounce_timer.cpp
 * @brief Implementation of the restartable debounce timer.
 */

#include "ember/infra/debounce_timer.hpp"

#include <utility>

namespace ember::infra {

DebounceTimer::DebounceTimer(std::chrono::milliseconds window, std::function<void()> task)
    : window_(window), task_(std::move(task)), worker_([this] { run(); })
{
}

DebounceTimer::~DebounceTimer()
{
    {
        std::unique_lock<std::mutex> lock(mutex_);
        stop_ = true;
        armed_ = false;
    }
    condition_.notify_all();

    if (worker_.joinable()) {
        worker_.join();
    }
}

void DebounceTimer::restart()
{
    {
        std::unique_lock<std::mutex> lock(mutex_);
        deadline_ = Clock::now() + window_;
        armed_ = true;
    }
    condition_.notify_one();
}

void DebounceTimer::cancel()
{
    {
        std::unique_lock<std::mutex> lock(mutex_);
        armed_ = false;
    }
    condition_.notify_one();
}

bool DebounceTimer::armed() const
{
    std::unique_lock<std::mutex> lock(mutex_);
    return armed_;
}

/**
 * @brief Worker event loop.
 *
 * Sleeps until armed, then waits for the deadline. A restart while waiting
 * moves the deadline; the loop re-reads it on every wake-up, so only the
 * last restart in a burst counts.
 */
void DebounceTimer::run()
{
    std::unique_lock<std::mutex> lock(mutex_);

    while (true) {
        condition_.wait(lock, [this] { return stop_ || armed_; });
        if (stop_) {
            return;
        }

        auto deadline = deadline_;
        condition_.wait_until(lock, deadline,
                              [this, deadline] { return stop_ || !armed_ || deadline_ != deadline; });
        if (stop_) {
            return;
        }
        if (!armed_ || deadline_ != deadline || Clock::now() < deadline_) {
            continue;
        }

        armed_ = false;

        // The task runs unlocked so it may call restart() itself.
        lock.unlock();
        if (task_) {
            task_();
        }
        lock.lock();
    }
}

} // namespace ember::infra
