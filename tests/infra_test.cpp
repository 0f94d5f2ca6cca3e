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
 * @file infra_test.cpp
 * @brief Unit tests for shared infrastructure primitives (String, Logger, DebounceTimer).
 */

#include "ember/infra/debounce_timer.hpp"
#include "ember/infra/logger.hpp"
#include "ember/infra/string.hpp"
#include "framework.hpp"

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using ember::infra::DebounceTimer;
using ember::infra::Logger;
using ember::infra::LogLevel;
using ember::infra::String;

/**
 * @brief Tests the `String::trim` algorithm with nominal input.
 *
 * Internal whitespace must survive; only the padding goes.
 */
void test_string_trim()
{
    std::string clean = String::trim("   stats score   ");
    ASSERT_EQ(clean, std::string("stats score"));
}

void test_string_trim_empty()
{
    std::string result = String::trim("  \t\n  \r ");
    ASSERT_EQ(result, std::string(""));
    ASSERT_EQ(result.length(), static_cast<size_t>(0));
}

/**
 * @brief Dot-notation paths split into their segments, empty ones included.
 */
void test_string_split_path()
{
    auto parts = String::split("stats.score.max", '.');
    ASSERT_EQ(parts.size(), static_cast<size_t>(3));
    ASSERT_EQ(parts[0], std::string("stats"));
    ASSERT_EQ(parts[2], std::string("max"));

    auto gaps = String::split("a..b", '.');
    ASSERT_EQ(gaps.size(), static_cast<size_t>(3));
    ASSERT_TRUE(gaps[1].empty());

    ASSERT_EQ(String::split("", '.').size(), static_cast<size_t>(1));
    ASSERT_EQ(String::join(parts, '.'), std::string("stats.score.max"));
}

void test_logger_threshold()
{
    LogLevel saved = Logger::level();

    Logger::set_level(LogLevel::ERROR);
    ASSERT_FALSE(Logger::enabled(LogLevel::WARN));
    ASSERT_TRUE(Logger::enabled(LogLevel::ERROR));
    ASSERT_TRUE(Logger::enabled(LogLevel::FATAL));

    Logger::set_level(LogLevel::TRACE);
    ASSERT_TRUE(Logger::enabled(LogLevel::TRACE));

    Logger::set_level(saved);
}

/**
 * @brief Repeated restarts inside the window fire the task once.
 */
void test_debounce_timer_coalesces()
{
    std::atomic<int> fired{0};
    DebounceTimer timer(std::chrono::milliseconds(60), [&fired] { fired++; });

    for (int i = 0; i < 5; ++i) {
        timer.restart();
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    ASSERT_EQ(fired.load(), 0);
    ASSERT_TRUE(timer.armed());

    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    ASSERT_EQ(fired.load(), 1);
    ASSERT_FALSE(timer.armed());
}

void test_debounce_timer_cancel()
{
    std::atomic<int> fired{0};
    DebounceTimer timer(std::chrono::milliseconds(40), [&fired] { fired++; });

    timer.restart();
    timer.cancel();
    ASSERT_FALSE(timer.armed());

    std::this_thread::sleep_for(std::chrono::milliseconds(150));
    ASSERT_EQ(fired.load(), 0);

    // Still usable after a cancel.
    timer.restart();
    std::this_thread::sleep_for(std::chrono::milliseconds(250));
    ASSERT_EQ(fired.load(), 1);
}

/**
 * @brief Destroying an armed timer joins the worker without running the task.
 */
void test_debounce_timer_destructor_discards()
{
    std::atomic<int> fired{0};
    {
        DebounceTimer timer(std::chrono::milliseconds(500), [&fired] { fired++; });
        timer.restart();
    }
    ASSERT_EQ(fired.load(), 0);
}
