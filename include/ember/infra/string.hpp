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
 * @file string.hpp
 * @brief Supplementary string manipulation primitives.
 *
 * @details
 * This header defines the `String` utility class. Its main client is the
 * dot-path interpreter that resolves nested document fields such as
 * `"stats.score"` or `"address.city"`.
 */

#pragma once

#include <string>
#include <vector>

namespace ember::infra {

/**
 * @class String
 * @brief A static container for text processing algorithms.
 */
class String {
  public:
    /**
     * @brief Splits a string on every occurrence of a delimiter.
     *
     * Empty segments are preserved, so `"a..b"` yields `{"a", "", "b"}` and
     * callers can reject malformed paths. An empty input yields a single
     * empty segment.
     *
     * @param s The source string.
     * @param delimiter The separator character.
     * @return std::vector<std::string> The segments in order.
     *
     * @code
     * auto parts = ember::infra::String::split("stats.score", '.'); // {"stats", "score"}
     * @endcode
     */
    static std::vector<std::string> split(const std::string& s, char delimiter);

    /**
     * @brief Joins segments with a delimiter (inverse of `split`).
     */
    static std::string join(const std::vector<std::string>& parts, char delimiter);

    /**
     * @brief Trims leading and trailing whitespace from a string.
     *
     * @param s The source string to process.
     * @return std::string The trimmed content; empty if `s` is all whitespace.
     */
    static std::string trim(const std::string& s);
};

} // namespace ember::infra
