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
 * @file helpers.hpp
 * @brief Fixtures shared by the EmberDB test translation units.
 */

#pragma once

#include "ember/storage/document.hpp"
#include "ember/storage/error.hpp"
#include "ember/storage/key.hpp"

#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace ember::storage {

/// @brief Lets `ASSERT_EQ` print key lists.
inline std::ostream& operator<<(std::ostream& os, const std::vector<Key>& keys)
{
    os << '[';
    for (size_t i = 0; i < keys.size(); ++i) {
        os << (i > 0 ? ", " : "") << keys[i];
    }
    return os << ']';
}

} // namespace ember::storage

namespace ember::test {

/**
 * @brief Parses a JSON literal, failing loudly on a typo in the fixture.
 */
inline storage::Document json(const char* text)
{
    storage::Document doc = storage::parse(text);
    if (!doc) {
        throw std::invalid_argument(std::string("bad JSON fixture: ") + text);
    }
    return doc;
}

/**
 * @brief Runs `func` and returns the code of the `UsageError` it threw, if any.
 */
template <typename F> std::optional<storage::ErrorCode> error_code_of(F&& func)
{
    try {
        func();
    } catch (const storage::UsageError& e) {
        return e.code();
    }
    return std::nullopt;
}

} // namespace ember::test
