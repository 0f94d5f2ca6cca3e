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
 * @file key.hpp
 * @brief Tagged primitive value used for primary keys and index entries.
 *
 * @details
 * A `Key` holds exactly one of: boolean, number (IEEE double, which also
 * carries date-like ordinals), or string. Keys have a total order
 * (booleans < numbers < strings, then by value) so index maps can be kept
 * sorted for range queries, and a hash so the primary map stays O(1).
 */

#pragma once

#include <cJSON.h>
#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <type_traits>
#include <variant>

namespace ember::storage {

/**
 * @class Key
 * @brief Immutable primitive value with total ordering and hashing.
 *
 * @details
 * Implicit construction from `bool`, any arithmetic type, and strings keeps
 * call sites short: `users.get(42)`, `users.get("alice")`.
 */
class Key {
  public:
    /// @brief Discriminator; its order defines the cross-type ordering.
    enum class Type { Boolean = 0, Number = 1, String = 2 };

    Key(bool value) : value_(value) {}
    Key(const char* value) : value_(std::string(value)) {}
    Key(std::string value) : value_(std::move(value)) {}

    // A pointer would otherwise decay silently to `bool`.
    Key(const cJSON*) = delete;
    Key(cJSON*) = delete;

    template <typename T,
              typename = std::enable_if_t<std::is_arithmetic_v<T> && !std::is_same_v<T, bool>>>
    Key(T value) : value_(static_cast<double>(value))
    {
    }

    /**
     * @brief Converts a JSON node into a key.
     *
     * @param item The node to inspect (may be `nullptr`).
     * @return std::optional<Key> The key, or `std::nullopt` when the node is
     * missing, `null`, an object, an array, or a non-finite number.
     */
    static std::optional<Key> from_json(const cJSON* item);

    /**
     * @brief Creates a detached JSON node holding this value.
     *
     * @warning The caller owns the returned node.
     */
    cJSON* to_json() const;

    Type type() const { return static_cast<Type>(value_.index()); }
    bool is_bool() const { return type() == Type::Boolean; }
    bool is_number() const { return type() == Type::Number; }
    bool is_string() const { return type() == Type::String; }

    bool as_bool() const { return std::get<bool>(value_); }
    double as_number() const { return std::get<double>(value_); }
    const std::string& as_string() const { return std::get<std::string>(value_); }

    /// @brief Display form: strings unquoted, integral numbers without a fraction.
    std::string to_string() const;

    /**
     * @brief True when `item` is a primitive JSON node equal to this key.
     */
    bool equals_json(const cJSON* item) const;

    friend bool operator==(const Key& a, const Key& b) { return a.value_ == b.value_; }
    friend bool operator!=(const Key& a, const Key& b) { return !(a == b); }
    friend bool operator<(const Key& a, const Key& b) { return a.value_ < b.value_; }
    friend bool operator>(const Key& a, const Key& b) { return b < a; }
    friend bool operator<=(const Key& a, const Key& b) { return !(b < a); }
    friend bool operator>=(const Key& a, const Key& b) { return !(a < b); }

    size_t hash() const;

  private:
    std::variant<bool, double, std::string> value_;
};

/// @brief Hash functor for unordered containers keyed by `Key`.
struct KeyHash {
    size_t operator()(const Key& key) const { return key.hash(); }
};

std::ostream& operator<<(std::ostream& os, const Key& key);

} // namespace ember::storage
