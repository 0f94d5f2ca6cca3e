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
 * @file condition.hpp
 * @brief A single query condition on one field path and its match rules.
 *
 * @details
 * Conditions come from two places: each member of a criteria object
 * (`{"email": "a@x.com", "age": [20, 30]}`) and the operator chosen after
 * `where(path)`. The planner uses them to pick index buckets; afterwards
 * every condition is re-checked against every candidate document.
 *
 * **Match Rules** (record value = the value at `path`):
 * | Operator | record is array | record is primitive |
 * |---|---|---|
 * | Match (scalar) / Equals | contains value | equal |
 * | Match (list) | same length, holds every value | one of the values |
 * | AnyOf | holds any value | one of the values |
 * | AllOf | holds every value | never |
 * | ranges | never | number inside the range |
 * | NotEquals | never | same type, different value |
 * A missing or `null` value never matches.
 */

#pragma once

#include "ember/storage/key.hpp"

#include <cJSON.h>
#include <string>
#include <vector>

namespace ember::query {

/**
 * @enum Operator
 * @brief Comparison carried by a condition.
 */
enum class Operator {
    Match,        ///< Criteria-object member (exact value or exact/IN list).
    Equals,       ///< `where(path).equals(v)`
    AnyOf,        ///< `where(path).any_of([...])`
    AllOf,        ///< `where(path).all_of([...])` (multi-entry fields only)
    Above,        ///< value > bound
    AboveOrEqual, ///< value >= bound
    Below,        ///< value < bound
    BelowOrEqual, ///< value <= bound
    Between,      ///< bound range with configurable inclusivity
    NotEquals     ///< primitive of the same type, different value
};

const char* operator_name(Operator op);

/**
 * @struct Condition
 * @brief One predicate over the value found at `path`.
 */
struct Condition {
    std::string path;
    std::vector<std::string> segments;
    Operator op = Operator::Equals;

    /// @brief Operand values for Match/Equals/AnyOf/AllOf/NotEquals.
    std::vector<storage::Key> values;

    /// @brief Match only: the criterion was an array.
    bool list = false;

    /// @brief Range operands.
    double lower = 0.0;
    double upper = 0.0;
    bool include_lower = true;
    bool include_upper = false;

    /**
     * @brief Builds a condition from one criteria-object member.
     *
     * @throws storage::UsageError (`InvalidQuery`) unless `criterion` is a
     * primitive or an array of primitives.
     */
    static Condition match(const std::string& path, const cJSON* criterion);

    /// @brief Builds a membership condition (Equals, AnyOf, AllOf, NotEquals).
    static Condition membership(const std::string& path, Operator op, std::vector<storage::Key> values);

    /// @brief Builds a numeric range condition.
    static Condition range(const std::string& path, Operator op, double lower, double upper,
                           bool include_lower, bool include_upper);

    /**
     * @brief Evaluates the condition against a document. Never throws.
     */
    bool matches(const cJSON* document) const;

    /// @brief True for the numeric range operators.
    bool is_range() const;

    /// @brief True when the primary map can answer the condition by key lookups.
    bool is_key_lookup() const;

    /// @brief True when `value` (a number) lies inside the range operands.
    bool in_range(double value) const;

    /// @brief Human-readable form, e.g. `age between [20, 30)`.
    std::string describe() const;
};

} // namespace ember::query
