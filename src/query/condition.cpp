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
 * @file condition.cpp
 * @brief Implementation of condition construction and matching.
 */

#include "ember/query/condition.hpp"

#include "ember/storage/document.hpp"
#include "ember/storage/error.hpp"

#include <algorithm>
#include <utility>

namespace ember::query {

namespace {

bool array_contains(const cJSON* array, const storage::Key& value)
{
    const cJSON* element = nullptr;
    cJSON_ArrayForEach(element, array)
    {
        if (value.equals_json(element)) {
            return true;
        }
    }
    return false;
}

bool value_in(const std::vector<storage::Key>& values, const cJSON* item)
{
    auto key = storage::Key::from_json(item);
    if (!key) {
        return false;
    }
    return std::find(values.begin(), values.end(), *key) != values.end();
}

/// Scalar equality, or containment when the record holds an array.
bool equals_value(const cJSON* item, const storage::Key& value)
{
    if (cJSON_IsArray(item)) {
        return array_contains(item, value);
    }
    return value.equals_json(item);
}

std::string join_values(const std::vector<storage::Key>& values)
{
    std::string out = "[";
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += values[i].to_string();
    }
    return out + "]";
}

} // namespace

const char* operator_name(Operator op)
{
    switch (op) {
    case Operator::Match:
        return "match";
    case Operator::Equals:
        return "equals";
    case Operator::AnyOf:
        return "anyOf";
    case Operator::AllOf:
        return "allOf";
    case Operator::Above:
        return "above";
    case Operator::AboveOrEqual:
        return "aboveOrEqual";
    case Operator::Below:
        return "below";
    case Operator::BelowOrEqual:
        return "belowOrEqual";
    case Operator::Between:
        return "between";
    case Operator::NotEquals:
        return "notEquals";
    }
    return "unknown";
}

Condition Condition::match(const std::string& path, const cJSON* criterion)
{
    Condition condition;
    condition.path = path;
    condition.segments = storage::split_path(path);
    condition.op = Operator::Match;

    if (cJSON_IsArray(criterion)) {
        condition.list = true;
        const cJSON* element = nullptr;
        cJSON_ArrayForEach(element, criterion)
        {
            auto key = storage::Key::from_json(element);
            if (!key) {
                throw storage::UsageError(storage::ErrorCode::InvalidQuery,
                                          "criterion '" + path + "' may only list primitive values");
            }
            condition.values.push_back(std::move(*key));
        }
        return condition;
    }

    auto key = storage::Key::from_json(criterion);
    if (!key) {
        throw storage::UsageError(storage::ErrorCode::InvalidQuery,
                                  "criterion '" + path + "' must be a primitive or an array of primitives");
    }
    condition.values.push_back(std::move(*key));
    return condition;
}

Condition Condition::membership(const std::string& path, Operator op, std::vector<storage::Key> values)
{
    Condition condition;
    condition.path = path;
    condition.segments = storage::split_path(path);
    condition.op = op;
    condition.values = std::move(values);
    return condition;
}

Condition Condition::range(const std::string& path, Operator op, double lower, double upper,
                           bool include_lower, bool include_upper)
{
    Condition condition;
    condition.path = path;
    condition.segments = storage::split_path(path);
    condition.op = op;
    condition.lower = lower;
    condition.upper = upper;
    condition.include_lower = include_lower;
    condition.include_upper = include_upper;
    return condition;
}

bool Condition::is_range() const
{
    switch (op) {
    case Operator::Above:
    case Operator::AboveOrEqual:
    case Operator::Below:
    case Operator::BelowOrEqual:
    case Operator::Between:
        return true;
    default:
        return false;
    }
}

bool Condition::is_key_lookup() const
{
    return op == Operator::Match || op == Operator::Equals || op == Operator::AnyOf;
}

bool Condition::in_range(double value) const
{
    switch (op) {
    case Operator::Above:
        return value > lower;
    case Operator::AboveOrEqual:
        return value >= lower;
    case Operator::Below:
        return value < upper;
    case Operator::BelowOrEqual:
        return value <= upper;
    case Operator::Between:
        return (include_lower ? value >= lower : value > lower) &&
               (include_upper ? value <= upper : value < upper);
    default:
        return false;
    }
}

bool Condition::matches(const cJSON* document) const
{
    const cJSON* item = storage::resolve_path(document, segments);
    if (storage::is_absent(item)) {
        return false;
    }

    switch (op) {
    case Operator::Match:
        if (!list) {
            return !values.empty() && equals_value(item, values.front());
        }
        if (cJSON_IsArray(item)) {
            if (static_cast<size_t>(cJSON_GetArraySize(item)) != values.size()) {
                return false;
            }
            return std::all_of(values.begin(), values.end(),
                               [item](const storage::Key& v) { return array_contains(item, v); });
        }
        return value_in(values, item);

    case Operator::Equals:
        return !values.empty() && equals_value(item, values.front());

    case Operator::AnyOf:
        if (cJSON_IsArray(item)) {
            return std::any_of(values.begin(), values.end(),
                               [item](const storage::Key& v) { return array_contains(item, v); });
        }
        return value_in(values, item);

    case Operator::AllOf:
        if (!cJSON_IsArray(item)) {
            return false;
        }
        return std::all_of(values.begin(), values.end(),
                           [item](const storage::Key& v) { return array_contains(item, v); });

    case Operator::NotEquals: {
        auto key = storage::Key::from_json(item);
        return key && !values.empty() && key->type() == values.front().type() &&
               *key != values.front();
    }

    case Operator::Above:
    case Operator::AboveOrEqual:
    case Operator::Below:
    case Operator::BelowOrEqual:
    case Operator::Between:
        return cJSON_IsNumber(item) && in_range(item->valuedouble);
    }
    return false;
}

std::string Condition::describe() const
{
    switch (op) {
    case Operator::Match:
    case Operator::Equals:
    case Operator::NotEquals:
        if (list || values.size() != 1) {
            return path + " " + operator_name(op) + " " + join_values(values);
        }
        return path + " " + operator_name(op) + " " + values.front().to_string();
    case Operator::AnyOf:
    case Operator::AllOf:
        return path + " " + operator_name(op) + " " + join_values(values);
    case Operator::Above:
    case Operator::AboveOrEqual:
        return path + " " + operator_name(op) + " " + storage::Key(lower).to_string();
    case Operator::Below:
    case Operator::BelowOrEqual:
        return path + " " + operator_name(op) + " " + storage::Key(upper).to_string();
    case Operator::Between:
        return path + " between " + (include_lower ? "[" : "(") + storage::Key(lower).to_string() +
               ", " + storage::Key(upper).to_string() + (include_upper ? "]" : ")");
    }
    return path;
}

} // namespace ember::query
