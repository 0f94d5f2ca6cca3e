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
 * @file key.cpp
 * @brief Implementation of the primitive key type.
 */

#include "ember/storage/key.hpp"

#include <cmath>
#include <functional>
#include <sstream>

namespace ember::storage {

std::optional<Key> Key::from_json(const cJSON* item)
{
    if (item == nullptr) {
        return std::nullopt;
    }
    if (cJSON_IsBool(item)) {
        return Key(cJSON_IsTrue(item) != 0);
    }
    if (cJSON_IsNumber(item)) {
        // NaN and infinities have no place in a strict weak order.
        if (!std::isfinite(item->valuedouble)) {
            return std::nullopt;
        }
        return Key(item->valuedouble);
    }
    if (cJSON_IsString(item) && item->valuestring != nullptr) {
        return Key(std::string(item->valuestring));
    }
    return std::nullopt;
}

cJSON* Key::to_json() const
{
    switch (type()) {
    case Type::Boolean:
        return cJSON_CreateBool(as_bool() ? 1 : 0);
    case Type::Number:
        return cJSON_CreateNumber(as_number());
    case Type::String:
        return cJSON_CreateString(as_string().c_str());
    }
    return cJSON_CreateNull();
}

bool Key::equals_json(const cJSON* item) const
{
    auto other = from_json(item);
    return other && *other == *this;
}

std::string Key::to_string() const
{
    switch (type()) {
    case Type::Boolean:
        return as_bool() ? "true" : "false";
    case Type::Number: {
        double n = as_number();
        double integral = 0.0;
        if (std::modf(n, &integral) == 0.0 && std::fabs(n) < 1e15) {
            return std::to_string(static_cast<long long>(n));
        }
        std::ostringstream ss;
        ss << n;
        return ss.str();
    }
    case Type::String:
        return as_string();
    }
    return "";
}

size_t Key::hash() const
{
    size_t seed = static_cast<size_t>(value_.index());
    size_t h = 0;
    switch (type()) {
    case Type::Boolean:
        h = std::hash<bool>{}(as_bool());
        break;
    case Type::Number:
        // +0.0 and -0.0 compare equal, so they must hash equal.
        h = as_number() == 0.0 ? 0 : std::hash<double>{}(as_number());
        break;
    case Type::String:
        h = std::hash<std::string>{}(as_string());
        break;
    }
    return h ^ (seed + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2));
}

std::ostream& operator<<(std::ostream& os, const Key& key)
{
    if (key.is_string()) {
        return os << '"' << key.as_string() << '"';
    }
    return os << key.to_string();
}

} // namespace ember::storage
