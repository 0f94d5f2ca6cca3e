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
 * @file schema.cpp
 * @brief Schema parsing and validation.
 */

#include "ember/storage/schema.hpp"

#include "ember/infra/string.hpp"
#include "ember/storage/error.hpp"

#include <algorithm>
#include <unordered_set>

namespace ember::storage {

namespace {

std::vector<std::string> read_paths(const cJSON* definition, const char* field)
{
    std::vector<std::string> paths;
    const cJSON* list = cJSON_GetObjectItemCaseSensitive(definition, field);
    if (list == nullptr || cJSON_IsNull(list)) {
        return paths;
    }
    if (!cJSON_IsArray(list)) {
        throw UsageError(ErrorCode::InvalidSchema, std::string("'") + field + "' must be an array");
    }

    const cJSON* item = nullptr;
    cJSON_ArrayForEach(item, list)
    {
        if (!cJSON_IsString(item) || item->valuestring == nullptr) {
            throw UsageError(ErrorCode::InvalidSchema,
                             std::string("'") + field + "' must only contain strings");
        }
        paths.emplace_back(item->valuestring);
    }
    return paths;
}

void check_path(const std::string& path)
{
    if (path.empty()) {
        throw UsageError(ErrorCode::InvalidSchema, "empty field path");
    }
    if (infra::String::trim(path) != path) {
        throw UsageError(ErrorCode::InvalidSchema, "field path '" + path + "' has surrounding whitespace");
    }
    for (const auto& segment : infra::String::split(path, '.')) {
        if (segment.empty()) {
            throw UsageError(ErrorCode::InvalidSchema, "field path '" + path + "' has an empty segment");
        }
    }
}

} // namespace

Schema Schema::from_json(const cJSON* definition)
{
    if (!cJSON_IsObject(definition)) {
        throw UsageError(ErrorCode::InvalidSchema, "schema definition must be an object");
    }

    const cJSON* pk = cJSON_GetObjectItemCaseSensitive(definition, "primaryKey");
    if (!cJSON_IsString(pk) || pk->valuestring == nullptr) {
        throw UsageError(ErrorCode::InvalidSchema, "'primaryKey' must be a string");
    }

    Schema schema;
    schema.primary_key = pk->valuestring;
    schema.indexes = read_paths(definition, "indexes");
    schema.multi_entry = read_paths(definition, "multiEntry");
    schema.validate();
    return schema;
}

void Schema::validate() const
{
    check_path(primary_key);

    std::unordered_set<std::string> seen;
    for (const auto& path : all_indexes()) {
        check_path(path);
        if (path == primary_key) {
            throw UsageError(ErrorCode::InvalidSchema,
                             "primary key '" + path + "' cannot also be an index");
        }
        if (!seen.insert(path).second) {
            throw UsageError(ErrorCode::InvalidSchema, "index '" + path + "' is declared twice");
        }
    }
}

bool Schema::is_indexed(const std::string& path) const
{
    return std::find(indexes.begin(), indexes.end(), path) != indexes.end() || is_multi_entry(path);
}

bool Schema::is_multi_entry(const std::string& path) const
{
    return std::find(multi_entry.begin(), multi_entry.end(), path) != multi_entry.end();
}

std::vector<std::string> Schema::all_indexes() const
{
    std::vector<std::string> all(indexes);
    all.insert(all.end(), multi_entry.begin(), multi_entry.end());
    return all;
}

} // namespace ember::storage
