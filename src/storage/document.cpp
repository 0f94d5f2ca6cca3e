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
 * @file document.cpp
 * @brief Implementation of the document ownership and path helpers.
 */

#include "ember/storage/document.hpp"

#include "ember/infra/string.hpp"

#include <cctype>
#include <cstdlib>

namespace ember::storage {

namespace {

bool is_index_segment(const std::string& segment)
{
    if (segment.empty()) {
        return false;
    }
    for (char c : segment) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

} // namespace

Document parse(std::string_view text)
{
    return Document(cJSON_ParseWithLength(text.data(), text.size()));
}

Document clone(const cJSON* item)
{
    if (item == nullptr) {
        return Document();
    }
    return Document(cJSON_Duplicate(item, 1));
}

SharedDocument share(const cJSON* item)
{
    return SharedDocument(clone(item).release(), JsonDeleter());
}

std::string dump(const cJSON* item)
{
    if (item == nullptr) {
        return "null";
    }
    char* raw = cJSON_PrintUnformatted(item);
    if (raw == nullptr) {
        return "null";
    }
    std::string out(raw);
    cJSON_free(raw);
    return out;
}

std::vector<std::string> split_path(const std::string& path)
{
    if (path.empty()) {
        return {};
    }
    return infra::String::split(path, '.');
}

const cJSON* resolve_path(const cJSON* root, const std::string& path)
{
    return resolve_path(root, split_path(path));
}

const cJSON* resolve_path(const cJSON* root, const std::vector<std::string>& segments)
{
    const cJSON* current = root;
    for (const auto& segment : segments) {
        if (current == nullptr) {
            return nullptr;
        }
        if (cJSON_IsObject(current)) {
            current = cJSON_GetObjectItemCaseSensitive(current, segment.c_str());
        } else if (cJSON_IsArray(current) && is_index_segment(segment)) {
            current = cJSON_GetArrayItem(current, std::atoi(segment.c_str()));
        } else {
            return nullptr;
        }
    }
    return current;
}

bool is_primitive(const cJSON* item)
{
    return item != nullptr && (cJSON_IsString(item) || cJSON_IsNumber(item) || cJSON_IsBool(item));
}

bool is_container(const cJSON* item)
{
    return item != nullptr && (cJSON_IsObject(item) || cJSON_IsArray(item));
}

bool is_absent(const cJSON* item)
{
    return item == nullptr || cJSON_IsNull(item);
}

} // namespace ember::storage
