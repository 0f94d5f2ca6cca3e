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
 * @file document.hpp
 * @brief Ownership helpers and the dot-path interpreter for cJSON documents.
 *
 * @details
 * Documents are plain cJSON object trees. This header provides:
 * 1. **Ownership**: `Document` (unique) and `SharedDocument` (shared, read-only)
 *    smart pointers that release trees with `cJSON_Delete`.
 * 2. **Path Resolution**: a small interpreter for dot-notation paths
 *    (`"stats.score"`, `"tags.0"`) used by indexes, criteria and sorting.
 * 3. **Classification**: primitive/container predicates shared by the
 *    collection and the query engine.
 */

#pragma once

#include <cJSON.h>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace ember::storage {

/**
 * @struct JsonDeleter
 * @brief Releases a cJSON tree. Safe to call with `nullptr`.
 */
struct JsonDeleter {
    void operator()(cJSON* item) const { cJSON_Delete(item); }
};

/// @brief Exclusively owned, mutable document tree.
using Document = std::unique_ptr<cJSON, JsonDeleter>;

/// @brief Shared, immutable document tree as stored by a collection.
using SharedDocument = std::shared_ptr<const cJSON>;

/**
 * @brief Parses JSON text into an owned document.
 *
 * @param text The JSON source.
 * @return Document The parsed tree, or an empty pointer on a syntax error.
 */
Document parse(std::string_view text);

/**
 * @brief Deep-copies a node into an owned document.
 */
Document clone(const cJSON* item);

/**
 * @brief Deep-copies a node into shared, read-only storage.
 */
SharedDocument share(const cJSON* item);

/**
 * @brief Serializes a node without whitespace. Returns `"null"` for `nullptr`.
 */
std::string dump(const cJSON* item);

/**
 * @brief Splits a dot-notation path into its segments.
 */
std::vector<std::string> split_path(const std::string& path);

/**
 * @brief Resolves a dot-notation path against a document.
 *
 * Each segment selects an object member by name; on arrays a segment made of
 * digits selects an element by position. An empty path returns `root`.
 *
 * @param root The document (may be `nullptr`).
 * @param path The dot-notation path.
 * @return const cJSON* The node at the path, or `nullptr` if any segment is missing.
 */
const cJSON* resolve_path(const cJSON* root, const std::string& path);

/// @brief As above, with a pre-split path.
const cJSON* resolve_path(const cJSON* root, const std::vector<std::string>& segments);

/// @brief True for strings, numbers and booleans.
bool is_primitive(const cJSON* item);

/// @brief True for objects and arrays.
bool is_container(const cJSON* item);

/// @brief True when the node is missing or JSON `null`.
bool is_absent(const cJSON* item);

} // namespace ember::storage
