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
 * @file schema.hpp
 * @brief Static per-collection configuration: primary key and index paths.
 *
 * @details
 * A schema is consumed once, when its collection is constructed, and never
 * changes afterwards. Adding an index later means building a new collection.
 */

#pragma once

#include <cJSON.h>
#include <string>
#include <vector>

namespace ember::storage {

/**
 * @struct Schema
 * @brief Primary-key path plus secondary and multi-entry index paths.
 *
 * @details
 * All paths use dot notation for nested fields (e.g., `"address.city"`).
 * A multi-entry path indexes each element of an array value separately.
 */
struct Schema {
    std::string primary_key;
    std::vector<std::string> indexes;
    std::vector<std::string> multi_entry;

    /**
     * @brief Parses a schema definition.
     *
     * Expected shape:
     * @code
     * { "primaryKey": "id", "indexes": ["email", "address.city"], "multiEntry": ["tags"] }
     * @endcode
     *
     * @throws UsageError (`InvalidSchema`) on a missing primary key or a
     * non-string path.
     */
    static Schema from_json(const cJSON* definition);

    /**
     * @brief Checks the schema invariants.
     *
     * Rejects an empty primary key, empty path segments, surrounding
     * whitespace, duplicate paths, and the primary key reused as an index.
     *
     * @throws UsageError (`InvalidSchema`) on the first violation.
     */
    void validate() const;

    /// @brief True when `path` is a secondary or multi-entry index.
    bool is_indexed(const std::string& path) const;

    /// @brief True when `path` is a multi-entry index.
    bool is_multi_entry(const std::string& path) const;

    /// @brief Secondary then multi-entry paths, in declaration order.
    std::vector<std::string> all_indexes() const;
};

} // namespace ember::storage
