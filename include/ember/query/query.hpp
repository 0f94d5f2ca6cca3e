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
 * @file query.hpp
 * @brief Fluent, lazily executed query plans over one collection.
 *
 * @details
 * A query is built in stages:
 * 1. **Selection:** `Collection::where(criteria)` yields a `Query` directly;
 *    `Collection::where(path)` yields a `WhereClause`, whose operator
 *    (`equals`, `any_of`, `above`, ...) yields the `Query`.
 * 2. **Shaping:** `order_by`, `sort_by`, `reverse`, `offset`, `limit`, `filter`.
 * 3. **Terminal:** `to_array`, `first`, `last`, `count`, `each`, `keys`,
 *    `modify`, `remove`.
 *
 * The plan runs once, on the first terminal, and its result is memoized.
 * Shaping the query again discards the memo.
 *
 * **Execution Pipeline:**
 * 1. **Primary Key:** a key-lookup condition on the primary key reads the
 *    primary map directly.
 * 2. **Index Buckets:** otherwise every condition on an index proposes a
 *    candidate set (bucket, union of buckets, or ordered range of buckets)
 *    and the smallest one wins.
 * 3. **Scan:** with no usable condition the whole collection is the candidate set.
 * 4. **Re-check:** every condition is evaluated on every candidate.
 * 5. **Filter:** predicates run in the order they were added.
 * 6. **Sort:** stable, by the order path.
 * 7. **Paginate:** offset, then limit.
 *
 * @warning A query keeps a reference to its collection and must not outlive it.
 */

#pragma once

#include "ember/query/condition.hpp"
#include "ember/storage/document.hpp"
#include "ember/storage/document_view.hpp"
#include "ember/storage/key.hpp"

#include <cJSON.h>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace ember::storage {
class Collection;
}

namespace ember::query {

enum class SortDirection { Ascending, Descending };

/// @brief Post-selection filter. Receives a copy-on-write view of each candidate.
using Predicate = std::function<bool(const storage::DocumentView&)>;

/**
 * @enum Strategy
 * @brief How the last execution obtained its candidate set.
 */
enum class Strategy { NotExecuted, PrimaryKey, Index, Scan };

const char* strategy_name(Strategy strategy);

/**
 * @struct PlanInfo
 * @brief Diagnostics of the last execution (see `Query::explain`).
 */
struct PlanInfo {
    Strategy strategy = Strategy::NotExecuted;
    std::string path;       ///< Field that drove the lookup (empty for a scan).
    size_t candidates = 0;  ///< Size of the candidate set before re-checking.
    size_t results = 0;     ///< Size of the final result.
};

/**
 * @class Query
 * @brief Executable query plan with memoized results.
 */
class Query {
  public:
    /**
     * @brief Builds a query from a criteria object (implicit AND).
     *
     * Each member maps a dot-notation path to a primitive (exact match) or an
     * array of primitives (IN / exact array). `nullptr` or `{}` selects every
     * document.
     *
     * @throws storage::UsageError `InvalidQuery` for malformed criteria;
     * `UnindexedField` when no member names the primary key or an index.
     */
    Query(storage::Collection& collection, const cJSON* criteria);

    /**
     * @brief Builds a query from a single where-stage condition.
     */
    Query(storage::Collection& collection, Condition condition);

    // ========================================================================
    //  SHAPING
    // ========================================================================

    /// @brief Sorts ascending by `path`.
    Query& order_by(const std::string& path);

    /// @brief Sorts by `path` in the given direction.
    Query& sort_by(const std::string& path, SortDirection direction = SortDirection::Ascending);

    /**
     * @brief Flips the sort direction to descending.
     *
     * @throws storage::UsageError (`InvalidQuery`) if no order path is set.
     */
    Query& reverse();

    Query& limit(size_t count);
    Query& offset(size_t count);

    /// @brief Adds a predicate; predicates run in insertion order after re-checking.
    Query& filter(Predicate predicate);

    // ========================================================================
    //  TERMINALS
    // ========================================================================

    std::vector<storage::DocumentView> to_array();
    std::optional<storage::DocumentView> first();
    std::optional<storage::DocumentView> last();
    size_t count();
    void each(const std::function<void(const storage::DocumentView&)>& callback);

    /// @brief Primary keys of the results, in result order.
    std::vector<storage::Key> keys();

    /**
     * @brief Applies `changes` to every result through `Collection::bulk_update`.
     *
     * Emits one coalesced `update` notification.
     *
     * @return std::vector<storage::Key> Keys actually updated.
     */
    std::vector<storage::Key> modify(const cJSON* changes);

    /**
     * @brief Removes every result through `Collection::bulk_remove`.
     *
     * Emits one coalesced `delete` notification.
     *
     * @return std::vector<storage::Key> Keys actually removed.
     */
    std::vector<storage::Key> remove();

    // ========================================================================
    //  INTROSPECTION
    // ========================================================================

    const std::vector<Condition>& conditions() const { return conditions_; }

    /// @brief True once a terminal has run and the memo is valid.
    bool executed() const { return results_.has_value(); }

    /// @brief Diagnostics of the last execution.
    const PlanInfo& explain() const { return plan_; }

  private:
    /// @brief One memoized result: key plus the document version it matched.
    struct Hit {
        storage::Key key;
        storage::SharedDocument doc;
    };

    void validate_criteria() const;
    void invalidate();
    const std::vector<Hit>& results();
    void execute();

    storage::Collection* collection_;
    std::vector<Condition> conditions_;
    std::vector<Predicate> filters_;
    std::optional<std::string> order_path_;
    SortDirection direction_ = SortDirection::Ascending;
    std::optional<size_t> limit_;
    size_t offset_ = 0;

    std::optional<std::vector<Hit>> results_;
    PlanInfo plan_;
};

/**
 * @class WhereClause
 * @brief The stage between `where(path)` and an executable `Query`.
 *
 * @details
 * Construction fails fast when `path` is neither the primary key nor a
 * declared index, so a typo can never degrade into a silent full scan.
 */
class WhereClause {
  public:
    /**
     * @throws storage::UsageError (`UnindexedField`) for an undeclared path.
     */
    WhereClause(storage::Collection& collection, std::string path);

    Query equals(const storage::Key& value) const;
    Query any_of(std::vector<storage::Key> values) const;

    /**
     * @brief Matches arrays holding every value.
     *
     * @throws storage::UsageError (`InvalidQuery`) unless `path` is a multi-entry index.
     */
    Query all_of(std::vector<storage::Key> values) const;

    Query not_equals(const storage::Key& value) const;

    Query above(double bound) const;
    Query above_or_equal(double bound) const;
    Query below(double bound) const;
    Query below_or_equal(double bound) const;

    /**
     * @brief Matches numbers between `lower` and `upper`.
     *
     * @throws storage::UsageError (`InvalidQuery`) if `lower > upper`.
     */
    Query between(double lower, double upper, bool include_lower = true,
                  bool include_upper = false) const;

    const std::string& path() const { return path_; }

  private:
    storage::Collection* collection_;
    std::string path_;
};

} // namespace ember::query
