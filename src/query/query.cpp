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
 * @file query.cpp
 * @brief Implementation of the query planner and executor.
 *
 * @details
 * Execution runs once, on the first terminal call, in fixed stages:
 * 1. **Candidate selection**: primary-key lookups if a key-lookup condition
 *    names the primary key; otherwise the smallest candidate set any index
 *    condition yields; otherwise a full scan.
 * 2. **Re-check**: every condition is evaluated against every candidate.
 * 3. **Filters**: predicates run in insertion order on read-only views.
 * 4. **Sort**: stable, on the order path, missing values last.
 * 5. **Pagination**: offset, then limit.
 *
 * The result is memoized until a modifier changes the plan.
 */

#include "ember/query/query.hpp"

#include "ember/infra/logger.hpp"
#include "ember/storage/collection.hpp"
#include "ember/storage/error.hpp"

#include <algorithm>
#include <cstdint>
#include <iterator>
#include <limits>
#include <map>
#include <mutex>
#include <numeric>

namespace ember::query {

using storage::ErrorCode;
using storage::Key;
using storage::RecordPtr;
using storage::UsageError;

namespace {

/// @brief Candidate records ordered by insertion sequence (deduplicated).
using CandidateSet = std::map<std::uint64_t, RecordPtr>;

template <typename BucketT>
void add_bucket(CandidateSet& set, const BucketT& bucket)
{
    for (const auto& [key, record] : bucket) {
        set.emplace(record->sequence, record);
    }
}

} // namespace

const char* strategy_name(Strategy strategy)
{
    switch (strategy) {
    case Strategy::NotExecuted:
        return "not-executed";
    case Strategy::PrimaryKey:
        return "primary-key";
    case Strategy::Index:
        return "index";
    case Strategy::Scan:
        return "scan";
    }
    return "unknown";
}

// ============================================================================
//  CONSTRUCTION
// ============================================================================

Query::Query(storage::Collection& collection, const cJSON* criteria) : collection_(&collection)
{
    if (criteria == nullptr) {
        return;
    }
    if (!cJSON_IsObject(criteria)) {
        throw UsageError(ErrorCode::InvalidQuery, "criteria must be a JSON object");
    }

    const cJSON* member = nullptr;
    cJSON_ArrayForEach(member, criteria)
    {
        conditions_.push_back(Condition::match(member->string, member));
    }
    validate_criteria();
}

Query::Query(storage::Collection& collection, Condition condition) : collection_(&collection)
{
    conditions_.push_back(std::move(condition));
}

/**
 * @brief Rejects criteria that no index can serve.
 *
 * At least one member must name the primary key or an index; the others are
 * re-checked per candidate.
 */
void Query::validate_criteria() const
{
    if (conditions_.empty()) {
        return;
    }
    const storage::Schema& schema = collection_->schema();
    for (const auto& condition : conditions_) {
        if (condition.path == schema.primary_key || schema.is_indexed(condition.path)) {
            return;
        }
    }
    throw UsageError(ErrorCode::UnindexedField,
                     "criteria on '" + collection_->name() +
                         "' must name the primary key or an indexed field (first field: '" +
                         conditions_.front().path + "')");
}

// ============================================================================
//  SHAPING
// ============================================================================

Query& Query::order_by(const std::string& path)
{
    return sort_by(path, SortDirection::Ascending);
}

Query& Query::sort_by(const std::string& path, SortDirection direction)
{
    order_path_ = path;
    direction_ = direction;
    invalidate();
    return *this;
}

Query& Query::reverse()
{
    if (!order_path_) {
        throw UsageError(ErrorCode::InvalidQuery, "reverse() requires order_by() or sort_by() first");
    }
    direction_ = SortDirection::Descending;
    invalidate();
    return *this;
}

Query& Query::limit(size_t count)
{
    limit_ = count;
    invalidate();
    return *this;
}

Query& Query::offset(size_t count)
{
    offset_ = count;
    invalidate();
    return *this;
}

Query& Query::filter(Predicate predicate)
{
    filters_.push_back(std::move(predicate));
    invalidate();
    return *this;
}

void Query::invalidate()
{
    results_.reset();
    plan_ = PlanInfo{};
}

// ============================================================================
//  EXECUTION
// ============================================================================

const std::vector<Query::Hit>& Query::results()
{
    if (!results_) {
        execute();
    }
    return *results_;
}

void Query::execute()
{
    const storage::Collection& collection = *collection_;
    std::unique_lock lock(collection.mutex_);
    const std::string& primary_key = collection.schema_.primary_key;

    PlanInfo plan;
    std::optional<CandidateSet> selected;

    // Tier 1: direct primary-key lookups.
    for (const auto& condition : conditions_) {
        if (condition.path != primary_key || !condition.is_key_lookup()) {
            continue;
        }
        CandidateSet set;
        for (const auto& value : condition.values) {
            auto it = collection.primary_.find(value);
            if (it != collection.primary_.end()) {
                set.emplace(it->second->sequence, it->second);
            }
        }
        selected = std::move(set);
        plan.strategy = Strategy::PrimaryKey;
        plan.path = primary_key;
        break;
    }

    // Tier 2: the smallest candidate set any index condition can produce.
    if (!selected) {
        for (const auto& condition : conditions_) {
            const auto* index = collection.find_index(condition.path);
            if (index == nullptr) {
                continue;
            }
            const auto& map = index->map;

            std::optional<CandidateSet> set;
            switch (condition.op) {
            case Operator::Match:
            case Operator::Equals:
            case Operator::AnyOf: {
                if (condition.op == Operator::Match && condition.list && condition.values.empty()) {
                    break;
                }
                set.emplace();
                for (const auto& value : condition.values) {
                    auto bucket = map.find(value);
                    if (bucket != map.end()) {
                        add_bucket(*set, bucket->second);
                    }
                }
                break;
            }
            case Operator::AllOf: {
                if (condition.values.empty()) {
                    break;
                }
                // Every match sits in every value's bucket; the smallest one suffices.
                const decltype(map.begin()->second)* smallest = nullptr;
                bool missing = false;
                for (const auto& value : condition.values) {
                    auto bucket = map.find(value);
                    if (bucket == map.end()) {
                        missing = true;
                        break;
                    }
                    if (smallest == nullptr || bucket->second.size() < smallest->size()) {
                        smallest = &bucket->second;
                    }
                }
                set.emplace();
                if (!missing && smallest != nullptr) {
                    add_bucket(*set, *smallest);
                }
                break;
            }
            case Operator::Above:
            case Operator::AboveOrEqual:
            case Operator::Below:
            case Operator::BelowOrEqual:
            case Operator::Between: {
                const double infinity = std::numeric_limits<double>::infinity();
                const bool bounded_below = condition.op == Operator::Above ||
                                           condition.op == Operator::AboveOrEqual ||
                                           condition.op == Operator::Between;
                const bool bounded_above = condition.op == Operator::Below ||
                                           condition.op == Operator::BelowOrEqual ||
                                           condition.op == Operator::Between;
                const Key low(bounded_below ? condition.lower : -infinity);
                const Key high(bounded_above ? condition.upper : infinity);

                set.emplace();
                for (auto it = map.lower_bound(low); it != map.end(); ++it) {
                    if (!it->first.is_number() || high < it->first) {
                        break;
                    }
                    if (condition.in_range(it->first.as_number())) {
                        add_bucket(*set, it->second);
                    }
                }
                break;
            }
            case Operator::NotEquals:
                break;
            }

            if (set && (!selected || set->size() < selected->size())) {
                selected = std::move(set);
                plan.strategy = Strategy::Index;
                plan.path = condition.path;
            }
        }
    }

    std::vector<RecordPtr> candidates;
    if (selected) {
        candidates.reserve(selected->size());
        for (auto& [sequence, record] : *selected) {
            candidates.push_back(std::move(record));
        }
    } else {
        plan.strategy = Strategy::Scan;
        candidates.reserve(collection.order_.size());
        for (const auto& [sequence, record] : collection.order_) {
            candidates.push_back(record);
        }
    }
    plan.candidates = candidates.size();

    // Re-check and filter.
    std::vector<Hit> hits;
    for (const auto& record : candidates) {
        const cJSON* document = record->doc.get();
        bool accepted = std::all_of(conditions_.begin(), conditions_.end(),
                                    [document](const Condition& c) { return c.matches(document); });
        if (accepted && !filters_.empty()) {
            storage::DocumentView view(record->doc);
            for (const auto& predicate : filters_) {
                if (!predicate(view)) {
                    accepted = false;
                    break;
                }
            }
        }
        if (accepted) {
            hits.push_back(Hit{record->key, record->doc});
        }
    }

    // Sort.
    if (order_path_) {
        const auto segments = storage::split_path(*order_path_);
        std::vector<std::optional<Key>> sort_keys;
        sort_keys.reserve(hits.size());
        for (const auto& hit : hits) {
            sort_keys.push_back(Key::from_json(storage::resolve_path(hit.doc.get(), segments)));
        }

        std::vector<size_t> order(hits.size());
        std::iota(order.begin(), order.end(), 0);
        const bool descending = direction_ == SortDirection::Descending;
        std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
            const auto& ka = sort_keys[a];
            const auto& kb = sort_keys[b];
            if (!ka || !kb) {
                return ka.has_value() && !kb.has_value();
            }
            return descending ? *kb < *ka : *ka < *kb;
        });

        std::vector<Hit> sorted;
        sorted.reserve(hits.size());
        for (size_t i : order) {
            sorted.push_back(std::move(hits[i]));
        }
        hits = std::move(sorted);
    }

    // Paginate.
    const size_t begin = std::min(offset_, hits.size());
    size_t end = hits.size();
    if (limit_ && end - begin > *limit_) {
        end = begin + *limit_;
    }
    std::vector<Hit> page(std::make_move_iterator(hits.begin() + begin),
                          std::make_move_iterator(hits.begin() + end));

    plan.results = page.size();
    if (infra::Logger::enabled(infra::LogLevel::TRACE)) {
        infra::Logger::log(infra::LogLevel::TRACE,
                           "Query: '" + collection.name() + "' via " + strategy_name(plan.strategy) +
                               (plan.path.empty() ? std::string() : " on '" + plan.path + "'") +
                               ", " + std::to_string(plan.candidates) + " candidate(s), " +
                               std::to_string(plan.results) + " result(s).");
    }

    plan_ = std::move(plan);
    results_ = std::move(page);
}

// ============================================================================
//  TERMINALS
// ============================================================================

std::vector<storage::DocumentView> Query::to_array()
{
    const auto& hits = results();
    std::vector<storage::DocumentView> views;
    views.reserve(hits.size());
    for (const auto& hit : hits) {
        views.emplace_back(hit.doc);
    }
    return views;
}

std::optional<storage::DocumentView> Query::first()
{
    const auto& hits = results();
    if (hits.empty()) {
        return std::nullopt;
    }
    return storage::DocumentView(hits.front().doc);
}

std::optional<storage::DocumentView> Query::last()
{
    const auto& hits = results();
    if (hits.empty()) {
        return std::nullopt;
    }
    return storage::DocumentView(hits.back().doc);
}

size_t Query::count()
{
    return results().size();
}

void Query::each(const std::function<void(const storage::DocumentView&)>& callback)
{
    for (const auto& view : to_array()) {
        callback(view);
    }
}

std::vector<Key> Query::keys()
{
    const auto& hits = results();
    std::vector<Key> result;
    result.reserve(hits.size());
    for (const auto& hit : hits) {
        result.push_back(hit.key);
    }
    return result;
}

std::vector<Key> Query::modify(const cJSON* changes)
{
    return collection_->bulk_update(keys(), changes);
}

std::vector<Key> Query::remove()
{
    std::vector<Key> removed;
    for (auto& result : collection_->bulk_remove(keys())) {
        if (result) {
            removed.push_back(std::move(*result));
        }
    }
    return removed;
}

// ============================================================================
//  WHERE CLAUSE
// ============================================================================

WhereClause::WhereClause(storage::Collection& collection, std::string path)
    : collection_(&collection), path_(std::move(path))
{
    const storage::Schema& schema = collection.schema();
    if (path_ != schema.primary_key && !schema.is_indexed(path_)) {
        throw UsageError(ErrorCode::UnindexedField,
                         "'" + path_ + "' is neither the primary key nor an index of '" +
                             collection.name() + "'");
    }
}

Query WhereClause::equals(const Key& value) const
{
    return Query(*collection_, Condition::membership(path_, Operator::Equals, {value}));
}

Query WhereClause::any_of(std::vector<Key> values) const
{
    return Query(*collection_, Condition::membership(path_, Operator::AnyOf, std::move(values)));
}

Query WhereClause::all_of(std::vector<Key> values) const
{
    if (!collection_->schema().is_multi_entry(path_)) {
        throw UsageError(ErrorCode::InvalidQuery,
                         "all_of() requires a multi-entry index; '" + path_ + "' is not one");
    }
    return Query(*collection_, Condition::membership(path_, Operator::AllOf, std::move(values)));
}

Query WhereClause::not_equals(const Key& value) const
{
    return Query(*collection_, Condition::membership(path_, Operator::NotEquals, {value}));
}

Query WhereClause::above(double bound) const
{
    return Query(*collection_, Condition::range(path_, Operator::Above, bound, 0.0, false, false));
}

Query WhereClause::above_or_equal(double bound) const
{
    return Query(*collection_, Condition::range(path_, Operator::AboveOrEqual, bound, 0.0, true, false));
}

Query WhereClause::below(double bound) const
{
    return Query(*collection_, Condition::range(path_, Operator::Below, 0.0, bound, false, false));
}

Query WhereClause::below_or_equal(double bound) const
{
    return Query(*collection_, Condition::range(path_, Operator::BelowOrEqual, 0.0, bound, false, true));
}

Query WhereClause::between(double lower, double upper, bool include_lower, bool include_upper) const
{
    if (lower > upper) {
        throw UsageError(ErrorCode::InvalidQuery, "between() lower bound exceeds upper bound");
    }
    return Query(*collection_,
                 Condition::range(path_, Operator::Between, lower, upper, include_lower, include_upper));
}

} // namespace ember::query
