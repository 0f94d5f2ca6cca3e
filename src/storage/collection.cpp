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
 * @file collection.cpp
 * @brief Implementation of the in-memory document collection.
 *
 * @details
 * Every write follows the same sequence: derive the primary key and the index
 * entries of the new version, validate them, and only then touch the primary
 * map and the index maps. A `UsageError` therefore never leaves a
 * half-indexed document behind.
 */

#include "ember/storage/collection.hpp"

#include "ember/infra/logger.hpp"
#include "ember/storage/error.hpp"

#include <algorithm>
#include <mutex>
#include <new>

namespace ember::storage {

namespace {

/**
 * @brief Shallow-merges the members of `changes` into `target`.
 *
 * Existing members are replaced, new members are appended.
 */
void merge_members(cJSON* target, const cJSON* changes)
{
    const cJSON* change = nullptr;
    cJSON_ArrayForEach(change, changes)
    {
        Document copy(cJSON_Duplicate(change, true));
        if (!copy) {
            throw std::bad_alloc();
        }
        const cJSON_bool stored =
            cJSON_GetObjectItemCaseSensitive(target, change->string) != nullptr
                ? cJSON_ReplaceItemInObjectCaseSensitive(target, change->string, copy.get())
                : cJSON_AddItemToObject(target, change->string, copy.get());
        if (!stored) {
            throw std::bad_alloc();
        }
        // Owned by `target` from here on.
        copy.release();
    }
}

} // namespace

Collection::Collection(std::string name, Schema schema, notify::NotifyOptions options)
    : name_(std::move(name)), schema_(std::move(schema)), observer_(name_, options, &mutex_)
{
    schema_.validate();
    pk_segments_ = split_path(schema_.primary_key);

    for (const auto& path : schema_.indexes) {
        indexes_.push_back(Index{path, split_path(path), false, {}});
    }
    for (const auto& path : schema_.multi_entry) {
        indexes_.push_back(Index{path, split_path(path), true, {}});
    }

    infra::Logger::log(infra::LogLevel::INFO,
                       "Collection: '" + name_ + "' ready (primary key '" + schema_.primary_key +
                           "', " + std::to_string(indexes_.size()) + " index(es)).");
}

// ============================================================================
//  KEY DERIVATION
// ============================================================================

Key Collection::primary_key_of(const cJSON* document) const
{
    std::optional<Key> key = Key::from_json(resolve_path(document, pk_segments_));
    if (!key) {
        throw UsageError(ErrorCode::NonPrimitiveValue,
                         "primary key '" + schema_.primary_key +
                             "' must hold a string, finite number or boolean in collection '" + name_ + "'");
    }
    return *key;
}

/**
 * @brief Computes the entries each index holds for a document.
 *
 * Missing and `null` values produce no entry. A multi-entry index produces
 * one entry per distinct array element; the entries are sorted so two
 * versions of a document compare equal when they index identically.
 */
std::vector<std::vector<Key>> Collection::index_keys_of(const cJSON* document) const
{
    std::vector<std::vector<Key>> result;
    result.reserve(indexes_.size());

    for (const auto& index : indexes_) {
        std::vector<Key> entries;
        const cJSON* node = resolve_path(document, index.segments);

        if (is_absent(node)) {
            result.push_back(std::move(entries));
            continue;
        }

        if (index.multi_entry && cJSON_IsArray(node)) {
            const cJSON* element = nullptr;
            cJSON_ArrayForEach(element, node)
            {
                if (cJSON_IsNull(element)) {
                    continue;
                }
                std::optional<Key> key = Key::from_json(element);
                if (!key) {
                    throw UsageError(ErrorCode::NonPrimitiveValue,
                                     "multi-entry index '" + index.path +
                                         "' only accepts arrays of primitives");
                }
                entries.push_back(std::move(*key));
            }
            std::sort(entries.begin(), entries.end());
            entries.erase(std::unique(entries.begin(), entries.end()), entries.end());
        } else {
            std::optional<Key> key = Key::from_json(node);
            if (!key) {
                throw UsageError(ErrorCode::NonPrimitiveValue,
                                 "index '" + index.path + "' must hold a string, finite number or boolean");
            }
            entries.push_back(std::move(*key));
        }
        result.push_back(std::move(entries));
    }
    return result;
}

const Collection::Index* Collection::find_index(const std::string& path) const
{
    for (const auto& index : indexes_) {
        if (index.path == path) {
            return &index;
        }
    }
    return nullptr;
}

// ============================================================================
//  INDEX MAINTENANCE
// ============================================================================

void Collection::insert_record(const Key& key, SharedDocument doc,
                               std::vector<std::vector<Key>> index_keys)
{
    auto record = std::make_shared<Record>(
        Record{key, next_sequence_++, std::move(doc), std::move(index_keys)});

    primary_[key] = record;
    order_[record->sequence] = record;

    for (size_t i = 0; i < indexes_.size(); ++i) {
        for (const auto& value : record->index_keys[i]) {
            indexes_[i].map[value][key] = record;
        }
    }
}

/**
 * @brief Unlinks a record from the primary map, the order, and every index.
 *
 * Buckets left empty are pruned so `index_size()` reports live values only.
 *
 * @return RecordPtr The detached record, or `nullptr` if the key is absent.
 */
RecordPtr Collection::detach(const Key& key)
{
    auto it = primary_.find(key);
    if (it == primary_.end()) {
        return nullptr;
    }

    RecordPtr record = it->second;
    primary_.erase(it);
    order_.erase(record->sequence);

    for (size_t i = 0; i < indexes_.size(); ++i) {
        IndexMap& map = indexes_[i].map;
        for (const auto& value : record->index_keys[i]) {
            auto bucket = map.find(value);
            if (bucket == map.end()) {
                continue;
            }
            bucket->second.erase(key);
            if (bucket->second.empty()) {
                map.erase(bucket);
            }
        }
    }
    return record;
}

void Collection::emit(notify::Operation op, std::vector<Key> keys)
{
    if (batch_depth_ > 0) {
        return;
    }
    observer_.notify(op, std::move(keys));
}

template <typename Step>
void Collection::run_batch(notify::Operation op, std::vector<Key>& affected, Step&& step)
{
    ++batch_depth_;
    try {
        step();
    } catch (...) {
        // Writes already applied stay applied; observers still hear about them.
        --batch_depth_;
        emit(op, affected);
        throw;
    }
    --batch_depth_;

    if (infra::Logger::enabled(infra::LogLevel::DEBUG)) {
        infra::Logger::log(infra::LogLevel::DEBUG, "Collection: '" + name_ + "' bulk " +
                                                       notify::operation_name(op) + " touched " +
                                                       std::to_string(affected.size()) + " key(s).");
    }
    emit(op, affected);
}

// ============================================================================
//  WRITES
// ============================================================================

Key Collection::put(const cJSON* document)
{
    std::unique_lock lock(mutex_);
    if (!cJSON_IsObject(document)) {
        throw UsageError(ErrorCode::InvalidDocument,
                         "documents stored in '" + name_ + "' must be JSON objects");
    }

    Key key = primary_key_of(document);
    auto entries = index_keys_of(document);
    SharedDocument copy = share(document);

    detach(key);
    insert_record(key, std::move(copy), std::move(entries));

    emit(notify::Operation::Create, {key});
    return key;
}

Key Collection::add(const cJSON* document)
{
    std::unique_lock lock(mutex_);
    if (cJSON_IsObject(document)) {
        Key key = primary_key_of(document);
        if (primary_.count(key) > 0) {
            throw UsageError(ErrorCode::DuplicateKey,
                             "key " + key.to_string() + " already exists in '" + name_ + "'");
        }
    }
    return put(document);
}

std::vector<Key> Collection::bulk_put(const std::vector<const cJSON*>& documents)
{
    std::unique_lock lock(mutex_);
    std::vector<Key> keys;
    keys.reserve(documents.size());
    run_batch(notify::Operation::Create, keys, [&] {
        for (const cJSON* document : documents) {
            keys.push_back(put(document));
        }
    });
    return keys;
}

std::vector<Key> Collection::bulk_add(const std::vector<const cJSON*>& documents)
{
    std::unique_lock lock(mutex_);
    std::vector<Key> keys;
    keys.reserve(documents.size());
    run_batch(notify::Operation::Create, keys, [&] {
        for (const cJSON* document : documents) {
            keys.push_back(add(document));
        }
    });
    return keys;
}

std::optional<Key> Collection::update(const Key& key, const cJSON* changes)
{
    std::unique_lock lock(mutex_);
    if (!cJSON_IsObject(changes)) {
        throw UsageError(ErrorCode::InvalidDocument, "update changes must be a JSON object");
    }

    auto it = primary_.find(key);
    if (it == primary_.end()) {
        return std::nullopt;
    }
    RecordPtr record = it->second;

    Document merged = clone(record->doc.get());
    merge_members(merged.get(), changes);

    Key new_key = primary_key_of(merged.get());
    auto entries = index_keys_of(merged.get());

    const bool key_changed = new_key != key;
    if (key_changed && primary_.count(new_key) > 0) {
        throw UsageError(ErrorCode::DuplicateKey, "cannot move " + key.to_string() + " onto existing key " +
                                                      new_key.to_string() + " in '" + name_ + "'");
    }

    SharedDocument doc(merged.release(), JsonDeleter());
    if (key_changed || entries != record->index_keys) {
        detach(key);
        insert_record(new_key, std::move(doc), std::move(entries));
    } else {
        // Every index already points at this record.
        record->doc = std::move(doc);
    }

    if (key_changed) {
        emit(notify::Operation::Update, {key, new_key});
    } else {
        emit(notify::Operation::Update, {key});
    }
    return new_key;
}

size_t Collection::bulk_update(const std::vector<std::pair<Key, const cJSON*>>& changes)
{
    std::unique_lock lock(mutex_);
    std::vector<Key> affected;
    size_t updated = 0;
    run_batch(notify::Operation::Update, affected, [&] {
        for (const auto& [key, change] : changes) {
            std::optional<Key> result = update(key, change);
            if (!result) {
                continue;
            }
            ++updated;
            affected.push_back(key);
            if (*result != key) {
                affected.push_back(*result);
            }
        }
    });
    return updated;
}

std::vector<Key> Collection::bulk_update(const std::vector<Key>& keys, const cJSON* changes)
{
    std::unique_lock lock(mutex_);
    std::vector<Key> affected;
    std::vector<Key> updated;
    run_batch(notify::Operation::Update, affected, [&] {
        for (const auto& key : keys) {
            std::optional<Key> result = update(key, changes);
            if (!result) {
                continue;
            }
            updated.push_back(*result);
            affected.push_back(key);
            if (*result != key) {
                affected.push_back(*result);
            }
        }
    });
    return updated;
}

std::optional<Key> Collection::remove(const Key& key)
{
    std::unique_lock lock(mutex_);
    RecordPtr record = detach(key);
    if (!record) {
        return std::nullopt;
    }
    emit(notify::Operation::Delete, {record->key});
    return record->key;
}

std::vector<std::optional<Key>> Collection::bulk_remove(const std::vector<Key>& keys)
{
    std::unique_lock lock(mutex_);
    std::vector<Key> affected;
    std::vector<std::optional<Key>> results;
    results.reserve(keys.size());
    run_batch(notify::Operation::Delete, affected, [&] {
        for (const auto& key : keys) {
            std::optional<Key> removed = remove(key);
            if (removed) {
                affected.push_back(*removed);
            }
            results.push_back(std::move(removed));
        }
    });
    return results;
}

void Collection::clear()
{
    std::unique_lock lock(mutex_);
    const size_t dropped = primary_.size();
    primary_.clear();
    order_.clear();
    for (auto& index : indexes_) {
        index.map.clear();
    }

    infra::Logger::log(infra::LogLevel::DEBUG, "Collection: '" + name_ + "' cleared (" +
                                                   std::to_string(dropped) + " document(s)).");
    emit(notify::Operation::Clear, {});
}

// ============================================================================
//  READS
// ============================================================================

std::optional<DocumentView> Collection::get(const Key& key) const
{
    std::unique_lock lock(mutex_);
    auto it = primary_.find(key);
    if (it == primary_.end()) {
        return std::nullopt;
    }
    return DocumentView(it->second->doc);
}

std::vector<std::optional<DocumentView>> Collection::bulk_get(const std::vector<Key>& keys) const
{
    std::unique_lock lock(mutex_);
    std::vector<std::optional<DocumentView>> views;
    views.reserve(keys.size());
    for (const auto& key : keys) {
        views.push_back(get(key));
    }
    return views;
}

std::vector<DocumentView> Collection::to_array() const
{
    std::unique_lock lock(mutex_);
    std::vector<DocumentView> views;
    views.reserve(order_.size());
    for (const auto& [sequence, record] : order_) {
        views.emplace_back(record->doc);
    }
    return views;
}

size_t Collection::count() const
{
    std::unique_lock lock(mutex_);
    return primary_.size();
}

bool Collection::has(const Key& key) const
{
    std::unique_lock lock(mutex_);
    return primary_.count(key) > 0;
}

std::vector<Key> Collection::keys() const
{
    std::unique_lock lock(mutex_);
    std::vector<Key> result;
    result.reserve(order_.size());
    for (const auto& [sequence, record] : order_) {
        result.push_back(record->key);
    }
    return result;
}

void Collection::each(const std::function<void(const DocumentView&)>& callback) const
{
    for (const auto& view : to_array()) {
        callback(view);
    }
}

// ============================================================================
//  QUERIES
// ============================================================================

query::WhereClause Collection::where(const std::string& path)
{
    return query::WhereClause(*this, path);
}

query::Query Collection::where(const cJSON* criteria)
{
    return query::Query(*this, criteria);
}

query::Query Collection::filter(query::Predicate predicate)
{
    query::Query query(*this, nullptr);
    query.filter(std::move(predicate));
    return query;
}

query::Query Collection::order_by(const std::string& path)
{
    query::Query query(*this, nullptr);
    query.order_by(path);
    return query;
}

query::Query Collection::limit(size_t count)
{
    query::Query query(*this, nullptr);
    query.limit(count);
    return query;
}

query::Query Collection::offset(size_t count)
{
    query::Query query(*this, nullptr);
    query.offset(count);
    return query;
}

// ============================================================================
//  OBSERVERS
// ============================================================================

notify::SubscriptionId Collection::subscribe(notify::Observer observer)
{
    return observer_.subscribe(std::move(observer));
}

bool Collection::unsubscribe(notify::SubscriptionId id)
{
    return observer_.unsubscribe(id);
}

void Collection::flush_notifications()
{
    observer_.flush();
}

// ============================================================================
//  INTROSPECTION
// ============================================================================

std::vector<Key> Collection::indexed(const std::string& path, const Key& value) const
{
    std::unique_lock lock(mutex_);
    const Index* index = find_index(path);
    if (index == nullptr) {
        throw UsageError(ErrorCode::UnindexedField, "'" + path + "' is not an index of '" + name_ + "'");
    }

    std::vector<RecordPtr> records;
    auto bucket = index->map.find(value);
    if (bucket != index->map.end()) {
        for (const auto& [key, record] : bucket->second) {
            records.push_back(record);
        }
    }
    std::sort(records.begin(), records.end(),
              [](const RecordPtr& a, const RecordPtr& b) { return a->sequence < b->sequence; });

    std::vector<Key> result;
    result.reserve(records.size());
    for (const auto& record : records) {
        result.push_back(record->key);
    }
    return result;
}

size_t Collection::index_size(const std::string& path) const
{
    std::unique_lock lock(mutex_);
    const Index* index = find_index(path);
    if (index == nullptr) {
        throw UsageError(ErrorCode::UnindexedField, "'" + path + "' is not an index of '" + name_ + "'");
    }
    return index->map.size();
}

} // namespace ember::storage
