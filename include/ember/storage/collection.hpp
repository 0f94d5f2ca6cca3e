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
 * @file collection.hpp
 * @brief In-memory document collection with synchronous index maintenance.
 *
 * @details
 * This header defines the `Collection` class, the owner of one entity type's
 * documents. It keeps:
 * - a **primary map** (primary key -> record) for O(1) lookups,
 * - an **insertion order** used by every full iteration,
 * - one **ordered index map** per declared index
 *   (value -> (primary key -> record)), updated on every write.
 *
 * Every read returns a copy-on-write `DocumentView`; every write notifies the
 * collection's `NotificationManager`. Bulk operations coalesce their
 * notifications into one.
 *
 * @note Every public member and every query execution takes the collection's
 * recursive mutex. Debounced notifications arrive on the timer thread and are
 * delivered under the same mutex, so an observer may read or write the
 * collection from there. Observers invoked during a write run on the writing
 * thread with the mutex already held.
 */

#pragma once

#include "ember/notify/notification_manager.hpp"
#include "ember/query/query.hpp"
#include "ember/storage/document.hpp"
#include "ember/storage/document_view.hpp"
#include "ember/storage/key.hpp"
#include "ember/storage/schema.hpp"

#include <cJSON.h>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace ember::storage {

/**
 * @struct Record
 * @brief One stored document plus its bookkeeping.
 *
 * The primary map, the insertion order and every index bucket share the
 * record, so a non-indexed update swaps `doc` once for all of them.
 */
struct Record {
    Key key;
    std::uint64_t sequence = 0;                  ///< Insertion order.
    SharedDocument doc;                          ///< Current version (immutable).
    std::vector<std::vector<Key>> index_keys;    ///< Entries per index, parallel to the schema.
};

using RecordPtr = std::shared_ptr<Record>;

/**
 * @class Collection
 * @brief Document storage, index upkeep, and the entry point for queries.
 */
class Collection {
  public:
    /**
     * @brief Creates an empty collection.
     *
     * @param name Collection name (used in logs and diagnostics).
     * @param schema Primary key and index paths; fixed for the collection's lifetime.
     * @param options Notification delivery policy.
     *
     * @throws UsageError (`InvalidSchema`) if the schema is invalid.
     */
    Collection(std::string name, Schema schema, notify::NotifyOptions options = {});

    Collection(const Collection&) = delete;
    Collection& operator=(const Collection&) = delete;

    const std::string& name() const { return name_; }
    const Schema& schema() const { return schema_; }

    // ========================================================================
    //  WRITES
    // ========================================================================

    /**
     * @brief Inserts or replaces a document (deep copy).
     *
     * Replacement removes the previous version from every index before the
     * new one is indexed. Emits `create` unless inside a batch.
     *
     * @return Key The document's primary key.
     * @throws UsageError `InvalidDocument` for a non-object; `NonPrimitiveValue`
     * for a bad primary-key or index value. The collection is unchanged on throw.
     */
    Key put(const cJSON* document);

    /**
     * @brief Inserts a document whose primary key must be new.
     *
     * @throws UsageError (`DuplicateKey`) if the key exists.
     */
    Key add(const cJSON* document);

    /// @brief `put` per document, one `create` notification with every key.
    std::vector<Key> bulk_put(const std::vector<const cJSON*>& documents);

    /// @brief `add` per document, one `create` notification with every key.
    std::vector<Key> bulk_add(const std::vector<const cJSON*>& documents);

    /**
     * @brief Shallow-merges `changes` into the stored document.
     *
     * If the primary key or any index entry changes, the document is removed
     * and re-inserted; otherwise its record is updated in place. Emits one
     * `update` carrying the key (and the new key, if it changed).
     *
     * @return std::optional<Key> The key the document is stored under
     * afterwards, or `std::nullopt` if `key` does not exist.
     * @throws UsageError (`DuplicateKey`) when the new primary key belongs to
     * another document, or for non-primitive key/index values.
     */
    std::optional<Key> update(const Key& key, const cJSON* changes);

    /**
     * @brief Applies per-key changes; one `update` notification.
     *
     * @return size_t Number of documents updated.
     */
    size_t bulk_update(const std::vector<std::pair<Key, const cJSON*>>& changes);

    /**
     * @brief Applies the same changes to several keys; one `update` notification.
     *
     * @return std::vector<Key> Keys actually updated (post-update keys).
     */
    std::vector<Key> bulk_update(const std::vector<Key>& keys, const cJSON* changes);

    /**
     * @brief Removes a document from the primary map and every index.
     *
     * @return std::optional<Key> The removed key, or `std::nullopt` if absent.
     */
    std::optional<Key> remove(const Key& key);

    /// @brief `remove` per key, one `delete` notification with the removed keys.
    std::vector<std::optional<Key>> bulk_remove(const std::vector<Key>& keys);

    /// @brief Drops every document and index entry; emits `clear` with no keys.
    void clear();

    // ========================================================================
    //  READS
    // ========================================================================

    std::optional<DocumentView> get(const Key& key) const;
    std::vector<std::optional<DocumentView>> bulk_get(const std::vector<Key>& keys) const;

    /// @brief Every document, in insertion order.
    std::vector<DocumentView> to_array() const;

    size_t count() const;
    std::vector<Key> keys() const;
    bool has(const Key& key) const;

    /**
     * @brief Invokes `callback` on a snapshot of every document.
     *
     * The callback may mutate the collection; the snapshot is unaffected.
     */
    void each(const std::function<void(const DocumentView&)>& callback) const;

    // ========================================================================
    //  QUERIES
    // ========================================================================

    /**
     * @brief Starts a where-stage on a primary-key or index path.
     *
     * @throws UsageError (`UnindexedField`) for any other path.
     */
    query::WhereClause where(const std::string& path);

    /// @brief Builds a query from a criteria object (see `query::Query`).
    query::Query where(const cJSON* criteria);

    query::Query filter(query::Predicate predicate);
    query::Query order_by(const std::string& path);
    query::Query limit(size_t count);
    query::Query offset(size_t count);

    // ========================================================================
    //  OBSERVERS
    // ========================================================================

    notify::SubscriptionId subscribe(notify::Observer observer);
    bool unsubscribe(notify::SubscriptionId id);

    /// @brief Delivers a pending debounced notification immediately.
    void flush_notifications();

    // ========================================================================
    //  INTROSPECTION
    // ========================================================================

    /**
     * @brief Primary keys stored in the bucket `value` of index `path`, in insertion order.
     *
     * @throws UsageError (`UnindexedField`) if `path` is not an index.
     */
    std::vector<Key> indexed(const std::string& path, const Key& value) const;

    /**
     * @brief Number of distinct values (non-empty buckets) in index `path`.
     *
     * @throws UsageError (`UnindexedField`) if `path` is not an index.
     */
    size_t index_size(const std::string& path) const;

  private:
    friend class query::Query;

    using Bucket = std::unordered_map<Key, RecordPtr, KeyHash>;
    using IndexMap = std::map<Key, Bucket>;

    struct Index {
        std::string path;
        std::vector<std::string> segments;
        bool multi_entry = false;
        IndexMap map;
    };

    Key primary_key_of(const cJSON* document) const;
    std::vector<std::vector<Key>> index_keys_of(const cJSON* document) const;
    const Index* find_index(const std::string& path) const;

    void insert_record(const Key& key, SharedDocument doc, std::vector<std::vector<Key>> index_keys);
    RecordPtr detach(const Key& key);

    /// @brief Publishes unless a batch is in progress.
    void emit(notify::Operation op, std::vector<Key> keys);

    /// @brief Runs `step` with notifications suppressed, then emits once (also on throw).
    template <typename Step>
    void run_batch(notify::Operation op, std::vector<Key>& affected, Step&& step);

    std::string name_;
    Schema schema_;
    std::vector<std::string> pk_segments_;
    std::vector<Index> indexes_;

    std::unordered_map<Key, RecordPtr, KeyHash> primary_;
    std::map<std::uint64_t, RecordPtr> order_;
    std::uint64_t next_sequence_ = 0;
    int batch_depth_ = 0;

    /// @brief Guards every member above; recursive because observers re-enter.
    mutable std::recursive_mutex mutex_;

    notify::NotificationManager observer_;
};

} // namespace ember::storage
