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
 * @file document_view.hpp
 * @brief Copy-on-write handle returned by every read path.
 *
 * @details
 * A `DocumentView` is what `Collection::get`, `Collection::to_array` and all
 * query terminals hand out. Reads forward to the stored document until the
 * first write, which deep-copies the target into a private clone; from then
 * on reads and writes use the clone. The stored document is held through a
 * `shared_ptr<const cJSON>` and is never written through a view, so no
 * caller can corrupt collection state, at any depth.
 */

#pragma once

#include "ember/storage/document.hpp"
#include "ember/storage/key.hpp"

#include <cJSON.h>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ember::storage {

/**
 * @class DocumentView
 * @brief Lazily cloning view over a stored document (or a nested part of it).
 *
 * @details
 * **Nested Access:**
 * `at()` returns a view over an object or array child. While this view has
 * not been cloned, the child view is an independent copy-on-write view over
 * the original child, so writing through it clones only that child and the
 * write is not visible through the parent. Once this view has been cloned,
 * the child view points straight into the clone and its writes land there.
 *
 * Copies of a view share its clone once it exists. A node that a write
 * replaces or erases is unlinked from the clone but kept alive until the last
 * view sharing the clone goes away, so child views taken earlier keep reading
 * the value they were taken from.
 */
class DocumentView {
  public:
    /**
     * @brief Wraps a stored document.
     *
     * @param original The shared, immutable document. Must not be `nullptr`.
     */
    explicit DocumentView(SharedDocument original);

    // ========================================================================
    //  READS
    // ========================================================================

    /// @brief The node reads currently resolve against (original or clone).
    const cJSON* json() const;

    /**
     * @brief Resolves a dot-notation path against the current target.
     *
     * @return const cJSON* The node, or `nullptr` when the path is missing.
     */
    const cJSON* get(const std::string& path) const;

    /// @brief True when the path resolves to a node (including JSON `null`).
    bool has(const std::string& path) const;

    /// @brief The primitive at `path`, or `std::nullopt` for missing or non-primitive values.
    std::optional<Key> key(const std::string& path) const;

    std::optional<std::string> get_string(const std::string& path) const;
    std::optional<double> get_number(const std::string& path) const;
    std::optional<bool> get_bool(const std::string& path) const;

    /// @brief Member names of an object target, in document order.
    std::vector<std::string> members() const;

    /// @brief Member count of an object, or element count of an array.
    size_t size() const;

    bool is_object() const;
    bool is_array() const;

    /**
     * @brief Returns a view over the object or array member `field`.
     *
     * @throws std::out_of_range If the member is missing or primitive.
     */
    DocumentView at(const std::string& field) const;

    /**
     * @brief Returns a view over the object or array element at `index`.
     *
     * @throws std::out_of_range If the element is missing or primitive.
     */
    DocumentView at(size_t index) const;

    // ========================================================================
    //  WRITES (clone on first use)
    // ========================================================================

    /**
     * @brief Sets (or adds) a member on an object target.
     *
     * The value is deep-copied.
     *
     * @throws std::invalid_argument If the target is not an object.
     */
    void set(const std::string& field, const cJSON* value);

    /// @brief Sets a member to a primitive value.
    void set(const std::string& field, const Key& value);

    /**
     * @brief Sets the value at a dot-notation path, creating intermediate objects.
     *
     * The path is checked before anything is written.
     *
     * @throws std::invalid_argument If an intermediate segment is a primitive.
     */
    void set_path(const std::string& path, const cJSON* value);

    /// @brief Sets a primitive value at a dot-notation path.
    void set_path(const std::string& path, const Key& value);

    /**
     * @brief Removes a member from an object target.
     *
     * @return true If the member existed.
     */
    bool erase(const std::string& field);

    /**
     * @brief Appends a deep copy of `value` to an array target.
     *
     * @throws std::invalid_argument If the target is not an array.
     */
    void append(const cJSON* value);

    /// @brief Appends a primitive value to an array target.
    void append(const Key& value);

    /// @brief True once a write has produced (or this view points into) a private clone.
    bool is_cloned() const { return clone_ != nullptr; }

    /// @brief Deep copy of the current target.
    Document to_document() const;

    /// @brief Compact JSON text of the current target.
    std::string dump() const;

  private:
    /// @brief A private copy shared by a view, its copies and its children.
    struct Clone {
        Document root;

        /// @brief Nodes unlinked by writes; child views may still point into them.
        std::vector<Document> retired;
    };

    DocumentView(SharedDocument source, std::shared_ptr<Clone> clone, cJSON* node);

    DocumentView wrap_child(const cJSON* child) const;
    cJSON* ensure_cloned();

    /**
     * @brief Stores `value` as member `field` of `object`, in place of any
     * existing member (which is retired, not freed).
     *
     * @return cJSON* The stored node.
     */
    cJSON* put_member(cJSON* object, const std::string& field, Document value);

    /// @brief Unlinks `item` from `parent` and parks it in the retired list.
    void retire(cJSON* parent, cJSON* item);

    /// @brief The stored document (or the original child). Never written.
    SharedDocument source_;

    /// @brief Private clone; `nullptr` until the first write.
    std::shared_ptr<Clone> clone_;

    /// @brief The node of `clone_` this view targets.
    cJSON* node_ = nullptr;
};

} // namespace ember::storage
