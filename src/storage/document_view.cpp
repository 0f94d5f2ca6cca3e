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
 * @file document_view.cpp
 * @brief Implementation of the copy-on-write document view.
 *
 * @details
 * Nested views rely on the `shared_ptr` aliasing constructor: a child view
 * owns a reference to the root tree while pointing at the child node, so a
 * view stays valid after the collection replaced or dropped the document.
 * Writes on a clone never free a node: replaced and erased members are
 * unlinked into `Clone::retired`, which lives as long as the clone.
 */

#include "ember/storage/document_view.hpp"

#include <memory>
#include <new>
#include <stdexcept>
#include <utility>

namespace ember::storage {

namespace {

/// @brief Deep copy of `value`, or a JSON `null` for `nullptr`.
Document duplicate(const cJSON* value)
{
    Document copy(value != nullptr ? cJSON_Duplicate(value, 1) : cJSON_CreateNull());
    if (!copy) {
        throw std::bad_alloc();
    }
    return copy;
}

Document key_node(const Key& value)
{
    Document node(value.to_json());
    if (!node) {
        throw std::bad_alloc();
    }
    return node;
}

} // namespace

DocumentView::DocumentView(SharedDocument original) : source_(std::move(original))
{
    if (!source_) {
        throw std::invalid_argument("DocumentView: cannot wrap a null document");
    }
}

DocumentView::DocumentView(SharedDocument source, std::shared_ptr<Clone> clone, cJSON* node)
    : source_(std::move(source)), clone_(std::move(clone)), node_(node)
{
}

const cJSON* DocumentView::json() const
{
    return clone_ ? node_ : source_.get();
}

const cJSON* DocumentView::get(const std::string& path) const
{
    return resolve_path(json(), path);
}

bool DocumentView::has(const std::string& path) const
{
    return get(path) != nullptr;
}

std::optional<Key> DocumentView::key(const std::string& path) const
{
    return Key::from_json(get(path));
}

std::optional<std::string> DocumentView::get_string(const std::string& path) const
{
    const cJSON* item = get(path);
    if (cJSON_IsString(item) && item->valuestring != nullptr) {
        return std::string(item->valuestring);
    }
    return std::nullopt;
}

std::optional<double> DocumentView::get_number(const std::string& path) const
{
    const cJSON* item = get(path);
    if (cJSON_IsNumber(item)) {
        return item->valuedouble;
    }
    return std::nullopt;
}

std::optional<bool> DocumentView::get_bool(const std::string& path) const
{
    const cJSON* item = get(path);
    if (cJSON_IsBool(item)) {
        return cJSON_IsTrue(item) != 0;
    }
    return std::nullopt;
}

std::vector<std::string> DocumentView::members() const
{
    std::vector<std::string> names;
    const cJSON* target = json();
    if (!cJSON_IsObject(target)) {
        return names;
    }
    const cJSON* item = nullptr;
    cJSON_ArrayForEach(item, target)
    {
        if (item->string != nullptr) {
            names.emplace_back(item->string);
        }
    }
    return names;
}

size_t DocumentView::size() const
{
    const cJSON* target = json();
    if (!is_container(target)) {
        return 0;
    }
    return static_cast<size_t>(cJSON_GetArraySize(target));
}

bool DocumentView::is_object() const
{
    return cJSON_IsObject(json()) != 0;
}

bool DocumentView::is_array() const
{
    return cJSON_IsArray(json()) != 0;
}

DocumentView DocumentView::at(const std::string& field) const
{
    const cJSON* target = json();
    const cJSON* child = nullptr;
    if (cJSON_IsObject(target)) {
        child = cJSON_GetObjectItemCaseSensitive(target, field.c_str());
    }
    if (!is_container(child)) {
        throw std::out_of_range("DocumentView: '" + field + "' is not an object or array");
    }
    return wrap_child(child);
}

DocumentView DocumentView::at(size_t index) const
{
    const cJSON* target = json();
    const cJSON* child = nullptr;
    if (is_container(target)) {
        child = cJSON_GetArrayItem(target, static_cast<int>(index));
    }
    if (!is_container(child)) {
        throw std::out_of_range("DocumentView: element " + std::to_string(index) +
                                " is not an object or array");
    }
    return wrap_child(child);
}

/**
 * @brief Builds the view handed out for a nested container.
 *
 * Before cloning, the child is a fresh copy-on-write view over the original
 * child. After cloning, it shares the clone and targets the child node.
 */
DocumentView DocumentView::wrap_child(const cJSON* child) const
{
    if (clone_) {
        return DocumentView(SharedDocument(clone_, child), clone_, const_cast<cJSON*>(child));
    }
    return DocumentView(SharedDocument(source_, child), nullptr, nullptr);
}

cJSON* DocumentView::ensure_cloned()
{
    if (!clone_) {
        Document copy(cJSON_Duplicate(source_.get(), 1));
        if (!copy) {
            throw std::bad_alloc();
        }
        auto clone = std::make_shared<Clone>();
        clone->root = std::move(copy);
        node_ = clone->root.get();
        clone_ = std::move(clone);
    }
    return node_;
}

void DocumentView::retire(cJSON* parent, cJSON* item)
{
    auto& retired = clone_->retired;
    if (retired.size() == retired.capacity()) {
        retired.reserve(retired.empty() ? 4 : retired.capacity() * 2);
    }
    retired.emplace_back(cJSON_DetachItemViaPointer(parent, item));
}

cJSON* DocumentView::put_member(cJSON* object, const std::string& field, Document value)
{
    cJSON* existing = cJSON_GetObjectItemCaseSensitive(object, field.c_str());
    if (existing == nullptr) {
        if (!cJSON_AddItemToObject(object, field.c_str(), value.get())) {
            throw std::bad_alloc();
        }
        return value.release();
    }

    int position = 0;
    for (const cJSON* item = object->child; item != existing; item = item->next) {
        ++position;
    }
    retire(object, existing);

    // The replacement takes over the retired node's member name and slot.
    if (value->string != nullptr && (value->type & cJSON_StringIsConst) == 0) {
        cJSON_free(value->string);
    }
    value->string = existing->string;
    value->type = (value->type & ~cJSON_StringIsConst) | (existing->type & cJSON_StringIsConst);
    existing->string = nullptr;
    existing->type &= ~cJSON_StringIsConst;

    if (!cJSON_InsertItemInArray(object, position, value.get())) {
        throw std::bad_alloc();
    }
    return value.release();
}

void DocumentView::set(const std::string& field, const cJSON* value)
{
    if (!cJSON_IsObject(json())) {
        throw std::invalid_argument("DocumentView: set('" + field + "') on a non-object");
    }
    Document copy = duplicate(value);
    put_member(ensure_cloned(), field, std::move(copy));
}

void DocumentView::set(const std::string& field, const Key& value)
{
    Document node = key_node(value);
    set(field, node.get());
}

void DocumentView::set_path(const std::string& path, const cJSON* value)
{
    auto segments = split_path(path);
    if (segments.empty()) {
        throw std::invalid_argument("DocumentView: empty path");
    }
    if (segments.size() == 1) {
        set(segments.front(), value);
        return;
    }
    if (!cJSON_IsObject(json())) {
        throw std::invalid_argument("DocumentView: set_path('" + path + "') on a non-object");
    }

    // Past the first missing or null segment everything is created fresh.
    const cJSON* walk = json();
    for (size_t i = 0; i + 1 < segments.size(); ++i) {
        const cJSON* next = cJSON_GetObjectItemCaseSensitive(walk, segments[i].c_str());
        if (next == nullptr || cJSON_IsNull(next)) {
            break;
        }
        if (!cJSON_IsObject(next)) {
            throw std::invalid_argument("DocumentView: '" + segments[i] + "' in '" + path +
                                        "' is not an object");
        }
        walk = next;
    }

    Document copy = duplicate(value);
    cJSON* current = ensure_cloned();
    for (size_t i = 0; i + 1 < segments.size(); ++i) {
        cJSON* next = cJSON_GetObjectItemCaseSensitive(current, segments[i].c_str());
        if (next == nullptr || cJSON_IsNull(next)) {
            Document created(cJSON_CreateObject());
            if (!created) {
                throw std::bad_alloc();
            }
            next = put_member(current, segments[i], std::move(created));
        }
        current = next;
    }
    put_member(current, segments.back(), std::move(copy));
}

void DocumentView::set_path(const std::string& path, const Key& value)
{
    Document node = key_node(value);
    set_path(path, node.get());
}

bool DocumentView::erase(const std::string& field)
{
    if (!cJSON_IsObject(json()) ||
        cJSON_GetObjectItemCaseSensitive(json(), field.c_str()) == nullptr) {
        return false;
    }
    cJSON* target = ensure_cloned();
    retire(target, cJSON_GetObjectItemCaseSensitive(target, field.c_str()));
    return true;
}

void DocumentView::append(const cJSON* value)
{
    if (!cJSON_IsArray(json())) {
        throw std::invalid_argument("DocumentView: append on a non-array");
    }
    Document copy = duplicate(value);
    if (!cJSON_AddItemToArray(ensure_cloned(), copy.get())) {
        throw std::bad_alloc();
    }
    copy.release();
}

void DocumentView::append(const Key& value)
{
    Document node = key_node(value);
    append(node.get());
}

Document DocumentView::to_document() const
{
    return clone(json());
}

std::string DocumentView::dump() const
{
    return storage::dump(json());
}

} // namespace ember::storage
