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
 * @file document_view_test.cpp
 * @brief Unit tests for the copy-on-write `DocumentView`.
 *
 * @details
 * The invariant under test: no write through a view is ever visible in the
 * stored document, and no clone is made until the first write.
 */

#include "ember/storage/document.hpp"
#include "ember/storage/document_view.hpp"
#include "framework.hpp"
#include "helpers.hpp"

#include <optional>
#include <stdexcept>
#include <string>

using ember::storage::DocumentView;
using ember::storage::Key;
using ember::storage::SharedDocument;
using ember::test::json;

namespace {

SharedDocument stored(const char* text)
{
    return ember::storage::share(json(text).get());
}

} // namespace

void test_view_reads_without_cloning()
{
    SharedDocument original = stored(R"({"id":1,"name":"Ann","active":true,"stats":{"score":9}})");
    DocumentView view(original);

    ASSERT_TRUE(view.json() == original.get());
    ASSERT_EQ(*view.get_string("name"), std::string("Ann"));
    ASSERT_EQ(*view.get_number("stats.score"), 9.0);
    ASSERT_EQ(*view.get_bool("active"), true);
    ASSERT_EQ(*view.key("id"), Key(1));
    ASSERT_FALSE(view.get_string("id").has_value());
    ASSERT_FALSE(view.has("missing"));
    ASSERT_EQ(view.members().size(), static_cast<size_t>(4));
    ASSERT_FALSE(view.is_cloned());
}

/**
 * @brief The first write clones; the stored document never changes.
 */
void test_view_write_clones_once()
{
    SharedDocument original = stored(R"({"id":1,"name":"Ann"})");
    DocumentView view(original);

    view.set("name", "Bea");
    ASSERT_TRUE(view.is_cloned());
    const cJSON* clone = view.json();
    ASSERT_TRUE(clone != original.get());

    view.set("age", 30);
    ASSERT_TRUE(view.json() == clone);

    ASSERT_EQ(*view.get_string("name"), std::string("Bea"));
    ASSERT_EQ(*view.get_number("age"), 30.0);
    ASSERT_EQ(ember::storage::dump(original.get()), std::string(R"({"id":1,"name":"Ann"})"));

    ASSERT_TRUE(view.erase("name"));
    ASSERT_FALSE(view.erase("name"));
    ASSERT_FALSE(view.has("name"));
    ASSERT_TRUE(cJSON_GetObjectItem(original.get(), "name") != nullptr);
}

void test_view_set_path_creates_objects()
{
    SharedDocument original = stored(R"({"id":1})");
    DocumentView view(original);

    view.set_path("stats.score", 42);
    ASSERT_EQ(*view.get_number("stats.score"), 42.0);
    ASSERT_FALSE(ember::storage::resolve_path(original.get(), "stats") != nullptr);

    view.set_path("stats.score", nullptr);
    ASSERT_TRUE(cJSON_IsNull(view.get("stats.score")));
}

/**
 * @brief A child view taken before cloning isolates its own writes.
 */
void test_view_child_before_clone_is_independent()
{
    SharedDocument original = stored(R"({"id":1,"stats":{"score":1},"tags":["a"]})");
    DocumentView view(original);

    DocumentView stats = view.at("stats");
    stats.set("score", 5);

    ASSERT_EQ(*stats.get_number("score"), 5.0);
    ASSERT_EQ(*view.get_number("stats.score"), 1.0);
    ASSERT_FALSE(view.is_cloned());
    ASSERT_EQ(*Key::from_json(ember::storage::resolve_path(original.get(), "stats.score")), Key(1));

    DocumentView tags = view.at("tags");
    tags.append("b");
    ASSERT_EQ(tags.size(), static_cast<size_t>(2));
    ASSERT_EQ(view.at("tags").size(), static_cast<size_t>(1));
}

/**
 * @brief After the parent cloned, child views write into the parent's clone.
 */
void test_view_child_after_clone_writes_through()
{
    SharedDocument original = stored(R"({"id":1,"stats":{"score":1}})");
    DocumentView view(original);

    view.set("touched", true);
    DocumentView stats = view.at("stats");
    stats.set("score", 7);

    ASSERT_EQ(*view.get_number("stats.score"), 7.0);
    ASSERT_EQ(*Key::from_json(ember::storage::resolve_path(original.get(), "stats.score")), Key(1));
}

void test_view_rejects_misuse()
{
    SharedDocument original = stored(R"({"id":1,"name":"Ann","list":[1,{"x":2}]})");
    DocumentView view(original);

    ASSERT_THROWS(view.at("name"), std::out_of_range);
    ASSERT_THROWS(view.at("missing"), std::out_of_range);
    ASSERT_THROWS(view.append(Key(1)), std::invalid_argument);
    ASSERT_THROWS(DocumentView(SharedDocument()), std::invalid_argument);

    DocumentView list = view.at("list");
    ASSERT_TRUE(list.is_array());
    ASSERT_EQ(*list.at(1).get_number("x"), 2.0);
    ASSERT_THROWS(list.at(0), std::out_of_range);
}

void test_view_to_document_is_owned_copy()
{
    SharedDocument original = stored(R"({"id":1,"name":"Ann"})");
    DocumentView view(original);
    view.set("name", "Cy");

    ember::storage::Document copy = view.to_document();
    cJSON_DeleteItemFromObject(copy.get(), "name");

    ASSERT_EQ(*view.get_string("name"), std::string("Cy"));
    ASSERT_EQ(view.dump(), std::string(R"({"id":1,"name":"Cy"})"));
}

/**
 * @brief Child views keep reading their node after the parent replaces or
 * erases it, and replacement keeps the member's position.
 */
void test_view_child_outlives_replaced_member()
{
    SharedDocument original =
        stored(R"({"id":1,"stats":{"score":9},"tags":["a","b"],"name":"Ann"})");
    DocumentView view(original);
    view.set("touched", true);

    DocumentView stats = view.at("stats");
    DocumentView tags = view.at("tags");
    view.set("stats", 0);
    ASSERT_TRUE(view.erase("tags"));

    ASSERT_EQ(*view.get_number("stats"), 0.0);
    ASSERT_FALSE(view.has("tags"));
    ASSERT_EQ(view.dump(), std::string(R"({"id":1,"stats":0,"name":"Ann","touched":true})"));

    ASSERT_EQ(*stats.get_number("score"), 9.0);
    ASSERT_EQ(tags.size(), static_cast<size_t>(2));
    ASSERT_EQ(*Key::from_json(cJSON_GetArrayItem(tags.json(), 1)), Key(std::string("b")));

    // Writes through a detached child stay in the child.
    stats.set("score", 10);
    ASSERT_EQ(*stats.get_number("score"), 10.0);
    ASSERT_EQ(*view.get_number("stats"), 0.0);
}

void test_view_child_outlives_parent()
{
    SharedDocument original = stored(R"({"id":1,"stats":{"score":9}})");
    std::optional<DocumentView> stats;
    {
        DocumentView view(original);
        view.set("touched", true);
        stats = view.at("stats");
        view.set_path("stats", nullptr);
    }
    ASSERT_EQ(*stats->get_number("score"), 9.0);
    ASSERT_EQ(stats->dump(), std::string(R"({"score":9})"));
}

/**
 * @brief A rejected `set_path` leaves the view exactly as it was.
 */
void test_view_set_path_checks_before_writing()
{
    SharedDocument original = stored(R"({"id":1,"meta":{"level":1}})");
    DocumentView view(original);

    ASSERT_THROWS(view.set_path("meta.level.deep", 2), std::invalid_argument);
    ASSERT_FALSE(view.is_cloned());

    view.set("name", "Ann");
    const std::string before = view.dump();
    ASSERT_THROWS(view.set_path("meta.level.deep", 2), std::invalid_argument);
    ASSERT_THROWS(view.set_path("name.first", "A"), std::invalid_argument);
    ASSERT_EQ(view.dump(), before);

    view.set_path("extra.inner.value", 3);
    ASSERT_EQ(*view.get_number("extra.inner.value"), 3.0);
}
