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
 * @file document_test.cpp
 * @brief Unit tests for the document model: keys, path resolution, schemas.
 */

#include "ember/storage/document.hpp"
#include "ember/storage/error.hpp"
#include "ember/storage/key.hpp"
#include "ember/storage/schema.hpp"
#include "framework.hpp"
#include "helpers.hpp"

#include <string>
#include <unordered_set>

using ember::storage::ErrorCode;
using ember::storage::Key;
using ember::storage::KeyHash;
using ember::storage::Schema;
using ember::storage::UsageError;
using ember::test::error_code_of;
using ember::test::json;

/**
 * @brief Keys order booleans before numbers before strings.
 */
void test_key_cross_type_ordering()
{
    ASSERT_TRUE(Key(false) < Key(true));
    ASSERT_TRUE(Key(true) < Key(-1000));
    ASSERT_TRUE(Key(2) < Key(10));
    ASSERT_TRUE(Key(1e9) < Key("0"));
    ASSERT_TRUE(Key("apple") < Key("banana"));

    // Numeric kinds collapse onto one representation.
    ASSERT_EQ(Key(3), Key(3.0));
    ASSERT_NE(Key(1), Key(true));
    ASSERT_NE(Key("1"), Key(1));
}

void test_key_hash_consistency()
{
    KeyHash hash;
    ASSERT_EQ(hash(Key(42)), hash(Key(42.0)));
    ASSERT_EQ(hash(Key(0.0)), hash(Key(-0.0)));

    std::unordered_set<Key, KeyHash> set{Key(1), Key("1"), Key(true), Key(1.0)};
    ASSERT_EQ(set.size(), static_cast<size_t>(3));
}

/**
 * @brief Only primitives become keys; null, objects and arrays do not.
 */
void test_key_from_json()
{
    auto doc = json(R"({"s":"x","n":7,"b":false,"z":null,"o":{},"a":[1]})");

    ASSERT_EQ(*Key::from_json(cJSON_GetObjectItem(doc.get(), "s")), Key("x"));
    ASSERT_EQ(*Key::from_json(cJSON_GetObjectItem(doc.get(), "n")), Key(7));
    ASSERT_EQ(*Key::from_json(cJSON_GetObjectItem(doc.get(), "b")), Key(false));
    ASSERT_FALSE(Key::from_json(cJSON_GetObjectItem(doc.get(), "z")).has_value());
    ASSERT_FALSE(Key::from_json(cJSON_GetObjectItem(doc.get(), "o")).has_value());
    ASSERT_FALSE(Key::from_json(cJSON_GetObjectItem(doc.get(), "a")).has_value());
    ASSERT_FALSE(Key::from_json(nullptr).has_value());

    ASSERT_EQ(Key(12).to_string(), std::string("12"));
    ASSERT_EQ(Key(2.5).to_string(), std::string("2.5"));
    ASSERT_TRUE(Key("x").equals_json(cJSON_GetObjectItem(doc.get(), "s")));
}

void test_resolve_nested_path()
{
    auto doc = json(R"({"stats":{"score":88,"tags":["a","b"]},"name":"n"})");

    const cJSON* score = ember::storage::resolve_path(doc.get(), "stats.score");
    ASSERT_TRUE(cJSON_IsNumber(score));
    ASSERT_EQ(score->valuedouble, 88.0);

    const cJSON* tag = ember::storage::resolve_path(doc.get(), "stats.tags.1");
    ASSERT_EQ(std::string(tag->valuestring), std::string("b"));

    ASSERT_TRUE(ember::storage::resolve_path(doc.get(), "stats.missing") == nullptr);
    ASSERT_TRUE(ember::storage::resolve_path(doc.get(), "name.length") == nullptr);
    ASSERT_TRUE(ember::storage::resolve_path(doc.get(), "") == doc.get());
}

void test_parse_rejects_malformed_json()
{
    ASSERT_TRUE(ember::storage::parse("{\"id\": ") == nullptr);
    auto doc = ember::storage::parse(R"({"id":1})");
    ASSERT_EQ(ember::storage::dump(doc.get()), std::string(R"({"id":1})"));
}

/**
 * @brief Schema definitions are read from JSON and validated.
 */
void test_schema_from_json()
{
    auto def = json(R"({"primaryKey":"id","indexes":["name","stats.score"],"multiEntry":["tags"]})");
    Schema schema = Schema::from_json(def.get());

    ASSERT_EQ(schema.primary_key, std::string("id"));
    ASSERT_EQ(schema.indexes.size(), static_cast<size_t>(2));
    ASSERT_TRUE(schema.is_indexed("stats.score"));
    ASSERT_TRUE(schema.is_indexed("tags"));
    ASSERT_TRUE(schema.is_multi_entry("tags"));
    ASSERT_FALSE(schema.is_multi_entry("name"));
    ASSERT_EQ(schema.all_indexes().size(), static_cast<size_t>(3));
}

void test_schema_rejects_invalid_definitions()
{
    auto missing_pk = json(R"({"indexes":["a"]})");
    ASSERT_THROWS(Schema::from_json(missing_pk.get()), UsageError);

    auto not_array = json(R"({"primaryKey":"id","indexes":"name"})");
    ASSERT_TRUE(error_code_of([&] { Schema::from_json(not_array.get()); }) == ErrorCode::InvalidSchema);

    Schema duplicate{"id", {"name", "name"}, {}};
    ASSERT_TRUE(error_code_of([&] { duplicate.validate(); }) == ErrorCode::InvalidSchema);

    Schema pk_indexed{"id", {"id"}, {}};
    ASSERT_TRUE(error_code_of([&] { pk_indexed.validate(); }) == ErrorCode::InvalidSchema);

    Schema empty_segment{"id", {"stats..score"}, {}};
    ASSERT_TRUE(error_code_of([&] { empty_segment.validate(); }) == ErrorCode::InvalidSchema);

    Schema padded{" id", {}, {}};
    ASSERT_TRUE(error_code_of([&] { padded.validate(); }) == ErrorCode::InvalidSchema);

    Schema valid{"id", {"name"}, {"tags"}};
    ASSERT_FALSE(error_code_of([&] { valid.validate(); }).has_value());
}

void test_usage_error_message()
{
    UsageError error(ErrorCode::DuplicateKey, "key 1 already exists");
    ASSERT_TRUE(error.code() == ErrorCode::DuplicateKey);
    ASSERT_EQ(std::string(error.what()), std::string("EmberDB: DuplicateKey: key 1 already exists"));
}
