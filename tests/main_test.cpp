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
 * @file main_test.cpp
 * @brief Central orchestrator for the EmberDB Test Suite.
 *
 * @details
 * Aggregates the unit and integration tests of every subsystem:
 * Infrastructure, Document Model, Views, Notifications, Collections and Queries.
 */

#include "ember/infra/logger.hpp"
#include "framework.hpp"

#include <iostream>

// ============================================================================
// Forward Declarations
// ============================================================================
// The following test functions are implemented in their respective
// translation units (e.g., infra_test.cpp, query_test.cpp, etc.).

// Infrastructure Subsystem (infra_test.cpp)
void test_string_trim();
void test_string_trim_empty();
void test_string_split_path();
void test_logger_threshold();
void test_debounce_timer_coalesces();
void test_debounce_timer_cancel();
void test_debounce_timer_destructor_discards();

// Document Model (document_test.cpp)
void test_key_cross_type_ordering();
void test_key_hash_consistency();
void test_key_from_json();
void test_resolve_nested_path();
void test_parse_rejects_malformed_json();
void test_schema_from_json();
void test_schema_rejects_invalid_definitions();
void test_usage_error_message();

// Copy-on-Write Views (document_view_test.cpp)
void test_view_reads_without_cloning();
void test_view_write_clones_once();
void test_view_set_path_creates_objects();
void test_view_child_before_clone_is_independent();
void test_view_child_after_clone_writes_through();
void test_view_rejects_misuse();
void test_view_to_document_is_owned_copy();
void test_view_child_outlives_replaced_member();
void test_view_child_outlives_parent();
void test_view_set_path_checks_before_writing();

// Notification Subsystem (notify_test.cpp)
void test_notify_immediate_delivers_exact_keys();
void test_notify_unsubscribe_stops_delivery();
void test_notify_unsubscribe_during_delivery();
void test_notify_throwing_observer_is_isolated();
void test_notify_non_standard_throw_is_isolated();
void test_notify_debounced_collapses_burst();
void test_notify_flush_delivers_now();
void test_notify_teardown_flushes_pending();
void test_notify_options_from_json();

// Collection Storage (collection_test.cpp)
void test_collection_put_and_get();
void test_collection_views_are_isolated();
void test_collection_add_rejects_duplicates();
void test_collection_put_replaces_index_entries();
void test_collection_rejects_non_primitive_values();
void test_collection_skips_absent_index_values();
void test_collection_nested_index_path();
void test_collection_update_merges_shallowly();
void test_collection_update_reindexes();
void test_collection_update_changes_primary_key();
void test_collection_update_missing_key();
void test_collection_remove_prunes_buckets();
void test_collection_clear();
void test_collection_insertion_order();
void test_collection_bulk_operations_coalesce();
void test_collection_bulk_error_flushes_notification();
void test_collection_debounced_notifications();
void test_collection_rejects_invalid_schema();
void test_collection_rejects_non_finite_numbers();
void test_collection_debounced_observer_reads_during_writes();

// Query Engine (query_test.cpp)
void test_query_criteria_uses_index();
void test_query_criteria_on_primary_key();
void test_query_criteria_rechecks_other_fields();
void test_query_planner_picks_smallest_bucket();
void test_query_array_criteria_semantics();
void test_query_rejects_bad_criteria();
void test_query_membership_operators();
void test_query_range_operators();
void test_query_not_equals();
void test_query_ordering();
void test_query_pagination();
void test_query_filter_predicates();
void test_query_memoizes_results();
void test_query_views_are_isolated();
void test_query_modify_and_remove();
void test_condition_describe();

// End-to-End Scenarios (scenario_test.cpp)
void test_scenario_multi_entry_lookup();
void test_scenario_duplicate_add();
void test_scenario_order_and_limit();
void test_scenario_read_isolation();
void test_scenario_bulk_add_single_notification();
void test_scenario_update_missing_key();
void test_scenario_put_is_idempotent();
void test_scenario_cardinality();

/**
 * @brief Test Suite Execution Entry Point.
 *
 * @return
 * - 0: All tests passed (Success).
 * - 1: One or more tests failed (Exit failure for CI pipelines).
 */
int main()
{
    std::cout << "\033[36mInitiating EmberDB Test Suite...\033[0m" << std::endl;

    // Keep lifecycle chatter out of the report; observer failures still show.
    ember::infra::Logger::set_level(ember::infra::LogLevel::WARN);

    // --- 1. Infrastructure Subsystem ---
    // Verifies string primitives, the logger threshold and the debounce timer.
    RUN_TEST(test_string_trim);
    RUN_TEST(test_string_trim_empty);
    RUN_TEST(test_string_split_path);
    RUN_TEST(test_logger_threshold);
    RUN_TEST(test_debounce_timer_coalesces);
    RUN_TEST(test_debounce_timer_cancel);
    RUN_TEST(test_debounce_timer_destructor_discards);

    // --- 2. Document Model ---
    // Verifies key ordering/hashing, path resolution and schema validation.
    RUN_TEST(test_key_cross_type_ordering);
    RUN_TEST(test_key_hash_consistency);
    RUN_TEST(test_key_from_json);
    RUN_TEST(test_resolve_nested_path);
    RUN_TEST(test_parse_rejects_malformed_json);
    RUN_TEST(test_schema_from_json);
    RUN_TEST(test_schema_rejects_invalid_definitions);
    RUN_TEST(test_usage_error_message);

    // --- 3. Copy-on-Write Views ---
    // Verifies that writes through a view never reach stored state.
    RUN_TEST(test_view_reads_without_cloning);
    RUN_TEST(test_view_write_clones_once);
    RUN_TEST(test_view_set_path_creates_objects);
    RUN_TEST(test_view_child_before_clone_is_independent);
    RUN_TEST(test_view_child_after_clone_writes_through);
    RUN_TEST(test_view_rejects_misuse);
    RUN_TEST(test_view_to_document_is_owned_copy);
    RUN_TEST(test_view_child_outlives_replaced_member);
    RUN_TEST(test_view_child_outlives_parent);
    RUN_TEST(test_view_set_path_checks_before_writing);

    // --- 4. Notification Subsystem ---
    // Verifies immediate and debounced delivery.
    RUN_TEST(test_notify_immediate_delivers_exact_keys);
    RUN_TEST(test_notify_unsubscribe_stops_delivery);
    RUN_TEST(test_notify_unsubscribe_during_delivery);
    RUN_TEST(test_notify_throwing_observer_is_isolated);
    RUN_TEST(test_notify_non_standard_throw_is_isolated);
    RUN_TEST(test_notify_debounced_collapses_burst);
    RUN_TEST(test_notify_flush_delivers_now);
    RUN_TEST(test_notify_teardown_flushes_pending);
    RUN_TEST(test_notify_options_from_json);

    // --- 5. Collection Storage ---
    // Verifies CRUD, index consistency and coalesced notifications.
    RUN_TEST(test_collection_put_and_get);
    RUN_TEST(test_collection_views_are_isolated);
    RUN_TEST(test_collection_add_rejects_duplicates);
    RUN_TEST(test_collection_put_replaces_index_entries);
    RUN_TEST(test_collection_rejects_non_primitive_values);
    RUN_TEST(test_collection_skips_absent_index_values);
    RUN_TEST(test_collection_nested_index_path);
    RUN_TEST(test_collection_update_merges_shallowly);
    RUN_TEST(test_collection_update_reindexes);
    RUN_TEST(test_collection_update_changes_primary_key);
    RUN_TEST(test_collection_update_missing_key);
    RUN_TEST(test_collection_remove_prunes_buckets);
    RUN_TEST(test_collection_clear);
    RUN_TEST(test_collection_insertion_order);
    RUN_TEST(test_collection_bulk_operations_coalesce);
    RUN_TEST(test_collection_bulk_error_flushes_notification);
    RUN_TEST(test_collection_debounced_notifications);
    RUN_TEST(test_collection_rejects_invalid_schema);
    RUN_TEST(test_collection_rejects_non_finite_numbers);
    RUN_TEST(test_collection_debounced_observer_reads_during_writes);

    // --- 6. Query Engine ---
    // Verifies the planner, operators, ordering, pagination and terminals.
    RUN_TEST(test_query_criteria_uses_index);
    RUN_TEST(test_query_criteria_on_primary_key);
    RUN_TEST(test_query_criteria_rechecks_other_fields);
    RUN_TEST(test_query_planner_picks_smallest_bucket);
    RUN_TEST(test_query_array_criteria_semantics);
    RUN_TEST(test_query_rejects_bad_criteria);
    RUN_TEST(test_query_membership_operators);
    RUN_TEST(test_query_range_operators);
    RUN_TEST(test_query_not_equals);
    RUN_TEST(test_query_ordering);
    RUN_TEST(test_query_pagination);
    RUN_TEST(test_query_filter_predicates);
    RUN_TEST(test_query_memoizes_results);
    RUN_TEST(test_query_views_are_isolated);
    RUN_TEST(test_query_modify_and_remove);
    RUN_TEST(test_condition_describe);

    // --- 7. End-to-End Scenarios ---
    // Verifies the subsystems working together.
    RUN_TEST(test_scenario_multi_entry_lookup);
    RUN_TEST(test_scenario_duplicate_add);
    RUN_TEST(test_scenario_order_and_limit);
    RUN_TEST(test_scenario_read_isolation);
    RUN_TEST(test_scenario_bulk_add_single_notification);
    RUN_TEST(test_scenario_update_missing_key);
    RUN_TEST(test_scenario_put_is_idempotent);
    RUN_TEST(test_scenario_cardinality);

    ember::test::print_summary();

    return (ember::test::failed_count == 0) ? 0 : 1;
}
