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
 * @file notification_manager.hpp
 * @brief Per-collection subscriber registry and change propagation.
 *
 * @details
 * Every collection owns one `NotificationManager`. Mutations report
 * `(operation, affected primary keys)`; the manager fans the event out to
 * every subscriber, either immediately or coalesced behind a debounce window.
 *
 * **Delivery Policies:**
 * - **Immediate:** each call to `notify()` is delivered synchronously with its
 *   exact key list. Bulk operations already arrive as one call.
 * - **Debounced:** calls within the window collapse into one delivery carrying
 *   only the latest operation kind and no keys. Delivery happens on the timer
 *   thread, or synchronously from `flush()` and from the destructor. When the
 *   owner supplies a delivery mutex, these deliveries hold it, so observers
 *   see the owner's state exactly as its writers left it.
 */

#pragma once

#include "ember/infra/debounce_timer.hpp"
#include "ember/storage/key.hpp"

#include <cJSON.h>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace ember::notify {

/**
 * @enum Operation
 * @brief Kind of mutation carried by a notification.
 */
enum class Operation { Create, Update, Delete, Clear };

/// @brief Lower-case name of an operation (`"create"`, `"update"`, ...).
const char* operation_name(Operation op);

/**
 * @brief Subscriber callback.
 *
 * Receives the operation kind and the affected primary keys (empty for
 * `Clear` and for debounced deliveries).
 */
using Observer = std::function<void(Operation, const std::vector<storage::Key>&)>;

/// @brief Handle returned by `subscribe()`; pass it to `unsubscribe()`.
using SubscriptionId = std::uint64_t;

enum class DeliveryPolicy { Immediate, Debounced };

/**
 * @struct NotifyOptions
 * @brief Delivery configuration of one manager.
 */
struct NotifyOptions {
    DeliveryPolicy policy = DeliveryPolicy::Immediate;
    std::chrono::milliseconds debounce_window{70};

    /**
     * @brief Parses `{"policy": "immediate"|"debounced", "debounceMs": <n>}`.
     *
     * Missing members keep their defaults.
     *
     * @throws storage::UsageError (`InvalidSchema`) on an unknown policy or a
     * negative window.
     */
    static NotifyOptions from_json(const cJSON* definition);
};

/**
 * @class NotificationManager
 * @brief Thread-safe observer registry with immediate or debounced delivery.
 *
 * @details
 * Subscribers are invoked from a snapshot taken under the registry lock and
 * run with the lock released, so a callback may subscribe or unsubscribe
 * (itself included) without deadlocking or invalidating the iteration.
 * A callback that throws (a `std::exception` or anything else) is logged;
 * the remaining subscribers are still notified.
 */
class NotificationManager {
  public:
    /**
     * @param collection_name Used in log lines.
     * @param options Delivery policy and debounce window.
     * @param delivery_mutex Optional lock of the owner, held around debounced
     * deliveries. Immediate deliveries run on the caller, which already holds it.
     */
    NotificationManager(std::string collection_name, NotifyOptions options = {},
                        std::recursive_mutex* delivery_mutex = nullptr);

    /**
     * @brief Stops the debounce timer and delivers any pending notification.
     */
    ~NotificationManager();

    NotificationManager(const NotificationManager&) = delete;
    NotificationManager& operator=(const NotificationManager&) = delete;

    /**
     * @brief Registers a subscriber.
     *
     * @return SubscriptionId Token for `unsubscribe()`.
     */
    SubscriptionId subscribe(Observer observer);

    /**
     * @brief Removes a subscriber.
     *
     * @return true If the id was registered.
     */
    bool unsubscribe(SubscriptionId id);

    /**
     * @brief Publishes a mutation according to the delivery policy.
     */
    void notify(Operation op, std::vector<storage::Key> keys = {});

    /**
     * @brief Delivers a pending debounced notification now.
     *
     * No-op under the immediate policy or when nothing is pending.
     */
    void flush();

    /// @brief True while a debounced notification waits for its window.
    bool pending() const;

    size_t subscriber_count() const;

    const NotifyOptions& options() const { return options_; }

  private:
    /// @brief Takes the pending operation, if any, and delivers it without keys.
    void deliver_pending();

    void deliver(Operation op, const std::vector<storage::Key>& keys);

    std::string collection_name_;
    NotifyOptions options_;
    std::recursive_mutex* delivery_mutex_;

    mutable std::mutex mutex_;

    /// @brief Ordered by id, so delivery follows subscription order.
    std::map<SubscriptionId, Observer> observers_;
    SubscriptionId next_id_ = 1;

    /// @brief Latest operation kind awaiting debounced delivery.
    std::optional<Operation> pending_;

    /// @brief Present only under the debounced policy.
    std::unique_ptr<infra::DebounceTimer> timer_;
};

} // namespace ember::notify
