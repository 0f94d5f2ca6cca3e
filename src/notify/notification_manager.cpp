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
 * @file notification_manager.cpp
 * @brief Implementation of the observer registry and delivery policies.
 */

#include "ember/notify/notification_manager.hpp"

#include "ember/infra/logger.hpp"
#include "ember/storage/error.hpp"

#include <exception>
#include <string>
#include <utility>

namespace ember::notify {

const char* operation_name(Operation op)
{
    switch (op) {
    case Operation::Create:
        return "create";
    case Operation::Update:
        return "update";
    case Operation::Delete:
        return "delete";
    case Operation::Clear:
        return "clear";
    }
    return "unknown";
}

NotifyOptions NotifyOptions::from_json(const cJSON* definition)
{
    NotifyOptions options;
    if (definition == nullptr || cJSON_IsNull(definition)) {
        return options;
    }
    if (!cJSON_IsObject(definition)) {
        throw storage::UsageError(storage::ErrorCode::InvalidSchema,
                                  "notification options must be an object");
    }

    const cJSON* policy = cJSON_GetObjectItemCaseSensitive(definition, "policy");
    if (cJSON_IsString(policy) && policy->valuestring != nullptr) {
        std::string name = policy->valuestring;
        if (name == "immediate") {
            options.policy = DeliveryPolicy::Immediate;
        } else if (name == "debounced") {
            options.policy = DeliveryPolicy::Debounced;
        } else {
            throw storage::UsageError(storage::ErrorCode::InvalidSchema,
                                      "unknown notification policy '" + name + "'");
        }
    }

    const cJSON* window = cJSON_GetObjectItemCaseSensitive(definition, "debounceMs");
    if (cJSON_IsNumber(window)) {
        if (window->valuedouble < 0) {
            throw storage::UsageError(storage::ErrorCode::InvalidSchema,
                                      "'debounceMs' must not be negative");
        }
        options.debounce_window = std::chrono::milliseconds(static_cast<long long>(window->valuedouble));
    }
    return options;
}

NotificationManager::NotificationManager(std::string collection_name, NotifyOptions options,
                                         std::recursive_mutex* delivery_mutex)
    : collection_name_(std::move(collection_name)), options_(options), delivery_mutex_(delivery_mutex)
{
    if (options_.policy == DeliveryPolicy::Debounced) {
        timer_ = std::make_unique<infra::DebounceTimer>(options_.debounce_window,
                                                        [this] { deliver_pending(); });
    }
}

/**
 * @brief Tears the timer down first so it cannot fire into a dying object,
 * then delivers whatever it would have delivered.
 */
NotificationManager::~NotificationManager()
{
    timer_.reset();

    bool had_pending = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        had_pending = pending_.has_value();
    }
    if (had_pending) {
        infra::Logger::log(infra::LogLevel::DEBUG,
                           "Notify: Flushing pending event for '" + collection_name_ +
                               "' on teardown.");
        deliver_pending();
    }
}

SubscriptionId NotificationManager::subscribe(Observer observer)
{
    std::lock_guard<std::mutex> lock(mutex_);
    SubscriptionId id = next_id_++;
    observers_.emplace(id, std::move(observer));
    return id;
}

bool NotificationManager::unsubscribe(SubscriptionId id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    return observers_.erase(id) > 0;
}

void NotificationManager::notify(Operation op, std::vector<storage::Key> keys)
{
    if (options_.policy == DeliveryPolicy::Immediate) {
        deliver(op, keys);
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_ = op;
    }
    timer_->restart();
}

void NotificationManager::flush()
{
    if (timer_) {
        timer_->cancel();
    }
    deliver_pending();
}

void NotificationManager::deliver_pending()
{
    // Owner lock first, registry lock second: the order writers use too.
    std::unique_lock<std::recursive_mutex> owner;
    if (delivery_mutex_ != nullptr) {
        owner = std::unique_lock<std::recursive_mutex>(*delivery_mutex_);
    }

    std::optional<Operation> op;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        op.swap(pending_);
    }
    if (op) {
        deliver(*op, {});
    }
}

bool NotificationManager::pending() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.has_value();
}

size_t NotificationManager::subscriber_count() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return observers_.size();
}

void NotificationManager::deliver(Operation op, const std::vector<storage::Key>& keys)
{
    std::vector<Observer> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshot.reserve(observers_.size());
        for (const auto& [id, observer] : observers_) {
            snapshot.push_back(observer);
        }
    }

    for (const auto& observer : snapshot) {
        try {
            observer(op, keys);
        } catch (const std::exception& e) {
            infra::Logger::log(infra::LogLevel::ERROR,
                               "Notify: Observer of '" + collection_name_ + "' failed on " +
                                   operation_name(op) + ": " + e.what());
        } catch (...) {
            infra::Logger::log(infra::LogLevel::ERROR,
                               "Notify: Observer of '" + collection_name_ + "' failed on " +
                                   operation_name(op) + " with a non-standard exception.");
        }
    }
}

} // namespace ember::notify
