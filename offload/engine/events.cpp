/*
 * events.cpp
 *
 * Copyright (C) 2026 offload contributors
 */

/*************************************************

Date: 2026-9-10

Description: Named engine events and their fan-out to observers

**************************************************/

#include "events.hpp"

#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace offload::engine {

void EventBus::emit(std::string_view name, const json& payload) {
    std::lock_guard lock(mutex_);
    spdlog::debug("event {} -> {} observer(s)", name, observers_.size());
    for (const auto& [id, observer] : observers_) {
        deliver(id, observer, name, payload);
    }
}

auto EventBus::subscribe(Observer observer) -> SubscriberId {
    std::lock_guard lock(mutex_);
    const SubscriberId id = nextId_++;
    observers_.emplace(id, std::move(observer));
    return id;
}

auto EventBus::subscribeWithSnapshot(Observer observer,
                                     const SnapshotProvider& snapshot)
    -> SubscriberId {
    std::lock_guard lock(mutex_);
    const SubscriberId id = nextId_++;
    json status;
    try {
        status = snapshot();
    } catch (const std::exception& e) {
        spdlog::error("Failed to build snapshot for observer {}: {}", id,
                      e.what());
        status = json::object();
    }
    deliver(id, observer, event::STATUS, status);
    observers_.emplace(id, std::move(observer));
    return id;
}

void EventBus::unsubscribe(SubscriberId id) {
    std::lock_guard lock(mutex_);
    observers_.erase(id);
}

auto EventBus::subscriberCount() const -> std::size_t {
    std::lock_guard lock(mutex_);
    return observers_.size();
}

void EventBus::deliver(SubscriberId id, const Observer& observer,
                       std::string_view name, const json& payload) {
    try {
        observer(name, payload);
    } catch (const std::exception& e) {
        spdlog::warn("Observer {} failed on {}: {}", id, name, e.what());
    }
}

ObserverGateway::ObserverGateway(EventBus& bus, SnapshotProvider snapshot)
    : bus_(bus), snapshot_(std::move(snapshot)) {}

auto ObserverGateway::attach(Observer observer) -> EventBus::SubscriberId {
    auto id = bus_.subscribeWithSnapshot(std::move(observer), snapshot_);
    spdlog::info("Observer {} attached", id);
    return id;
}

void ObserverGateway::detach(EventBus::SubscriberId id) {
    bus_.unsubscribe(id);
    spdlog::info("Observer {} detached", id);
}

auto ObserverGateway::status() const -> json { return snapshot_(); }

}  // namespace offload::engine
