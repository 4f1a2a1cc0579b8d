/*
 * events.hpp
 *
 * Copyright (C) 2026 offload contributors
 */

/*************************************************

Date: 2026-9-10

Description: Named engine events and their fan-out to observers

**************************************************/

#ifndef OFFLOAD_ENGINE_EVENTS_HPP
#define OFFLOAD_ENGINE_EVENTS_HPP

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string_view>

#include <nlohmann/json.hpp>

namespace offload::engine {

namespace event {
inline constexpr std::string_view STATUS = "status";
inline constexpr std::string_view DEVICE_CONNECTED = "device_connected";
inline constexpr std::string_view DEVICE_DISCONNECTED = "device_disconnected";
inline constexpr std::string_view DEVICE_ERROR = "device_error";
inline constexpr std::string_view FILES_UPDATED = "files_updated";
inline constexpr std::string_view TRANSFER_STARTED = "transfer_started";
inline constexpr std::string_view FILE_STARTED = "file_started";
inline constexpr std::string_view FILE_PROGRESS = "file_progress";
inline constexpr std::string_view FILE_VERIFYING = "file_verifying";
inline constexpr std::string_view FILE_COMPLETE = "file_complete";
inline constexpr std::string_view FILE_ERROR = "file_error";
inline constexpr std::string_view TRANSFER_CANCELLED = "transfer_cancelled";
inline constexpr std::string_view TRANSFER_COMPLETE = "transfer_complete";
inline constexpr std::string_view CONFIG_SAVED = "config_saved";
inline constexpr std::string_view NAS_CONNECTED = "nas_connected";
inline constexpr std::string_view NAS_ERROR = "nas_error";
inline constexpr std::string_view NAS_DISCONNECTED = "nas_disconnected";
inline constexpr std::string_view COMMAND_ERROR = "error";
inline constexpr std::string_view SPEED_TEST_PROGRESS = "speed_test_progress";
inline constexpr std::string_view SPEED_TEST_DONE = "speed_test_done";
inline constexpr std::string_view SPEED_TEST_ERROR = "speed_test_error";
}  // namespace event

/**
 * @brief Publishing side of the event stream.
 *
 * emit() is fire-and-forget: it never throws and never blocks on an
 * observer. Callers must not hold the state store lock while emitting.
 */
class EventSink {
public:
    virtual ~EventSink() = default;
    virtual void emit(std::string_view name, const nlohmann::json& payload) = 0;
};

using Observer =
    std::function<void(std::string_view name, const nlohmann::json& payload)>;
using SnapshotProvider = std::function<nlohmann::json()>;

/**
 * @brief Serialized fan-out of events to subscribed observers.
 *
 * Observers run on the emitting thread with the bus lock held; they must be
 * quick and must not emit themselves. Observer exceptions are logged and
 * contained.
 */
class EventBus : public EventSink {
public:
    using SubscriberId = std::uint64_t;

    void emit(std::string_view name, const nlohmann::json& payload) override;

    auto subscribe(Observer observer) -> SubscriberId;

    /**
     * @brief Delivers a "status" snapshot to @p observer and subscribes it,
     * atomically with respect to emit().
     *
     * @p snapshot is invoked with the bus lock held.
     */
    auto subscribeWithSnapshot(Observer observer,
                               const SnapshotProvider& snapshot)
        -> SubscriberId;

    void unsubscribe(SubscriberId id);

    [[nodiscard]] auto subscriberCount() const -> std::size_t;

private:
    void deliver(SubscriberId id, const Observer& observer,
                 std::string_view name, const nlohmann::json& payload);

    mutable std::mutex mutex_;
    std::map<SubscriberId, Observer> observers_;
    SubscriberId nextId_{1};
};

/**
 * @brief Entry point for observers: snapshot on attach, then live deltas.
 */
class ObserverGateway {
public:
    ObserverGateway(EventBus& bus, SnapshotProvider snapshot);

    auto attach(Observer observer) -> EventBus::SubscriberId;
    void detach(EventBus::SubscriberId id);

    /**
     * @brief Synchronous read of the same snapshot an observer gets.
     */
    [[nodiscard]] auto status() const -> nlohmann::json;

private:
    EventBus& bus_;
    SnapshotProvider snapshot_;
};

}  // namespace offload::engine

#endif  // OFFLOAD_ENGINE_EVENTS_HPP
