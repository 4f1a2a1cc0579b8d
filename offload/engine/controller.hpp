/*
 * controller.hpp
 *
 * Copyright (C) 2026 offload contributors
 */

/*************************************************

Date: 2026-9-15

Description: Inbound command surface of the offload engine

**************************************************/

#ifndef OFFLOAD_ENGINE_CONTROLLER_HPP
#define OFFLOAD_ENGINE_CONTROLLER_HPP

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "offload/config/history.hpp"
#include "offload/config/settings.hpp"
#include "offload/engine/device_manager.hpp"
#include "offload/engine/events.hpp"
#include "offload/engine/speed_test.hpp"
#include "offload/engine/state_store.hpp"
#include "offload/engine/transfer_job.hpp"
#include "offload/notify/notifier.hpp"
#include "offload/type/result.hpp"

namespace offload::engine {

/**
 * @brief Builds the notifier a job uses from that job's settings snapshot.
 */
using NotifierFactory = std::function<std::unique_ptr<notify::Notifier>(
    const config::Settings& settings)>;

struct ControllerOptions {
    TransferOptions transfer;
    SpeedTestOptions speedTest;
};

/**
 * @brief Validates commands and turns them into engine actions.
 *
 * Every command returns quickly. Long work (transfers, speed tests) runs on
 * its own thread and reports through events. A rejected command changes
 * nothing and returns the reason.
 */
class Controller {
public:
    using CommandResult = type::Result<void, std::string>;

    Controller(config::SettingsStore& settings, config::HistoryStore& history,
               StateStore& store, EventBus& bus,
               DeviceLifecycleManager& devices, NotifierFactory notifierFactory,
               ControllerOptions options = {});
    ~Controller();

    Controller(const Controller&) = delete;
    Controller& operator=(const Controller&) = delete;

    /**
     * @brief Merges @p patch into the stored settings and saves them.
     * Emits config_saved.
     */
    auto saveSettings(const nlohmann::json& patch) -> CommandResult;

    /**
     * @brief Mounts the configured share. The outcome is reported through
     * nas_connected or nas_error.
     */
    auto connectDestination() -> CommandResult;
    auto disconnectDestination() -> CommandResult;
    auto rescanSource() -> CommandResult;
    auto startTransfer(const std::vector<std::string>& names) -> CommandResult;
    auto cancelTransfer() -> CommandResult;
    auto clearFinished() -> CommandResult;
    auto runSpeedTest() -> CommandResult;

    /**
     * @brief Full snapshot: device, files, redacted config, history and
     * transfer state.
     */
    [[nodiscard]] auto status() const -> nlohmann::json;

    /**
     * @brief Publishes the current snapshot as a status event.
     */
    void broadcastStatus();

    auto attachObserver(Observer observer) -> EventBus::SubscriberId;
    void detachObserver(EventBus::SubscriberId id);

    /**
     * @brief Blocks until the current transfer thread, if any, has exited.
     */
    void waitForTransfer();

    /**
     * @brief Cancels a running transfer and waits for background work.
     */
    void shutdown();

private:
    config::SettingsStore& settings_;
    config::HistoryStore& history_;
    StateStore& store_;
    EventBus& bus_;
    DeviceLifecycleManager& devices_;
    NotifierFactory notifierFactory_;
    ControllerOptions options_;
    ObserverGateway gateway_;
    SpeedTest speedTest_;

    std::mutex jobMutex_;
    std::jthread jobThread_;
};

}  // namespace offload::engine

#endif  // OFFLOAD_ENGINE_CONTROLLER_HPP
