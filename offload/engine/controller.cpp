/*
 * controller.cpp
 *
 * Copyright (C) 2026 offload contributors
 */

/*************************************************

Date: 2026-9-15

Description: Inbound command surface of the offload engine

**************************************************/

#include "controller.hpp"

#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace offload::engine {

namespace {
constexpr const char* K_TRANSFER_RUNNING = "Transfer in progress";
constexpr const char* K_SOURCE_BUSY = "USB drive is being updated";
}  // namespace

Controller::Controller(config::SettingsStore& settings,
                       config::HistoryStore& history, StateStore& store,
                       EventBus& bus, DeviceLifecycleManager& devices,
                       NotifierFactory notifierFactory,
                       ControllerOptions options)
    : settings_(settings),
      history_(history),
      store_(store),
      bus_(bus),
      devices_(devices),
      notifierFactory_(std::move(notifierFactory)),
      options_(std::move(options)),
      gateway_(bus, [this] { return status(); }),
      speedTest_(bus, options_.speedTest) {}

Controller::~Controller() { shutdown(); }

auto Controller::saveSettings(const json& patch) -> CommandResult {
    if (!patch.is_object()) {
        return type::fail(std::string("Settings must be a JSON object"));
    }
    const config::Settings merged =
        config::mergeSettings(settings_.load(), patch);
    if (!settings_.save(merged)) {
        return type::fail(std::string("Failed to save settings"));
    }
    spdlog::info("Settings saved");
    bus_.emit(event::CONFIG_SAVED,
              {{"config", config::redactedJson(merged)},
               {"config_has_password", merged.hasPassword()}});
    return {};
}

auto Controller::connectDestination() -> CommandResult {
    if (store_.isTransferRunning()) {
        return type::fail(std::string(K_TRANSFER_RUNNING));
    }
    const config::Settings settings = settings_.load();
    auto result = devices_.mountDestination(settings);
    if (result.isSuccess()) {
        bus_.emit(event::NAS_CONNECTED, json::object());
    } else {
        bus_.emit(event::NAS_ERROR, {{"error", result.error().detail}});
    }
    return {};
}

auto Controller::disconnectDestination() -> CommandResult {
    if (store_.isTransferRunning()) {
        return type::fail(std::string(K_TRANSFER_RUNNING));
    }
    if (speedTest_.isRunning()) {
        return type::fail(std::string("Speed test in progress"));
    }
    devices_.unmountDestination();
    bus_.emit(event::NAS_DISCONNECTED, json::object());
    return {};
}

auto Controller::rescanSource() -> CommandResult {
    if (store_.isTransferRunning()) {
        return type::fail(std::string(K_TRANSFER_RUNNING));
    }
    if (!devices_.rescanSource()) {
        return type::fail(std::string(K_SOURCE_BUSY));
    }
    return {};
}

auto Controller::startTransfer(const std::vector<std::string>& names)
    -> CommandResult {
    const config::Settings settings = settings_.load();
    auto begun = store_.tryBeginTransfer(names, settings.destinationLabel());
    if (begun.isError()) {
        spdlog::warn("Transfer rejected: {}", begun.error());
        return type::fail(begun.error());
    }

    std::lock_guard lock(jobMutex_);
    if (jobThread_.joinable()) {
        jobThread_.join();
    }
    jobThread_ = std::jthread(
        [this, files = std::move(begun).value(), settings]() mutable {
            try {
                std::unique_ptr<notify::Notifier> notifier =
                    notifierFactory_ ? notifierFactory_(settings) : nullptr;
                if (!notifier) {
                    notifier = std::make_unique<notify::NullNotifier>();
                }
                TransferJob job(std::move(files), devices_.paths().sourceMount,
                                devices_.paths().destinationMount, settings,
                                store_, bus_, *notifier, history_,
                                options_.transfer);
                job.run();
            } catch (const std::exception& e) {
                spdlog::error("Transfer could not start: {}", e.what());
                store_.updateTransfer([](TransferState& state) {
                    state.phase = TransferPhase::Idle;
                });
                bus_.emit(event::COMMAND_ERROR,
                          {{"message",
                            std::string("Transfer could not start: ") +
                                e.what()}});
            }
        });
    return {};
}

auto Controller::cancelTransfer() -> CommandResult {
    if (!store_.isTransferRunning()) {
        return type::fail(std::string("No transfer in progress"));
    }
    spdlog::info("Transfer cancellation requested");
    store_.requestCancel();
    return {};
}

auto Controller::clearFinished() -> CommandResult {
    if (!store_.clearFinished()) {
        return type::fail(std::string(K_TRANSFER_RUNNING));
    }
    return {};
}

auto Controller::runSpeedTest() -> CommandResult {
    if (!store_.isDestinationMounted()) {
        return type::fail(std::string("NAS not connected"));
    }
    return speedTest_.start(devices_.paths().destinationMount);
}

auto Controller::status() const -> json {
    json snapshot = store_.toJson();
    const config::Settings settings = settings_.load();
    snapshot["config"] = config::redactedJson(settings);
    snapshot["config_has_password"] = settings.hasPassword();
    snapshot["history"] = history_.load();
    return snapshot;
}

void Controller::broadcastStatus() { bus_.emit(event::STATUS, status()); }

auto Controller::attachObserver(Observer observer) -> EventBus::SubscriberId {
    return gateway_.attach(std::move(observer));
}

void Controller::detachObserver(EventBus::SubscriberId id) {
    gateway_.detach(id);
}

void Controller::waitForTransfer() {
    std::lock_guard lock(jobMutex_);
    if (jobThread_.joinable()) {
        jobThread_.join();
    }
}

void Controller::shutdown() {
    if (store_.isTransferRunning()) {
        spdlog::info("Cancelling running transfer for shutdown");
        store_.requestCancel();
    }
    waitForTransfer();
    speedTest_.wait();
}

}  // namespace offload::engine
