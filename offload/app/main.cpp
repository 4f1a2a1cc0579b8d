/*
 * main.cpp
 *
 * Copyright (C) 2026 offload contributors
 */

/*************************************************

Date: 2026-9-18

Description: offloadd, the unattended footage offload daemon

**************************************************/

#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <system_error>
#include <vector>

#include <pthread.h>

#include <spdlog/spdlog.h>

#include "offload/config/history.hpp"
#include "offload/config/settings.hpp"
#include "offload/connection/command_channel.hpp"
#include "offload/connection/event_fifo.hpp"
#include "offload/engine/controller.hpp"
#include "offload/engine/device_manager.hpp"
#include "offload/engine/events.hpp"
#include "offload/engine/state_store.hpp"
#include "offload/error/exception.hpp"
#include "offload/log/logging.hpp"
#include "offload/notify/notifier.hpp"
#include "offload/system/block_device.hpp"
#include "offload/system/mount.hpp"
#include "offload/utils/args.hpp"
#include "offload/web/webhook.hpp"

namespace fs = std::filesystem;
using namespace offload;

namespace {

auto buildParser() -> utils::ArgumentParser {
    utils::ArgumentParser parser("offloadd");
    parser.setDescription(
        "Copies footage from a USB volume to a network share, unattended.");
    parser.addArgument("config-dir", "Directory holding config.json and "
                                     "history.json",
                       "/etc/offloader");
    parser.addArgument("usb-mount", "Mount point of the source volume",
                       "/mnt/offloader/usb");
    parser.addArgument("nas-mount", "Mount point of the network share",
                       "/mnt/offloader/nas");
    parser.addArgument("command-fifo", "Named pipe for inbound commands",
                       "/run/offloader/commands");
    parser.addArgument("event-fifo", "Named pipe for outbound events",
                       "/run/offloader/events");
    parser.addArgument("log-file", "Rotating log file");
    parser.addArgument("log-level", "trace, debug, info, warn, error", "info");
    parser.addFlag("no-sudo", "Run mount and umount directly");
    return parser;
}

auto ensureDirectory(const fs::path& dir) -> bool {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        spdlog::warn("Cannot create {}: {}", dir.string(), ec.message());
        return false;
    }
    return true;
}

auto runDaemon(const utils::ArgumentParser& args) -> int {
    const fs::path configDir = *args.get("config-dir");
    engine::DevicePaths paths;
    paths.sourceMount = *args.get("usb-mount");
    paths.destinationMount = *args.get("nas-mount");

    ensureDirectory(configDir);
    ensureDirectory(paths.sourceMount);
    ensureDirectory(paths.destinationMount);

    config::SettingsStore settings(configDir / "config.json");
    settings.ensureExists();
    config::HistoryStore history(configDir / "history.json");

    engine::StateStore store;
    engine::EventBus bus;
    auto detector = system::DeviceDetector::create();
    system::CommandMountBackend backend(!args.getFlag("no-sudo"));
    engine::DeviceLifecycleManager devices(store, bus, *detector, backend,
                                           paths);

    notify::NotificationDispatcher dispatcher(
        std::make_shared<web::CurlWebhookSender>());
    engine::Controller controller(
        settings, history, store, bus, devices,
        [&dispatcher](const config::Settings& snapshot) {
            return std::make_unique<notify::WebhookNotifier>(
                dispatcher, snapshot.discordWebhook);
        });

    connection::EventFifoWriter events(
        *args.get("event-fifo"), [&controller] { return controller.status(); });
    events.create();
    const auto observerId = controller.attachObserver(
        [&events](std::string_view name, const nlohmann::json& payload) {
            events.write(name, payload);
        });

    devices.attachPresent();
    devices.start();

    connection::CommandChannel commands(
        *args.get("command-fifo"), [&](std::string_view line) {
            connection::handleCommandLine(controller, bus, line);
        });
    commands.start();

    spdlog::info("offloadd ready");

    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    int received = 0;
    if (sigwait(&signals, &received) != 0) {
        spdlog::error("sigwait failed");
    } else {
        spdlog::info("Received signal {}, shutting down", received);
    }

    commands.stop();
    devices.stop();
    controller.shutdown();
    controller.detachObserver(observerId);
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto parser = buildParser();
    try {
        const std::vector<const char*> rawArgs(argv, argv + argc);
        parser.parse(rawArgs);
    } catch (const error::Exception& e) {
        std::cerr << e.getMessage() << "\n\n" << parser.usage();
        return 2;
    }
    if (parser.helpRequested()) {
        std::cout << parser.usage();
        return 0;
    }

    offload::log::LogOptions logOptions;
    if (auto level = offload::log::parseLevel(*parser.get("log-level"))) {
        logOptions.level = *level;
    } else {
        std::cerr << "Unknown log level: " << *parser.get("log-level") << "\n";
        return 2;
    }
    if (auto file = parser.get("log-file")) {
        logOptions.file = fs::path(*file);
    }
    offload::log::setupLogging(logOptions);

    // Block the shutdown signals in every thread; main collects them with
    // sigwait. Writes to a FIFO whose reader left must not kill the daemon.
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);
    std::signal(SIGPIPE, SIG_IGN);

    try {
        return runDaemon(parser);
    } catch (const error::Exception& e) {
        spdlog::critical("Fatal: {}", e.what());
    } catch (const std::exception& e) {
        spdlog::critical("Fatal: {}", e.what());
    }
    return 1;
}
