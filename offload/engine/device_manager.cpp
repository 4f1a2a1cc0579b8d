/*
 * device_manager.cpp
 *
 * Copyright (C) 2026 offload contributors
 */

/*************************************************

Date: 2026-9-13

Description: Source volume and destination share lifecycle, hot-plug
polling

**************************************************/

#include "device_manager.hpp"

#include <algorithm>
#include <iterator>

#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace offload::engine {

namespace {
// Holds the store's source claim for the lifetime of a mutation.
class SourceReservation {
public:
    explicit SourceReservation(StateStore& store)
        : store_(store), held_(store.tryReserveSource()) {}
    ~SourceReservation() {
        if (held_) {
            store_.releaseSource();
        }
    }
    SourceReservation(const SourceReservation&) = delete;
    SourceReservation& operator=(const SourceReservation&) = delete;

    explicit operator bool() const { return held_; }

private:
    StateStore& store_;
    bool held_;
};
}  // namespace

DeviceLifecycleManager::DeviceLifecycleManager(StateStore& store,
                                               EventSink& events,
                                               system::DeviceDetector& detector,
                                               system::MountBackend& backend,
                                               DevicePaths paths,
                                               PollOptions options)
    : store_(store),
      events_(events),
      detector_(detector),
      backend_(backend),
      paths_(std::move(paths)),
      options_(std::move(options)) {}

DeviceLifecycleManager::~DeviceLifecycleManager() { stop(); }

auto DeviceLifecycleManager::detect() -> std::vector<system::Device> {
    try {
        return detector_.detect();
    } catch (const std::exception& e) {
        spdlog::warn("USB detection failed: {}", e.what());
        return {};
    }
}

auto DeviceLifecycleManager::mountSourceOnce(const system::Device& device)
    -> system::MountResult {
    std::lock_guard lock(mountMutex_);
    backend_.unmount(paths_.sourceMount, false);

    system::MountRequest request;
    request.source = device.path;
    request.target = paths_.sourceMount;
    request.readOnly = true;
    return backend_.mount(request);
}

auto DeviceLifecycleManager::mountSource(const system::Device& device,
                                         int retries,
                                         std::chrono::milliseconds delay)
    -> system::MountResult {
    const int attempts = std::max(retries, 1);
    system::MountResult result;
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        result = mountSourceOnce(device);
        if (result.isSuccess()) {
            spdlog::info("Mounted {} at {}", device.path,
                         paths_.sourceMount.string());
            return result;
        }
        if (attempt < attempts) {
            spdlog::info(
                "Mount attempt {}/{} failed for {}, retrying in {}ms...",
                attempt, attempts, device.path, delay.count());
            std::this_thread::sleep_for(delay);
        }
    }
    spdlog::warn("Giving up on {}: {}", device.path, result.error().detail);
    return result;
}

void DeviceLifecycleManager::unmountSource() {
    {
        std::lock_guard lock(mountMutex_);
        backend_.unmount(paths_.sourceMount, true);
    }
    store_.clearSource();
    spdlog::info("USB drive unmounted");
}

auto DeviceLifecycleManager::mountDestination(const config::Settings& settings)
    -> system::MountResult {
    system::MountResult result;
    {
        std::lock_guard lock(mountMutex_);
        backend_.unmount(paths_.destinationMount, true);
        result = backend_.mount(
            system::buildDestinationRequest(settings, paths_.destinationMount));
    }
    store_.setDestinationMounted(result.isSuccess());
    if (result.isSuccess()) {
        spdlog::info("NAS share {} mounted", settings.shareAddress());
    } else {
        spdlog::error("NAS mount of {} failed: {}", settings.shareAddress(),
                      result.error().detail);
    }
    return result;
}

void DeviceLifecycleManager::unmountDestination() {
    {
        std::lock_guard lock(mountMutex_);
        backend_.unmount(paths_.destinationMount, true);
    }
    store_.setDestinationMounted(false);
    spdlog::info("NAS share unmounted");
}

auto DeviceLifecycleManager::attachSource(const system::Device& device)
    -> bool {
    auto result =
        mountSource(device, options_.mountRetries, options_.retryDelay);
    if (result.isError()) {
        spdlog::error("Failed to mount {}: {}", device.path,
                      result.error().detail);
        events_.emit(event::DEVICE_ERROR, {{"device", device.path},
                                           {"error", result.error().detail}});
        return false;
    }

    system::Device mounted = device;
    mounted.mountPoint = paths_.sourceMount.string();
    auto files = system::scanFiles(paths_.sourceMount, options_.scan);
    spdlog::info("Drive connected: {} with {} file(s)", mounted.toString(),
                 files.size());
    store_.setSource(mounted, std::move(files));

    const FileList list = store_.files();
    events_.emit(event::DEVICE_CONNECTED,
                 {{"device", mounted}, {"files", *list}});
    return true;
}

auto DeviceLifecycleManager::rescanSource() -> bool {
    SourceReservation reservation(store_);
    if (!reservation) {
        spdlog::info("Rescan skipped: USB drive is in use");
        return false;
    }

    if (store_.isSourceMounted()) {
        store_.setFiles(system::scanFiles(paths_.sourceMount, options_.scan));
        const FileList list = store_.files();
        spdlog::info("Rescan found {} file(s)", list->size());
        events_.emit(event::FILES_UPDATED, {{"files", *list}});
        return true;
    }

    auto devices = detect();
    if (devices.empty()) {
        spdlog::info("Rescan: no USB drives detected");
        events_.emit(event::DEVICE_DISCONNECTED, json::object());
        return true;
    }
    spdlog::info("Rescan: found {}, attempting mount...",
                 devices.front().toString());
    attachSource(devices.front());
    return true;
}

auto DeviceLifecycleManager::attachPresent() -> bool {
    SourceReservation reservation(store_);
    if (!reservation) {
        return false;
    }
    auto devices = detect();
    knownDevices_ = pathsOf(devices);
    if (devices.empty()) {
        spdlog::info("Startup: no USB drives detected");
        return false;
    }
    spdlog::info("Startup: found {}, mounting...", devices.front().toString());
    return attachSource(devices.front());
}

void DeviceLifecycleManager::pollOnce() {
    if (store_.isTransferRunning()) {
        return;
    }

    auto devices = detect();
    auto current = pathsOf(devices);
    if (current == knownDevices_) {
        return;
    }

    // A job admitted after the check above wins; the change is picked up
    // on the first tick after it ends.
    SourceReservation reservation(store_);
    if (!reservation) {
        return;
    }

    std::set<std::string> added;
    std::set_difference(current.begin(), current.end(), knownDevices_.begin(),
                        knownDevices_.end(),
                        std::inserter(added, added.begin()));
    if (!added.empty()) {
        spdlog::info("New USB device(s) detected: {}", added.size());
        std::this_thread::sleep_for(options_.settleDelay);
        devices = detect();
        current = pathsOf(devices);

        for (const auto& device : devices) {
            if (added.contains(device.path)) {
                attachSource(device);
                break;
            }
        }
    }

    std::set<std::string> removed;
    std::set_difference(knownDevices_.begin(), knownDevices_.end(),
                        current.begin(), current.end(),
                        std::inserter(removed, removed.begin()));
    if (!removed.empty() && store_.isSourceMounted()) {
        spdlog::info("USB device removed: {}", *removed.begin());
        unmountSource();
        events_.emit(event::DEVICE_DISCONNECTED, json::object());
    }

    knownDevices_ = std::move(current);
}

void DeviceLifecycleManager::start() {
    if (pollThread_.joinable()) {
        spdlog::warn("Device polling already running");
        return;
    }
    pollThread_ =
        std::jthread([this](std::stop_token stopToken) { pollLoop(stopToken); });
    spdlog::info("Device polling started ({}ms interval)",
                 options_.interval.count());
}

void DeviceLifecycleManager::stop() {
    if (!pollThread_.joinable()) {
        return;
    }
    pollThread_.request_stop();
    waitCv_.notify_all();
    pollThread_.join();
    spdlog::info("Device polling stopped");
}

auto DeviceLifecycleManager::isPolling() const -> bool {
    return pollThread_.joinable();
}

void DeviceLifecycleManager::pollLoop(std::stop_token stopToken) {
    while (!stopToken.stop_requested()) {
        try {
            pollOnce();
        } catch (const std::exception& e) {
            spdlog::error("Device poll error: {}", e.what());
        }

        std::unique_lock lock(waitMutex_);
        waitCv_.wait_for(lock, stopToken, options_.interval,
                         [] { return false; });
    }
}

auto DeviceLifecycleManager::pathsOf(const std::vector<system::Device>& devices)
    -> std::set<std::string> {
    std::set<std::string> paths;
    for (const auto& device : devices) {
        paths.insert(device.path);
    }
    return paths;
}

}  // namespace offload::engine
