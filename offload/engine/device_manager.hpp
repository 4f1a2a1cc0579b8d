/*
 * device_manager.hpp
 *
 * Copyright (C) 2026 offload contributors
 */

/*************************************************

Date: 2026-9-13

Description: Source volume and destination share lifecycle, hot-plug
polling

**************************************************/

#ifndef OFFLOAD_ENGINE_DEVICE_MANAGER_HPP
#define OFFLOAD_ENGINE_DEVICE_MANAGER_HPP

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <mutex>
#include <set>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#include "offload/config/settings.hpp"
#include "offload/engine/events.hpp"
#include "offload/engine/state_store.hpp"
#include "offload/system/block_device.hpp"
#include "offload/system/file_scan.hpp"
#include "offload/system/mount.hpp"

namespace offload::engine {

struct DevicePaths {
    std::filesystem::path sourceMount{"/mnt/offloader/usb"};
    std::filesystem::path destinationMount{"/mnt/offloader/nas"};
};

struct PollOptions {
    std::chrono::milliseconds interval{2000};
    /// Wait after a new device shows up before detecting again, so the
    /// kernel can finish registering partitions.
    std::chrono::milliseconds settleDelay{1000};
    int mountRetries{3};
    std::chrono::milliseconds retryDelay{1500};
    system::ScanOptions scan;
};

/**
 * @brief Detects, mounts and tracks the source volume and the destination
 * share.
 *
 * Every mount and unmount goes through one lock. Poll ticks, rescans and
 * the startup attach change the device fields only while holding the
 * store's source reservation, which is never granted during a transfer and
 * blocks admission of a new one while held.
 */
class DeviceLifecycleManager {
public:
    DeviceLifecycleManager(StateStore& store, EventSink& events,
                           system::DeviceDetector& detector,
                           system::MountBackend& backend,
                           DevicePaths paths = {}, PollOptions options = {});
    ~DeviceLifecycleManager();

    DeviceLifecycleManager(const DeviceLifecycleManager&) = delete;
    DeviceLifecycleManager& operator=(const DeviceLifecycleManager&) = delete;

    /**
     * @brief Enumerates candidate source devices. Never throws.
     */
    auto detect() -> std::vector<system::Device>;

    /**
     * @brief Mounts @p device read-only at the source mount point.
     *
     * Each attempt unmounts whatever is mounted there first. Up to
     * @p retries attempts are made, @p delay apart.
     *
     * @return The error of the last attempt if all of them failed.
     */
    auto mountSource(const system::Device& device, int retries,
                     std::chrono::milliseconds delay) -> system::MountResult;

    /**
     * @brief Lazily unmounts the source and clears the device and files.
     */
    void unmountSource();

    auto mountDestination(const config::Settings& settings)
        -> system::MountResult;
    void unmountDestination();

    /**
     * @brief Mounts with retry, scans and publishes the device.
     *
     * Emits device_connected on success and device_error on failure. The
     * caller holds the source reservation.
     */
    auto attachSource(const system::Device& device) -> bool;

    /**
     * @brief Rescans a mounted source, or looks for a device to attach.
     *
     * @return False, with nothing changed, while a transfer runs or another
     * source update is in flight.
     */
    auto rescanSource() -> bool;

    /**
     * @brief Attaches a device that is already present at startup and
     * records the present devices as known to the poll loop.
     */
    auto attachPresent() -> bool;

    /**
     * @brief One iteration of the hot-plug poll. Exceptions propagate.
     */
    void pollOnce();

    void start();
    void stop();

    [[nodiscard]] auto isPolling() const -> bool;
    [[nodiscard]] auto paths() const -> const DevicePaths& { return paths_; }

private:
    void pollLoop(std::stop_token stopToken);
    auto mountSourceOnce(const system::Device& device) -> system::MountResult;
    static auto pathsOf(const std::vector<system::Device>& devices)
        -> std::set<std::string>;

    StateStore& store_;
    EventSink& events_;
    system::DeviceDetector& detector_;
    system::MountBackend& backend_;
    DevicePaths paths_;
    PollOptions options_;

    std::mutex mountMutex_;
    std::set<std::string> knownDevices_;  ///< Poll thread only

    std::mutex waitMutex_;
    std::condition_variable_any waitCv_;
    std::jthread pollThread_;
};

}  // namespace offload::engine

#endif  // OFFLOAD_ENGINE_DEVICE_MANAGER_HPP
