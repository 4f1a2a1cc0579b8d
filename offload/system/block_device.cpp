/*
 * block_device.cpp
 *
 * Copyright (C) 2026 offload contributors
 */

/*************************************************

Date: 2026-9-8

Description: Removable block device enumeration (lsblk + by-id fallback)

**************************************************/

#include "block_device.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <format>
#include <set>
#include <system_error>

#include <libudev.h>
#include <sys/stat.h>

#include <spdlog/spdlog.h>

#include "offload/system/process.hpp"
#include "offload/utils/format.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace offload::system {

namespace {
constexpr const char* K_DEFAULT_MODEL = "USB Drive";
constexpr const char* K_UNKNOWN_SIZE = "?";
constexpr const char* K_BY_ID_PREFIX = "usb-";
constexpr const char* K_PARTITION_MARKER = "-part";
constexpr unsigned long long K_SECTOR_SIZE = 512;

auto trim(std::string_view text) -> std::string {
    auto isSpace = [](unsigned char c) { return std::isspace(c) != 0; };
    auto begin = std::find_if_not(text.begin(), text.end(), isSpace);
    auto end = std::find_if_not(text.rbegin(), text.rend(), isSpace).base();
    if (begin >= end) {
        return {};
    }
    return std::string(begin, end);
}

auto stringField(const json& node, const char* key) -> std::string {
    auto it = node.find(key);
    if (it == node.end() || !it->is_string()) {
        return {};
    }
    return trim(it->get<std::string>());
}

// Older lsblk prints RM as "0"/"1", newer releases as a JSON boolean.
auto removableFlag(const json& node) -> bool {
    auto it = node.find("rm");
    if (it == node.end()) {
        return false;
    }
    if (it->is_boolean()) {
        return it->get<bool>();
    }
    if (it->is_string()) {
        return trim(it->get<std::string>()) == "1";
    }
    if (it->is_number_integer()) {
        return it->get<int>() != 0;
    }
    return false;
}

struct UdevDeleter {
    void operator()(udev* handle) const noexcept { udev_unref(handle); }
};

struct UdevDeviceDeleter {
    void operator()(udev_device* device) const noexcept {
        udev_device_unref(device);
    }
};

auto startsWith(std::string_view text, std::string_view prefix) -> bool {
    return text.substr(0, prefix.size()) == prefix;
}
}  // namespace

auto Device::toString() const -> std::string {
    return std::format("{} ({}, {}, {})", path, model, size,
                       fsType.empty() ? "unknown fs" : fsType);
}

void to_json(json& j, const Device& device) {
    j = json{{"device", device.path},
             {"size", device.size},
             {"model", device.model},
             {"fstype", device.fsType}};
    if (device.mountPoint) {
        j["mountpoint"] = *device.mountPoint;
    } else {
        j["mountpoint"] = nullptr;
    }
}

auto parseLsblkJson(std::string_view text) -> std::vector<Device> {
    std::vector<Device> devices;
    const json root = json::parse(text);
    auto blockDevices = root.find("blockdevices");
    if (blockDevices == root.end() || !blockDevices->is_array()) {
        return devices;
    }

    for (const auto& disk : *blockDevices) {
        std::string tran = stringField(disk, "tran");
        std::transform(tran.begin(), tran.end(), tran.begin(),
                       [](unsigned char c) { return std::tolower(c); });
        std::string model = stringField(disk, "model");

        const bool usbTransport = tran == "usb";
        const bool bridgeAdapter =
            tran.empty() && !model.empty() && removableFlag(disk);
        if (!usbTransport && !bridgeAdapter) {
            continue;
        }
        if (model.empty()) {
            model = K_DEFAULT_MODEL;
        }

        std::vector<const json*> targets;
        auto children = disk.find("children");
        if (children != disk.end() && children->is_array() &&
            !children->empty()) {
            for (const auto& child : *children) {
                targets.push_back(&child);
            }
        } else {
            targets.push_back(&disk);
        }

        for (const json* part : targets) {
            const std::string type = stringField(*part, "type");
            if (type != "part" && type != "disk") {
                continue;
            }
            const std::string name = stringField(*part, "name");
            if (name.empty()) {
                continue;
            }

            Device device;
            device.path = startsWith(name, "/dev/") ? name : "/dev/" + name;
            device.size = stringField(*part, "size");
            if (device.size.empty()) {
                device.size = K_UNKNOWN_SIZE;
            }
            device.model = model;
            device.fsType = stringField(*part, "fstype");
            std::string mountPoint = stringField(*part, "mountpoint");
            if (!mountPoint.empty()) {
                device.mountPoint = std::move(mountPoint);
            }
            devices.push_back(std::move(device));
        }
    }
    return devices;
}

auto scanByIdDirectory(const fs::path& directory, const PropertyLookup& lookup)
    -> std::vector<Device> {
    std::vector<Device> devices;
    std::error_code ec;
    if (!fs::is_directory(directory, ec)) {
        return devices;
    }

    std::vector<std::string> links;
    for (const auto& entry : fs::directory_iterator(directory, ec)) {
        std::string name = entry.path().filename().string();
        if (startsWith(name, K_BY_ID_PREFIX)) {
            links.push_back(std::move(name));
        }
    }
    if (ec) {
        spdlog::warn("Cannot list {}: {}", directory.string(), ec.message());
        return devices;
    }
    std::sort(links.begin(), links.end());

    std::set<std::string> seen;
    for (const auto& name : links) {
        if (name.find(K_PARTITION_MARKER) == std::string::npos) {
            const std::string partitionPrefix = name + K_PARTITION_MARKER;
            const bool hasPartition = std::any_of(
                links.begin(), links.end(), [&](const std::string& other) {
                    return startsWith(other, partitionPrefix);
                });
            if (hasPartition) {
                continue;
            }
        }

        std::error_code resolveEc;
        const fs::path node = fs::canonical(directory / name, resolveEc);
        if (resolveEc) {
            spdlog::debug("Skipping dangling by-id link {}: {}", name,
                          resolveEc.message());
            continue;
        }
        if (!seen.insert(node.string()).second) {
            continue;
        }

        Device device;
        device.path = node.string();
        device.size = K_UNKNOWN_SIZE;
        device.model = K_DEFAULT_MODEL;
        if (lookup) {
            if (auto props = lookup(device.path)) {
                if (!props->size.empty()) {
                    device.size = props->size;
                }
                if (!props->model.empty()) {
                    device.model = props->model;
                }
                device.fsType = props->fsType;
            }
        }
        devices.push_back(std::move(device));
    }
    return devices;
}

auto udevProperties(const std::string& node)
    -> std::optional<DeviceProperties> {
    struct stat st {};
    if (::stat(node.c_str(), &st) != 0 || !S_ISBLK(st.st_mode)) {
        return std::nullopt;
    }

    std::unique_ptr<udev, UdevDeleter> context(udev_new());
    if (!context) {
        spdlog::warn("udev_new failed");
        return std::nullopt;
    }
    std::unique_ptr<udev_device, UdevDeviceDeleter> device(
        udev_device_new_from_devnum(context.get(), 'b', st.st_rdev));
    if (!device) {
        return std::nullopt;
    }

    DeviceProperties props;
    if (const char* fsType =
            udev_device_get_property_value(device.get(), "ID_FS_TYPE")) {
        props.fsType = fsType;
    }
    if (const char* model =
            udev_device_get_property_value(device.get(), "ID_MODEL")) {
        props.model = trim(model);
        std::replace(props.model.begin(), props.model.end(), '_', ' ');
    }
    if (const char* sectors =
            udev_device_get_sysattr_value(device.get(), "size")) {
        std::string_view text(sectors);
        unsigned long long count = 0;
        auto [ptr, errc] =
            std::from_chars(text.data(), text.data() + text.size(), count);
        if (errc == std::errc{} && count > 0) {
            props.size = utils::humanSize(
                static_cast<double>(count * K_SECTOR_SIZE));
        }
    }
    return props;
}

LsblkDeviceDetector::LsblkDeviceDetector(fs::path byIdDirectory,
                                   PropertyLookup lookup)
    : byIdDirectory_(std::move(byIdDirectory)), lookup_(std::move(lookup)) {}

auto LsblkDeviceDetector::detect() -> std::vector<Device> {
    std::vector<Device> devices;
    try {
        auto result = runProcess("lsblk", {"-J", "-o", K_LSBLK_COLUMNS},
                                 K_LSBLK_TIMEOUT);
        if (result.timedOut) {
            spdlog::warn("lsblk timed out after {}s", K_LSBLK_TIMEOUT.count());
        } else if (result.exitCode != 0) {
            spdlog::warn("lsblk exited with {}: {}", result.exitCode,
                         trim(result.stderrText));
        } else if (!trim(result.stdoutText).empty()) {
            devices = parseLsblkJson(result.stdoutText);
        }
    } catch (const std::exception& e) {
        spdlog::warn("lsblk detection failed: {}", e.what());
    }

    if (devices.empty()) {
        try {
            devices = scanByIdDirectory(byIdDirectory_, lookup_);
        } catch (const std::exception& e) {
            spdlog::warn("Fallback USB detection failed: {}", e.what());
        }
    }
    return devices;
}

auto DeviceDetector::create() -> std::unique_ptr<DeviceDetector> {
    return std::make_unique<LsblkDeviceDetector>();
}

}  // namespace offload::system
