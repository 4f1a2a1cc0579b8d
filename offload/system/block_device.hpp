/*
 * block_device.hpp
 *
 * Copyright (C) 2026 offload contributors
 */

/*************************************************

Date: 2026-9-8

Description: Removable block device enumeration (lsblk + by-id fallback)

**************************************************/

#ifndef OFFLOAD_SYSTEM_BLOCK_DEVICE_HPP
#define OFFLOAD_SYSTEM_BLOCK_DEVICE_HPP

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace offload::system {

/**
 * @brief A removable volume that can be mounted as the transfer source.
 */
struct Device {
    std::string path;    ///< Canonical device node, e.g. "/dev/sdb1"
    std::string size;    ///< Coarse size label, e.g. "58.6G"
    std::string model;   ///< Model string, "USB Drive" when unknown
    std::string fsType;  ///< Filesystem type, may be empty
    std::optional<std::string> mountPoint;

    [[nodiscard]] auto toString() const -> std::string;

    bool operator==(const Device& other) const = default;
};

void to_json(nlohmann::json& j, const Device& device);

/**
 * @brief Properties of a block device node as reported by udev.
 */
struct DeviceProperties {
    std::string fsType;
    std::string model;
    std::string size;
};

using PropertyLookup =
    std::function<std::optional<DeviceProperties>(const std::string& node)>;

/**
 * @brief Platform interface for block device enumeration.
 *
 * detect() is side-effect free and never throws; on any failure it returns
 * an empty list.
 */
class DeviceDetector {
public:
    virtual ~DeviceDetector() = default;

    [[nodiscard]] virtual auto detect() -> std::vector<Device> = 0;

    /**
     * @brief Creates the detector for the current platform.
     */
    static auto create() -> std::unique_ptr<DeviceDetector>;
};

/**
 * @brief Extracts USB volumes from `lsblk -J` output.
 *
 * A disk reporting USB transport contributes its partitions, or itself when
 * it has none. A disk reporting no transport is accepted when it has a model
 * name and the removable flag set.
 *
 * @throws nlohmann::json::exception on malformed input.
 */
[[nodiscard]] auto parseLsblkJson(std::string_view text) -> std::vector<Device>;

/**
 * @brief Resolves `usb-*` links in a by-id directory to device nodes.
 *
 * A whole-disk link is skipped when partition links for the same disk
 * exist. Missing directories give an empty list.
 */
[[nodiscard]] auto scanByIdDirectory(const std::filesystem::path& directory,
                                     const PropertyLookup& lookup)
    -> std::vector<Device>;

/**
 * @brief Reads ID_FS_TYPE, ID_MODEL and the sector count through libudev.
 */
[[nodiscard]] auto udevProperties(const std::string& node)
    -> std::optional<DeviceProperties>;

/**
 * @brief Linux detector: lsblk first, /dev/disk/by-id when lsblk finds nothing.
 */
class LsblkDeviceDetector : public DeviceDetector {
public:
    static constexpr std::chrono::seconds K_LSBLK_TIMEOUT{5};
    static constexpr const char* K_LSBLK_COLUMNS =
        "NAME,SIZE,TYPE,MOUNTPOINT,TRAN,MODEL,FSTYPE,RM";

    explicit LsblkDeviceDetector(
        std::filesystem::path byIdDirectory = "/dev/disk/by-id",
        PropertyLookup lookup = udevProperties);

    [[nodiscard]] auto detect() -> std::vector<Device> override;

private:
    std::filesystem::path byIdDirectory_;
    PropertyLookup lookup_;
};

}  // namespace offload::system

#endif  // OFFLOAD_SYSTEM_BLOCK_DEVICE_HPP
