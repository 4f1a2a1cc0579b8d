/*
 * mount.hpp
 *
 * Copyright (C) 2026 offload contributors
 */

/*************************************************

Date: 2026-9-8

Description: Mount and unmount through the system mount tools

**************************************************/

#ifndef OFFLOAD_SYSTEM_MOUNT_HPP
#define OFFLOAD_SYSTEM_MOUNT_HPP

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

#include "offload/type/result.hpp"

namespace offload::config {
struct Settings;
}

namespace offload::system {

enum class MountErrorKind {
    CommandFailed,  ///< The mount tool ran and reported failure
    Timeout,        ///< The mount tool did not finish in time
    SpawnFailed     ///< The mount tool could not be started
};

[[nodiscard]] auto toString(MountErrorKind kind) -> const char*;

struct MountError {
    MountErrorKind kind{MountErrorKind::CommandFailed};
    std::string detail;  ///< Raw stderr of the mount tool, or a reason
};

using MountResult = type::Result<void, MountError>;

struct MountRequest {
    std::string source;  ///< Device node or "//host/share"
    std::filesystem::path target;
    std::string fsType;   ///< Passed as `-t`, empty lets mount detect it
    std::string options;  ///< Passed as `-o`, without "ro"
    bool readOnly{false};
};

/**
 * @brief Platform interface for mounting volumes.
 */
class MountBackend {
public:
    virtual ~MountBackend() = default;

    virtual auto mount(const MountRequest& request) -> MountResult = 0;

    /**
     * @brief Best effort unmount. Failures (e.g. nothing mounted) are only
     * logged.
     * @param lazy Detach now and clean up once the mount is no longer busy.
     */
    virtual void unmount(const std::filesystem::path& target, bool lazy) = 0;
};

/**
 * @brief Builds the argument vector for mount(8).
 */
[[nodiscard]] auto buildMountArgs(const MountRequest& request)
    -> std::vector<std::string>;

/**
 * @brief Builds the CIFS mount request for the configured share.
 *
 * Uses the tunneled or local host as selected, guest access when no
 * username is set.
 */
[[nodiscard]] auto buildDestinationRequest(const config::Settings& settings,
                                           const std::filesystem::path& target)
    -> MountRequest;

/**
 * @brief Runs mount(8) and umount(8), optionally through sudo.
 */
class CommandMountBackend : public MountBackend {
public:
    static constexpr std::chrono::seconds K_MOUNT_TIMEOUT{30};
    static constexpr std::chrono::seconds K_UNMOUNT_TIMEOUT{15};

    explicit CommandMountBackend(bool useSudo = true);

    auto mount(const MountRequest& request) -> MountResult override;
    void unmount(const std::filesystem::path& target, bool lazy) override;

private:
    bool useSudo_;
};

}  // namespace offload::system

#endif  // OFFLOAD_SYSTEM_MOUNT_HPP
