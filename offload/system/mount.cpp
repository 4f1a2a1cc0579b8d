/*
 * mount.cpp
 *
 * Copyright (C) 2026 offload contributors
 */

/*************************************************

Date: 2026-9-8

Description: Mount and unmount through the system mount tools

**************************************************/

#include "mount.hpp"

#include <format>
#include <system_error>

#include <spdlog/spdlog.h>

#include "offload/config/settings.hpp"
#include "offload/error/exception.hpp"
#include "offload/system/process.hpp"

namespace fs = std::filesystem;

namespace offload::system {

namespace {
constexpr const char* K_CIFS_PERMISSIONS =
    "uid=0,gid=0,file_mode=0777,dir_mode=0777";

auto trimmed(std::string text) -> std::string {
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r' ||
                             text.back() == ' ')) {
        text.pop_back();
    }
    return text;
}

auto runPrivileged(bool useSudo, const std::string& tool,
                   std::vector<std::string> args,
                   std::chrono::milliseconds timeout) -> ProcessResult {
    if (!useSudo) {
        return runProcess(tool, args, timeout);
    }
    args.insert(args.begin(), {"-n", tool});
    return runProcess("sudo", args, timeout);
}
}  // namespace

auto toString(MountErrorKind kind) -> const char* {
    switch (kind) {
        case MountErrorKind::CommandFailed:
            return "command failed";
        case MountErrorKind::Timeout:
            return "timeout";
        case MountErrorKind::SpawnFailed:
            return "spawn failed";
    }
    return "unknown";
}

auto buildMountArgs(const MountRequest& request) -> std::vector<std::string> {
    std::vector<std::string> args;
    if (!request.fsType.empty()) {
        args.emplace_back("-t");
        args.push_back(request.fsType);
    }

    std::string options = request.readOnly ? "ro" : "";
    if (!request.options.empty()) {
        if (!options.empty()) {
            options += ',';
        }
        options += request.options;
    }
    if (!options.empty()) {
        args.emplace_back("-o");
        args.push_back(std::move(options));
    }

    args.push_back(request.source);
    args.push_back(request.target.string());
    return args;
}

auto buildDestinationRequest(const config::Settings& settings,
                             const fs::path& target) -> MountRequest {
    std::string options = std::format("vers={}", settings.smbVersion);
    if (!settings.smbUsername.empty()) {
        options += std::format(",username={},password={}",
                               settings.smbUsername, settings.smbPassword);
    } else {
        options += ",guest";
    }
    options += ',';
    options += K_CIFS_PERMISSIONS;

    MountRequest request;
    request.source = settings.shareAddress();
    request.target = target;
    request.fsType = "cifs";
    request.options = std::move(options);
    return request;
}

CommandMountBackend::CommandMountBackend(bool useSudo) : useSudo_(useSudo) {}

auto CommandMountBackend::mount(const MountRequest& request) -> MountResult {
    std::error_code ec;
    fs::create_directories(request.target, ec);
    if (ec) {
        spdlog::warn("Cannot create mount point {}: {}",
                     request.target.string(), ec.message());
    }

    ProcessResult result;
    try {
        result = runPrivileged(useSudo_, "mount", buildMountArgs(request),
                               K_MOUNT_TIMEOUT);
    } catch (const error::Exception& e) {
        spdlog::error("Cannot run mount: {}", e.getMessage());
        return type::fail(
            MountError{MountErrorKind::SpawnFailed, e.getMessage()});
    }

    if (result.timedOut) {
        spdlog::warn("mount {} timed out after {}s", request.source,
                     K_MOUNT_TIMEOUT.count());
        return type::fail(MountError{
            MountErrorKind::Timeout,
            std::format("mount timed out after {}s", K_MOUNT_TIMEOUT.count())});
    }
    if (result.exitCode == 127) {
        return type::fail(MountError{MountErrorKind::SpawnFailed,
                                     trimmed(result.stderrText)});
    }
    if (result.exitCode != 0) {
        std::string detail = trimmed(result.stderrText);
        spdlog::warn("mount {} on {} failed ({}): {}", request.source,
                     request.target.string(), result.exitCode, detail);
        return type::fail(
            MountError{MountErrorKind::CommandFailed, std::move(detail)});
    }

    spdlog::info("Mounted {} at {}", request.source, request.target.string());
    return {};
}

void CommandMountBackend::unmount(const fs::path& target, bool lazy) {
    std::vector<std::string> args;
    if (lazy) {
        args.emplace_back("-l");
    }
    args.push_back(target.string());

    try {
        auto result = runPrivileged(useSudo_, "umount", std::move(args),
                                    K_UNMOUNT_TIMEOUT);
        if (result.timedOut) {
            spdlog::warn("umount {} timed out", target.string());
        } else if (result.exitCode != 0) {
            // Expected when nothing is mounted there.
            spdlog::debug("umount {} exited with {}: {}", target.string(),
                          result.exitCode, trimmed(result.stderrText));
        } else {
            spdlog::info("Unmounted {}", target.string());
        }
    } catch (const error::Exception& e) {
        spdlog::error("Cannot run umount: {}", e.getMessage());
    }
}

}  // namespace offload::system
