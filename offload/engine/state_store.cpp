/*
 * state_store.cpp
 *
 * Copyright (C) 2026 offload contributors
 */

/*************************************************

Date: 2026-9-10

Description: Shared device and transfer state with copy-on-read snapshots

**************************************************/

#include "state_store.hpp"

#include <chrono>
#include <numeric>
#include <unordered_map>

#include <spdlog/spdlog.h>

#include "offload/utils/format.hpp"

using json = nlohmann::json;

namespace offload::engine {

namespace {
auto emptyFileList() -> FileList {
    return std::make_shared<const std::vector<system::FileEntry>>();
}

auto epochSeconds() -> double {
    return std::chrono::duration<double>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}
}  // namespace

auto toString(TransferPhase phase) -> const char* {
    switch (phase) {
        case TransferPhase::Idle:
            return "idle";
        case TransferPhase::Running:
            return "running";
        case TransferPhase::Completed:
            return "completed";
        case TransferPhase::Cancelled:
            return "cancelled";
    }
    return "unknown";
}

void to_json(json& j, const FinishSummary& summary) {
    j = json{{"total_files", summary.totalFiles},
             {"completed_files", summary.completedFiles},
             {"total_size", summary.totalBytes},
             {"total_size_human", summary.totalSizeHuman},
             {"duration_seconds", summary.durationSeconds},
             {"duration", summary.duration},
             {"avg_speed_bps", summary.avgSpeed},
             {"avg_speed", summary.avgSpeedHuman},
             {"destination", summary.destination},
             {"errors", summary.errors}};
}

void to_json(json& j, const TransferState& state) {
    j = json{{"active", state.active()},
             {"phase", toString(state.phase)},
             {"finished", state.finished},
             {"started_at", state.startedAt},
             {"total_files", state.totalFiles},
             {"completed_files", state.completedFiles},
             {"current_file", state.currentFile},
             {"current_file_index", state.currentFileIndex},
             {"current_file_percent", state.currentFilePercent},
             {"total_bytes", state.totalBytes},
             {"bytes_done", state.bytesDone},
             {"overall_percent", state.overallPercent},
             {"errors", state.errors},
             {"destination", state.destination},
             {"file_list", state.fileList},
             {"completed_list", state.completedList}};
    if (state.speed) {
        j["speed_bps"] = *state.speed;
        j["speed_human"] = utils::humanSpeed(*state.speed);
    } else {
        j["speed_bps"] = nullptr;
        j["speed_human"] = "";
    }
    j["eta_seconds"] = state.eta ? json(*state.eta) : json(nullptr);
    j["eta_human"] = utils::formatEta(state.eta);
    j["finish_summary"] =
        state.summary ? json(*state.summary) : json(nullptr);
}

StateStore::StateStore() { device_.files = emptyFileList(); }

auto StateStore::snapshot() const -> Snapshot {
    std::shared_lock lock(mutex_);
    return Snapshot{device_, transfer_};
}

auto StateStore::deviceState() const -> DeviceState {
    std::shared_lock lock(mutex_);
    return device_;
}

auto StateStore::transfer() const -> TransferState {
    std::shared_lock lock(mutex_);
    return transfer_;
}

auto StateStore::files() const -> FileList {
    std::shared_lock lock(mutex_);
    return device_.files;
}

auto StateStore::toJson() const -> json {
    const Snapshot snap = snapshot();
    json j;
    j["drive"] = snap.device.device ? json(*snap.device.device) : json(nullptr);
    j["drive_mounted"] = snap.device.driveMounted;
    j["nas_mounted"] = snap.device.nasMounted;
    j["files"] = snap.device.files ? json(*snap.device.files) : json::array();
    j["transfer"] = snap.transfer;
    return j;
}

auto StateStore::isSourceMounted() const -> bool {
    std::shared_lock lock(mutex_);
    return device_.driveMounted;
}

auto StateStore::isDestinationMounted() const -> bool {
    std::shared_lock lock(mutex_);
    return device_.nasMounted;
}

auto StateStore::isTransferRunning() const -> bool {
    std::shared_lock lock(mutex_);
    return transfer_.active();
}

void StateStore::setSource(system::Device device,
                           std::vector<system::FileEntry> files) {
    auto list =
        std::make_shared<const std::vector<system::FileEntry>>(std::move(files));
    std::unique_lock lock(mutex_);
    device_.device = std::move(device);
    device_.driveMounted = true;
    device_.files = std::move(list);
}

void StateStore::setFiles(std::vector<system::FileEntry> files) {
    auto list =
        std::make_shared<const std::vector<system::FileEntry>>(std::move(files));
    std::unique_lock lock(mutex_);
    device_.files = std::move(list);
}

void StateStore::clearSource() {
    std::unique_lock lock(mutex_);
    device_.device.reset();
    device_.driveMounted = false;
    device_.files = emptyFileList();
}

void StateStore::setDestinationMounted(bool mounted) {
    std::unique_lock lock(mutex_);
    device_.nasMounted = mounted;
}

auto StateStore::tryBeginTransfer(const std::vector<std::string>& names,
                                  std::string destination)
    -> type::Result<std::vector<system::FileEntry>, std::string> {
    std::unique_lock lock(mutex_);
    if (transfer_.active()) {
        return type::fail(std::string("Transfer already in progress"));
    }
    if (sourceReserved_) {
        return type::fail(std::string("USB drive is being updated"));
    }
    if (!device_.driveMounted) {
        return type::fail(std::string("No USB drive connected"));
    }
    if (!device_.nasMounted) {
        return type::fail(std::string("NAS not connected"));
    }

    std::unordered_map<std::string, const system::FileEntry*> byName;
    for (const auto& entry : *device_.files) {
        byName.emplace(entry.name, &entry);
    }
    std::vector<system::FileEntry> selected;
    for (const auto& name : names) {
        if (auto it = byName.find(name); it != byName.end()) {
            selected.push_back(*it->second);
        } else {
            spdlog::debug("Ignoring unknown selection {}", name);
        }
    }
    if (selected.empty()) {
        return type::fail(std::string("No files selected"));
    }

    TransferState fresh;
    fresh.phase = TransferPhase::Running;
    fresh.startedAt = epochSeconds();
    fresh.totalFiles = selected.size();
    fresh.totalBytes = std::accumulate(
        selected.begin(), selected.end(), std::uint64_t{0},
        [](std::uint64_t sum, const system::FileEntry& entry) {
            return sum + entry.size;
        });
    fresh.destination = std::move(destination);
    fresh.fileList.reserve(selected.size());
    for (const auto& entry : selected) {
        fresh.fileList.push_back(entry.name);
    }
    transfer_ = std::move(fresh);
    cancelRequested_.store(false);
    return selected;
}

void StateStore::requestCancel() noexcept { cancelRequested_.store(true); }

auto StateStore::cancelRequested() const noexcept -> bool {
    return cancelRequested_.load();
}

auto StateStore::tryReserveSource() -> bool {
    std::unique_lock lock(mutex_);
    if (transfer_.active() || sourceReserved_) {
        return false;
    }
    sourceReserved_ = true;
    return true;
}

void StateStore::releaseSource() {
    std::unique_lock lock(mutex_);
    sourceReserved_ = false;
}

auto StateStore::isSourceReserved() const -> bool {
    std::shared_lock lock(mutex_);
    return sourceReserved_;
}

auto StateStore::clearFinished() -> bool {
    std::unique_lock lock(mutex_);
    if (transfer_.active()) {
        return false;
    }
    transfer_ = TransferState{};
    return true;
}

}  // namespace offload::engine
