/*
 * state_store.hpp
 *
 * Copyright (C) 2026 offload contributors
 */

/*************************************************

Date: 2026-9-10

Description: Shared device and transfer state with copy-on-read snapshots

**************************************************/

#ifndef OFFLOAD_ENGINE_STATE_STORE_HPP
#define OFFLOAD_ENGINE_STATE_STORE_HPP

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "offload/system/block_device.hpp"
#include "offload/system/file_scan.hpp"
#include "offload/type/result.hpp"

namespace offload::engine {

enum class TransferPhase { Idle, Running, Completed, Cancelled };

[[nodiscard]] auto toString(TransferPhase phase) -> const char*;

/**
 * @brief Immutable result of a job that ran to the end.
 */
struct FinishSummary {
    std::size_t totalFiles{0};
    std::size_t completedFiles{0};
    std::uint64_t totalBytes{0};
    std::string totalSizeHuman;
    double durationSeconds{0.0};
    std::string duration;
    double avgSpeed{0.0};  ///< Bytes per second over the whole job
    std::string avgSpeedHuman;
    std::string destination;
    std::vector<std::string> errors;
};

void to_json(nlohmann::json& j, const FinishSummary& summary);

struct TransferState {
    TransferPhase phase{TransferPhase::Idle};
    double startedAt{0.0};  ///< Seconds since the Unix epoch
    std::size_t totalFiles{0};
    std::size_t completedFiles{0};
    std::string currentFile;
    std::size_t currentFileIndex{0};
    double currentFilePercent{0.0};
    std::uint64_t totalBytes{0};
    std::uint64_t bytesDone{0};
    double overallPercent{0.0};
    std::optional<double> speed;  ///< Bytes per second, unknown at start
    std::optional<double> eta;    ///< Seconds, unknown without a speed
    std::vector<std::string> errors;
    std::string destination;
    std::vector<std::string> fileList;
    std::vector<std::string> completedList;
    bool finished{false};
    std::optional<FinishSummary> summary;

    [[nodiscard]] auto active() const -> bool {
        return phase == TransferPhase::Running;
    }
};

void to_json(nlohmann::json& j, const TransferState& state);

using FileList = std::shared_ptr<const std::vector<system::FileEntry>>;

struct DeviceState {
    std::optional<system::Device> device;
    bool driveMounted{false};
    bool nasMounted{false};
    FileList files;
};

struct Snapshot {
    DeviceState device;
    TransferState transfer;
};

/**
 * @brief Device fields, file list and transfer progress behind one
 * reader/writer lock.
 *
 * Readers get copies. The file list is an immutable vector swapped whole.
 * The cancellation flag lives outside the lock.
 */
class StateStore {
public:
    StateStore();

    [[nodiscard]] auto snapshot() const -> Snapshot;
    [[nodiscard]] auto deviceState() const -> DeviceState;
    [[nodiscard]] auto transfer() const -> TransferState;
    [[nodiscard]] auto files() const -> FileList;

    /**
     * @brief drive, drive_mounted, nas_mounted, files and transfer.
     */
    [[nodiscard]] auto toJson() const -> nlohmann::json;

    [[nodiscard]] auto isSourceMounted() const -> bool;
    [[nodiscard]] auto isDestinationMounted() const -> bool;
    [[nodiscard]] auto isTransferRunning() const -> bool;

    void setSource(system::Device device, std::vector<system::FileEntry> files);
    void setFiles(std::vector<system::FileEntry> files);
    void clearSource();
    void setDestinationMounted(bool mounted);

    /**
     * @brief Checks the start preconditions and, if they hold, resets the
     * transfer state to a fresh Running job in the same critical section.
     *
     * Unknown names are dropped. On rejection nothing changes.
     *
     * @return The resolved entries in selection order, or the reason.
     */
    auto tryBeginTransfer(const std::vector<std::string>& names,
                          std::string destination)
        -> type::Result<std::vector<system::FileEntry>, std::string>;

    /**
     * @brief Applies @p mutator to the transfer state under the write lock.
     */
    template <typename Mutator>
    void updateTransfer(Mutator&& mutator) {
        std::unique_lock lock(mutex_);
        mutator(transfer_);
    }

    /**
     * @brief Claims the source for a mount, unmount or rescan.
     *
     * Fails while a job runs or another claim is held. While the claim is
     * held, tryBeginTransfer refuses to start a job.
     */
    auto tryReserveSource() -> bool;
    void releaseSource();
    [[nodiscard]] auto isSourceReserved() const -> bool;

    void requestCancel() noexcept;
    [[nodiscard]] auto cancelRequested() const noexcept -> bool;

    /**
     * @brief Returns a finished or cancelled job to Idle.
     * @return False while a job is running.
     */
    auto clearFinished() -> bool;

private:
    mutable std::shared_mutex mutex_;
    DeviceState device_;
    TransferState transfer_;
    bool sourceReserved_{false};
    std::atomic<bool> cancelRequested_{false};
};

}  // namespace offload::engine

#endif  // OFFLOAD_ENGINE_STATE_STORE_HPP
