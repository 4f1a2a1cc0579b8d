/*
 * transfer_job.hpp
 *
 * Copyright (C) 2026 offload contributors
 */

/*************************************************

Date: 2026-9-12

Description: Chunked copy of a file selection with progress, verification
and cancellation

**************************************************/

#ifndef OFFLOAD_ENGINE_TRANSFER_JOB_HPP
#define OFFLOAD_ENGINE_TRANSFER_JOB_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "offload/config/history.hpp"
#include "offload/config/settings.hpp"
#include "offload/engine/events.hpp"
#include "offload/engine/milestone.hpp"
#include "offload/engine/speed_estimator.hpp"
#include "offload/engine/state_store.hpp"
#include "offload/notify/notifier.hpp"
#include "offload/system/file_scan.hpp"

namespace offload::engine {

using DigestFunction =
    std::function<std::string(const std::filesystem::path& file)>;

struct TransferOptions {
    std::size_t chunkSize{4 * 1024 * 1024};
    /// Minimum spacing of file_progress events within one file. The first
    /// chunk of every file always publishes.
    std::chrono::milliseconds emitInterval{300};
    std::chrono::milliseconds speedWindow{SpeedEstimator::K_DEFAULT_WINDOW};
    /// Defaults to MD5 when empty.
    DigestFunction digest;
};

/**
 * @brief Runs one transfer from start to finish on the calling thread.
 *
 * The job expects the store to be in the Running phase already, as left by
 * StateStore::tryBeginTransfer(), and is the only writer of the transfer
 * fields until it returns. Files land flat in the destination directory;
 * a later file with the same base name overwrites an earlier one.
 */
class TransferJob {
public:
    TransferJob(std::vector<system::FileEntry> files,
                std::filesystem::path sourceRoot,
                std::filesystem::path destinationMount,
                config::Settings settings, StateStore& store,
                EventSink& events, notify::Notifier& notifier,
                config::HistoryStore& history, TransferOptions options = {});

    void run();

    [[nodiscard]] auto destinationDirectory() const
        -> const std::filesystem::path& {
        return destinationDir_;
    }

private:
    enum class FileOutcome { Completed, Failed, Cancelled };

    auto processFile(std::size_t index, const system::FileEntry& entry)
        -> FileOutcome;
    /// @return False if cancelled mid-file.
    auto copyContents(std::size_t index, const system::FileEntry& entry,
                      const std::filesystem::path& source,
                      const std::filesystem::path& target) -> bool;
    void publishProgress(std::size_t index, const system::FileEntry& entry,
                         double filePercent);
    void recordError(std::size_t index, const std::string& name,
                     const std::string& reason);
    void finalize();
    void finishCancelled();

    [[nodiscard]] auto overallPercent() const -> double;
    [[nodiscard]] auto elapsedSeconds() const -> double;
    [[nodiscard]] auto figures(double percent) const -> ProgressFigures;

    std::vector<system::FileEntry> files_;
    std::filesystem::path sourceRoot_;
    std::filesystem::path destinationDir_;
    config::Settings settings_;
    StateStore& store_;
    EventSink& events_;
    config::HistoryStore& history_;
    TransferOptions options_;
    MilestoneNotifier milestones_;
    SpeedEstimator estimator_;

    std::uint64_t totalBytes_{0};
    std::uint64_t bytesDone_{0};
    std::size_t completedFiles_{0};
    std::vector<std::string> errors_;
    std::optional<double> eta_;
    SpeedEstimator::Clock::time_point startedAt_;
};

/**
 * @brief Copies access/modification times and permission bits.
 * @return False if any part failed; the failure is logged.
 */
auto copyFileMetadata(const std::filesystem::path& source,
                      const std::filesystem::path& target) -> bool;

}  // namespace offload::engine

#endif  // OFFLOAD_ENGINE_TRANSFER_JOB_HPP
