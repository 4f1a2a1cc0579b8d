/*
 * transfer_job.cpp
 *
 * Copyright (C) 2026 offload contributors
 */

/*************************************************

Date: 2026-9-12

Description: Chunked copy of a file selection with progress, verification
and cancellation

**************************************************/

#include "transfer_job.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <ctime>
#include <fstream>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>

#include <spdlog/spdlog.h>

#include "offload/algorithm/md5.hpp"
#include "offload/error/exception.hpp"
#include "offload/utils/format.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace offload::engine {

namespace {
constexpr const char* K_UNTITLED = "untitled";
constexpr const char* K_CHECKSUM_MISMATCH = "Checksum mismatch";

auto localTimeText(std::time_t when, const char* pattern) -> std::string {
    std::tm local{};
    localtime_r(&when, &local);
    std::array<char, 32> buffer{};
    const auto written =
        std::strftime(buffer.data(), buffer.size(), pattern, &local);
    return std::string(buffer.data(), written);
}

auto percentOf(std::uint64_t done, std::uint64_t total) -> double {
    if (total == 0) {
        return 100.0;
    }
    return static_cast<double>(done) / static_cast<double>(total) * 100.0;
}
}  // namespace

auto copyFileMetadata(const fs::path& source, const fs::path& target) -> bool {
    struct stat st {};
    if (::stat(source.c_str(), &st) != 0) {
        spdlog::warn("Cannot stat {}: {}", source.string(),
                     std::strerror(errno));
        return false;
    }

    bool ok = true;
    const std::array<timespec, 2> times{st.st_atim, st.st_mtim};
    if (::utimensat(AT_FDCWD, target.c_str(), times.data(), 0) != 0) {
        spdlog::warn("Cannot copy timestamps to {}: {}", target.string(),
                     std::strerror(errno));
        ok = false;
    }
    if (::chmod(target.c_str(), st.st_mode & 07777) != 0) {
        spdlog::warn("Cannot copy mode to {}: {}", target.string(),
                     std::strerror(errno));
        ok = false;
    }
    return ok;
}

TransferJob::TransferJob(std::vector<system::FileEntry> files,
                         fs::path sourceRoot, fs::path destinationMount,
                         config::Settings settings, StateStore& store,
                         EventSink& events, notify::Notifier& notifier,
                         config::HistoryStore& history,
                         TransferOptions options)
    : files_(std::move(files)),
      sourceRoot_(std::move(sourceRoot)),
      destinationDir_(settings.subfolder.empty()
                          ? destinationMount
                          : destinationMount / settings.subfolder),
      settings_(std::move(settings)),
      store_(store),
      events_(events),
      history_(history),
      options_(std::move(options)),
      milestones_(settings_.notifyMilestones, notifier),
      estimator_(options_.speedWindow) {
    if (!options_.digest) {
        options_.digest = [](const fs::path& file) {
            return algorithm::md5File(file);
        };
    }
    if (options_.chunkSize == 0) {
        THROW_INVALID_ARGUMENT("Transfer chunk size must be positive");
    }
    for (const auto& entry : files_) {
        totalBytes_ += entry.size;
    }
}

void TransferJob::run() {
    startedAt_ = SpeedEstimator::Clock::now();
    milestones_.reset();
    estimator_.reset();

    const std::string label = settings_.destinationLabel();
    spdlog::info("Transfer started: {} file(s), {} to {}", files_.size(),
                 utils::humanSize(static_cast<double>(totalBytes_)), label);

    try {
        milestones_.announceStart(files_.size(), totalBytes_, label);
        events_.emit(event::TRANSFER_STARTED,
                     {{"total_files", files_.size()},
                      {"total_size", totalBytes_},
                      {"total_size_human",
                       utils::humanSize(static_cast<double>(totalBytes_))}});

        std::error_code ec;
        fs::create_directories(destinationDir_, ec);
        if (ec) {
            spdlog::error("Cannot create {}: {}", destinationDir_.string(),
                          ec.message());
        }

        bool cancelled = false;
        for (std::size_t i = 0; i < files_.size(); ++i) {
            if (store_.cancelRequested()) {
                cancelled = true;
                break;
            }
            if (processFile(i, files_[i]) == FileOutcome::Cancelled) {
                cancelled = true;
                break;
            }
        }

        if (cancelled) {
            finishCancelled();
        } else {
            finalize();
        }
    } catch (const std::exception& e) {
        spdlog::error("Transfer aborted: {}", e.what());
        store_.updateTransfer([](TransferState& state) {
            state.phase = TransferPhase::Idle;
        });
        events_.emit(
            event::COMMAND_ERROR,
            {{"message", std::string("Transfer aborted: ") + e.what()}});
    }
}

auto TransferJob::processFile(std::size_t index,
                              const system::FileEntry& entry) -> FileOutcome {
    const fs::path source = sourceRoot_ / fs::path(entry.name);
    const fs::path target = destinationDir_ / fs::path(entry.name).filename();

    store_.updateTransfer([&](TransferState& state) {
        state.currentFile = entry.name;
        state.currentFileIndex = index;
        state.currentFilePercent = 0.0;
    });
    events_.emit(event::FILE_STARTED, {{"index", index},
                                       {"name", entry.name},
                                       {"size", entry.size},
                                       {"size_human", entry.sizeHuman}});

    try {
        if (!copyContents(index, entry, source, target)) {
            std::error_code ec;
            fs::remove(target, ec);
            spdlog::info("Transfer cancelled during {}", entry.name);
            return FileOutcome::Cancelled;
        }

        copyFileMetadata(source, target);

        if (settings_.verifyChecksums) {
            store_.updateTransfer([&](TransferState& state) {
                state.currentFile = "Verifying: " + entry.name;
            });
            events_.emit(event::FILE_VERIFYING,
                         {{"index", index}, {"name", entry.name}});
            if (options_.digest(source) != options_.digest(target)) {
                recordError(index, entry.name, K_CHECKSUM_MISMATCH);
                return FileOutcome::Failed;
            }
        }
    } catch (const error::Exception& e) {
        recordError(index, entry.name, e.getMessage());
        return FileOutcome::Failed;
    } catch (const std::exception& e) {
        recordError(index, entry.name, e.what());
        return FileOutcome::Failed;
    }

    ++completedFiles_;
    const double percent = overallPercent();
    store_.updateTransfer([&](TransferState& state) {
        state.completedFiles = completedFiles_;
        state.completedList.push_back(entry.name);
        state.currentFilePercent = 100.0;
    });
    events_.emit(event::FILE_COMPLETE, {{"index", index},
                                        {"name", entry.name},
                                        {"overall_percent", percent}});
    spdlog::info("Copied {} ({})", entry.name, entry.sizeHuman);
    return FileOutcome::Completed;
}

auto TransferJob::copyContents(std::size_t index,
                               const system::FileEntry& entry,
                               const fs::path& source, const fs::path& target)
    -> bool {
    std::ifstream in(source, std::ios::binary);
    if (!in) {
        THROW_FILE_NOT_FOUND("Cannot open ", source.string());
    }
    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out) {
        THROW_IO_ERROR("Cannot create ", target.string());
    }

    std::vector<char> buffer(options_.chunkSize);
    std::uint64_t fileDone = 0;
    std::optional<SpeedEstimator::Clock::time_point> lastEmit;

    while (true) {
        if (store_.cancelRequested()) {
            return false;
        }
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const std::streamsize count = in.gcount();
        if (count <= 0) {
            if (in.bad()) {
                THROW_IO_ERROR("Read failed on ", source.string());
            }
            break;
        }
        out.write(buffer.data(), count);
        if (!out) {
            THROW_IO_ERROR("Write failed on ", target.string());
        }

        fileDone += static_cast<std::uint64_t>(count);
        bytesDone_ += static_cast<std::uint64_t>(count);
        const double filePercent = percentOf(fileDone, entry.size);
        const double overall = overallPercent();
        store_.updateTransfer([&](TransferState& state) {
            state.bytesDone = bytesDone_;
            state.currentFilePercent = filePercent;
            state.overallPercent = overall;
        });

        const auto now = SpeedEstimator::Clock::now();
        if (!lastEmit || now - *lastEmit >= options_.emitInterval) {
            lastEmit = now;
            publishProgress(index, entry, filePercent);
        }

        if (in.eof()) {
            break;
        }
    }
    if (in.bad()) {
        THROW_IO_ERROR("Read failed on ", source.string());
    }

    out.close();
    if (!out) {
        THROW_IO_ERROR("Cannot finish writing ", target.string());
    }
    return true;
}

void TransferJob::publishProgress(std::size_t index,
                                  const system::FileEntry& entry,
                                  double filePercent) {
    estimator_.addSample(SpeedEstimator::Clock::now(), bytesDone_);
    const auto speed = estimator_.speed();
    eta_ = estimator_.eta(totalBytes_ - std::min(bytesDone_, totalBytes_));
    const double overall = overallPercent();

    store_.updateTransfer([&](TransferState& state) {
        state.speed = speed;
        state.eta = eta_;
    });

    milestones_.check(figures(overall));

    json payload{{"index", index},
                 {"name", entry.name},
                 {"file_percent", filePercent},
                 {"overall_percent", overall},
                 {"completed_files", completedFiles_},
                 {"total_files", files_.size()},
                 {"bytes_done", bytesDone_},
                 {"speed_human", speed ? utils::humanSpeed(*speed) : ""},
                 {"eta_human", utils::formatEta(eta_)}};
    payload["speed"] = speed ? json(*speed) : json(nullptr);
    payload["eta"] = eta_ ? json(*eta_) : json(nullptr);
    events_.emit(event::FILE_PROGRESS, payload);
}

void TransferJob::recordError(std::size_t index, const std::string& name,
                              const std::string& reason) {
    spdlog::warn("Transfer of {} failed: {}", name, reason);
    errors_.push_back(name);
    store_.updateTransfer(
        [&](TransferState& state) { state.errors.push_back(name); });
    events_.emit(event::FILE_ERROR,
                 {{"index", index}, {"name", name}, {"error", reason}});
}

void TransferJob::finalize() {
    const double elapsed = elapsedSeconds();
    const double avgSpeed =
        elapsed > 0.0 ? static_cast<double>(totalBytes_) / elapsed : 0.0;

    FinishSummary summary;
    summary.totalFiles = files_.size();
    summary.completedFiles = completedFiles_;
    summary.totalBytes = totalBytes_;
    summary.totalSizeHuman = utils::humanSize(static_cast<double>(totalBytes_));
    summary.durationSeconds = elapsed;
    summary.duration = utils::formatDuration(elapsed);
    summary.avgSpeed = avgSpeed;
    summary.avgSpeedHuman = utils::humanSpeed(avgSpeed);
    summary.destination = settings_.destinationLabel();
    summary.errors = errors_;

    store_.updateTransfer([&](TransferState& state) {
        state.phase = TransferPhase::Completed;
        state.finished = true;
        state.overallPercent = 100.0;
        state.summary = summary;
    });

    milestones_.check(figures(100.0));

    const std::time_t now = std::time(nullptr);
    config::HistoryEntry entry;
    entry.title = settings_.subfolder.empty() ? K_UNTITLED : settings_.subfolder;
    entry.date = localTimeText(now, "%b %d");
    entry.time = localTimeText(now, "%I:%M %p");
    entry.duration = summary.duration;
    entry.totalSize = summary.totalSizeHuman;
    entry.avgSpeed = summary.avgSpeedHuman;
    entry.totalFiles = files_.size();
    entry.errors = errors_.size();
    entry.timestamp = std::chrono::duration<double>(
                          std::chrono::system_clock::now().time_since_epoch())
                          .count();
    for (const auto& file : files_) {
        entry.fileNames.push_back(file.name);
    }
    const auto history = history_.append(std::move(entry));

    json payload = summary;
    payload["history"] = history;
    events_.emit(event::TRANSFER_COMPLETE, payload);
    spdlog::info("Transfer complete: {}/{} file(s) in {}, {} error(s)",
                 completedFiles_, files_.size(), summary.duration,
                 errors_.size());
}

void TransferJob::finishCancelled() {
    store_.updateTransfer([](TransferState& state) {
        state.phase = TransferPhase::Cancelled;
    });
    events_.emit(event::TRANSFER_CANCELLED, json::object());
    spdlog::info("Transfer cancelled after {}/{} file(s)", completedFiles_,
                 files_.size());
}

auto TransferJob::overallPercent() const -> double {
    return percentOf(bytesDone_, totalBytes_);
}

auto TransferJob::elapsedSeconds() const -> double {
    return std::chrono::duration<double>(SpeedEstimator::Clock::now() -
                                         startedAt_)
        .count();
}

auto TransferJob::figures(double percent) const -> ProgressFigures {
    ProgressFigures result;
    result.percent = percent;
    result.completedFiles = completedFiles_;
    result.totalFiles = files_.size();
    result.bytesDone = bytesDone_;
    result.totalBytes = totalBytes_;
    result.etaSeconds = eta_;
    result.elapsedSeconds = elapsedSeconds();
    result.errorCount = errors_.size();
    result.destination = settings_.destinationLabel();
    return result;
}

}  // namespace offload::engine
