/*
 * milestone.cpp
 *
 * Copyright (C) 2026 offload contributors
 */

/*************************************************

Date: 2026-9-11

Description: Once-per-job notifications at progress thresholds

**************************************************/

#include "milestone.hpp"

#include <format>

#include <spdlog/spdlog.h>

#include "offload/config/settings.hpp"
#include "offload/utils/format.hpp"

namespace offload::engine {

namespace {
constexpr int K_START_THRESHOLD = 0;
constexpr int K_COMPLETE_THRESHOLD = 100;
}  // namespace

MilestoneNotifier::MilestoneNotifier(std::vector<int> thresholds,
                                     notify::Notifier& notifier)
    : thresholds_(config::normalizeMilestones(std::move(thresholds))),
      notifier_(notifier) {}

void MilestoneNotifier::reset() { sent_.clear(); }

void MilestoneNotifier::announceStart(std::size_t totalFiles,
                                      std::uint64_t totalBytes,
                                      const std::string& destination) {
    sent_.insert(K_START_THRESHOLD);
    notifier_.notify(startMessage(totalFiles, totalBytes, destination));
}

auto MilestoneNotifier::check(const ProgressFigures& figures)
    -> std::vector<int> {
    std::vector<int> fired;
    for (int threshold : thresholds_) {
        if (figures.percent < threshold || sent_.contains(threshold)) {
            continue;
        }
        sent_.insert(threshold);
        fired.push_back(threshold);

        std::string message;
        if (threshold == K_COMPLETE_THRESHOLD) {
            message = completionMessage(figures);
        } else if (threshold == K_START_THRESHOLD) {
            message = startMessage(figures.totalFiles, figures.totalBytes,
                                   figures.destination);
        } else {
            message = progressMessage(threshold, figures);
        }
        spdlog::info("Milestone {}% reached", threshold);
        notifier_.notify(message);
    }
    return fired;
}

auto MilestoneNotifier::startMessage(std::size_t totalFiles,
                                     std::uint64_t totalBytes,
                                     const std::string& destination)
    -> std::string {
    return std::format("**Transfer started**\n{} files - {}\n`{}`", totalFiles,
                       utils::humanSize(static_cast<double>(totalBytes)),
                       destination);
}

auto MilestoneNotifier::progressMessage(int threshold,
                                        const ProgressFigures& figures)
    -> std::string {
    std::string eta = figures.etaSeconds ? utils::formatEta(*figures.etaSeconds)
                                         : std::string("estimating...");
    return std::format(
        "**{}% complete**\n{}/{} files - {} / {}\n{}", threshold,
        figures.completedFiles, figures.totalFiles,
        utils::humanSize(static_cast<double>(figures.bytesDone)),
        utils::humanSize(static_cast<double>(figures.totalBytes)), eta);
}

auto MilestoneNotifier::completionMessage(const ProgressFigures& figures)
    -> std::string {
    const double avgSpeed =
        figures.elapsedSeconds > 0.0
            ? static_cast<double>(figures.totalBytes) / figures.elapsedSeconds
            : 0.0;
    std::string errors;
    if (figures.errorCount > 0) {
        errors = std::format(" - {} error(s)", figures.errorCount);
    }
    return std::format(
        "**Transfer complete**\n{} files - {}{}\n`{}`\nDuration: {} - Avg: {}",
        figures.totalFiles,
        utils::humanSize(static_cast<double>(figures.totalBytes)), errors,
        figures.destination, utils::formatDuration(figures.elapsedSeconds),
        utils::humanSpeed(avgSpeed));
}

}  // namespace offload::engine
