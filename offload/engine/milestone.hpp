/*
 * milestone.hpp
 *
 * Copyright (C) 2026 offload contributors
 */

/*************************************************

Date: 2026-9-11

Description: Once-per-job notifications at progress thresholds

**************************************************/

#ifndef OFFLOAD_ENGINE_MILESTONE_HPP
#define OFFLOAD_ENGINE_MILESTONE_HPP

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "offload/notify/notifier.hpp"

namespace offload::engine {

/**
 * @brief Progress figures a milestone message is rendered from.
 */
struct ProgressFigures {
    double percent{0.0};
    std::size_t completedFiles{0};
    std::size_t totalFiles{0};
    std::uint64_t bytesDone{0};
    std::uint64_t totalBytes{0};
    std::optional<double> etaSeconds;
    double elapsedSeconds{0.0};
    std::size_t errorCount{0};
    std::string destination;
};

/**
 * @brief Sends one notification per configured threshold per job.
 *
 * Thresholds are checked in ascending order; a threshold is sent at most
 * once until reset().
 */
class MilestoneNotifier {
public:
    MilestoneNotifier(std::vector<int> thresholds, notify::Notifier& notifier);

    /**
     * @brief Forgets every sent threshold. Called at job start.
     */
    void reset();

    /**
     * @brief Sends the "transfer started" message and marks threshold 0 as
     * sent.
     */
    void announceStart(std::size_t totalFiles, std::uint64_t totalBytes,
                       const std::string& destination);

    /**
     * @return Thresholds newly sent by this call, ascending.
     */
    auto check(const ProgressFigures& figures) -> std::vector<int>;

    [[nodiscard]] auto sent() const -> const std::set<int>& { return sent_; }

    [[nodiscard]] static auto startMessage(std::size_t totalFiles,
                                           std::uint64_t totalBytes,
                                           const std::string& destination)
        -> std::string;
    [[nodiscard]] static auto progressMessage(int threshold,
                                              const ProgressFigures& figures)
        -> std::string;
    [[nodiscard]] static auto completionMessage(const ProgressFigures& figures)
        -> std::string;

private:
    std::vector<int> thresholds_;
    notify::Notifier& notifier_;
    std::set<int> sent_;
};

}  // namespace offload::engine

#endif  // OFFLOAD_ENGINE_MILESTONE_HPP
