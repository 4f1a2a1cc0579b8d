/*
 * history.hpp
 *
 * Copyright (C) 2026 offload contributors
 */

/*************************************************

Date: 2026-9-6

Description: Capped log of completed transfers

**************************************************/

#ifndef OFFLOAD_CONFIG_HISTORY_HPP
#define OFFLOAD_CONFIG_HISTORY_HPP

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace offload::config {

struct HistoryEntry {
    std::string title;      ///< Subfolder name, or "untitled"
    std::string date;       ///< e.g. "Jun 06"
    std::string time;       ///< e.g. "04:12 PM"
    std::string duration;   ///< Human readable job duration
    std::string totalSize;  ///< Human readable byte total
    std::string avgSpeed;   ///< Human readable average throughput
    std::size_t totalFiles{0};
    std::size_t errors{0};
    double timestamp{0.0};  ///< Seconds since the Unix epoch
    std::vector<std::string> fileNames;
};

void to_json(nlohmann::json& j, const HistoryEntry& entry);
void from_json(const nlohmann::json& j, HistoryEntry& entry);

/**
 * @brief JSON file holding the most recent completed transfers.
 *
 * Appending drops the oldest entries beyond the cap. Failures are logged and
 * never thrown.
 */
class HistoryStore {
public:
    static constexpr std::size_t K_DEFAULT_CAP = 50;

    explicit HistoryStore(std::filesystem::path file,
                          std::size_t cap = K_DEFAULT_CAP);

    [[nodiscard]] auto load() const -> std::vector<HistoryEntry>;

    /**
     * @brief Appends @p entry and persists the capped list.
     * @return The retained list after the append.
     */
    auto append(HistoryEntry entry) -> std::vector<HistoryEntry>;

private:
    [[nodiscard]] auto loadUnlocked() const -> std::vector<HistoryEntry>;

    std::filesystem::path file_;
    std::size_t cap_;
    mutable std::mutex mutex_;
};

}  // namespace offload::config

#endif  // OFFLOAD_CONFIG_HISTORY_HPP
