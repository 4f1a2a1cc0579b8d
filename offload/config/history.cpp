/*
 * history.cpp
 *
 * Copyright (C) 2026 offload contributors
 */

/*************************************************

Date: 2026-9-6

Description: Capped log of completed transfers

**************************************************/

#include "history.hpp"

#include <fstream>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace offload::config {

void to_json(json& j, const HistoryEntry& entry) {
    j = json{{"title", entry.title},
             {"date", entry.date},
             {"time", entry.time},
             {"duration", entry.duration},
             {"total_size", entry.totalSize},
             {"avg_speed", entry.avgSpeed},
             {"total_files", entry.totalFiles},
             {"errors", entry.errors},
             {"timestamp", entry.timestamp},
             {"file_names", entry.fileNames}};
}

void from_json(const json& j, HistoryEntry& entry) {
    entry.title = j.value("title", std::string{});
    entry.date = j.value("date", std::string{});
    entry.time = j.value("time", std::string{});
    entry.duration = j.value("duration", std::string{});
    entry.totalSize = j.value("total_size", std::string{});
    entry.avgSpeed = j.value("avg_speed", std::string{});
    entry.totalFiles = j.value("total_files", std::size_t{0});
    entry.errors = j.value("errors", std::size_t{0});
    entry.timestamp = j.value("timestamp", 0.0);
    entry.fileNames = j.value("file_names", std::vector<std::string>{});
}

HistoryStore::HistoryStore(fs::path file, std::size_t cap)
    : file_(std::move(file)), cap_(cap) {}

auto HistoryStore::load() const -> std::vector<HistoryEntry> {
    std::lock_guard lock(mutex_);
    return loadUnlocked();
}

auto HistoryStore::loadUnlocked() const -> std::vector<HistoryEntry> {
    std::ifstream in(file_);
    if (!in) {
        return {};
    }
    try {
        return json::parse(in).get<std::vector<HistoryEntry>>();
    } catch (const json::exception& e) {
        spdlog::warn("History file {} is unreadable: {}", file_.string(),
                     e.what());
        return {};
    }
}

auto HistoryStore::append(HistoryEntry entry) -> std::vector<HistoryEntry> {
    std::lock_guard lock(mutex_);
    auto history = loadUnlocked();
    history.push_back(std::move(entry));
    if (history.size() > cap_) {
        history.erase(history.begin(),
                      history.end() - static_cast<std::ptrdiff_t>(cap_));
    }

    try {
        if (file_.has_parent_path()) {
            fs::create_directories(file_.parent_path());
        }
        std::ofstream out(file_, std::ios::trunc);
        if (!out) {
            spdlog::error("Cannot write history to {}", file_.string());
            return history;
        }
        out << json(history).dump(2);
    } catch (const std::exception& e) {
        spdlog::error("Failed to save history to {}: {}", file_.string(),
                      e.what());
    }
    return history;
}

}  // namespace offload::config
