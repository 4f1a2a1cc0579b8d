/*
 * settings.cpp
 *
 * Copyright (C) 2026 offload contributors
 */

/*************************************************

Date: 2026-9-6

Description: Appliance settings record and its JSON file store

**************************************************/

#include "settings.hpp"

#include <algorithm>
#include <fstream>
#include <utility>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace offload::config {

namespace {
constexpr int K_MIN_MILESTONE = 0;
constexpr int K_MAX_MILESTONE = 100;

template <typename T>
void readKey(const json& j, const char* key, T& target) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return;
    }
    try {
        target = it->get<T>();
    } catch (const json::exception& e) {
        spdlog::warn("Ignoring setting '{}': {}", key, e.what());
    }
}
}  // namespace

auto Settings::activeHost() const -> std::string {
    if (useTailscale || nasIpLocal.empty()) {
        return nasIp;
    }
    return nasIpLocal;
}

auto Settings::shareAddress() const -> std::string {
    return "//" + activeHost() + "/" + shareName;
}

auto Settings::destinationLabel() const -> std::string {
    if (subfolder.empty()) {
        return shareAddress();
    }
    return shareAddress() + "/" + subfolder;
}

auto normalizeMilestones(std::vector<int> milestones) -> std::vector<int> {
    std::erase_if(milestones, [](int m) {
        return m < K_MIN_MILESTONE || m > K_MAX_MILESTONE;
    });
    std::ranges::sort(milestones);
    auto [first, last] = std::ranges::unique(milestones);
    milestones.erase(first, last);
    return milestones;
}

auto isSafeSubfolder(std::string_view subfolder) -> bool {
    const fs::path path(subfolder);
    if (path.has_root_path()) {
        return false;
    }
    return std::none_of(path.begin(), path.end(),
                        [](const fs::path& part) { return part == ".."; });
}

void to_json(json& j, const Settings& settings) {
    j = json{{"nas_ip", settings.nasIp},
             {"nas_ip_local", settings.nasIpLocal},
             {"share_name", settings.shareName},
             {"subfolder", settings.subfolder},
             {"smb_username", settings.smbUsername},
             {"smb_password", settings.smbPassword},
             {"smb_version", settings.smbVersion},
             {"verify_checksums", settings.verifyChecksums},
             {"use_tailscale", settings.useTailscale},
             {"discord_webhook", settings.discordWebhook},
             {"discord_notify_milestones", settings.notifyMilestones}};
}

void from_json(const json& j, Settings& settings) {
    if (!j.is_object()) {
        return;
    }
    readKey(j, "nas_ip", settings.nasIp);
    readKey(j, "nas_ip_local", settings.nasIpLocal);
    readKey(j, "share_name", settings.shareName);
    std::string subfolder = settings.subfolder;
    readKey(j, "subfolder", subfolder);
    if (isSafeSubfolder(subfolder)) {
        settings.subfolder = std::move(subfolder);
    } else {
        spdlog::warn("Ignoring subfolder '{}': must be relative to the share",
                     subfolder);
    }
    readKey(j, "smb_username", settings.smbUsername);
    readKey(j, "smb_password", settings.smbPassword);
    readKey(j, "smb_version", settings.smbVersion);
    readKey(j, "verify_checksums", settings.verifyChecksums);
    readKey(j, "use_tailscale", settings.useTailscale);
    readKey(j, "discord_webhook", settings.discordWebhook);
    readKey(j, "discord_notify_milestones", settings.notifyMilestones);
    settings.notifyMilestones = normalizeMilestones(settings.notifyMilestones);
}

auto redactedJson(const Settings& settings) -> json {
    json j = settings;
    j.erase("smb_password");
    return j;
}

auto mergeSettings(const Settings& base, const json& patch) -> Settings {
    Settings merged = base;
    from_json(patch, merged);
    return merged;
}

SettingsStore::SettingsStore(fs::path file) : file_(std::move(file)) {}

auto SettingsStore::load() const -> Settings {
    std::lock_guard lock(mutex_);
    Settings settings;
    std::ifstream in(file_);
    if (!in) {
        spdlog::debug("No settings file at {}, using defaults", file_.string());
        return settings;
    }
    try {
        from_json(json::parse(in), settings);
    } catch (const json::exception& e) {
        spdlog::warn("Settings file {} is unreadable ({}), using defaults",
                     file_.string(), e.what());
        return Settings{};
    }
    return settings;
}

bool SettingsStore::save(const Settings& settings) {
    std::lock_guard lock(mutex_);
    try {
        if (file_.has_parent_path()) {
            fs::create_directories(file_.parent_path());
        }
        const auto tmp = fs::path(file_.string() + ".tmp");
        {
            std::ofstream out(tmp, std::ios::trunc);
            if (!out) {
                spdlog::error("Cannot write settings to {}", tmp.string());
                return false;
            }
            out << json(settings).dump(2);
            if (!out) {
                spdlog::error("Failed writing settings to {}", tmp.string());
                return false;
            }
        }
        fs::rename(tmp, file_);
        spdlog::info("Settings saved to {}", file_.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to save settings to {}: {}", file_.string(),
                      e.what());
        return false;
    }
}

void SettingsStore::ensureExists() {
    std::error_code ec;
    if (fs::exists(file_, ec)) {
        return;
    }
    spdlog::info("Creating default settings at {}", file_.string());
    save(Settings{});
}

}  // namespace offload::config
