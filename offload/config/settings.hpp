/*
 * settings.hpp
 *
 * Copyright (C) 2026 offload contributors
 */

/*************************************************

Date: 2026-9-6

Description: Appliance settings record and its JSON file store

**************************************************/

#ifndef OFFLOAD_CONFIG_SETTINGS_HPP
#define OFFLOAD_CONFIG_SETTINGS_HPP

#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace offload::config {

/**
 * @brief Flat settings record. Immutable per transfer job once copied.
 */
struct Settings {
    std::string nasIp{"100.109.23.38"};      ///< Tunneled (Tailscale) address
    std::string nasIpLocal{"192.168.88.20"};  ///< Local network address
    std::string shareName{"archive"};
    std::string subfolder;
    std::string smbUsername;
    std::string smbPassword;
    std::string smbVersion{"3.0"};
    bool verifyChecksums{false};
    bool useTailscale{true};
    std::string discordWebhook;
    std::vector<int> notifyMilestones{25, 50, 75, 100};

    /**
     * @brief Host selected by the tunnel flag. Falls back to the tunneled
     * address when no local address is configured.
     */
    [[nodiscard]] auto activeHost() const -> std::string;

    /**
     * @brief Remote share address, e.g. "//100.109.23.38/archive".
     */
    [[nodiscard]] auto shareAddress() const -> std::string;

    /**
     * @brief Share address plus subfolder, used in summaries and messages.
     */
    [[nodiscard]] auto destinationLabel() const -> std::string;

    [[nodiscard]] auto hasPassword() const -> bool {
        return !smbPassword.empty();
    }
};

/**
 * @brief Sorts, de-duplicates and bounds a milestone list to 0..100.
 */
[[nodiscard]] auto normalizeMilestones(std::vector<int> milestones)
    -> std::vector<int>;

/**
 * @brief True when @p subfolder stays inside the share: not absolute and no
 * ".." component.
 */
[[nodiscard]] auto isSafeSubfolder(std::string_view subfolder) -> bool;

void to_json(nlohmann::json& j, const Settings& settings);

/**
 * @brief Reads known keys; anything missing, mistyped or an unsafe subfolder
 * keeps its current value.
 */
void from_json(const nlohmann::json& j, Settings& settings);

/**
 * @brief Settings as JSON without the SMB password.
 */
[[nodiscard]] auto redactedJson(const Settings& settings) -> nlohmann::json;

/**
 * @brief Applies the recognised keys of @p patch onto @p base.
 */
[[nodiscard]] auto mergeSettings(const Settings& base,
                                 const nlohmann::json& patch) -> Settings;

/**
 * @brief Loads and saves Settings as a JSON file.
 *
 * Neither operation ever throws: a missing or corrupt file loads as
 * defaults and a failed save is logged and reported as false.
 */
class SettingsStore {
public:
    explicit SettingsStore(std::filesystem::path file);

    [[nodiscard]] auto load() const -> Settings;
    bool save(const Settings& settings);

    /**
     * @brief Writes the defaults if no settings file exists yet.
     */
    void ensureExists();

    [[nodiscard]] auto path() const -> const std::filesystem::path& {
        return file_;
    }

private:
    std::filesystem::path file_;
    mutable std::mutex mutex_;
};

}  // namespace offload::config

#endif  // OFFLOAD_CONFIG_SETTINGS_HPP
