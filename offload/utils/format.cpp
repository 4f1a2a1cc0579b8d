/*
 * format.cpp
 *
 * Copyright (C) 2026 offload contributors
 */

/*************************************************

Date: 2026-9-4

Description: Human readable sizes, durations and ETAs

**************************************************/

#include "format.hpp"

#include <array>
#include <format>
#include <string_view>

namespace offload::utils {

namespace {
constexpr double K_UNIT_STEP = 1024.0;
constexpr std::array<std::string_view, 5> K_UNITS = {"B", "KB", "MB", "GB",
                                                     "TB"};
constexpr long long K_SECONDS_PER_MINUTE = 60;
constexpr long long K_SECONDS_PER_HOUR = 3600;
}  // namespace

auto humanSize(double bytes) -> std::string {
    for (auto unit : K_UNITS) {
        if (bytes < K_UNIT_STEP) {
            return std::format("{:.1f} {}", bytes, unit);
        }
        bytes /= K_UNIT_STEP;
    }
    return std::format("{:.1f} PB", bytes);
}

auto humanSpeed(double bytesPerSecond) -> std::string {
    return humanSize(bytesPerSecond) + "/s";
}

auto formatDuration(double seconds) -> std::string {
    const auto total = seconds > 0 ? static_cast<long long>(seconds) : 0LL;
    if (total < K_SECONDS_PER_MINUTE) {
        return std::format("{}s", total);
    }
    if (total < K_SECONDS_PER_HOUR) {
        return std::format("{}m {}s", total / K_SECONDS_PER_MINUTE,
                           total % K_SECONDS_PER_MINUTE);
    }
    return std::format("{}h {}m", total / K_SECONDS_PER_HOUR,
                       (total % K_SECONDS_PER_HOUR) / K_SECONDS_PER_MINUTE);
}

auto formatEta(double seconds) -> std::string {
    if (seconds <= 0) {
        return "almost done";
    }
    return formatDuration(seconds) + " remaining";
}

auto formatEta(std::optional<double> seconds) -> std::string {
    if (!seconds) {
        return {};
    }
    return formatEta(*seconds);
}

}  // namespace offload::utils
