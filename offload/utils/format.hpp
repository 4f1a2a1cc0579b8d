/*
 * format.hpp
 *
 * Copyright (C) 2026 offload contributors
 */

/*************************************************

Date: 2026-9-4

Description: Human readable sizes, durations and ETAs

**************************************************/

#ifndef OFFLOAD_UTILS_FORMAT_HPP
#define OFFLOAD_UTILS_FORMAT_HPP

#include <optional>
#include <string>

namespace offload::utils {

/**
 * @brief Formats a byte count with binary (1024) steps, e.g. "1.5 GB".
 *
 * Units run B, KB, MB, GB, TB and everything larger is expressed in PB.
 * Always one decimal place.
 */
[[nodiscard]] auto humanSize(double bytes) -> std::string;

/**
 * @brief Formats a throughput as "<size>/s".
 */
[[nodiscard]] auto humanSpeed(double bytesPerSecond) -> std::string;

/**
 * @brief Formats seconds as "42s", "3m 7s" or "2h 15m".
 *
 * Fractions are truncated; negative input is treated as zero.
 */
[[nodiscard]] auto formatDuration(double seconds) -> std::string;

/**
 * @brief Formats an ETA as "<duration> remaining" or "almost done".
 */
[[nodiscard]] auto formatEta(double seconds) -> std::string;

// Empty string when the ETA is indeterminate.
[[nodiscard]] auto formatEta(std::optional<double> seconds) -> std::string;

}  // namespace offload::utils

#endif  // OFFLOAD_UTILS_FORMAT_HPP
