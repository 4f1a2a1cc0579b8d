/*
 * logging.hpp
 *
 * Copyright (C) 2026 offload contributors
 */

/*************************************************

Date: 2026-9-17

Description: Default spdlog logger for the daemon

**************************************************/

#ifndef OFFLOAD_LOG_LOGGING_HPP
#define OFFLOAD_LOG_LOGGING_HPP

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string_view>

#include <spdlog/common.h>

namespace offload::log {

struct LogOptions {
    spdlog::level::level_enum level{spdlog::level::info};
    std::optional<std::filesystem::path> file;  ///< Rotating file sink
    std::size_t maxFileSize{5 * 1024 * 1024};
    std::size_t maxFiles{3};
};

inline constexpr const char* K_LOG_PATTERN = "%Y-%m-%d %H:%M:%S [%l] %v";

/**
 * @brief Accepts trace, debug, info, warn/warning, error, critical and off,
 * case-insensitively.
 */
[[nodiscard]] auto parseLevel(std::string_view text)
    -> std::optional<spdlog::level::level_enum>;

/**
 * @brief Installs a colour console logger, plus a rotating file sink when
 * a file is given, as the spdlog default logger.
 *
 * A file sink that cannot be opened is reported and skipped.
 */
void setupLogging(const LogOptions& options);

}  // namespace offload::log

#endif  // OFFLOAD_LOG_LOGGING_HPP
