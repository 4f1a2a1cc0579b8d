/*
 * logging.cpp
 *
 * Copyright (C) 2026 offload contributors
 */

/*************************************************

Date: 2026-9-17

Description: Default spdlog logger for the daemon

**************************************************/

#include "logging.hpp"

#include <algorithm>
#include <cctype>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace offload::log {

auto parseLevel(std::string_view text)
    -> std::optional<spdlog::level::level_enum> {
    std::string level(text);
    std::transform(level.begin(), level.end(), level.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (level == "trace") {
        return spdlog::level::trace;
    }
    if (level == "debug") {
        return spdlog::level::debug;
    }
    if (level == "info") {
        return spdlog::level::info;
    }
    if (level == "warn" || level == "warning") {
        return spdlog::level::warn;
    }
    if (level == "error") {
        return spdlog::level::err;
    }
    if (level == "critical") {
        return spdlog::level::critical;
    }
    if (level == "off") {
        return spdlog::level::off;
    }
    return std::nullopt;
}

void setupLogging(const LogOptions& options) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    std::string fileError;
    if (options.file) {
        try {
            std::error_code ec;
            if (options.file->has_parent_path()) {
                std::filesystem::create_directories(
                    options.file->parent_path(), ec);
            }
            sinks.push_back(
                std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    options.file->string(), options.maxFileSize,
                    options.maxFiles));
        } catch (const spdlog::spdlog_ex& e) {
            fileError = e.what();
        }
    }

    auto logger = std::make_shared<spdlog::logger>("offload", sinks.begin(),
                                                   sinks.end());
    logger->set_pattern(K_LOG_PATTERN);
    logger->set_level(options.level);
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);

    if (!fileError.empty()) {
        spdlog::error("Cannot open log file {}: {}", options.file->string(),
                      fileError);
    }
}

}  // namespace offload::log
