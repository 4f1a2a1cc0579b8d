/*
 * command_channel.hpp
 *
 * Copyright (C) 2026 offload contributors
 */

/*************************************************

Date: 2026-9-16

Description: Newline-delimited JSON commands read from a named pipe

**************************************************/

#ifndef OFFLOAD_CONNECTION_COMMAND_CHANNEL_HPP
#define OFFLOAD_CONNECTION_COMMAND_CHANNEL_HPP

#include <filesystem>
#include <functional>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>

#include <nlohmann/json.hpp>

#include "offload/engine/controller.hpp"
#include "offload/engine/events.hpp"

namespace offload::connection {

/**
 * @brief Runs one decoded command against @p controller.
 *
 * Recognised commands: save_config, connect_nas, disconnect_nas,
 * rescan_drive, start_transfer, cancel_transfer, clear_finished,
 * speed_test and status.
 *
 * @return The rejection reason, or std::nullopt when the command was
 * accepted.
 */
auto dispatchCommand(engine::Controller& controller,
                     const nlohmann::json& command)
    -> std::optional<std::string>;

/**
 * @brief Parses one line and dispatches it. Rejections and parse errors
 * are published as an "error" event.
 */
void handleCommandLine(engine::Controller& controller, engine::EventSink& events,
                       std::string_view line);

/**
 * @brief Reader thread on a FIFO, handing over each complete line.
 *
 * The FIFO is created if missing and opened read-write so that the reader
 * never sees end-of-file when writers come and go.
 */
class CommandChannel {
public:
    using LineHandler = std::function<void(std::string_view line)>;

    CommandChannel(std::filesystem::path fifoPath, LineHandler handler);
    ~CommandChannel();

    CommandChannel(const CommandChannel&) = delete;
    CommandChannel& operator=(const CommandChannel&) = delete;

    /**
     * @throws offload::error::IOError if the FIFO cannot be created or
     * opened.
     */
    void start();
    void stop();

    [[nodiscard]] auto isRunning() const -> bool {
        return reader_.joinable();
    }

private:
    void run(std::stop_token stopToken);
    void consume(std::string& buffer);

    std::filesystem::path fifoPath_;
    LineHandler handler_;
    int fd_{-1};
    std::jthread reader_;
};

}  // namespace offload::connection

#endif  // OFFLOAD_CONNECTION_COMMAND_CHANNEL_HPP
