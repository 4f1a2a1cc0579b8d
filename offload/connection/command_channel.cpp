/*
 * command_channel.cpp
 *
 * Copyright (C) 2026 offload contributors
 */

/*************************************************

Date: 2026-9-16

Description: Newline-delimited JSON commands read from a named pipe

**************************************************/

#include "command_channel.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <system_error>

#include <fcntl.h>
#include <poll.h>
#include <sys/stat.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

#include "offload/error/exception.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace offload::connection {

namespace {
constexpr int K_POLL_TIMEOUT_MS = 200;
constexpr std::size_t K_READ_BUFFER = 4096;
constexpr std::size_t K_MAX_LINE = 1024 * 1024;

auto reasonOf(const engine::Controller::CommandResult& result)
    -> std::optional<std::string> {
    if (result.isSuccess()) {
        return std::nullopt;
    }
    return result.error();
}
}  // namespace

auto dispatchCommand(engine::Controller& controller, const json& command)
    -> std::optional<std::string> {
    if (!command.is_object()) {
        return "Command must be a JSON object";
    }
    auto it = command.find("command");
    if (it == command.end() || !it->is_string()) {
        return "Missing command name";
    }
    const std::string name = it->get<std::string>();
    spdlog::debug("Command {}", name);

    if (name == "save_config") {
        json patch = command;
        patch.erase("command");
        return reasonOf(controller.saveSettings(patch));
    }
    if (name == "connect_nas") {
        return reasonOf(controller.connectDestination());
    }
    if (name == "disconnect_nas") {
        return reasonOf(controller.disconnectDestination());
    }
    if (name == "rescan_drive") {
        return reasonOf(controller.rescanSource());
    }
    if (name == "start_transfer") {
        std::vector<std::string> files;
        if (auto list = command.find("files");
            list != command.end() && list->is_array()) {
            for (const auto& item : *list) {
                if (item.is_string()) {
                    files.push_back(item.get<std::string>());
                }
            }
        }
        return reasonOf(controller.startTransfer(files));
    }
    if (name == "cancel_transfer") {
        return reasonOf(controller.cancelTransfer());
    }
    if (name == "clear_finished") {
        return reasonOf(controller.clearFinished());
    }
    if (name == "speed_test") {
        return reasonOf(controller.runSpeedTest());
    }
    if (name == "status") {
        controller.broadcastStatus();
        return std::nullopt;
    }
    return "Unknown command: " + name;
}

void handleCommandLine(engine::Controller& controller,
                       engine::EventSink& events, std::string_view line) {
    std::optional<std::string> reason;
    try {
        reason = dispatchCommand(controller, json::parse(line));
    } catch (const json::exception& e) {
        reason = std::string("Malformed command: ") + e.what();
    }
    if (reason) {
        spdlog::warn("Command rejected: {}", *reason);
        events.emit(engine::event::COMMAND_ERROR, {{"message", *reason}});
    }
}

CommandChannel::CommandChannel(fs::path fifoPath, LineHandler handler)
    : fifoPath_(std::move(fifoPath)), handler_(std::move(handler)) {}

CommandChannel::~CommandChannel() { stop(); }

void CommandChannel::start() {
    if (reader_.joinable()) {
        return;
    }

    std::error_code ec;
    if (fifoPath_.has_parent_path()) {
        fs::create_directories(fifoPath_.parent_path(), ec);
    }
    if (::mkfifo(fifoPath_.c_str(), 0660) != 0 && errno != EEXIST) {
        THROW_IO_ERROR("Failed to create FIFO ", fifoPath_.string(), ": ",
                       std::strerror(errno));
    }
    fd_ = ::open(fifoPath_.c_str(), O_RDWR | O_NONBLOCK | O_CLOEXEC);
    if (fd_ < 0) {
        THROW_IO_ERROR("Failed to open FIFO ", fifoPath_.string(), ": ",
                       std::strerror(errno));
    }

    reader_ = std::jthread([this](std::stop_token stopToken) { run(stopToken); });
    spdlog::info("Listening for commands on {}", fifoPath_.string());
}

void CommandChannel::stop() {
    if (reader_.joinable()) {
        reader_.request_stop();
        reader_.join();
    }
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

void CommandChannel::run(std::stop_token stopToken) {
    std::string buffer;
    std::array<char, K_READ_BUFFER> chunk{};

    while (!stopToken.stop_requested()) {
        pollfd pfd{fd_, POLLIN, 0};
        const int ready = ::poll(&pfd, 1, K_POLL_TIMEOUT_MS);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::error("poll on {} failed: {}", fifoPath_.string(),
                          std::strerror(errno));
            break;
        }
        if (ready == 0 || (pfd.revents & POLLIN) == 0) {
            continue;
        }

        const ssize_t count = ::read(fd_, chunk.data(), chunk.size());
        if (count < 0) {
            if (errno != EAGAIN && errno != EINTR) {
                spdlog::error("read on {} failed: {}", fifoPath_.string(),
                              std::strerror(errno));
            }
            continue;
        }
        buffer.append(chunk.data(), static_cast<std::size_t>(count));
        consume(buffer);
        if (buffer.size() > K_MAX_LINE) {
            spdlog::warn("Discarding oversized command ({} bytes)",
                         buffer.size());
            buffer.clear();
        }
    }
}

void CommandChannel::consume(std::string& buffer) {
    std::size_t start = 0;
    for (auto newline = buffer.find('\n'); newline != std::string::npos;
         newline = buffer.find('\n', start)) {
        std::string_view line(buffer.data() + start, newline - start);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        if (!line.empty()) {
            try {
                handler_(line);
            } catch (const std::exception& e) {
                spdlog::error("Command handler failed: {}", e.what());
            }
        }
        start = newline + 1;
    }
    buffer.erase(0, start);
}

}  // namespace offload::connection
