/*
 * event_fifo.cpp
 *
 * Copyright (C) 2026 offload contributors
 */

/*************************************************

Date: 2026-9-16

Description: Observer that writes events to a named pipe

**************************************************/

#include "event_fifo.hpp"

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

auto encodeEvent(std::string_view name, const json& payload) -> std::string {
    json line{{"event", std::string(name)}, {"data", payload}};
    // Invalid UTF-8 in file names must not abort the event stream.
    std::string text =
        line.dump(-1, ' ', false, json::error_handler_t::replace);
    text.push_back('\n');
    return text;
}

EventFifoWriter::EventFifoWriter(fs::path fifoPath, SnapshotProvider snapshot,
                                 std::chrono::milliseconds flushTimeout)
    : fifoPath_(std::move(fifoPath)),
      snapshot_(std::move(snapshot)),
      flushTimeout_(flushTimeout) {}

EventFifoWriter::~EventFifoWriter() {
    std::lock_guard lock(mutex_);
    closeFd();
}

void EventFifoWriter::create() {
    std::error_code ec;
    if (fifoPath_.has_parent_path()) {
        fs::create_directories(fifoPath_.parent_path(), ec);
    }
    if (::mkfifo(fifoPath_.c_str(), 0660) != 0 && errno != EEXIST) {
        THROW_IO_ERROR("Failed to create FIFO ", fifoPath_.string(), ": ",
                       std::strerror(errno));
    }
    spdlog::info("Publishing events on {}", fifoPath_.string());
}

bool EventFifoWriter::write(std::string_view name, const json& payload) {
    const std::string text = encodeEvent(name, payload);

    std::lock_guard lock(mutex_);
    const bool wasOpen = fd_ >= 0;
    if (!ensureOpen()) {
        ++dropped_;
        return false;
    }

    if (!wasOpen && snapshot_ && name != "status") {
        try {
            pending_ += encodeEvent("status", snapshot_());
        } catch (const std::exception& e) {
            spdlog::error("Cannot build snapshot for event reader: {}",
                          e.what());
        }
    }
    pending_ += text;
    if (flush()) {
        return true;
    }
    ++dropped_;
    return false;
}

auto EventFifoWriter::dropped() const -> std::size_t {
    std::lock_guard lock(mutex_);
    return dropped_;
}

auto EventFifoWriter::ensureOpen() -> bool {
    if (fd_ >= 0) {
        return true;
    }
    fd_ = ::open(fifoPath_.c_str(), O_WRONLY | O_NONBLOCK | O_CLOEXEC);
    if (fd_ < 0) {
        // ENXIO: no reader yet.
        if (errno != ENXIO) {
            spdlog::debug("Cannot open {}: {}", fifoPath_.string(),
                          std::strerror(errno));
        }
        return false;
    }
    spdlog::debug("Event reader attached to {}", fifoPath_.string());
    return true;
}

auto EventFifoWriter::flush() -> bool {
    const auto deadline = std::chrono::steady_clock::now() + flushTimeout_;
    while (!pending_.empty()) {
        const ssize_t written = ::write(fd_, pending_.data(), pending_.size());
        if (written > 0) {
            pending_.erase(0, static_cast<std::size_t>(written));
            continue;
        }
        if (written < 0 && errno == EINTR) {
            continue;
        }
        if (written < 0 && errno != EAGAIN) {
            spdlog::debug("Event reader went away: {}", std::strerror(errno));
            closeFd();
            return false;
        }

        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (left.count() <= 0) {
            spdlog::warn("Event reader stalled with {} bytes pending, "
                         "closing {}",
                         pending_.size(), fifoPath_.string());
            closeFd();
            return false;
        }
        pollfd pfd{fd_, POLLOUT, 0};
        if (::poll(&pfd, 1, static_cast<int>(left.count())) < 0 &&
            errno != EINTR) {
            spdlog::error("poll on {} failed: {}", fifoPath_.string(),
                          std::strerror(errno));
            closeFd();
            return false;
        }
        if ((pfd.revents & (POLLERR | POLLHUP)) != 0) {
            spdlog::debug("Event reader went away");
            closeFd();
            return false;
        }
    }
    return true;
}

void EventFifoWriter::closeFd() {
    pending_.clear();
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

}  // namespace offload::connection
