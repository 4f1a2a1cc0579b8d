/*
 * event_fifo.hpp
 *
 * Copyright (C) 2026 offload contributors
 */

/*************************************************

Date: 2026-9-16

Description: Observer that writes events to a named pipe

**************************************************/

#ifndef OFFLOAD_CONNECTION_EVENT_FIFO_HPP
#define OFFLOAD_CONNECTION_EVENT_FIFO_HPP

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace offload::connection {

/**
 * @brief One line per event: {"event": name, "data": payload}.
 */
[[nodiscard]] auto encodeEvent(std::string_view name,
                               const nlohmann::json& payload) -> std::string;

/**
 * @brief FIFO writer that only ever leaves whole lines in the pipe.
 *
 * Events are dropped while nobody has the FIFO open for reading. A line
 * that does not fit into the pipe is finished by waiting for the reader,
 * up to the flush timeout. If the reader does not drain it in time the
 * FIFO is closed, so the reader sees end-of-file after the partial line,
 * and reopened on the next event. Every open starts with a status line
 * from the snapshot provider, if one is set. The process must ignore
 * SIGPIPE.
 */
class EventFifoWriter {
public:
    using SnapshotProvider = std::function<nlohmann::json()>;

    static constexpr std::chrono::milliseconds K_DEFAULT_FLUSH_TIMEOUT{1000};

    explicit EventFifoWriter(
        std::filesystem::path fifoPath, SnapshotProvider snapshot = {},
        std::chrono::milliseconds flushTimeout = K_DEFAULT_FLUSH_TIMEOUT);
    ~EventFifoWriter();

    EventFifoWriter(const EventFifoWriter&) = delete;
    EventFifoWriter& operator=(const EventFifoWriter&) = delete;

    /**
     * @throws offload::error::IOError if the FIFO cannot be created.
     */
    void create();

    /**
     * @return False if the event was dropped.
     */
    bool write(std::string_view name, const nlohmann::json& payload);

    [[nodiscard]] auto dropped() const -> std::size_t;

private:
    auto ensureOpen() -> bool;
    auto flush() -> bool;
    void closeFd();

    std::filesystem::path fifoPath_;
    SnapshotProvider snapshot_;
    std::chrono::milliseconds flushTimeout_;
    int fd_{-1};
    std::string pending_;  ///< Unwritten bytes, always ending in a newline
    std::size_t dropped_{0};
    mutable std::mutex mutex_;
};

}  // namespace offload::connection

#endif  // OFFLOAD_CONNECTION_EVENT_FIFO_HPP
