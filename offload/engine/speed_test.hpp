/*
 * speed_test.hpp
 *
 * Copyright (C) 2026 offload contributors
 */

/*************************************************

Date: 2026-9-14

Description: One-shot write throughput test of the destination share

**************************************************/

#ifndef OFFLOAD_ENGINE_SPEED_TEST_HPP
#define OFFLOAD_ENGINE_SPEED_TEST_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

#include "offload/engine/events.hpp"
#include "offload/type/result.hpp"

namespace offload::engine {

struct SpeedTestOptions {
    std::uint64_t testSize{256ULL * 1024 * 1024};
    std::size_t chunkSize{4 * 1024 * 1024};
    std::string fileName{".offloader_speedtest.tmp"};
};

struct SpeedTestResult {
    std::uint64_t bytesWritten{0};
    double elapsedSeconds{0.0};
    double bytesPerSecond{0.0};
};

/**
 * @brief Writes random data to a hidden file, fsyncs it and reports the
 * throughput. The file is removed whether or not the test succeeds.
 */
class SpeedTest {
public:
    using ProgressCallback = std::function<void(double percent)>;

    explicit SpeedTest(EventSink& events, SpeedTestOptions options = {});
    ~SpeedTest();

    SpeedTest(const SpeedTest&) = delete;
    SpeedTest& operator=(const SpeedTest&) = delete;

    /**
     * @brief Runs the test on a background thread, publishing
     * speed_test_progress, then speed_test_done or speed_test_error.
     *
     * @return The reason if a test is already running.
     */
    auto start(const std::filesystem::path& directory)
        -> type::Result<void, std::string>;

    [[nodiscard]] auto isRunning() const noexcept -> bool {
        return running_.load();
    }

    /**
     * @brief Blocks until the current test, if any, has finished.
     */
    void wait();

    /**
     * @brief Synchronous measurement.
     * @throws offload::error::IOError if the file cannot be written.
     */
    static auto measure(const std::filesystem::path& directory,
                        const SpeedTestOptions& options,
                        const ProgressCallback& onProgress)
        -> SpeedTestResult;

private:
    EventSink& events_;
    SpeedTestOptions options_;
    std::atomic<bool> running_{false};
    std::mutex mutex_;
    std::jthread worker_;
};

}  // namespace offload::engine

#endif  // OFFLOAD_ENGINE_SPEED_TEST_HPP
