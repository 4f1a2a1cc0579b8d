/*
 * speed_estimator.hpp
 *
 * Copyright (C) 2026 offload contributors
 */

/*************************************************

Date: 2026-9-11

Description: Rolling-window throughput and ETA estimate

**************************************************/

#ifndef OFFLOAD_ENGINE_SPEED_ESTIMATOR_HPP
#define OFFLOAD_ENGINE_SPEED_ESTIMATOR_HPP

#include <chrono>
#include <cstdint>
#include <deque>
#include <optional>

namespace offload::engine {

/**
 * @brief Derives bytes per second from (time, cumulative bytes) samples
 * kept over a trailing window.
 *
 * With fewer than two samples in the window the previous speed stands,
 * which is unknown before the first estimate.
 */
class SpeedEstimator {
public:
    using Clock = std::chrono::steady_clock;

    static constexpr std::chrono::milliseconds K_DEFAULT_WINDOW{5000};

    explicit SpeedEstimator(
        std::chrono::milliseconds window = K_DEFAULT_WINDOW);

    /**
     * @brief Records @p bytesDone at @p now and prunes samples older than
     * the window.
     */
    void addSample(Clock::time_point now, std::uint64_t bytesDone);

    [[nodiscard]] auto speed() const -> std::optional<double>;

    /**
     * @return Seconds until @p remainingBytes are done, unknown when the
     * speed is unknown or zero.
     */
    [[nodiscard]] auto eta(std::uint64_t remainingBytes) const
        -> std::optional<double>;

    void reset();

    [[nodiscard]] auto sampleCount() const -> std::size_t {
        return samples_.size();
    }

private:
    struct Sample {
        Clock::time_point time;
        std::uint64_t bytes;
    };

    std::chrono::milliseconds window_;
    std::deque<Sample> samples_;
    std::optional<double> speed_;
};

}  // namespace offload::engine

#endif  // OFFLOAD_ENGINE_SPEED_ESTIMATOR_HPP
