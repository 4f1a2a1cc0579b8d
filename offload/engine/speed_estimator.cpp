/*
 * speed_estimator.cpp
 *
 * Copyright (C) 2026 offload contributors
 */

/*************************************************

Date: 2026-9-11

Description: Rolling-window throughput and ETA estimate

**************************************************/

#include "speed_estimator.hpp"

namespace offload::engine {

SpeedEstimator::SpeedEstimator(std::chrono::milliseconds window)
    : window_(window) {}

void SpeedEstimator::addSample(Clock::time_point now,
                               std::uint64_t bytesDone) {
    samples_.push_back(Sample{now, bytesDone});

    const auto cutoff = now - window_;
    while (!samples_.empty() && samples_.front().time < cutoff) {
        samples_.pop_front();
    }

    if (samples_.size() < 2) {
        return;
    }
    const Sample& oldest = samples_.front();
    const double dt =
        std::chrono::duration<double>(now - oldest.time).count();
    if (dt <= 0.0 || bytesDone < oldest.bytes) {
        return;
    }
    speed_ = static_cast<double>(bytesDone - oldest.bytes) / dt;
}

auto SpeedEstimator::speed() const -> std::optional<double> { return speed_; }

auto SpeedEstimator::eta(std::uint64_t remainingBytes) const
    -> std::optional<double> {
    if (!speed_ || *speed_ <= 0.0) {
        return std::nullopt;
    }
    return static_cast<double>(remainingBytes) / *speed_;
}

void SpeedEstimator::reset() {
    samples_.clear();
    speed_.reset();
}

}  // namespace offload::engine
