#pragma once

/**
 * SpeedEstimator.hpp
 *
 * Sliding-window throughput sampler producing a smoothed speed and an ETA.
 */

#include <chrono>
#include <cstdint>
#include <deque>
#include <optional>

namespace fetchkit::core::transfer {

/**
 * SpeedEstimator - mean of instantaneous rates inside a time window
 *
 * Each sample is one (timestamp, bytes/sec) pair. Samples older than
 * now - window are evicted on every insert. The speed is the plain
 * arithmetic mean of the retained rates, not a time-weighted integral.
 *
 * Not synchronized: a worker owns its estimator.
 */
class SpeedEstimator {
public:
    using Clock = std::chrono::steady_clock;

    explicit SpeedEstimator(std::chrono::milliseconds window = std::chrono::seconds(5));

    /**
     * Record deltaBytes transferred over deltaSeconds.
     * Samples with deltaSeconds <= 0 are skipped.
     */
    void sample(Clock::time_point now, uint64_t deltaBytes, double deltaSeconds);

    /**
     * Smoothed bytes/sec, empty while fewer than 2 samples are retained
     */
    std::optional<double> speed() const;

    /**
     * Seconds remaining, empty if the total is unknown or speed is not positive
     */
    std::optional<double> eta(uint64_t totalSize, uint64_t downloadedSize) const;

    size_t sampleCount() const { return m_samples.size(); }
    std::chrono::milliseconds window() const { return m_window; }

    void reset();

private:
    struct Sample {
        Clock::time_point at;
        double bytesPerSecond;
    };

    std::chrono::milliseconds m_window;
    std::deque<Sample> m_samples;
};

} // namespace fetchkit::core::transfer
