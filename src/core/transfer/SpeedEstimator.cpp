/**
 * SpeedEstimator.cpp
 */

#include "SpeedEstimator.hpp"

#include <numeric>

namespace fetchkit::core::transfer {

SpeedEstimator::SpeedEstimator(std::chrono::milliseconds window)
    : m_window(window) {
}

void SpeedEstimator::sample(Clock::time_point now, uint64_t deltaBytes, double deltaSeconds) {
    auto cutoff = now - m_window;
    while (!m_samples.empty() && m_samples.front().at <= cutoff) {
        m_samples.pop_front();
    }

    if (deltaSeconds <= 0.0) {
        return;
    }

    m_samples.push_back({now, static_cast<double>(deltaBytes) / deltaSeconds});
}

std::optional<double> SpeedEstimator::speed() const {
    if (m_samples.size() < 2) {
        return std::nullopt;
    }

    double sum = std::accumulate(m_samples.begin(), m_samples.end(), 0.0,
        [](double acc, const Sample& s) { return acc + s.bytesPerSecond; });
    return sum / static_cast<double>(m_samples.size());
}

std::optional<double> SpeedEstimator::eta(uint64_t totalSize, uint64_t downloadedSize) const {
    if (totalSize == 0) {
        return std::nullopt;
    }

    auto current = speed();
    if (!current || *current <= 0.0) {
        return std::nullopt;
    }

    uint64_t remaining = totalSize > downloadedSize ? totalSize - downloadedSize : 0;
    return static_cast<double>(remaining) / *current;
}

void SpeedEstimator::reset() {
    m_samples.clear();
}

} // namespace fetchkit::core::transfer
