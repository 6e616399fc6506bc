/**
 * RetryPolicy.cpp
 */

#include "RetryPolicy.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>

namespace fetchkit::core::transfer {

RetryPolicy::RetryPolicy(Settings settings)
    : m_settings(settings) {
    if (m_settings.maxRetries < 0) m_settings.maxRetries = 0;
    if (m_settings.backoffMultiplier < 1.0) m_settings.backoffMultiplier = 1.0;
    if (m_settings.delay.count() < 0) m_settings.delay = std::chrono::milliseconds(0);
    if (m_settings.maxDelay < m_settings.delay) m_settings.maxDelay = m_settings.delay;
}

bool RetryPolicy::shouldRetryAutomatically(int retryCount, int maxRetries) const {
    return m_settings.automatic && hasBudget(retryCount, maxRetries);
}

std::chrono::milliseconds RetryPolicy::delayFor(int retryNumber) const {
    if (retryNumber <= 1 || m_settings.backoffMultiplier <= 1.0) {
        return m_settings.delay;
    }

    double scaled = static_cast<double>(m_settings.delay.count()) *
                    std::pow(m_settings.backoffMultiplier, retryNumber - 1);
    double capped = std::min(scaled, static_cast<double>(m_settings.maxDelay.count()));
    return std::chrono::milliseconds(static_cast<int64_t>(capped));
}

} // namespace fetchkit::core::transfer
