#pragma once

/**
 * RetryPolicy.hpp
 *
 * Bounded retry of failed transfers.
 */

#include <chrono>

namespace fetchkit::core::transfer {

/**
 * RetryPolicy - decides whether and when a failed transfer runs again
 *
 * Automatic and manual retries draw from the same per-task budget:
 * a task may be retried while retryCount < maxRetries.
 * The delay is fixed unless backoffMultiplier > 1.
 */
class RetryPolicy {
public:
    struct Settings {
        int maxRetries{3};
        std::chrono::milliseconds delay{2000};
        double backoffMultiplier{1.0};
        std::chrono::milliseconds maxDelay{60000};
        bool automatic{true};
    };

    RetryPolicy() = default;
    explicit RetryPolicy(Settings settings);

    /**
     * Budget check shared by automatic and manual retries
     */
    static bool hasBudget(int retryCount, int maxRetries) {
        return retryCount < maxRetries;
    }

    /**
     * Whether a failed attempt is retried without caller involvement
     */
    bool shouldRetryAutomatically(int retryCount, int maxRetries) const;

    /**
     * Delay before retry number `retryNumber` (1-based)
     */
    std::chrono::milliseconds delayFor(int retryNumber) const;

    const Settings& settings() const { return m_settings; }

private:
    Settings m_settings;
};

} // namespace fetchkit::core::transfer
