#pragma once

/**
 * TransferSettings.hpp
 *
 * Tunables a TaskRegistry is constructed with.
 */

#include "RetryPolicy.hpp"

#include <chrono>
#include <cstddef>
#include <string>

namespace fetchkit::core {
class Config;
}

namespace fetchkit::core::transfer {

struct TransferSettings {
    // Bytes read from the stream per loop iteration
    size_t chunkSize{8192};

    // Minimum wall-clock gap between progress ticks
    std::chrono::milliseconds progressInterval{100};

    // SpeedEstimator window
    std::chrono::milliseconds speedWindow{5000};

    // Connect timeout and read (stall) timeout
    std::chrono::seconds timeout{30};

    std::string userAgent{"fetchkit/1.0"};
    bool verifySSL{true};

    RetryPolicy::Settings retry;

    /**
     * Build settings from the "transfers.*" configuration keys
     * @param config Configuration to read
     * @return Settings with defaults for missing keys
     */
    static TransferSettings fromConfig(const Config& config);
};

} // namespace fetchkit::core::transfer
