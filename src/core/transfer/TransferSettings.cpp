/**
 * TransferSettings.cpp
 */

#include "TransferSettings.hpp"
#include "../Config.hpp"

namespace fetchkit::core::transfer {

TransferSettings TransferSettings::fromConfig(const Config& config) {
    TransferSettings settings;

    int chunkSize = config.get<int>("transfers.chunkSize", static_cast<int>(settings.chunkSize));
    if (chunkSize > 0) {
        settings.chunkSize = static_cast<size_t>(chunkSize);
    }

    settings.progressInterval = std::chrono::milliseconds(
        config.get<int>("transfers.progressIntervalMs", 100));
    settings.speedWindow = std::chrono::milliseconds(
        config.get<int>("transfers.speedWindowMs", 5000));
    settings.timeout = std::chrono::seconds(
        config.get<int>("transfers.timeoutSeconds", 30));
    settings.userAgent = config.get<std::string>("transfers.userAgent", settings.userAgent);
    settings.verifySSL = config.get<bool>("transfers.verifySSL", true);

    settings.retry.maxRetries = config.get<int>("transfers.maxRetries", 3);
    settings.retry.delay = std::chrono::milliseconds(
        config.get<int>("transfers.retryDelayMs", 2000));
    settings.retry.backoffMultiplier = config.get<double>("transfers.retryBackoff", 1.0);
    settings.retry.maxDelay = std::chrono::milliseconds(
        config.get<int>("transfers.maxRetryDelayMs", 60000));
    settings.retry.automatic = config.get<bool>("transfers.autoRetry", true);

    return settings;
}

} // namespace fetchkit::core::transfer
