#pragma once

/**
 * FakeTransferSource.hpp
 *
 * In-memory TransferSource for driving workers without a network.
 */

#include "core/Errors.hpp"
#include "core/transfer/TransferSource.hpp"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstring>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace fetchkit::test {

using core::transfer::TransferRequest;
using core::transfer::TransferSource;
using core::transfer::TransferStream;

/**
 * Resource content 0..size-1 with a recognizable byte pattern
 */
inline std::string makePayload(size_t size) {
    std::string payload(size, '\0');
    for (size_t i = 0; i < size; ++i) {
        payload[i] = static_cast<char>('a' + (i % 23));
    }
    return payload;
}

class FakeTransferStream : public TransferStream {
public:
    FakeTransferStream(int status, std::string body, bool sendLength,
                       size_t maxRead, std::chrono::milliseconds delay,
                       std::optional<size_t> stallAt)
        : m_status(status)
        , m_body(std::move(body))
        , m_sendLength(sendLength)
        , m_maxRead(maxRead)
        , m_delay(delay)
        , m_stallAt(stallAt) {}

    int statusCode() const override { return m_status; }

    std::optional<uint64_t> contentLength() const override {
        if (!m_sendLength) return std::nullopt;
        return m_body.size();
    }

    size_t read(char* buffer, size_t size) override {
        std::unique_lock<std::mutex> lock(m_mutex);

        if (m_stallAt && m_position >= *m_stallAt) {
            m_condition.wait(lock, [this] { return m_aborted; });
        } else if (m_delay.count() > 0) {
            m_condition.wait_for(lock, m_delay, [this] { return m_aborted; });
        }
        if (m_aborted) {
            throw core::TransferError("Transfer aborted");
        }

        size_t count = std::min({size, m_maxRead, m_body.size() - m_position});
        if (m_stallAt && m_position < *m_stallAt) {
            count = std::min(count, *m_stallAt - m_position);
        }
        std::memcpy(buffer, m_body.data() + m_position, count);
        m_position += count;
        return count;
    }

    void abort() override {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_aborted = true;
        }
        m_condition.notify_all();
    }

private:
    int m_status;
    std::string m_body;
    bool m_sendLength;
    size_t m_maxRead;
    std::chrono::milliseconds m_delay;
    std::optional<size_t> m_stallAt;

    std::mutex m_mutex;
    std::condition_variable m_condition;
    size_t m_position{0};
    bool m_aborted{false};
};

/**
 * Serves registered resources, honoring "Range: bytes=N-" when enabled.
 * Unknown URLs answer 404.
 */
class FakeTransferSource : public TransferSource {
public:
    void addResource(const std::string& url, std::string content) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_resources[url] = std::move(content);
    }

    void setHonorRange(bool honor) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_honorRange = honor;
    }

    void setSendContentLength(bool send) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_sendLength = send;
    }

    /**
     * Deliver at most maxRead bytes per read, sleeping delay before each
     */
    void setThrottle(size_t maxRead, std::chrono::milliseconds delay) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_maxRead = maxRead;
        m_delay = delay;
    }

    /**
     * Streams opened from now on block in read() once `bytes` of their body
     * were delivered, until aborted. Empty disables.
     */
    void setStallAfter(std::optional<size_t> bytes) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stallAt = bytes;
    }

    /**
     * The next `count` calls to open() throw TransferError
     */
    void failNextOpens(int count) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_failures = count;
    }

    std::vector<TransferRequest> requests() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_requests;
    }

    size_t openCount() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_requests.size();
    }

    std::unique_ptr<TransferStream> open(const TransferRequest& request) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_requests.push_back(request);

        if (m_failures > 0) {
            --m_failures;
            throw core::TransferError("Connection refused");
        }

        auto it = m_resources.find(request.url);
        if (it == m_resources.end()) {
            return std::make_unique<FakeTransferStream>(404, "", false, m_maxRead, m_delay, std::nullopt);
        }
        const std::string& content = it->second;

        size_t offset = 0;
        auto range = request.headers.find("Range");
        if (m_honorRange && range != request.headers.end()) {
            // "bytes=N-"
            offset = std::stoull(range->second.substr(6));
            if (offset >= content.size()) {
                return std::make_unique<FakeTransferStream>(416, "", false, m_maxRead, m_delay, std::nullopt);
            }
            return std::make_unique<FakeTransferStream>(206, content.substr(offset), m_sendLength,
                                                        m_maxRead, m_delay, m_stallAt);
        }

        return std::make_unique<FakeTransferStream>(200, content, m_sendLength, m_maxRead, m_delay,
                                                    m_stallAt);
    }

private:
    mutable std::mutex m_mutex;
    std::map<std::string, std::string> m_resources;
    bool m_honorRange{true};
    bool m_sendLength{true};
    size_t m_maxRead{static_cast<size_t>(-1)};
    std::chrono::milliseconds m_delay{0};
    std::optional<size_t> m_stallAt;
    int m_failures{0};
    std::vector<TransferRequest> m_requests;
};

} // namespace fetchkit::test
