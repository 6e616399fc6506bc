#pragma once

/**
 * TransferSource.hpp
 *
 * Byte-stream sources consumed by transfer workers.
 */

#include "Task.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace fetchkit::core::transfer {

/**
 * A single GET issued by a worker
 */
struct TransferRequest {
    std::string url;
    HeaderMap headers;
    std::chrono::seconds timeout{30};
    std::string userAgent;
    bool verifySSL{true};
};

/**
 * Response being received.
 * Implementations throw core::TransferError on network failure. The response
 * may still be in flight when open() returns; statusCode() and
 * contentLength() wait for it.
 */
class TransferStream {
public:
    virtual ~TransferStream() = default;

    virtual int statusCode() const = 0;

    /**
     * Announced body length (Content-Length), empty if not sent
     */
    virtual std::optional<uint64_t> contentLength() const = 0;

    /**
     * Read up to `size` bytes. Blocks until data is available.
     * @return Bytes read, 0 at end of body
     */
    virtual size_t read(char* buffer, size_t size) = 0;

    /**
     * Called from another thread to interrupt a blocked statusCode(),
     * contentLength() or read(), which then throw core::TransferError.
     * Must not block.
     */
    virtual void abort() = 0;
};

/**
 * Opens transfer streams. Shared by all workers of a registry, so
 * open() must be safe to call from several threads at once.
 */
class TransferSource {
public:
    virtual ~TransferSource() = default;

    /**
     * Issue the request
     * @throws core::TransferError if the request could not be sent
     */
    virtual std::unique_ptr<TransferStream> open(const TransferRequest& request) = 0;
};

} // namespace fetchkit::core::transfer
