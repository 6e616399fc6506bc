/**
 * HttpTransferSource.cpp
 */

#include "HttpTransferSource.hpp"
#include "../Errors.hpp"
#include "../Logger.hpp"

#include <stdexcept>

namespace fetchkit::core::transfer {

namespace {

class HttpTransferStream : public TransferStream {
public:
    explicit HttpTransferStream(std::unique_ptr<utils::HttpStream> stream)
        : m_stream(std::move(stream)) {}

    int statusCode() const override {
        try {
            return m_stream->statusCode();
        } catch (const std::runtime_error& e) {
            throw TransferError(std::string("Network error: ") + e.what());
        }
    }

    std::optional<uint64_t> contentLength() const override {
        std::optional<int64_t> length;
        try {
            length = m_stream->contentLength();
        } catch (const std::runtime_error& e) {
            throw TransferError(std::string("Network error: ") + e.what());
        }
        if (!length) return std::nullopt;
        return static_cast<uint64_t>(*length);
    }

    size_t read(char* buffer, size_t size) override {
        try {
            return m_stream->read(buffer, size);
        } catch (const std::runtime_error& e) {
            throw TransferError(std::string("Network error: ") + e.what());
        }
    }

    void abort() override {
        m_stream->abort();
    }

private:
    std::unique_ptr<utils::HttpStream> m_stream;
};

} // namespace

std::unique_ptr<TransferStream> HttpTransferSource::open(const TransferRequest& request) {
    utils::HttpOptions options;
    options.headers = request.headers;
    options.timeoutSeconds = static_cast<int>(request.timeout.count());
    options.verifySSL = request.verifySSL;
    if (!request.userAgent.empty()) {
        options.userAgent = request.userAgent;
    }

    LOG_DEBUG("GET {}", request.url);

    return std::make_unique<HttpTransferStream>(m_client.openStream(request.url, options));
}

} // namespace fetchkit::core::transfer
