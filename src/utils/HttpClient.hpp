// FetchKit - HTTP Client
// Streaming HTTP GET on top of cpr/libcurl

#pragma once

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace fetchkit::utils {

/**
 * @brief HTTP request options
 */
struct HttpOptions {
    std::map<std::string, std::string> headers;

    // Connect timeout, and the longest time the body may stall
    int timeoutSeconds{30};

    bool followRedirects{true};
    int maxRedirects{5};
    bool verifySSL{true};
    std::string userAgent{"fetchkit/1.0"};

    // Bytes buffered ahead of the reader before curl is held back
    size_t bufferLimit{256 * 1024};
};

/**
 * @brief Response pulled chunk by chunk.
 *
 * The request runs on its own thread; curl's write callback fills a bounded
 * buffer that read() drains. Status and headers become available once the
 * final response starts. Destroying or closing the stream aborts the request.
 */
class HttpStream {
    struct State;

    // Restricts construction to HttpClient
    struct Token {
        explicit Token() = default;
    };

public:
    HttpStream(Token, std::shared_ptr<State> state);
    ~HttpStream();

    HttpStream(const HttpStream&) = delete;
    HttpStream& operator=(const HttpStream&) = delete;

    /**
     * Status code of the final response (after redirects).
     * Blocks until the response starts.
     * @throws std::runtime_error if the request failed or was aborted first
     */
    int statusCode() const;

    /**
     * Content-Length of the final response, if present. Blocks like statusCode().
     */
    std::optional<int64_t> contentLength() const;

    /**
     * Header value by case-insensitive name. Blocks like statusCode().
     */
    std::optional<std::string> header(const std::string& name) const;

    /**
     * Read up to `size` bytes, blocking until data arrives.
     * @return Bytes read, 0 at end of body
     * @throws std::runtime_error if the transfer failed or was aborted
     */
    size_t read(char* buffer, size_t size);

    /**
     * Wake every blocked call and stop the request without waiting for it.
     * Safe to call from any thread.
     */
    void abort();

    /**
     * Abort the request and release the connection
     */
    void close();

private:
    friend class HttpClient;

    struct State {
        std::mutex mutex;
        std::condition_variable condition;
        std::deque<char> buffer;
        size_t bufferLimit{0};

        int statusCode{0};
        std::map<std::string, std::string> headers; // lower-case names
        std::string error;

        bool bodyStarted{false};
        bool finished{false};
        bool closed{false};
    };

    /**
     * Wait for the final response; caller holds the state mutex
     */
    void awaitResponse(std::unique_lock<std::mutex>& lock) const;

    std::shared_ptr<State> m_state;
    std::thread m_thread;
};

/**
 * @brief HTTP client used by transfer workers
 */
class HttpClient {
public:
    HttpClient();
    ~HttpClient();

    // Disable copy
    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    /**
     * Start a GET. Returns at once; the stream's accessors wait for the response.
     */
    std::unique_ptr<HttpStream> openStream(const std::string& url,
                                           const HttpOptions& options = {});
};

/**
 * @brief Global CURL initialization
 */
class CurlGlobalInit {
public:
    static void init();
};

} // namespace fetchkit::utils
