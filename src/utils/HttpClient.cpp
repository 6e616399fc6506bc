/**
 * HttpClient.cpp
 *
 * Streaming GET implementation using cpr (which wraps libcurl).
 */

#include "HttpClient.hpp"
#include "StringUtils.hpp"

#include <cpr/cpr.h>
#include <curl/curl.h>

#include <algorithm>
#include <stdexcept>
#include <string_view>

namespace fetchkit::utils {

// -- CurlGlobalInit --

namespace {
std::once_flag g_curlInitFlag;
} // namespace

void CurlGlobalInit::init() {
    std::call_once(g_curlInitFlag, [] {
        curl_global_init(CURL_GLOBAL_ALL);
    });
}

// -- HttpStream --

HttpStream::HttpStream(Token, std::shared_ptr<State> state)
    : m_state(std::move(state)) {
}

HttpStream::~HttpStream() {
    close();
}

int HttpStream::statusCode() const {
    std::unique_lock<std::mutex> lock(m_state->mutex);
    awaitResponse(lock);
    return m_state->statusCode;
}

std::optional<int64_t> HttpStream::contentLength() const {
    auto value = header("content-length");
    if (!value) return std::nullopt;
    return StringUtils::parseContentLength(*value);
}

std::optional<std::string> HttpStream::header(const std::string& name) const {
    std::unique_lock<std::mutex> lock(m_state->mutex);
    awaitResponse(lock);
    auto it = m_state->headers.find(StringUtils::toLower(name));
    if (it == m_state->headers.end()) return std::nullopt;
    return it->second;
}

size_t HttpStream::read(char* buffer, size_t size) {
    std::unique_lock<std::mutex> lock(m_state->mutex);
    m_state->condition.wait(lock, [this] {
        return !m_state->buffer.empty() || m_state->finished || m_state->closed;
    });

    if (!m_state->buffer.empty()) {
        size_t count = std::min(size, m_state->buffer.size());
        std::copy_n(m_state->buffer.begin(), count, buffer);
        m_state->buffer.erase(m_state->buffer.begin(), m_state->buffer.begin() + count);
        m_state->condition.notify_all();
        return count;
    }

    if (m_state->closed) {
        throw std::runtime_error("Transfer aborted");
    }
    if (!m_state->error.empty()) {
        throw std::runtime_error(m_state->error);
    }

    return 0;
}

void HttpStream::abort() {
    {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        m_state->closed = true;
    }
    m_state->condition.notify_all();
}

void HttpStream::close() {
    abort();

    if (m_thread.joinable()) {
        m_thread.join();
    }
}

void HttpStream::awaitResponse(std::unique_lock<std::mutex>& lock) const {
    m_state->condition.wait(lock, [this] {
        return m_state->bodyStarted || m_state->finished || m_state->closed;
    });

    if (m_state->closed) {
        throw std::runtime_error("Transfer aborted");
    }
    if (!m_state->bodyStarted && !m_state->error.empty()) {
        throw std::runtime_error(m_state->error);
    }
}

// -- HttpClient --

HttpClient::HttpClient() {
    CurlGlobalInit::init();
}

HttpClient::~HttpClient() = default;

std::unique_ptr<HttpStream> HttpClient::openStream(const std::string& url, const HttpOptions& options) {
    cpr::Header headers;
    for (const auto& [key, value] : options.headers) headers[key] = value;

    std::string userAgent = options.userAgent.empty() ? HttpOptions{}.userAgent : options.userAgent;
    int timeout = options.timeoutSeconds > 0 ? options.timeoutSeconds : 30;

    auto state = std::make_shared<HttpStream::State>();
    state->bufferLimit = options.bufferLimit > 0 ? options.bufferLimit : HttpOptions{}.bufferLimit;

    auto stream = std::make_unique<HttpStream>(HttpStream::Token{}, state);

    stream->m_thread = std::thread([state, url, headers, userAgent, timeout, options]() {
        auto redirect = options.followRedirects
            ? cpr::Redirect{static_cast<long>(options.maxRedirects)}
            : cpr::Redirect{false};

        cpr::Response response = cpr::Get(
            cpr::Url{url},
            headers,
            cpr::ConnectTimeout{std::chrono::seconds(timeout)},
            cpr::LowSpeed{1, timeout},
            cpr::UserAgent{userAgent},
            cpr::VerifySsl{options.verifySSL},
            redirect,
            cpr::HeaderCallback([state](std::string_view data, intptr_t) -> bool {
                std::string line = StringUtils::trim(std::string(data));
                std::lock_guard<std::mutex> lock(state->mutex);

                if (StringUtils::startsWith(line, "HTTP/")) {
                    // A new response block (redirect hop or final response)
                    state->statusCode = StringUtils::parseStatusLine(line);
                    state->headers.clear();
                    return !state->closed;
                }

                if (auto parsed = StringUtils::parseHeader(line)) {
                    state->headers[StringUtils::toLower(parsed->first)] = parsed->second;
                }
                return !state->closed;
            }),
            cpr::WriteCallback([state](std::string_view data, intptr_t) -> bool {
                std::unique_lock<std::mutex> lock(state->mutex);

                if (!state->bodyStarted) {
                    state->bodyStarted = true;
                    state->condition.notify_all();
                }

                state->condition.wait(lock, [&state] {
                    return state->closed || state->buffer.size() < state->bufferLimit;
                });
                if (state->closed) {
                    return false;
                }

                state->buffer.insert(state->buffer.end(), data.begin(), data.end());
                state->condition.notify_all();
                return true;
            }),
            cpr::ProgressCallback([state](cpr::cpr_off_t, cpr::cpr_off_t,
                                          cpr::cpr_off_t, cpr::cpr_off_t,
                                          intptr_t) -> bool {
                std::lock_guard<std::mutex> lock(state->mutex);
                return !state->closed;
            })
        );

        {
            std::lock_guard<std::mutex> lock(state->mutex);
            state->finished = true;
            if (response.status_code > 0) {
                state->statusCode = static_cast<int>(response.status_code);
            }
            if (!state->closed && response.error) {
                state->error = response.error.message.empty()
                    ? "Transfer failed: " + url
                    : response.error.message;
            }
        }
        state->condition.notify_all();
    });

    return stream;
}

} // namespace fetchkit::utils
