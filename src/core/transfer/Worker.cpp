/**
 * Worker.cpp
 *
 * Transfer loop: resume offset, range request, chunked copy to disk,
 * progress ticks, pause parking and retry.
 */

#include "Worker.hpp"
#include "../Errors.hpp"
#include "../Logger.hpp"
#include "../../utils/FileUtils.hpp"

#include <deque>
#include <utility>
#include <vector>

namespace fetchkit::core::transfer {

namespace {

using SteadyClock = std::chrono::steady_clock;

double secondsBetween(SteadyClock::time_point from, SteadyClock::time_point to) {
    return std::chrono::duration<double>(to - from).count();
}

/**
 * The worker's open response, published on the task so pause() and
 * cancel() can abort it. Replaced streams are destroyed outside the lock.
 */
class ActiveStream {
public:
    explicit ActiveStream(Task& task) : m_task(task) {}

    ~ActiveStream() { reset(); }

    ActiveStream(const ActiveStream&) = delete;
    ActiveStream& operator=(const ActiveStream&) = delete;

    void reset(std::unique_ptr<TransferStream> stream = nullptr) {
        {
            std::lock_guard<std::mutex> lock(m_task.mutex);
            m_task.stream = stream.get();
            m_task.streamAborted = false;
            // Requested before the stream existed
            if (m_task.cancelRequested || m_task.pauseRequested) {
                m_task.abortStreamLocked();
            }
        }
        std::swap(m_stream, stream);
    }

    TransferStream& operator*() const { return *m_stream; }
    TransferStream* operator->() const { return m_stream.get(); }
    explicit operator bool() const { return m_stream != nullptr; }

private:
    Task& m_task;
    std::unique_ptr<TransferStream> m_stream;
};

} // namespace

Worker::Worker(std::shared_ptr<Task> task,
               std::shared_ptr<TransferSource> source,
               EventBus& events,
               TransferCounters& counters,
               const TransferSettings& settings)
    : m_task(std::move(task))
    , m_source(std::move(source))
    , m_events(events)
    , m_counters(counters)
    , m_settings(settings)
    , m_retryPolicy(settings.retry)
    , m_estimator(settings.speedWindow) {
    if (m_settings.chunkSize == 0) {
        m_settings.chunkSize = 8192;
    }
}

Worker::~Worker() {
    join();
}

void Worker::start() {
    m_thread = std::thread([this] { run(); });
}

void Worker::join() {
    if (!m_thread.joinable()) return;

    if (runsOnCurrentThread()) {
        // Destroyed from one of its own callbacks; run() returns right after
        m_thread.detach();
        return;
    }
    m_thread.join();
}

void Worker::run() {
    m_startedAt = SteadyClock::now();
    LOG_INFO("Transfer started: {} ({})", m_task->name, m_task->id);
    m_events.dispatch(m_task->snapshot(), TaskEvent::Started);

    while (true) {
        std::string error;

        try {
            Outcome outcome = transfer();
            if (outcome == Outcome::Completed) {
                finishCompleted();
            } else {
                finishCancelled();
            }
            break;
        } catch (const TransferError& e) {
            error = e.what();
        } catch (const std::exception& e) {
            error = std::string("Unexpected error: ") + e.what();
        }

        if (!handleFailure(error)) {
            break;
        }
    }

    m_finished = true;
}

Worker::Outcome Worker::transfer() {
    uint64_t written = 0;
    uint64_t total = 0;

    int64_t existing = utils::FileUtils::getFileSize(m_task->destination);
    if (existing > 0) {
        written = static_cast<uint64_t>(existing);
        LOG_INFO("Found partial file for {} ({} bytes)", m_task->id, written);
    }

    {
        std::lock_guard<std::mutex> lock(m_task->mutex);
        m_task->metrics.downloadedSize = written;
    }

    std::vector<char> buffer(m_settings.chunkSize);
    std::ofstream file;
    ActiveStream stream(*m_task);

    while (true) {
        if (!stream) {
            if (total > 0 && written == total) {
                // Every byte arrived before the pause took effect
                std::lock_guard<std::mutex> lock(m_task->mutex);
                if (m_task->cancelRequested) {
                    return Outcome::Cancelled;
                }
                return completeLocked(written, total, file);
            }
            if (!parkWhilePaused()) {
                return Outcome::Cancelled;
            }
        }

        size_t count = 0;
        bool interrupted = false;
        try {
            if (!stream) {
                stream.reset(m_source->open(makeRequest(written)));
                if (!acceptResponse(*stream, written, total, file)) {
                    return Outcome::Cancelled;
                }
                resetTick(written);
            }
            count = stream->read(buffer.data(), buffer.size());
        } catch (const TransferError& e) {
            if (!wasInterrupted()) {
                throw;
            }
            LOG_DEBUG("Transfer {} interrupted: {}", m_task->id, e.what());
            interrupted = true;
        }

        bool pausedNow = false;
        {
            std::lock_guard<std::mutex> lock(m_task->mutex);

            if (m_task->cancelRequested) {
                return Outcome::Cancelled;
            }

            bool lastChunk = total > 0 && written + count == total;

            if (interrupted) {
                pausedNow = true;
            } else if (count == 0) {
                if (total > 0 && written < total) {
                    throw TransferError("Connection closed after " + std::to_string(written) +
                                        " of " + std::to_string(total) + " bytes");
                }
                return completeLocked(written, total, file);
            } else if (m_task->pauseRequested && !lastChunk) {
                // The chunk is dropped; the request is reissued at `written`
                pausedNow = true;
            } else {
                writeChunkLocked(buffer.data(), count, written, total, file);
                if (m_task->pauseRequested) {
                    // Completes instead of pausing; there is nothing left to resume
                    return completeLocked(written, total, file);
                }
            }
        }

        if (pausedNow) {
            stream.reset();
            file.flush();
            continue;
        }

        publishProgress(written, total);
        flushControlEvents();
    }
}

TransferRequest Worker::makeRequest(uint64_t offset) const {
    TransferRequest request;
    request.url = m_task->url;
    request.headers = m_task->headers;
    request.timeout = m_settings.timeout;
    request.userAgent = m_settings.userAgent;
    request.verifySSL = m_settings.verifySSL;

    if (offset > 0) {
        request.headers["Range"] = "bytes=" + std::to_string(offset) + "-";
    }
    return request;
}

bool Worker::acceptResponse(TransferStream& stream, uint64_t& written, uint64_t& total, std::ofstream& file) {
    const std::string& destination = m_task->destination;
    uint64_t offset = written;

    int status = stream.statusCode();
    auto length = stream.contentLength();

    if (offset > 0 && status == 416) {
        {
            std::lock_guard<std::mutex> lock(m_task->mutex);
            if (!m_task->cancelRequested) {
                if (!utils::FileUtils::deleteFile(destination)) {
                    throw TransferError("HTTP 416: cannot discard partial file " + destination);
                }
                m_task->metrics.downloadedSize = 0;
            }
        }
        written = 0;
        throw TransferError("HTTP 416: range not satisfiable, partial file discarded");
    }

    if (status < 200 || status >= 300) {
        throw TransferError("HTTP " + std::to_string(status));
    }

    bool append = offset > 0;
    if (offset > 0 && status != 206) {
        LOG_WARN("Server ignored range request for {} (HTTP {}), restarting from byte 0",
                 m_task->id, status);
        append = false;
        offset = 0;
    } else if (offset > 0) {
        LOG_INFO("Resuming {} from byte {}", m_task->id, offset);
    }

    if (!utils::FileUtils::createParentDirectories(destination)) {
        throw TransferError("Cannot create directory for " + destination);
    }

    std::lock_guard<std::mutex> lock(m_task->mutex);
    if (m_task->cancelRequested) {
        return false;
    }

    if (file.is_open()) {
        file.close();
    }
    file.clear();
    file.open(destination, std::ios::binary | (append ? std::ios::app : std::ios::trunc));
    if (!file.is_open()) {
        throw TransferError("Cannot open " + destination + " for writing");
    }

    written = offset;
    total = length ? *length + offset : 0;

    auto& metrics = m_task->metrics;
    metrics.totalSize = total;
    metrics.downloadedSize = written;
    metrics.progressPercent = TransferMetrics::computeProgress(written, total);

    LOG_DEBUG("Connected {} (HTTP {}, {} bytes announced)", m_task->id, status,
              length ? std::to_string(*length) : std::string("unknown"));
    return true;
}

void Worker::writeChunkLocked(const char* data, size_t count, uint64_t& written, uint64_t total,
                              std::ofstream& file) {
    if (total > 0 && written + count > total) {
        throw TransferError("Server sent more than the announced " +
                            std::to_string(total) + " bytes");
    }

    file.write(data, static_cast<std::streamsize>(count));
    if (!file) {
        throw TransferError("Failed to write " + m_task->destination);
    }

    written += count;
    m_task->metrics.downloadedSize = written;
}

Worker::Outcome Worker::completeLocked(uint64_t written, uint64_t total, std::ofstream& file) {
    if (file.is_open()) {
        file.flush();
        if (!file) {
            throw TransferError("Failed to write " + m_task->destination);
        }
    }

    auto& metrics = m_task->metrics;
    m_task->status = TaskStatus::Completed;
    m_task->pauseRequested = false;
    metrics.downloadedSize = written;
    if (total > 0) {
        metrics.progressPercent = 100.0;
        metrics.etaSeconds = 0.0;
    }
    metrics.elapsedSeconds = secondsBetween(m_startedAt, SteadyClock::now());
    metrics.lastUpdate = std::chrono::system_clock::now();
    m_task->attached = false;
    ++m_task->pendingFinalEvents;
    return Outcome::Completed;
}

bool Worker::wasInterrupted() const {
    std::lock_guard<std::mutex> lock(m_task->mutex);
    return m_task->cancelRequested || m_task->pauseRequested || m_task->streamAborted;
}

bool Worker::parkWhilePaused() {
    flushControlEvents();

    bool parked = false;
    bool cancelled = false;
    {
        std::unique_lock<std::mutex> lock(m_task->mutex);
        if (m_task->pauseRequested && !m_task->cancelRequested) {
            parked = true;
            LOG_DEBUG("Worker for {} parked", m_task->id);
            m_task->control.wait(lock, [this] {
                return !m_task->pauseRequested || m_task->cancelRequested;
            });
            LOG_DEBUG("Worker for {} unparked", m_task->id);
        }
        cancelled = m_task->cancelRequested;
    }

    // Speed samples must not span the pause
    m_estimator.reset();

    if (parked) {
        flushControlEvents();
    }
    return !cancelled;
}

void Worker::flushControlEvents() {
    std::deque<std::pair<TaskEvent, TaskSnapshot>> events;
    {
        std::lock_guard<std::mutex> lock(m_task->mutex);
        events.swap(m_task->controlEvents);
    }

    for (const auto& [event, snapshot] : events) {
        m_events.dispatch(snapshot, event);
    }
}

bool Worker::handleFailure(const std::string& error) {
    flushControlEvents();

    TaskSnapshot failed;
    int retryNumber = 0;
    int maxRetries = 0;
    bool cancelled = false;
    bool exhausted = false;

    {
        std::lock_guard<std::mutex> lock(m_task->mutex);

        if (m_task->cancelRequested) {
            cancelled = true;
        } else if (m_task->pauseRequested) {
            // The attempt resumes after the pause and consumes no retry
            LOG_DEBUG("Transfer {} failed while paused: {}", m_task->id, error);
            return true;
        } else if (!m_retryPolicy.shouldRetryAutomatically(m_task->retryCount, m_task->maxRetries)) {
            exhausted = true;
            m_task->status = TaskStatus::Failed;
            m_task->errorMessage = error;
            m_task->attached = false;
            ++m_task->pendingFinalEvents;
            failed = m_task->snapshotLocked();
        } else {
            retryNumber = ++m_task->retryCount;
            maxRetries = m_task->maxRetries;
            m_task->status = TaskStatus::Pending;
            m_task->metrics = TransferMetrics{};
            m_task->errorMessage = error;
        }
    }

    if (cancelled) {
        finishCancelled();
        return false;
    }

    if (exhausted) {
        ++m_counters.failedTasks;
        LOG_ERROR("Transfer failed: {} ({}): {}", m_task->name, m_task->id, error);
        m_events.dispatch(failed, TaskEvent::Failed);
        settle();
        return false;
    }

    auto delay = m_retryPolicy.delayFor(retryNumber);
    LOG_WARN("Transfer {} failed: {}; retry {}/{} in {} ms",
             m_task->id, error, retryNumber, maxRetries, delay.count());

    TaskSnapshot restarted;
    {
        std::unique_lock<std::mutex> lock(m_task->mutex);
        m_task->control.wait_for(lock, delay, [this] { return m_task->cancelRequested; });

        if (m_task->cancelRequested) {
            cancelled = true;
        } else {
            m_task->status = TaskStatus::Running;
            m_task->metrics.startTime = std::chrono::system_clock::now();
            restarted = m_task->snapshotLocked();
        }
    }

    if (cancelled) {
        finishCancelled();
        return false;
    }

    m_startedAt = SteadyClock::now();
    m_estimator.reset();
    m_events.dispatch(restarted, TaskEvent::Started);
    return true;
}

void Worker::resetTick(uint64_t written) {
    m_lastTick = SteadyClock::now();
    m_lastTickBytes = written;
}

void Worker::publishProgress(uint64_t written, uint64_t total) {
    auto now = SteadyClock::now();
    if (now - m_lastTick < m_settings.progressInterval) {
        return;
    }

    m_estimator.sample(now, written - m_lastTickBytes, secondsBetween(m_lastTick, now));
    m_lastTick = now;
    m_lastTickBytes = written;

    TaskSnapshot snapshot;
    {
        std::lock_guard<std::mutex> lock(m_task->mutex);
        if (m_task->status != TaskStatus::Running) {
            return;
        }

        auto& metrics = m_task->metrics;
        metrics.progressPercent = TransferMetrics::computeProgress(written, total);
        metrics.speedBps = m_estimator.speed().value_or(0.0);
        metrics.etaSeconds = m_estimator.eta(total, written);
        metrics.elapsedSeconds = secondsBetween(m_startedAt, now);
        metrics.lastUpdate = std::chrono::system_clock::now();
        snapshot = m_task->snapshotLocked();
    }

    m_events.dispatch(snapshot, TaskEvent::Progress);
}

void Worker::finishCompleted() {
    // transfer() already published COMPLETED under the task lock
    TaskSnapshot snapshot = m_task->snapshot();
    flushControlEvents();

    ++m_counters.completedTasks;
    m_counters.completedBytes += snapshot.metrics.downloadedSize;

    LOG_INFO("Transfer completed: {} ({}, {} bytes)", m_task->name, m_task->id,
             snapshot.metrics.downloadedSize);
    m_events.dispatch(snapshot, TaskEvent::Completed);
    settle();
}

void Worker::finishCancelled() {
    // cancel() removed the file already; this covers a delete that failed there
    if (!utils::FileUtils::deleteFile(m_task->destination)) {
        LOG_WARN("Could not delete partial file {}", m_task->destination);
    }

    TaskSnapshot snapshot;
    {
        std::lock_guard<std::mutex> lock(m_task->mutex);
        m_task->status = TaskStatus::Cancelled;
        m_task->attached = false;
        ++m_task->pendingFinalEvents;
        snapshot = m_task->snapshotLocked();
    }

    flushControlEvents();
    LOG_INFO("Transfer cancelled: {} ({})", m_task->name, m_task->id);
    m_events.dispatch(snapshot, TaskEvent::Cancelled);
    settle();
}

void Worker::settle() {
    {
        std::lock_guard<std::mutex> lock(m_task->mutex);
        --m_task->pendingFinalEvents;
    }
    m_task->control.notify_all();
}

} // namespace fetchkit::core::transfer
