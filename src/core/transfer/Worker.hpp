#pragma once

/**
 * Worker.hpp
 *
 * Per-task transfer loop.
 */

#include "EventBus.hpp"
#include "RetryPolicy.hpp"
#include "SpeedEstimator.hpp"
#include "Task.hpp"
#include "TransferSettings.hpp"
#include "TransferSource.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <memory>
#include <string>
#include <thread>

namespace fetchkit::core::transfer {

/**
 * Registry-wide counters updated by workers
 */
struct TransferCounters {
    std::atomic<uint64_t> totalTasks{0};
    std::atomic<uint64_t> completedTasks{0};
    std::atomic<uint64_t> failedTasks{0};
    std::atomic<uint64_t> completedBytes{0};
};

/**
 * Worker - streams one task's resource into its destination file
 *
 * Runs on its own thread from start() until the task reaches a terminal
 * status. While attached it is the only writer of the task's metrics and
 * of the destination file. Failed attempts are retried inside the same
 * worker according to the RetryPolicy.
 */
class Worker {
public:
    Worker(std::shared_ptr<Task> task,
           std::shared_ptr<TransferSource> source,
           EventBus& events,
           TransferCounters& counters,
           const TransferSettings& settings);

    /**
     * Joins the thread
     */
    ~Worker();

    Worker(const Worker&) = delete;
    Worker& operator=(const Worker&) = delete;

    /**
     * Spawn the worker thread. The task must already be RUNNING and attached.
     */
    void start();

    void join();

    /**
     * True once the thread has nothing left to do
     */
    bool isFinished() const { return m_finished; }

    bool runsOnCurrentThread() const {
        return m_thread.get_id() == std::this_thread::get_id();
    }

    const std::string& taskId() const { return m_task->id; }

private:
    enum class Outcome {
        Completed,
        Cancelled
    };

    void run();

    /**
     * One attempt: resume offset, request, chunk loop.
     * @throws TransferError on network or file failure
     */
    Outcome transfer();

    TransferRequest makeRequest(uint64_t offset) const;

    /**
     * Check the response to a request at `written` and (re)open the
     * destination file. Updates `written` when the server ignores the range.
     * @return false if the task was cancelled meanwhile
     */
    bool acceptResponse(TransferStream& stream, uint64_t& written, uint64_t& total, std::ofstream& file);

    // Task mutex held
    void writeChunkLocked(const char* data, size_t count, uint64_t& written, uint64_t total,
                          std::ofstream& file);
    Outcome completeLocked(uint64_t written, uint64_t total, std::ofstream& file);

    /**
     * True if a network error was caused by pause() or cancel() aborting the stream
     */
    bool wasInterrupted() const;

    /**
     * Park until resume() or cancel()
     * @return false if cancelled
     */
    bool parkWhilePaused();

    /**
     * Deliver queued paused/resumed events
     */
    void flushControlEvents();

    /**
     * Decide between retry and FAILED after a failed attempt
     * @return true if another attempt follows
     */
    bool handleFailure(const std::string& error);

    void publishProgress(uint64_t written, uint64_t total);
    void resetTick(uint64_t written);

    void finishCompleted();
    void finishCancelled();

    /**
     * The terminal event is out; wake waitFor() callers
     */
    void settle();

    std::shared_ptr<Task> m_task;
    std::shared_ptr<TransferSource> m_source;
    EventBus& m_events;
    TransferCounters& m_counters;
    TransferSettings m_settings;
    RetryPolicy m_retryPolicy;
    SpeedEstimator m_estimator;

    // Worker thread only
    std::chrono::steady_clock::time_point m_startedAt;
    std::chrono::steady_clock::time_point m_lastTick;
    uint64_t m_lastTickBytes{0};

    std::thread m_thread;
    std::atomic<bool> m_finished{false};
};

} // namespace fetchkit::core::transfer
