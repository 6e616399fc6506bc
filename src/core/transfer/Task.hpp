#pragma once

/**
 * Task.hpp
 *
 * A single tracked transfer: identity, status, metrics and control flags.
 */

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

namespace fetchkit::core::transfer {

class TransferStream;

using HeaderMap = std::map<std::string, std::string>;
using SystemTime = std::chrono::system_clock::time_point;

/**
 * Task status
 */
enum class TaskStatus {
    Pending,
    Running,
    Paused,
    Completed,
    Failed,
    Cancelled
};

/**
 * Events delivered to task and global callbacks
 */
enum class TaskEvent {
    Started,
    Progress,
    Paused,
    Resumed,
    Completed,
    Failed,
    Cancelled
};

const char* toString(TaskStatus status);
const char* toString(TaskEvent event);

/**
 * COMPLETED, FAILED and CANCELLED
 */
bool isTerminal(TaskStatus status);

/**
 * RUNNING and PAUSED
 */
bool isActive(TaskStatus status);

/**
 * Transfer metrics. Written only by the task's worker while it is attached.
 */
struct TransferMetrics {
    // 0 = unknown
    uint64_t totalSize{0};
    uint64_t downloadedSize{0};

    // Empty while totalSize is unknown
    std::optional<double> progressPercent;

    double speedBps{0.0};
    std::optional<double> etaSeconds;
    double elapsedSeconds{0.0};

    std::optional<SystemTime> startTime;
    std::optional<SystemTime> lastUpdate;

    double speedMbps() const { return speedBps / (1024.0 * 1024.0); }

    /**
     * downloaded / total * 100 clamped to [0, 100], empty when total is 0
     */
    static std::optional<double> computeProgress(uint64_t downloaded, uint64_t total);
};

/**
 * Consistent copy of a task handed to callers and callbacks
 */
struct TaskSnapshot {
    std::string id;
    std::string name;
    std::string description;
    std::string url;
    std::string destination;
    HeaderMap headers;

    TaskStatus status{TaskStatus::Pending};
    TransferMetrics metrics;
    std::optional<std::string> errorMessage;

    int retryCount{0};
    int maxRetries{3};
    SystemTime createdAt;

    bool isTerminal() const { return transfer::isTerminal(status); }
    bool isActive() const { return transfer::isActive(status); }
};

/**
 * Task - shared between the registry and the task's worker.
 *
 * Identity fields are immutable. Everything below `mutex` is guarded by it.
 * `control` is signaled on pause, resume, cancel and when the task leaves
 * its worker, so parked workers and waiters re-check their predicates.
 *
 * pause() and resume() only queue their events; the worker dispatches them
 * in sequence with its own, so no event follows the terminal one.
 */
struct Task {
    Task(std::string id_,
         std::string name_,
         std::string description_,
         std::string url_,
         std::string destination_,
         HeaderMap headers_,
         int maxRetries_);

    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    const std::string id;
    const std::string name;
    const std::string description;
    const std::string url;
    const std::string destination;
    const HeaderMap headers;
    const SystemTime createdAt;

    mutable std::mutex mutex;
    std::condition_variable control;

    TaskStatus status{TaskStatus::Pending};
    TransferMetrics metrics;
    std::optional<std::string> errorMessage;
    int retryCount{0};
    int maxRetries{3};

    bool cancelRequested{false};
    bool pauseRequested{false};

    // A worker owns this task's metrics until it publishes a terminal status
    bool attached{false};

    // Terminal statuses published whose event has not been dispatched yet
    int pendingFinalEvents{0};

    // Paused/resumed events waiting for the worker
    std::deque<std::pair<TaskEvent, TaskSnapshot>> controlEvents;

    // The worker's open response, owned by the worker
    TransferStream* stream{nullptr};
    bool streamAborted{false};

    /**
     * Interrupt the worker's blocked network call. Caller holds `mutex`.
     */
    void abortStreamLocked();

    TaskSnapshot snapshot() const;

    /**
     * Same as snapshot(); caller already holds `mutex`
     */
    TaskSnapshot snapshotLocked() const;
};

} // namespace fetchkit::core::transfer
