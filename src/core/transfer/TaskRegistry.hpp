#pragma once

/**
 * TaskRegistry.hpp
 *
 * Creates, drives and tracks transfer tasks.
 */

#include "EventBus.hpp"
#include "Task.hpp"
#include "TransferSettings.hpp"
#include "TransferSource.hpp"
#include "Worker.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace fetchkit::core::transfer {

/**
 * Aggregates over all tasks of a registry
 */
struct GlobalStats {
    size_t totalTasks{0};
    size_t completedTasks{0};
    size_t failedTasks{0};
    double totalDownloadedMb{0.0};
    size_t activeDownloads{0};
    double currentTotalSpeedMbps{0.0};
    size_t tasksInQueue{0};
};

/**
 * TaskRegistry - transfer task orchestration
 *
 * Features:
 * - One worker thread per active transfer
 * - Pause/resume by parking the worker, cancel with partial-file cleanup
 * - Automatic and manual retry sharing one per-task budget
 * - Resumable transfers through HTTP range requests
 * - Per-task and global event callbacks
 *
 * Structural mutations are serialized by one registry-wide mutex.
 * Task reads return snapshot copies. Instances are independent; the
 * destructor cancels active transfers and joins their workers.
 */
class TaskRegistry {
public:
    /**
     * Constructor
     * @param settings Transfer tunables
     * @param source Stream source (nullptr = HTTP via cpr)
     */
    explicit TaskRegistry(TransferSettings settings = {},
                          std::shared_ptr<TransferSource> source = nullptr);

    /**
     * Destructor - calls shutdown()
     */
    ~TaskRegistry();

    // Disable copy
    TaskRegistry(const TaskRegistry&) = delete;
    TaskRegistry& operator=(const TaskRegistry&) = delete;

    /**
     * Register a new PENDING task
     * @throws DuplicateTaskError if the id is taken
     */
    TaskSnapshot create(const std::string& id,
                        const std::string& name,
                        const std::string& url,
                        const std::string& destination,
                        const std::string& description = "",
                        const HeaderMap& headers = {});

    /**
     * Spawn a worker for a PENDING task
     * @return false if unknown, not PENDING or already attached to a worker
     */
    bool start(const std::string& id);

    /**
     * RUNNING -> PAUSED. Interrupts the worker's network read; the worker
     * delivers the paused event and parks.
     */
    bool pause(const std::string& id);

    /**
     * PAUSED -> RUNNING
     */
    bool resume(const std::string& id);

    /**
     * RUNNING, PAUSED, or waiting for an automatic retry -> CANCELLED.
     * The partial destination file is deleted before this returns.
     */
    bool cancel(const std::string& id);

    /**
     * FAILED -> PENDING -> RUNNING while retryCount < maxRetries
     */
    bool retry(const std::string& id);

    /**
     * Forget a task; fails while RUNNING, PAUSED or waiting for a retry
     */
    bool remove(const std::string& id);

    /**
     * Remove every terminal task
     * @return Number of tasks removed
     */
    size_t clearFinished();

    std::optional<TaskSnapshot> get(const std::string& id) const;
    std::vector<TaskSnapshot> list() const;
    std::vector<TaskSnapshot> listActive() const;

    /**
     * Change the retry budget of a task with no active worker
     * @throws NotFoundError for unknown ids
     * @return false if the task is attached to a worker
     */
    bool setMaxRetries(const std::string& id, int maxRetries);

    /**
     * Per-task callback
     * @throws NotFoundError for unknown ids
     */
    SubscriptionPtr subscribe(const std::string& id, TaskCallback callback);

    /**
     * Callback for every event of every task
     */
    SubscriptionPtr subscribeAll(GlobalCallback callback);

    void unsubscribe(const SubscriptionPtr& subscription);

    /**
     * Block until the task is terminal, released by its worker and its
     * final event has been dispatched
     * @return Last snapshot, empty for unknown ids
     */
    std::optional<TaskSnapshot> waitFor(const std::string& id,
                                        std::chrono::milliseconds timeout) const;

    GlobalStats globalStats() const;

    const TransferSettings& settings() const { return m_settings; }

    /**
     * Cancel active transfers and join all workers. Idempotent.
     * start() and retry() are refused afterwards.
     */
    void shutdown();

private:
    std::shared_ptr<Task> findLocked(const std::string& id) const;

    /**
     * Attach a worker to a PENDING task; registry lock held
     */
    bool startLocked(const std::shared_ptr<Task>& task);

    /**
     * Join finished workers that were replaced or whose task was removed
     */
    void reapRetiredLocked();

    void retireWorkerLocked(const std::string& id);

private:
    TransferSettings m_settings;
    std::shared_ptr<TransferSource> m_source;
    EventBus m_events;
    TransferCounters m_counters;

    mutable std::mutex m_mutex;
    std::unordered_map<std::string, std::shared_ptr<Task>> m_tasks;
    std::vector<std::string> m_order;
    std::unordered_map<std::string, std::unique_ptr<Worker>> m_workers;
    std::vector<std::unique_ptr<Worker>> m_retired;
    bool m_shutdown{false};
};

} // namespace fetchkit::core::transfer
