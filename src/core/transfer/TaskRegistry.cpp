/**
 * TaskRegistry.cpp
 *
 * Implementation of the transfer task registry.
 */

#include "TaskRegistry.hpp"
#include "HttpTransferSource.hpp"
#include "../Errors.hpp"
#include "../Logger.hpp"
#include "../../utils/FileUtils.hpp"

#include <algorithm>
#include <stdexcept>

namespace fetchkit::core::transfer {

TaskRegistry::TaskRegistry(TransferSettings settings, std::shared_ptr<TransferSource> source)
    : m_settings(std::move(settings))
    , m_source(std::move(source)) {
    if (!m_source) {
        m_source = std::make_shared<HttpTransferSource>();
    }
}

TaskRegistry::~TaskRegistry() {
    shutdown();
}

TaskSnapshot TaskRegistry::create(const std::string& id,
                                  const std::string& name,
                                  const std::string& url,
                                  const std::string& destination,
                                  const std::string& description,
                                  const HeaderMap& headers) {
    if (id.empty()) {
        throw std::invalid_argument("Task id must not be empty");
    }

    std::shared_ptr<Task> task;
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        if (m_tasks.count(id) > 0) {
            throw DuplicateTaskError(id);
        }

        task = std::make_shared<Task>(id, name, description, url, destination, headers,
                                      std::max(0, m_settings.retry.maxRetries));
        m_tasks.emplace(id, task);
        m_order.push_back(id);
        ++m_counters.totalTasks;
    }

    LOG_INFO("Created task {}: {} -> {}", id, url, destination);
    return task->snapshot();
}

bool TaskRegistry::start(const std::string& id) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_shutdown) {
        LOG_WARN("Cannot start {}: registry is shut down", id);
        return false;
    }

    auto task = findLocked(id);
    if (!task) {
        LOG_WARN("Cannot start {}: task not found", id);
        return false;
    }

    return startLocked(task);
}

bool TaskRegistry::startLocked(const std::shared_ptr<Task>& task) {
    {
        std::lock_guard<std::mutex> taskLock(task->mutex);

        if (task->status != TaskStatus::Pending || task->attached) {
            LOG_WARN("Cannot start {} from status {}", task->id, toString(task->status));
            return false;
        }

        task->status = TaskStatus::Running;
        task->attached = true;
        task->cancelRequested = false;
        task->pauseRequested = false;
        task->metrics.startTime = std::chrono::system_clock::now();
    }

    reapRetiredLocked();
    retireWorkerLocked(task->id);

    auto worker = std::make_unique<Worker>(task, m_source, m_events, m_counters, m_settings);
    worker->start();
    m_workers[task->id] = std::move(worker);

    LOG_INFO("Started task {}", task->id);
    return true;
}

bool TaskRegistry::pause(const std::string& id) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto task = findLocked(id);
    if (!task) {
        LOG_WARN("Cannot pause {}: task not found", id);
        return false;
    }

    uint64_t downloaded = 0;
    {
        std::lock_guard<std::mutex> taskLock(task->mutex);
        if (task->status != TaskStatus::Running) {
            LOG_WARN("Cannot pause {} from status {}", id, toString(task->status));
            return false;
        }

        task->pauseRequested = true;
        task->status = TaskStatus::Paused;
        task->controlEvents.emplace_back(TaskEvent::Paused, task->snapshotLocked());
        downloaded = task->metrics.downloadedSize;
        task->abortStreamLocked();
    }
    task->control.notify_all();

    LOG_INFO("Paused task {} at {} bytes", id, downloaded);
    return true;
}

bool TaskRegistry::resume(const std::string& id) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto task = findLocked(id);
    if (!task) {
        LOG_WARN("Cannot resume {}: task not found", id);
        return false;
    }

    {
        std::lock_guard<std::mutex> taskLock(task->mutex);
        if (task->status != TaskStatus::Paused) {
            LOG_WARN("Cannot resume {} from status {}", id, toString(task->status));
            return false;
        }

        task->pauseRequested = false;
        task->status = TaskStatus::Running;
        task->controlEvents.emplace_back(TaskEvent::Resumed, task->snapshotLocked());
    }
    task->control.notify_all();

    LOG_INFO("Resumed task {}", id);
    return true;
}

bool TaskRegistry::cancel(const std::string& id) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto task = findLocked(id);
    if (!task) {
        LOG_WARN("Cannot cancel {}: task not found", id);
        return false;
    }

    {
        std::lock_guard<std::mutex> taskLock(task->mutex);

        // PENDING with a worker attached = waiting for an automatic retry
        bool cancellable = isActive(task->status) ||
                           (task->status == TaskStatus::Pending && task->attached);
        if (!cancellable) {
            LOG_WARN("Cannot cancel {} from status {}", id, toString(task->status));
            return false;
        }

        task->cancelRequested = true;
        task->status = TaskStatus::Cancelled;
        task->abortStreamLocked();

        // The worker only touches the file under this lock after checking the flag
        if (!utils::FileUtils::deleteFile(task->destination)) {
            LOG_WARN("Could not delete partial file {}", task->destination);
        }
    }
    task->control.notify_all();

    LOG_INFO("Cancelled task {}", id);
    return true;
}

bool TaskRegistry::retry(const std::string& id) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_shutdown) {
        LOG_WARN("Cannot retry {}: registry is shut down", id);
        return false;
    }

    auto task = findLocked(id);
    if (!task) {
        LOG_WARN("Cannot retry {}: task not found", id);
        return false;
    }

    {
        std::lock_guard<std::mutex> taskLock(task->mutex);

        if (task->status != TaskStatus::Failed || task->attached) {
            LOG_WARN("Cannot retry {} from status {}", id, toString(task->status));
            return false;
        }
        if (!RetryPolicy::hasBudget(task->retryCount, task->maxRetries)) {
            LOG_WARN("Cannot retry {}: retry budget exhausted ({}/{})",
                     id, task->retryCount, task->maxRetries);
            return false;
        }

        ++task->retryCount;
        task->status = TaskStatus::Pending;
        task->metrics = TransferMetrics{};
        task->errorMessage.reset();
        task->cancelRequested = false;
        task->pauseRequested = false;

        LOG_INFO("Retrying task {} ({}/{})", id, task->retryCount, task->maxRetries);
    }

    return startLocked(task);
}

bool TaskRegistry::remove(const std::string& id) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        auto task = findLocked(id);
        if (!task) {
            LOG_WARN("Cannot remove {}: task not found", id);
            return false;
        }

        {
            std::lock_guard<std::mutex> taskLock(task->mutex);
            // A cancelled task may still be winding down its worker
            bool busy = isActive(task->status) ||
                        (task->status == TaskStatus::Pending && task->attached);
            if (busy) {
                LOG_WARN("Cannot remove {} while {}", id, toString(task->status));
                return false;
            }
        }

        retireWorkerLocked(id);
        m_tasks.erase(id);
        m_order.erase(std::remove(m_order.begin(), m_order.end(), id), m_order.end());
    }

    m_events.clearTask(id);
    LOG_INFO("Removed task {}", id);
    return true;
}

size_t TaskRegistry::clearFinished() {
    std::vector<std::string> removed;
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        for (const auto& id : m_order) {
            auto& task = m_tasks.at(id);
            std::lock_guard<std::mutex> taskLock(task->mutex);
            if (isTerminal(task->status)) {
                removed.push_back(id);
            }
        }

        for (const auto& id : removed) {
            retireWorkerLocked(id);
            m_tasks.erase(id);
        }
        m_order.erase(std::remove_if(m_order.begin(), m_order.end(), [this](const std::string& id) {
            return m_tasks.count(id) == 0;
        }), m_order.end());

        reapRetiredLocked();
    }

    for (const auto& id : removed) {
        m_events.clearTask(id);
    }

    if (!removed.empty()) {
        LOG_INFO("Cleared {} finished task(s)", removed.size());
    }
    return removed.size();
}

std::optional<TaskSnapshot> TaskRegistry::get(const std::string& id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto task = findLocked(id);
    if (!task) {
        return std::nullopt;
    }
    return task->snapshot();
}

std::vector<TaskSnapshot> TaskRegistry::list() const {
    std::lock_guard<std::mutex> lock(m_mutex);

    std::vector<TaskSnapshot> result;
    result.reserve(m_order.size());
    for (const auto& id : m_order) {
        result.push_back(m_tasks.at(id)->snapshot());
    }
    return result;
}

std::vector<TaskSnapshot> TaskRegistry::listActive() const {
    std::vector<TaskSnapshot> result;
    for (auto& snapshot : list()) {
        if (snapshot.isActive()) {
            result.push_back(std::move(snapshot));
        }
    }
    return result;
}

bool TaskRegistry::setMaxRetries(const std::string& id, int maxRetries) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto task = findLocked(id);
    if (!task) {
        throw NotFoundError(id);
    }

    std::lock_guard<std::mutex> taskLock(task->mutex);
    if (task->attached) {
        LOG_WARN("Cannot change retry budget of {} while it is transferring", id);
        return false;
    }

    task->maxRetries = std::max(0, maxRetries);
    LOG_DEBUG("Retry budget of {} set to {}", id, task->maxRetries);
    return true;
}

SubscriptionPtr TaskRegistry::subscribe(const std::string& id, TaskCallback callback) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!findLocked(id)) {
            throw NotFoundError(id);
        }
    }
    return m_events.subscribe(id, std::move(callback));
}

SubscriptionPtr TaskRegistry::subscribeAll(GlobalCallback callback) {
    return m_events.subscribeAll(std::move(callback));
}

void TaskRegistry::unsubscribe(const SubscriptionPtr& subscription) {
    m_events.unsubscribe(subscription);
}

std::optional<TaskSnapshot> TaskRegistry::waitFor(const std::string& id,
                                                  std::chrono::milliseconds timeout) const {
    std::shared_ptr<Task> task;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        task = findLocked(id);
    }
    if (!task) {
        return std::nullopt;
    }

    std::unique_lock<std::mutex> taskLock(task->mutex);
    task->control.wait_for(taskLock, timeout, [&task] {
        return isTerminal(task->status) && !task->attached && task->pendingFinalEvents == 0;
    });
    return task->snapshotLocked();
}

GlobalStats TaskRegistry::globalStats() const {
    GlobalStats stats;
    stats.totalTasks = static_cast<size_t>(m_counters.totalTasks.load());
    stats.completedTasks = static_cast<size_t>(m_counters.completedTasks.load());
    stats.failedTasks = static_cast<size_t>(m_counters.failedTasks.load());
    stats.totalDownloadedMb = static_cast<double>(m_counters.completedBytes.load()) / (1024.0 * 1024.0);

    for (const auto& snapshot : list()) {
        if (snapshot.isActive()) {
            ++stats.activeDownloads;
            stats.currentTotalSpeedMbps += snapshot.metrics.speedMbps();
        } else if (snapshot.status == TaskStatus::Pending) {
            ++stats.tasksInQueue;
        }
    }
    return stats;
}

void TaskRegistry::shutdown() {
    std::vector<std::unique_ptr<Worker>> workers;
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        if (!m_shutdown) {
            LOG_DEBUG("Shutting down task registry");
        }
        m_shutdown = true;

        for (const auto& [id, task] : m_tasks) {
            bool cancelled = false;
            {
                std::lock_guard<std::mutex> taskLock(task->mutex);
                if (task->attached && !isTerminal(task->status)) {
                    task->cancelRequested = true;
                    task->status = TaskStatus::Cancelled;
                    task->abortStreamLocked();
                    if (!utils::FileUtils::deleteFile(task->destination)) {
                        LOG_WARN("Could not delete partial file {}", task->destination);
                    }
                    cancelled = true;
                }
            }
            if (cancelled) {
                task->control.notify_all();
                LOG_INFO("Cancelled task {} on shutdown", id);
            }
        }

        for (auto& [id, worker] : m_workers) {
            workers.push_back(std::move(worker));
        }
        m_workers.clear();
        for (auto& worker : m_retired) {
            workers.push_back(std::move(worker));
        }
        m_retired.clear();
    }

    // Joined outside the lock; cancelled events may call back into the registry
    workers.clear();
}

std::shared_ptr<Task> TaskRegistry::findLocked(const std::string& id) const {
    auto it = m_tasks.find(id);
    if (it == m_tasks.end()) {
        return nullptr;
    }
    return it->second;
}

void TaskRegistry::reapRetiredLocked() {
    m_retired.erase(std::remove_if(m_retired.begin(), m_retired.end(), [](const std::unique_ptr<Worker>& worker) {
        return worker->isFinished() && !worker->runsOnCurrentThread();
    }), m_retired.end());
}

void TaskRegistry::retireWorkerLocked(const std::string& id) {
    auto it = m_workers.find(id);
    if (it == m_workers.end()) {
        return;
    }
    m_retired.push_back(std::move(it->second));
    m_workers.erase(it);
}

} // namespace fetchkit::core::transfer
