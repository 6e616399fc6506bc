#pragma once

/**
 * EventBus.hpp
 *
 * Per-task and global callback dispatch for task transitions and
 * progress ticks.
 */

#include "Task.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace fetchkit::core::transfer {

using TaskCallback = std::function<void(const TaskSnapshot& task, TaskEvent event)>;
using GlobalCallback = std::function<void(const std::string& taskId,
                                          const TaskSnapshot& task,
                                          TaskEvent event)>;

/**
 * Event subscription handle
 */
class Subscription {
public:
    // Empty taskId = global subscription
    Subscription(uint64_t id, std::string taskId)
        : m_id(id), m_taskId(std::move(taskId)), m_active(true) {}

    uint64_t getId() const { return m_id; }
    const std::string& getTaskId() const { return m_taskId; }
    bool isGlobal() const { return m_taskId.empty(); }
    bool isActive() const { return m_active; }
    void cancel() { m_active = false; }

private:
    uint64_t m_id;
    std::string m_taskId;
    std::atomic<bool> m_active;
};

using SubscriptionPtr = std::shared_ptr<Subscription>;

/**
 * EventBus - thread-safe subscribe/dispatch
 *
 * dispatch() copies the matching callback lists under the lock and invokes
 * them after releasing it, so callbacks may subscribe, unsubscribe or call
 * back into the registry. An exception thrown by one callback is logged
 * and does not prevent the remaining callbacks from running.
 */
class EventBus {
public:
    EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /**
     * Subscribe to the events of a single task
     * @param taskId Task id (must not be empty)
     * @param callback Callback function
     * @return Subscription handle for unsubscribing
     */
    SubscriptionPtr subscribe(const std::string& taskId, TaskCallback callback);

    /**
     * Subscribe to every event of every task
     * @param callback Callback function
     * @return Subscription handle for unsubscribing
     */
    SubscriptionPtr subscribeAll(GlobalCallback callback);

    void unsubscribe(const SubscriptionPtr& subscription);

    /**
     * Drop all callbacks of a task
     */
    void clearTask(const std::string& taskId);

    /**
     * Deliver an event to the task's callbacks, then to the global ones
     */
    void dispatch(const TaskSnapshot& task, TaskEvent event) const;

    size_t getSubscriberCount(const std::string& taskId) const;
    size_t getGlobalSubscriberCount() const;

private:
    struct TaskEntry {
        TaskCallback callback;
        SubscriptionPtr subscription;
    };

    struct GlobalEntry {
        GlobalCallback callback;
        SubscriptionPtr subscription;
    };

    mutable std::mutex m_mutex;
    std::unordered_map<std::string, std::vector<TaskEntry>> m_taskSubscribers;
    std::vector<GlobalEntry> m_globalSubscribers;
    std::atomic<uint64_t> m_nextId{0};
};

} // namespace fetchkit::core::transfer
