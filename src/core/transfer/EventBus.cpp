/**
 * EventBus.cpp
 */

#include "EventBus.hpp"
#include "../Logger.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>

namespace fetchkit::core::transfer {

SubscriptionPtr EventBus::subscribe(const std::string& taskId, TaskCallback callback) {
    if (taskId.empty()) {
        throw std::invalid_argument("Task subscription requires a task id");
    }

    auto subscription = std::make_shared<Subscription>(m_nextId++, taskId);

    std::lock_guard<std::mutex> lock(m_mutex);
    m_taskSubscribers[taskId].push_back({std::move(callback), subscription});
    return subscription;
}

SubscriptionPtr EventBus::subscribeAll(GlobalCallback callback) {
    auto subscription = std::make_shared<Subscription>(m_nextId++, std::string());

    std::lock_guard<std::mutex> lock(m_mutex);
    m_globalSubscribers.push_back({std::move(callback), subscription});
    return subscription;
}

void EventBus::unsubscribe(const SubscriptionPtr& subscription) {
    if (!subscription) return;

    subscription->cancel();

    std::lock_guard<std::mutex> lock(m_mutex);

    auto matches = [id = subscription->getId()](const auto& entry) {
        return entry.subscription->getId() == id;
    };

    if (subscription->isGlobal()) {
        m_globalSubscribers.erase(
            std::remove_if(m_globalSubscribers.begin(), m_globalSubscribers.end(), matches),
            m_globalSubscribers.end());
        return;
    }

    auto it = m_taskSubscribers.find(subscription->getTaskId());
    if (it == m_taskSubscribers.end()) {
        return;
    }

    auto& entries = it->second;
    entries.erase(std::remove_if(entries.begin(), entries.end(), matches), entries.end());
    if (entries.empty()) {
        m_taskSubscribers.erase(it);
    }
}

void EventBus::clearTask(const std::string& taskId) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_taskSubscribers.find(taskId);
    if (it == m_taskSubscribers.end()) {
        return;
    }

    for (auto& entry : it->second) {
        entry.subscription->cancel();
    }
    m_taskSubscribers.erase(it);
}

void EventBus::dispatch(const TaskSnapshot& task, TaskEvent event) const {
    std::vector<TaskEntry> taskCallbacks;
    std::vector<GlobalEntry> globalCallbacks;

    {
        std::lock_guard<std::mutex> lock(m_mutex);

        auto it = m_taskSubscribers.find(task.id);
        if (it != m_taskSubscribers.end()) {
            taskCallbacks = it->second;
        }
        globalCallbacks = m_globalSubscribers;
    }

    for (const auto& entry : taskCallbacks) {
        if (!entry.subscription->isActive()) continue;

        try {
            entry.callback(task, event);
        } catch (const std::exception& e) {
            LOG_ERROR("Task callback failed for {} on '{}': {}", task.id, toString(event), e.what());
        } catch (...) {
            LOG_ERROR("Task callback failed for {} on '{}': unknown exception", task.id, toString(event));
        }
    }

    for (const auto& entry : globalCallbacks) {
        if (!entry.subscription->isActive()) continue;

        try {
            entry.callback(task.id, task, event);
        } catch (const std::exception& e) {
            LOG_ERROR("Global callback failed for {} on '{}': {}", task.id, toString(event), e.what());
        } catch (...) {
            LOG_ERROR("Global callback failed for {} on '{}': unknown exception", task.id, toString(event));
        }
    }
}

size_t EventBus::getSubscriberCount(const std::string& taskId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_taskSubscribers.find(taskId);
    return it != m_taskSubscribers.end() ? it->second.size() : 0;
}

size_t EventBus::getGlobalSubscriberCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_globalSubscribers.size();
}

} // namespace fetchkit::core::transfer
