/**
 * Task.cpp
 */

#include "Task.hpp"
#include "TransferSource.hpp"

#include <algorithm>

namespace fetchkit::core::transfer {

const char* toString(TaskStatus status) {
    switch (status) {
        case TaskStatus::Pending:   return "pending";
        case TaskStatus::Running:   return "running";
        case TaskStatus::Paused:    return "paused";
        case TaskStatus::Completed: return "completed";
        case TaskStatus::Failed:    return "failed";
        case TaskStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

const char* toString(TaskEvent event) {
    switch (event) {
        case TaskEvent::Started:   return "started";
        case TaskEvent::Progress:  return "progress";
        case TaskEvent::Paused:    return "paused";
        case TaskEvent::Resumed:   return "resumed";
        case TaskEvent::Completed: return "completed";
        case TaskEvent::Failed:    return "failed";
        case TaskEvent::Cancelled: return "cancelled";
    }
    return "unknown";
}

bool isTerminal(TaskStatus status) {
    return status == TaskStatus::Completed ||
           status == TaskStatus::Failed ||
           status == TaskStatus::Cancelled;
}

bool isActive(TaskStatus status) {
    return status == TaskStatus::Running || status == TaskStatus::Paused;
}

std::optional<double> TransferMetrics::computeProgress(uint64_t downloaded, uint64_t total) {
    if (total == 0) {
        return std::nullopt;
    }
    double percent = static_cast<double>(downloaded) / static_cast<double>(total) * 100.0;
    return std::clamp(percent, 0.0, 100.0);
}

Task::Task(std::string id_,
           std::string name_,
           std::string description_,
           std::string url_,
           std::string destination_,
           HeaderMap headers_,
           int maxRetries_)
    : id(std::move(id_))
    , name(std::move(name_))
    , description(std::move(description_))
    , url(std::move(url_))
    , destination(std::move(destination_))
    , headers(std::move(headers_))
    , createdAt(std::chrono::system_clock::now())
    , maxRetries(maxRetries_) {
}

TaskSnapshot Task::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex);
    return snapshotLocked();
}

TaskSnapshot Task::snapshotLocked() const {
    TaskSnapshot snap;
    snap.id = id;
    snap.name = name;
    snap.description = description;
    snap.url = url;
    snap.destination = destination;
    snap.headers = headers;
    snap.status = status;
    snap.metrics = metrics;
    snap.errorMessage = errorMessage;
    snap.retryCount = retryCount;
    snap.maxRetries = maxRetries;
    snap.createdAt = createdAt;
    return snap;
}

void Task::abortStreamLocked() {
    if (stream && !streamAborted) {
        stream->abort();
        streamAborted = true;
    }
}

} // namespace fetchkit::core::transfer
