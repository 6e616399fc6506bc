/**
 * DiagnosticsReport.cpp
 */

#include "DiagnosticsReport.hpp"
#include "../Logger.hpp"
#include "../../utils/FileUtils.hpp"
#include "../../utils/StringUtils.hpp"

#include <chrono>

namespace fetchkit::core::transfer {

namespace {

constexpr double kMegabyte = 1024.0 * 1024.0;
constexpr const char* kIsoFormat = "%Y-%m-%dT%H:%M:%S";

template <typename T>
json optionalToJson(const std::optional<T>& value) {
    return value ? json(*value) : json(nullptr);
}

} // namespace

json DiagnosticsReport::taskToJson(const TaskSnapshot& task) {
    const auto& metrics = task.metrics;

    return {
        {"id", task.id},
        {"name", task.name},
        {"description", task.description},
        {"status", toString(task.status)},
        {"progress_percent", optionalToJson(metrics.progressPercent)},
        {"total_size_mb", static_cast<double>(metrics.totalSize) / kMegabyte},
        {"downloaded_size_mb", static_cast<double>(metrics.downloadedSize) / kMegabyte},
        {"speed_mbps", metrics.speedMbps()},
        {"eta_seconds", optionalToJson(metrics.etaSeconds)},
        {"elapsed_seconds", metrics.elapsedSeconds},
        {"retry_count", task.retryCount},
        {"error_message", optionalToJson(task.errorMessage)},
        {"created_at", utils::StringUtils::formatTimestamp(task.createdAt, kIsoFormat)}
    };
}

json DiagnosticsReport::statsToJson(const GlobalStats& stats) {
    return {
        {"total_tasks", stats.totalTasks},
        {"completed_tasks", stats.completedTasks},
        {"failed_tasks", stats.failedTasks},
        {"total_downloaded_mb", stats.totalDownloadedMb},
        {"active_downloads", stats.activeDownloads},
        {"current_total_speed_mbps", stats.currentTotalSpeedMbps},
        {"tasks_in_queue", stats.tasksInQueue}
    };
}

json DiagnosticsReport::build(const TaskRegistry& registry) {
    json tasks = json::array();
    for (const auto& task : registry.list()) {
        tasks.push_back(taskToJson(task));
    }

    return {
        {"timestamp", utils::StringUtils::formatTimestamp(std::chrono::system_clock::now(), kIsoFormat)},
        {"global_stats", statsToJson(registry.globalStats())},
        {"tasks", std::move(tasks)}
    };
}

bool DiagnosticsReport::writeTo(const TaskRegistry& registry, const std::string& path) {
    if (!utils::FileUtils::writeFile(path, build(registry).dump(2))) {
        LOG_ERROR("Failed to write diagnostics report to {}", path);
        return false;
    }

    LOG_INFO("Diagnostics report written to {}", path);
    return true;
}

} // namespace fetchkit::core::transfer
