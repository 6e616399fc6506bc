#pragma once

/**
 * DiagnosticsReport.hpp
 *
 * Read-only JSON report of every task and the registry aggregates.
 */

#include "TaskRegistry.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace fetchkit::core::transfer {

using json = nlohmann::json;

class DiagnosticsReport {
public:
    /**
     * Build the report
     * @return {"timestamp", "global_stats", "tasks": [...]}
     */
    static json build(const TaskRegistry& registry);

    static json taskToJson(const TaskSnapshot& task);
    static json statsToJson(const GlobalStats& stats);

    /**
     * Write the pretty-printed report, creating parent directories
     * @return true if written
     */
    static bool writeTo(const TaskRegistry& registry, const std::string& path);
};

} // namespace fetchkit::core::transfer
