#pragma once

#include "core/slow_query_report.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace querywatch {

/**
 * @brief JSON wire shape for slow-query reports (camelCase field names)
 *
 * {
 *   "queryId", "rawQuery", "parameters", "executionTimeMs", "stackTrace",
 *   "timestamp", "contextType", "environment", "applicationName", "version",
 *   "executionPlan": { "databaseProvider",
 *                      "planFormat": { "contentType", "fileExtension", "description" },
 *                      "content" }
 * }
 *
 * Absent optionals serialize as null.
 */
class ReportSerializer {
public:
    [[nodiscard]] static nlohmann::json to_json(const SlowQueryReport& report);

    [[nodiscard]] static nlohmann::json parameter_to_json(const ParameterValue& value);

    [[nodiscard]] static nlohmann::json plan_to_json(const ExecutionPlan& plan);

    /// Compact single-line JSON
    [[nodiscard]] static std::string serialize(const SlowQueryReport& report);
};

} // namespace querywatch
