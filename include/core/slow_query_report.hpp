#pragma once

#include "core/data_context.hpp"
#include "core/types.hpp"
#include "db/idb_connection.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace querywatch {

/**
 * @brief Frozen snapshot of a command that crossed the slow threshold
 *
 * Self-contained: every field is a copy, nothing aliases tracker state.
 * execution_plan is filled in only by background analysis.
 */
struct SlowQueryReport {
    std::string query_id;
    std::string raw_query;
    ParameterMap parameters;
    double execution_time_ms = 0.0;
    std::optional<std::vector<std::string>> stack_trace;
    TimePoint timestamp;
    std::string context_type;
    std::string environment;
    std::optional<std::string> application_name;
    std::optional<std::string> version;
    std::optional<ExecutionPlan> execution_plan;
};

/**
 * @brief Unit of work on the analysis queue
 *
 * The handles are released once the worker is done with the item.
 */
struct AnalysisItem {
    SlowQueryReport report;
    std::shared_ptr<IDbConnection> connection;
    std::shared_ptr<IDataContext> data_context;
};

} // namespace querywatch
