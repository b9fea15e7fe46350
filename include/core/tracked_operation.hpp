#pragma once

#include "core/data_context.hpp"
#include "core/types.hpp"
#include "core/utils.hpp"
#include "db/idb_connection.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace querywatch {

/**
 * @brief One in-flight database command, owned by the OperationTracker
 *
 * Created on command start; stamped exactly once on completion
 * (completed_at + elapsed) and then moved out of the tracker.
 */
struct TrackedOperation {
    std::string operation_id;
    CorrelationKey key;
    std::string command_text;
    ParameterMap parameters;
    std::string context_tag;

    TimePoint started_at;
    std::optional<TimePoint> completed_at;
    utils::Timer timer;
    std::chrono::microseconds elapsed{0};

    std::optional<std::vector<std::string>> stack_trace;

    // Host handles kept for execution plan capture; never serialized
    std::shared_ptr<IDbConnection> connection;
    std::shared_ptr<IDataContext> data_context;

    TrackedOperation() : started_at(utils::now()) {}

    void mark_completed() {
        completed_at = utils::now();
        elapsed = timer.elapsed_us();
    }

    [[nodiscard]] double elapsed_ms() const {
        return static_cast<double>(elapsed.count()) / 1000.0;
    }
};

} // namespace querywatch
