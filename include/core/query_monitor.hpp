#pragma once

#include "analysis/analysis_queue.hpp"
#include "analysis/analysis_worker.hpp"
#include "analysis/stack_trace_filter.hpp"
#include "core/operation_tracker.hpp"
#include "core/slow_query_report.hpp"
#include "core/threshold_evaluator.hpp"
#include "plan/plan_capture.hpp"
#include "reporting/report_sink.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace querywatch {

/**
 * @brief What the host's command hook knows when a command is about to run
 *
 * connection and data_context are optional; they are only used for
 * execution plan capture and are released once analysis is done.
 */
struct CommandStartEvent {
    std::string connection_id;
    std::string command_id;
    std::string command_text;
    ParameterMap parameters;
    std::string context_tag;
    std::shared_ptr<IDbConnection> connection;
    std::shared_ptr<IDataContext> data_context;
};

/**
 * @brief Components the monitor delegates to, grouped in a single struct
 */
struct MonitorComponents {
    // Required
    std::shared_ptr<IReportSink> sink;

    // Optional (nullptr = disabled)
    std::shared_ptr<PlanCapture> plan_capture;
    std::shared_ptr<const StackTraceFilter> stack_filter;
};

/**
 * @brief Slow query detection front end
 *
 * Flow for one command:
 *   on_command_starting --> OperationTracker (timer starts)
 *   on_command_completed --> OperationTracker --> ThresholdEvaluator
 *        slow? --> AnalysisQueue --> AnalysisWorker --> plan capture --> sink
 *
 * The hooks run on the host's threads: they never block on I/O and never
 * throw. All I/O happens on the worker thread.
 */
class QueryMonitor {
public:
    struct Options {
        bool enabled = true;
        bool capture_stack_trace = true;
        OperationTracker::Config tracker;
        ThresholdEvaluator::Config evaluator;
        AnalysisWorker::Config worker;
        size_t max_queue_depth = 0;      ///< 0 = unbounded
    };

    /// @throws std::invalid_argument if components.sink is null
    QueryMonitor(const Options& options, MonitorComponents components);

    /// Calls shutdown(); anything a racing hook queued after it is delivered
    /// when the worker is destroyed
    ~QueryMonitor();

    // Non-copyable, non-movable (owns worker thread)
    QueryMonitor(const QueryMonitor&) = delete;
    QueryMonitor& operator=(const QueryMonitor&) = delete;
    QueryMonitor(QueryMonitor&&) = delete;
    QueryMonitor& operator=(QueryMonitor&&) = delete;

    /// Start the background worker (no-op when disabled or shut down)
    void start();

    /**
     * @brief Stop accepting reports, drain the queue and stop the worker
     *
     * The drain also runs when start() was never called.
     * Idempotent. Commands completing afterwards are still removed from the
     * tracker but no longer analyzed.
     */
    void shutdown();

    /**
     * @brief Command start hook
     * @return Operation id, or empty string when disabled or on failure
     */
    std::string on_command_starting(CommandStartEvent event) noexcept;

    /// Command completion hook (success or failure of the command alike)
    void on_command_completed(const std::string& connection_id,
                              const std::string& command_id) noexcept;

    [[nodiscard]] bool enabled() const { return options_.enabled; }
    [[nodiscard]] bool accepting() const { return accepting_.load(std::memory_order_acquire); }

    struct Stats {
        OperationTracker::Stats tracker;
        ThresholdEvaluator::Stats evaluator;
        AnalysisWorker::Stats worker;
        PlanCapture::Stats plan;           ///< Zero when plan capture is not configured
        size_t queue_depth;
        uint64_t queue_dropped;            ///< Rejected by max_queue_depth
        uint64_t enqueued;
        uint64_t rejected_after_shutdown;
    };

    [[nodiscard]] Stats get_stats() const;

    [[nodiscard]] OperationTracker& tracker() { return tracker_; }
    [[nodiscard]] AnalysisQueue<AnalysisItem>& queue() { return queue_; }

private:
    Options options_;
    MonitorComponents components_;

    OperationTracker tracker_;
    ThresholdEvaluator evaluator_;
    AnalysisQueue<AnalysisItem> queue_;
    AnalysisWorker worker_;              // declared after queue_: holds a reference to it

    std::mutex lifecycle_mutex_;
    std::atomic<bool> accepting_{true};

    std::atomic<uint64_t> enqueued_{0};
    std::atomic<uint64_t> rejected_after_shutdown_{0};
};

} // namespace querywatch
