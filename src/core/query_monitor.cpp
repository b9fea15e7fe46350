#include "core/query_monitor.hpp"
#include "core/utils.hpp"

#include <format>
#include <stdexcept>

namespace querywatch {

namespace {

const std::shared_ptr<IReportSink>& require_sink(const MonitorComponents& components) {
    if (!components.sink) {
        throw std::invalid_argument("QueryMonitor: report sink is required");
    }
    return components.sink;
}

} // anonymous namespace

QueryMonitor::QueryMonitor(const Options& options, MonitorComponents components)
    : options_(options),
      components_(std::move(components)),
      tracker_(options.tracker, components_.stack_filter),
      evaluator_(options.evaluator),
      queue_(options.max_queue_depth),
      worker_(options.worker, queue_, components_.plan_capture, require_sink(components_)) {
    utils::log::info(std::format(
        "QueryMonitor: enabled={}, threshold={}ms, stack_trace={}, plan_capture={}, sink={}",
        options_.enabled, options_.evaluator.threshold_ms,
        options_.capture_stack_trace && components_.stack_filter != nullptr,
        components_.plan_capture != nullptr && components_.plan_capture->enabled(),
        components_.sink->name()));
}

QueryMonitor::~QueryMonitor() {
    shutdown();
}

void QueryMonitor::start() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (!options_.enabled || !accepting_.load(std::memory_order_acquire)) {
        return;
    }
    worker_.start();
}

void QueryMonitor::shutdown() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (!accepting_.exchange(false, std::memory_order_acq_rel)) {
        return;
    }
    worker_.stop();

    const auto tracker_stats = tracker_.get_stats();
    if (tracker_stats.active > 0) {
        utils::log::debug(std::format(
            "QueryMonitor: shut down with {} command(s) still in flight", tracker_stats.active));
    }
}

// ============================================================================
// Command Hooks
// ============================================================================

std::string QueryMonitor::on_command_starting(CommandStartEvent event) noexcept {
    if (!options_.enabled) {
        return {};
    }

    const bool capture_stack = options_.capture_stack_trace && components_.stack_filter != nullptr;
    try {
        CorrelationKey key{std::move(event.connection_id), std::move(event.command_id)};
        return tracker_.start(key,
                              std::move(event.command_text),
                              std::move(event.parameters),
                              std::move(event.context_tag),
                              std::move(event.connection),
                              std::move(event.data_context),
                              capture_stack);
    } catch (const std::exception& e) {
        utils::log::error(std::format("QueryMonitor: command start failed: {}", e.what()));
        return {};
    }
}

void QueryMonitor::on_command_completed(const std::string& connection_id,
                                        const std::string& command_id) noexcept {
    if (!options_.enabled) {
        return;
    }

    try {
        auto op = tracker_.complete(CorrelationKey{connection_id, command_id});
        if (!op) {
            return;
        }

        auto connection = std::move(op->connection);
        auto data_context = std::move(op->data_context);

        auto report = evaluator_.evaluate(std::move(*op));
        if (!report) {
            return;
        }

        if (!accepting_.load(std::memory_order_acquire)) {
            rejected_after_shutdown_.fetch_add(1, std::memory_order_relaxed);
            utils::log::debug(std::format(
                "QueryMonitor: shut down, not analyzing slow query {}", report->query_id));
            return;
        }

        const std::string query_id = report->query_id;
        AnalysisItem item{std::move(*report), std::move(connection), std::move(data_context)};
        if (!queue_.push(std::move(item))) {
            utils::log::warn(std::format(
                "QueryMonitor: analysis queue full ({} items), dropped slow query {}",
                queue_.max_depth(), query_id));
            return;
        }
        enqueued_.fetch_add(1, std::memory_order_relaxed);
    } catch (const std::exception& e) {
        utils::log::error(std::format(
            "QueryMonitor: command completion failed for {}/{}: {}",
            connection_id, command_id, e.what()));
    }
}

QueryMonitor::Stats QueryMonitor::get_stats() const {
    PlanCapture::Stats plan{};
    if (components_.plan_capture) {
        plan = components_.plan_capture->get_stats();
    }

    return Stats{
        .tracker = tracker_.get_stats(),
        .evaluator = evaluator_.get_stats(),
        .worker = worker_.get_stats(),
        .plan = plan,
        .queue_depth = queue_.size(),
        .queue_dropped = queue_.dropped_count(),
        .enqueued = enqueued_.load(std::memory_order_relaxed),
        .rejected_after_shutdown = rejected_after_shutdown_.load(std::memory_order_relaxed)
    };
}

} // namespace querywatch
