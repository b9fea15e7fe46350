#include "core/threshold_evaluator.hpp"
#include "core/utils.hpp"

#include <format>

namespace querywatch {

ThresholdEvaluator::ThresholdEvaluator(const Config& config)
    : config_(config) {}

bool ThresholdEvaluator::is_slow(std::chrono::microseconds elapsed) const {
    return is_slow(static_cast<double>(elapsed.count()) / 1000.0);
}

std::optional<SlowQueryReport> ThresholdEvaluator::evaluate(TrackedOperation&& op) {
    evaluated_.fetch_add(1, std::memory_order_relaxed);

    const double elapsed_ms = op.elapsed_ms();
    if (!is_slow(elapsed_ms)) {
        return std::nullopt;
    }

    slow_.fetch_add(1, std::memory_order_relaxed);

    if (utils::log::enabled(utils::log::Level::WARN)) {
        utils::log::warn(std::format("Slow query detected: {:.2f}ms (threshold {:.2f}ms) [{}] {}",
            elapsed_ms, config_.threshold_ms, op.context_tag,
            utils::truncate_for_log(op.command_text, kLogQueryLength)));
    }

    SlowQueryReport report;
    report.query_id = std::move(op.operation_id);
    report.raw_query = std::move(op.command_text);
    report.parameters = std::move(op.parameters);
    report.execution_time_ms = elapsed_ms;
    report.stack_trace = std::move(op.stack_trace);
    report.timestamp = op.started_at;
    report.context_type = std::move(op.context_tag);
    report.environment = config_.environment;
    report.application_name = config_.application_name;
    report.version = config_.version;
    return report;
}

} // namespace querywatch
