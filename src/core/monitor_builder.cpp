#include "core/monitor_builder.hpp"
#include "analysis/stack_capture_provider.hpp"
#include "core/database_provider.hpp"
#include "core/utils.hpp"
#include "reporting/composite_sink.hpp"
#include "reporting/environment.hpp"
#include "reporting/file_sink.hpp"
#include "reporting/http_sink.hpp"

#include <format>
#include <stdexcept>

namespace querywatch {

std::unique_ptr<QueryMonitor> MonitorBuilder::build() {
    if (!c_.sink) throw std::runtime_error("MonitorBuilder: report sink is required");

    return std::make_unique<QueryMonitor>(options_, c_);
}

MonitorBuilder MonitorBuilder::from_config(const QuerywatchConfig& config,
                                           std::shared_ptr<IConnectionFactory> factory) {
    const std::string environment = resolve_environment(config.reporting.environment);
    const std::string application_name = resolve_application_name(config.reporting.application_name);
    const std::string version = resolve_version(config.reporting.version);

    // ---- Options ----
    QueryMonitor::Options options;
    options.enabled = config.analyzer.enabled;
    options.capture_stack_trace = config.analyzer.capture_stack_trace;
    options.tracker.max_stack_lines = static_cast<size_t>(config.analyzer.max_stack_trace_lines);
    options.evaluator.threshold_ms = config.analyzer.threshold_ms;
    options.evaluator.environment = environment;
    options.evaluator.application_name = application_name;
    options.evaluator.version = version;
    options.worker.batch_size = static_cast<size_t>(config.queue.batch_size);
    options.worker.poll_interval = std::chrono::milliseconds(config.queue.poll_interval_ms);
    options.max_queue_depth = static_cast<size_t>(config.queue.max_depth);

    MonitorBuilder builder;
    builder.with_options(options);

    // ---- Sinks ----
    auto composite = std::make_shared<CompositeReportSink>();

    const auto& http = config.reporting.http;
    if (http.enabled) {
        HttpReportSink::Config http_cfg;
        http_cfg.endpoint = http.endpoint;
        http_cfg.api_key = http.api_key;
        http_cfg.project_id = http.project_id;
        http_cfg.timeout = std::chrono::milliseconds(http.timeout_ms);
        http_cfg.max_query_length = static_cast<size_t>(config.analyzer.max_query_length);
        http_cfg.environment = environment;
        http_cfg.enable_in_development = config.reporting.enable_in_development;
        http_cfg.enable_in_production = config.reporting.enable_in_production;
        composite->add_sink(std::make_shared<HttpReportSink>(http_cfg));
    }

    const auto& file = config.reporting.file;
    if (file.enabled) {
        FileReportSink::Config file_cfg;
        file_cfg.output_file = file.path;
        file_cfg.max_file_size_bytes = static_cast<size_t>(file.max_file_size_mb) * 1024 * 1024;
        file_cfg.max_files = static_cast<int>(file.max_files);
        composite->add_sink(std::make_shared<FileReportSink>(file_cfg));
    }

    if (composite->sink_count() == 0) {
        utils::log::warn("No report sink enabled; slow queries are only logged");
    }
    builder.with_sink(composite);

    // ---- Stack traces ----
    if (config.analyzer.capture_stack_trace) {
        StackTraceFilter::Config filter_cfg;
        filter_cfg.enabled = true;
        filter_cfg.project_root = config.analyzer.project_root;
        filter_cfg.max_lines = static_cast<size_t>(config.analyzer.max_stack_trace_lines);
        builder.with_stack_filter(std::make_shared<const StackTraceFilter>(
            filter_cfg, std::make_shared<BoostStackCaptureProvider>()));
    }

    // ---- Execution plans ----
    if (config.execution_plan.enabled) {
        const auto provider = parse_provider(config.execution_plan.provider);
        if (!provider) {
            throw std::runtime_error(std::format(
                "Unknown execution plan provider '{}'", config.execution_plan.provider));
        }

        PlanCapture::Config plan_cfg;
        plan_cfg.enabled = true;
        plan_cfg.timeout = std::chrono::seconds(config.execution_plan.timeout_seconds);
        plan_cfg.connection_string = config.execution_plan.connection_string;
        plan_cfg.provider = *provider;
        builder.with_plan_capture(std::make_shared<PlanCapture>(plan_cfg, std::move(factory)));
    }

    return builder;
}

} // namespace querywatch
