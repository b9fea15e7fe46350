#pragma once

#include "config/config_types.hpp"
#include "core/query_monitor.hpp"
#include "db/iconnection_factory.hpp"

#include <memory>

namespace querywatch {

/**
 * @brief Builder pattern for QueryMonitor construction.
 *
 * Usage:
 *   auto monitor = MonitorBuilder()
 *       .with_options(options)
 *       .with_sink(sink)
 *       .with_plan_capture(plan_capture)    // optional
 *       .with_stack_filter(filter)          // optional
 *       .build();
 *
 * Or wired entirely from a loaded configuration:
 *   auto monitor = MonitorBuilder::from_config(config, factory).build();
 */
class MonitorBuilder {
public:
    MonitorBuilder& with_options(const QueryMonitor::Options& o)                 { options_ = o; return *this; }
    MonitorBuilder& with_sink(std::shared_ptr<IReportSink> p)                    { c_.sink = std::move(p); return *this; }
    MonitorBuilder& with_plan_capture(std::shared_ptr<PlanCapture> p)            { c_.plan_capture = std::move(p); return *this; }
    MonitorBuilder& with_stack_filter(std::shared_ptr<const StackTraceFilter> p) { c_.stack_filter = std::move(p); return *this; }

    [[nodiscard]] const QueryMonitor::Options& options() const { return options_; }
    [[nodiscard]] const MonitorComponents& components() const { return c_; }

    /**
     * @brief Build the QueryMonitor from accumulated components.
     * @throws std::runtime_error if the sink is missing.
     */
    [[nodiscard]] std::unique_ptr<QueryMonitor> build();

    /**
     * @brief Wire sinks, stack filter and plan capture from configuration
     *
     * Enabled HTTP / file sinks are combined in a CompositeReportSink (an
     * empty composite when none is enabled). Environment, application name
     * and version are resolved once here.
     *
     * @param factory  Opens plan-capture connections; may be null
     * @throws std::runtime_error if a configured sink cannot be created
     */
    [[nodiscard]] static MonitorBuilder from_config(const QuerywatchConfig& config,
                                                    std::shared_ptr<IConnectionFactory> factory);

private:
    QueryMonitor::Options options_;
    MonitorComponents c_;
};

} // namespace querywatch
