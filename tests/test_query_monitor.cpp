#include <catch2/catch_test_macros.hpp>
#include "core/monitor_builder.hpp"
#include "core/query_monitor.hpp"
#include "mocks/fixed_stack_provider.hpp"
#include "mocks/mock_db_connection.hpp"
#include "mocks/mock_report_sink.hpp"

#include <chrono>
#include <filesystem>
#include <thread>

using namespace querywatch;
using namespace querywatch::testing;

static QueryMonitor::Options fast_options(double threshold_ms = 100.0) {
    QueryMonitor::Options opts;
    opts.capture_stack_trace = false;
    opts.evaluator.threshold_ms = threshold_ms;
    opts.worker.poll_interval = std::chrono::milliseconds(10);
    return opts;
}

static CommandStartEvent make_event(const std::string& conn, const std::string& cmd,
                                    const std::string& sql = "SELECT * FROM orders") {
    CommandStartEvent ev;
    ev.connection_id = conn;
    ev.command_id = cmd;
    ev.command_text = sql;
    ev.context_tag = "OrdersContext";
    return ev;
}

static void run_command(QueryMonitor& monitor, const std::string& conn, const std::string& cmd,
                        std::chrono::milliseconds duration, const std::string& sql = "SELECT 1") {
    monitor.on_command_starting(make_event(conn, cmd, sql));
    std::this_thread::sleep_for(duration);
    monitor.on_command_completed(conn, cmd);
}

TEST_CASE("QueryMonitor: only commands over the threshold are reported", "[monitor]") {
    auto sink = std::make_shared<RecordingReportSink>();
    QueryMonitor monitor(fast_options(100.0), MonitorComponents{sink, nullptr, nullptr});
    monitor.start();

    run_command(monitor, "c1", "slow", std::chrono::milliseconds(150), "SELECT pg_sleep(0.15)");
    run_command(monitor, "c1", "fast", std::chrono::milliseconds(40), "SELECT 1");
    monitor.shutdown();

    const auto reports = sink->reports();
    REQUIRE(reports.size() == 1);
    CHECK(reports[0].raw_query == "SELECT pg_sleep(0.15)");
    CHECK(reports[0].execution_time_ms >= 150.0);
    CHECK(reports[0].context_type == "OrdersContext");

    const auto stats = monitor.get_stats();
    CHECK(stats.tracker.completed == 2);
    CHECK(stats.evaluator.evaluated == 2);
    CHECK(stats.evaluator.slow == 1);
    CHECK(stats.enqueued == 1);
    CHECK(stats.worker.processed == 1);
}

TEST_CASE("QueryMonitor: completion for an unknown key changes nothing", "[monitor]") {
    auto sink = std::make_shared<RecordingReportSink>();
    QueryMonitor monitor(fast_options(0.0), MonitorComponents{sink, nullptr, nullptr});
    monitor.start();

    monitor.on_command_completed("nobody", "nothing");
    monitor.shutdown();

    CHECK(sink->count() == 0);
    const auto stats = monitor.get_stats();
    CHECK(stats.tracker.misses == 1);
    CHECK(stats.queue_depth == 0);
}

TEST_CASE("QueryMonitor: starting hook returns the report id", "[monitor]") {
    auto sink = std::make_shared<RecordingReportSink>();
    QueryMonitor monitor(fast_options(0.0), MonitorComponents{sink, nullptr, nullptr});
    monitor.start();

    const auto id = monitor.on_command_starting(make_event("c1", "k1"));
    REQUIRE_FALSE(id.empty());
    monitor.on_command_completed("c1", "k1");
    monitor.shutdown();

    const auto reports = sink->reports();
    REQUIRE(reports.size() == 1);
    CHECK(reports[0].query_id == id);
}

TEST_CASE("QueryMonitor: disabled monitor ignores everything", "[monitor]") {
    auto sink = std::make_shared<RecordingReportSink>();
    auto opts = fast_options(0.0);
    opts.enabled = false;
    QueryMonitor monitor(opts, MonitorComponents{sink, nullptr, nullptr});
    monitor.start();

    CHECK(monitor.on_command_starting(make_event("c1", "k1")).empty());
    monitor.on_command_completed("c1", "k1");
    monitor.shutdown();

    CHECK(sink->count() == 0);
    CHECK(monitor.get_stats().tracker.started == 0);
    CHECK(monitor.get_stats().tracker.misses == 0);
}

TEST_CASE("QueryMonitor: shutdown delivers everything already queued", "[monitor]") {
    auto sink = std::make_shared<RecordingReportSink>("slow-sink", std::chrono::milliseconds(2));
    auto opts = fast_options(0.0);
    opts.worker.batch_size = 10;
    QueryMonitor monitor(opts, MonitorComponents{sink, nullptr, nullptr});
    monitor.start();

    for (int i = 0; i < 25; ++i) {
        const auto cmd = std::to_string(i);
        monitor.on_command_starting(make_event("c1", cmd));
        monitor.on_command_completed("c1", cmd);
    }
    monitor.shutdown();

    CHECK(sink->count() == 25);
    CHECK(monitor.get_stats().worker.processed == 25);
    CHECK(monitor.queue().empty());
}

TEST_CASE("QueryMonitor: shutdown without start still delivers queued reports", "[monitor]") {
    auto sink = std::make_shared<RecordingReportSink>();
    QueryMonitor monitor(fast_options(0.0), MonitorComponents{sink, nullptr, nullptr});

    for (int i = 0; i < 25; ++i) {
        const auto cmd = std::to_string(i);
        monitor.on_command_starting(make_event("c1", cmd));
        monitor.on_command_completed("c1", cmd);
    }
    CHECK(monitor.get_stats().enqueued == 25);

    monitor.shutdown();
    CHECK(sink->count() == 25);
    CHECK(monitor.get_stats().worker.processed == 25);
    CHECK(monitor.queue().empty());
}

TEST_CASE("QueryMonitor: completions after shutdown are not analyzed", "[monitor]") {
    auto sink = std::make_shared<RecordingReportSink>();
    QueryMonitor monitor(fast_options(0.0), MonitorComponents{sink, nullptr, nullptr});
    monitor.start();

    monitor.on_command_starting(make_event("c1", "k1"));
    monitor.shutdown();
    CHECK_FALSE(monitor.accepting());
    monitor.on_command_completed("c1", "k1");

    CHECK(sink->count() == 0);
    CHECK(monitor.get_stats().rejected_after_shutdown == 1);
    CHECK(monitor.tracker().active_count() == 0);
}

TEST_CASE("QueryMonitor: bounded queue drops new reports", "[monitor]") {
    auto sink = std::make_shared<RecordingReportSink>();
    auto opts = fast_options(0.0);
    opts.max_queue_depth = 2;
    QueryMonitor monitor(opts, MonitorComponents{sink, nullptr, nullptr});

    // Worker not started: the queue only fills
    for (int i = 0; i < 5; ++i) {
        const auto cmd = std::to_string(i);
        monitor.on_command_starting(make_event("c1", cmd));
        monitor.on_command_completed("c1", cmd);
    }

    const auto stats = monitor.get_stats();
    CHECK(stats.queue_depth == 2);
    CHECK(stats.queue_dropped == 3);
    CHECK(stats.enqueued == 2);

    monitor.shutdown();
    CHECK(sink->count() == 2);
}

TEST_CASE("QueryMonitor: failing sink never reaches the caller", "[monitor]") {
    auto sink = std::make_shared<FailingReportSink>(true);
    QueryMonitor monitor(fast_options(0.0), MonitorComponents{sink, nullptr, nullptr});
    monitor.start();

    CHECK_NOTHROW(monitor.on_command_starting(make_event("c1", "k1")));
    CHECK_NOTHROW(monitor.on_command_completed("c1", "k1"));
    monitor.shutdown();

    CHECK(sink->call_count() == 1);
    CHECK(monitor.get_stats().worker.failed == 1);
}

TEST_CASE("QueryMonitor: plan captured on the command's own connection", "[monitor]") {
    auto sink = std::make_shared<RecordingReportSink>();
    auto conn = std::make_shared<MockDbConnection>(DatabaseProvider::POSTGRESQL);
    std::weak_ptr<MockDbConnection> weak = conn;

    PlanCapture::Config plan_cfg;
    plan_cfg.enabled = true;
    auto plan = std::make_shared<PlanCapture>(plan_cfg, nullptr);

    QueryMonitor monitor(fast_options(0.0), MonitorComponents{sink, plan, nullptr});
    monitor.start();

    auto ev = make_event("c1", "k1", "SELECT * FROM orders WHERE id = @id");
    ev.parameters = {{"@id", int64_t{5}}};
    ev.connection = conn;
    monitor.on_command_starting(std::move(ev));
    monitor.on_command_completed("c1", "k1");
    monitor.shutdown();

    const auto reports = sink->reports();
    REQUIRE(reports.size() == 1);
    REQUIRE(reports[0].execution_plan.has_value());
    CHECK(reports[0].execution_plan->provider == DatabaseProvider::POSTGRESQL);
    CHECK(conn->state()->was_executed("EXPLAIN (FORMAT JSON) SELECT * FROM orders WHERE id = 5"));
    CHECK(monitor.get_stats().plan.captured == 1);

    conn.reset();
    CHECK(weak.expired());
}

TEST_CASE("QueryMonitor: stack trace attached when enabled", "[monitor]") {
    auto sink = std::make_shared<RecordingReportSink>();
    auto provider = std::make_shared<FixedStackProvider>(std::vector<StackFrame>{
        {"shop::Orders::find(int)", "/opt/shop/src/orders.cpp", 12}});
    StackTraceFilter::Config filter_cfg;
    filter_cfg.project_root = "/opt/shop";
    auto filter = std::make_shared<const StackTraceFilter>(filter_cfg, provider);

    auto opts = fast_options(0.0);
    opts.capture_stack_trace = true;
    QueryMonitor monitor(opts, MonitorComponents{sink, nullptr, filter});
    monitor.start();

    monitor.on_command_starting(make_event("c1", "k1"));
    monitor.on_command_completed("c1", "k1");
    monitor.shutdown();

    const auto reports = sink->reports();
    REQUIRE(reports.size() == 1);
    REQUIRE(reports[0].stack_trace.has_value());
    CHECK(reports[0].stack_trace->front() == "shop::Orders::find(int) in src/orders.cpp:line 12");
}

TEST_CASE("QueryMonitor: concurrent hooks from many threads", "[monitor][concurrency]") {
    auto sink = std::make_shared<RecordingReportSink>();
    QueryMonitor monitor(fast_options(0.0), MonitorComponents{sink, nullptr, nullptr});
    monitor.start();

    constexpr int kThreads = 8;
    constexpr int kPerThread = 100;
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&monitor, t] {
            const std::string conn = "conn-" + std::to_string(t);
            for (int i = 0; i < kPerThread; ++i) {
                const std::string cmd = std::to_string(i);
                monitor.on_command_starting(make_event(conn, cmd, conn + "/" + cmd));
                monitor.on_command_completed(conn, cmd);
            }
        });
    }
    for (auto& th : threads) th.join();
    monitor.shutdown();

    CHECK(sink->count() == kThreads * kPerThread);
    for (const auto& r : sink->reports()) {
        CHECK(r.raw_query.starts_with("conn-"));
    }
}

TEST_CASE("QueryMonitor: missing sink is rejected", "[monitor]") {
    CHECK_THROWS_AS(QueryMonitor(fast_options(), MonitorComponents{}), std::invalid_argument);
    CHECK_THROWS_AS(MonitorBuilder().build(), std::runtime_error);
}

TEST_CASE("MonitorBuilder: wires components from configuration", "[monitor]") {
    namespace fs = std::filesystem;
    const auto report_file = fs::temp_directory_path() / "querywatch_builder_test.jsonl";
    fs::remove(report_file);

    QuerywatchConfig config;
    config.analyzer.threshold_ms = 0.0;
    config.analyzer.capture_stack_trace = false;
    config.queue.batch_size = 3;
    config.queue.poll_interval_ms = 10;
    config.queue.max_depth = 50;
    config.reporting.environment = "Development";
    config.reporting.application_name = "shop-api";
    config.reporting.version = "9.9.9";
    config.reporting.file.enabled = true;
    config.reporting.file.path = report_file.string();
    config.execution_plan.enabled = true;
    config.execution_plan.connection_string = "host=db dbname=shop";

    auto factory = std::make_shared<MockConnectionFactory>(DatabaseProvider::POSTGRESQL);
    auto builder = MonitorBuilder::from_config(config, factory);

    const auto& opts = builder.options();
    CHECK(opts.evaluator.threshold_ms == 0.0);
    CHECK(opts.evaluator.environment == "Development");
    CHECK(opts.evaluator.application_name == "shop-api");
    CHECK(opts.evaluator.version == "9.9.9");
    CHECK(opts.worker.batch_size == 3);
    CHECK(opts.worker.poll_interval == std::chrono::milliseconds(10));
    CHECK(opts.max_queue_depth == 50);
    CHECK(builder.components().stack_filter == nullptr);
    REQUIRE(builder.components().plan_capture != nullptr);
    CHECK(builder.components().plan_capture->enabled());

    {
        auto monitor = builder.build();
        monitor->start();
        monitor->on_command_starting(make_event("c1", "k1"));
        monitor->on_command_completed("c1", "k1");
        monitor->shutdown();
        CHECK(monitor->get_stats().worker.processed == 1);
    }

    CHECK(factory->create_count() == 1);
    CHECK(fs::exists(report_file));
    CHECK(fs::file_size(report_file) > 0);
    fs::remove(report_file);
}

TEST_CASE("MonitorBuilder: no sinks enabled still builds", "[monitor]") {
    QuerywatchConfig config;
    config.analyzer.capture_stack_trace = true;
    auto builder = MonitorBuilder::from_config(config, nullptr);
    CHECK(builder.components().sink != nullptr);
    CHECK(builder.components().stack_filter != nullptr);
    CHECK(builder.components().plan_capture == nullptr);
    CHECK(builder.build() != nullptr);
}
