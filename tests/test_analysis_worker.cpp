#include <catch2/catch_test_macros.hpp>
#include "analysis/analysis_worker.hpp"
#include "mocks/mock_db_connection.hpp"
#include "mocks/mock_report_sink.hpp"

#include <chrono>
#include <thread>

using namespace querywatch;
using namespace querywatch::testing;

static AnalysisItem make_item(const std::string& id) {
    AnalysisItem item;
    item.report.query_id = id;
    item.report.raw_query = "SELECT * FROM orders";
    item.report.execution_time_ms = 150.0;
    item.report.environment = "Production";
    return item;
}

static AnalysisWorker::Config fast_config(size_t batch_size = 10) {
    AnalysisWorker::Config cfg;
    cfg.batch_size = batch_size;
    cfg.poll_interval = std::chrono::milliseconds(10);
    cfg.fault_backoff = std::chrono::milliseconds(10);
    return cfg;
}

static bool wait_until(const std::function<bool()>& pred,
                       std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

TEST_CASE("AnalysisWorker: delivers queued reports in FIFO order", "[worker]") {
    AnalysisQueue<AnalysisItem> queue;
    auto sink = std::make_shared<RecordingReportSink>();
    AnalysisWorker worker(fast_config(), queue, nullptr, sink);

    for (int i = 0; i < 5; ++i) {
        queue.push(make_item("q" + std::to_string(i)));
    }
    worker.start();
    CHECK(wait_until([&] { return sink->count() == 5; }));
    worker.stop();

    const auto reports = sink->reports();
    REQUIRE(reports.size() == 5);
    for (int i = 0; i < 5; ++i) {
        CHECK(reports[i].query_id == "q" + std::to_string(i));
    }
    CHECK(worker.get_stats().processed == 5);
}

TEST_CASE("AnalysisWorker: shutdown drains every pending item", "[worker]") {
    AnalysisQueue<AnalysisItem> queue;
    auto sink = std::make_shared<RecordingReportSink>("slow", std::chrono::milliseconds(2));
    AnalysisWorker worker(fast_config(10), queue, nullptr, sink);

    worker.start();
    for (int i = 0; i < 25; ++i) {
        queue.push(make_item("q" + std::to_string(i)));
    }
    worker.stop();

    CHECK(sink->count() == 25);
    CHECK(queue.empty());
    const auto stats = worker.get_stats();
    CHECK(stats.processed == 25);
    CHECK(stats.failed == 0);
    CHECK_FALSE(worker.is_running());
}

TEST_CASE("AnalysisWorker: stop without start delivers queued items", "[worker]") {
    AnalysisQueue<AnalysisItem> queue;
    auto sink = std::make_shared<RecordingReportSink>();
    AnalysisWorker worker(fast_config(), queue, nullptr, sink);

    for (int i = 0; i < 25; ++i) {
        queue.push(make_item("q" + std::to_string(i)));
    }

    worker.stop();
    CHECK(sink->count() == 25);
    CHECK(worker.get_stats().processed == 25);
    CHECK(queue.empty());

    worker.stop();
    CHECK(sink->count() == 25);
}

TEST_CASE("AnalysisWorker: items queued after stop are delivered on destruction", "[worker]") {
    AnalysisQueue<AnalysisItem> queue;
    auto sink = std::make_shared<RecordingReportSink>();
    {
        AnalysisWorker worker(fast_config(), queue, nullptr, sink);
        worker.start();
        worker.stop();

        queue.push(make_item("late"));
    }
    REQUIRE(sink->count() == 1);
    CHECK(sink->reports()[0].query_id == "late");
}

TEST_CASE("AnalysisWorker: report interrupted by stop is retried in the final drain", "[worker]") {
    AnalysisQueue<AnalysisItem> queue;
    auto sink = std::make_shared<CancellationAwareSink>();
    AnalysisWorker worker(fast_config(), queue, nullptr, sink);

    queue.push(make_item("in-flight"));
    worker.start();
    REQUIRE(wait_until([&] { return sink->entered() > 0; }));

    worker.stop();

    CHECK(sink->cancelled_calls() == 1);
    const auto reports = sink->delivered();
    REQUIRE(reports.size() == 1);
    CHECK(reports[0].query_id == "in-flight");
    CHECK(worker.get_stats().processed == 1);
    CHECK(worker.get_stats().failed == 0);
}

TEST_CASE("AnalysisWorker: failing sink is counted and does not stop the loop", "[worker]") {
    AnalysisQueue<AnalysisItem> queue;

    SECTION("sink returns false") {
        auto sink = std::make_shared<FailingReportSink>(false);
        AnalysisWorker worker(fast_config(), queue, nullptr, sink);
        worker.start();
        queue.push(make_item("a"));
        queue.push(make_item("b"));
        CHECK(wait_until([&] { return sink->call_count() == 2; }));
        worker.stop();
        CHECK(worker.get_stats().failed == 2);
        CHECK(worker.get_stats().processed == 0);
    }

    SECTION("sink throws") {
        auto sink = std::make_shared<FailingReportSink>(true);
        AnalysisWorker worker(fast_config(), queue, nullptr, sink);
        worker.start();
        queue.push(make_item("a"));
        queue.push(make_item("b"));
        CHECK(wait_until([&] { return sink->call_count() == 2; }));
        worker.stop();
        CHECK(worker.get_stats().failed == 2);
    }
}

TEST_CASE("AnalysisWorker: attaches execution plan before reporting", "[worker]") {
    AnalysisQueue<AnalysisItem> queue;
    auto sink = std::make_shared<RecordingReportSink>();

    auto factory = std::make_shared<MockConnectionFactory>(DatabaseProvider::POSTGRESQL);
    PlanCapture::Config plan_cfg;
    plan_cfg.enabled = true;
    plan_cfg.connection_string = "host=db dbname=app";
    auto plan = std::make_shared<PlanCapture>(plan_cfg, factory);

    AnalysisWorker worker(fast_config(), queue, plan, sink);
    worker.start();
    queue.push(make_item("q1"));
    CHECK(wait_until([&] { return sink->count() == 1; }));
    worker.stop();

    const auto reports = sink->reports();
    REQUIRE(reports.size() == 1);
    REQUIRE(reports[0].execution_plan.has_value());
    CHECK(reports[0].execution_plan->provider == DatabaseProvider::POSTGRESQL);
    CHECK(reports[0].execution_plan->format == PlanFormat::JSON);
    CHECK(factory->state()->is_closed());
}

TEST_CASE("AnalysisWorker: no plan strategy still delivers the report", "[worker]") {
    AnalysisQueue<AnalysisItem> queue;
    auto sink = std::make_shared<RecordingReportSink>();

    PlanCapture::Config plan_cfg;
    plan_cfg.enabled = true;
    auto plan = std::make_shared<PlanCapture>(plan_cfg, nullptr);

    AnalysisWorker worker(fast_config(), queue, plan, sink);
    worker.start();
    queue.push(make_item("q1"));
    CHECK(wait_until([&] { return sink->count() == 1; }));
    worker.stop();

    const auto reports = sink->reports();
    REQUIRE(reports.size() == 1);
    CHECK_FALSE(reports[0].execution_plan.has_value());
    CHECK(plan->get_stats().no_strategy == 1);
}

TEST_CASE("AnalysisWorker: releases host handles after processing", "[worker]") {
    AnalysisQueue<AnalysisItem> queue;
    auto sink = std::make_shared<RecordingReportSink>();
    AnalysisWorker worker(fast_config(), queue, nullptr, sink);

    auto connection = std::make_shared<MockDbConnection>();
    std::weak_ptr<MockDbConnection> weak = connection;

    auto item = make_item("q1");
    item.connection = std::move(connection);
    queue.push(std::move(item));

    worker.start();
    CHECK(wait_until([&] { return sink->count() == 1; }));
    worker.stop();

    CHECK(weak.expired());
}

TEST_CASE("AnalysisWorker: restart after stop", "[worker]") {
    AnalysisQueue<AnalysisItem> queue;
    auto sink = std::make_shared<RecordingReportSink>();
    AnalysisWorker worker(fast_config(), queue, nullptr, sink);

    worker.start();
    queue.push(make_item("first"));
    worker.stop();

    worker.start();
    queue.push(make_item("second"));
    worker.stop();

    CHECK(sink->count() == 2);
}
