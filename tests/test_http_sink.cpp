#include <catch2/catch_test_macros.hpp>
#include "reporting/http_sink.hpp"
#include "reporting/http_constants.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <format>
#include <mutex>
#include <thread>

using namespace querywatch;

static SlowQueryReport make_report(std::string sql = "SELECT * FROM orders") {
    SlowQueryReport r;
    r.query_id = "q-123";
    r.raw_query = std::move(sql);
    r.execution_time_ms = 1500.0;
    r.environment = "Development";
    return r;
}

static HttpReportSink::Config dev_config(std::string endpoint) {
    HttpReportSink::Config cfg;
    cfg.endpoint = std::move(endpoint);
    cfg.api_key = "secret-key";
    cfg.project_id = "proj-7";
    cfg.timeout = std::chrono::milliseconds(2000);
    cfg.environment = "Development";
    return cfg;
}

TEST_CASE("truncate_query: long text is cut and marked", "[http_sink]") {
    CHECK(truncate_query("SELECT 1", 100) == "SELECT 1");
    CHECK(truncate_query("abcdef", 6) == "abcdef");
    CHECK(truncate_query("abcdefgh", 3) == "abc\n-- [TRUNCATED]");
}

TEST_CASE("HttpReportSink: payload truncates the command text", "[http_sink]") {
    auto cfg = dev_config("https://api.example.com/v1/reports");
    cfg.max_query_length = 10;
    HttpReportSink sink(cfg);

    const auto body = nlohmann::json::parse(sink.build_payload(make_report(std::string(50, 'x'))));
    CHECK(body["rawQuery"] == std::string(10, 'x') + std::string(http::kTruncationMarker));
    CHECK(body["queryId"] == "q-123");
}

TEST_CASE("HttpReportSink: environment gating", "[http_sink]") {
    SECTION("production disabled by default") {
        auto cfg = dev_config("http://127.0.0.1:1/reports");
        cfg.environment = "Production";
        HttpReportSink sink(cfg);
        CHECK_FALSE(sink.environment_enabled());
        CHECK(sink.report(make_report(), CancellationToken{}));
        CHECK(sink.skipped_count() == 1);
        CHECK(sink.sent_count() == 0);
    }

    SECTION("development compared case-insensitively") {
        auto cfg = dev_config("http://127.0.0.1:1/reports");
        cfg.environment = "development";
        HttpReportSink sink(cfg);
        CHECK(sink.environment_enabled());
    }

    SECTION("development can be switched off") {
        auto cfg = dev_config("http://127.0.0.1:1/reports");
        cfg.enable_in_development = false;
        HttpReportSink sink(cfg);
        CHECK_FALSE(sink.environment_enabled());
    }

    SECTION("production can be switched on") {
        auto cfg = dev_config("http://127.0.0.1:1/reports");
        cfg.environment = "Staging";
        cfg.enable_in_production = true;
        HttpReportSink sink(cfg);
        CHECK(sink.environment_enabled());
    }
}

TEST_CASE("HttpReportSink: missing or invalid endpoint skips", "[http_sink]") {
    SECTION("missing") {
        HttpReportSink sink(dev_config(""));
        CHECK(sink.report(make_report(), CancellationToken{}));
        CHECK(sink.skipped_count() == 1);
    }

    SECTION("bad port") {
        HttpReportSink sink(dev_config("http://localhost:notaport/x"));
        CHECK(sink.report(make_report(), CancellationToken{}));
        CHECK(sink.skipped_count() == 1);
    }
}

TEST_CASE("HttpReportSink: cancelled token fails without sending", "[http_sink]") {
    HttpReportSink sink(dev_config("http://127.0.0.1:1/reports"));
    CancellationToken token;
    token.cancel();
    CHECK_FALSE(sink.report(make_report(), token));
    CHECK(sink.failure_count() == 0);
    CHECK(sink.skipped_count() == 1);
}

TEST_CASE("HttpReportSink: unreachable endpoint is a failure", "[http_sink]") {
    auto cfg = dev_config("http://127.0.0.1:1/reports");
    cfg.timeout = std::chrono::milliseconds(500);
    HttpReportSink sink(cfg);
    CHECK_FALSE(sink.report(make_report(), CancellationToken{}));
    CHECK(sink.failure_count() == 1);
}

TEST_CASE("HttpReportSink: posts JSON with auth headers", "[http_sink]") {
    httplib::Server server;
    std::mutex mutex;
    std::string body;
    std::string authorization;
    std::string project_id;
    std::string content_type;
    int status = 202;

    server.Post("/v1/reports", [&](const httplib::Request& req, httplib::Response& res) {
        std::lock_guard<std::mutex> lock(mutex);
        body = req.body;
        authorization = req.get_header_value("Authorization");
        project_id = req.get_header_value("X-PROJECT-ID");
        content_type = req.get_header_value("Content-Type");
        res.status = status;
    });

    const int port = server.bind_to_any_port("127.0.0.1");
    REQUIRE(port > 0);
    std::thread listener([&] { server.listen_after_bind(); });
    server.wait_until_ready();

    HttpReportSink sink(dev_config(std::format("http://127.0.0.1:{}/v1/reports", port)));

    SECTION("accepted") {
        CHECK(sink.report(make_report(), CancellationToken{}));
        CHECK(sink.sent_count() == 1);

        std::lock_guard<std::mutex> lock(mutex);
        CHECK(authorization == "Bearer secret-key");
        CHECK(project_id == "proj-7");
        CHECK(content_type == "application/json");
        const auto j = nlohmann::json::parse(body);
        CHECK(j["queryId"] == "q-123");
        CHECK(j["environment"] == "Development");
    }

    SECTION("server error") {
        {
            std::lock_guard<std::mutex> lock(mutex);
            status = 500;
        }
        CHECK_FALSE(sink.report(make_report(), CancellationToken{}));
        CHECK(sink.failure_count() == 1);
    }

    server.stop();
    listener.join();
}
