#pragma once

#include "reporting/report_sink.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

namespace querywatch {

/**
 * @brief Posts each report as JSON to a remote collector
 *
 * Uses cpp-httplib. Best-effort: a non-2xx response or transport error
 * is logged and counted, never retried.
 *
 * Reporting is gated by environment: "Development" (case-insensitive)
 * follows enable_in_development, every other environment follows
 * enable_in_production. A disabled environment or a missing endpoint
 * skips the report and counts as success.
 */
class HttpReportSink : public IReportSink {
public:
    struct Config {
        std::string endpoint;
        std::string api_key;
        std::string project_id;
        std::chrono::milliseconds timeout{5000};
        size_t max_query_length = 10000;
        std::string environment = "Production";
        bool enable_in_development = true;
        bool enable_in_production = false;
    };

    explicit HttpReportSink(const Config& config);

    [[nodiscard]] bool report(const SlowQueryReport& report,
                              const CancellationToken& token) override;

    [[nodiscard]] std::string name() const override;

    /// Request body for a report (command text already truncated)
    [[nodiscard]] std::string build_payload(const SlowQueryReport& report) const;

    [[nodiscard]] bool environment_enabled() const;

    [[nodiscard]] uint64_t sent_count() const { return sent_.load(std::memory_order_relaxed); }
    [[nodiscard]] uint64_t failure_count() const { return failures_.load(std::memory_order_relaxed); }
    [[nodiscard]] uint64_t skipped_count() const { return skipped_.load(std::memory_order_relaxed); }

private:
    Config config_;

    // Parsed from endpoint
    std::string scheme_host_port_;
    std::string path_;
    bool endpoint_valid_ = false;

    std::atomic<uint64_t> sent_{0};
    std::atomic<uint64_t> failures_{0};
    std::atomic<uint64_t> skipped_{0};
};

/// Cut text to max_length characters and append the truncation marker
[[nodiscard]] std::string truncate_query(const std::string& text, size_t max_length);

} // namespace querywatch
