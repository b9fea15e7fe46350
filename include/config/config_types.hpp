#pragma once

#include <cstdint>
#include <string>

namespace querywatch {

// ============================================================================
// Config sections (mirror the TOML hierarchy)
// ============================================================================

struct LoggingConfig {
    std::string level = "info";
};

struct AnalyzerConfig {
    bool enabled = true;
    double threshold_ms = 1000.0;
    bool capture_stack_trace = true;
    int64_t max_stack_trace_lines = 20;
    int64_t max_query_length = 10000;
    std::string project_root;                 // empty: auto-detect
};

struct ExecutionPlanConfig {
    bool enabled = false;
    int64_t timeout_seconds = 30;
    std::string connection_string;            // empty: not configured
    std::string provider = "auto";
};

struct QueueConfig {
    int64_t batch_size = 10;
    int64_t poll_interval_ms = 100;
    int64_t max_depth = 0;                    // 0: unbounded
};

struct HttpReportingConfig {
    bool enabled = false;
    std::string endpoint;
    std::string api_key;
    std::string project_id;
    int64_t timeout_ms = 5000;
};

struct FileReportingConfig {
    bool enabled = false;
    std::string path = "slow_queries.jsonl";
    int64_t max_file_size_mb = 100;
    int64_t max_files = 10;
};

struct ReportingConfig {
    std::string environment;                  // empty: $QUERYWATCH_ENVIRONMENT / Production
    std::string application_name;
    std::string version;
    bool enable_in_development = true;
    bool enable_in_production = false;
    HttpReportingConfig http;
    FileReportingConfig file;
};

// ============================================================================
// QuerywatchConfig - Complete parsed configuration
// ============================================================================

struct QuerywatchConfig {
    LoggingConfig logging;
    AnalyzerConfig analyzer;
    ExecutionPlanConfig execution_plan;
    QueueConfig queue;
    ReportingConfig reporting;
};

} // namespace querywatch
