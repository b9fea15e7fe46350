#include "config/config_loader.hpp"
#include "core/database_provider.hpp"
#include "core/utils.hpp"

#include <toml++/toml.hpp>

#include <cstdlib>
#include <format>
#include <stdexcept>

using namespace std::string_literals;

namespace querywatch {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = ConfigLoader::expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            auto expanded = ConfigLoader::expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);
    expand_env_vars_recursive(result);
    return result;
}

// ---- Section extractors ----------------------------------------------------

LoggingConfig extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* sec = root["logging"].as_table();
    if (!sec) return cfg;
    const auto& s = *sec;

    cfg.level = s["level"].value_or(cfg.level);
    return cfg;
}

AnalyzerConfig extract_analyzer(const toml::table& root) {
    AnalyzerConfig cfg;
    const auto* sec = root["analyzer"].as_table();
    if (!sec) return cfg;
    const auto& s = *sec;

    cfg.enabled = s["enabled"].value_or(cfg.enabled);
    if (const auto* whole = s["threshold_ms"].as_integer()) {
        cfg.threshold_ms = static_cast<double>(whole->get());
    } else {
        cfg.threshold_ms = s["threshold_ms"].value_or(cfg.threshold_ms);
    }
    cfg.capture_stack_trace = s["capture_stack_trace"].value_or(cfg.capture_stack_trace);
    cfg.max_stack_trace_lines = s["max_stack_trace_lines"].value_or(cfg.max_stack_trace_lines);
    cfg.max_query_length = s["max_query_length"].value_or(cfg.max_query_length);
    cfg.project_root = s["project_root"].value_or(""s);
    return cfg;
}

ExecutionPlanConfig extract_execution_plan(const toml::table& root) {
    ExecutionPlanConfig cfg;
    const auto* sec = root["execution_plan"].as_table();
    if (!sec) return cfg;
    const auto& s = *sec;

    cfg.enabled = s["enabled"].value_or(cfg.enabled);
    cfg.timeout_seconds = s["timeout_seconds"].value_or(cfg.timeout_seconds);
    cfg.connection_string = s["connection_string"].value_or(""s);
    cfg.provider = s["provider"].value_or(cfg.provider);
    return cfg;
}

QueueConfig extract_queue(const toml::table& root) {
    QueueConfig cfg;
    const auto* sec = root["queue"].as_table();
    if (!sec) return cfg;
    const auto& s = *sec;

    cfg.batch_size = s["batch_size"].value_or(cfg.batch_size);
    cfg.poll_interval_ms = s["poll_interval_ms"].value_or(cfg.poll_interval_ms);
    cfg.max_depth = s["max_depth"].value_or(cfg.max_depth);
    return cfg;
}

ReportingConfig extract_reporting(const toml::table& root) {
    ReportingConfig cfg;
    const auto* sec = root["reporting"].as_table();
    if (!sec) return cfg;
    const auto& s = *sec;

    cfg.environment = s["environment"].value_or(""s);
    cfg.application_name = s["application_name"].value_or(""s);
    cfg.version = s["version"].value_or(""s);
    cfg.enable_in_development = s["enable_in_development"].value_or(cfg.enable_in_development);
    cfg.enable_in_production = s["enable_in_production"].value_or(cfg.enable_in_production);

    if (const auto* http = s["http"].as_table()) {
        const auto& h = *http;
        cfg.http.enabled = h["enabled"].value_or(false);
        cfg.http.endpoint = h["endpoint"].value_or(""s);
        cfg.http.api_key = h["api_key"].value_or(""s);
        cfg.http.project_id = h["project_id"].value_or(""s);
        cfg.http.timeout_ms = h["timeout_ms"].value_or(cfg.http.timeout_ms);
    }

    if (const auto* file = s["file"].as_table()) {
        const auto& f = *file;
        cfg.file.enabled = f["enabled"].value_or(false);
        cfg.file.path = f["path"].value_or(cfg.file.path);
        cfg.file.max_file_size_mb = f["max_file_size_mb"].value_or(cfg.file.max_file_size_mb);
        cfg.file.max_files = f["max_files"].value_or(cfg.file.max_files);
    }
    return cfg;
}

QuerywatchConfig extract_all_sections(const toml::table& root) {
    QuerywatchConfig config;
    config.logging = extract_logging(root);
    config.analyzer = extract_analyzer(root);
    config.execution_plan = extract_execution_plan(root);
    config.queue = extract_queue(root);
    config.reporting = extract_reporting(root);
    return config;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

std::string ConfigLoader::expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(QuerywatchConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return LoadResult::error(std::move(combined));
    }
    return LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const QuerywatchConfig& config) {
    std::vector<std::string> errors;

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format(
            "logging.level must be debug|info|warn|error, got '{}'", config.logging.level));
    }

    const auto& analyzer = config.analyzer;
    if (analyzer.threshold_ms < 0.0) {
        errors.push_back(std::format(
            "analyzer.threshold_ms must be >= 0, got {}", analyzer.threshold_ms));
    }
    if (analyzer.capture_stack_trace && analyzer.max_stack_trace_lines <= 0) {
        errors.push_back(std::format(
            "analyzer.max_stack_trace_lines must be > 0 when capture_stack_trace is true, got {}",
            analyzer.max_stack_trace_lines));
    }
    if (analyzer.max_query_length <= 0) {
        errors.push_back(std::format(
            "analyzer.max_query_length must be > 0, got {}", analyzer.max_query_length));
    }

    const auto& plan = config.execution_plan;
    if (plan.timeout_seconds <= 0) {
        errors.push_back(std::format(
            "execution_plan.timeout_seconds must be > 0, got {}", plan.timeout_seconds));
    }
    if (!parse_provider(plan.provider)) {
        errors.push_back(std::format(
            "execution_plan.provider '{}' is not recognized", plan.provider));
    }

    const auto& queue = config.queue;
    if (queue.batch_size <= 0) {
        errors.push_back(std::format("queue.batch_size must be > 0, got {}", queue.batch_size));
    }
    if (queue.poll_interval_ms <= 0) {
        errors.push_back(std::format(
            "queue.poll_interval_ms must be > 0, got {}", queue.poll_interval_ms));
    }
    if (queue.max_depth < 0) {
        errors.push_back(std::format("queue.max_depth must be >= 0, got {}", queue.max_depth));
    }

    const auto& http = config.reporting.http;
    if (http.enabled && http.endpoint.empty()) {
        errors.push_back("reporting.http.endpoint required when HTTP reporting is enabled");
    }
    if (http.timeout_ms <= 0) {
        errors.push_back(std::format(
            "reporting.http.timeout_ms must be > 0, got {}", http.timeout_ms));
    }

    const auto& file = config.reporting.file;
    if (file.enabled && file.path.empty()) {
        errors.push_back("reporting.file.path required when file reporting is enabled");
    }
    if (file.max_file_size_mb <= 0) {
        errors.push_back(std::format(
            "reporting.file.max_file_size_mb must be > 0, got {}", file.max_file_size_mb));
    }
    if (file.max_files < 0) {
        errors.push_back(std::format(
            "reporting.file.max_files must be >= 0, got {}", file.max_files));
    }

    return errors;
}

} // namespace querywatch
