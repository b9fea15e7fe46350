#include "reporting/http_sink.hpp"
#include "reporting/environment.hpp"
#include "reporting/http_constants.hpp"
#include "reporting/report_serializer.hpp"
#include "core/utils.hpp"

#include <httplib.h>

#include <charconv>
#include <format>

namespace querywatch {

std::string truncate_query(const std::string& text, size_t max_length) {
    if (text.size() <= max_length) {
        return text;
    }
    std::string out = text.substr(0, max_length);
    out += http::kTruncationMarker;
    return out;
}

HttpReportSink::HttpReportSink(const Config& config)
    : config_(config) {

    std::string url = utils::trim(config_.endpoint);
    if (url.empty()) {
        return;
    }

    std::string scheme = "https://";
    int port = 443;
    if (url.starts_with("https://")) {
        url = url.substr(8);
    } else if (url.starts_with("http://")) {
        scheme = "http://";
        port = 80;
        url = url.substr(7);
    }

    std::string host;
    const auto path_pos = url.find('/');
    if (path_pos != std::string::npos) {
        host = url.substr(0, path_pos);
        path_ = url.substr(path_pos);
    } else {
        host = url;
        path_ = "/";
    }

    const auto port_pos = host.find(':');
    if (port_pos != std::string::npos) {
        const std::string_view port_str = std::string_view(host).substr(port_pos + 1);
        const auto [ptr, ec] = std::from_chars(port_str.data(), port_str.data() + port_str.size(), port);
        if (ec != std::errc{} || ptr != port_str.data() + port_str.size() || port <= 0 || port > 65535) {
            utils::log::warn(std::format("HTTP report sink: invalid port in endpoint '{}'", config_.endpoint));
            return;
        }
        host = host.substr(0, port_pos);
    }

    if (host.empty()) {
        utils::log::warn(std::format("HTTP report sink: invalid endpoint '{}'", config_.endpoint));
        return;
    }

    scheme_host_port_ = std::format("{}{}:{}", scheme, host, port);
    endpoint_valid_ = true;
}

std::string HttpReportSink::name() const {
    return "http:" + config_.endpoint;
}

bool HttpReportSink::environment_enabled() const {
    return is_development(config_.environment) ? config_.enable_in_development
                                               : config_.enable_in_production;
}

std::string HttpReportSink::build_payload(const SlowQueryReport& report) const {
    auto j = ReportSerializer::to_json(report);
    j["rawQuery"] = truncate_query(report.raw_query, config_.max_query_length);
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

bool HttpReportSink::report(const SlowQueryReport& report, const CancellationToken& token) {
    if (!environment_enabled()) {
        skipped_.fetch_add(1, std::memory_order_relaxed);
        utils::log::debug(std::format("HTTP report sink: reporting disabled for environment '{}'",
                                      config_.environment));
        return true;
    }

    if (!endpoint_valid_) {
        skipped_.fetch_add(1, std::memory_order_relaxed);
        utils::log::warn("HTTP report sink: no endpoint configured, skipping report");
        return true;
    }

    if (token.is_cancelled()) {
        skipped_.fetch_add(1, std::memory_order_relaxed);
        utils::log::warn(std::format("HTTP report sink: cancelled before sending {}", report.query_id));
        return false;
    }

    const std::string payload = build_payload(report);

    httplib::Client client(scheme_host_port_);
    client.set_connection_timeout(config_.timeout);
    client.set_read_timeout(config_.timeout);
    client.set_write_timeout(config_.timeout);

    httplib::Headers headers;
    headers.emplace(http::kUserAgentHeader, std::format("querywatch/{}", http::kLibraryVersion));
    if (!config_.api_key.empty()) {
        headers.emplace(http::kAuthorizationHeader,
                        std::format("{}{}", http::kBearerPrefix, config_.api_key));
    }
    if (!config_.project_id.empty()) {
        headers.emplace(http::kProjectIdHeader, config_.project_id);
    }

    const auto res = client.Post(path_, headers, payload, http::kJsonContentType);
    if (!res) {
        failures_.fetch_add(1, std::memory_order_relaxed);
        utils::log::error(std::format("HTTP report sink: request to {} failed: {}",
                                      config_.endpoint, httplib::to_string(res.error())));
        return false;
    }

    if (res->status < 200 || res->status >= 300) {
        failures_.fetch_add(1, std::memory_order_relaxed);
        utils::log::error(std::format("HTTP report sink: {} returned {}: {}",
                                      config_.endpoint, res->status,
                                      utils::truncate_for_log(res->body, 500)));
        return false;
    }

    sent_.fetch_add(1, std::memory_order_relaxed);
    utils::log::debug(std::format("HTTP report sink: delivered {}", report.query_id));
    return true;
}

} // namespace querywatch
