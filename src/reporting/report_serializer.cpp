#include "reporting/report_serializer.hpp"
#include "core/database_provider.hpp"
#include "core/utils.hpp"

#include <cmath>
#include <format>
#include <type_traits>

namespace querywatch {

namespace {

std::string hex_bytes(const Bytes& bytes) {
    std::string out = "0x";
    out.reserve(2 + bytes.size() * 2);
    for (const uint8_t b : bytes) {
        out += std::format("{:02X}", b);
    }
    return out;
}

template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

} // anonymous namespace

nlohmann::json ReportSerializer::parameter_to_json(const ParameterValue& value) {
    return std::visit(overloaded{
        [](std::monostate) -> nlohmann::json { return nullptr; },
        [](bool v) -> nlohmann::json { return v; },
        [](int64_t v) -> nlohmann::json { return v; },
        [](uint64_t v) -> nlohmann::json { return v; },
        [](double v) -> nlohmann::json {
            if (!std::isfinite(v)) return nullptr;
            return v;
        },
        [](const Decimal& v) -> nlohmann::json { return v.value; },
        [](const std::string& v) -> nlohmann::json { return v; },
        [](char v) -> nlohmann::json { return std::string(1, v); },
        [](const TimePoint& v) -> nlohmann::json { return utils::format_iso8601_utc(v); },
        [](const DateTimeOffset& v) -> nlohmann::json {
            return utils::format_datetime(v.local_time, 'T') + utils::format_utc_offset(v.offset);
        },
        [](const TimeSpan& v) -> nlohmann::json { return utils::format_time_span(v); },
        [](const Uuid& v) -> nlohmann::json { return v.value; },
        [](const Bytes& v) -> nlohmann::json { return hex_bytes(v); },
    }, value);
}

nlohmann::json ReportSerializer::plan_to_json(const ExecutionPlan& plan) {
    return nlohmann::json{
        {"databaseProvider", std::string(provider_to_string(plan.provider))},
        {"planFormat", {
            {"contentType", std::string(plan_format_content_type(plan.format))},
            {"fileExtension", std::string(plan_format_extension(plan.format))},
            {"description", std::string(plan_format_description(plan.format))},
        }},
        {"content", plan.content},
    };
}

nlohmann::json ReportSerializer::to_json(const SlowQueryReport& report) {
    nlohmann::json params = nlohmann::json::object();
    for (const auto& [name, value] : report.parameters) {
        params[name] = parameter_to_json(value);
    }

    nlohmann::json j;
    j["queryId"] = report.query_id;
    j["rawQuery"] = report.raw_query;
    j["parameters"] = std::move(params);
    j["executionTimeMs"] = report.execution_time_ms;
    j["stackTrace"] = report.stack_trace ? nlohmann::json(*report.stack_trace) : nlohmann::json(nullptr);
    j["timestamp"] = utils::format_iso8601_utc(report.timestamp);
    j["contextType"] = report.context_type;
    j["environment"] = report.environment;
    j["applicationName"] = report.application_name ? nlohmann::json(*report.application_name)
                                                   : nlohmann::json(nullptr);
    j["version"] = report.version ? nlohmann::json(*report.version) : nlohmann::json(nullptr);
    j["executionPlan"] = report.execution_plan ? plan_to_json(*report.execution_plan)
                                               : nlohmann::json(nullptr);
    return j;
}

std::string ReportSerializer::serialize(const SlowQueryReport& report) {
    // Replace invalid UTF-8 instead of throwing on odd command text
    return to_json(report).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace querywatch
