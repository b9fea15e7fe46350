#include "plan/plan_capture.hpp"
#include "core/database_provider.hpp"
#include "core/utils.hpp"

#include <format>

namespace querywatch {

namespace {

/// Closes connections this component opened, whatever the exit path
struct CloseConnection {
    void operator()(IDbConnection* conn) const {
        if (conn) {
            conn->close();
            delete conn;
        }
    }
};

using OwnedConnection = std::unique_ptr<IDbConnection, CloseConnection>;

} // anonymous namespace

PlanCapture::PlanCapture(const Config& config, std::shared_ptr<IConnectionFactory> factory)
    : config_(config),
      factory_(std::move(factory)) {}

ConnectionSelection PlanCapture::select_strategy(const AnalysisItem& item) const {
    if (!config_.connection_string.empty()) {
        return {ConnectionStrategy::CONFIGURED_STRING, config_.connection_string};
    }

    if (item.connection && item.connection->is_connected()) {
        return {ConnectionStrategy::OPEN_CONNECTION, {}};
    }

    if (const auto source = std::dynamic_pointer_cast<IConnectionStringSource>(item.data_context)) {
        if (auto conn_str = source->connection_string(); conn_str && !conn_str->empty()) {
            return {ConnectionStrategy::DATA_CONTEXT, std::move(*conn_str)};
        }
    }

    if (config_.fallback_resolver) {
        if (auto conn_str = config_.fallback_resolver(item.report); conn_str && !conn_str->empty()) {
            return {ConnectionStrategy::FALLBACK_RESOLVER, std::move(*conn_str)};
        }
    }

    return {};
}

DatabaseProvider PlanCapture::resolve_provider(const IDbConnection& connection,
                                               const std::string& connection_string) const {
    if (config_.provider != DatabaseProvider::AUTO) {
        return config_.provider;
    }

    const auto from_connection = connection.provider();
    if (from_connection != DatabaseProvider::UNKNOWN && from_connection != DatabaseProvider::AUTO) {
        return from_connection;
    }

    return detect_provider(connection_string);
}

std::optional<ExecutionPlan> PlanCapture::fail(const std::string& query_id, const std::string& reason) {
    failed_.fetch_add(1, std::memory_order_relaxed);
    utils::log::warn(std::format("Execution plan capture failed for query {}: {}", query_id, reason));
    return std::nullopt;
}

std::optional<ExecutionPlan> PlanCapture::capture(const AnalysisItem& item,
                                                  const CancellationToken& token) noexcept {
    if (!config_.enabled) {
        return std::nullopt;
    }

    attempts_.fetch_add(1, std::memory_order_relaxed);

    try {
        return capture_impl(item, token);
    } catch (const std::exception& e) {
        failed_.fetch_add(1, std::memory_order_relaxed);
        utils::log::error(std::format("Execution plan capture error for query {}: {}",
                                      item.report.query_id, e.what()));
        return std::nullopt;
    }
}

std::optional<ExecutionPlan> PlanCapture::capture_impl(const AnalysisItem& item,
                                                       const CancellationToken& token) {
    const auto& report = item.report;

    if (token.is_cancelled()) {
        utils::log::debug(std::format("Execution plan capture cancelled for query {}", report.query_id));
        return std::nullopt;
    }

    const auto selection = select_strategy(item);
    if (selection.strategy == ConnectionStrategy::NONE) {
        no_strategy_.fetch_add(1, std::memory_order_relaxed);
        utils::log::warn(std::format(
            "No connection available to capture execution plan for query {}", report.query_id));
        return std::nullopt;
    }

    utils::log::debug(std::format("Capturing execution plan for query {} via {}",
                                  report.query_id, strategy_to_string(selection.strategy)));

    // Declared before the guard so the guard runs its exit statements first
    OwnedConnection owned;
    IDbConnection* connection = nullptr;

    if (selection.strategy == ConnectionStrategy::OPEN_CONNECTION) {
        connection = item.connection.get();
    } else {
        if (!factory_) {
            return fail(report.query_id, "no connection factory configured");
        }
        owned.reset(factory_->create(selection.connection_string).release());
        if (!owned) {
            return fail(report.query_id, std::format("could not open connection ({})",
                                                     strategy_to_string(selection.strategy)));
        }
        connection = owned.get();
    }

    if (!connection->is_connected()) {
        return fail(report.query_id, "connection is not open");
    }

    const auto provider = resolve_provider(*connection, selection.connection_string);
    const auto dialect = make_plan_dialect(provider);
    if (!dialect) {
        return fail(report.query_id, std::format("unsupported database provider '{}'",
                                                 provider_to_string(provider)));
    }

    const auto timeout_ms = static_cast<uint32_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(config_.timeout).count());

    if (owned && !owned->set_query_timeout(timeout_ms)) {
        utils::log::debug(std::format("Could not set plan query timeout for query {}", report.query_id));
    }

    const std::string literal_sql =
        substitute_parameters(report.raw_query, report.parameters, dialect->literal_style());

    if (token.is_cancelled()) {
        utils::log::debug(std::format("Execution plan capture cancelled for query {}", report.query_id));
        return std::nullopt;
    }

    std::string content;
    {
        DiagnosticModeGuard guard(*connection, *dialect);
        if (!guard.enter(timeout_ms)) {
            return fail(report.query_id, "could not enter diagnostic mode");
        }

        const auto result = connection->execute(dialect->plan_query(literal_sql));
        if (!result.success) {
            return fail(report.query_id, describe_error(result));
        }
        if (result.rows.empty() || result.rows.front().empty()) {
            return fail(report.query_id, "plan query returned no rows");
        }
        content = result.rows.front().front();
    }

    if (content.empty()) {
        return fail(report.query_id, "plan query returned empty content");
    }

    captured_.fetch_add(1, std::memory_order_relaxed);
    utils::log::debug(std::format("Captured {} execution plan for query {} ({} bytes)",
                                  provider_to_string(provider), report.query_id, content.size()));

    return ExecutionPlan{provider, dialect->format(), std::move(content)};
}

} // namespace querywatch
