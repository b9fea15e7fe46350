#include "plan/plan_dialect.hpp"
#include "core/database_provider.hpp"
#include "core/utils.hpp"

#include <format>

namespace querywatch {

// ============================================================================
// SQL Server
// ============================================================================

std::vector<std::string> SqlServerPlanDialect::enter_statements(uint32_t timeout_ms) const {
    // SHOWPLAN_XML must be the only statement in its batch
    return {
        std::format("SET LOCK_TIMEOUT {}", timeout_ms),
        "SET SHOWPLAN_XML ON",
    };
}

std::string SqlServerPlanDialect::plan_query(const std::string& literal_sql) const {
    return literal_sql;
}

std::vector<std::string> SqlServerPlanDialect::exit_statements() const {
    return {
        "SET SHOWPLAN_XML OFF",
        "SET LOCK_TIMEOUT -1",
    };
}

// ============================================================================
// PostgreSQL
// ============================================================================

std::vector<std::string> PostgresPlanDialect::enter_statements(uint32_t timeout_ms) const {
    return {
        "BEGIN READ ONLY",
        std::format("SET LOCAL statement_timeout = {}", timeout_ms),
    };
}

std::string PostgresPlanDialect::plan_query(const std::string& literal_sql) const {
    return "EXPLAIN (FORMAT JSON) " + literal_sql;
}

std::vector<std::string> PostgresPlanDialect::exit_statements() const {
    return {"ROLLBACK"};
}

// ============================================================================
// MySQL
// ============================================================================

std::vector<std::string> MysqlPlanDialect::enter_statements(uint32_t timeout_ms) const {
    return {
        std::format("SET SESSION max_execution_time = {}", timeout_ms),
        "START TRANSACTION READ ONLY",
    };
}

std::string MysqlPlanDialect::plan_query(const std::string& literal_sql) const {
    return "EXPLAIN FORMAT=JSON " + literal_sql;
}

std::vector<std::string> MysqlPlanDialect::exit_statements() const {
    return {
        "ROLLBACK",
        "SET SESSION max_execution_time = 0",
    };
}

// ============================================================================
// Factory
// ============================================================================

std::unique_ptr<IPlanDialect> make_plan_dialect(DatabaseProvider provider) {
    switch (provider) {
        case DatabaseProvider::SQL_SERVER: return std::make_unique<SqlServerPlanDialect>();
        case DatabaseProvider::POSTGRESQL: return std::make_unique<PostgresPlanDialect>();
        case DatabaseProvider::MYSQL:      return std::make_unique<MysqlPlanDialect>();
        default:                           return nullptr;
    }
}

// ============================================================================
// DiagnosticModeGuard
// ============================================================================

bool DiagnosticModeGuard::enter(uint32_t timeout_ms) {
    // Armed before the first statement so a partial enter is still undone
    active_ = true;

    for (const auto& stmt : dialect_.enter_statements(timeout_ms)) {
        const auto result = connection_.execute(stmt);
        if (!result.success) {
            utils::log::warn(std::format("{}: failed to enter diagnostic mode ({}): {}",
                provider_to_string(dialect_.provider()), stmt, describe_error(result)));
            return false;
        }
    }
    return true;
}

void DiagnosticModeGuard::exit() noexcept {
    if (!active_) return;
    active_ = false;

    try {
        if (!connection_.is_connected()) {
            utils::log::warn("Diagnostic mode not reset: connection already closed");
            return;
        }

        for (const auto& stmt : dialect_.exit_statements()) {
            const auto result = connection_.execute(stmt);
            if (!result.success) {
                utils::log::warn(std::format("{}: failed to leave diagnostic mode ({}): {}",
                    provider_to_string(dialect_.provider()), stmt, describe_error(result)));
            }
        }
    } catch (const std::exception& e) {
        utils::log::warn(std::format("Failed to leave diagnostic mode: {}", e.what()));
    }
}

} // namespace querywatch
