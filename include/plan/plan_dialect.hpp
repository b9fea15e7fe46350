#pragma once

#include "core/types.hpp"
#include "db/idb_connection.hpp"
#include "plan/sql_literal.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace querywatch {

/**
 * @brief Provider-specific protocol for asking a database for a plan
 *
 * enter_statements() switch a connection into diagnostic mode,
 * plan_query() wraps the literal SQL, exit_statements() restore the
 * connection. Exit statements must be safe to run after a partial enter.
 */
class IPlanDialect {
public:
    virtual ~IPlanDialect() = default;

    [[nodiscard]] virtual DatabaseProvider provider() const = 0;
    [[nodiscard]] virtual PlanFormat format() const = 0;
    [[nodiscard]] virtual LiteralStyle literal_style() const { return LiteralStyle::GENERIC; }

    [[nodiscard]] virtual std::vector<std::string> enter_statements(uint32_t timeout_ms) const = 0;
    [[nodiscard]] virtual std::string plan_query(const std::string& literal_sql) const = 0;
    [[nodiscard]] virtual std::vector<std::string> exit_statements() const = 0;
};

/// SET SHOWPLAN_XML ON: the server returns the estimated plan instead of executing
class SqlServerPlanDialect : public IPlanDialect {
public:
    DatabaseProvider provider() const override { return DatabaseProvider::SQL_SERVER; }
    PlanFormat format() const override { return PlanFormat::XML; }
    std::vector<std::string> enter_statements(uint32_t timeout_ms) const override;
    std::string plan_query(const std::string& literal_sql) const override;
    std::vector<std::string> exit_statements() const override;
};

/// EXPLAIN (FORMAT JSON) inside a read-only transaction that is rolled back
class PostgresPlanDialect : public IPlanDialect {
public:
    DatabaseProvider provider() const override { return DatabaseProvider::POSTGRESQL; }
    PlanFormat format() const override { return PlanFormat::JSON; }
    LiteralStyle literal_style() const override { return LiteralStyle::POSTGRESQL; }
    std::vector<std::string> enter_statements(uint32_t timeout_ms) const override;
    std::string plan_query(const std::string& literal_sql) const override;
    std::vector<std::string> exit_statements() const override;
};

/// EXPLAIN FORMAT=JSON inside a read-only transaction with max_execution_time
class MysqlPlanDialect : public IPlanDialect {
public:
    DatabaseProvider provider() const override { return DatabaseProvider::MYSQL; }
    PlanFormat format() const override { return PlanFormat::JSON; }
    std::vector<std::string> enter_statements(uint32_t timeout_ms) const override;
    std::string plan_query(const std::string& literal_sql) const override;
    std::vector<std::string> exit_statements() const override;
};

/// @return nullptr for providers without plan support
[[nodiscard]] std::unique_ptr<IPlanDialect> make_plan_dialect(DatabaseProvider provider);

/**
 * @brief Keeps a connection in diagnostic mode for the guard's lifetime
 *
 * The exit statements run from the destructor whenever enter() was
 * attempted, including after a partial enter or a failed plan query,
 * provided the connection is still connected. Exit failures are logged
 * and never propagate.
 */
class DiagnosticModeGuard {
public:
    DiagnosticModeGuard(IDbConnection& connection, const IPlanDialect& dialect)
        : connection_(connection), dialect_(dialect) {}

    ~DiagnosticModeGuard() { exit(); }

    DiagnosticModeGuard(const DiagnosticModeGuard&) = delete;
    DiagnosticModeGuard& operator=(const DiagnosticModeGuard&) = delete;

    /// @return false as soon as one enter statement fails
    [[nodiscard]] bool enter(uint32_t timeout_ms);

    /// Idempotent
    void exit() noexcept;

    [[nodiscard]] bool active() const { return active_; }

private:
    IDbConnection& connection_;
    const IPlanDialect& dialect_;
    bool active_ = false;
};

} // namespace querywatch
