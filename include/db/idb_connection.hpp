#pragma once

#include "core/types.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace querywatch {

/**
 * @brief Result set from a statement execution
 *
 * Returned by IDbConnection::execute().
 * Owns the result data (copied from native result handles).
 */
struct DbResultSet {
    bool success = false;
    std::string error_message;
    std::string error_code;      ///< SQLSTATE or vendor error number when known

    // For SELECT / EXPLAIN
    std::vector<std::string> column_names;
    std::vector<std::vector<std::string>> rows;

    // For DML
    uint64_t affected_rows = 0;

    // SELECT vs DML/DDL/SET
    bool has_rows = false;
};

/// Error text with the driver's code appended when known: "msg (error code 42P01)"
[[nodiscard]] inline std::string describe_error(const DbResultSet& result) {
    if (result.error_code.empty()) return result.error_message;
    return result.error_message + " (error code " + result.error_code + ")";
}

/**
 * @brief Abstract database connection
 *
 * Wraps a single native connection handle (PGconn*, MYSQL*, or a host
 * adapter). Implementations are not thread-safe. A connection attached to
 * a tracked command by the host may later be reused by the analysis worker
 * for plan capture, so host adapters must tolerate use from that thread.
 *
 * Does NOT expose native handles to prevent leaking backend types.
 */
class IDbConnection {
public:
    virtual ~IDbConnection() = default;

    /**
     * @brief Execute a SQL statement
     * @param sql SQL text
     * @return Result set with rows or affected count; success=false on error
     * @throws std::runtime_error only for transport-level failures an
     *         implementation cannot express in the result
     */
    [[nodiscard]] virtual DbResultSet execute(const std::string& sql) = 0;

    /**
     * @brief Check if connection is in a valid state (connected)
     */
    [[nodiscard]] virtual bool is_connected() const = 0;

    /**
     * @brief Set query timeout for subsequent statements
     * @param timeout_ms Timeout in milliseconds (0 = no timeout)
     * @return true if timeout was set successfully
     *
     * PostgreSQL: SET statement_timeout = N
     * MySQL: SET SESSION max_execution_time = N
     */
    virtual bool set_query_timeout(uint32_t timeout_ms) = 0;

    /**
     * @brief Database flavour behind this connection (UNKNOWN if not known)
     */
    [[nodiscard]] virtual DatabaseProvider provider() const = 0;

    /**
     * @brief Close the connection and release resources
     */
    virtual void close() = 0;
};

} // namespace querywatch
