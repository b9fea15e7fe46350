#pragma once

#include "db/idb_connection.hpp"
#include "db/iconnection_factory.hpp"
#include <libpq-fe.h>
#include <chrono>
#include <string>

namespace querywatch {

/**
 * @brief libpq connection used for EXPLAIN and statement replay
 *
 * Takes ownership of the PGconn*. Statements run through the simple query
 * protocol (PQexec), so a single call may carry several statements; only the
 * last result is returned.
 */
class PgConnection : public IDbConnection {
public:
    explicit PgConnection(PGconn* conn);
    ~PgConnection() override;

    PgConnection(const PgConnection&) = delete;
    PgConnection& operator=(const PgConnection&) = delete;

    DbResultSet execute(const std::string& sql) override;
    bool is_connected() const override;
    bool set_query_timeout(uint32_t timeout_ms) override;
    DatabaseProvider provider() const override { return DatabaseProvider::POSTGRESQL; }
    void close() override;

private:
    static DbResultSet read_rows(PGresult* res);
    static DbResultSet read_command(PGresult* res);
    static DbResultSet read_error(PGresult* res, PGconn* conn);

    PGconn* conn_;
};

/**
 * @brief Opens PgConnection instances with PQconnectdbParams
 *
 * Accepts keyword/value ("host=... dbname=...") and URI connection strings.
 * application_name and connect_timeout are applied as defaults; values in
 * the connection string itself take precedence.
 */
class PgConnectionFactory : public IConnectionFactory {
public:
    struct Options {
        std::string application_name = "querywatch";
        std::chrono::seconds connect_timeout{5};
    };

    PgConnectionFactory() : PgConnectionFactory(Options{}) {}
    explicit PgConnectionFactory(Options options);

    std::unique_ptr<IDbConnection> create(const std::string& connection_string) override;
    DatabaseProvider provider() const override { return DatabaseProvider::POSTGRESQL; }

private:
    Options options_;
};

} // namespace querywatch
