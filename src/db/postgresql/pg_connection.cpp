#include "db/postgresql/pg_connection.hpp"
#include "core/database_provider.hpp"
#include "core/utils.hpp"
#include <cstdlib>
#include <format>
#include <memory>

namespace querywatch {

namespace {

struct PgResultDeleter {
    void operator()(PGresult* res) const { PQclear(res); }
};

using PgResultPtr = std::unique_ptr<PGresult, PgResultDeleter>;

/// libpq messages end with a newline (sometimes followed by DETAIL lines)
std::string first_line(const char* message) {
    if (!message) return {};
    std::string text(message);
    if (const auto nl = text.find('\n'); nl != std::string::npos) {
        text.resize(nl);
    }
    return text;
}

} // anonymous namespace

// ============================================================================
// PgConnection
// ============================================================================

PgConnection::PgConnection(PGconn* conn)
    : conn_(conn) {}

PgConnection::~PgConnection() {
    close();
}

DbResultSet PgConnection::execute(const std::string& sql) {
    if (!conn_) {
        DbResultSet result;
        result.error_message = "Connection is closed";
        return result;
    }

    PgResultPtr res(PQexec(conn_, sql.c_str()));
    if (!res) {
        return read_error(nullptr, conn_);
    }

    switch (PQresultStatus(res.get())) {
        case PGRES_TUPLES_OK:
            return read_rows(res.get());
        case PGRES_COMMAND_OK:
        case PGRES_EMPTY_QUERY:
            return read_command(res.get());
        default:
            return read_error(res.get(), conn_);
    }
}

bool PgConnection::is_connected() const {
    return conn_ != nullptr && PQstatus(conn_) == CONNECTION_OK;
}

bool PgConnection::set_query_timeout(uint32_t timeout_ms) {
    if (!conn_) {
        return false;
    }

    const PgResultPtr res(PQexec(conn_, std::format("SET statement_timeout = {}", timeout_ms).c_str()));
    return res && PQresultStatus(res.get()) == PGRES_COMMAND_OK;
}

void PgConnection::close() {
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

DbResultSet PgConnection::read_rows(PGresult* res) {
    DbResultSet result;
    result.success = true;
    result.has_rows = true;

    const int ncols = PQnfields(res);
    result.column_names.reserve(ncols);
    for (int i = 0; i < ncols; i++) {
        result.column_names.emplace_back(PQfname(res, i));
    }

    // EXPLAIN (FORMAT JSON) yields one row with one cell; replay may yield many
    const int nrows = PQntuples(res);
    result.rows.reserve(nrows);
    for (int i = 0; i < nrows; i++) {
        auto& row = result.rows.emplace_back();
        row.reserve(ncols);
        for (int j = 0; j < ncols; j++) {
            row.emplace_back(PQgetisnull(res, i, j) ? "" : PQgetvalue(res, i, j));
        }
    }

    return result;
}

DbResultSet PgConnection::read_command(PGresult* res) {
    DbResultSet result;
    result.success = true;

    if (const char* affected = PQcmdTuples(res); affected && *affected != '\0') {
        result.affected_rows = std::strtoull(affected, nullptr, 10);
    }
    return result;
}

DbResultSet PgConnection::read_error(PGresult* res, PGconn* conn) {
    DbResultSet result;
    if (res) {
        result.error_message = first_line(PQresultErrorMessage(res));
        if (const char* state = PQresultErrorField(res, PG_DIAG_SQLSTATE)) {
            result.error_code = state;
        }
    }
    if (result.error_message.empty()) {
        result.error_message = first_line(PQerrorMessage(conn));
    }
    return result;
}

// ============================================================================
// PgConnectionFactory
// ============================================================================

PgConnectionFactory::PgConnectionFactory(Options options)
    : options_(std::move(options)) {}

std::unique_ptr<IDbConnection> PgConnectionFactory::create(
    const std::string& connection_string) {

    const std::string timeout = std::to_string(options_.connect_timeout.count());

    // dbname is expanded last so settings in the string override the defaults
    const char* keywords[] = {"application_name", "connect_timeout", "dbname", nullptr};
    const char* values[] = {options_.application_name.c_str(), timeout.c_str(),
                            connection_string.c_str(), nullptr};

    PGconn* conn = PQconnectdbParams(keywords, values, /*expand_dbname=*/1);
    if (!conn) {
        utils::log::error("PostgreSQL: failed to allocate connection");
        return nullptr;
    }

    if (PQstatus(conn) != CONNECTION_OK) {
        utils::log::error(std::format("PostgreSQL: connection to '{}' failed: {}",
                                      redact_connection_string(connection_string),
                                      first_line(PQerrorMessage(conn))));
        PQfinish(conn);
        return nullptr;
    }

    return std::make_unique<PgConnection>(conn);
}

} // namespace querywatch
