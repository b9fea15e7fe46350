#include "db/mysql/mysql_connection.hpp"
#include "core/utils.hpp"
#include <charconv>
#include <format>

namespace querywatch {

namespace {

unsigned int parse_port(std::string_view text, unsigned int fallback) {
    unsigned int port = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), port);
    if (ec != std::errc{} || ptr != text.data() + text.size() || port == 0 || port > 65535) {
        utils::log::warn(std::format("MySQL: invalid port '{}', using {}", text, fallback));
        return fallback;
    }
    return port;
}

void parse_uri(std::string_view sv, MysqlConnectionFactory::ConnParams& params) {
    const size_t at_pos = sv.rfind('@');
    if (at_pos != std::string_view::npos) {
        const std::string_view creds = sv.substr(0, at_pos);
        sv.remove_prefix(at_pos + 1);

        const size_t colon_pos = creds.find(':');
        if (colon_pos != std::string_view::npos) {
            params.user = std::string(creds.substr(0, colon_pos));
            params.password = std::string(creds.substr(colon_pos + 1));
        } else {
            params.user = std::string(creds);
        }
    }

    std::string_view host_port = sv;
    const size_t slash_pos = sv.find('/');
    if (slash_pos != std::string_view::npos) {
        host_port = sv.substr(0, slash_pos);
        std::string_view db = sv.substr(slash_pos + 1);
        if (const size_t q = db.find('?'); q != std::string_view::npos) {
            db = db.substr(0, q);
        }
        params.database = std::string(db);
    }

    const size_t colon_pos = host_port.find(':');
    if (colon_pos != std::string_view::npos) {
        params.host = std::string(host_port.substr(0, colon_pos));
        params.port = parse_port(host_port.substr(colon_pos + 1), params.port);
    } else if (!host_port.empty()) {
        params.host = std::string(host_port);
    }
}

void parse_key_values(std::string_view sv, MysqlConnectionFactory::ConnParams& params) {
    while (!sv.empty()) {
        const size_t semi = sv.find(';');
        const std::string_view pair = sv.substr(0, semi);
        sv.remove_prefix(semi == std::string_view::npos ? sv.size() : semi + 1);

        const size_t eq = pair.find('=');
        if (eq == std::string_view::npos) continue;

        const std::string key = utils::to_lower(utils::trim(std::string(pair.substr(0, eq))));
        const std::string value = utils::trim(std::string(pair.substr(eq + 1)));

        if (key == "server" || key == "host" || key == "data source") {
            params.host = value;
        } else if (key == "port") {
            params.port = parse_port(value, params.port);
        } else if (key == "database" || key == "initial catalog") {
            params.database = value;
        } else if (key == "uid" || key == "user" || key == "user id" || key == "username") {
            params.user = value;
        } else if (key == "pwd" || key == "password") {
            params.password = value;
        }
    }
}

} // anonymous namespace

// ============================================================================
// MysqlConnection
// ============================================================================

MysqlConnection::MysqlConnection(MYSQL* conn)
    : conn_(conn) {}

MysqlConnection::~MysqlConnection() {
    close();
}

DbResultSet MysqlConnection::execute(const std::string& sql) {
    DbResultSet result;

    if (!conn_) {
        result.error_message = "Connection is null";
        return result;
    }

    if (mysql_query(conn_, sql.c_str()) != 0) {
        result.error_message = mysql_error(conn_);
        result.error_code = std::to_string(mysql_errno(conn_));
        return result;
    }

    MYSQL_RES* res = mysql_store_result(conn_);
    if (res) {
        result = read_result_set(res);
        mysql_free_result(res);
        return result;
    }

    if (mysql_field_count(conn_) == 0) {
        return read_affected_rows();
    }

    // A result set was expected but could not be stored
    result.error_message = mysql_error(conn_);
    result.error_code = std::to_string(mysql_errno(conn_));
    return result;
}

DbResultSet MysqlConnection::read_result_set(MYSQL_RES* res) {
    DbResultSet result;
    result.success = true;
    result.has_rows = true;

    const unsigned int num_fields = mysql_num_fields(res);
    const MYSQL_FIELD* fields = mysql_fetch_fields(res);

    result.column_names.reserve(num_fields);
    for (unsigned int i = 0; i < num_fields; ++i) {
        result.column_names.emplace_back(fields[i].name);
    }

    MYSQL_ROW row;
    while ((row = mysql_fetch_row(res)) != nullptr) {
        const unsigned long* lengths = mysql_fetch_lengths(res);
        std::vector<std::string> values;
        values.reserve(num_fields);
        for (unsigned int i = 0; i < num_fields; ++i) {
            if (row[i]) {
                values.emplace_back(row[i], lengths[i]);
            } else {
                values.emplace_back();
            }
        }
        result.rows.push_back(std::move(values));
    }

    return result;
}

DbResultSet MysqlConnection::read_affected_rows() {
    DbResultSet result;
    result.success = true;
    result.affected_rows = static_cast<uint64_t>(mysql_affected_rows(conn_));
    return result;
}

bool MysqlConnection::is_connected() const {
    return conn_ != nullptr;
}

bool MysqlConnection::set_query_timeout(uint32_t timeout_ms) {
    if (!conn_) {
        return false;
    }

    // MySQL 5.7.8+; applies to read-only SELECT statements
    const std::string sql = std::format("SET SESSION max_execution_time = {}", timeout_ms);
    return mysql_query(conn_, sql.c_str()) == 0;
}

void MysqlConnection::close() {
    if (conn_) {
        mysql_close(conn_);
        conn_ = nullptr;
    }
}

// ============================================================================
// MysqlConnectionFactory
// ============================================================================

std::unique_ptr<IDbConnection> MysqlConnectionFactory::create(
    const std::string& connection_string) {

    const auto params = parse_connection_string(connection_string);

    MYSQL* conn = mysql_init(nullptr);
    if (!conn) {
        utils::log::error("mysql_init failed");
        return nullptr;
    }

    const auto timeout = static_cast<unsigned int>(options_.connect_timeout.count());
    mysql_options(conn, MYSQL_OPT_CONNECT_TIMEOUT, &timeout);
    mysql_options(conn, MYSQL_SET_CHARSET_NAME, "utf8mb4");
    mysql_options4(conn, MYSQL_OPT_CONNECT_ATTR_ADD, "program_name", options_.program_name.c_str());

    if (!mysql_real_connect(conn, params.host.c_str(), params.user.c_str(),
                            params.password.c_str(), params.database.c_str(),
                            params.port, nullptr, 0)) {
        utils::log::error(std::format("MySQL connection to {}:{} failed: {}",
                                      params.host, params.port, mysql_error(conn)));
        mysql_close(conn);
        return nullptr;
    }

    return std::make_unique<MysqlConnection>(conn);
}

MysqlConnectionFactory::ConnParams MysqlConnectionFactory::parse_connection_string(
    std::string_view conn_str) {

    ConnParams params;

    if (conn_str.starts_with("mysql://")) {
        parse_uri(conn_str.substr(8), params);
    } else if (conn_str.starts_with("mariadb://")) {
        parse_uri(conn_str.substr(10), params);
    } else {
        parse_key_values(conn_str, params);
    }

    return params;
}

} // namespace querywatch
