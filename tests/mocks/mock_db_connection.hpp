#pragma once

#include "core/data_context.hpp"
#include "db/iconnection_factory.hpp"
#include "db/idb_connection.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace querywatch::testing {

/**
 * @brief State shared between a mock connection and the test
 *
 * Outlives the connection, so tests can inspect what happened to
 * connections that plan capture opened and destroyed itself.
 */
struct MockConnectionState {
    mutable std::mutex mutex;
    std::vector<std::string> statements;
    std::string fail_on;                  ///< Statements containing this fail
    std::string throw_on;                 ///< Statements containing this throw
    std::string plan_content = R"([{"Plan": {"Node Type": "Seq Scan"}}])";
    bool connected = true;
    bool closed = false;
    std::optional<uint32_t> query_timeout_ms;

    [[nodiscard]] std::vector<std::string> executed() const {
        std::lock_guard<std::mutex> lock(mutex);
        return statements;
    }

    [[nodiscard]] bool was_executed(const std::string& needle) const {
        std::lock_guard<std::mutex> lock(mutex);
        for (const auto& s : statements) {
            if (s.find(needle) != std::string::npos) return true;
        }
        return false;
    }

    [[nodiscard]] bool is_closed() const {
        std::lock_guard<std::mutex> lock(mutex);
        return closed;
    }
};

/**
 * @brief Mock connection with a statement log and fault injection
 *
 * Session statements (SET, BEGIN, START, ROLLBACK) succeed without rows.
 * Any other statement returns plan_content as a single-cell result.
 */
class MockDbConnection : public IDbConnection {
public:
    explicit MockDbConnection(DatabaseProvider provider = DatabaseProvider::POSTGRESQL,
                              std::shared_ptr<MockConnectionState> state =
                                  std::make_shared<MockConnectionState>())
        : provider_(provider), state_(std::move(state)) {}

    [[nodiscard]] DbResultSet execute(const std::string& sql) override {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->statements.push_back(sql);

        if (!state_->throw_on.empty() && sql.find(state_->throw_on) != std::string::npos) {
            throw std::runtime_error("Mock transport failure");
        }

        DbResultSet result;
        if (!state_->fail_on.empty() && sql.find(state_->fail_on) != std::string::npos) {
            result.success = false;
            result.error_message = "Mock failure: " + sql;
            return result;
        }

        result.success = true;
        if (is_session_statement(sql)) {
            return result;
        }
        result.has_rows = true;
        result.column_names = {"QUERY PLAN"};
        result.rows = {{state_->plan_content}};
        return result;
    }

    [[nodiscard]] bool is_connected() const override {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->connected && !state_->closed;
    }

    bool set_query_timeout(uint32_t timeout_ms) override {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->query_timeout_ms = timeout_ms;
        return true;
    }

    [[nodiscard]] DatabaseProvider provider() const override { return provider_; }

    void close() override {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->closed = true;
    }

    [[nodiscard]] const std::shared_ptr<MockConnectionState>& state() const { return state_; }

private:
    static bool is_session_statement(const std::string& sql) {
        return sql.starts_with("SET ") || sql.starts_with("BEGIN") ||
               sql.starts_with("START ") || sql.starts_with("ROLLBACK");
    }

    DatabaseProvider provider_;
    std::shared_ptr<MockConnectionState> state_;
};

/**
 * @brief Factory handing out mock connections that share one state
 */
class MockConnectionFactory : public IConnectionFactory {
public:
    explicit MockConnectionFactory(DatabaseProvider provider = DatabaseProvider::POSTGRESQL)
        : provider_(provider) {}

    [[nodiscard]] std::unique_ptr<IDbConnection> create(
        const std::string& connection_string) override {
        create_count_.fetch_add(1, std::memory_order_relaxed);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            connection_strings_.push_back(connection_string);
        }
        if (fail_create_) {
            return nullptr;
        }
        return std::make_unique<MockDbConnection>(provider_, state_);
    }

    [[nodiscard]] DatabaseProvider provider() const override { return provider_; }

    [[nodiscard]] uint64_t create_count() const {
        return create_count_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] std::vector<std::string> connection_strings() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return connection_strings_;
    }

    [[nodiscard]] const std::shared_ptr<MockConnectionState>& state() const { return state_; }

    void set_fail_create(bool v) { fail_create_ = v; }

private:
    DatabaseProvider provider_;
    std::shared_ptr<MockConnectionState> state_ = std::make_shared<MockConnectionState>();
    mutable std::mutex mutex_;
    std::vector<std::string> connection_strings_;
    std::atomic<uint64_t> create_count_{0};
    bool fail_create_ = false;
};

/// Host data context without any capability
class PlainDataContext : public IDataContext {};

/// Host data context that exposes its connection string
class ConnectionStringDataContext : public IDataContext, public IConnectionStringSource {
public:
    explicit ConnectionStringDataContext(std::optional<std::string> conn_str)
        : conn_str_(std::move(conn_str)) {}

    [[nodiscard]] std::optional<std::string> connection_string() const override {
        return conn_str_;
    }

private:
    std::optional<std::string> conn_str_;
};

} // namespace querywatch::testing
