#include "config/config_loader.hpp"
#include "core/database_provider.hpp"
#include "core/monitor_builder.hpp"
#include "core/utils.hpp"
#include "db/postgresql/pg_connection.hpp"

#ifdef ENABLE_MYSQL
#include "db/mysql/mysql_connection.hpp"
#endif

#include <atomic>
#include <csignal>
#include <format>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

using namespace querywatch;

namespace {

std::atomic<bool> g_stop_requested{false};

void signal_handler(int /*signal*/) {
    g_stop_requested.store(true);
}

/**
 * @brief Split a script into statements on ';' outside quotes and comments
 */
std::vector<std::string> split_statements(const std::string& script) {
    std::vector<std::string> statements;
    std::string current;

    auto flush = [&] {
        auto stmt = utils::trim(current);
        if (!stmt.empty()) statements.push_back(std::move(stmt));
        current.clear();
    };

    size_t i = 0;
    while (i < script.size()) {
        const char c = script[i];
        if (c == '\'' || c == '"') {
            const size_t close = script.find(c, i + 1);
            const size_t end = (close == std::string::npos) ? script.size() : close + 1;
            current.append(script, i, end - i);
            i = end;
        } else if (c == '-' && i + 1 < script.size() && script[i + 1] == '-') {
            const size_t eol = script.find('\n', i);
            i = (eol == std::string::npos) ? script.size() : eol + 1;
            current += '\n';
        } else if (c == '/' && i + 1 < script.size() && script[i + 1] == '*') {
            const size_t close = script.find("*/", i + 2);
            i = (close == std::string::npos) ? script.size() : close + 2;
            current += ' ';
        } else if (c == ';') {
            flush();
            ++i;
        } else {
            current += c;
            ++i;
        }
    }
    flush();
    return statements;
}

std::shared_ptr<IConnectionFactory> make_factory(DatabaseProvider provider) {
#ifdef ENABLE_MYSQL
    if (provider == DatabaseProvider::MYSQL) {
        return std::make_shared<MysqlConnectionFactory>();
    }
#endif
    if (provider != DatabaseProvider::POSTGRESQL) {
        utils::log::warn(std::format("Provider {} has no driver, using PostgreSQL",
                                     provider_to_string(provider)));
    }
    return std::make_shared<PgConnectionFactory>();
}

void print_stats(const QueryMonitor::Stats& stats) {
    utils::log::info(std::format(
        "Commands: started={} completed={} misses={} replaced={}",
        stats.tracker.started, stats.tracker.completed, stats.tracker.misses,
        stats.tracker.replaced));
    utils::log::info(std::format(
        "Slow queries: {} of {} evaluated, enqueued={} dropped={}",
        stats.evaluator.slow, stats.evaluator.evaluated, stats.enqueued, stats.queue_dropped));
    utils::log::info(std::format(
        "Analysis: processed={} failed={} batches={}",
        stats.worker.processed, stats.worker.failed, stats.worker.batches));
    utils::log::info(std::format(
        "Execution plans: attempts={} captured={} failed={} no_strategy={}",
        stats.plan.attempts, stats.plan.captured, stats.plan.failed, stats.plan.no_strategy));
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 3) {
        std::cerr << std::format("Usage: {} <config.toml> <sql-file>\n", argv[0]);
        return 2;
    }

    try {
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        const std::string config_file = argv[1];
        const std::string sql_file = argv[2];

        // ---- Configuration ----
        auto result = ConfigLoader::load_from_file(config_file);
        if (!result.success) {
            utils::log::error(result.error_message);
            return 1;
        }
        const auto& config = result.config;

        if (const auto level = utils::log::parse_level(config.logging.level)) {
            utils::log::set_level(*level);
        }
        utils::log::info(std::format("Loaded configuration from {}", config_file));

        const std::string& conn_str = config.execution_plan.connection_string;
        if (conn_str.empty()) {
            utils::log::error("execution_plan.connection_string is required for replay");
            return 1;
        }

        auto provider = parse_provider(config.execution_plan.provider).value_or(DatabaseProvider::AUTO);
        if (provider == DatabaseProvider::AUTO) {
            provider = detect_provider(conn_str);
        }
        auto factory = make_factory(provider);

        // ---- Script ----
        std::ifstream in(sql_file);
        if (!in.is_open()) {
            utils::log::error(std::format("Cannot open SQL file: {}", sql_file));
            return 1;
        }
        std::stringstream buffer;
        buffer << in.rdbuf();
        const auto statements = split_statements(buffer.str());
        utils::log::info(std::format("Replaying {} statement(s) from {}", statements.size(), sql_file));

        // ---- Database ----
        // The replay connection stays on this thread; plan capture opens its own
        auto connection = factory->create(conn_str);
        if (!connection) {
            utils::log::error(std::format("Failed to connect to {}", redact_connection_string(conn_str)));
            return 1;
        }
        utils::log::info(std::format("Connected to {} ({})", redact_connection_string(conn_str),
                                     provider_to_string(factory->provider())));

        // ---- Monitor ----
        auto monitor = MonitorBuilder::from_config(config, factory).build();
        monitor->start();

        const std::string connection_id = utils::generate_uuid();
        size_t index = 0;
        for (const auto& sql : statements) {
            if (g_stop_requested.load()) {
                utils::log::info("Stop requested, skipping remaining statements");
                break;
            }

            const std::string command_id = std::to_string(++index);
            monitor->on_command_starting(CommandStartEvent{
                .connection_id = connection_id,
                .command_id = command_id,
                .command_text = sql,
                .parameters = {},
                .context_tag = "replay",
                .connection = nullptr,
                .data_context = nullptr
            });

            const auto rs = connection->execute(sql);

            monitor->on_command_completed(connection_id, command_id);

            if (!rs.success) {
                utils::log::warn(std::format("Statement {} failed: {}", command_id, describe_error(rs)));
            }
        }

        connection->close();

        monitor->shutdown();
        print_stats(monitor->get_stats());

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return 1;
    }

    return 0;
}
