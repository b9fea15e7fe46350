#pragma once

#include "core/data_context.hpp"
#include "core/slow_query_report.hpp"

#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace querywatch {

/// Where plan capture gets its connection from, in priority order
enum class ConnectionStrategy {
    NONE,
    CONFIGURED_STRING,   ///< execution_plan.connection_string (new connection)
    OPEN_CONNECTION,     ///< The command's own still-open connection (reused)
    DATA_CONTEXT,        ///< IConnectionStringSource on the data context (new connection)
    FALLBACK_RESOLVER    ///< Host-supplied callback (new connection)
};

[[nodiscard]] inline std::string_view strategy_to_string(ConnectionStrategy strategy) {
    switch (strategy) {
        case ConnectionStrategy::CONFIGURED_STRING: return "configured";
        case ConnectionStrategy::OPEN_CONNECTION:   return "open_connection";
        case ConnectionStrategy::DATA_CONTEXT:      return "data_context";
        case ConnectionStrategy::FALLBACK_RESOLVER: return "fallback_resolver";
        default:                                    return "none";
    }
}

/**
 * @brief Last-resort connection string lookup supplied by the host
 *
 * Called on the analysis worker thread. Return nullopt (or empty) when
 * no connection string applies to the report.
 */
using ConnectionStringResolver =
    std::function<std::optional<std::string>(const SlowQueryReport&)>;

struct ConnectionSelection {
    ConnectionStrategy strategy = ConnectionStrategy::NONE;
    std::string connection_string;   ///< Empty for OPEN_CONNECTION
};

} // namespace querywatch
