#pragma once

#include "db/idb_connection.hpp"
#include <memory>
#include <string>

namespace querywatch {

/**
 * @brief Opens connections for plan capture and the replay tool
 *
 * Connections returned here are owned by the caller, who closes them when
 * done. Host connections attached to a command never go through a factory.
 */
class IConnectionFactory {
public:
    virtual ~IConnectionFactory() = default;

    /**
     * @param connection_string Driver-specific connection string
     * @return Open connection, or nullptr if the connection attempt failed
     *         (the reason is logged by the factory)
     */
    [[nodiscard]] virtual std::unique_ptr<IDbConnection> create(
        const std::string& connection_string) = 0;

    /// Flavour of every connection this factory opens
    [[nodiscard]] virtual DatabaseProvider provider() const = 0;
};

} // namespace querywatch
