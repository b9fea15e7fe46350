#pragma once

#include <optional>
#include <string>

namespace querywatch {

/**
 * @brief Opaque handle to the host's logical owner of a command
 *
 * The monitor never inspects it beyond the capability interfaces below.
 */
class IDataContext {
public:
    virtual ~IDataContext() = default;
};

/**
 * @brief Capability: a data context that can hand out its connection string
 *
 * Host contexts opt in by implementing this alongside IDataContext.
 * Plan capture discovers it with std::dynamic_pointer_cast.
 */
class IConnectionStringSource {
public:
    virtual ~IConnectionStringSource() = default;

    /// nullopt (or empty) when the context has no usable connection string
    [[nodiscard]] virtual std::optional<std::string> connection_string() const = 0;
};

} // namespace querywatch
