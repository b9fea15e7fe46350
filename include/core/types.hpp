#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace querywatch {

// ============================================================================
// Correlation Key
// ============================================================================

/**
 * @brief Identifies one in-flight database command
 *
 * Both parts are opaque identifiers supplied by the host's command hook.
 * Unique only among concurrently active commands.
 */
struct CorrelationKey {
    std::string connection_id;
    std::string command_id;

    [[nodiscard]] bool operator==(const CorrelationKey&) const = default;
};

struct CorrelationKeyHash {
    [[nodiscard]] size_t operator()(const CorrelationKey& key) const noexcept {
        const size_t h1 = std::hash<std::string>{}(key.connection_id);
        const size_t h2 = std::hash<std::string>{}(key.command_id);
        return h1 ^ (h2 + 0x9E3779B97F4A7C15ULL + (h1 << 6) + (h1 >> 2));
    }
};

// ============================================================================
// Parameter Values
// ============================================================================

/// Exact numeric value kept in its invariant textual form (e.g. "12.50")
struct Decimal {
    std::string value;
    [[nodiscard]] bool operator==(const Decimal&) const = default;
};

/// UUID in canonical textual form
struct Uuid {
    std::string value;
    [[nodiscard]] bool operator==(const Uuid&) const = default;
};

/// Date/time with an explicit UTC offset
struct DateTimeOffset {
    std::chrono::system_clock::time_point local_time;
    std::chrono::minutes offset{0};
    [[nodiscard]] bool operator==(const DateTimeOffset&) const = default;
};

using Bytes = std::vector<uint8_t>;
using TimePoint = std::chrono::system_clock::time_point;
using TimeSpan = std::chrono::microseconds;

/**
 * @brief One bound parameter value as snapshotted at command start
 *
 * std::monostate represents SQL NULL.
 */
using ParameterValue = std::variant<
    std::monostate,
    bool,
    int64_t,
    uint64_t,
    double,
    Decimal,
    std::string,
    char,
    TimePoint,
    DateTimeOffset,
    TimeSpan,
    Uuid,
    Bytes>;

/// Parameter name -> value; ordered for deterministic reporting
using ParameterMap = std::map<std::string, ParameterValue>;

[[nodiscard]] inline bool is_null(const ParameterValue& v) {
    return std::holds_alternative<std::monostate>(v);
}

// ============================================================================
// Execution Plan Model
// ============================================================================

enum class DatabaseProvider {
    AUTO,
    SQL_SERVER,
    POSTGRESQL,
    MYSQL,
    ORACLE,
    SQLITE,
    OTHER,
    UNKNOWN
};

enum class PlanFormat {
    JSON,
    XML,
    TEXT,
    UNKNOWN
};

struct ExecutionPlan {
    DatabaseProvider provider = DatabaseProvider::UNKNOWN;
    PlanFormat format = PlanFormat::UNKNOWN;
    std::string content;
};

} // namespace querywatch
