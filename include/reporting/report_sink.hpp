#pragma once

#include "core/cancellation.hpp"
#include "core/slow_query_report.hpp"

#include <string>

namespace querywatch {

/**
 * @brief Destination for slow-query reports
 *
 * report() returns true when the report was delivered or intentionally
 * skipped (e.g. reporting disabled for this environment) and false when
 * delivery failed. Implementations may throw; callers isolate failures.
 */
class IReportSink {
public:
    virtual ~IReportSink() = default;

    [[nodiscard]] virtual bool report(const SlowQueryReport& report,
                                      const CancellationToken& token) = 0;

    /// Human-readable sink name for logging (e.g. "http:https://api.example.com/v1")
    [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace querywatch
