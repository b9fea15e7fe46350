#pragma once

#include "core/cancellation.hpp"
#include "core/slow_query_report.hpp"
#include "db/iconnection_factory.hpp"
#include "plan/connection_source.hpp"
#include "plan/plan_dialect.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace querywatch {

/**
 * @brief Captures an estimated execution plan for a slow query
 *
 * Per attempt:
 * 1. Select a connection strategy (configured string, open connection,
 *    data context, fallback resolver)
 * 2. Open a connection if the strategy needs one (closed on every exit path)
 * 3. Resolve the provider and its dialect
 * 4. Inline parameters as literals
 * 5. Enter diagnostic mode, run the plan query, read row 0 column 0
 * 6. Leave diagnostic mode unconditionally (DiagnosticModeGuard)
 *
 * Any failure yields nullopt and a log line; capture() never throws.
 * Runs on the analysis worker thread only.
 */
class PlanCapture {
public:
    struct Config {
        bool enabled = false;
        std::chrono::seconds timeout{30};
        std::string connection_string;
        DatabaseProvider provider = DatabaseProvider::AUTO;
        ConnectionStringResolver fallback_resolver;
    };

    /**
     * @param factory  Opens connections for the string-based strategies;
     *                 may be null when only open connections are reused
     */
    PlanCapture(const Config& config, std::shared_ptr<IConnectionFactory> factory);

    [[nodiscard]] std::optional<ExecutionPlan> capture(const AnalysisItem& item,
                                                       const CancellationToken& token) noexcept;

    /// Strategy that capture() would use for this item
    [[nodiscard]] ConnectionSelection select_strategy(const AnalysisItem& item) const;

    [[nodiscard]] bool enabled() const { return config_.enabled; }

    struct Stats {
        uint64_t attempts;
        uint64_t captured;
        uint64_t failed;
        uint64_t no_strategy;
    };

    [[nodiscard]] Stats get_stats() const {
        return Stats{
            .attempts = attempts_.load(std::memory_order_relaxed),
            .captured = captured_.load(std::memory_order_relaxed),
            .failed = failed_.load(std::memory_order_relaxed),
            .no_strategy = no_strategy_.load(std::memory_order_relaxed)
        };
    }

private:
    std::optional<ExecutionPlan> capture_impl(const AnalysisItem& item,
                                              const CancellationToken& token);

    DatabaseProvider resolve_provider(const IDbConnection& connection,
                                      const std::string& connection_string) const;

    std::optional<ExecutionPlan> fail(const std::string& query_id, const std::string& reason);

    Config config_;
    std::shared_ptr<IConnectionFactory> factory_;

    std::atomic<uint64_t> attempts_{0};
    std::atomic<uint64_t> captured_{0};
    std::atomic<uint64_t> failed_{0};
    std::atomic<uint64_t> no_strategy_{0};
};

} // namespace querywatch
