#pragma once

#include "core/slow_query_report.hpp"
#include "core/tracked_operation.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace querywatch {

/**
 * @brief Classifies completed operations against the slow-query threshold
 *
 * Non-slow operations are dropped without allocating. Slow ones are frozen
 * into a SlowQueryReport that shares nothing with the tracker.
 */
class ThresholdEvaluator {
public:
    struct Config {
        double threshold_ms = 1000.0;
        std::string environment = "Production";
        std::optional<std::string> application_name;
        std::optional<std::string> version;
    };

    ThresholdEvaluator() : ThresholdEvaluator(Config{}) {}
    explicit ThresholdEvaluator(const Config& config);

    /// Elapsed equal to the threshold counts as slow
    [[nodiscard]] bool is_slow(std::chrono::microseconds elapsed) const;

    [[nodiscard]] bool is_slow(double elapsed_ms) const {
        return elapsed_ms >= config_.threshold_ms;
    }

    /**
     * @brief Freeze a slow operation into a report
     * @return nullopt when the operation is below the threshold
     */
    [[nodiscard]] std::optional<SlowQueryReport> evaluate(TrackedOperation&& op);

    [[nodiscard]] double threshold_ms() const { return config_.threshold_ms; }

    struct Stats {
        uint64_t evaluated;
        uint64_t slow;
    };

    [[nodiscard]] Stats get_stats() const {
        return Stats{
            .evaluated = evaluated_.load(std::memory_order_relaxed),
            .slow = slow_.load(std::memory_order_relaxed)
        };
    }

private:
    static constexpr size_t kLogQueryLength = 200;

    Config config_;
    std::atomic<uint64_t> evaluated_{0};
    std::atomic<uint64_t> slow_{0};
};

} // namespace querywatch
