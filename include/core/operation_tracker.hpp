#pragma once

#include "analysis/stack_trace_filter.hpp"
#include "core/tracked_operation.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace querywatch {

/**
 * @brief Registry of in-flight database commands keyed by CorrelationKey
 *
 * Sharding strategy:
 * - N shards (default: 16), each an unordered_map behind its own mutex
 * - Shard selected by CorrelationKeyHash % num_shards
 * - Locks are held only for the single insert or erase
 *
 * At most one operation is active per key. A start for a key that is
 * already active replaces the stale entry.
 *
 * Thread-safety: start() and complete() may be called from any number of
 * threads concurrently.
 */
class OperationTracker {
public:
    struct Config {
        size_t num_shards = 16;
        size_t max_stack_lines = 20;
    };

    /**
     * @param config  Shard count and stack depth
     * @param stack_filter  Optional; when null no stack traces are captured
     */
    explicit OperationTracker(const Config& config,
                              std::shared_ptr<const StackTraceFilter> stack_filter = nullptr);

    OperationTracker() : OperationTracker(Config{}) {}

    ~OperationTracker() = default;

    OperationTracker(const OperationTracker&) = delete;
    OperationTracker& operator=(const OperationTracker&) = delete;

    /**
     * @brief Begin tracking a command
     *
     * Stack capture (when requested) runs before any lock is taken.
     * Never throws; internal failures are logged.
     *
     * @return Generated operation id, or empty string if nothing was tracked
     */
    std::string start(const CorrelationKey& key,
                      std::string command_text,
                      ParameterMap parameters,
                      std::string context_tag,
                      std::shared_ptr<IDbConnection> connection,
                      std::shared_ptr<IDataContext> data_context,
                      bool capture_stack) noexcept;

    /**
     * @brief Stop tracking a command and stamp its elapsed time
     * @return The completed operation, or nullopt when the key is not active
     */
    [[nodiscard]] std::optional<TrackedOperation> complete(const CorrelationKey& key) noexcept;

    [[nodiscard]] size_t active_count() const;

    struct Stats {
        uint64_t started;
        uint64_t completed;
        uint64_t misses;       ///< complete() without a matching start
        uint64_t replaced;     ///< start() over a still-active key
        uint64_t faults;       ///< exceptions caught inside start/complete
        size_t active;
    };

    [[nodiscard]] Stats get_stats() const;

private:
    class Shard {
    public:
        Shard() = default;

        Shard(const Shard&) = delete;
        Shard& operator=(const Shard&) = delete;

        /// @return true if an existing entry was replaced
        bool insert(TrackedOperation op);
        std::optional<TrackedOperation> remove(const CorrelationKey& key);
        size_t size() const;

    private:
        mutable std::mutex mutex_;
        std::unordered_map<CorrelationKey, TrackedOperation, CorrelationKeyHash> ops_;
    };

    Shard& shard_for(const CorrelationKey& key) {
        return *shards_[CorrelationKeyHash{}(key) % shards_.size()];
    }

    Config config_;
    std::shared_ptr<const StackTraceFilter> stack_filter_;
    std::vector<std::unique_ptr<Shard>> shards_;

    std::atomic<uint64_t> started_{0};
    std::atomic<uint64_t> completed_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> replaced_{0};
    std::atomic<uint64_t> faults_{0};
};

} // namespace querywatch
