#include "core/operation_tracker.hpp"
#include "core/utils.hpp"

#include <format>

namespace querywatch {

// ============================================================================
// Shard
// ============================================================================

bool OperationTracker::Shard::insert(TrackedOperation op) {
    const CorrelationKey key = op.key;
    std::lock_guard<std::mutex> lock(mutex_);
    const auto [it, inserted] = ops_.try_emplace(key, std::move(op));
    if (!inserted) {
        it->second = std::move(op);
    }
    return !inserted;
}

std::optional<TrackedOperation> OperationTracker::Shard::remove(const CorrelationKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = ops_.find(key);
    if (it == ops_.end()) {
        return std::nullopt;
    }
    std::optional<TrackedOperation> op(std::move(it->second));
    ops_.erase(it);
    return op;
}

size_t OperationTracker::Shard::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ops_.size();
}

// ============================================================================
// OperationTracker
// ============================================================================

OperationTracker::OperationTracker(const Config& config,
                                   std::shared_ptr<const StackTraceFilter> stack_filter)
    : config_(config),
      stack_filter_(std::move(stack_filter)) {

    if (config_.num_shards == 0) {
        config_.num_shards = 16;
    }

    shards_.reserve(config_.num_shards);
    for (size_t i = 0; i < config_.num_shards; ++i) {
        shards_.push_back(std::make_unique<Shard>());
    }
}

std::string OperationTracker::start(const CorrelationKey& key,
                                    std::string command_text,
                                    ParameterMap parameters,
                                    std::string context_tag,
                                    std::shared_ptr<IDbConnection> connection,
                                    std::shared_ptr<IDataContext> data_context,
                                    bool capture_stack) noexcept {
    try {
        TrackedOperation op;
        op.operation_id = utils::generate_uuid();
        op.key = key;
        op.command_text = std::move(command_text);
        op.parameters = std::move(parameters);
        op.context_tag = std::move(context_tag);
        op.connection = std::move(connection);
        op.data_context = std::move(data_context);

        if (capture_stack && stack_filter_) {
            auto lines = stack_filter_->capture(config_.max_stack_lines);
            if (!lines.empty()) {
                op.stack_trace = std::move(lines);
            }
        }

        // Restart the timer so stack capture is not billed to the command
        op.timer.reset();

        std::string operation_id = op.operation_id;
        if (shard_for(key).insert(std::move(op))) {
            replaced_.fetch_add(1, std::memory_order_relaxed);
            utils::log::warn(std::format(
                "Operation tracker: replaced stale entry for connection {} command {}",
                key.connection_id, key.command_id));
        }

        started_.fetch_add(1, std::memory_order_relaxed);
        return operation_id;
    } catch (const std::exception& e) {
        faults_.fetch_add(1, std::memory_order_relaxed);
        utils::log::error(std::format("Operation tracker: failed to start tracking: {}", e.what()));
        return {};
    }
}

std::optional<TrackedOperation> OperationTracker::complete(const CorrelationKey& key) noexcept {
    try {
        auto op = shard_for(key).remove(key);
        if (!op) {
            misses_.fetch_add(1, std::memory_order_relaxed);
            utils::log::debug(std::format(
                "Operation tracker: no active operation for connection {} command {}",
                key.connection_id, key.command_id));
            return std::nullopt;
        }

        op->mark_completed();
        completed_.fetch_add(1, std::memory_order_relaxed);
        return op;
    } catch (const std::exception& e) {
        faults_.fetch_add(1, std::memory_order_relaxed);
        utils::log::error(std::format("Operation tracker: failed to complete tracking: {}", e.what()));
        return std::nullopt;
    }
}

size_t OperationTracker::active_count() const {
    size_t total = 0;
    for (const auto& shard : shards_) {
        total += shard->size();
    }
    return total;
}

OperationTracker::Stats OperationTracker::get_stats() const {
    return Stats{
        .started = started_.load(std::memory_order_relaxed),
        .completed = completed_.load(std::memory_order_relaxed),
        .misses = misses_.load(std::memory_order_relaxed),
        .replaced = replaced_.load(std::memory_order_relaxed),
        .faults = faults_.load(std::memory_order_relaxed),
        .active = active_count()
    };
}

} // namespace querywatch
