#include "analysis/analysis_worker.hpp"
#include "core/utils.hpp"

#include <format>
#include <limits>

namespace querywatch {

// ============================================================================
// Construction / Destruction
// ============================================================================

AnalysisWorker::AnalysisWorker(const Config& config,
                               AnalysisQueue<AnalysisItem>& queue,
                               std::shared_ptr<PlanCapture> plan_capture,
                               std::shared_ptr<IReportSink> sink)
    : config_(config),
      queue_(queue),
      plan_capture_(std::move(plan_capture)),
      sink_(std::move(sink)) {
    if (config_.batch_size == 0) {
        config_.batch_size = 10;
    }
}

AnalysisWorker::~AnalysisWorker() {
    stop();
}

// ============================================================================
// Lifecycle
// ============================================================================

void AnalysisWorker::start() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (running_.load(std::memory_order_acquire)) {
        return;
    }
    if (worker_thread_.joinable()) {
        worker_thread_.join();
    }

    token_ = CancellationToken{};
    running_.store(true, std::memory_order_release);
    worker_thread_ = std::thread(&AnalysisWorker::worker_thread_func, this);

    utils::log::info(std::format("Analysis worker started (batch {}, poll {}ms)",
                                 config_.batch_size, config_.poll_interval.count()));
}

void AnalysisWorker::stop() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (running_.load(std::memory_order_acquire)) {
        {
            // Flip under the wait mutex so the wake-up cannot be missed
            std::lock_guard<std::mutex> wait_lock(wait_mutex_);
            running_.store(false, std::memory_order_release);
        }
        token_.cancel();
        wait_cv_.notify_all();
    }

    if (worker_thread_.joinable()) {
        worker_thread_.join();
        utils::log::info("Analysis worker stopped");
        return;
    }

    // Never started, or already stopped: deliver whatever is still queued
    std::vector<AnalysisItem> none;
    final_drain(none);
}

AnalysisWorker::Stats AnalysisWorker::get_stats() const {
    return Stats{
        .processed = processed_.load(std::memory_order_relaxed),
        .failed = failed_.load(std::memory_order_relaxed),
        .batches = batches_.load(std::memory_order_relaxed),
        .loop_faults = loop_faults_.load(std::memory_order_relaxed)
    };
}

// ============================================================================
// Background Thread
// ============================================================================

void AnalysisWorker::wait_for(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(wait_mutex_);
    wait_cv_.wait_for(lock, duration, [this] {
        return !running_.load(std::memory_order_acquire);
    });
}

void AnalysisWorker::worker_thread_func() {
    const CancellationToken token = token_;

    std::vector<AnalysisItem> batch;
    batch.reserve(config_.batch_size);

    // Items drained but not processed when stop() arrived mid-batch
    std::vector<AnalysisItem> leftovers;

    while (running_.load(std::memory_order_acquire)) {
        try {
            batch.clear();
            if (queue_.drain(batch, config_.batch_size) > 0) {
                batches_.fetch_add(1, std::memory_order_relaxed);

                size_t i = 0;
                for (; i < batch.size() && running_.load(std::memory_order_acquire); ++i) {
                    if (!process_item(batch[i], token)) {
                        leftovers.push_back(std::move(batch[i]));
                    }
                }
                for (; i < batch.size(); ++i) {
                    leftovers.push_back(std::move(batch[i]));
                }
                batch.clear();
            }

            wait_for(config_.poll_interval);
        } catch (const std::exception& e) {
            loop_faults_.fetch_add(1, std::memory_order_relaxed);
            utils::log::error(std::format("Analysis worker loop fault: {}", e.what()));
            wait_for(config_.fault_backoff);
        }
    }

    final_drain(leftovers);
}

void AnalysisWorker::final_drain(std::vector<AnalysisItem>& leftovers) {
    // Not cancelled: shutdown must not silently drop reports
    const CancellationToken token;
    size_t drained = 0;

    try {
        for (auto& item : leftovers) {
            process_item(item, token);
            ++drained;
        }
        leftovers.clear();

        std::vector<AnalysisItem> batch;
        while (queue_.drain(batch, std::numeric_limits<size_t>::max()) > 0) {
            for (auto& item : batch) {
                process_item(item, token);
                ++drained;
            }
            batch.clear();
        }
    } catch (const std::exception& e) {
        loop_faults_.fetch_add(1, std::memory_order_relaxed);
        utils::log::error(std::format("Analysis worker final drain fault: {}", e.what()));
    }

    if (drained > 0) {
        utils::log::info(std::format("Analysis worker drained {} pending item(s) on shutdown", drained));
    }
}

bool AnalysisWorker::process_item(AnalysisItem& item, const CancellationToken& token) {
    try {
        if (plan_capture_ && plan_capture_->enabled() && !item.report.execution_plan) {
            item.report.execution_plan = plan_capture_->capture(item, token);
        }

        if (token.is_cancelled()) {
            utils::log::debug(std::format("Slow query {} deferred to shutdown drain",
                                          item.report.query_id));
            return false;
        }

        // The report no longer needs host handles
        item.connection.reset();
        item.data_context.reset();

        if (sink_ && !sink_->report(item.report, token)) {
            if (token.is_cancelled()) {
                utils::log::debug(std::format("Slow query {} interrupted by stop, retrying on shutdown drain",
                                              item.report.query_id));
                return false;
            }
            failed_.fetch_add(1, std::memory_order_relaxed);
            utils::log::error(std::format("Failed to report slow query {}", item.report.query_id));
            return true;
        }
        processed_.fetch_add(1, std::memory_order_relaxed);
    } catch (const std::exception& e) {
        failed_.fetch_add(1, std::memory_order_relaxed);
        utils::log::error(std::format("Failed to process slow query {}: {}",
                                      item.report.query_id, e.what()));
    }

    item.connection.reset();
    item.data_context.reset();
    return true;
}

} // namespace querywatch
