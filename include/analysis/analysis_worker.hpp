#pragma once

#include "analysis/analysis_queue.hpp"
#include "core/cancellation.hpp"
#include "core/slow_query_report.hpp"
#include "plan/plan_capture.hpp"
#include "reporting/report_sink.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace querywatch {

/**
 * @brief Background consumer of the analysis queue
 *
 * One dedicated thread drains up to batch_size items per pass, processes
 * them in FIFO order (optional plan capture, then the sink), and waits
 * poll_interval before the next pass.
 *
 *   [Thread 1] --push()--> [AnalysisQueue] --drain()--> [Worker] --> plan capture --> sink
 *   [Thread N] --push()-->
 *
 * A failing item is logged and skipped. A fault in the loop itself backs
 * off for fault_backoff before retrying.
 *
 * stop() cancels the token handed to in-flight work, wakes the thread,
 * and waits for a final unbounded drain. Items handled by the final drain
 * get a fresh token so their reports are still delivered.
 */
class AnalysisWorker {
public:
    struct Config {
        size_t batch_size = 10;
        std::chrono::milliseconds poll_interval{100};
        std::chrono::milliseconds fault_backoff{1000};
    };

    /**
     * @param queue  Must outlive the worker
     * @param plan_capture  Optional; null disables plan capture
     * @param sink  Destination for every processed report
     */
    AnalysisWorker(const Config& config,
                   AnalysisQueue<AnalysisItem>& queue,
                   std::shared_ptr<PlanCapture> plan_capture,
                   std::shared_ptr<IReportSink> sink);

    ~AnalysisWorker();

    // Non-copyable, non-movable (owns thread)
    AnalysisWorker(const AnalysisWorker&) = delete;
    AnalysisWorker& operator=(const AnalysisWorker&) = delete;
    AnalysisWorker(AnalysisWorker&&) = delete;
    AnalysisWorker& operator=(AnalysisWorker&&) = delete;

    /// Start the background thread (no-op if already running)
    void start();

    /**
     * @brief Request shutdown, join, and deliver everything still queued
     *
     * Idempotent. Without a running thread (never started, or already
     * stopped) the drain runs on the calling thread.
     */
    void stop();

    [[nodiscard]] bool is_running() const {
        return running_.load(std::memory_order_acquire);
    }

    struct Stats {
        uint64_t processed;     ///< Items whose report was delivered
        uint64_t failed;        ///< Items whose processing threw or whose sink failed
        uint64_t batches;       ///< Drain passes that found work
        uint64_t loop_faults;   ///< Faults outside per-item processing
    };

    [[nodiscard]] Stats get_stats() const;

private:
    void worker_thread_func();
    /// @return false when stop() interrupted the item; it is retried by the final drain
    bool process_item(AnalysisItem& item, const CancellationToken& token);
    void final_drain(std::vector<AnalysisItem>& leftovers);
    void wait_for(std::chrono::milliseconds duration);

    Config config_;
    AnalysisQueue<AnalysisItem>& queue_;
    std::shared_ptr<PlanCapture> plan_capture_;
    std::shared_ptr<IReportSink> sink_;

    // -- Background thread --
    std::thread worker_thread_;
    std::atomic<bool> running_{false};
    std::mutex lifecycle_mutex_;
    CancellationToken token_;

    // -- Wake-up --
    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;

    // -- Stats --
    std::atomic<uint64_t> processed_{0};
    std::atomic<uint64_t> failed_{0};
    std::atomic<uint64_t> batches_{0};
    std::atomic<uint64_t> loop_faults_{0};
};

} // namespace querywatch
