#pragma once

#include "reporting/report_sink.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <vector>

namespace querywatch {

/**
 * @brief Fans one report out to every registered sink
 *
 * With more than one sink, each is invoked on its own std::async task and
 * all are awaited. A sink that throws or returns false is logged and
 * counted; its siblings still run.
 */
class CompositeReportSink : public IReportSink {
public:
    CompositeReportSink() = default;
    explicit CompositeReportSink(std::vector<std::shared_ptr<IReportSink>> sinks);

    void add_sink(std::shared_ptr<IReportSink> sink);

    /// @return true only if every sink succeeded
    [[nodiscard]] bool report(const SlowQueryReport& report,
                              const CancellationToken& token) override;

    [[nodiscard]] std::string name() const override;

    [[nodiscard]] size_t sink_count() const { return sinks_.size(); }

    [[nodiscard]] uint64_t sink_failures() const {
        return sink_failures_.load(std::memory_order_relaxed);
    }

private:
    bool report_to(IReportSink& sink, const SlowQueryReport& report,
                   const CancellationToken& token);

    std::vector<std::shared_ptr<IReportSink>> sinks_;
    std::atomic<uint64_t> sink_failures_{0};
};

} // namespace querywatch
