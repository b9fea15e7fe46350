#pragma once

#include "reporting/report_sink.hpp"

#include <mutex>
#include <vector>

namespace querywatch {

/**
 * @brief Keeps every report in memory (tests, local inspection)
 *
 * Stored copies carry the environment tag "InMemory". Thread-safe.
 */
class InMemoryReportSink : public IReportSink {
public:
    static constexpr const char* kEnvironment = "InMemory";

    [[nodiscard]] bool report(const SlowQueryReport& report,
                              const CancellationToken& token) override;

    [[nodiscard]] std::string name() const override { return "memory"; }

    [[nodiscard]] std::vector<SlowQueryReport> reports() const;
    [[nodiscard]] size_t size() const;
    void clear();

private:
    mutable std::mutex mutex_;
    std::vector<SlowQueryReport> reports_;
};

} // namespace querywatch
