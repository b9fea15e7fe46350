#include "reporting/memory_sink.hpp"

namespace querywatch {

bool InMemoryReportSink::report(const SlowQueryReport& report,
                                const CancellationToken& /*token*/) {
    SlowQueryReport copy = report;
    copy.environment = kEnvironment;

    std::lock_guard<std::mutex> lock(mutex_);
    reports_.push_back(std::move(copy));
    return true;
}

std::vector<SlowQueryReport> InMemoryReportSink::reports() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reports_;
}

size_t InMemoryReportSink::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reports_.size();
}

void InMemoryReportSink::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    reports_.clear();
}

} // namespace querywatch
