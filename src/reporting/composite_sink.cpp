#include "reporting/composite_sink.hpp"
#include "core/utils.hpp"

#include <format>
#include <future>

namespace querywatch {

CompositeReportSink::CompositeReportSink(std::vector<std::shared_ptr<IReportSink>> sinks) {
    for (auto& sink : sinks) {
        add_sink(std::move(sink));
    }
}

void CompositeReportSink::add_sink(std::shared_ptr<IReportSink> sink) {
    if (sink) {
        sinks_.push_back(std::move(sink));
    }
}

bool CompositeReportSink::report_to(IReportSink& sink, const SlowQueryReport& report,
                                    const CancellationToken& token) {
    try {
        if (sink.report(report, token)) {
            return true;
        }
        utils::log::error(std::format("Report sink {} failed for query {}",
                                      sink.name(), report.query_id));
    } catch (const std::exception& e) {
        utils::log::error(std::format("Report sink {} threw for query {}: {}",
                                      sink.name(), report.query_id, e.what()));
    }
    sink_failures_.fetch_add(1, std::memory_order_relaxed);
    return false;
}

bool CompositeReportSink::report(const SlowQueryReport& report,
                                 const CancellationToken& token) {
    if (sinks_.size() <= 1) {
        // Single sink: no parallelization overhead
        bool ok = true;
        for (auto& sink : sinks_) {
            ok = report_to(*sink, report, token) && ok;
        }
        return ok;
    }

    // The report reference stays valid because every future is awaited
    std::vector<std::future<bool>> futures;
    futures.reserve(sinks_.size());

    for (auto& sink : sinks_) {
        futures.push_back(std::async(std::launch::async,
            [this, &sink, &report, &token] { return report_to(*sink, report, token); }));
    }

    bool ok = true;
    for (auto& f : futures) {
        ok = f.get() && ok;
    }
    return ok;
}

std::string CompositeReportSink::name() const {
    std::string out = "composite[";
    for (size_t i = 0; i < sinks_.size(); ++i) {
        if (i > 0) out += ',';
        out += sinks_[i]->name();
    }
    out += ']';
    return out;
}

} // namespace querywatch
