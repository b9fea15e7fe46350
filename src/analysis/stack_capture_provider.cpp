#include "analysis/stack_capture_provider.hpp"

#include <boost/stacktrace.hpp>

namespace querywatch {

std::vector<StackFrame> BoostStackCaptureProvider::capture() {
    // Skip this function's own frame
    const boost::stacktrace::stacktrace trace(1, static_cast<std::size_t>(-1));

    std::vector<StackFrame> frames;
    frames.reserve(trace.size());

    for (const auto& frame : trace) {
        StackFrame out;
        out.function = frame.name();
        out.source_file = frame.source_file();
        out.line = static_cast<uint32_t>(frame.source_line());
        frames.push_back(std::move(out));
    }

    return frames;
}

} // namespace querywatch
