#pragma once

#include "analysis/stack_capture_provider.hpp"

#include <atomic>
#include <vector>

namespace querywatch::testing {

/**
 * @brief Stack provider returning the same frames on every capture
 */
class FixedStackProvider : public IStackCaptureProvider {
public:
    explicit FixedStackProvider(std::vector<StackFrame> frames)
        : frames_(std::move(frames)) {}

    [[nodiscard]] std::vector<StackFrame> capture() override {
        capture_count_.fetch_add(1, std::memory_order_relaxed);
        return frames_;
    }

    [[nodiscard]] uint64_t capture_count() const {
        return capture_count_.load(std::memory_order_relaxed);
    }

private:
    std::vector<StackFrame> frames_;
    std::atomic<uint64_t> capture_count_{0};
};

} // namespace querywatch::testing
