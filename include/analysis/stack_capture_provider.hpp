#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace querywatch {

/// One raw call-stack frame, innermost first when returned in a sequence
struct StackFrame {
    std::string function;      ///< Demangled symbol; empty when unresolved
    std::string source_file;   ///< Absolute path when debug info is present
    uint32_t line = 0;
};

/**
 * @brief Source of raw call stacks
 *
 * Injected into StackTraceFilter so tests can supply fixed frames and
 * deployments can turn capture off entirely.
 */
class IStackCaptureProvider {
public:
    virtual ~IStackCaptureProvider() = default;

    /// Current thread's stack, innermost frame first
    [[nodiscard]] virtual std::vector<StackFrame> capture() = 0;
};

/**
 * @brief Boost.Stacktrace backed provider (libbacktrace for file/line)
 */
class BoostStackCaptureProvider : public IStackCaptureProvider {
public:
    [[nodiscard]] std::vector<StackFrame> capture() override;
};

/**
 * @brief Provider that never captures anything
 */
class NullStackCaptureProvider : public IStackCaptureProvider {
public:
    [[nodiscard]] std::vector<StackFrame> capture() override { return {}; }
};

} // namespace querywatch
