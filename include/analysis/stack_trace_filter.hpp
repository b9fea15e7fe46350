#pragma once

#include "analysis/stack_capture_provider.hpp"

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace querywatch {

/**
 * @brief Reduces a raw call stack to the application frames that issued a command
 *
 * Excludes:
 * - frames of this library (querywatch::)
 * - infrastructure namespaces and system paths (std::, boost::, libpq, /usr/include/ ...)
 * - compiler-generated frames (lambdas, coroutine resume/destroy, static init)
 *
 * A frame is application code when its source file lies under the project
 * root. Frames without a source file fall back to a token match on the
 * project root's folder name.
 *
 * Output lines look like "billing::Invoices::load(int) in src/invoices.cpp:line 42".
 */
class StackTraceFilter {
public:
    struct Config {
        bool enabled = true;
        std::string project_root;    ///< Empty: detect from the working directory
        size_t max_lines = 20;
    };

    StackTraceFilter(const Config& config, std::shared_ptr<IStackCaptureProvider> provider);

    /**
     * @brief Capture and filter the current stack
     * @return Formatted frames, innermost first; empty when disabled, on
     *         failure, or when no application frame survives
     */
    [[nodiscard]] std::vector<std::string> capture(size_t max_lines) const;

    [[nodiscard]] std::vector<std::string> capture() const { return capture(config_.max_lines); }

    /// Filter and format already-captured frames
    [[nodiscard]] std::vector<std::string> filter(const std::vector<StackFrame>& frames,
                                                  size_t max_lines) const;

    [[nodiscard]] bool enabled() const { return config_.enabled && provider_ != nullptr; }

    [[nodiscard]] const std::string& project_root() const { return project_root_; }

    /**
     * @brief Walk up from start to the first directory holding a build or
     *        VCS marker (CMakeLists.txt, Makefile, meson.build, .git)
     * @return That directory, or start itself when none is found
     */
    [[nodiscard]] static std::string detect_project_root(const std::filesystem::path& start);

    [[nodiscard]] static bool is_excluded(const StackFrame& frame);

private:
    [[nodiscard]] bool is_application_frame(const StackFrame& frame) const;
    [[nodiscard]] std::string format_frame(const StackFrame& frame) const;
    [[nodiscard]] bool under_root(const std::string& path) const;

    Config config_;
    std::shared_ptr<IStackCaptureProvider> provider_;
    std::string project_root_;
    std::string root_token_;    ///< Lowercased folder name of project_root_
};

} // namespace querywatch
