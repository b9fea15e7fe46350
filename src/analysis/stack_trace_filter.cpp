#include "analysis/stack_trace_filter.hpp"
#include "core/utils.hpp"

#include <array>
#include <cctype>
#include <format>
#include <unordered_set>

namespace querywatch {

namespace {

constexpr std::array<std::string_view, 4> kRootMarkers = {
    "CMakeLists.txt", "Makefile", "meson.build", ".git"
};

// Symbols whose frames never point at the caller's own code
constexpr std::array<std::string_view, 14> kExcludedPrefixes = {
    "querywatch::",
    "std::",
    "__gnu_cxx::",
    "__cxxabiv1::",
    "boost::",
    "Catch::",
    "httplib::",
    "nlohmann::",
    "toml::",
    "__libc_",
    "__cxa_",
    "_dl_",
    "start_thread",
    "__clone",
};

constexpr std::array<std::string_view, 8> kGeneratedMarkers = {
    "{lambda(",
    "<lambda",
    "lambda#",
    ".resume",
    ".destroy",
    ".actor",
    "_GLOBAL__sub_I",
    "__static_initialization",
};

constexpr std::array<std::string_view, 4> kSystemPaths = {
    "/usr/include/", "/usr/lib/", "/usr/local/include/", "/lib/"
};

/// libpq is plain C: PQexec / PQgetvalue (API), pqGetc / pqsecure_read (internal)
bool is_libpq_frame(const StackFrame& frame) {
    if (frame.source_file.find("/libpq/") != std::string::npos) {
        return true;
    }

    const std::string_view fn = frame.function;
    if (fn.size() < 3 || fn.find("::") != std::string_view::npos) {
        return false;
    }

    const auto third = static_cast<unsigned char>(fn[2]);
    if (fn.starts_with("PQ")) return std::islower(third) != 0;
    if (fn.starts_with("pq")) return std::isupper(third) != 0 || fn.starts_with("pqsecure_");
    return false;
}

std::string normalize_path(const std::filesystem::path& p) {
    std::string s = p.lexically_normal().generic_string();
    while (s.size() > 1 && s.back() == '/') {
        s.pop_back();
    }
    return s;
}

bool is_identifier_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

// Whole-token match, so "shop" does not match "workshop"
bool contains_token(std::string_view haystack_lower, std::string_view token) {
    if (token.empty()) return false;
    size_t pos = haystack_lower.find(token);
    while (pos != std::string_view::npos) {
        const bool left_ok = pos == 0 || !is_identifier_char(haystack_lower[pos - 1]);
        const size_t end = pos + token.size();
        const bool right_ok = end == haystack_lower.size() || !is_identifier_char(haystack_lower[end]);
        if (left_ok && right_ok) return true;
        pos = haystack_lower.find(token, pos + 1);
    }
    return false;
}

} // anonymous namespace

StackTraceFilter::StackTraceFilter(const Config& config,
                                   std::shared_ptr<IStackCaptureProvider> provider)
    : config_(config),
      provider_(std::move(provider)) {
    if (!config_.project_root.empty()) {
        std::error_code ec;
        const auto abs = std::filesystem::absolute(config_.project_root, ec);
        project_root_ = normalize_path(ec ? std::filesystem::path(config_.project_root) : abs);
    } else {
        std::error_code ec;
        const auto cwd = std::filesystem::current_path(ec);
        project_root_ = ec ? std::string{} : detect_project_root(cwd);
    }

    root_token_ = utils::to_lower(std::filesystem::path(project_root_).filename().string());

    if (config_.enabled) {
        utils::log::debug(std::format("Stack trace filter: project root '{}'", project_root_));
    }
}

std::vector<std::string> StackTraceFilter::capture(size_t max_lines) const {
    if (!enabled() || max_lines == 0) {
        return {};
    }

    try {
        return filter(provider_->capture(), max_lines);
    } catch (const std::exception& e) {
        utils::log::debug(std::format("Stack trace capture failed: {}", e.what()));
        return {};
    }
}

std::vector<std::string> StackTraceFilter::filter(const std::vector<StackFrame>& frames,
                                                  size_t max_lines) const {
    std::vector<std::string> lines;
    std::unordered_set<std::string> seen;

    for (const auto& frame : frames) {
        if (lines.size() >= max_lines) break;
        if (is_excluded(frame) || !is_application_frame(frame)) continue;

        std::string line = format_frame(frame);
        if (seen.insert(line).second) {
            lines.push_back(std::move(line));
        }
    }

    return lines;
}

std::string StackTraceFilter::detect_project_root(const std::filesystem::path& start) {
    namespace fs = std::filesystem;

    std::error_code ec;
    fs::path dir = fs::absolute(start, ec);
    if (ec) dir = start;
    dir = dir.lexically_normal();

    for (fs::path cur = dir; !cur.empty(); cur = cur.parent_path()) {
        for (const auto marker : kRootMarkers) {
            if (fs::exists(cur / marker, ec)) {
                return normalize_path(cur);
            }
        }
        if (cur == cur.parent_path()) break;
    }

    return normalize_path(dir);
}

bool StackTraceFilter::is_excluded(const StackFrame& frame) {
    if (frame.function.empty()) {
        return true;
    }

    for (const auto prefix : kExcludedPrefixes) {
        if (frame.function.starts_with(prefix)) return true;
    }

    if (is_libpq_frame(frame)) {
        return true;
    }

    for (const auto marker : kGeneratedMarkers) {
        if (frame.function.find(marker) != std::string::npos) return true;
    }

    for (const auto sys : kSystemPaths) {
        if (frame.source_file.starts_with(sys)) return true;
    }

    return false;
}

bool StackTraceFilter::under_root(const std::string& path) const {
    if (project_root_.empty()) return false;
    if (project_root_ == "/") return path.starts_with('/');
    return path == project_root_ ||
           (path.starts_with(project_root_) && path.size() > project_root_.size() &&
            path[project_root_.size()] == '/');
}

bool StackTraceFilter::is_application_frame(const StackFrame& frame) const {
    if (!frame.source_file.empty()) {
        if (under_root(normalize_path(frame.source_file))) {
            return true;
        }
        return contains_token(utils::to_lower(frame.source_file), root_token_);
    }

    return contains_token(utils::to_lower(frame.function), root_token_);
}

std::string StackTraceFilter::format_frame(const StackFrame& frame) const {
    if (frame.source_file.empty()) {
        return frame.function;
    }

    std::string path = normalize_path(frame.source_file);
    if (under_root(path) && path != project_root_) {
        path = std::filesystem::path(path).lexically_relative(project_root_).generic_string();
    }

    if (frame.line == 0) {
        return std::format("{} in {}", frame.function, path);
    }
    return std::format("{} in {}:line {}", frame.function, path, frame.line);
}

} // namespace querywatch
