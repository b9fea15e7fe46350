#pragma once

#include "reporting/report_sink.hpp"

#include <cstddef>
#include <fstream>
#include <mutex>
#include <string>

namespace querywatch {

/**
 * @brief Appends one JSON line per report with size-based rotation
 *
 * Rotated files are named with numeric suffixes: slow_queries.jsonl.1,
 * slow_queries.jsonl.2, etc. Files beyond max_files are deleted.
 */
class FileReportSink : public IReportSink {
public:
    struct Config {
        std::string output_file = "slow_queries.jsonl";
        size_t max_file_size_bytes = 100ULL * 1024 * 1024;  // 100MB
        int max_files = 10;
    };

    /// @throws std::runtime_error if the file cannot be opened
    explicit FileReportSink(const Config& config);
    ~FileReportSink() override;

    [[nodiscard]] bool report(const SlowQueryReport& report,
                              const CancellationToken& token) override;

    [[nodiscard]] std::string name() const override;

    [[nodiscard]] size_t rotation_count() const;
    [[nodiscard]] size_t current_file_size() const;

private:
    void rotate_file();

    Config config_;
    mutable std::mutex mutex_;
    std::ofstream file_stream_;
    size_t current_file_size_ = 0;
    size_t rotation_count_ = 0;
};

} // namespace querywatch
