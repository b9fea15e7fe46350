#include "reporting/file_sink.hpp"
#include "reporting/report_serializer.hpp"

#include <filesystem>
#include <format>
#include <stdexcept>

namespace querywatch {

FileReportSink::FileReportSink(const Config& config)
    : config_(config) {
    file_stream_.open(config_.output_file, std::ios::app);
    if (!file_stream_.is_open()) {
        throw std::runtime_error("Failed to open report file: " + config_.output_file);
    }

    std::error_code ec;
    const auto file_size = std::filesystem::file_size(config_.output_file, ec);
    if (!ec) {
        current_file_size_ = static_cast<size_t>(file_size);
    }
}

FileReportSink::~FileReportSink() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_stream_.is_open()) {
        file_stream_.flush();
        file_stream_.close();
    }
}

bool FileReportSink::report(const SlowQueryReport& report, const CancellationToken& /*token*/) {
    std::string line = ReportSerializer::serialize(report);
    line += '\n';

    std::lock_guard<std::mutex> lock(mutex_);
    if (config_.max_file_size_bytes > 0 && current_file_size_ > 0 &&
        current_file_size_ + line.size() > config_.max_file_size_bytes) {
        rotate_file();
    }

    if (!file_stream_.is_open()) {
        return false;
    }

    file_stream_.write(line.data(), static_cast<std::streamsize>(line.size()));
    file_stream_.flush();
    current_file_size_ += line.size();
    return file_stream_.good();
}

std::string FileReportSink::name() const {
    return "file:" + config_.output_file;
}

size_t FileReportSink::rotation_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rotation_count_;
}

size_t FileReportSink::current_file_size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_file_size_;
}

void FileReportSink::rotate_file() {
    file_stream_.flush();
    file_stream_.close();

    std::error_code ec;

    const auto oldest = std::format("{}.{}", config_.output_file, config_.max_files);
    std::filesystem::remove(oldest, ec);

    // Shift existing rotated files: .N -> .N+1 (missing files are fine)
    for (int i = config_.max_files - 1; i >= 1; --i) {
        const auto old_name = std::format("{}.{}", config_.output_file, i);
        const auto new_name = std::format("{}.{}", config_.output_file, i + 1);
        std::filesystem::rename(old_name, new_name, ec);
    }

    if (config_.max_files > 0) {
        std::filesystem::rename(config_.output_file, config_.output_file + ".1", ec);
        file_stream_.open(config_.output_file, std::ios::app);
    } else {
        file_stream_.open(config_.output_file, std::ios::trunc);
    }

    current_file_size_ = 0;
    ++rotation_count_;
}

} // namespace querywatch
