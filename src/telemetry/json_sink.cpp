/**
 * @file json_sink.cpp
 * @brief Log sink implementations.
 */

#include "telemetry/json_sink.hpp"

#include <iostream>
#include <system_error>

namespace railway {

// ── JsonFileSink ─────────────────────────────

JsonFileSink::JsonFileSink(const std::filesystem::path& log_dir,
                            const std::string& prefix,
                            uint32_t max_file_size_mb,
                            uint32_t max_files)
    : log_dir_(log_dir)
    , prefix_(prefix)
    , max_file_size_bytes_(static_cast<uint64_t>(max_file_size_mb) * 1024 * 1024)
    , max_files_(max_files == 0 ? 1 : max_files) {
    std::filesystem::create_directories(log_dir_);
    auto path = current_path();

    std::error_code ec;
    auto existing = std::filesystem::file_size(path, ec);
    if (!ec) current_size_ = existing;

    current_file_.open(path, std::ios::app);
}

JsonFileSink::~JsonFileSink() {
    if (current_file_.is_open()) {
        current_file_.flush();
        current_file_.close();
    }
}

std::filesystem::path JsonFileSink::current_path() const {
    return log_dir_ / (prefix_ + ".ndjson");
}

std::filesystem::path JsonFileSink::rotated_path(uint32_t index) const {
    return log_dir_ / (prefix_ + "." + std::to_string(index) + ".ndjson");
}

void JsonFileSink::write(std::string_view json_line) {
    rotate_if_needed(json_line.size() + 1);
    if (current_file_.is_open()) {
        current_file_ << json_line << '\n';
        current_size_ += json_line.size() + 1;
    }
}

void JsonFileSink::flush() {
    if (current_file_.is_open()) {
        current_file_.flush();
    }
}

void JsonFileSink::rotate_if_needed(size_t incoming) {
    if (current_size_ == 0) return;
    if (current_size_ + incoming <= max_file_size_bytes_) return;
    rotate();
}

void JsonFileSink::rotate() {
    current_file_.close();

    // Errors are ignored file by file; a failed rename only loses history.
    std::error_code ec;
    if (max_files_ > 1) {
        std::filesystem::remove(rotated_path(max_files_ - 1), ec);
        for (uint32_t i = max_files_ - 1; i > 1; --i) {
            auto from = rotated_path(i - 1);
            if (std::filesystem::exists(from, ec)) {
                std::filesystem::rename(from, rotated_path(i), ec);
            }
        }
        std::filesystem::rename(current_path(), rotated_path(1), ec);
    }

    current_file_.open(current_path(), std::ios::trunc);
    current_size_ = 0;
}

// ── StdoutSink ───────────────────────────────

void StdoutSink::write(std::string_view json_line) {
    std::cout << json_line << '\n';
}

void StdoutSink::flush() {
    std::cout.flush();
}

// ── Factory ──────────────────────────────────

Result<std::unique_ptr<ILogSink>> make_log_sink(const LoggingConfig& config,
                                                const std::string& prefix) {
    if (config.log_dir.empty()) {
        return std::unique_ptr<ILogSink>(std::make_unique<StdoutSink>());
    }
    return try_invoke(
        [&]() -> std::unique_ptr<ILogSink> {
            return std::make_unique<JsonFileSink>(config.log_dir, prefix,
                                                  config.max_file_size_mb, config.rotate_count);
        },
        [&](const std::exception& ex) {
            return Error::unexpected("cannot open log directory " + config.log_dir.string() +
                                         ": " + ex.what(),
                                     "logging.sink_unavailable");
        });
}

}  // namespace railway
