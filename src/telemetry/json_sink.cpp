/**
 * @file json_sink.cpp
 * @brief Log sink implementations.
 * @author Dimitris Kafetzis
 */

#include "telemetry/json_sink.hpp"

#include <iostream>
#include <system_error>

namespace fleet_mirror {

// ── JsonFileSink ─────────────────────────────

JsonFileSink::JsonFileSink(const std::filesystem::path& log_dir,
                            const std::string& prefix,
                            uint32_t max_file_size_mb,
                            uint32_t max_files)
    : log_dir_(log_dir)
    , prefix_(prefix)
    , max_file_size_bytes_(static_cast<uint64_t>(max_file_size_mb) * 1024 * 1024)
    , max_files_(max_files) {
    std::filesystem::create_directories(log_dir_);
    auto path = generation_path(0);
    std::error_code ec;
    if (auto size = std::filesystem::file_size(path, ec); !ec) {
        current_size_ = size;
    }
    current_file_.open(path, std::ios::app);
}

JsonFileSink::~JsonFileSink() {
    if (current_file_.is_open()) {
        current_file_.flush();
        current_file_.close();
    }
}

void JsonFileSink::write(std::string_view json_line) {
    rotate_if_needed();
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

std::filesystem::path JsonFileSink::generation_path(uint32_t index) const {
    if (index == 0) return log_dir_ / (prefix_ + ".ndjson");
    return log_dir_ / (prefix_ + "." + std::to_string(index) + ".ndjson");
}

void JsonFileSink::rotate_if_needed() {
    if (current_size_ < max_file_size_bytes_) return;

    current_file_.close();
    std::error_code ec;
    if (max_files_ > 1) {
        std::filesystem::remove(generation_path(max_files_ - 1), ec);
        for (uint32_t i = max_files_ - 1; i > 0; --i) {
            auto from = generation_path(i - 1);
            if (std::filesystem::exists(from, ec)) {
                std::filesystem::rename(from, generation_path(i), ec);
            }
        }
        current_file_.open(generation_path(0), std::ios::app);
    } else {
        current_file_.open(generation_path(0), std::ios::trunc);
    }
    current_size_ = 0;
}

// ── StdoutSink ───────────────────────────────

void StdoutSink::write(std::string_view json_line) {
    std::cout << json_line << '\n';
}

void StdoutSink::flush() {
    std::cout.flush();
}

// ── MemorySink ───────────────────────────────

MemorySink::MemorySink() : buffer_(std::make_shared<Buffer>()) {}

void MemorySink::write(std::string_view json_line) {
    std::lock_guard lock(buffer_->mutex);
    buffer_->lines.emplace_back(json_line);
}

std::vector<std::string> MemorySink::lines() const {
    std::lock_guard lock(buffer_->mutex);
    return buffer_->lines;
}

bool MemorySink::contains(std::string_view needle) const {
    std::lock_guard lock(buffer_->mutex);
    for (const auto& line : buffer_->lines) {
        if (line.find(needle) != std::string::npos) return true;
    }
    return false;
}

}  // namespace fleet_mirror
