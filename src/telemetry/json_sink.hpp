/**
 * @file json_sink.hpp
 * @brief NDJSON file log sink with rotation support.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/logger.hpp"

#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace fleet_mirror {

/**
 * @brief Writes NDJSON to rotating log files.
 *
 * The active file is <prefix>.ndjson; on rotation it becomes <prefix>.1.ndjson
 * and older generations shift up until max_files is reached.
 */
class JsonFileSink : public ILogSink {
public:
    JsonFileSink(const std::filesystem::path& log_dir,
                 const std::string& prefix,
                 uint32_t max_file_size_mb = 50,
                 uint32_t max_files = 5);
    ~JsonFileSink() override;

    void write(std::string_view json_line) override;
    void flush() override;

private:
    void rotate_if_needed();
    [[nodiscard]] std::filesystem::path generation_path(uint32_t index) const;

    std::filesystem::path log_dir_;
    std::string prefix_;
    uint64_t max_file_size_bytes_;
    uint32_t max_files_;
    std::ofstream current_file_;
    uint64_t current_size_{0};
};

/**
 * @brief Writes to stdout, useful for development/debugging.
 */
class StdoutSink : public ILogSink {
public:
    void write(std::string_view json_line) override;
    void flush() override;
};

/**
 * @brief Discards all output, useful for benchmarking.
 */
class NullSink : public ILogSink {
public:
    void write(std::string_view /*json_line*/) override {}
    void flush() override {}
};

/**
 * @brief Keeps lines in memory so tests can inspect them.
 *
 * Copies share the underlying buffer; hand one copy to a Logger and keep
 * the other.
 */
class MemorySink : public ILogSink {
public:
    MemorySink();

    void write(std::string_view json_line) override;
    void flush() override {}

    [[nodiscard]] std::vector<std::string> lines() const;
    [[nodiscard]] bool contains(std::string_view needle) const;

private:
    struct Buffer {
        std::mutex mutex;
        std::vector<std::string> lines;
    };
    std::shared_ptr<Buffer> buffer_;
};

}  // namespace fleet_mirror
