/**
 * @file json_sink.hpp
 * @brief NDJSON log sinks: rotating file, standard streams, null.
 */

#pragma once

#include "core/logger.hpp"

#include <filesystem>
#include <fstream>
#include <string>

namespace session_planner {

/**
 * @brief Writes NDJSON to rotating log files.
 *
 * <prefix>.ndjson is the live file. When it exceeds the size limit it is
 * renamed to <prefix>.1.ndjson, shifting older files up to max_files.
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

    [[nodiscard]] std::filesystem::path current_path() const;

private:
    void rotate_if_needed();
    [[nodiscard]] std::filesystem::path rotated_path(uint32_t generation) const;

    std::filesystem::path log_dir_;
    std::string prefix_;
    uint64_t max_file_size_bytes_;
    uint32_t max_files_;
    std::ofstream current_file_;
    uint64_t current_size_{0};
};

/**
 * @brief Writes to stdout.
 */
class StdoutSink : public ILogSink {
public:
    void write(std::string_view json_line) override;
    void flush() override;
};

/**
 * @brief Writes to stderr, keeping stdout free for the result document.
 */
class StderrSink : public ILogSink {
public:
    void write(std::string_view json_line) override;
    void flush() override;
};

/**
 * @brief Discards all output.
 */
class NullSink : public ILogSink {
public:
    void write(std::string_view /*json_line*/) override {}
    void flush() override {}
};

}  // namespace session_planner
