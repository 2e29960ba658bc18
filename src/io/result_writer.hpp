/**
 * @file result_writer.hpp
 * @brief JSON rendering of a schedule result.
 */

#pragma once

#include "core/result.hpp"
#include "scheduler/scheduler.hpp"

#include <filesystem>
#include <string>

namespace session_planner {

/**
 * @brief Render @p result as a JSON document.
 *
 * Accepted entries carry "recommendation": "APPROVE", rejected entries
 * "REJECT" together with the rendered reason and its machine-readable kind.
 */
[[nodiscard]] std::string to_json(const ScheduleResult& result);

/// Write to_json(result) to @p path, creating parent directories.
Result<void> write_result(const ScheduleResult& result, const std::filesystem::path& path);

}  // namespace session_planner
