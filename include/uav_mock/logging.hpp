// === Logging =================================================================
//
// One process-wide spdlog logger named `uav_mock`. Console output is always
// on; a rotating JSON-line file is added only when a log directory is given.

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/formatter.h>
#include <spdlog/logger.h>

namespace uav_mock {

/**
 * @brief Build the sinks for the shared logger.
 *
 * Without @p log_directory only the stdout sink is returned and the file
 * system is not touched. With it, the directory is created and a rotating
 * `uav_mock.log` sink is appended.
 *
 * @throws std::runtime_error when the directory cannot be created.
 */
std::vector<spdlog::sink_ptr> make_log_sinks(const std::optional<std::string>& log_directory);

/** @brief UTC JSON-line formatter whose `msg` field is always valid JSON. */
std::unique_ptr<spdlog::formatter> make_json_line_formatter();

std::shared_ptr<spdlog::logger> initialize_logger(const std::optional<std::string>& log_directory);

std::shared_ptr<spdlog::logger> get_logger();

void set_log_level(const std::string& str_level);

}  // namespace uav_mock
