// === Logging =================================================================
//
// Process-wide spdlog logger shared by every pipeline stage. The logger writes
// a short console line plus a JSON-line record into a rotating file under the
// configured log directory.

#pragma once

#include <memory>
#include <string>

#include <spdlog/formatter.h>
#include <spdlog/logger.h>

namespace tile_timeline {

/** @brief Create (once) the shared logger writing under @p log_directory. */
std::shared_ptr<spdlog::logger> initialize_logger(const std::string& log_directory);

/** @brief Shared logger; throws std::runtime_error before initialize_logger(). */
std::shared_ptr<spdlog::logger> get_logger();

/**
 * @brief Formatter for the file sink: one JSON object per record.
 *
 * The message text is JSON-escaped so quotes, backslashes and control
 * characters in paths or library errors keep every line parseable.
 */
std::unique_ptr<spdlog::formatter> make_json_line_formatter();

/** @brief Apply a textual level ("debug", "warn", ...); unknown values reset to info. */
void set_log_level(const std::string& str_level);

}  // namespace tile_timeline
