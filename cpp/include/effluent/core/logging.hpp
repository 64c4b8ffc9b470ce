#pragma once

/**
 * @file logging.hpp
 * @brief Minimal process-wide logger shared by all engine modules
 *
 * WARN and ERROR go to stderr, everything else to stdout. Calls never throw
 * and are serialised with a mutex so scenario workers can log concurrently.
 */

#include <string>

namespace effluent {

enum class LogLevel : int { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3 };

/// Set global logging verbosity (default INFO)
void set_log_level(LogLevel level) noexcept;

/// Get global logging verbosity
LogLevel get_log_level() noexcept;

/// Parse "debug" / "info" / "warn" / "error" (case-insensitive)
/// @throws std::invalid_argument for unknown names
LogLevel parse_log_level(const std::string& name);

/// Core logging call. Never throws.
void log(LogLevel level, const std::string& message) noexcept;

inline void log_debug(const std::string& message) noexcept { log(LogLevel::DEBUG, message); }
inline void log_info(const std::string& message) noexcept { log(LogLevel::INFO, message); }
inline void log_warn(const std::string& message) noexcept { log(LogLevel::WARN, message); }
inline void log_error(const std::string& message) noexcept { log(LogLevel::ERROR, message); }

} // namespace effluent
