// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <spdlog/spdlog.h>

#include <string>

namespace raspap {
namespace logging {

/**
 * @brief Where log output goes besides the console
 */
enum class LogTarget {
    Auto,    ///< journal if available, otherwise syslog
    Journal, ///< systemd journal (needs RASPAP_HAS_SYSTEMD)
    Syslog,  ///< syslog(3)
    File,    ///< rotating file, 5 MB x 3
    Console  ///< console only
};

struct LogConfig {
    spdlog::level::level_enum level = spdlog::level::warn;
    LogTarget target = LogTarget::Auto;
    bool enable_console = true;
    bool console_to_stderr = false; ///< Keep stdout clean for machine-readable output
    std::string file_path; ///< File target only; empty picks a default location
};

/**
 * @brief Install the default spdlog logger with the configured sinks
 *
 * Safe to call more than once; the last call wins.
 */
void init(const LogConfig& config);

/**
 * @brief "auto", "journal", "syslog", "file", "console"; anything else is Auto
 */
LogTarget parse_log_target(const std::string& str);

const char* log_target_name(LogTarget target);

/**
 * @brief Level name to spdlog level; case-sensitive, "warning" is an alias
 */
spdlog::level::level_enum parse_level(const std::string& str,
                                      spdlog::level::level_enum default_level = spdlog::level::warn);

/**
 * @brief -v count to level: 1 info, 2 debug, 3+ trace, otherwise warn
 */
spdlog::level::level_enum verbosity_to_level(int verbosity);

/**
 * @brief spdlog level to libhv LOG_LEVEL_* (libhv has no trace)
 */
int to_hv_level(spdlog::level::level_enum level);

/**
 * @brief Pick the effective level
 *
 * Precedence: CLI verbosity, then the LOG_LEVEL environment value, then the
 * config file value, then warn.
 */
spdlog::level::level_enum resolve_log_level(int cli_verbosity, const std::string& env_level,
                                            const std::string& config_level);

} // namespace logging
} // namespace raspap
