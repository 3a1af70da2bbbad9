// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file logging_init.h
 * @brief spdlog setup for the supervisor and its CLI
 *
 * One default logger named "kiro2api" with an optional colored console sink
 * plus one system sink chosen by LogTarget.
 */

#include <spdlog/spdlog.h>

#include <string>

namespace kiro2api {
namespace logging {

enum class LogTarget {
    Auto,    ///< Syslog on Linux, console elsewhere
    Journal, ///< systemd journal (falls back to syslog without systemd support)
    Syslog,
    File,    ///< Rotating file, 5 MiB x 3
    Console  ///< Console sink only
};

struct LogConfig {
    spdlog::level::level_enum level = spdlog::level::warn;
    LogTarget target = LogTarget::Auto;
    bool enable_console = true;
    std::string file_path; ///< Override for LogTarget::File
};

/**
 * @brief Install the default logger
 *
 * Safe to call more than once; the previous default logger is replaced.
 */
void init(const LogConfig& config);

/// "auto|journal|syslog|file|console"; unknown text maps to Auto
LogTarget parse_log_target(const std::string& str);

const char* log_target_name(LogTarget target);

/// Default rotating file location ($XDG_DATA_HOME/kiro2api/supervisor.log)
std::string default_log_file_path();

} // namespace logging
} // namespace kiro2api
