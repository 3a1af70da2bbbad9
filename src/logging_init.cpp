// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "logging_init.h"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdlib>
#include <filesystem>
#include <vector>

#ifdef __linux__
#ifdef KIRO2API_HAS_SYSTEMD
#include <spdlog/sinks/systemd_sink.h>
#endif
#include <spdlog/sinks/syslog_sink.h>
#endif

namespace kiro2api {
namespace logging {

namespace {

constexpr const char* SYSLOG_IDENT = "kiro2api";

/// XDG_DATA_HOME or ~/.local/share
std::string get_xdg_data_home() {
    const char* xdg = std::getenv("XDG_DATA_HOME");
    if (xdg && xdg[0] != '\0') {
        return xdg;
    }

    const char* home = std::getenv("HOME");
    if (home && home[0] != '\0') {
        return std::string(home) + "/.local/share";
    }

    return "/tmp";
}

LogTarget detect_best_target() {
#ifdef __linux__
#ifdef KIRO2API_HAS_SYSTEMD
    std::error_code ec;
    if (std::filesystem::exists("/run/systemd/journal/socket", ec)) {
        return LogTarget::Journal;
    }
#endif
    return LogTarget::Syslog;
#else
    return LogTarget::Console;
#endif
}

/// @return Error text if the sink could not be created, empty otherwise
std::string add_system_sink(std::vector<spdlog::sink_ptr>& sinks, LogTarget target,
                            const std::string& file_path) {
    switch (target) {
#ifdef __linux__
    case LogTarget::Journal:
#ifdef KIRO2API_HAS_SYSTEMD
        sinks.push_back(std::make_shared<spdlog::sinks::systemd_sink_mt>(SYSLOG_IDENT));
        break;
#endif
        // Without systemd support, journal falls through to syslog
    case LogTarget::Syslog:
        sinks.push_back(std::make_shared<spdlog::sinks::syslog_sink_mt>(SYSLOG_IDENT, LOG_PID,
                                                                        LOG_USER, false));
        break;
#else
    case LogTarget::Journal:
    case LogTarget::Syslog:
        break;
#endif
    case LogTarget::File: {
        std::string path = file_path.empty() ? default_log_file_path() : file_path;
        std::error_code ec;
        auto dir = std::filesystem::path(path).parent_path();
        if (!dir.empty()) {
            std::filesystem::create_directories(dir, ec);
        }
        try {
            // 5MB max size, 3 rotated files
            sinks.push_back(
                std::make_shared<spdlog::sinks::rotating_file_sink_mt>(path, 5 * 1024 * 1024, 3));
        } catch (const spdlog::spdlog_ex& e) {
            return "cannot open log file " + path + ": " + e.what();
        }
        break;
    }
    case LogTarget::Console:
    case LogTarget::Auto:
        break;
    }
    return {};
}

} // namespace

std::string default_log_file_path() {
    return get_xdg_data_home() + "/kiro2api/supervisor.log";
}

void init(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.enable_console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    }

    LogTarget effective_target =
        (config.target == LogTarget::Auto) ? detect_best_target() : config.target;

    std::string sink_error = add_system_sink(sinks, effective_target, config.file_path);
    if (!sink_error.empty() && sinks.empty()) {
        // Keep running on the console rather than logging nowhere
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    }

    auto logger = std::make_shared<spdlog::logger>("kiro2api", sinks.begin(), sinks.end());
    logger->set_level(config.level);
    spdlog::set_default_logger(logger);

    // Last 32 messages are dumped on fatal CLI errors
    spdlog::enable_backtrace(32);

    if (!sink_error.empty()) {
        spdlog::warn("[Logging] {}", sink_error);
    }
    spdlog::debug("[Logging] Initialized: target={}, console={}, backtrace=32 messages",
                  log_target_name(effective_target), config.enable_console ? "yes" : "no");
}

LogTarget parse_log_target(const std::string& str) {
    if (str == "journal")
        return LogTarget::Journal;
    if (str == "syslog")
        return LogTarget::Syslog;
    if (str == "file")
        return LogTarget::File;
    if (str == "console")
        return LogTarget::Console;
    return LogTarget::Auto;
}

const char* log_target_name(LogTarget target) {
    switch (target) {
    case LogTarget::Auto:
        return "auto";
    case LogTarget::Journal:
        return "journal";
    case LogTarget::Syslog:
        return "syslog";
    case LogTarget::File:
        return "file";
    case LogTarget::Console:
        return "console";
    }
    return "unknown";
}

} // namespace logging
} // namespace kiro2api
