// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file cli_args.h
 * @brief Command-line argument parsing for kiro2api-ctl
 */

#include "logging_init.h"
#include "sidecar_supervisor.h"

#include <cstdint>
#include <optional>
#include <string>

namespace kiro2api {

enum class CliCommand { NONE, RUN, STOP, PROBE, PATHS };

/**
 * @brief Parsed command-line arguments
 */
struct CliArgs {
    CliCommand command = CliCommand::NONE;

    // Start overrides (only set fields override the config file)
    StartParams start;

    std::string config_path; // empty = platform default
    int interval_sec = 10;   // run: health check interval

    // Logging
    int verbosity = 0;
    logging::LogTarget log_target = logging::LogTarget::Console;
    std::string log_file;

    bool help_requested = false;
};

/**
 * @brief Parse command-line arguments
 *
 * Errors are printed to stderr.
 *
 * @param argc Argument count
 * @param argv Argument values
 * @param args Output: parsed arguments
 * @return true on success, false if help was requested or input was invalid
 *         (check args.help_requested to tell them apart)
 */
bool parse_cli_args(int argc, const char* const* argv, CliArgs& args);

void print_usage(const char* program_name);

const char* cli_command_name(CliCommand command);

} // namespace kiro2api
