// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "cli_args.h"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace kiro2api {

namespace {

// Helper to parse integer with validation
bool parse_int(const char* str, long min_val, long max_val, int& out, const char* name) {
    char* endptr;
    errno = 0;
    long val = strtol(str, &endptr, 10);
    if (*str == '\0' || *endptr != '\0' || errno != 0 || val < min_val || val > max_val) {
        fprintf(stderr, "Error: invalid %s (must be %ld-%ld): %s\n", name, min_val, max_val, str);
        return false;
    }
    out = static_cast<int>(val);
    return true;
}

bool parse_port(const char* str, std::optional<uint16_t>& out) {
    int port = 0;
    if (!parse_int(str, 1, 65535, port, "port")) {
        return false;
    }
    out = static_cast<uint16_t>(port);
    return true;
}

/// Fetch the value of an option that requires one
bool take_value(int argc, const char* const* argv, int& i, const char*& value) {
    if (i + 1 >= argc) {
        fprintf(stderr, "Error: %s requires an argument\n", argv[i]);
        return false;
    }
    value = argv[++i];
    return true;
}

bool parse_command(const char* word, CliCommand& out) {
    if (strcmp(word, "run") == 0) {
        out = CliCommand::RUN;
    } else if (strcmp(word, "stop") == 0) {
        out = CliCommand::STOP;
    } else if (strcmp(word, "probe") == 0) {
        out = CliCommand::PROBE;
    } else if (strcmp(word, "paths") == 0) {
        out = CliCommand::PATHS;
    } else {
        return false;
    }
    return true;
}

} // namespace

void print_usage(const char* program_name) {
    printf("Usage: %s <command> [options]\n", program_name);
    printf("Commands:\n");
    printf("  run                    Start the sidecar and supervise it in the foreground\n");
    printf("  stop                   Stop any sidecar instance listening on the port\n");
    printf("  probe                  Run one health probe (exit 0 if healthy)\n");
    printf("  paths                  Print resolved data and runtime paths\n");
    printf("Options:\n");
    printf("  --project-path <path>  Custom sidecar executable or build directory\n");
    printf("  --port <n>             TCP port (1-65535)\n");
    printf("  --api-key <key>        API key clients must present\n");
    printf("  --admin-key <key>      Admin API key\n");
    printf("  --data-dir <dir>       Directory for config, credentials and log\n");
    printf("  --region <region>      Default region for accounts without one\n");
    printf("  --runtime-version <v>  Version string reported to the upstream service\n");
    printf("  --proxy-url <url>      Outbound proxy for the sidecar\n");
    printf("  --config <file>        Supervisor configuration file\n");
    printf("  --interval <sec>       Health check interval for 'run' (default: 10)\n");
    printf("  -v, --verbose          Increase verbosity (-v=info, -vv=debug, -vvv=trace)\n");
    printf("  --log-target <target>  Log destination: auto, journal, syslog, file, console\n");
    printf("  --log-file <path>      Log file path (when --log-target=file)\n");
    printf("  -h, --help             Show this help message\n");
}

const char* cli_command_name(CliCommand command) {
    switch (command) {
    case CliCommand::NONE:
        return "none";
    case CliCommand::RUN:
        return "run";
    case CliCommand::STOP:
        return "stop";
    case CliCommand::PROBE:
        return "probe";
    case CliCommand::PATHS:
        return "paths";
    }
    return "unknown";
}

bool parse_cli_args(int argc, const char* const* argv, CliArgs& args) {
    for (int i = 1; i < argc; i++) {
        const char* arg = argv[i];
        const char* value = nullptr;

        if (strcmp(arg, "-h") == 0 || strcmp(arg, "--help") == 0) {
            args.help_requested = true;
            return false;
        }
        // Verbosity: -v, -vv, -vvv or repeated --verbose
        else if (strcmp(arg, "--verbose") == 0) {
            args.verbosity++;
        } else if (arg[0] == '-' && arg[1] == 'v' && strspn(arg + 1, "v") == strlen(arg + 1)) {
            args.verbosity += static_cast<int>(strlen(arg + 1));
        }
        // Start overrides
        else if (strcmp(arg, "--project-path") == 0) {
            if (!take_value(argc, argv, i, value))
                return false;
            args.start.project_path = value;
        } else if (strcmp(arg, "--port") == 0) {
            if (!take_value(argc, argv, i, value) || !parse_port(value, args.start.port))
                return false;
        } else if (strcmp(arg, "--api-key") == 0) {
            if (!take_value(argc, argv, i, value))
                return false;
            args.start.api_key = value;
        } else if (strcmp(arg, "--admin-key") == 0) {
            if (!take_value(argc, argv, i, value))
                return false;
            args.start.admin_key = value;
        } else if (strcmp(arg, "--data-dir") == 0) {
            if (!take_value(argc, argv, i, value))
                return false;
            args.start.data_dir = value;
        } else if (strcmp(arg, "--region") == 0) {
            if (!take_value(argc, argv, i, value))
                return false;
            args.start.region = value;
        } else if (strcmp(arg, "--runtime-version") == 0) {
            if (!take_value(argc, argv, i, value))
                return false;
            args.start.runtime_version = value;
        } else if (strcmp(arg, "--proxy-url") == 0) {
            if (!take_value(argc, argv, i, value))
                return false;
            args.start.proxy_url = value;
        }
        // Supervisor options
        else if (strcmp(arg, "--config") == 0) {
            if (!take_value(argc, argv, i, value))
                return false;
            args.config_path = value;
        } else if (strcmp(arg, "--interval") == 0) {
            if (!take_value(argc, argv, i, value) ||
                !parse_int(value, 1, 3600, args.interval_sec, "interval"))
                return false;
        } else if (strcmp(arg, "--log-target") == 0) {
            if (!take_value(argc, argv, i, value))
                return false;
            args.log_target = logging::parse_log_target(value);
        } else if (strcmp(arg, "--log-file") == 0) {
            if (!take_value(argc, argv, i, value))
                return false;
            args.log_file = value;
        }
        // Positional command
        else if (arg[0] != '-') {
            CliCommand command;
            if (args.command != CliCommand::NONE) {
                fprintf(stderr, "Error: unexpected argument: %s\n", arg);
                return false;
            }
            if (!parse_command(arg, command)) {
                fprintf(stderr, "Error: unknown command: %s\n", arg);
                return false;
            }
            args.command = command;
        } else {
            fprintf(stderr, "Error: unknown option: %s\n", arg);
            return false;
        }
    }

    if (args.command == CliCommand::NONE) {
        fprintf(stderr, "Error: no command given\n");
        return false;
    }
    return true;
}

} // namespace kiro2api
