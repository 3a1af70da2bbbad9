// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file main.cpp
 * @brief kiro2api-ctl: start, supervise, probe and stop the kiro-rs sidecar
 *
 * Exit codes: 0 success, 1 operation failed (or the sidecar died on its own
 * during 'run'), 2 invalid command line.
 */

#include "app_paths.h"
#include "cli_args.h"
#include "config.h"
#include "health_prober.h"
#include "logging_init.h"
#include "runtime_resolver.h"
#include "sidecar_supervisor.h"
#include "supervisor_settings.h"

#include <spdlog/spdlog.h>

#include <chrono>
#include <csignal>
#include <cstdio>
#include <thread>

#ifndef KIRO2API_VERSION
#define KIRO2API_VERSION "dev"
#endif

using namespace kiro2api;

namespace {

volatile sig_atomic_t g_quit = 0;

constexpr auto QUIT_POLL_INTERVAL = std::chrono::milliseconds(100);

void signal_handler(int sig) {
    (void)sig;
    g_quit = 1;
}

void setup_signal_handlers() {
    signal(SIGTERM, signal_handler);
    signal(SIGINT, signal_handler);
    // The child's exit is collected explicitly with waitpid
    signal(SIGCHLD, SIG_DFL);
}

spdlog::level::level_enum level_for_verbosity(int verbosity) {
    switch (verbosity) {
    case 0:
        return spdlog::level::warn;
    case 1:
        return spdlog::level::info;
    case 2:
        return spdlog::level::debug;
    default:
        return spdlog::level::trace;
    }
}

void print_json(const json& j) {
    printf("%s\n", j.dump(2).c_str());
    fflush(stdout);
}

int report_failure(const char* what, const SidecarError& err) {
    spdlog::error("[Main] {} failed: {}", what, err.message());
    spdlog::dump_backtrace();
    fprintf(stderr, "%s failed: %s\n", what, err.message().c_str());
    if (!err.suggestion.empty()) {
        fprintf(stderr, "Suggestion: %s\n", err.suggestion.c_str());
    }
    return 1;
}

/// Sleep up to @p duration, returning early on SIGINT/SIGTERM
void sleep_interruptible(std::chrono::milliseconds duration) {
    auto deadline = std::chrono::steady_clock::now() + duration;
    while (!g_quit && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(QUIT_POLL_INTERVAL);
    }
}

int run_command(const CliArgs& args, const SupervisorSettings& settings) {
    auto supervisor = SidecarSupervisor::create(settings);

    SidecarStatus status;
    SidecarError err = supervisor->start(args.start, status);
    if (!err) {
        return report_failure("start", err);
    }
    print_json(status.to_json());

    bool last_healthy = status.healthy;
    bool died = false;
    spdlog::info("[Main] Supervising sidecar PID {} (health check every {}s)",
                 status.pid.value_or(0), args.interval_sec);

    while (!g_quit) {
        sleep_interruptible(std::chrono::seconds(args.interval_sec));
        if (g_quit) {
            break;
        }

        err = supervisor->status(status);
        if (!err) {
            spdlog::warn("[Main] Status unavailable: {}", err.message());
            continue;
        }
        if (!status.running) {
            spdlog::error("[Main] {}", status.message.value_or("sidecar is no longer running"));
            died = true;
            break;
        }
        if (status.healthy != last_healthy) {
            if (status.healthy) {
                spdlog::info("[Main] Sidecar is healthy at {}", status.url.value_or(""));
            } else {
                spdlog::warn("[Main] Sidecar stopped responding at {}", status.url.value_or(""));
            }
            last_healthy = status.healthy;
        }
    }

    if (g_quit) {
        spdlog::info("[Main] Shutdown requested");
    }
    supervisor->shutdown();
    return died ? 1 : 0;
}

int stop_command(const CliArgs& args, const SupervisorSettings& settings) {
    auto supervisor = SidecarSupervisor::create(settings);

    SidecarStatus status;
    SidecarError err = supervisor->stop(args.start.port, status);
    if (!err) {
        return report_failure("stop", err);
    }
    print_json(status.to_json());
    return 0;
}

int probe_command(const CliArgs& args, const SupervisorSettings& settings) {
    HttpHealthProber prober(settings.health);

    ProbeTarget target;
    target.host = probe_host_for(settings.host);
    target.port = args.start.port.value_or(settings.default_port);
    target.api_key = args.start.api_key.value_or(settings.default_api_key);

    bool healthy = prober.probe_blocking(target);
    json j;
    j["url"] = "http://" + target.host + ":" + std::to_string(target.port) + settings.health.path;
    j["healthy"] = healthy;
    print_json(j);
    return healthy ? 0 : 1;
}

int paths_command(const CliArgs& args, const SupervisorSettings& settings,
                  const std::string& config_path) {
    json j;
    j["dataRoot"] = data_root();
    j["configFile"] = config_path;
    j["sharedAccountsFile"] = settings.account_store_path;
    j["dataDir"] = args.start.data_dir.value_or(settings.default_data_dir);
    j["platform"] = platform_arch_tag();

    RuntimeResolver resolver(
        RuntimeDescriptor::from_environment(settings.binary_name, settings.resource_dir));
    ResolvedRuntime runtime;
    SidecarError err = resolver.resolve(args.start.project_path.value_or(""), runtime);
    if (err) {
        j["runtime"] = runtime.path;
    } else {
        j["runtime"] = nullptr;
        j["runtimeError"] = err.message();
    }
    print_json(j);
    return err ? 0 : 1;
}

} // namespace

int main(int argc, char** argv) {
    setup_signal_handlers();

    CliArgs args;
    if (!parse_cli_args(argc, argv, args)) {
        print_usage(argv[0]);
        return args.help_requested ? 0 : 2;
    }

    // 'run' reports health transitions at info level by default
    int verbosity = args.verbosity;
    if (args.command == CliCommand::RUN && verbosity < 1) {
        verbosity = 1;
    }

    logging::LogConfig log_config;
    log_config.level = level_for_verbosity(verbosity);
    log_config.target = args.log_target;
    log_config.file_path = args.log_file;
    log_config.enable_console = true;
    logging::init(log_config);

    spdlog::debug("[Main] kiro2api-ctl {} ({})", KIRO2API_VERSION,
                  cli_command_name(args.command));

    std::string config_path = args.config_path.empty() ? default_config_path() : args.config_path;
    Config* config = Config::get_instance();
    config->init(config_path);
    SupervisorSettings settings = load_supervisor_settings(*config);

    switch (args.command) {
    case CliCommand::RUN:
        return run_command(args, settings);
    case CliCommand::STOP:
        return stop_command(args, settings);
    case CliCommand::PROBE:
        return probe_command(args, settings);
    case CliCommand::PATHS:
        return paths_command(args, settings, config_path);
    case CliCommand::NONE:
        break;
    }

    print_usage(argv[0]);
    return 2;
}
