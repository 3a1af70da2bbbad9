// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "sidecar_supervisor.h"

#include "credential_materializer.h"

#include <spdlog/spdlog.h>

#include <cstring>
#include <filesystem>

namespace fs = std::filesystem;

namespace kiro2api {

namespace {

/// Slack on top of the HTTP timeout before the probe is abandoned
constexpr auto PROBE_WAIT_MARGIN = std::chrono::milliseconds(500);

std::string trimmed(const std::string& s) {
    const char* ws = " \t\r\n";
    auto start = s.find_first_not_of(ws);
    if (start == std::string::npos) {
        return {};
    }
    auto end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

/// Trimmed override, or the fallback when unset or blank
std::string value_or_default(const std::optional<std::string>& value,
                             const std::string& fallback) {
    if (value) {
        std::string t = trimmed(*value);
        if (!t.empty()) {
            return t;
        }
    }
    return fallback;
}

std::string describe_exit(int pid, const ChildExit& exit) {
    if (exit.was_signaled) {
        return "sidecar (PID " + std::to_string(pid) + ") was killed by signal " +
               std::to_string(exit.signal_num) + " (" + strsignal(exit.signal_num) + ")";
    }
    return "sidecar (PID " + std::to_string(pid) + ") exited with code " +
           std::to_string(exit.exit_code);
}

} // namespace

const char* supervisor_state_name(SupervisorState state) {
    switch (state) {
    case SupervisorState::IDLE:
        return "idle";
    case SupervisorState::STARTING:
        return "starting";
    case SupervisorState::RUNNING:
        return "running";
    case SupervisorState::STOPPING:
        return "stopping";
    }
    return "unknown";
}

json SidecarStatus::to_json() const {
    json j;
    j["running"] = running;
    j["pid"] = pid ? json(*pid) : json(nullptr);
    j["port"] = port ? json(*port) : json(nullptr);
    j["url"] = url ? json(*url) : json(nullptr);
    j["projectPath"] = project_path ? json(*project_path) : json(nullptr);
    j["logPath"] = log_path ? json(*log_path) : json(nullptr);
    j["sharedAccountsFile"] = shared_accounts_file ? json(*shared_accounts_file) : json(nullptr);
    j["healthy"] = healthy;
    j["message"] = message ? json(*message) : json(nullptr);
    j["state"] = supervisor_state_name(state);
    return j;
}

SidecarSupervisor::SidecarSupervisor(SupervisorSettings settings, RuntimeDescriptor runtime,
                                     std::unique_ptr<ProcessInspector> inspector,
                                     std::unique_ptr<HealthProber> prober)
    : settings_(std::move(settings)), runtime_(std::move(runtime)),
      inspector_(std::move(inspector)), prober_(std::move(prober)) {
    if (!inspector_) {
        inspector_ = std::make_unique<ProcessInspectorNoop>();
    }
    if (!prober_) {
        prober_ = std::make_unique<HttpHealthProber>(settings_.health);
    }
    spdlog::debug("[Supervisor] Created (runtime '{}', default port {})", runtime_.binary_name,
                  settings_.default_port);
}

std::unique_ptr<SidecarSupervisor> SidecarSupervisor::create(const SupervisorSettings& settings) {
    return std::make_unique<SidecarSupervisor>(
        settings, RuntimeDescriptor::from_environment(settings.binary_name, settings.resource_dir),
        ProcessInspector::create(), std::make_unique<HttpHealthProber>(settings.health));
}

SidecarSupervisor::~SidecarSupervisor() {
    shutdown();
    prober_->cancel_all();
}

SidecarError SidecarSupervisor::acquire(Lock& lock, const char* operation) {
    lock = Lock(mutex_, std::defer_lock);
    if (!lock.try_lock_for(settings_.lock_timeout)) {
        spdlog::warn("[Supervisor] {}: state lock not acquired within {}ms", operation,
                     settings_.lock_timeout.count());
        return SidecarErrorHelper::lock_unavailable(
            std::string("supervisor state lock unavailable during ") + operation);
    }
    return SidecarErrorHelper::success();
}

void SidecarSupervisor::clear_if_exited_locked() {
    if (!instance_ || instance_->process->is_alive()) {
        return;
    }

    // is_alive() has reaped the child; dropping the handle does not block
    const auto& exit = instance_->process->exit_status();
    std::string message = exit ? describe_exit(instance_->pid, *exit)
                               : "sidecar (PID " + std::to_string(instance_->pid) + ") exited";
    spdlog::warn("[Supervisor] {}", message);
    last_exit_message_ = message;
    instance_.reset();

    SupervisorState expected = SupervisorState::RUNNING;
    state_.compare_exchange_strong(expected, SupervisorState::IDLE);
}

std::optional<SidecarSupervisor::Snapshot> SidecarSupervisor::snapshot_locked() const {
    if (!instance_) {
        return std::nullopt;
    }
    Snapshot snap;
    snap.pid = instance_->pid;
    snap.port = instance_->port;
    snap.host = instance_->host;
    snap.executable_path = instance_->executable_path;
    snap.log_file_path = instance_->log_file_path;
    snap.credential_source_path = instance_->credential_source_path;
    snap.api_key = instance_->api_key;
    return snap;
}

void SidecarSupervisor::teardown(std::unique_ptr<RunningInstance> instance) {
    if (!instance) {
        return;
    }
    spdlog::info("[Supervisor] Stopping sidecar (PID {})", instance->pid);
    instance->process->terminate(settings_.stop_grace);
}

SidecarStatus SidecarSupervisor::build_status(const std::optional<Snapshot>& snapshot) {
    SidecarStatus status;
    status.state = state_.load();

    if (!snapshot) {
        return status;
    }

    status.running = true;
    status.pid = snapshot->pid;
    status.port = snapshot->port;
    std::string probe_host = probe_host_for(snapshot->host);
    status.url = "http://" + probe_host + ":" + std::to_string(snapshot->port);
    status.project_path = snapshot->executable_path;
    status.log_path = snapshot->log_file_path;
    status.shared_accounts_file = snapshot->credential_source_path;

    ProbeTarget target;
    target.host = probe_host;
    target.port = snapshot->port;
    target.api_key = snapshot->api_key;
    status.healthy = prober_->probe(
        target, std::chrono::milliseconds(settings_.health.timeout_ms) + PROBE_WAIT_MARGIN);
    if (!status.healthy) {
        status.message = "sidecar is running but not responding on " + *status.url;
    }
    return status;
}

SidecarError SidecarSupervisor::run_start_sequence(const StartParams& params,
                                                   std::unique_ptr<RunningInstance>& out) {
    // 1. Resolve the runtime
    RuntimeResolver resolver(runtime_);
    ResolvedRuntime runtime;
    SidecarError err = resolver.resolve(params.project_path.value_or(""), runtime);
    if (!err) {
        return err;
    }
    err = ensure_executable(runtime.path);
    if (!err) {
        return err;
    }

    // 2. Materialize config + credentials
    LaunchConfig config;
    config.host = settings_.host;
    config.port =
        (params.port && *params.port != 0) ? *params.port : settings_.default_port;
    config.region = value_or_default(params.region, settings_.default_region);
    config.runtime_version =
        value_or_default(params.runtime_version, settings_.default_runtime_version);
    config.api_key = value_or_default(params.api_key, settings_.default_api_key);
    config.admin_key = value_or_default(params.admin_key, settings_.default_admin_key);
    std::string proxy = value_or_default(params.proxy_url, "");
    if (!proxy.empty()) {
        config.proxy_url = proxy;
    }
    config.load_balancing_mode = settings_.load_balancing_mode;
    config.tls_backend = settings_.tls_backend;

    std::string data_dir = value_or_default(params.data_dir, settings_.default_data_dir);

    MaterializedFiles files;
    size_t credential_count = 0;
    err = materialize(settings_.account_store_path, data_dir, config, files, &credential_count);
    if (!err) {
        return err;
    }

    // 3. Reclaim the port from any stale instance of ours
    PortArbiter arbiter(*inspector_, settings_.arbiter);
    ArbitrationReport report;
    err = arbiter.reclaim(config.port, {runtime.path, data_dir}, &report);
    if (!err) {
        return err;
    }
    if (report.check_skipped) {
        spdlog::warn("[Supervisor] Port {} ownership check skipped on this platform",
                     config.port);
    }

    // 4. Spawn
    SpawnOptions spawn_opts;
    spawn_opts.executable = runtime.path;
    spawn_opts.args = {"--config", files.config_path, "--credentials", files.credentials_path};
    spawn_opts.working_dir = data_dir;
    spawn_opts.log_path = (fs::path(data_dir) / settings_.log_file_name).string();
    spawn_opts.env = {{"RUST_LOG", settings_.child_log_level}};

    std::unique_ptr<ChildProcess> child;
    err = ChildProcess::spawn(spawn_opts, child);
    if (!err) {
        return err;
    }

    auto instance = std::make_unique<RunningInstance>();
    instance->pid = child->pid();
    instance->process = std::move(child);
    instance->port = config.port;
    instance->host = config.host;
    instance->executable_path = runtime.path;
    instance->data_dir = data_dir;
    instance->log_file_path = spawn_opts.log_path;
    instance->credential_source_path = settings_.account_store_path;
    instance->api_key = config.api_key;

    spdlog::info("[Supervisor] Sidecar started: PID {}, port {}, {} credential(s)",
                 instance->pid, instance->port, credential_count);
    out = std::move(instance);
    return SidecarErrorHelper::success();
}

SidecarError SidecarSupervisor::start(const StartParams& params, SidecarStatus& status) {
    status = SidecarStatus{};
    status.state = state_.load();

    {
        Lock lock;
        SidecarError err = acquire(lock, "start");
        if (!err) {
            return err;
        }
        clear_if_exited_locked();

        if (instance_) {
            return SidecarErrorHelper::already_running(
                "sidecar is already running (PID " + std::to_string(instance_->pid) + ", port " +
                std::to_string(instance_->port) + ")");
        }
        SupervisorState current = state_.load();
        if (current == SupervisorState::STARTING) {
            return SidecarErrorHelper::already_running("start already in progress");
        }
        if (current == SupervisorState::STOPPING) {
            return SidecarErrorHelper::already_running("stop in progress");
        }
        state_ = SupervisorState::STARTING;
        last_exit_message_.reset();
    }

    std::unique_ptr<RunningInstance> instance;
    SidecarError err = run_start_sequence(params, instance);
    if (!err) {
        spdlog::error("[Supervisor] Start failed: {}", err.message());
        state_ = SupervisorState::IDLE;
        status.state = SupervisorState::IDLE;
        return err;
    }

    // Record immediately; a spawned child must never be left untracked
    std::optional<Snapshot> snapshot;
    {
        Lock lock;
        err = acquire(lock, "start (record)");
        if (!err) {
            state_ = SupervisorState::IDLE;
            teardown(std::move(instance));
            status.state = SupervisorState::IDLE;
            return err;
        }
        instance_ = std::move(instance);
        state_ = SupervisorState::RUNNING;
        snapshot = snapshot_locked();
    }

    status = build_status(snapshot);
    return SidecarErrorHelper::success();
}

SidecarError SidecarSupervisor::status(SidecarStatus& status) {
    status = SidecarStatus{};

    std::optional<Snapshot> snapshot;
    std::optional<std::string> exit_message;
    {
        Lock lock;
        SidecarError err = acquire(lock, "status");
        if (!err) {
            status.state = state_.load();
            return err;
        }
        clear_if_exited_locked();
        snapshot = snapshot_locked();
        exit_message = last_exit_message_;
    }

    status = build_status(snapshot);
    if (!snapshot && exit_message) {
        status.message = exit_message;
    }
    return SidecarErrorHelper::success();
}

SidecarError SidecarSupervisor::stop(std::optional<uint16_t> port, SidecarStatus& status) {
    status = SidecarStatus{};
    status.state = state_.load();

    std::unique_ptr<RunningInstance> instance;
    {
        Lock lock;
        SidecarError err = acquire(lock, "stop");
        if (!err) {
            return err;
        }
        clear_if_exited_locked();
        // The in-flight start has not recorded its child yet; a port sweep now
        // could signal it while start goes on to report it running
        if (!instance_ && state_.load() == SupervisorState::STARTING) {
            status.state = SupervisorState::STARTING;
            return SidecarErrorHelper::lock_unavailable("start in progress, stop again once it "
                                                        "completes");
        }
        if (instance_) {
            instance = std::move(instance_);
            state_ = SupervisorState::STOPPING;
        }
        last_exit_message_.reset();
    }

    uint16_t target_port = settings_.default_port;
    if (port && *port != 0) {
        target_port = *port;
    } else if (instance) {
        target_port = instance->port;
    }

    if (instance) {
        teardown(std::move(instance));
        SupervisorState expected = SupervisorState::STOPPING;
        state_.compare_exchange_strong(expected, SupervisorState::IDLE);
    } else {
        spdlog::debug("[Supervisor] stop: no recorded instance");
    }

    // Signature-only sweep catches a sidecar orphaned by a previous supervisor
    PortArbiter arbiter(*inspector_, settings_.arbiter);
    SidecarError err = arbiter.reclaim(target_port, {});
    status.state = state_.load();
    if (!err) {
        spdlog::warn("[Supervisor] Port {} not reclaimed: {}", target_port, err.message());
        return err;
    }

    spdlog::info("[Supervisor] Sidecar stopped (port {})", target_port);
    return SidecarErrorHelper::success();
}

void SidecarSupervisor::shutdown() {
    std::unique_ptr<RunningInstance> instance;
    {
        std::lock_guard<std::timed_mutex> lock(mutex_);
        instance = std::move(instance_);
        if (instance) {
            state_ = SupervisorState::STOPPING;
        }
    }

    if (instance) {
        spdlog::info("[Supervisor] Shutdown: terminating sidecar (PID {})", instance->pid);
        teardown(std::move(instance));
        SupervisorState expected = SupervisorState::STOPPING;
        state_.compare_exchange_strong(expected, SupervisorState::IDLE);
    }
}

} // namespace kiro2api
