// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file sidecar_supervisor.h
 * @brief Owns the single running sidecar instance
 *
 * State machine:
 *
 *     IDLE -> STARTING -> RUNNING -> STOPPING -> IDLE
 *                            \______________________/  (child exits on its own)
 *
 * start() runs Resolver -> Materializer -> Port Arbiter -> spawn, in that
 * order, and records the instance only after all of them succeeded. The
 * state lock is held only for in-memory mutation; resolution, file I/O,
 * arbitration, spawning and health probing all happen outside it.
 *
 * Every path that drops a RunningInstance also terminates and reaps its
 * process: stop(), the lazy liveness check, and shutdown().
 */

#include "child_process.h"
#include "health_prober.h"
#include "port_arbiter.h"
#include "process_inspector.h"
#include "runtime_resolver.h"
#include "sidecar_error.h"
#include "supervisor_settings.h"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "hv/json.hpp"

namespace kiro2api {

using json = nlohmann::json;

enum class SupervisorState { IDLE, STARTING, RUNNING, STOPPING };

const char* supervisor_state_name(SupervisorState state);

/**
 * @brief Per-start overrides; unset fields use SupervisorSettings defaults
 */
struct StartParams {
    std::optional<std::string> project_path; ///< Explicit runtime file or directory
    std::optional<uint16_t> port;
    std::optional<std::string> api_key;
    std::optional<std::string> admin_key;
    std::optional<std::string> data_dir;
    std::optional<std::string> region;
    std::optional<std::string> runtime_version;
    std::optional<std::string> proxy_url;
};

/**
 * @brief Composite status view returned by every supervisor operation
 */
struct SidecarStatus {
    bool running = false;
    std::optional<int> pid;
    std::optional<uint16_t> port;
    std::optional<std::string> url;
    std::optional<std::string> project_path; ///< Resolved executable
    std::optional<std::string> log_path;
    std::optional<std::string> shared_accounts_file;
    bool healthy = false;
    std::optional<std::string> message;
    SupervisorState state = SupervisorState::IDLE;

    json to_json() const;
};

/**
 * @brief The live child and the immutable facts recorded at spawn time
 */
struct RunningInstance {
    std::unique_ptr<ChildProcess> process;
    int pid = 0;
    uint16_t port = 0;
    std::string host;
    std::string executable_path;
    std::string data_dir;
    std::string log_file_path;
    std::string credential_source_path;
    std::string api_key;
};

class SidecarSupervisor {
  public:
    /**
     * @param settings Defaults, paths and timing
     * @param runtime Candidate locations for the sidecar executable
     * @param inspector Process discovery for port arbitration
     * @param prober Health probe implementation
     */
    SidecarSupervisor(SupervisorSettings settings, RuntimeDescriptor runtime,
                      std::unique_ptr<ProcessInspector> inspector,
                      std::unique_ptr<HealthProber> prober);

    /// Supervisor wired with the platform inspector and the libhv prober
    static std::unique_ptr<SidecarSupervisor> create(const SupervisorSettings& settings);

    /// Calls shutdown()
    ~SidecarSupervisor();

    SidecarSupervisor(const SidecarSupervisor&) = delete;
    SidecarSupervisor& operator=(const SidecarSupervisor&) = delete;

    /**
     * @brief Launch the sidecar
     *
     * @param params Per-start overrides
     * @param[out] status Status of the new instance on success
     * @return SUCCESS, ALREADY_RUNNING, LOCK_UNAVAILABLE, or the first failing
     *         step's error. On failure no instance is recorded.
     */
    SidecarError start(const StartParams& params, SidecarStatus& status);

    /**
     * @brief Current status, including a bounded health probe
     *
     * @return SUCCESS, or LOCK_UNAVAILABLE if the state lock timed out
     */
    SidecarError status(SidecarStatus& status);

    /**
     * @brief Stop the recorded instance and reclaim the port
     *
     * Terminates the recorded instance (if any), then re-runs port
     * arbitration on @p port using signature matching only. This catches a
     * sidecar left behind by a previous supervisor process.
     *
     * Refused with LOCK_UNAVAILABLE while a start() is between its port
     * check and recording its child; stop does not cancel that start.
     *
     * @param port Port to reclaim (default: recorded instance's, else configured)
     */
    SidecarError stop(std::optional<uint16_t> port, SidecarStatus& status);

    /**
     * @brief Explicit teardown
     *
     * Terminates and reaps any recorded instance. Blocks until the state
     * lock is available. Idempotent.
     */
    void shutdown();

    SupervisorState state() const {
        return state_.load();
    }

    const SupervisorSettings& settings() const {
        return settings_;
    }

  private:
    using Lock = std::unique_lock<std::timed_mutex>;

    /// Immutable copy of the recorded instance's facts (probe without the lock)
    struct Snapshot {
        int pid = 0;
        uint16_t port = 0;
        std::string host;
        std::string executable_path;
        std::string log_file_path;
        std::string credential_source_path;
        std::string api_key;
    };

    SidecarError acquire(Lock& lock, const char* operation);

    /// Lazy liveness check; must hold the lock
    void clear_if_exited_locked();

    std::optional<Snapshot> snapshot_locked() const;

    /// Terminate and reap outside the lock
    void teardown(std::unique_ptr<RunningInstance> instance);

    SidecarStatus build_status(const std::optional<Snapshot>& snapshot);

    SidecarError run_start_sequence(const StartParams& params,
                                    std::unique_ptr<RunningInstance>& out);

    SupervisorSettings settings_;
    RuntimeDescriptor runtime_;
    std::unique_ptr<ProcessInspector> inspector_;
    std::unique_ptr<HealthProber> prober_;

    std::timed_mutex mutex_;
    std::unique_ptr<RunningInstance> instance_;   ///< Guarded by mutex_
    std::optional<std::string> last_exit_message_; ///< Guarded by mutex_
    std::atomic<SupervisorState> state_{SupervisorState::IDLE};
};

} // namespace kiro2api
