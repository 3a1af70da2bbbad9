// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file child_process.h
 * @brief Spawned sidecar process handle (POSIX fork/exec)
 *
 * The child's stdout and stderr are appended to a log file. Exec failures
 * are reported back through a close-on-exec pipe, so spawn() only succeeds
 * once the new image is actually running.
 *
 * Teardown is explicit: owners call terminate(). The destructor repeats it
 * only as a last-resort safety net so a handle can never leak a process.
 */

#include "sidecar_error.h"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace kiro2api {

struct SpawnOptions {
    std::string executable;
    std::vector<std::string> args;   ///< Arguments after argv[0]
    std::string working_dir;         ///< Empty to inherit
    std::string log_path;            ///< Appended stdout+stderr (required)
    std::vector<std::pair<std::string, std::string>> env; ///< Added to inherited env
};

/**
 * @brief How a child ended
 */
struct ChildExit {
    bool was_signaled = false;
    int exit_code = 0;  ///< Valid when !was_signaled
    int signal_num = 0; ///< Valid when was_signaled
};

class ChildProcess {
  public:
    /**
     * @brief fork/exec a new child
     *
     * @param opts Executable, arguments, environment and log file
     * @param[out] out Handle to the running child
     * @return SUCCESS or SPAWN_FAILED (log file, fork or exec error text)
     */
    static SidecarError spawn(const SpawnOptions& opts, std::unique_ptr<ChildProcess>& out);

    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    int pid() const {
        return pid_;
    }

    /**
     * @brief Non-blocking liveness check
     *
     * Reaps the child if it has exited; the exit status is then available
     * from exit_status().
     */
    bool is_alive();

    /// Exit status once reaped
    const std::optional<ChildExit>& exit_status() const {
        return exit_;
    }

    /**
     * @brief Stop the child and reap it
     *
     * SIGTERM, wait up to @p grace, then SIGKILL and a blocking wait.
     * Safe to call repeatedly and on an already-exited child.
     */
    void terminate(std::chrono::milliseconds grace = std::chrono::milliseconds(1500));

  private:
    explicit ChildProcess(int pid) : pid_(pid) {}

    /// waitpid wrapper; records exit_ when the child has been reaped
    bool reap(bool block);

    int pid_;
    std::optional<ChildExit> exit_;
};

} // namespace kiro2api
