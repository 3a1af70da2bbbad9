// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <string>
#include <utility>
#include <vector>

/**
 * @file sidecar_error.h
 * @brief Error types and helpers for sidecar supervision
 *
 * Every fallible step of the start/stop sequence returns a SidecarError.
 * The technical message carries the diagnostic detail (checked paths, PIDs,
 * OS error text); the user message is short enough for a status line.
 */

namespace kiro2api {

/**
 * @brief Sidecar operation result codes
 */
enum class SidecarResult {
    SUCCESS = 0, ///< Operation succeeded

    // Start sequence
    RUNTIME_NOT_FOUND,     ///< No usable sidecar executable found
    CONFIG_MISSING,        ///< Shared account store does not exist
    CONFIG_INVALID,        ///< Shared account store could not be read or parsed
    NO_USABLE_CREDENTIALS, ///< No account carries a usable secret

    // Port arbitration
    PORT_IN_USE,          ///< Port held by a process we do not recognize
    PORT_RELEASE_FAILED,  ///< Our own stale instance would not release the port
    PROCESS_QUERY_FAILED, ///< Listener enumeration could not be performed

    // Supervisor state
    ALREADY_RUNNING,  ///< An instance is alive or a start is in progress
    SPAWN_FAILED,     ///< fork/exec of the sidecar failed
    LOCK_UNAVAILABLE, ///< Supervisor state lock could not be acquired

    IO_ERROR ///< Data directory or snapshot file could not be written
};

/**
 * @brief Get string representation of a sidecar result
 * @param result The result code
 * @return Stable display name for the result
 */
inline const char* sidecar_result_to_string(SidecarResult result) {
    switch (result) {
    case SidecarResult::SUCCESS:
        return "Success";
    case SidecarResult::RUNTIME_NOT_FOUND:
        return "Runtime Not Found";
    case SidecarResult::CONFIG_MISSING:
        return "Config Missing";
    case SidecarResult::CONFIG_INVALID:
        return "Config Invalid";
    case SidecarResult::NO_USABLE_CREDENTIALS:
        return "No Usable Credentials";
    case SidecarResult::PORT_IN_USE:
        return "Port In Use";
    case SidecarResult::PORT_RELEASE_FAILED:
        return "Port Release Failed";
    case SidecarResult::PROCESS_QUERY_FAILED:
        return "Process Query Failed";
    case SidecarResult::ALREADY_RUNNING:
        return "Already Running";
    case SidecarResult::SPAWN_FAILED:
        return "Spawn Failed";
    case SidecarResult::LOCK_UNAVAILABLE:
        return "Lock Unavailable";
    case SidecarResult::IO_ERROR:
        return "I/O Error";
    }
    return "Unknown Error";
}

/**
 * @brief Detailed error information for sidecar operations
 */
struct SidecarError {
    SidecarResult result;      ///< Primary error code
    std::string technical_msg; ///< Technical details for logging/debugging
    std::string user_msg;      ///< Short message for status display
    std::string suggestion;    ///< Suggested recovery action (optional)
    std::vector<int> pids;     ///< Processes involved (port errors only)

    SidecarError(SidecarResult r = SidecarResult::SUCCESS, const std::string& tech = "",
                 const std::string& user = "", const std::string& suggest = "",
                 std::vector<int> involved = {})
        : result(r), technical_msg(tech), user_msg(user), suggestion(suggest),
          pids(std::move(involved)) {}

    [[nodiscard]] bool success() const {
        return result == SidecarResult::SUCCESS;
    }

    operator bool() const {
        return success();
    }

    /**
     * @brief Message returned to command-surface callers
     *
     * The technical message is preferred since it carries the detail needed to
     * self-diagnose; the user message is the fallback.
     */
    [[nodiscard]] const std::string& message() const {
        return technical_msg.empty() ? user_msg : technical_msg;
    }
};

/// Render a PID list as "[1, 2, 3]"
std::string format_pid_list(const std::vector<int>& pids);

/**
 * @brief Utility class for creating sidecar errors with consistent wording
 */
class SidecarErrorHelper {
  public:
    static SidecarError runtime_not_found(const std::string& detail) {
        return SidecarError(SidecarResult::RUNTIME_NOT_FOUND, detail,
                            "Sidecar executable not found",
                            "Reinstall the bundled runtime or set a custom runtime path");
    }

    static SidecarError config_missing(const std::string& path) {
        return SidecarError(SidecarResult::CONFIG_MISSING,
                            "shared accounts file not found: " + path,
                            "Account store not found", "Add an account in the account manager");
    }

    static SidecarError config_invalid(const std::string& detail) {
        return SidecarError(SidecarResult::CONFIG_INVALID, detail, "Account store is unreadable",
                            "Retry once the account manager has finished saving");
    }

    static SidecarError no_usable_credentials() {
        return SidecarError(SidecarResult::NO_USABLE_CREDENTIALS,
                            "no valid account with refresh token found in shared accounts file",
                            "No usable account credentials",
                            "Log in to at least one account first");
    }

    static SidecarError port_in_use(int port, const std::vector<int>& pids) {
        return SidecarError(SidecarResult::PORT_IN_USE,
                            "port " + std::to_string(port) +
                                " is already in use by non-sidecar process(es): " +
                                format_pid_list(pids),
                            "Port " + std::to_string(port) + " is used by another program",
                            "Choose a different port or stop the other program", pids);
    }

    static SidecarError port_release_failed(int port, const std::vector<int>& pids) {
        return SidecarError(SidecarResult::PORT_RELEASE_FAILED,
                            "failed to release port " + std::to_string(port) +
                                " after terminating stale sidecar process(es): " +
                                format_pid_list(pids),
                            "Previous sidecar instance did not exit", "", pids);
    }

    static SidecarError process_query_failed(const std::string& detail) {
        return SidecarError(SidecarResult::PROCESS_QUERY_FAILED, detail,
                            "Could not inspect port listeners",
                            "Make sure lsof and ps are installed");
    }

    static SidecarError already_running(const std::string& detail) {
        return SidecarError(SidecarResult::ALREADY_RUNNING, detail, "Sidecar is already running");
    }

    static SidecarError spawn_failed(const std::string& detail) {
        return SidecarError(SidecarResult::SPAWN_FAILED, detail, "Failed to start sidecar");
    }

    static SidecarError lock_unavailable(const std::string& detail) {
        return SidecarError(SidecarResult::LOCK_UNAVAILABLE, detail, "Supervisor is busy",
                            "Try again in a moment");
    }

    static SidecarError io_error(const std::string& detail) {
        return SidecarError(SidecarResult::IO_ERROR, detail, "Failed to write sidecar files");
    }

    static SidecarError success() {
        return SidecarError(SidecarResult::SUCCESS);
    }
};

} // namespace kiro2api
