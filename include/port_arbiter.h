// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file port_arbiter.h
 * @brief Reclaims the sidecar port from stale instances of ourselves
 *
 * A listener on the target port is either "recognized" (its command line
 * carries one of our markers or looks like a sidecar) or "foreign". A foreign
 * listener is never signalled: arbitration fails with PORT_IN_USE. Recognized
 * listeners get SIGTERM, then SIGKILL if they are still listening after the
 * first grace period.
 */

#include "process_inspector.h"
#include "sidecar_error.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace kiro2api {

/**
 * @brief Grace periods between escalation steps
 */
struct ArbiterTiming {
    std::chrono::milliseconds term_grace{400}; ///< After SIGTERM
    std::chrono::milliseconds kill_grace{200}; ///< After SIGKILL
};

/**
 * @brief What arbitration did
 */
struct ArbitrationReport {
    bool check_skipped = false;    ///< Platform cannot enumerate listeners
    std::vector<int> recognized;   ///< Our listeners found on the port
    std::vector<int> terminated;   ///< Sent SIGTERM
    std::vector<int> force_killed; ///< Sent SIGKILL
};

/**
 * @brief Check a command line against the known sidecar signatures
 *
 * Matches "kiro-rs", "kiro2api", or a Node process running src/index.js
 * (the retired Node implementation).
 *
 * @param cmdline_lower Lowercased command line
 */
bool matches_sidecar_signature(const std::string& cmdline_lower);

class PortArbiter {
  public:
    using SleepFn = std::function<void(std::chrono::milliseconds)>;

    /**
     * @param inspector Platform inspector (not owned, must outlive the arbiter)
     * @param timing Grace periods
     * @param sleep Sleep function (tests substitute a no-op)
     */
    explicit PortArbiter(ProcessInspector& inspector, ArbiterTiming timing = {},
                         SleepFn sleep = {});

    /**
     * @brief Make the port free for a new instance
     *
     * Blocking: runs inspection commands and sleeps through grace periods.
     *
     * @param port Target TCP port
     * @param markers Strings identifying our own instances (resolved
     *        executable path, data directory); empty for signature-only matching
     * @param[out] report Optional details of what was done
     * @return SUCCESS, PORT_IN_USE, PORT_RELEASE_FAILED or PROCESS_QUERY_FAILED
     */
    SidecarError reclaim(uint16_t port, const std::vector<std::string>& markers,
                         ArbitrationReport* report = nullptr);

    /// Classify one listener
    bool is_recognized(int pid, const std::vector<std::string>& markers);

  private:
    SidecarError list_unique(uint16_t port, std::vector<int>& pids);

    ProcessInspector& inspector_;
    ArbiterTiming timing_;
    SleepFn sleep_;
};

} // namespace kiro2api
