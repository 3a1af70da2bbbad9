// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file process_inspector.h
 * @brief OS process discovery used by port arbitration
 *
 * Small capability interface over the platform's process inspection tools.
 * Concrete implementations:
 * - ProcessInspectorPosix: lsof/ps for queries, kill(2) for signals
 * - ProcessInspectorNoop: platforms without port enumeration (always empty)
 * - MockProcessInspector (tests): scripted listeners, records signals
 */

#include "sidecar_error.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kiro2api {

class ProcessInspector {
  public:
    virtual ~ProcessInspector() = default;

    /**
     * @brief Whether listener enumeration is implemented on this platform
     *
     * When false, list_listeners() always reports an empty port and port
     * arbitration degrades to a no-op.
     */
    virtual bool supports_port_enumeration() const = 0;

    /**
     * @brief Enumerate PIDs listening on a TCP port
     *
     * An unused port is success with an empty list.
     *
     * @param port TCP port
     * @param[out] pids Listening PIDs (may contain duplicates)
     * @return SUCCESS or PROCESS_QUERY_FAILED
     */
    virtual SidecarError list_listeners(uint16_t port, std::vector<int>& pids) = 0;

    /**
     * @brief Full command line of a process
     *
     * @return Command line, or std::nullopt if the process is gone or unreadable
     */
    virtual std::optional<std::string> command_line_of(int pid) = 0;

    /**
     * @brief Deliver a termination signal
     *
     * Best-effort: a process that already exited is not an error.
     *
     * @param pid Target process
     * @param forceful false for graceful (SIGTERM), true for SIGKILL
     */
    virtual void terminate(int pid, bool forceful) = 0;

    /**
     * @brief Create the inspector for the current platform
     *
     * POSIX systems get ProcessInspectorPosix; everything else gets the no-op.
     */
    static std::unique_ptr<ProcessInspector> create();
};

/**
 * @brief Inspector for platforms without port enumeration support
 */
class ProcessInspectorNoop : public ProcessInspector {
  public:
    bool supports_port_enumeration() const override {
        return false;
    }
    SidecarError list_listeners(uint16_t port, std::vector<int>& pids) override;
    std::optional<std::string> command_line_of(int pid) override;
    void terminate(int pid, bool forceful) override;
};

} // namespace kiro2api
