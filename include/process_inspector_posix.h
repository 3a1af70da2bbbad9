// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "process_inspector.h"

#include <string>

namespace kiro2api {

/**
 * @brief POSIX process inspector (Linux, macOS)
 *
 * Uses external utilities for read-only queries:
 * - lsof -nP -iTCP:<port> -sTCP:LISTEN -t   (listeners, exit code 1 = none)
 * - ps -p <pid> -o command=                  (command line)
 *
 * Commands are run through popen(); the only interpolated values are
 * integers, so there is no shell injection surface. Signals go through
 * kill(2) directly.
 */
class ProcessInspectorPosix : public ProcessInspector {
  public:
    bool supports_port_enumeration() const override {
        return true;
    }
    SidecarError list_listeners(uint16_t port, std::vector<int>& pids) override;
    std::optional<std::string> command_line_of(int pid) override;
    void terminate(int pid, bool forceful) override;

  private:
    /**
     * @brief Run a read-only command and capture stdout
     *
     * @param cmd Shell command (stderr is redirected to /dev/null)
     * @param[out] exit_code Command exit code, -1 if it did not exit normally
     * @return Captured stdout, or std::nullopt if popen() failed
     */
    std::optional<std::string> exec_capture(const std::string& cmd, int& exit_code);
};

} // namespace kiro2api
