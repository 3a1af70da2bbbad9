// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "process_inspector_posix.h"

#include <spdlog/spdlog.h>

#include <array>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <signal.h>
#include <sstream>
#include <sys/types.h>
#include <sys/wait.h>

namespace kiro2api {

std::optional<std::string> ProcessInspectorPosix::exec_capture(const std::string& cmd,
                                                               int& exit_code) {
    spdlog::trace("[ProcessInspector] exec: {}", cmd);
    exit_code = -1;

    std::string full_cmd = cmd + " 2>/dev/null";
    FILE* pipe = popen(full_cmd.c_str(), "r");
    if (!pipe) {
        spdlog::debug("[ProcessInspector] popen failed for '{}': {}", cmd, strerror(errno));
        return std::nullopt;
    }

    std::string result;
    std::array<char, 512> buffer;
    while (fgets(buffer.data(), buffer.size(), pipe) != nullptr) {
        result += buffer.data();
    }

    int ret = pclose(pipe);
    exit_code = (ret != -1 && WIFEXITED(ret)) ? WEXITSTATUS(ret) : -1;
    return result;
}

SidecarError ProcessInspectorPosix::list_listeners(uint16_t port, std::vector<int>& pids) {
    pids.clear();

    int exit_code = -1;
    std::string cmd = "lsof -nP -iTCP:" + std::to_string(port) + " -sTCP:LISTEN -t";
    auto output = exec_capture(cmd, exit_code);
    if (!output) {
        return SidecarErrorHelper::process_query_failed(
            "failed to query listeners on port " + std::to_string(port) + ": " +
            strerror(errno));
    }

    if (exit_code != 0) {
        // lsof exits 1 when nothing matches
        if (exit_code == 1 && output->find_first_not_of(" \t\r\n") == std::string::npos) {
            return SidecarErrorHelper::success();
        }
        std::string reason = exit_code == 127 ? std::string("lsof not found")
                                              : "lsof exited with code " + std::to_string(exit_code);
        return SidecarErrorHelper::process_query_failed("failed to query listeners on port " +
                                                        std::to_string(port) + ": " + reason);
    }

    std::istringstream lines(*output);
    std::string line;
    while (std::getline(lines, line)) {
        try {
            size_t used = 0;
            int pid = std::stoi(line, &used);
            if (pid > 0) {
                pids.push_back(pid);
            }
        } catch (const std::exception&) {
            spdlog::trace("[ProcessInspector] Ignoring lsof line '{}'", line);
        }
    }

    spdlog::debug("[ProcessInspector] Port {}: {} listener(s)", port, pids.size());
    return SidecarErrorHelper::success();
}

std::optional<std::string> ProcessInspectorPosix::command_line_of(int pid) {
    int exit_code = -1;
    auto output = exec_capture("ps -p " + std::to_string(pid) + " -o command=", exit_code);
    if (!output || exit_code != 0) {
        return std::nullopt;
    }

    std::string cmdline = *output;
    while (!cmdline.empty() && (cmdline.back() == '\n' || cmdline.back() == '\r' ||
                                cmdline.back() == ' ' || cmdline.back() == '\t')) {
        cmdline.pop_back();
    }
    auto start = cmdline.find_first_not_of(" \t");
    if (start == std::string::npos) {
        return std::nullopt;
    }
    return cmdline.substr(start);
}

void ProcessInspectorPosix::terminate(int pid, bool forceful) {
    if (pid <= 0) {
        return;
    }
    int sig = forceful ? SIGKILL : SIGTERM;
    if (kill(pid, sig) != 0 && errno != ESRCH) {
        spdlog::warn("[ProcessInspector] kill({}, {}) failed: {}", pid, forceful ? "KILL" : "TERM",
                     strerror(errno));
    }
}

} // namespace kiro2api
