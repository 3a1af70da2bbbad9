// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "port_arbiter.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <thread>

namespace kiro2api {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

bool matches_sidecar_signature(const std::string& cmdline_lower) {
    return cmdline_lower.find("kiro-rs") != std::string::npos ||
           cmdline_lower.find("kiro2api") != std::string::npos ||
           (cmdline_lower.find("node") != std::string::npos &&
            cmdline_lower.find("src/index.js") != std::string::npos);
}

PortArbiter::PortArbiter(ProcessInspector& inspector, ArbiterTiming timing, SleepFn sleep)
    : inspector_(inspector), timing_(timing), sleep_(std::move(sleep)) {
    if (!sleep_) {
        sleep_ = [](std::chrono::milliseconds ms) { std::this_thread::sleep_for(ms); };
    }
}

bool PortArbiter::is_recognized(int pid, const std::vector<std::string>& markers) {
    auto cmdline = inspector_.command_line_of(pid);
    if (!cmdline) {
        return false;
    }

    std::string cmd = to_lower(*cmdline);
    for (const auto& marker : markers) {
        if (!marker.empty() && cmd.find(to_lower(marker)) != std::string::npos) {
            return true;
        }
    }
    return matches_sidecar_signature(cmd);
}

SidecarError PortArbiter::list_unique(uint16_t port, std::vector<int>& pids) {
    auto err = inspector_.list_listeners(port, pids);
    if (!err) {
        return err;
    }
    std::sort(pids.begin(), pids.end());
    pids.erase(std::unique(pids.begin(), pids.end()), pids.end());
    return err;
}

SidecarError PortArbiter::reclaim(uint16_t port, const std::vector<std::string>& markers,
                                  ArbitrationReport* report) {
    ArbitrationReport local;
    ArbitrationReport& rep = report ? *report : local;
    rep = ArbitrationReport{};

    if (!inspector_.supports_port_enumeration()) {
        rep.check_skipped = true;
        spdlog::debug("[PortArbiter] Port {} check skipped (no listener enumeration)", port);
        return SidecarErrorHelper::success();
    }

    std::vector<int> pids;
    auto err = list_unique(port, pids);
    if (!err) {
        return err;
    }
    if (pids.empty()) {
        return SidecarErrorHelper::success();
    }

    std::vector<int> foreign;
    for (int pid : pids) {
        if (is_recognized(pid, markers)) {
            rep.recognized.push_back(pid);
        } else {
            foreign.push_back(pid);
        }
    }

    if (!foreign.empty()) {
        spdlog::error("[PortArbiter] Port {} held by foreign process(es) {}", port,
                      format_pid_list(foreign));
        return SidecarErrorHelper::port_in_use(port, foreign);
    }

    spdlog::info("[PortArbiter] Terminating stale sidecar process(es) {} on port {}",
                 format_pid_list(rep.recognized), port);
    for (int pid : rep.recognized) {
        inspector_.terminate(pid, false);
        rep.terminated.push_back(pid);
    }
    sleep_(timing_.term_grace);

    err = list_unique(port, pids);
    if (!err) {
        return err;
    }
    for (int pid : pids) {
        if (is_recognized(pid, markers)) {
            spdlog::warn("[PortArbiter] PID {} ignored SIGTERM, sending SIGKILL", pid);
            inspector_.terminate(pid, true);
            rep.force_killed.push_back(pid);
        }
    }
    sleep_(timing_.kill_grace);

    err = list_unique(port, pids);
    if (!err) {
        return err;
    }
    if (!pids.empty()) {
        spdlog::error("[PortArbiter] Port {} still held by {}", port, format_pid_list(pids));
        return SidecarErrorHelper::port_release_failed(port, pids);
    }

    spdlog::info("[PortArbiter] Port {} released", port);
    return SidecarErrorHelper::success();
}

} // namespace kiro2api
