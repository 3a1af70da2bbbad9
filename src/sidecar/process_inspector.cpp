// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "process_inspector.h"

#include <spdlog/spdlog.h>

#if defined(__unix__) || defined(__APPLE__)
#include "process_inspector_posix.h"
#define KIRO2API_HAS_POSIX_INSPECTOR 1
#endif

namespace kiro2api {

std::unique_ptr<ProcessInspector> ProcessInspector::create() {
#ifdef KIRO2API_HAS_POSIX_INSPECTOR
    spdlog::debug("[ProcessInspector] Using POSIX inspector (lsof/ps)");
    return std::make_unique<ProcessInspectorPosix>();
#else
    spdlog::warn("[ProcessInspector] Port enumeration not supported on this platform, "
                 "stale-instance cleanup will be skipped");
    return std::make_unique<ProcessInspectorNoop>();
#endif
}

SidecarError ProcessInspectorNoop::list_listeners(uint16_t port, std::vector<int>& pids) {
    (void)port;
    pids.clear();
    return SidecarErrorHelper::success();
}

std::optional<std::string> ProcessInspectorNoop::command_line_of(int pid) {
    (void)pid;
    return std::nullopt;
}

void ProcessInspectorNoop::terminate(int pid, bool forceful) {
    (void)pid;
    (void)forceful;
}

} // namespace kiro2api
