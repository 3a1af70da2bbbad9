// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "sidecar_error.h"

namespace kiro2api {

std::string format_pid_list(const std::vector<int>& pids) {
    std::string out = "[";
    for (size_t i = 0; i < pids.size(); ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += std::to_string(pids[i]);
    }
    out += "]";
    return out;
}

} // namespace kiro2api
