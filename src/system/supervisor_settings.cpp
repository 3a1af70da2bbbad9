// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "supervisor_settings.h"

#include "app_paths.h"
#include "config.h"

#include <spdlog/spdlog.h>

namespace kiro2api {

namespace {

std::chrono::milliseconds non_negative_ms(int value, std::chrono::milliseconds fallback) {
    if (value < 0) {
        return fallback;
    }
    return std::chrono::milliseconds(value);
}

} // namespace

SupervisorSettings SupervisorSettings::defaults() {
    SupervisorSettings s;
    s.account_store_path = account_store_path();
    s.default_data_dir = default_runtime_data_dir();
    return s;
}

SupervisorSettings load_supervisor_settings(Config& config) {
    SupervisorSettings s = SupervisorSettings::defaults();

    s.binary_name = config.get<std::string>("/sidecar/binary_name", s.binary_name);
    if (s.binary_name.empty()) {
        s.binary_name = "kiro-rs";
    }
    s.host = config.get<std::string>("/sidecar/host", s.host);

    int port = config.get<int>("/sidecar/port", s.default_port);
    if (port > 0 && port <= 65535) {
        s.default_port = static_cast<uint16_t>(port);
    } else {
        spdlog::warn("[Config] Invalid /sidecar/port {}, using {}", port, s.default_port);
    }

    s.default_api_key = config.get<std::string>("/sidecar/api_key", s.default_api_key);
    s.default_admin_key = config.get<std::string>("/sidecar/admin_key", s.default_admin_key);
    s.default_region = config.get<std::string>("/sidecar/region", s.default_region);
    s.default_runtime_version =
        config.get<std::string>("/sidecar/runtime_version", s.default_runtime_version);
    s.load_balancing_mode =
        config.get<std::string>("/sidecar/load_balancing_mode", s.load_balancing_mode);
    s.tls_backend = config.get<std::string>("/sidecar/tls_backend", s.tls_backend);
    s.child_log_level = config.get<std::string>("/sidecar/log_level", s.child_log_level);
    s.resource_dir = config.get<std::string>("/sidecar/resource_dir", s.resource_dir);

    std::string store = config.get<std::string>("/paths/account_store", "");
    if (!store.empty()) {
        s.account_store_path = store;
    }
    std::string data_dir = config.get<std::string>("/paths/data_dir", "");
    if (!data_dir.empty()) {
        s.default_data_dir = data_dir;
    }

    s.health.path = config.get<std::string>("/health/path", s.health.path);
    if (s.health.path.empty() || s.health.path[0] != '/') {
        s.health.path = "/" + s.health.path;
    }
    s.health.auth_header = config.get<std::string>("/health/auth_header", s.health.auth_header);
    s.health.timeout_ms = config.get<int>("/health/timeout_ms", s.health.timeout_ms);
    if (s.health.timeout_ms <= 0) {
        s.health.timeout_ms = 3000;
    }

    s.arbiter.term_grace = non_negative_ms(
        config.get<int>("/arbiter/term_grace_ms", 400), s.arbiter.term_grace);
    s.arbiter.kill_grace = non_negative_ms(
        config.get<int>("/arbiter/kill_grace_ms", 200), s.arbiter.kill_grace);
    s.lock_timeout = non_negative_ms(config.get<int>("/supervisor/lock_timeout_ms", 5000),
                                     s.lock_timeout);
    s.stop_grace =
        non_negative_ms(config.get<int>("/supervisor/stop_grace_ms", 1500), s.stop_grace);

    return s;
}

} // namespace kiro2api
