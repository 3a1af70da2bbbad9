// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "health_prober.h"
#include "port_arbiter.h"

#include <chrono>
#include <cstdint>
#include <string>

namespace kiro2api {

class Config;

/**
 * @brief Everything the supervisor needs besides per-start parameters
 *
 * Start parameters (port, keys, region, ...) override the matching defaults
 * here for a single start.
 */
struct SupervisorSettings {
    // Sidecar defaults
    std::string binary_name = "kiro-rs";
    std::string host = "127.0.0.1";
    uint16_t default_port = 8080;
    std::string default_api_key = "sk-default-key";
    std::string default_admin_key = "admin-default-key";
    std::string default_region = "us-east-1";
    std::string default_runtime_version = "0.9.2";
    std::string load_balancing_mode = "priority";
    std::string tls_backend = "rustls";
    std::string child_log_level = "info"; ///< RUST_LOG for the sidecar
    std::string resource_dir;             ///< Extra bundled resource root

    // Paths
    std::string account_store_path; ///< Shared accounts.json
    std::string default_data_dir;   ///< Snapshot + log directory
    std::string log_file_name = "kiro2api.log";

    // Timing
    HealthProbeConfig health;
    ArbiterTiming arbiter;
    std::chrono::milliseconds lock_timeout{5000};
    std::chrono::milliseconds stop_grace{1500};

    /// Settings with platform-default paths filled in
    static SupervisorSettings defaults();
};

/**
 * @brief Read supervisor settings from a loaded Config
 *
 * Missing or wrong-typed keys keep their defaults; empty paths resolve to
 * the platform defaults; out-of-range ports fall back to the default port.
 */
SupervisorSettings load_supervisor_settings(Config& config);

} // namespace kiro2api
