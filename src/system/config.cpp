// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "config.h"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace kiro2api {

Config* Config::instance{nullptr};

namespace {

/// Default sidecar section
json get_default_sidecar_config() {
    return {{"binary_name", "kiro-rs"},
            {"host", "127.0.0.1"},
            {"port", 8080},
            {"api_key", "sk-default-key"},
            {"admin_key", "admin-default-key"},
            {"region", "us-east-1"},
            {"runtime_version", "0.9.2"},
            {"load_balancing_mode", "priority"},
            {"tls_backend", "rustls"},
            {"log_level", "info"},
            {"resource_dir", ""}};
}

/// Empty paths mean "platform default" (see app_paths.h)
json get_default_paths_config() {
    return {{"account_store", ""}, {"data_dir", ""}};
}

json get_default_health_config() {
    return {{"path", "/v1/models"}, {"auth_header", "x-api-key"}, {"timeout_ms", 3000}};
}

json get_default_arbiter_config() {
    return {{"term_grace_ms", 400}, {"kill_grace_ms", 200}};
}

json get_default_supervisor_config() {
    return {{"lock_timeout_ms", 5000}, {"stop_grace_ms", 1500}};
}

/**
 * @brief Fill in missing keys of a section from its defaults
 * @return true if anything was added
 */
bool merge_section_defaults(json& data, const std::string& section, const json& defaults) {
    bool modified = false;
    auto& target = data[section];
    if (!target.is_object()) {
        target = defaults;
        return true;
    }
    for (auto it = defaults.begin(); it != defaults.end(); ++it) {
        if (!target.contains(it.key())) {
            target[it.key()] = it.value();
            modified = true;
        }
    }
    return modified;
}

} // namespace

json get_default_config() {
    return {{"config_version", 1},
            {"sidecar", get_default_sidecar_config()},
            {"paths", get_default_paths_config()},
            {"health", get_default_health_config()},
            {"arbiter", get_default_arbiter_config()},
            {"supervisor", get_default_supervisor_config()}};
}

Config::Config() {}

Config* Config::get_instance() {
    if (instance == nullptr) {
        instance = new Config();
    }
    return instance;
}

void Config::init(const std::string& config_path) {
    path = config_path;
    struct stat buffer;
    bool config_modified = false;

    if (stat(config_path.c_str(), &buffer) == 0) {
        spdlog::info("[Config] Loading config from {}", config_path);
        std::string parse_error;
        try {
            std::ifstream in(config_path);
            data = json::parse(in);
            if (!data.is_object()) {
                parse_error = "top-level value is not an object";
            }
        } catch (const json::exception& e) {
            parse_error = e.what();
        }

        if (!parse_error.empty()) {
            spdlog::error("[Config] Failed to parse {}: {}", config_path, parse_error);
            spdlog::warn("[Config] Config file is corrupt, resetting to defaults");

            // Keep the corrupt file for diagnosis
            std::string backup_path = config_path + ".corrupt";
            if (std::rename(config_path.c_str(), backup_path.c_str()) == 0) {
                spdlog::info("[Config] Corrupt config backed up to {}", backup_path);
            }

            data = get_default_config();
            config_modified = true;
        }
    } else {
        spdlog::info("[Config] Creating default config at {}", config_path);
        data = get_default_config();
        config_modified = true;
    }

    config_modified |= merge_section_defaults(data, "sidecar", get_default_sidecar_config());
    config_modified |= merge_section_defaults(data, "paths", get_default_paths_config());
    config_modified |= merge_section_defaults(data, "health", get_default_health_config());
    config_modified |= merge_section_defaults(data, "arbiter", get_default_arbiter_config());
    config_modified |= merge_section_defaults(data, "supervisor", get_default_supervisor_config());

    if (config_modified) {
        std::error_code ec;
        fs::path dir = fs::path(config_path).parent_path();
        if (!dir.empty()) {
            fs::create_directories(dir, ec);
        }
        if (ec) {
            spdlog::warn("[Config] Could not create {}: {}", dir.string(), ec.message());
        } else if (save()) {
            spdlog::debug("[Config] Saved updated config to {}", config_path);
        }
    }

    spdlog::debug("[Config] initialized: sidecar port={}, region={}",
                  get<int>("/sidecar/port", 8080),
                  get<std::string>("/sidecar/region", "us-east-1"));
}

std::string Config::get_path() {
    return path;
}

json& Config::get_json(const std::string& json_path) {
    return data[json::json_pointer(json_path)];
}

bool Config::save() {
    spdlog::trace("[Config] Saving config to {}", path);

    try {
        std::ofstream o(path);
        if (!o.is_open()) {
            spdlog::error("[Config] Failed to open config file for writing: {}", path);
            return false;
        }

        o << std::setw(2) << data << std::endl;

        if (!o.good()) {
            spdlog::error("[Config] Error writing to config file: {}", path);
            return false;
        }

        o.close();
        spdlog::trace("[Config] saved successfully to {}", path);
        return true;

    } catch (const std::exception& e) {
        spdlog::error("[Config] Exception while saving config to {}: {}", path, e.what());
        return false;
    }
}

} // namespace kiro2api
