// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef __KIRO2API_CONFIG_H__
#define __KIRO2API_CONFIG_H__

#include "spdlog/spdlog.h"

#include <string>

#include "hv/json.hpp"

namespace kiro2api {

using json = nlohmann::json;

/**
 * @brief Supervisor configuration file (singleton)
 *
 * Loads and manages the supervisor configuration from a JSON file.
 * Uses JSON pointer syntax (RFC 6901) for nested value access.
 *
 * Thread safety: Not thread-safe. Initialize once at startup and read the
 * values into SupervisorSettings before any worker threads start.
 *
 * Example usage:
 * ```cpp
 * Config* cfg = Config::get_instance();
 * cfg->init("/path/to/kiro2api-supervisor.json");
 *
 * int port = cfg->get<int>("/sidecar/port", 8080);
 * cfg->set<std::string>("/sidecar/region", "eu-central-1");
 * cfg->save();
 * ```
 */
class Config {
  private:
    static Config* instance;
    std::string path;

  protected:
    json data;

    /// Allow test fixture to access protected members
    friend class ConfigTestFixture;

  public:
    Config();

    Config(Config& o) = delete;
    void operator=(const Config&) = delete;

    /**
     * @brief Initialize configuration from file
     *
     * Creates the file with defaults if it doesn't exist. A corrupt file is
     * renamed to <path>.corrupt and replaced by defaults. Missing sections
     * are filled in from defaults and written back.
     *
     * @param config_path Path to JSON configuration file
     */
    void init(const std::string& config_path);

    /**
     * @brief Get configuration value at JSON pointer path
     *
     * @throws nlohmann::json::exception if path not found or type mismatch
     */
    template <typename T> T get(const std::string& json_ptr) {
        return data[json::json_pointer(json_ptr)].template get<T>();
    };

    /**
     * @brief Get configuration value with default fallback
     *
     * Returns default_value if the path doesn't exist, is null, or holds a
     * value of the wrong type.
     */
    template <typename T> T get(const std::string& json_ptr, const T& default_value) {
        json::json_pointer ptr(json_ptr);
        if (!data.contains(ptr) || data[ptr].is_null()) {
            return default_value;
        }
        try {
            return data[ptr].template get<T>();
        } catch (const json::exception& e) {
            spdlog::warn("[Config] {} has wrong type ({}), using default", json_ptr, e.what());
            return default_value;
        }
    };

    /**
     * @brief Set configuration value at JSON pointer path
     *
     * Creates intermediate paths. In-memory until save() is called.
     */
    template <typename T> T set(const std::string& json_ptr, T v) {
        return data[json::json_pointer(json_ptr)] = v;
    };

    /// Mutable reference to the JSON value at path
    json& get_json(const std::string& json_path);

    /**
     * @brief Save current configuration to file
     *
     * @return true on success
     */
    bool save();

    /// Path of the loaded configuration file
    std::string get_path();

    static Config* get_instance();
};

/// Default configuration document
json get_default_config();

} // namespace kiro2api

#endif // __KIRO2API_CONFIG_H__
