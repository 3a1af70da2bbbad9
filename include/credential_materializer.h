// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file credential_materializer.h
 * @brief Converts the shared account store into sidecar config/credential files
 *
 * The account manager owns accounts.json; this module only reads it. Each
 * start produces a fresh snapshot in the run's data directory:
 *   - config.json       launch parameters (host, port, keys, region, ...)
 *   - credentials.json  ordered credential list, one per usable account
 *
 * Snapshot files are written with a plain truncate-and-write. There is no
 * temp-file-and-rename step, so a crash mid-write can leave a truncated file.
 */

#include "sidecar_error.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "hv/json.hpp"

namespace kiro2api {

using json = nlohmann::json;

/// Credential authentication methods understood by the sidecar
constexpr const char* AUTH_METHOD_IDC = "idc";
constexpr const char* AUTH_METHOD_SOCIAL = "social";

/**
 * @brief Per-start launch parameters written to config.json
 */
struct LaunchConfig {
    std::string host = "127.0.0.1";
    uint16_t port = 8080;
    std::string region = "us-east-1";
    std::string runtime_version = "0.9.2";
    std::string api_key;
    std::string admin_key;
    std::optional<std::string> proxy_url;
    std::string load_balancing_mode = "priority";
    std::string tls_backend = "rustls";

    json to_json() const;
};

/**
 * @brief One sidecar credential derived from an account record
 */
struct Credential {
    uint64_t id = 0;           ///< 1-based, enumeration order of the source list
    std::string refresh_token; ///< The account secret (never logged)
    std::string auth_method;   ///< AUTH_METHOD_IDC or AUTH_METHOD_SOCIAL
    uint32_t priority = 0;     ///< Zero-based ordinal of the source record
    bool disabled = false;     ///< Status text carries a ban/suspend marker
    std::optional<std::string> access_token;
    std::optional<std::string> profile_arn;
    std::optional<std::string> expires_at; ///< RFC 3339
    std::optional<std::string> client_id;
    std::optional<std::string> client_secret;
    std::optional<std::string> region;
    std::optional<std::string> email;
    std::optional<std::string> subscription_title;

    json to_json() const;
};

/**
 * @brief Normalize an account expiry timestamp to RFC 3339
 *
 * Accepts RFC 3339 (re-emitted with its own offset, "Z" as "+00:00") or
 * "YYYY/MM/DD HH:MM:SS" interpreted in the host's local time zone.
 *
 * @param raw Timestamp text from the account record
 * @return RFC 3339 string, or std::nullopt if empty or unparseable
 */
std::optional<std::string> normalize_expires_at(const std::string& raw);

/// True when the status text carries a ban/suspend marker (case-insensitive)
bool is_disabled_status(const std::string& status);

/**
 * @brief Convert one account record into a credential
 *
 * @param account JSON object from the account store
 * @param index Zero-based position of the record in the store
 * @param default_region Region used when the account carries none
 * @return Credential, or std::nullopt if the record has no usable secret
 */
std::optional<Credential> account_to_credential(const json& account, size_t index,
                                                const std::string& default_region);

/**
 * @brief Read the shared account store and build the credential list
 *
 * @param store_path Path to accounts.json
 * @param default_region Region for accounts without one
 * @param[out] credentials Usable credentials in store order
 * @return SUCCESS, CONFIG_MISSING, CONFIG_INVALID or NO_USABLE_CREDENTIALS
 */
SidecarError build_credentials(const std::string& store_path, const std::string& default_region,
                               std::vector<Credential>& credentials);

/**
 * @brief Paths of a written snapshot
 */
struct MaterializedFiles {
    std::string config_path;
    std::string credentials_path;
};

/**
 * @brief Write config.json and credentials.json into the data directory
 *
 * Creates the directory if needed and overwrites any prior snapshot.
 *
 * @return SUCCESS or IO_ERROR
 */
SidecarError write_runtime_files(const std::string& data_dir, const LaunchConfig& config,
                                 const std::vector<Credential>& credentials,
                                 MaterializedFiles& out);

/**
 * @brief Full materialization: build credentials, then write both files
 *
 * @param store_path Shared account store
 * @param data_dir Run data directory
 * @param config Launch parameters (its region is the credential default)
 * @param[out] out Written file paths
 * @param[out] credential_count Number of credentials written (optional)
 */
SidecarError materialize(const std::string& store_path, const std::string& data_dir,
                         const LaunchConfig& config, MaterializedFiles& out,
                         size_t* credential_count = nullptr);

} // namespace kiro2api
