// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <string>

namespace kiro2api {

/**
 * @brief Resolve the per-user application data root
 *
 * Follows the platform convention for application data:
 *   Linux:   $XDG_DATA_HOME, else $HOME/.local/share
 *   macOS:   $HOME/Library/Application Support
 *   Windows: %APPDATA%
 * Falls back to the home directory ($HOME, then %USERPROFILE%), then ".".
 *
 * @return Absolute data root path (or "." as a last resort)
 */
std::string data_root();

/// Directory shared with the account manager (data_root()/.kiro-account-manager)
std::string account_manager_dir();

/// Shared account store written by the account manager
std::string account_store_path();

/// Default directory for the materialized config, credentials and log file
std::string default_runtime_data_dir();

/// Default supervisor configuration file
std::string default_config_path();

/**
 * @brief Absolute path of the running executable
 *
 * Uses /proc/self/exe on Linux and _NSGetExecutablePath on macOS.
 *
 * @return Executable path, or empty string if it cannot be determined
 */
std::string self_executable_path();

/**
 * @brief Platform/architecture tag used by the bundled runtime layout
 *
 * @return e.g. "darwin-aarch64", "linux-x86_64"
 */
std::string platform_arch_tag();

} // namespace kiro2api
