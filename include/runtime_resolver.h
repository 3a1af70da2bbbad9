// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file runtime_resolver.h
 * @brief Locates the sidecar executable across custom, bundled and system paths
 *
 * Resolution is "first existing file wins" over an ordered candidate list:
 *   1. Explicit override (file, or a directory probed for conventional sub-paths)
 *   2. Bundled resource directories
 *   3. System PATH and well-known install prefixes
 *
 * Candidate generation is pure; all filesystem access goes through a PathProbe
 * so the search order can be tested without touching the disk.
 */

#include "sidecar_error.h"

#include <functional>
#include <string>
#include <vector>

namespace kiro2api {

/**
 * @brief Filesystem existence predicates used by the resolver
 */
struct PathProbe {
    std::function<bool(const std::string&)> is_file;
    std::function<bool(const std::string&)> is_dir;

    /// Probe backed by std::filesystem
    static PathProbe filesystem();
};

/**
 * @brief Ordered description of where the sidecar may live
 *
 * Immutable for the duration of a resolve() call.
 */
struct RuntimeDescriptor {
    std::string binary_name = "kiro-rs";
    std::string platform_tag;                  ///< e.g. "darwin-aarch64"
    std::vector<std::string> resource_dirs;    ///< Bundled resource roots, in order
    std::string path_env;                      ///< Value of $PATH
    std::vector<std::string> install_prefixes; ///< Well-known bin directories

    /**
     * @brief Build a descriptor from the current process environment
     *
     * @param binary_name Sidecar executable name
     * @param extra_resource_dir Optional resource root searched before the
     *        executable-relative ones (empty to skip)
     */
    static RuntimeDescriptor from_environment(const std::string& binary_name,
                                              const std::string& extra_resource_dir = "");
};

// ============================================================================
// Candidate generators (pure, exposed for testing)
// ============================================================================

/// Conventional sub-paths of an explicit directory override
std::vector<std::string> custom_dir_candidates(const std::string& dir,
                                               const std::string& binary_name);

/// Relocatable bundle layout under every resource root
std::vector<std::string> bundled_candidates(const RuntimeDescriptor& desc);

/// Every PATH entry, then the well-known install prefixes
std::vector<std::string> system_candidates(const RuntimeDescriptor& desc);

/// Split a PATH-style list into entries (empty entries dropped)
std::vector<std::string> split_path_list(const std::string& path_env);

/**
 * @brief Result of a successful resolution
 */
struct ResolvedRuntime {
    std::string path;                  ///< Executable to launch
    std::vector<std::string> checked;  ///< Every candidate examined, in order
    bool from_override = false;        ///< True when the explicit path matched
};

/**
 * @brief Resolves the sidecar executable
 *
 * @code
 * RuntimeResolver resolver(RuntimeDescriptor::from_environment("kiro-rs"));
 * ResolvedRuntime runtime;
 * auto err = resolver.resolve(user_path, runtime);
 * @endcode
 */
class RuntimeResolver {
  public:
    explicit RuntimeResolver(RuntimeDescriptor desc, PathProbe probe = PathProbe::filesystem());

    /**
     * @brief Find the executable to launch
     *
     * A failed explicit override does not abort the search. If every later
     * stage also fails, its message is prefixed to the aggregate error,
     * which lists every path checked.
     *
     * @param override_path Explicit file or directory (empty/whitespace to skip)
     * @param[out] out Resolved runtime on success
     * @return SUCCESS or RUNTIME_NOT_FOUND
     */
    SidecarError resolve(const std::string& override_path, ResolvedRuntime& out) const;

    const RuntimeDescriptor& descriptor() const {
        return desc_;
    }

  private:
    /// Explicit file, or first existing conventional sub-path of a directory
    bool resolve_custom(const std::string& path, std::string& found) const;

    /// package.json + src/index.js: the retired Node implementation
    bool looks_like_legacy_node_project(const std::string& dir) const;

    RuntimeDescriptor desc_;
    PathProbe probe_;
};

/**
 * @brief Ensure the file carries execute permission
 *
 * On POSIX, if no execute bit is set, adds owner/group/other execute bits.
 * Idempotent; a no-op when any execute bit is already present and on
 * non-POSIX platforms.
 *
 * @param path File to fix up
 * @return SUCCESS or SPAWN_FAILED with the OS error text
 */
SidecarError ensure_executable(const std::string& path);

} // namespace kiro2api
