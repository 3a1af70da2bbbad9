// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "runtime_resolver.h"

#include "app_paths.h"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>

#ifndef _WIN32
#include <sys/stat.h>
#endif

namespace fs = std::filesystem;

namespace kiro2api {

namespace {

#ifdef _WIN32
constexpr char PATH_LIST_SEPARATOR = ';';
#else
constexpr char PATH_LIST_SEPARATOR = ':';
#endif

std::string join(const std::string& base, const std::string& rel) {
    return (fs::path(base) / rel).string();
}

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    auto start = s.find_first_not_of(ws);
    if (start == std::string::npos) {
        return {};
    }
    auto end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

std::string join_list(const std::vector<std::string>& items) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) {
            out += ", ";
        }
        out += item;
    }
    return out;
}

} // namespace

PathProbe PathProbe::filesystem() {
    PathProbe probe;
    probe.is_file = [](const std::string& p) {
        std::error_code ec;
        return fs::is_regular_file(p, ec);
    };
    probe.is_dir = [](const std::string& p) {
        std::error_code ec;
        return fs::is_directory(p, ec);
    };
    return probe;
}

RuntimeDescriptor RuntimeDescriptor::from_environment(const std::string& binary_name,
                                                      const std::string& extra_resource_dir) {
    RuntimeDescriptor desc;
    desc.binary_name = binary_name;
    desc.platform_tag = platform_arch_tag();

    if (!extra_resource_dir.empty()) {
        desc.resource_dirs.push_back(extra_resource_dir);
    }

    std::string exe = self_executable_path();
    if (!exe.empty()) {
        std::string exe_dir = fs::path(exe).parent_path().string();
        desc.resource_dirs.push_back(exe_dir);
        desc.resource_dirs.push_back(join(exe_dir, "../Resources"));
        desc.resource_dirs.push_back(join(exe_dir, "resources"));
    }

    if (const char* path = std::getenv("PATH")) {
        desc.path_env = path;
    }

    desc.install_prefixes = {"/opt/homebrew/bin", "/usr/local/bin", "/usr/bin"};
    return desc;
}

std::vector<std::string> custom_dir_candidates(const std::string& dir,
                                               const std::string& binary_name) {
    return {
        join(dir, binary_name),
        join(dir, "target/release/" + binary_name),
        join(dir, "target/debug/" + binary_name),
        join(dir, "bin/" + binary_name),
    };
}

std::vector<std::string> bundled_candidates(const RuntimeDescriptor& desc) {
    const std::string& name = desc.binary_name;
    std::string platform_rel = "offline/" + name + "/" + desc.platform_tag + "/" + name;

    std::vector<std::string> candidates;
    for (const auto& base : desc.resource_dirs) {
        candidates.push_back(join(base, platform_rel));
        candidates.push_back(join(base, "offline/" + name + "/" + name));
        candidates.push_back(join(base, name));
        candidates.push_back(join(base, "resources/" + platform_rel));
    }
    return candidates;
}

std::vector<std::string> split_path_list(const std::string& path_env) {
    std::vector<std::string> entries;
    size_t start = 0;
    while (start <= path_env.size()) {
        size_t end = path_env.find(PATH_LIST_SEPARATOR, start);
        if (end == std::string::npos) {
            end = path_env.size();
        }
        if (end > start) {
            entries.push_back(path_env.substr(start, end - start));
        }
        start = end + 1;
    }
    return entries;
}

std::vector<std::string> system_candidates(const RuntimeDescriptor& desc) {
    std::vector<std::string> candidates;
    for (const auto& dir : split_path_list(desc.path_env)) {
        candidates.push_back(join(dir, desc.binary_name));
    }
    for (const auto& prefix : desc.install_prefixes) {
        candidates.push_back(join(prefix, desc.binary_name));
    }
    return candidates;
}

RuntimeResolver::RuntimeResolver(RuntimeDescriptor desc, PathProbe probe)
    : desc_(std::move(desc)), probe_(std::move(probe)) {}

bool RuntimeResolver::looks_like_legacy_node_project(const std::string& dir) const {
    return probe_.is_file(join(dir, "package.json")) && probe_.is_file(join(dir, "src/index.js"));
}

bool RuntimeResolver::resolve_custom(const std::string& path, std::string& found) const {
    if (probe_.is_file(path)) {
        found = path;
        return true;
    }

    if (probe_.is_dir(path)) {
        for (const auto& candidate : custom_dir_candidates(path, desc_.binary_name)) {
            if (probe_.is_file(candidate)) {
                found = candidate;
                return true;
            }
        }
    }

    return false;
}

SidecarError RuntimeResolver::resolve(const std::string& override_path,
                                      ResolvedRuntime& out) const {
    out = ResolvedRuntime{};
    std::string custom_error;

    std::string trimmed = trim(override_path);
    if (!trimmed.empty()) {
        std::string found;
        if (probe_.is_dir(trimmed) && looks_like_legacy_node_project(trimmed)) {
            custom_error =
                "legacy Node project path is no longer used by default runtime: " + trimmed;
            spdlog::warn("[Resolver] {}", custom_error);
        } else if (resolve_custom(trimmed, found)) {
            out.checked.push_back(found);
            out.path = found;
            out.from_override = true;
            spdlog::info("[Resolver] Using custom runtime: {}", found);
            return SidecarErrorHelper::success();
        } else {
            custom_error = "runtime path not found or invalid: " + trimmed;
            out.checked.push_back(trimmed);
            spdlog::warn("[Resolver] {}", custom_error);
        }
    }

    for (const auto& candidate : bundled_candidates(desc_)) {
        out.checked.push_back(candidate);
        if (probe_.is_file(candidate)) {
            out.path = candidate;
            spdlog::info("[Resolver] Using bundled runtime: {}", candidate);
            return SidecarErrorHelper::success();
        }
    }

    for (const auto& candidate : system_candidates(desc_)) {
        out.checked.push_back(candidate);
        if (probe_.is_file(candidate)) {
            out.path = candidate;
            spdlog::info("[Resolver] Using system runtime: {}", candidate);
            return SidecarErrorHelper::success();
        }
    }

    std::string message;
    if (!custom_error.empty()) {
        message = custom_error + "; ";
    }
    message += desc_.binary_name +
               " executable not found. Reinstall the bundled runtime or set a custom runtime "
               "path. Checked: " +
               join_list(out.checked);

    spdlog::error("[Resolver] {} not found ({} paths checked)", desc_.binary_name,
                  out.checked.size());
    return SidecarErrorHelper::runtime_not_found(message);
}

SidecarError ensure_executable(const std::string& path) {
#ifndef _WIN32
    struct stat st;
    if (stat(path.c_str(), &st) != 0) {
        return SidecarErrorHelper::spawn_failed("read metadata failed: " +
                                                std::string(strerror(errno)));
    }

    constexpr mode_t EXEC_BITS = S_IXUSR | S_IXGRP | S_IXOTH;
    if ((st.st_mode & EXEC_BITS) != 0) {
        return SidecarErrorHelper::success();
    }

    if (chmod(path.c_str(), (st.st_mode & 07777) | EXEC_BITS) != 0) {
        return SidecarErrorHelper::spawn_failed("set execute permission failed: " +
                                                std::string(strerror(errno)));
    }
    spdlog::info("[Resolver] Added execute permission to {}", path);
#else
    (void)path;
#endif
    return SidecarErrorHelper::success();
}

} // namespace kiro2api
