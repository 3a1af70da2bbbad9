// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "app_paths.h"

#include <climits>
#include <cstdlib>
#include <filesystem>

#if defined(__APPLE__)
#include <mach-o/dyld.h>
#elif defined(__linux__)
#include <unistd.h>
#endif

namespace kiro2api {

namespace {

constexpr const char* ACCOUNT_MANAGER_DIR = ".kiro-account-manager";

/// Non-empty environment variable or nullptr
const char* env_nonempty(const char* name) {
    const char* value = std::getenv(name);
    if (value && value[0] != '\0') {
        return value;
    }
    return nullptr;
}

std::string home_dir() {
    if (const char* home = env_nonempty("HOME")) {
        return home;
    }
    if (const char* profile = env_nonempty("USERPROFILE")) {
        return profile;
    }
    return ".";
}

} // namespace

std::string data_root() {
#if defined(_WIN32)
    if (const char* appdata = env_nonempty("APPDATA")) {
        return appdata;
    }
    return home_dir();
#elif defined(__APPLE__)
    if (const char* home = env_nonempty("HOME")) {
        return std::string(home) + "/Library/Application Support";
    }
    return home_dir();
#else
    if (const char* xdg = env_nonempty("XDG_DATA_HOME")) {
        return xdg;
    }
    if (const char* home = env_nonempty("HOME")) {
        return std::string(home) + "/.local/share";
    }
    return home_dir();
#endif
}

std::string account_manager_dir() {
    return (std::filesystem::path(data_root()) / ACCOUNT_MANAGER_DIR).string();
}

std::string account_store_path() {
    return (std::filesystem::path(account_manager_dir()) / "accounts.json").string();
}

std::string default_runtime_data_dir() {
    return (std::filesystem::path(account_manager_dir()) / "kiro-rs").string();
}

std::string default_config_path() {
    return (std::filesystem::path(account_manager_dir()) / "kiro2api-supervisor.json").string();
}

std::string self_executable_path() {
#if defined(__APPLE__)
    char buf[PATH_MAX];
    uint32_t size = sizeof(buf);
    if (_NSGetExecutablePath(buf, &size) == 0) {
        std::error_code ec;
        auto canonical = std::filesystem::canonical(buf, ec);
        return ec ? std::string(buf) : canonical.string();
    }
    return {};
#elif defined(__linux__)
    char buf[PATH_MAX];
    ssize_t len = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (len <= 0) {
        return {};
    }
    buf[len] = '\0';
    return buf;
#else
    return {};
#endif
}

std::string platform_arch_tag() {
#if defined(__APPLE__)
    const char* os = "darwin";
#elif defined(_WIN32)
    const char* os = "windows";
#else
    const char* os = "linux";
#endif

#if defined(__aarch64__) || defined(_M_ARM64)
    const char* arch = "aarch64";
#elif defined(__x86_64__) || defined(_M_X64)
    const char* arch = "x86_64";
#elif defined(__arm__)
    const char* arch = "armv7";
#else
    const char* arch = "unknown";
#endif
    return std::string(os) + "-" + arch;
}

} // namespace kiro2api
