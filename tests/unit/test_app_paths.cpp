// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "app_paths.h"

#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>

#include <catch2/catch_test_macros.hpp>

using namespace kiro2api;

namespace {

/// Sets (or unsets, for nullptr) an environment variable for one scope
class ScopedEnv {
  public:
    ScopedEnv(const char* name, const char* value) : name_(name) {
        if (const char* old = std::getenv(name)) {
            saved_ = old;
        }
        if (value) {
            setenv(name, value, 1);
        } else {
            unsetenv(name);
        }
    }

    ~ScopedEnv() {
        if (saved_) {
            setenv(name_.c_str(), saved_->c_str(), 1);
        } else {
            unsetenv(name_.c_str());
        }
    }

  private:
    std::string name_;
    std::optional<std::string> saved_;
};

} // namespace

#if defined(__linux__)

TEST_CASE("AppPaths: XDG_DATA_HOME is the data root", "[paths]") {
    ScopedEnv xdg("XDG_DATA_HOME", "/xdg/data");

    CHECK(data_root() == "/xdg/data");
    CHECK(account_manager_dir() == "/xdg/data/.kiro-account-manager");
    CHECK(account_store_path() == "/xdg/data/.kiro-account-manager/accounts.json");
    CHECK(default_runtime_data_dir() == "/xdg/data/.kiro-account-manager/kiro-rs");
    CHECK(default_config_path() ==
          "/xdg/data/.kiro-account-manager/kiro2api-supervisor.json");
}

TEST_CASE("AppPaths: HOME fallback when XDG_DATA_HOME is unset or empty", "[paths]") {
    ScopedEnv home("HOME", "/home/tester");

    SECTION("unset") {
        ScopedEnv xdg("XDG_DATA_HOME", nullptr);
        CHECK(data_root() == "/home/tester/.local/share");
    }

    SECTION("empty") {
        ScopedEnv xdg("XDG_DATA_HOME", "");
        CHECK(data_root() == "/home/tester/.local/share");
    }
}

TEST_CASE("AppPaths: current directory as last resort", "[paths]") {
    ScopedEnv xdg("XDG_DATA_HOME", nullptr);
    ScopedEnv home("HOME", nullptr);
    ScopedEnv profile("USERPROFILE", nullptr);

    CHECK(data_root() == ".");
}

TEST_CASE("AppPaths: self executable path points at the test binary", "[paths]") {
    std::string exe = self_executable_path();
    REQUIRE_FALSE(exe.empty());
    REQUIRE(std::filesystem::exists(exe));
}

#endif

TEST_CASE("AppPaths: platform tag is os-arch", "[paths]") {
    std::string tag = platform_arch_tag();
    auto dash = tag.find('-');
    REQUIRE(dash != std::string::npos);
    REQUIRE(dash > 0);
    REQUIRE(dash + 1 < tag.size());
}
