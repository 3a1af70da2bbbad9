// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "config.h"
#include "supervisor_settings.h"

#include "../test_helpers/temp_dir.h"

#include <filesystem>

#include <catch2/catch_test_macros.hpp>

using namespace kiro2api;

// Test fixture for Config class testing
class ConfigTestFixture {
  protected:
    Config config;
    TempDir tmp;

    void set_data(const json& j) {
        config.data = j;
    }

    json& data() {
        return config.data;
    }
};

// ============================================================================
// get() / set()
// ============================================================================

TEST_CASE_METHOD(ConfigTestFixture, "Config: get() returns existing values", "[config][get]") {
    set_data({{"sidecar", {{"port", 9000}, {"host", "0.0.0.0"}}}});

    REQUIRE(config.get<int>("/sidecar/port") == 9000);
    REQUIRE(config.get<std::string>("/sidecar/host") == "0.0.0.0");
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: get() without default throws on missing key",
                 "[config][get]") {
    set_data({{"sidecar", json::object()}});

    REQUIRE_THROWS_AS(config.get<std::string>("/sidecar/missing"), json::exception);
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: get() with default handles missing, null and wrong type",
                 "[config][get]") {
    set_data({{"sidecar", {{"port", "not-a-number"}, {"region", nullptr}}}});

    CHECK(config.get<int>("/sidecar/port", 8080) == 8080);
    CHECK(config.get<std::string>("/sidecar/region", "us-east-1") == "us-east-1");
    CHECK(config.get<std::string>("/nothing/here", "fallback") == "fallback");
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: set() creates intermediate paths", "[config][set]") {
    set_data(json::object());

    config.set<std::string>("/sidecar/region", "ap-southeast-1");
    config.set<int>("/health/timeout_ms", 1500);

    REQUIRE(config.get<std::string>("/sidecar/region") == "ap-southeast-1");
    REQUIRE(config.get<int>("/health/timeout_ms") == 1500);
}

// ============================================================================
// init() / save()
// ============================================================================

TEST_CASE_METHOD(ConfigTestFixture, "Config: init() creates a default file", "[config][init]") {
    std::string path = tmp.file("nested/dir/kiro2api-supervisor.json");

    config.init(path);

    REQUIRE(std::filesystem::exists(path));
    REQUIRE(config.get_path() == path);
    REQUIRE(config.get<int>("/sidecar/port") == 8080);
    REQUIRE(config.get<std::string>("/health/path") == "/v1/models");

    json on_disk = json::parse(tmp.read("nested/dir/kiro2api-supervisor.json"));
    REQUIRE(on_disk == get_default_config());
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: init() keeps user values and fills gaps",
                 "[config][init]") {
    std::string path =
        tmp.write("cfg.json", R"({"sidecar": {"port": 9999}, "custom": {"keep": true}})");

    config.init(path);

    CHECK(config.get<int>("/sidecar/port") == 9999);
    CHECK(config.get<std::string>("/sidecar/api_key") == "sk-default-key");
    CHECK(config.get<int>("/arbiter/term_grace_ms") == 400);
    CHECK(config.get<bool>("/custom/keep"));

    json on_disk = json::parse(tmp.read("cfg.json"));
    CHECK(on_disk["sidecar"]["region"] == "us-east-1");
    CHECK(on_disk["sidecar"]["port"] == 9999);
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: corrupt file is backed up and replaced",
                 "[config][init]") {
    std::string path = tmp.write("cfg.json", "{ this is not json");

    config.init(path);

    REQUIRE(std::filesystem::exists(path + ".corrupt"));
    REQUIRE(tmp.read("cfg.json.corrupt") == "{ this is not json");
    REQUIRE(config.get<int>("/sidecar/port") == 8080);
    REQUIRE_NOTHROW(json::parse(tmp.read("cfg.json")));
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: non-object document is treated as corrupt",
                 "[config][init]") {
    std::string path = tmp.write("cfg.json", "[1, 2, 3]");

    config.init(path);

    REQUIRE(std::filesystem::exists(path + ".corrupt"));
    REQUIRE(data().is_object());
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: save() persists changes", "[config][save]") {
    std::string path = tmp.file("cfg.json");
    config.init(path);

    config.set<int>("/sidecar/port", 7000);
    REQUIRE(config.save());

    Config reloaded;
    reloaded.init(path);
    REQUIRE(reloaded.get<int>("/sidecar/port") == 7000);
}

// ============================================================================
// SupervisorSettings mapping
// ============================================================================

TEST_CASE_METHOD(ConfigTestFixture, "Config: defaults map onto SupervisorSettings",
                 "[config][settings]") {
    config.init(tmp.file("cfg.json"));

    SupervisorSettings s = load_supervisor_settings(config);

    CHECK(s.binary_name == "kiro-rs");
    CHECK(s.host == "127.0.0.1");
    CHECK(s.default_port == 8080);
    CHECK(s.default_api_key == "sk-default-key");
    CHECK(s.default_admin_key == "admin-default-key");
    CHECK(s.default_region == "us-east-1");
    CHECK(s.default_runtime_version == "0.9.2");
    CHECK(s.load_balancing_mode == "priority");
    CHECK(s.tls_backend == "rustls");
    CHECK(s.child_log_level == "info");
    CHECK(s.health.path == "/v1/models");
    CHECK(s.health.auth_header == "x-api-key");
    CHECK(s.health.timeout_ms == 3000);
    CHECK(s.arbiter.term_grace == std::chrono::milliseconds(400));
    CHECK(s.arbiter.kill_grace == std::chrono::milliseconds(200));
    CHECK(s.lock_timeout == std::chrono::milliseconds(5000));
    CHECK(s.stop_grace == std::chrono::milliseconds(1500));

    // Empty path entries fall back to the platform defaults
    CHECK_FALSE(s.account_store_path.empty());
    CHECK_FALSE(s.default_data_dir.empty());
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: overrides and invalid values in SupervisorSettings",
                 "[config][settings]") {
    std::string path = tmp.write("cfg.json", R"({
        "sidecar": {"port": 70000, "region": "eu-west-2", "binary_name": ""},
        "paths": {"account_store": "/srv/accounts.json", "data_dir": "/srv/run"},
        "health": {"path": "healthz", "timeout_ms": -5},
        "arbiter": {"term_grace_ms": -1, "kill_grace_ms": 50}
    })");
    config.init(path);

    SupervisorSettings s = load_supervisor_settings(config);

    CHECK(s.default_port == 8080);
    CHECK(s.default_region == "eu-west-2");
    CHECK(s.binary_name == "kiro-rs");
    CHECK(s.account_store_path == "/srv/accounts.json");
    CHECK(s.default_data_dir == "/srv/run");
    CHECK(s.health.path == "/healthz");
    CHECK(s.health.timeout_ms == 3000);
    CHECK(s.arbiter.term_grace == std::chrono::milliseconds(400));
    CHECK(s.arbiter.kill_grace == std::chrono::milliseconds(50));
}
