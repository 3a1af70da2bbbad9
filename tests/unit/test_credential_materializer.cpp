// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "credential_materializer.h"

#include "../test_helpers/temp_dir.h"

#include <cstdlib>
#include <ctime>
#include <optional>
#include <string>

#include <catch2/catch_test_macros.hpp>

using namespace kiro2api;

namespace {

/// Pins the process time zone for the lifetime of the guard
class ScopedTimeZone {
  public:
    explicit ScopedTimeZone(const char* tz) {
        const char* old = std::getenv("TZ");
        if (old) {
            saved_ = old;
        }
        setenv("TZ", tz, 1);
        tzset();
    }

    ~ScopedTimeZone() {
        if (saved_) {
            setenv("TZ", saved_->c_str(), 1);
        } else {
            unsetenv("TZ");
        }
        tzset();
    }

  private:
    std::optional<std::string> saved_;
};

const char* THREE_ACCOUNT_SAMPLE = R"([
  {
    "email": "banned@example.com",
    "refreshToken": "rt-banned",
    "provider": "Google",
    "status": "Banned by upstream"
  },
  {
    "email": "empty@example.com",
    "refreshToken": "   ",
    "provider": "Github",
    "status": "active"
  },
  {
    "email": "corp@example.com",
    "refreshToken": "rt-corp",
    "provider": "Enterprise",
    "clientId": "cid",
    "clientSecret": "csecret",
    "region": "eu-west-1",
    "status": "active",
    "usageData": {"subscriptionInfo": {"subscriptionTitle": "KIRO PRO"}}
  }
])";

} // namespace

// ============================================================================
// Account conversion
// ============================================================================

TEST_CASE("Materializer: three-record sample yields two credentials", "[materializer]") {
    TempDir tmp;
    std::string store = tmp.write("accounts.json", THREE_ACCOUNT_SAMPLE);

    std::vector<Credential> creds;
    auto err = build_credentials(store, "us-east-1", creds);

    REQUIRE(err.success());
    REQUIRE(creds.size() == 2);

    const auto& banned = creds[0];
    CHECK(banned.id == 1);
    CHECK(banned.priority == 0);
    CHECK(banned.disabled);
    CHECK(banned.auth_method == AUTH_METHOD_SOCIAL);
    CHECK(banned.region == std::optional<std::string>("us-east-1"));

    const auto& corp = creds[1];
    CHECK(corp.id == 3);
    CHECK(corp.priority == 2);
    CHECK_FALSE(corp.disabled);
    CHECK(corp.auth_method == AUTH_METHOD_IDC);
    CHECK(corp.region == std::optional<std::string>("eu-west-1"));
    CHECK(corp.subscription_title == std::optional<std::string>("KIRO PRO"));
}

TEST_CASE("Materializer: credential count and priorities follow usable records",
          "[materializer]") {
    json accounts = json::array();
    for (int i = 0; i < 5; ++i) {
        accounts.push_back({{"refreshToken", "rt-" + std::to_string(i)}});
    }

    std::vector<Credential> creds;
    for (size_t i = 0; i < accounts.size(); ++i) {
        auto cred = account_to_credential(accounts[i], i, "us-east-1");
        REQUIRE(cred.has_value());
        creds.push_back(*cred);
    }

    REQUIRE(creds.size() == 5);
    for (size_t i = 0; i < creds.size(); ++i) {
        CHECK(creds[i].priority == i);
        CHECK(creds[i].id == i + 1);
    }
}

TEST_CASE("Materializer: auth method classification", "[materializer]") {
    auto method = [](const json& account) {
        auto cred = account_to_credential(account, 0, "us-east-1");
        REQUIRE(cred.has_value());
        return cred->auth_method;
    };

    SECTION("builder id provider") {
        REQUIRE(method({{"refreshToken", "x"}, {"provider", "BuilderId"}}) == AUTH_METHOD_IDC);
    }
    SECTION("client id and secret without provider") {
        REQUIRE(method({{"refreshToken", "x"}, {"clientId", "a"}, {"clientSecret", "b"}}) ==
                AUTH_METHOD_IDC);
    }
    SECTION("client id alone is not enough") {
        REQUIRE(method({{"refreshToken", "x"}, {"clientId", "a"}}) == AUTH_METHOD_SOCIAL);
    }
    SECTION("missing provider defaults to social") {
        REQUIRE(method({{"refreshToken", "x"}}) == AUTH_METHOD_SOCIAL);
    }
}

TEST_CASE("Materializer: optional fields are trimmed and blank means absent", "[materializer]") {
    json account = {{"refreshToken", "  rt  "},
                    {"accessToken", ""},
                    {"email", "  someone@example.com "},
                    {"profileArn", 42},
                    {"expiresAt", "not a date"}};

    auto cred = account_to_credential(account, 0, "us-east-1");
    REQUIRE(cred.has_value());
    CHECK(cred->refresh_token == "rt");
    CHECK_FALSE(cred->access_token.has_value());
    CHECK(cred->email == std::optional<std::string>("someone@example.com"));
    CHECK_FALSE(cred->profile_arn.has_value());
    CHECK_FALSE(cred->expires_at.has_value());
}

TEST_CASE("Materializer: disabled status markers", "[materializer]") {
    CHECK(is_disabled_status("BANNED"));
    CHECK(is_disabled_status("account suspended"));
    CHECK(is_disabled_status("\xE5\xB7\xB2\xE5\xB0\x81\xE7\xA6\x81")); // 已封禁
    CHECK_FALSE(is_disabled_status("active"));
    CHECK_FALSE(is_disabled_status(""));
}

// ============================================================================
// Timestamp normalization
// ============================================================================

TEST_CASE("Materializer: RFC 3339 timestamps keep their offset", "[materializer]") {
    CHECK(normalize_expires_at("2024-01-15T10:30:00Z") ==
          std::optional<std::string>("2024-01-15T10:30:00+00:00"));
    CHECK(normalize_expires_at("2024-01-15T10:30:00.123+08:00") ==
          std::optional<std::string>("2024-01-15T10:30:00.123+08:00"));
    CHECK(normalize_expires_at("2024-01-15T10:30:00.5-05:30") ==
          std::optional<std::string>("2024-01-15T10:30:00.500-05:30"));
}

TEST_CASE("Materializer: local timestamp uses host time zone", "[materializer]") {
    ScopedTimeZone tz("CST-8");
    CHECK(normalize_expires_at("2024/01/15 10:30:00") ==
          std::optional<std::string>("2024-01-15T10:30:00+08:00"));
}

TEST_CASE("Materializer: local time inside a DST gap is dropped", "[materializer]") {
    ScopedTimeZone tz("EST5EDT,M3.2.0,M11.1.0");
    CHECK_FALSE(normalize_expires_at("2024/03/10 02:30:00").has_value());
    CHECK(normalize_expires_at("2024/07/01 12:00:00") ==
          std::optional<std::string>("2024-07-01T12:00:00-04:00"));
}

TEST_CASE("Materializer: local time repeated when DST ends is dropped", "[materializer]") {
    ScopedTimeZone tz("EST5EDT,M3.2.0,M11.1.0");
    // 01:30 happens twice on 2024-11-03 (EDT, then EST)
    CHECK_FALSE(normalize_expires_at("2024/11/03 01:30:00").has_value());
    CHECK(normalize_expires_at("2024/11/03 00:30:00") ==
          std::optional<std::string>("2024-11-03T00:30:00-04:00"));
    CHECK(normalize_expires_at("2024/11/03 02:30:00") ==
          std::optional<std::string>("2024-11-03T02:30:00-05:00"));
    CHECK(normalize_expires_at("2024/01/15 10:30:00") ==
          std::optional<std::string>("2024-01-15T10:30:00-05:00"));
}

TEST_CASE("Materializer: unparseable timestamps are absent, not errors", "[materializer]") {
    CHECK_FALSE(normalize_expires_at("").has_value());
    CHECK_FALSE(normalize_expires_at("yesterday").has_value());
    CHECK_FALSE(normalize_expires_at("2024/13/01 00:00:00").has_value());
    CHECK_FALSE(normalize_expires_at("2024-02-30T00:00:00Z").has_value());
}

// ============================================================================
// Store errors
// ============================================================================

TEST_CASE("Materializer: missing store is ConfigMissing", "[materializer]") {
    TempDir tmp;
    std::vector<Credential> creds;
    auto err = build_credentials(tmp.file("accounts.json"), "us-east-1", creds);
    REQUIRE(err.result == SidecarResult::CONFIG_MISSING);
    REQUIRE(err.message().find(tmp.file("accounts.json")) != std::string::npos);
}

TEST_CASE("Materializer: malformed store is ConfigInvalid", "[materializer]") {
    TempDir tmp;
    std::vector<Credential> creds;

    SECTION("truncated JSON") {
        std::string store = tmp.write("accounts.json", R"([{"refreshToken": "a")");
        REQUIRE(build_credentials(store, "us-east-1", creds).result ==
                SidecarResult::CONFIG_INVALID);
    }
    SECTION("top level is not an array") {
        std::string store = tmp.write("accounts.json", R"({"refreshToken": "a"})");
        REQUIRE(build_credentials(store, "us-east-1", creds).result ==
                SidecarResult::CONFIG_INVALID);
    }
}

TEST_CASE("Materializer: no usable secret is NoUsableCredentials", "[materializer]") {
    TempDir tmp;
    std::string store =
        tmp.write("accounts.json", R"([{"email": "a"}, {"refreshToken": ""}, "junk"])");
    std::vector<Credential> creds;
    REQUIRE(build_credentials(store, "us-east-1", creds).result ==
            SidecarResult::NO_USABLE_CREDENTIALS);
    REQUIRE(creds.empty());
}

// ============================================================================
// Snapshot files
// ============================================================================

TEST_CASE("Materializer: writes config and credentials documents", "[materializer]") {
    TempDir tmp;
    std::string store = tmp.write("accounts.json", THREE_ACCOUNT_SAMPLE);

    LaunchConfig config;
    config.port = 9090;
    config.api_key = "sk-test";
    config.admin_key = "admin-test";

    MaterializedFiles files;
    size_t count = 0;
    auto err = materialize(store, tmp.file("run/data"), config, files, &count);

    REQUIRE(err.success());
    REQUIRE(count == 2);
    REQUIRE(files.config_path == tmp.file("run/data/config.json"));
    REQUIRE(files.credentials_path == tmp.file("run/data/credentials.json"));

    json cfg = json::parse(tmp.read("run/data/config.json"));
    CHECK(cfg["host"] == "127.0.0.1");
    CHECK(cfg["port"] == 9090);
    CHECK(cfg["region"] == "us-east-1");
    CHECK(cfg["kiroVersion"] == "0.9.2");
    CHECK(cfg["apiKey"] == "sk-test");
    CHECK(cfg["adminApiKey"] == "admin-test");
    CHECK(cfg["proxyUrl"].is_null());
    CHECK(cfg["loadBalancingMode"] == "priority");
    CHECK(cfg["tlsBackend"] == "rustls");

    json creds = json::parse(tmp.read("run/data/credentials.json"));
    REQUIRE(creds.is_array());
    REQUIRE(creds.size() == 2);
    CHECK(creds[0]["refreshToken"] == "rt-banned");
    CHECK(creds[0]["disabled"] == true);
    CHECK(creds[0]["accessToken"].is_null());
    CHECK(creds[1]["authMethod"] == "idc");
    CHECK(creds[1]["clientSecret"] == "csecret");
    CHECK(creds[1]["priority"] == 2);
}

TEST_CASE("Materializer: snapshot overwrites previous files", "[materializer]") {
    TempDir tmp;
    tmp.write("data/credentials.json", std::string(4096, 'x'));
    std::string store = tmp.write("accounts.json", R"([{"refreshToken": "only"}])");

    MaterializedFiles files;
    REQUIRE(materialize(store, tmp.file("data"), LaunchConfig{}, files).success());

    json creds = json::parse(tmp.read("data/credentials.json"));
    REQUIRE(creds.size() == 1);
    REQUIRE(creds[0]["refreshToken"] == "only");
}

TEST_CASE("Materializer: unwritable data dir is an I/O error", "[materializer]") {
    TempDir tmp;
    // A regular file where the directory should be
    std::string blocker = tmp.write("blocker", "");
    std::vector<Credential> creds(1);
    creds[0].refresh_token = "x";

    MaterializedFiles files;
    auto err = write_runtime_files(blocker + "/data", LaunchConfig{}, creds, files);
    REQUIRE(err.result == SidecarResult::IO_ERROR);
}
