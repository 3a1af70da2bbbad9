// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file credential_materializer.cpp
 * @brief Account store -> sidecar snapshot conversion
 *
 * The account store is read once per start with no file locking. A read that
 * races the account manager's own write may see truncated JSON; that is
 * reported as CONFIG_INVALID and never retried here.
 */

#include "credential_materializer.h"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <regex>

namespace fs = std::filesystem;

namespace kiro2api {

namespace {

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    auto start = s.find_first_not_of(ws);
    if (start == std::string::npos) {
        return {};
    }
    auto end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

/**
 * @brief Trimmed string field, or nullopt if missing, null, non-string or blank
 */
std::optional<std::string> optional_string(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) {
        return std::nullopt;
    }
    std::string value = trim(it->get<std::string>());
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

json optional_to_json(const std::optional<std::string>& value) {
    return value ? json(*value) : json(nullptr);
}

bool is_leap_year(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

bool valid_date(int year, int month, int day) {
    static const int DAYS_IN_MONTH[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12 || day < 1) {
        return false;
    }
    int max_day = DAYS_IN_MONTH[month - 1];
    if (month == 2 && is_leap_year(year)) {
        max_day = 29;
    }
    return day <= max_day;
}

bool valid_time(int hour, int minute, int second) {
    return hour >= 0 && hour < 24 && minute >= 0 && minute < 60 && second >= 0 && second <= 60;
}

std::string format_offset(long offset_seconds) {
    char sign = offset_seconds < 0 ? '-' : '+';
    long abs_offset = offset_seconds < 0 ? -offset_seconds : offset_seconds;
    return fmt::format("{}{:02d}:{:02d}", sign, abs_offset / 3600, (abs_offset % 3600) / 60);
}

/// Fraction digits -> ".mmm", ".uuuuuu" or ".nnnnnnnnn" (empty when zero)
std::string format_fraction(const std::string& digits) {
    std::string nanos_str = digits.substr(0, 9);
    nanos_str.append(9 - nanos_str.size(), '0');
    long nanos = std::stol(nanos_str);
    if (nanos == 0) {
        return {};
    }
    if (nanos % 1000000 == 0) {
        return fmt::format(".{:03d}", nanos / 1000000);
    }
    if (nanos % 1000 == 0) {
        return fmt::format(".{:06d}", nanos / 1000);
    }
    return fmt::format(".{:09d}", nanos);
}

std::optional<std::string> parse_rfc3339(const std::string& raw) {
    static const std::regex rfc3339_regex(
        R"(^(\d{4})-(\d{2})-(\d{2})[Tt ](\d{2}):(\d{2}):(\d{2})(?:\.(\d+))?([Zz]|[+-]\d{2}:\d{2})$)");

    std::smatch m;
    if (!std::regex_match(raw, m, rfc3339_regex)) {
        return std::nullopt;
    }

    int year = std::stoi(m[1].str());
    int month = std::stoi(m[2].str());
    int day = std::stoi(m[3].str());
    int hour = std::stoi(m[4].str());
    int minute = std::stoi(m[5].str());
    int second = std::stoi(m[6].str());
    if (!valid_date(year, month, day) || !valid_time(hour, minute, second)) {
        return std::nullopt;
    }

    long offset = 0;
    std::string zone = m[8].str();
    if (zone != "Z" && zone != "z") {
        int off_h = std::stoi(zone.substr(1, 2));
        int off_m = std::stoi(zone.substr(4, 2));
        if (off_h > 23 || off_m > 59) {
            return std::nullopt;
        }
        offset = off_h * 3600L + off_m * 60L;
        if (zone[0] == '-') {
            offset = -offset;
        }
    }

    std::string fraction = m[7].matched ? format_fraction(m[7].str()) : std::string();
    return fmt::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}{}{}", year, month, day, hour,
                       minute, second, fraction, format_offset(offset));
}

std::optional<std::string> parse_local_timestamp(const std::string& raw) {
    static const std::regex local_regex(R"(^(\d{4})/(\d{1,2})/(\d{1,2}) (\d{1,2}):(\d{2}):(\d{2})$)");

    std::smatch m;
    if (!std::regex_match(raw, m, local_regex)) {
        return std::nullopt;
    }

    int year = std::stoi(m[1].str());
    int month = std::stoi(m[2].str());
    int day = std::stoi(m[3].str());
    int hour = std::stoi(m[4].str());
    int minute = std::stoi(m[5].str());
    int second = std::stoi(m[6].str());
    if (!valid_date(year, month, day) || !valid_time(hour, minute, second) || second == 60) {
        return std::nullopt;
    }

    std::tm wall{};
    wall.tm_year = year - 1900;
    wall.tm_mon = month - 1;
    wall.tm_mday = day;
    wall.tm_hour = hour;
    wall.tm_min = minute;
    wall.tm_sec = second;

    // Try the wall time as standard and as daylight time. mktime normalizes
    // a time that does not exist under the requested flag, so a candidate
    // only counts if it keeps both the wall time and the flag.
    std::optional<long> offset;
    int matches = 0;
    for (int isdst : {0, 1}) {
        std::tm tm = wall;
        tm.tm_isdst = isdst;
        if (std::mktime(&tm) == static_cast<std::time_t>(-1)) {
            continue;
        }
        if (tm.tm_isdst != isdst || tm.tm_hour != hour || tm.tm_min != minute ||
            tm.tm_mday != day) {
            continue;
        }
        if (!offset || *offset != tm.tm_gmtoff) {
            matches++;
        }
        offset = tm.tm_gmtoff;
    }

    if (matches == 0) {
        spdlog::debug("[Materializer] Local time {} does not exist in this time zone", raw);
        return std::nullopt;
    }
    if (matches > 1) {
        spdlog::debug("[Materializer] Local time {} is ambiguous in this time zone", raw);
        return std::nullopt;
    }

    return fmt::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}{}", year, month, day, hour,
                       minute, second, format_offset(*offset));
}

std::optional<std::string> subscription_title_of(const json& account) {
    auto usage = account.find("usageData");
    if (usage == account.end() || !usage->is_object()) {
        return std::nullopt;
    }
    auto info = usage->find("subscriptionInfo");
    if (info == usage->end() || !info->is_object()) {
        return std::nullopt;
    }
    for (const char* key : {"subscriptionTitle", "subscriptionName", "subscriptionType"}) {
        auto it = info->find(key);
        if (it != info->end()) {
            // First present key wins, even if it is not a string
            if (it->is_string()) {
                return it->get<std::string>();
            }
            return std::nullopt;
        }
    }
    return std::nullopt;
}

SidecarError write_json_file(const fs::path& path, const json& doc, const char* what) {
    std::ofstream o(path, std::ios::trunc);
    if (!o.is_open()) {
        return SidecarErrorHelper::io_error(fmt::format("write {} failed ({}): {}", what,
                                                        path.string(), strerror(errno)));
    }

    o << std::setw(2) << doc << std::endl;

    if (!o.good()) {
        return SidecarErrorHelper::io_error(
            fmt::format("write {} failed ({}): stream error", what, path.string()));
    }
    return SidecarErrorHelper::success();
}

} // namespace

json LaunchConfig::to_json() const {
    return {{"host", host},
            {"port", port},
            {"region", region},
            {"kiroVersion", runtime_version},
            {"apiKey", api_key},
            {"adminApiKey", admin_key},
            {"proxyUrl", optional_to_json(proxy_url)},
            {"loadBalancingMode", load_balancing_mode},
            {"tlsBackend", tls_backend}};
}

json Credential::to_json() const {
    return {{"id", id},
            {"refreshToken", refresh_token},
            {"authMethod", auth_method},
            {"priority", priority},
            {"disabled", disabled},
            {"accessToken", optional_to_json(access_token)},
            {"profileArn", optional_to_json(profile_arn)},
            {"expiresAt", optional_to_json(expires_at)},
            {"clientId", optional_to_json(client_id)},
            {"clientSecret", optional_to_json(client_secret)},
            {"region", optional_to_json(region)},
            {"email", optional_to_json(email)},
            {"subscriptionTitle", optional_to_json(subscription_title)}};
}

std::optional<std::string> normalize_expires_at(const std::string& raw) {
    std::string value = trim(raw);
    if (value.empty()) {
        return std::nullopt;
    }

    if (auto rfc = parse_rfc3339(value)) {
        return rfc;
    }
    return parse_local_timestamp(value);
}

bool is_disabled_status(const std::string& status) {
    std::string lower = to_lower(status);
    return lower.find("banned") != std::string::npos ||
           lower.find("suspend") != std::string::npos ||
           lower.find("\xE5\xB0\x81\xE7\xA6\x81") != std::string::npos; // 封禁
}

std::optional<Credential> account_to_credential(const json& account, size_t index,
                                                const std::string& default_region) {
    if (!account.is_object()) {
        return std::nullopt;
    }

    auto refresh_token = optional_string(account, "refreshToken");
    if (!refresh_token) {
        return std::nullopt;
    }

    Credential cred;
    cred.id = static_cast<uint64_t>(index) + 1;
    cred.priority = static_cast<uint32_t>(index);
    cred.refresh_token = *refresh_token;

    cred.access_token = optional_string(account, "accessToken");
    cred.profile_arn = optional_string(account, "profileArn");
    cred.client_id = optional_string(account, "clientId");
    cred.client_secret = optional_string(account, "clientSecret");
    cred.email = optional_string(account, "email");
    cred.subscription_title = subscription_title_of(account);

    auto expires = optional_string(account, "expiresAt");
    if (expires) {
        cred.expires_at = normalize_expires_at(*expires);
        if (!cred.expires_at) {
            spdlog::debug("[Materializer] Account #{}: dropping unparseable expiresAt", index);
        }
    }

    auto region = optional_string(account, "region");
    cred.region = region ? *region : default_region;

    std::string provider = to_lower(optional_string(account, "provider").value_or("social"));
    bool has_idc_fields = cred.client_id.has_value() && cred.client_secret.has_value();
    if (provider.find("builder") != std::string::npos ||
        provider.find("enterprise") != std::string::npos || has_idc_fields) {
        cred.auth_method = AUTH_METHOD_IDC;
    } else {
        cred.auth_method = AUTH_METHOD_SOCIAL;
    }

    auto status = account.find("status");
    if (status != account.end() && status->is_string()) {
        cred.disabled = is_disabled_status(status->get<std::string>());
    }

    return cred;
}

SidecarError build_credentials(const std::string& store_path, const std::string& default_region,
                               std::vector<Credential>& credentials) {
    credentials.clear();

    std::error_code ec;
    if (!fs::exists(store_path, ec)) {
        spdlog::error("[Materializer] Shared accounts file not found: {}", store_path);
        return SidecarErrorHelper::config_missing(store_path);
    }

    std::ifstream file(store_path);
    if (!file.is_open()) {
        return SidecarErrorHelper::config_invalid(
            fmt::format("read shared accounts failed ({}): {}", store_path, strerror(errno)));
    }

    json accounts;
    try {
        accounts = json::parse(file);
    } catch (const json::exception& e) {
        spdlog::error("[Materializer] Failed to parse {}: {}", store_path, e.what());
        return SidecarErrorHelper::config_invalid(
            std::string("parse shared accounts failed: ") + e.what());
    }

    if (!accounts.is_array()) {
        return SidecarErrorHelper::config_invalid(
            "parse shared accounts failed: expected an array of accounts");
    }

    for (size_t i = 0; i < accounts.size(); ++i) {
        if (auto cred = account_to_credential(accounts[i], i, default_region)) {
            credentials.push_back(std::move(*cred));
        }
    }

    spdlog::debug("[Materializer] {} of {} account(s) usable", credentials.size(),
                  accounts.size());

    if (credentials.empty()) {
        return SidecarErrorHelper::no_usable_credentials();
    }
    return SidecarErrorHelper::success();
}

SidecarError write_runtime_files(const std::string& data_dir, const LaunchConfig& config,
                                 const std::vector<Credential>& credentials,
                                 MaterializedFiles& out) {
    std::error_code ec;
    fs::create_directories(data_dir, ec);
    if (ec) {
        return SidecarErrorHelper::io_error("create data dir failed (" + data_dir +
                                            "): " + ec.message());
    }

    fs::path config_path = fs::path(data_dir) / "config.json";
    fs::path credentials_path = fs::path(data_dir) / "credentials.json";

    auto err = write_json_file(config_path, config.to_json(), "config");
    if (!err) {
        return err;
    }

    json creds = json::array();
    for (const auto& cred : credentials) {
        creds.push_back(cred.to_json());
    }
    err = write_json_file(credentials_path, creds, "credentials");
    if (!err) {
        return err;
    }

    out.config_path = config_path.string();
    out.credentials_path = credentials_path.string();
    spdlog::info("[Materializer] Wrote {} credential(s) to {}", credentials.size(), data_dir);
    return SidecarErrorHelper::success();
}

SidecarError materialize(const std::string& store_path, const std::string& data_dir,
                         const LaunchConfig& config, MaterializedFiles& out,
                         size_t* credential_count) {
    std::vector<Credential> credentials;
    auto err = build_credentials(store_path, config.region, credentials);
    if (!err) {
        return err;
    }
    if (credential_count) {
        *credential_count = credentials.size();
    }
    return write_runtime_files(data_dir, config, credentials, out);
}

} // namespace kiro2api
