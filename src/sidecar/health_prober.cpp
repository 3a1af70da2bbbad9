// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "health_prober.h"

#include "hv/requests.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <system_error>

namespace kiro2api {

namespace {

constexpr auto JOIN_TIMEOUT = std::chrono::seconds(2);
constexpr auto JOIN_POLL_INTERVAL = std::chrono::milliseconds(10);

} // namespace

std::string probe_host_for(const std::string& bind_host) {
    if (bind_host.empty() || bind_host == "0.0.0.0" || bind_host == "::" ||
        bind_host == "[::]") {
        return "127.0.0.1";
    }
    return bind_host;
}

bool HealthProber::probe(const ProbeTarget& target, std::chrono::milliseconds wait) {
    auto result = probe_async(target);
    if (result.wait_for(wait) != std::future_status::ready) {
        spdlog::debug("[HealthProber] Probe of port {} did not finish within {}ms", target.port,
                      wait.count());
        return false;
    }
    return result.get();
}

HttpHealthProber::HttpHealthProber(HealthProbeConfig config)
    : state_(std::make_shared<State>(std::move(config))) {}

HttpHealthProber::~HttpHealthProber() {
    cancel_all();

    std::list<Worker> to_join;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        to_join = std::move(workers_);
    }

    // Timed join: a probe stuck in libhv must not hang shutdown
    for (auto& worker : to_join) {
        auto start = std::chrono::steady_clock::now();
        while (!worker.done->load()) {
            if (std::chrono::steady_clock::now() - start > JOIN_TIMEOUT) {
                spdlog::warn("[HealthProber] Probe thread still running after {}s, detaching",
                             JOIN_TIMEOUT.count());
                break;
            }
            std::this_thread::sleep_for(JOIN_POLL_INTERVAL);
        }
        if (worker.done->load()) {
            worker.thread.join();
        } else {
            worker.thread.detach();
        }
    }
}

bool HttpHealthProber::probe_blocking(const ProbeTarget& target) const {
    return request_once(*state_, target);
}

bool HttpHealthProber::request_once(const State& state, const ProbeTarget& target) {
    if (state.cancelled.load() || target.port == 0) {
        return false;
    }

    std::string url = "http://" + probe_host_for(target.host) + ":" +
                      std::to_string(target.port) + state.config.path;

    auto req = std::make_shared<HttpRequest>();
    req->method = HTTP_GET;
    req->url = url;
    // libhv timeouts are whole seconds
    req->timeout = std::max(1, (state.config.timeout_ms + 999) / 1000);
    if (!state.config.auth_header.empty() && !target.api_key.empty()) {
        req->headers[state.config.auth_header] = target.api_key;
    }

    auto resp = requests::request(req);
    if (!resp) {
        spdlog::debug("[HealthProber] GET {} failed (no response)", url);
        return false;
    }

    int status = static_cast<int>(resp->status_code);
    bool healthy = status >= 200 && status < 300;
    spdlog::trace("[HealthProber] GET {} -> HTTP {}", url, status);
    return healthy;
}

void HttpHealthProber::join_finished_locked() {
    for (auto it = workers_.begin(); it != workers_.end();) {
        if (it->done->load()) {
            it->thread.join();
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
}

std::future<bool> HttpHealthProber::probe_async(const ProbeTarget& target) {
    std::promise<bool> promise;
    std::future<bool> result = promise.get_future();

    if (state_->cancelled.load()) {
        promise.set_value(false);
        return result;
    }

    auto done = std::make_shared<std::atomic<bool>>(false);

    std::lock_guard<std::mutex> lock(workers_mutex_);
    join_finished_locked();

    try {
        std::thread worker([state = state_, target, done, p = std::move(promise)]() mutable {
            bool healthy = false;
            try {
                healthy = request_once(*state, target);
            } catch (const std::exception& e) {
                spdlog::debug("[HealthProber] Probe threw: {}", e.what());
            }
            p.set_value(healthy && !state->cancelled.load());
            done->store(true);
        });
        workers_.push_back(Worker{std::move(worker), done});
    } catch (const std::system_error& e) {
        // Thread creation failed; the promise was moved into the failed lambda
        spdlog::warn("[HealthProber] Could not start probe thread: {}", e.what());
        std::promise<bool> fallback;
        fallback.set_value(false);
        return fallback.get_future();
    }

    return result;
}

void HttpHealthProber::cancel_all() {
    state_->cancelled.store(true);
}

} // namespace kiro2api
