// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file health_prober.h
 * @brief Bounded, asynchronous HTTP liveness probe for the running sidecar
 *
 * An unhealthy-but-running sidecar is a normal state, so probes never fail:
 * connection errors, non-2xx status and timeouts all fold into false.
 */

#include <atomic>
#include <chrono>
#include <cstdint>
#include <future>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>

namespace kiro2api {

/**
 * @brief Liveness endpoint contract
 *
 * Path and header are configuration points; defaults match the sidecar's
 * model-listing endpoint guarded by the API key.
 */
struct HealthProbeConfig {
    std::string path = "/v1/models";
    std::string auth_header = "x-api-key"; ///< Empty to send no credential
    int timeout_ms = 3000;
};

struct ProbeTarget {
    std::string host = "127.0.0.1";
    uint16_t port = 0;
    std::string api_key;
};

/**
 * @brief Map a bind address to an address we can connect to
 *
 * Wildcard binds ("", "0.0.0.0", "::", "[::]") are probed on 127.0.0.1.
 */
std::string probe_host_for(const std::string& bind_host);

class HealthProber {
  public:
    virtual ~HealthProber() = default;

    /**
     * @brief Start a probe without blocking the caller
     *
     * The returned future never blocks in its destructor.
     */
    virtual std::future<bool> probe_async(const ProbeTarget& target) = 0;

    /// Abandon outstanding and future probes (their futures resolve to false)
    virtual void cancel_all() {}

    /**
     * @brief Probe and wait at most @p wait for the answer
     *
     * @return true only if the probe completed in time and succeeded
     */
    bool probe(const ProbeTarget& target, std::chrono::milliseconds wait);
};

/**
 * @brief libhv-based prober: GET http://<host>:<port><path>
 *
 * Each probe runs on a tracked worker thread; finished workers are joined
 * lazily and outstanding ones are joined (with a bounded wait) on destruction.
 * A worker still inside libhv after that wait is detached; it only touches
 * the shared State, never the prober itself.
 */
class HttpHealthProber : public HealthProber {
  public:
    explicit HttpHealthProber(HealthProbeConfig config = {});
    ~HttpHealthProber() override;

    HttpHealthProber(const HttpHealthProber&) = delete;
    HttpHealthProber& operator=(const HttpHealthProber&) = delete;

    std::future<bool> probe_async(const ProbeTarget& target) override;
    void cancel_all() override;

    /// Synchronous request (bounded by the configured timeout)
    bool probe_blocking(const ProbeTarget& target) const;

    const HealthProbeConfig& config() const {
        return state_->config;
    }

  private:
    /// Outlives the prober while a detached worker still holds it
    struct State {
        explicit State(HealthProbeConfig c) : config(std::move(c)) {}

        const HealthProbeConfig config;
        std::atomic<bool> cancelled{false};
    };

    static bool request_once(const State& state, const ProbeTarget& target);

    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void join_finished_locked();

    std::shared_ptr<State> state_;
    std::mutex workers_mutex_;
    std::list<Worker> workers_;
};

} // namespace kiro2api
