// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file mock_health_prober.h
 * @brief Health prober with a fixed answer and no network I/O
 */

#include "health_prober.h"

#include <atomic>
#include <future>
#include <mutex>

using namespace kiro2api;

class MockHealthProber : public HealthProber {
  public:
    std::future<bool> probe_async(const ProbeTarget& target) override {
        probe_count++;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            last_target_ = target;
        }
        std::promise<bool> promise;
        promise.set_value(healthy.load());
        return promise.get_future();
    }

    void cancel_all() override {
        cancelled = true;
    }

    ProbeTarget last_target() {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_target_;
    }

    std::atomic<bool> healthy{true};
    std::atomic<int> probe_count{0};
    std::atomic<bool> cancelled{false};

  private:
    std::mutex mutex_;
    ProbeTarget last_target_;
};
