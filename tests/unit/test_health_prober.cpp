// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "health_prober.h"

#include "../mocks/mock_health_prober.h"

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <thread>

#include <catch2/catch_test_macros.hpp>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

using namespace kiro2api;

namespace {

/**
 * @brief One-shot HTTP responder on a loopback ephemeral port
 *
 * Accepts a single connection, records the request head and answers with a
 * fixed status line, optionally after @p delay.
 */
class OneShotHttpServer {
  public:
    explicit OneShotHttpServer(int status,
                               std::chrono::milliseconds delay = std::chrono::milliseconds(0))
        : status_(status), delay_(delay) {
        fd_ = socket(AF_INET, SOCK_STREAM, 0);
        int one = 1;
        setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
        listen(fd_, 1);

        socklen_t len = sizeof(addr);
        getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);

        thread_ = std::thread([this]() { serve(); });
    }

    ~OneShotHttpServer() {
        shutdown(fd_, SHUT_RDWR);
        close(fd_);
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    uint16_t port() const {
        return port_;
    }

    /// Request head, available once the response has been sent
    std::string request() {
        return request_future_.get();
    }

  private:
    void serve() {
        int client = accept(fd_, nullptr, nullptr);
        if (client < 0) {
            request_promise_.set_value("");
            return;
        }

        std::string head;
        char buf[1024];
        while (head.find("\r\n\r\n") == std::string::npos) {
            ssize_t n = recv(client, buf, sizeof(buf), 0);
            if (n <= 0) {
                break;
            }
            head.append(buf, static_cast<size_t>(n));
        }

        std::this_thread::sleep_for(delay_);

        std::string body = "{}";
        std::string response = "HTTP/1.1 " + std::to_string(status_) + " X\r\n" +
                               "Content-Type: application/json\r\n" +
                               "Content-Length: " + std::to_string(body.size()) + "\r\n" +
                               "Connection: close\r\n\r\n" + body;
        send(client, response.data(), response.size(), 0);
        close(client);
        request_promise_.set_value(head);
    }

    int status_;
    std::chrono::milliseconds delay_;
    int fd_ = -1;
    uint16_t port_ = 0;
    std::thread thread_;
    std::promise<std::string> request_promise_;
    std::future<std::string> request_future_ = request_promise_.get_future();
};

/// Port with nothing listening on it
uint16_t closed_port() {
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    socklen_t len = sizeof(addr);
    getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len);
    close(fd);
    return ntohs(addr.sin_port);
}

/// Prober whose answer never arrives
class StalledProber : public HealthProber {
  public:
    std::future<bool> probe_async(const ProbeTarget&) override {
        return promise_.get_future();
    }

    ~StalledProber() override {
        promise_.set_value(false);
    }

  private:
    std::promise<bool> promise_;
};

} // namespace

TEST_CASE("HealthProber: wildcard bind hosts are probed on loopback", "[health]") {
    CHECK(probe_host_for("0.0.0.0") == "127.0.0.1");
    CHECK(probe_host_for("::") == "127.0.0.1");
    CHECK(probe_host_for("") == "127.0.0.1");
    CHECK(probe_host_for("192.168.1.5") == "192.168.1.5");
}

TEST_CASE("HealthProber: 2xx response is healthy and carries the API key", "[health]") {
    OneShotHttpServer server(200);
    HttpHealthProber prober;

    ProbeTarget target;
    target.port = server.port();
    target.api_key = "sk-probe";

    REQUIRE(prober.probe(target, std::chrono::seconds(5)));

    std::string head = server.request();
    CHECK(head.rfind("GET /v1/models ", 0) == 0);
    CHECK(head.find("sk-probe") != std::string::npos);
}

TEST_CASE("HealthProber: configured path is requested", "[health]") {
    OneShotHttpServer server(200);
    HealthProbeConfig config;
    config.path = "/healthz";
    config.auth_header = "";
    HttpHealthProber prober(config);

    ProbeTarget target;
    target.port = server.port();
    target.api_key = "sk-hidden";

    REQUIRE(prober.probe(target, std::chrono::seconds(5)));

    std::string head = server.request();
    CHECK(head.rfind("GET /healthz ", 0) == 0);
    CHECK(head.find("sk-hidden") == std::string::npos);
}

TEST_CASE("HealthProber: non-2xx response is unhealthy", "[health]") {
    OneShotHttpServer server(401);
    HttpHealthProber prober;

    ProbeTarget target;
    target.port = server.port();

    REQUIRE_FALSE(prober.probe(target, std::chrono::seconds(5)));
}

TEST_CASE("HealthProber: connection refused is unhealthy, not an error", "[health]") {
    HttpHealthProber prober;

    ProbeTarget target;
    target.port = closed_port();

    REQUIRE_FALSE(prober.probe(target, std::chrono::seconds(5)));
}

TEST_CASE("HealthProber: port zero is never probed", "[health]") {
    HttpHealthProber prober;
    ProbeTarget target;
    REQUIRE_FALSE(prober.probe_blocking(target));
}

TEST_CASE("HealthProber: cancelled prober answers false immediately", "[health]") {
    OneShotHttpServer server(200);
    HttpHealthProber prober;
    prober.cancel_all();

    ProbeTarget target;
    target.port = server.port();

    auto future = prober.probe_async(target);
    REQUIRE(future.wait_for(std::chrono::milliseconds(0)) == std::future_status::ready);
    REQUIRE_FALSE(future.get());
}

TEST_CASE("HealthProber: destroying the prober while a reply is pending is safe", "[health]") {
    // Reply arrives after the destructor has given up waiting for the worker
    OneShotHttpServer server(200, std::chrono::milliseconds(2500));
    HealthProbeConfig config;
    config.timeout_ms = 5000;
    auto prober = std::make_unique<HttpHealthProber>(config);

    ProbeTarget target;
    target.port = server.port();
    auto future = prober->probe_async(target);
    std::this_thread::sleep_for(std::chrono::milliseconds(200));

    prober.reset();

    // The detached worker still completes, and reports the cancelled prober as unhealthy
    REQUIRE(future.wait_for(std::chrono::seconds(10)) == std::future_status::ready);
    REQUIRE_FALSE(future.get());
    CHECK(server.request().rfind("GET /v1/models ", 0) == 0);
}

TEST_CASE("HealthProber: probe() gives up after the wait bound", "[health]") {
    StalledProber prober;
    ProbeTarget target;
    target.port = 1;

    auto start = std::chrono::steady_clock::now();
    bool healthy = prober.probe(target, std::chrono::milliseconds(100));
    auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE_FALSE(healthy);
    REQUIRE(elapsed < std::chrono::seconds(2));
}

TEST_CASE("HealthProber: mock records the probed target", "[health]") {
    MockHealthProber prober;
    prober.healthy = false;

    ProbeTarget target;
    target.port = 8123;
    target.api_key = "k";

    REQUIRE_FALSE(prober.probe(target, std::chrono::milliseconds(10)));
    REQUIRE(prober.probe_count.load() == 1);
    REQUIRE(prober.last_target().port == 8123);
}
