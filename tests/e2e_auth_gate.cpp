// SPDX-License-Identifier: Apache-2.0
// End-to-end: TokenStore + Server on loopback, real TCP clients.
#include "mellon/server.hpp"
#include "mellon/token_store.hpp"
#include "mellon/log.hpp"
#include "mellon/errors.hpp"
#include "test_util.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

using namespace mellon_test;

static const std::string kSecret = "11111111-1111-1111-1111-111111111111";

static std::string ask(uint16_t port, const std::string& auth_line) {
    int fd = connect_loopback(port);
    send_text(fd, request_with(auth_line));
    std::string st = status_line(read_all(fd));
    ::close(fd);
    return st;
}

static std::string ask_bearer(uint16_t port, const std::string& secret) {
    return ask(port, "Authorization: Bearer " + secret);
}

// Runs serve() on a background thread for the lifetime of the object.
class RunningServer {
public:
    RunningServer(const mellon::ServerConfig& cfg, const mellon::TokenStore& store)
        : srv(cfg, store)
    {
        srv.listen();
        th = std::thread([this] { srv.serve(); });
    }
    ~RunningServer() {
        srv.stop();
        th.join();
    }
    uint16_t port() const { return srv.bound_port(); }

    mellon::Server srv;
private:
    std::thread th;
};

static mellon::ServerConfig loopback_cfg() {
    mellon::ServerConfig cfg;
    cfg.host = "127.0.0.1";
    cfg.port = 0;
    cfg.read_timeout_sec = 2;
    cfg.write_timeout_sec = 2;
    return cfg;
}

static void test_basic_decisions() {
    TempDir dir;
    write_file(dir.file("tokens"), "svc-a:" + kSecret + "\n");
    mellon::TokenStore store(dir.file("tokens"));
    assert(store.contains_token(kSecret));
    assert(!store.contains_token("nope"));

    RunningServer rs(loopback_cfg(), store);
    assert(rs.port() != 0);

    assert(ask_bearer(rs.port(), kSecret) == "HTTP/1.1 200 OK");
    assert(ask_bearer(rs.port(), "nope") == "HTTP/1.1 401 Unauthorized");
    assert(ask(rs.port(), "") == "HTTP/1.1 401 Unauthorized");
    assert(ask(rs.port(), "Authorization: Basic " + kSecret) == "HTTP/1.1 401 Unauthorized");
}

static void test_silent_client_times_out() {
    TempDir dir;
    write_file(dir.file("tokens"), "svc-a:" + kSecret + "\n");
    mellon::TokenStore store(dir.file("tokens"));
    mellon::ServerConfig cfg = loopback_cfg();
    cfg.read_timeout_sec = 1;
    RunningServer rs(cfg, store);

    int idle = connect_loopback(rs.port());
    const auto t0 = std::chrono::steady_clock::now();
    const std::string st = status_line(read_all(idle));
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - t0).count();
    ::close(idle);
    assert(st == "HTTP/1.1 401 Unauthorized");
    assert(ms >= 800 && ms < 5000);

    // the listener is still serving afterwards
    assert(ask_bearer(rs.port(), kSecret) == "HTTP/1.1 200 OK");
}

// An idle connection must not hold up other clients.
static void test_no_head_of_line_blocking() {
    TempDir dir;
    write_file(dir.file("tokens"), "svc-a:" + kSecret + "\n");
    mellon::TokenStore store(dir.file("tokens"));
    mellon::ServerConfig cfg = loopback_cfg();
    cfg.read_timeout_sec = 3;
    RunningServer rs(cfg, store);

    int idle = connect_loopback(rs.port());
    send_text(idle, "GET / HTTP/1.1\r\n");  // never finishes its headers

    const auto t0 = std::chrono::steady_clock::now();
    for (int i = 0; i < 5; ++i) {
        assert(ask_bearer(rs.port(), kSecret) == "HTTP/1.1 200 OK");
    }
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - t0).count();
    assert(ms < 1500);

    assert(status_line(read_all(idle)) == "HTTP/1.1 401 Unauthorized");
    ::close(idle);
}

static void test_parallel_clients() {
    TempDir dir;
    write_file(dir.file("tokens"), "svc-a:" + kSecret + "\n");
    mellon::TokenStore store(dir.file("tokens"));
    RunningServer rs(loopback_cfg(), store);

    std::atomic<int> ok{0}, denied{0};
    std::vector<std::thread> clients;
    for (int i = 0; i < 16; ++i) {
        clients.emplace_back([&, i] {
            for (int j = 0; j < 10; ++j) {
                const bool good = ((i + j) % 2) == 0;
                const std::string st = ask_bearer(rs.port(), good ? kSecret : "bad-" + std::to_string(i));
                if (good && st == "HTTP/1.1 200 OK") ++ok;
                if (!good && st == "HTTP/1.1 401 Unauthorized") ++denied;
            }
        });
    }
    for (auto& c : clients) c.join();
    assert(ok.load() == 80);
    assert(denied.load() == 80);
}

// Admin mutations land in the file; the server sees them after reload().
static void test_admin_changes_need_reload() {
    TempDir dir;
    const std::string path = dir.file("tokens");
    mellon::TokenStore serving(path);
    RunningServer rs(loopback_cfg(), serving);

    mellon::Token issued;
    {
        mellon::TokenStore admin(path);
        issued = admin.create("late-comer");
    }
    assert(ask_bearer(rs.port(), issued.secret) == "HTTP/1.1 401 Unauthorized");
    serving.reload();
    assert(ask_bearer(rs.port(), issued.secret) == "HTTP/1.1 200 OK");

    {
        mellon::TokenStore admin(path);
        admin.rescind("late-comer");
    }
    assert(ask_bearer(rs.port(), issued.secret) == "HTTP/1.1 200 OK");
    serving.reload();
    assert(ask_bearer(rs.port(), issued.secret) == "HTTP/1.1 401 Unauthorized");

    // a corrupt file does not disturb what is being served
    mellon::Token kept = serving.create("kept");
    write_file(path, "garbage without separator\n");
    bool threw = false;
    try {
        serving.reload();
    } catch (const mellon::ParseError&) {
        threw = true;
    }
    assert(threw);
    assert(ask_bearer(rs.port(), kept.secret) == "HTTP/1.1 200 OK");
}

static void test_sequential_mode() {
    TempDir dir;
    write_file(dir.file("tokens"), "svc-a:" + kSecret + "\n");
    mellon::TokenStore store(dir.file("tokens"));
    mellon::ServerConfig cfg = loopback_cfg();
    cfg.sequential = true;
    RunningServer rs(cfg, store);
    assert(ask_bearer(rs.port(), kSecret) == "HTTP/1.1 200 OK");
    assert(ask_bearer(rs.port(), "nope") == "HTTP/1.1 401 Unauthorized");
}

static void test_bind_failure_is_fatal() {
    TempDir dir;
    mellon::TokenStore store(dir.file("tokens"));
    RunningServer rs(loopback_cfg(), store);

    mellon::ServerConfig cfg = loopback_cfg();
    cfg.port = rs.port();
    mellon::Server second(cfg, store);
    bool threw = false;
    try {
        second.listen();
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);

    // TEST-NET-1 is never a local address
    cfg.host = "192.0.2.1";
    cfg.port = 0;
    mellon::Server foreign(cfg, store);
    threw = false;
    try {
        foreign.run();
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);
}

static void test_host_port_parsing() {
    mellon::ServerConfig cfg;
    assert(mellon::parse_host_port("localhost:8090", cfg));
    assert(cfg.host == "localhost" && cfg.port == 8090);
    assert(mellon::parse_host_port("0.0.0.0:1", cfg));
    assert(cfg.host == "0.0.0.0" && cfg.port == 1);
    assert(mellon::parse_host_port("[::1]:9000", cfg));
    assert(cfg.host == "::1" && cfg.port == 9000);
    assert(mellon::parse_host_port(":8090", cfg));
    assert(cfg.host.empty() && cfg.port == 8090);

    assert(!mellon::parse_host_port("localhost", cfg));
    assert(!mellon::parse_host_port("localhost:", cfg));
    assert(!mellon::parse_host_port("localhost:http", cfg));
    assert(!mellon::parse_host_port("localhost:70000", cfg));
    assert(!mellon::parse_host_port("::1:9000", cfg));
    assert(!mellon::parse_host_port("[::1]9000", cfg));
}

int main() {
    mellon::set_log_quiet(true);

    test_host_port_parsing();
    test_basic_decisions();
    test_silent_client_times_out();
    test_no_head_of_line_blocking();
    test_parallel_clients();
    test_admin_changes_need_reload();
    test_sequential_mode();
    test_bind_failure_is_fatal();

    std::cout << "e2e_auth_gate OK" << std::endl;
    return 0;
}
