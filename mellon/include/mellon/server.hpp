/*
 * Part of the Mellon project.
 *
 * SPDX-FileCopyrightText: 2025 Mellon contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Mellon. See LICENSE for details.
 */

#pragma once
#include <atomic>
#include <mutex>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <string>
#include "mellon/server_config.hpp"
#include "mellon/token_store.hpp"

namespace mellon {

// Bearer-token authorization gate over plain TCP.
// The store is borrowed and must outlive the server.
class Server {
public:
    Server(const ServerConfig& cfg, const TokenStore& store);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    // Blocking run: listen() then serve().
    void run();

    // Resolve and bind cfg.host:cfg.port. Throws std::runtime_error on failure.
    void listen();

    // Accept until stop(); returns once in-flight handlers have finished.
    void serve();

    // Sets the stop flag and shuts the listening socket down to unblock accept().
    void stop();

    // Actual bound port (resolves port 0), 0 before listen().
    uint16_t bound_port() const { return _bound_port.load(); }

private:
    ServerConfig _cfg;
    const TokenStore& _store;
    std::atomic<bool> _stop{false};
    std::mutex _fd_mtx;                // orders stop()'s shutdown against close
    std::atomic<int> _listen_fd{-1};
    std::atomic<uint16_t> _bound_port{0};

    std::mutex _inflight_mtx;
    std::condition_variable _inflight_cv;
    std::size_t _inflight = 0;

    void dispatch(int fd, const std::string& peer);
    void wait_for_handlers();
    void close_listen_socket();
};

} // namespace mellon
