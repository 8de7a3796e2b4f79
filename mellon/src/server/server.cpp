/*
 * Part of the Mellon project.
 *
 * SPDX-FileCopyrightText: 2025 Mellon contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Mellon. See LICENSE for details.
 */

#include "mellon/server.hpp"
#include "mellon/internal/connection.hpp"
#include "mellon/log.hpp"

#include <stdexcept>
#include <string>
#include <cstring>
#include <cstdio>
#include <cerrno>
#include <chrono>
#include <thread>
#include <system_error>

#include <sys/types.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <unistd.h>

namespace mellon {

// ---------- small socket helpers (internal) ----------

static int set_reuseaddr(int s) { int o = 1; return ::setsockopt(s, SOL_SOCKET, SO_REUSEADDR, &o, sizeof(o)); }
static int set_nodelay (int s)  { int o = 1; return ::setsockopt(s, IPPROTO_TCP, TCP_NODELAY, &o, sizeof(o)); }

static std::string sockaddr_to_peer(const sockaddr_storage& ss) {
    char buf[INET6_ADDRSTRLEN] = {0};
    uint16_t port = 0;
    if (ss.ss_family == AF_INET) {
        const sockaddr_in* a = reinterpret_cast<const sockaddr_in*>(&ss);
        inet_ntop(AF_INET, &a->sin_addr, buf, sizeof(buf));
        port = ntohs(a->sin_port);
    } else if (ss.ss_family == AF_INET6) {
        const sockaddr_in6* a = reinterpret_cast<const sockaddr_in6*>(&ss);
        inet_ntop(AF_INET6, &a->sin6_addr, buf, sizeof(buf));
        port = ntohs(a->sin6_port);
    } else {
        std::snprintf(buf, sizeof(buf), "unknown");
    }
    return std::string(buf) + ":" + std::to_string(port);
}

static uint16_t local_port(int fd) {
    sockaddr_storage ss{};
    socklen_t len = sizeof(ss);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&ss), &len) < 0) return 0;
    if (ss.ss_family == AF_INET)  return ntohs(reinterpret_cast<sockaddr_in*>(&ss)->sin_port);
    if (ss.ss_family == AF_INET6) return ntohs(reinterpret_cast<sockaddr_in6*>(&ss)->sin6_port);
    return 0;
}

bool parse_host_port(const std::string& hostport, ServerConfig& cfg) {
    std::string host, port_s;
    if (!hostport.empty() && hostport[0] == '[') {
        std::size_t rb = hostport.find(']');
        if (rb == std::string::npos || rb + 1 >= hostport.size() || hostport[rb + 1] != ':') {
            return false;
        }
        host   = hostport.substr(1, rb - 1);
        port_s = hostport.substr(rb + 2);
    } else {
        std::size_t c = hostport.rfind(':');
        if (c == std::string::npos) return false;
        host   = hostport.substr(0, c);
        port_s = hostport.substr(c + 1);
        if (host.find(':') != std::string::npos) return false; // bare v6 needs brackets
    }
    if (port_s.empty() || port_s.size() > 5) return false;
    unsigned long p = 0;
    for (char ch : port_s) {
        if (ch < '0' || ch > '9') return false;
        p = p * 10 + static_cast<unsigned long>(ch - '0');
    }
    if (p > 65535) return false;
    cfg.host = host;
    cfg.port = static_cast<uint16_t>(p);
    return true;
}

// ---------- Server impl ----------

Server::Server(const ServerConfig& cfg, const TokenStore& store)
    : _cfg(cfg), _store(store)
{
}

Server::~Server() {
    stop();
    close_listen_socket();
    wait_for_handlers();
}

void Server::close_listen_socket() {
    std::lock_guard<std::mutex> lk(_fd_mtx);
    int fd = _listen_fd.exchange(-1);
    if (fd >= 0) ::close(fd);
}

void Server::stop() {
    _stop.store(true, std::memory_order_relaxed);
    std::lock_guard<std::mutex> lk(_fd_mtx);
    int fd = _listen_fd.load();
    if (fd >= 0) {
        // Wakes a thread blocked in accept(); the fd is closed by serve().
        (void)::shutdown(fd, SHUT_RDWR);
    }
}

void Server::listen() {
    addrinfo hints{};
    hints.ai_family   = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags    = AI_PASSIVE;

    const std::string port_s = std::to_string(_cfg.port);
    addrinfo* res = nullptr;
    int rc = ::getaddrinfo(_cfg.host.empty() ? nullptr : _cfg.host.c_str(),
                           port_s.c_str(), &hints, &res);
    if (rc != 0) {
        mellon::log_line(std::string("[FATAL] cannot resolve ") + _cfg.host + ": " + gai_strerror(rc));
        throw std::runtime_error("getaddrinfo() failed for " + _cfg.host);
    }

    int srv = -1;
    std::string last_err = "no usable address";
    for (addrinfo* ai = res; ai; ai = ai->ai_next) {
        int s = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (s < 0) {
            last_err = std::string("socket(): ") + std::strerror(errno);
            continue;
        }
        (void)set_reuseaddr(s);
        if (::bind(s, ai->ai_addr, ai->ai_addrlen) < 0) {
            last_err = std::string("bind(): ") + std::strerror(errno);
            ::close(s);
            continue;
        }
        if (::listen(s, _cfg.backlog) < 0) {
            last_err = std::string("listen(): ") + std::strerror(errno);
            ::close(s);
            continue;
        }
        srv = s;
        break;
    }
    ::freeaddrinfo(res);

    if (srv < 0) {
        mellon::log_line("[FATAL] cannot bind " + _cfg.host + ":" + port_s + ": " + last_err);
        throw std::runtime_error("bind failed for " + _cfg.host + ":" + port_s + " (" + last_err + ")");
    }

    _bound_port.store(local_port(srv));
    _listen_fd.store(srv);
    mellon::log_line("[INFO] Listening on " + _cfg.host + ":" + std::to_string(_bound_port.load()) +
                     (_cfg.sequential ? " (sequential)" : " (thread per connection)"));
}

void Server::run() {
    mellon::log_line("[INFO] Mellon auth server starting...");
    mellon::log_line("[INFO] Tokens: " + std::to_string(_store.size()) + " from " + _store.path());
    mellon::log_line("[INFO] Read timeout=" + std::to_string(_cfg.read_timeout_sec) +
                     "s, write timeout=" + std::to_string(_cfg.write_timeout_sec) + "s");
    listen();
    serve();
}

void Server::serve() {
    if (_listen_fd.load() < 0) {
        throw std::runtime_error("serve() called before listen()");
    }

    while (!_stop.load(std::memory_order_relaxed)) {
        sockaddr_storage cli{};
        socklen_t cl = sizeof(cli);
        int fd = ::accept(_listen_fd.load(), reinterpret_cast<sockaddr*>(&cli), &cl);
        if (fd < 0) {
            if (_stop.load(std::memory_order_relaxed)) break;
            if (errno == EINTR) continue;
            const int err = errno;
            mellon::log_line(std::string("[WARN] accept() failed: ") + std::strerror(err));
            if (err == EMFILE || err == ENFILE) {
                // Out of descriptors; give in-flight handlers a moment to release some.
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
            }
            continue;
        }
        (void)set_nodelay(fd);
        dispatch(fd, sockaddr_to_peer(cli));
    }

    close_listen_socket();
    wait_for_handlers();
    mellon::log_line("[INFO] Server stopped");
}

void Server::dispatch(int fd, const std::string& peer) {
    if (_cfg.sequential) {
        internal::handle_connection(fd, _cfg, peer, _store);
        return;
    }

    {
        std::lock_guard<std::mutex> lk(_inflight_mtx);
        ++_inflight;
    }
    try {
        // Detach a per-connection handler; it closes the fd itself.
        std::thread([this, fd, peer]() {
            internal::handle_connection(fd, this->_cfg, peer, this->_store);
            std::lock_guard<std::mutex> lk(this->_inflight_mtx);
            --this->_inflight;
            this->_inflight_cv.notify_all();
        }).detach();
    } catch (const std::system_error& e) {
        {
            std::lock_guard<std::mutex> lk(_inflight_mtx);
            --_inflight;
        }
        mellon::log_line(std::string("[WARN] cannot spawn handler thread (") + e.what() +
                         "), serving inline");
        internal::handle_connection(fd, _cfg, peer, _store);
    }
}

void Server::wait_for_handlers() {
    std::unique_lock<std::mutex> lk(_inflight_mtx);
    _inflight_cv.wait(lk, [this]{ return _inflight == 0; });
}

} // namespace mellon
