/*
 * Part of the Mellon project.
 *
 * SPDX-FileCopyrightText: 2025 Mellon contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Mellon. See LICENSE for details.
 */

#include "mellon/internal/connection.hpp"
#include "mellon/internal/utils.hpp"
#include "mellon/errors.hpp"
#include "mellon/log.hpp"

#include <chrono>
#include <cerrno>
#include <cstring>
#include <limits>
#include <string>

#include <sys/types.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <poll.h>
#include <unistd.h>

namespace mellon::internal {

int poll_budget_ms(std::chrono::steady_clock::time_point deadline) {
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now()).count();
    if (left <= 0) return 0;
    if (left > std::numeric_limits<int>::max()) return std::numeric_limits<int>::max();
    return static_cast<int>(left);
}

namespace {

constexpr const char* kResp200 =
    "HTTP/1.1 200 OK\r\nContent-Length: 0\r\nConnection: close\r\n\r\n";
constexpr const char* kResp401 =
    "HTTP/1.1 401 Unauthorized\r\nContent-Length: 0\r\nConnection: close\r\n\r\n";

constexpr int         kLingerMs       = 250;
constexpr std::size_t kLingerMaxBytes = 64 * 1024;

// Closes the connection on every exit path.
class FdGuard {
public:
    explicit FdGuard(int fd) : _fd(fd) {}
    ~FdGuard() { if (_fd >= 0) ::close(_fd); }
    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;
private:
    int _fd;
};

bool send_all(int fd, const char* d, std::size_t len) {
    std::size_t off = 0;
    while (off < len) {
        ssize_t n = ::send(fd, d + off, len - off, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        off += static_cast<std::size_t>(n);
    }
    return true;
}

// Half-close and drain unread request bytes for up to kLingerMs, so the
// final close() does not reset the connection under the response.
void linger_close(int fd) {
    if (::shutdown(fd, SHUT_WR) < 0) return;
    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + std::chrono::milliseconds(kLingerMs);
    std::size_t drained = 0;
    char sink[1024];
    while (drained < kLingerMaxBytes) {
        const int left = poll_budget_ms(deadline);
        if (left <= 0) return;
        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLIN;
        int pr = ::poll(&pfd, 1, left);
        if (pr < 0 && errno == EINTR) continue;
        if (pr <= 0) return;
        ssize_t n = ::recv(fd, sink, sizeof(sink), 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return;
        drained += static_cast<std::size_t>(n);
    }
}

// Strip one trailing '\r' so CRLF and bare LF terminators look the same.
std::string take_line(std::string& buf, std::size_t nl) {
    std::string line = buf.substr(0, nl);
    buf.erase(0, nl + 1);
    if (!line.empty() && line.back() == '\r') line.pop_back();
    return line;
}

// Returns true when the line ends the scan (credential or blank line).
bool inspect_line(const std::string& line, ScanResult& r) {
    static const std::string prefix(kBearerPrefix);
    if (starts_with(line, prefix)) {
        r.outcome = ScanOutcome::TokenFound;
        r.secret = line.substr(prefix.size());
        return true;
    }
    if (line.empty()) {
        r.outcome = ScanOutcome::HeadersExhausted;
        return true;
    }
    return false;
}

} // namespace

const char* outcome_name(ScanOutcome o) {
    switch (o) {
        case ScanOutcome::TokenFound:       return "TOKEN_FOUND";
        case ScanOutcome::HeadersExhausted: return "NO_CREDENTIAL";
        case ScanOutcome::ReadTimedOut:     return "READ_TIMEOUT";
        case ScanOutcome::ReadError:        return "READ_ERROR";
    }
    return "UNKNOWN";
}

ScanResult scan_bearer(int fd, int timeout_sec, std::size_t max_line) {
    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + std::chrono::seconds(timeout_sec);

    ScanResult r;
    std::string buf;
    buf.reserve(1024);
    char chunk[1024];

    while (true) {
        // Drain complete lines already buffered.
        std::size_t nl;
        while ((nl = buf.find('\n')) != std::string::npos) {
            if (nl > max_line) {
                r.outcome = ScanOutcome::ReadError;
                return r;
            }
            if (inspect_line(take_line(buf, nl), r)) return r;
        }
        if (buf.size() > max_line) {
            r.outcome = ScanOutcome::ReadError; // header abuse guard
            return r;
        }

        const int left = poll_budget_ms(deadline);
        if (left <= 0) {
            r.outcome = ScanOutcome::ReadTimedOut;
            return r;
        }

        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLIN;
        int pr = ::poll(&pfd, 1, left);
        if (pr == 0) {
            r.outcome = ScanOutcome::ReadTimedOut;
            return r;
        }
        if (pr < 0) {
            if (errno == EINTR) continue;
            r.outcome = ScanOutcome::ReadError;
            return r;
        }

        ssize_t n = ::recv(fd, chunk, sizeof(chunk), 0);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            r.outcome = ScanOutcome::ReadError;
            return r;
        }
        if (n == 0) {
            // Peer finished sending: an unterminated last line still counts.
            if (!buf.empty()) {
                std::string last = buf;
                if (last.back() == '\r') last.pop_back();
                if (inspect_line(last, r)) return r;
            }
            r.outcome = ScanOutcome::HeadersExhausted;
            return r;
        }
        buf.append(chunk, chunk + n);
    }
}

void handle_connection(int fd,
                       const ServerConfig& cfg,
                       const std::string& peer,
                       const TokenStore& store)
{
    FdGuard guard(fd);
    try {
        timeval tv{cfg.write_timeout_sec, 0};
        if (::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) < 0) {
            mellon::log_line(std::string("[CONN] ip=") + peer +
                             " SO_SNDTIMEO failed: " + std::strerror(errno));
        }

        ScanResult sr = scan_bearer(fd, cfg.read_timeout_sec, cfg.max_line);

        bool ok = false;
        std::string reason = outcome_name(sr.outcome);
        if (sr.outcome == ScanOutcome::TokenFound) {
            try {
                ok = store.contains_token(sr.secret);
                if (!ok) reason = "UNKNOWN_TOKEN";
            } catch (const mellon::Error& e) {
                reason = "STORE_ERROR";
                mellon::log_line(std::string("[CONN] ip=") + peer + " store check failed: " + e.what());
            }
        }

        const char* resp = ok ? kResp200 : kResp401;
        if (!send_all(fd, resp, std::strlen(resp))) {
            mellon::log_line(std::string("[CONN] ip=") + peer +
                             " write failed: " + std::strerror(errno));
            return;
        }

        if (ok) {
            mellon::log_line(std::string("[200] ip=") + peer);
        } else {
            mellon::log_line(std::string("[401] ip=") + peer + " reason=" + reason);
        }
        linger_close(fd);
    } catch (const std::exception& e) {
        mellon::log_line(std::string("[CONN] ip=") + peer + " handler failed: " + e.what());
    }
}

} // namespace mellon::internal
