/*
 * Part of the Mellon project.
 *
 * SPDX-FileCopyrightText: 2025 Mellon contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Mellon. See LICENSE for details.
 */

#pragma once
#include <string>
#include <cstddef>
#include <cstdint>

namespace mellon {

constexpr const char* kDefaultStorePath = "/tmp/mellon/tokens";
constexpr const char* kDefaultHostPort  = "localhost:8090";

// Upper bound accepted for read/write timeouts (one day).
constexpr int kMaxTimeoutSec = 24 * 60 * 60;

struct ServerConfig {
    // Listen address
    std::string host = "localhost";
    uint16_t    port = 8090;
    int         backlog = 512;

    // Per-connection limits
    int         read_timeout_sec  = 30;   // whole header phase, not per line
    int         write_timeout_sec = 30;
    std::size_t max_line = 8 * 1024;

    // Handle connections on the accept thread instead of one thread each.
    bool sequential = false;

    // Storage / logging (consumed by the CLI)
    std::string store_path = kDefaultStorePath;
    std::string log_file;
};

// Split "host:port" (or "[v6addr]:port") into cfg.host / cfg.port.
// Returns false on a malformed address or port.
bool parse_host_port(const std::string& hostport, ServerConfig& cfg);

} // namespace mellon
