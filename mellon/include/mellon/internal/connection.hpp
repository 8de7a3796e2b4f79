/*
 * Part of the Mellon project.
 *
 * SPDX-FileCopyrightText: 2025 Mellon contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Mellon. See LICENSE for details.
 */

#pragma once
#include <chrono>
#include <string>
#include <cstddef>
#include "mellon/server_config.hpp"
#include "mellon/token_store.hpp"

namespace mellon::internal {

// Exact, case-sensitive header prefix carrying the credential.
constexpr const char* kBearerPrefix = "Authorization: Bearer ";

enum class ScanOutcome {
    TokenFound,        // bearer header seen, secret captured
    HeadersExhausted,  // blank line or end of stream, no credential
    ReadTimedOut,      // overall header deadline passed
    ReadError          // socket error or oversized line
};

struct ScanResult {
    ScanOutcome outcome = ScanOutcome::HeadersExhausted;
    std::string secret;
};

const char* outcome_name(ScanOutcome o);

// Milliseconds left until deadline as a poll() timeout, in [0, INT_MAX].
int poll_budget_ms(std::chrono::steady_clock::time_point deadline);

// Read header lines from fd until a bearer header, a blank line, EOF, an
// error, or timeout_sec elapses (single deadline for the whole scan).
ScanResult scan_bearer(int fd, int timeout_sec, std::size_t max_line);

// Serve one connection: scan, check the store, answer 200/401, close fd.
// Never throws; failures are logged and end only this connection.
void handle_connection(int fd,
                       const ServerConfig& cfg,
                       const std::string& peer,
                       const TokenStore& store);

} // namespace mellon::internal
