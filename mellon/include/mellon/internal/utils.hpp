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

namespace mellon::internal {

// Trim spaces from both sides (in-place).
void trim_inplace(std::string& s);

// Lowercase hex of a byte range.
std::string bytes_to_hex(const unsigned char* p, std::size_t n);

// Random RFC 4122 version 4 UUID, textual form (36 chars).
// Throws StoreError if the CSPRNG fails.
std::string random_uuid_v4();

// True when s starts with prefix.
bool starts_with(const std::string& s, const std::string& prefix);

} // namespace mellon::internal
