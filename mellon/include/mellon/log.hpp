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

namespace mellon {

// Thread-safe logging (to stdout + optional file).
// Lines carry their own tag, e.g. "[INFO] ..." or "[STORE] ...".
void set_log_file(const std::string& path);   // empty path: console only
void set_log_quiet(bool quiet);                // drop the console copy
void log_line(const std::string& line);

} // namespace mellon
