/*
 * Part of the Mellon project.
 *
 * SPDX-FileCopyrightText: 2025 Mellon contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Mellon. See LICENSE for details.
 */

#include "mellon/log.hpp"
#include <mutex>
#include <fstream>
#include <iostream>

namespace {
std::mutex g_log_mtx;
std::ofstream g_log_ofs;
std::string g_log_path;
bool g_quiet = false;

void open_if_needed_unlocked() {
    if (!g_log_ofs.is_open() && !g_log_path.empty()) {
        g_log_ofs.open(g_log_path, std::ios::out | std::ios::app);
        if (!g_log_ofs) {
            std::cerr << "[WARN] cannot open log file " << g_log_path << '\n';
            g_log_path.clear();
        }
    }
}
} // namespace

namespace mellon {

void set_log_file(const std::string& path) {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    g_log_path = path;
    if (g_log_ofs.is_open()) {
        g_log_ofs.close();
    }
    g_log_ofs.clear();
    open_if_needed_unlocked();
}

void set_log_quiet(bool quiet) {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    g_quiet = quiet;
}

void log_line(const std::string& line) {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    open_if_needed_unlocked();
    if (g_log_ofs.is_open()) {
        g_log_ofs << line << '\n';
        g_log_ofs.flush();
    }
    if (!g_quiet) {
        std::cout << line << '\n';
    }
}

} // namespace mellon
