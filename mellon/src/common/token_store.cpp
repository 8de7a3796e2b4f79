/*
 * Part of the Mellon project.
 *
 * SPDX-FileCopyrightText: 2025 Mellon contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Mellon. See LICENSE for details.
 */

#include "mellon/token_store.hpp"
#include "mellon/errors.hpp"
#include "mellon/log.hpp"
#include "mellon/internal/utils.hpp"

#include <fstream>
#include <filesystem>
#include <mutex>
#include <system_error>
#include <cerrno>
#include <cstring>
#include <cstdio>

namespace fs = std::filesystem;

namespace mellon {

TokenStore::TokenStore(std::string path)
    : _path(std::move(path))
{
    const fs::path parent = fs::path(_path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            throw StoreError("Unable to create directory " + parent.string() + ": " + ec.message());
        }
    }
    reload();
}

TokenStore::SecretSet TokenStore::build_lookup(const TokenMap& tokens) {
    SecretSet s;
    s.reserve(tokens.size());
    for (const auto& kv : tokens) s.insert(kv.second.secret);
    return s;
}

void TokenStore::reload() {
    TokenMap tmp;

    // Only ENOENT means an empty store; any other status error keeps state.
    std::error_code ec;
    (void)fs::status(_path, ec);
    if (ec == std::errc::no_such_file_or_directory) {
        {
            std::unique_lock<std::shared_mutex> lk(_mtx);
            _tokens.clear();
            _lookup.clear();
            _loaded = true;
        }
        mellon::log_line("[STORE] no token file at " + _path + ", starting empty");
        return;
    }
    if (ec) {
        throw StoreError("Unable to access token file at " + _path + ": " + ec.message());
    }

    errno = 0;
    std::ifstream in(_path);
    if (!in.is_open()) {
        const int err = errno;
        throw StoreError("Unable to open token file at " + _path + ": " +
                         std::strerror(err ? err : EIO));
    }

    std::size_t line_no = 0;
    for (std::string line; std::getline(in, line); ) {
        ++line_no;
        try {
            Token t = parse_token(line);
            tmp[t.label] = std::move(t);
        } catch (const ParseError& e) {
            throw ParseError("Failed to parse token at " + _path + " line " +
                             std::to_string(line_no) + ": " + e.what());
        }
    }
    if (in.bad()) {
        throw StoreError("Failed reading token file at " + _path);
    }

    const std::size_t count = tmp.size();
    SecretSet lookup = build_lookup(tmp);
    {
        std::unique_lock<std::shared_mutex> lk(_mtx);
        _tokens.swap(tmp);
        _lookup.swap(lookup);
        _loaded = true;
    }
    mellon::log_line("[STORE] loaded " + std::to_string(count) + " token(s) from " + _path);
}

void TokenStore::require_loaded_unlocked() const {
    if (!_loaded) {
        throw StoreError("Token store not yet loaded");
    }
}

bool TokenStore::contains_token(const std::string& secret) const {
    std::shared_lock<std::shared_mutex> lk(_mtx);
    require_loaded_unlocked();
    return _lookup.find(secret) != _lookup.end();
}

Token TokenStore::create(const std::string& label) {
    validate_label(label);
    Token t{label, internal::random_uuid_v4()};

    std::unique_lock<std::shared_mutex> lk(_mtx);
    require_loaded_unlocked();
    if (_tokens.count(label)) {
        throw ValidationError("Labels must be unique: '" + label + "' already exists");
    }

    // _lookup is only replaced once the file holds the new map.
    _tokens.emplace(label, t);
    SecretSet fresh;
    try {
        fresh = build_lookup(_tokens);
        persist_unlocked();
    } catch (...) {
        _tokens.erase(label);
        throw;
    }
    _lookup.swap(fresh);
    return t;
}

void TokenStore::rescind(const std::string& label) {
    std::unique_lock<std::shared_mutex> lk(_mtx);
    require_loaded_unlocked();
    auto it = _tokens.find(label);
    if (it == _tokens.end()) {
        throw ValidationError("No token associated with label '" + label + "'");
    }

    Token removed = std::move(it->second);
    _tokens.erase(it);
    SecretSet fresh;
    try {
        fresh = build_lookup(_tokens);
        persist_unlocked();
    } catch (...) {
        _tokens.emplace(removed.label, removed);
        throw;
    }
    _lookup.swap(fresh);
}

std::vector<Token> TokenStore::list() const {
    std::shared_lock<std::shared_mutex> lk(_mtx);
    require_loaded_unlocked();
    std::vector<Token> out;
    out.reserve(_tokens.size());
    for (const auto& kv : _tokens) out.push_back(kv.second);
    return out;
}

std::size_t TokenStore::size() const {
    std::shared_lock<std::shared_mutex> lk(_mtx);
    return _tokens.size();
}

// Write the whole map to "<path>.tmp" and rename it over the real file so a
// crash mid-write never leaves a truncated store behind.
void TokenStore::persist_unlocked() const {
    const std::string tmp_path = _path + ".tmp";
    {
        std::ofstream out(tmp_path, std::ios::out | std::ios::trunc);
        if (!out.is_open()) {
            throw StoreError("Unable to write token file " + tmp_path + ": " + std::strerror(errno));
        }
        for (const auto& kv : _tokens) {
            out << serialize(kv.second) << '\n';
        }
        out.flush();
        if (!out) {
            (void)std::remove(tmp_path.c_str());
            throw StoreError("Failed writing token file " + tmp_path);
        }
    }
    if (std::rename(tmp_path.c_str(), _path.c_str()) != 0) {
        const int err = errno;
        (void)std::remove(tmp_path.c_str());
        throw StoreError("Unable to replace token file " + _path + ": " + std::strerror(err));
    }
}

} // namespace mellon
