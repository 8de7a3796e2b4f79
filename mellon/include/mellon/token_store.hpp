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
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include <shared_mutex>
#include "mellon/token.hpp"

namespace mellon {

/**
 * File-backed set of bearer tokens keyed by label.
 *
 * The label map is authoritative; the secret set is rebuilt from it after
 * every change and is what contains_token() consults. Every mutation rewrites
 * the whole file before returning. Lookups take a shared lock, so any number
 * of connection handlers can query concurrently while reload/create/rescind
 * commit under the exclusive lock.
 *
 * All failures are thrown as mellon::Error subclasses (see errors.hpp).
 */
class TokenStore {
public:
    // Creates the parent directory if needed, then reload().
    explicit TokenStore(std::string path);

    TokenStore(const TokenStore&) = delete;
    TokenStore& operator=(const TokenStore&) = delete;

    // Replace in-memory state with the file contents. A missing file is an
    // empty store. On ParseError/StoreError the previous state is kept.
    void reload();

    bool contains_token(const std::string& secret) const;

    // Issue a fresh secret for a new label and persist.
    Token create(const std::string& label);

    // Drop the token bound to label and persist.
    void rescind(const std::string& label);

    // Snapshot of the current tokens, unordered.
    std::vector<Token> list() const;

    std::size_t size() const;
    const std::string& path() const { return _path; }

private:
    using TokenMap  = std::unordered_map<std::string, Token>;   // label -> token
    using SecretSet = std::unordered_set<std::string>;

    std::string _path;
    mutable std::shared_mutex _mtx;
    TokenMap  _tokens;
    SecretSet _lookup;
    bool      _loaded = false;

    static SecretSet build_lookup(const TokenMap& tokens);

    // Both require _mtx held exclusively.
    void persist_unlocked() const;
    void require_loaded_unlocked() const;
};

} // namespace mellon
