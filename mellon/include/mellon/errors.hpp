/*
 * Part of the Mellon project.
 *
 * SPDX-FileCopyrightText: 2025 Mellon contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Mellon. See LICENSE for details.
 */

#pragma once
#include <stdexcept>
#include <string>

namespace mellon {

// Base for every failure the token store surfaces to its caller.
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

// A persisted line could not be turned into a Token.
class ParseError : public Error {
public:
    explicit ParseError(const std::string& what) : Error(what) {}
};

// Duplicate label on create, unknown label on rescind, unusable label.
class ValidationError : public Error {
public:
    explicit ValidationError(const std::string& what) : Error(what) {}
};

// Backing file I/O failures and use of a store that was never loaded.
class StoreError : public Error {
public:
    explicit StoreError(const std::string& what) : Error(what) {}
};

} // namespace mellon
