/*
 * Part of the Mellon project.
 *
 * SPDX-FileCopyrightText: 2025 Mellon contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Mellon. See LICENSE for details.
 */

#include "mellon/token.hpp"
#include "mellon/errors.hpp"
#include "mellon/internal/utils.hpp"

namespace mellon {

Token parse_token(const std::string& line) {
    const std::size_t c = line.find(kTokenSeparator);
    if (c == std::string::npos) {
        throw ParseError("Unable to parse token: no '" + std::string(1, kTokenSeparator) +
                         "' separator");
    }
    Token t;
    t.label  = line.substr(0, c);
    t.secret = line.substr(c + 1);
    internal::trim_inplace(t.label);
    internal::trim_inplace(t.secret);
    return t;
}

std::string serialize(const Token& t) {
    std::string out;
    out.reserve(t.label.size() + 1 + t.secret.size());
    out += t.label;
    out += kTokenSeparator;
    out += t.secret;
    return out;
}

void validate_label(const std::string& label) {
    if (label.empty()) {
        throw ValidationError("Label must not be empty");
    }
    if (label.find(kTokenSeparator) != std::string::npos) {
        throw ValidationError("Label must not contain '" + std::string(1, kTokenSeparator) + "'");
    }
    if (label.find_first_of("\r\n") != std::string::npos) {
        throw ValidationError("Label must not contain line breaks");
    }
    std::string trimmed = label;
    internal::trim_inplace(trimmed);
    if (trimmed != label) {
        throw ValidationError("Label must not start or end with whitespace");
    }
}

std::string mask_secret(const std::string& secret) {
    const std::size_t keep = secret.size() < 4 ? secret.size() : 4;
    return std::string(secret.size() - keep, '*') + secret.substr(secret.size() - keep);
}

} // namespace mellon
