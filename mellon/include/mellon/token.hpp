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

// Field separator of the persisted "label:secret" form.
constexpr char kTokenSeparator = ':';

// A label bound to its opaque bearer secret.
struct Token {
    std::string label;
    std::string secret;

    bool operator==(const Token& o) const { return label == o.label && secret == o.secret; }
    bool operator!=(const Token& o) const { return !(*this == o); }
};

/**
 * Parse one persisted line. Splits on the first separator and trims both
 * halves, so a secret may itself contain ':' but a label may not.
 * Throws ParseError when the separator is missing.
 */
Token parse_token(const std::string& line);

// "label:secret", no escaping.
std::string serialize(const Token& t);

// Throws ValidationError if the label could not round-trip through the file
// (empty, contains the separator or a line break, surrounding whitespace).
void validate_label(const std::string& label);

// "****************************1111" style masking for listings.
std::string mask_secret(const std::string& secret);

} // namespace mellon
