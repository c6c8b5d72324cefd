/*
 * Part of the TrustDial (TD) project.
 *
 * SPDX-FileCopyrightText: 2025 TrustDial contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of TrustDial (TD). See LICENSE for details.
 * Coded by DooKoo2: https://github.com/Dookoo2
 */

#pragma once
#include <string>
#include "td/http_response.hpp"
#include "td/types.hpp"

namespace td {

struct Credentials {
    std::string username;
    std::string password;
};

// "Basic " + base64(username ":" password), RFC 2617 section 2.
// No validation of the characters in either field.
std::string encode_basic_auth(const std::string& username, const std::string& password);

// Header map holding only the "Authorization" entry.
HttpHeaders basic_auth_header(const std::string& username, const std::string& password);

// Inverse of encode_basic_auth. Fails with Errc::AuthFormat when the value is
// empty, is not exactly "Basic" SP token, the token is not valid base64, or
// the decoded text has no ':'. The password is everything after the first
// colon. Does not log.
[[nodiscard]] bool decode_basic_auth(const std::string& header_value,
                                     Credentials& out,
                                     Error* err = nullptr);

// Finds "Authorization" (any case) in headers and decodes it.
[[nodiscard]] bool parse_basic_auth_header(const HttpHeaders& headers,
                                           Credentials& out,
                                           Error* err = nullptr);

} // namespace td
