/*
 * Part of the TrustDial (TD) project.
 *
 * SPDX-FileCopyrightText: 2025 TrustDial contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of TrustDial (TD). See LICENSE for details.
 * Coded by DooKoo2: https://github.com/Dookoo2
 */

#include "td/basic_auth.hpp"
#include "td/internal/http_parser.hpp"
#include "td/internal/utils.hpp"

namespace td {

std::string encode_basic_auth(const std::string& username, const std::string& password) {
    std::string auth = username + ":" + password;
    std::string encoded = "Basic " + internal::base64_encode(auth);
    internal::secure_wipe(auth);
    return encoded;
}

HttpHeaders basic_auth_header(const std::string& username, const std::string& password) {
    return HttpHeaders{{"Authorization", encode_basic_auth(username, password)}};
}

bool decode_basic_auth(const std::string& header_value, Credentials& out, Error* err) {
    static const char* kInvalidHeader = "invalid or missing HTTP auth header";

    // Exactly: "Basic" SP token. One space, no surrounding whitespace.
    const std::size_t sp = header_value.find(' ');
    if (header_value.empty() || sp == std::string::npos) {
        return internal::fail(err, Errc::AuthFormat, kInvalidHeader);
    }
    const std::string scheme = header_value.substr(0, sp);
    const std::string token  = header_value.substr(sp + 1);
    if (scheme != "Basic" || token.empty()) {
        return internal::fail(err, Errc::AuthFormat, kInvalidHeader);
    }
    for (char c : token) {
        if (c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\v' || c == '\f') {
            return internal::fail(err, Errc::AuthFormat, kInvalidHeader);
        }
    }

    // token is base64("user:pass"), RFC 2617 section 2.
    std::string challenge;
    if (!internal::base64_decode(token, challenge)) {
        return internal::fail(err, Errc::AuthFormat, "invalid HTTP auth encoding");
    }
    const std::size_t colon = challenge.find(':');
    if (colon == std::string::npos) {
        internal::secure_wipe(challenge);
        return internal::fail(err, Errc::AuthFormat, "invalid HTTP auth contents");
    }
    out.username = challenge.substr(0, colon);
    out.password = challenge.substr(colon + 1);
    internal::secure_wipe(challenge);
    return true;
}

bool parse_basic_auth_header(const HttpHeaders& headers, Credentials& out, Error* err) {
    return decode_basic_auth(internal::hdr_ci(headers, "Authorization"), out, err);
}

} // namespace td
