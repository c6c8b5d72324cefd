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
#include <cstdint>
#include "td/http_response.hpp"
#include "td/types.hpp"

namespace td::internal {

// Components of an absolute http://, https:// or file:// URL.
struct Url {
    std::string scheme;  // lower-case
    std::string host;    // without IPv6 brackets; empty for file://
    std::string port;    // defaulted from scheme when absent
    std::string path;    // always starts with '/'; includes query
};

bool parse_url(const std::string& url, Url& out, Error* err);

// "host:port", bracketing IPv6 literals.
std::string join_host_port(const std::string& host, const std::string& port);

// Value for the Host header: port omitted when it is the scheme default.
std::string host_header_value(const Url& u);

// Case-insensitive header lookup in a header map (utility)
std::string hdr_ci(const HttpHeaders& H, const char* name);
bool has_hdr_ci(const HttpHeaders& H, const char* name);

} // namespace td::internal
