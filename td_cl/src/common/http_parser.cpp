/*
 * Part of the TrustDial (TD) project.
 *
 * SPDX-FileCopyrightText: 2025 TrustDial contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of TrustDial (TD). See LICENSE for details.
 * Coded by DooKoo2: https://github.com/Dookoo2
 */

#include "td/internal/http_parser.hpp"
#include "td/internal/utils.hpp"
#include <algorithm>
#include <cctype>
#include <strings.h> // strcasecmp

namespace td::internal {

static const char* default_port(const std::string& scheme) {
    if (scheme == "https") return "443";
    if (scheme == "http")  return "80";
    return "";
}

bool parse_url(const std::string& url, Url& out, Error* err) {
    out = Url{};
    const std::size_t sep = url.find("://");
    if (sep == std::string::npos || sep == 0) {
        return fail(err, Errc::BadUrl, "missing scheme in URL \"" + url + "\"");
    }
    out.scheme = lower_copy(url.substr(0, sep));
    std::string rest = url.substr(sep + 3);

    if (out.scheme == "file") {
        // file:///abs/path (an empty authority is the only one accepted)
        if (rest.empty() || rest[0] != '/') {
            return fail(err, Errc::BadUrl, "file URL must be file:///path");
        }
        out.path = rest;
        return true;
    }
    if (out.scheme != "http" && out.scheme != "https") {
        return fail(err, Errc::UnsupportedScheme, "unsupported protocol scheme \"" + out.scheme + "\"");
    }

    const std::size_t slash = rest.find_first_of("/?");
    std::string authority = rest.substr(0, slash);
    out.path = (slash == std::string::npos) ? "/" : rest.substr(slash);
    if (out.path[0] == '?') out.path.insert(out.path.begin(), '/');

    // userinfo is not taken from URLs; send an Authorization header instead.
    if (authority.find('@') != std::string::npos) {
        return fail(err, Errc::BadUrl, "userinfo in URL is not supported");
    }
    if (authority.empty()) {
        return fail(err, Errc::BadUrl, "missing host in URL \"" + url + "\"");
    }

    if (authority[0] == '[') {
        const std::size_t close = authority.find(']');
        if (close == std::string::npos) {
            return fail(err, Errc::BadUrl, "unterminated IPv6 literal in URL");
        }
        out.host = authority.substr(1, close - 1);
        const std::string tail = authority.substr(close + 1);
        if (!tail.empty()) {
            if (tail[0] != ':') return fail(err, Errc::BadUrl, "bad port in URL");
            out.port = tail.substr(1);
        }
    } else {
        const std::size_t colon = authority.rfind(':');
        if (colon != std::string::npos) {
            out.host = authority.substr(0, colon);
            out.port = authority.substr(colon + 1);
        } else {
            out.host = authority;
        }
    }

    if (out.host.empty()) {
        return fail(err, Errc::BadUrl, "missing host in URL \"" + url + "\"");
    }
    if (out.port.empty()) {
        out.port = default_port(out.scheme);
    } else if (!std::all_of(out.port.begin(), out.port.end(),
                            [](unsigned char c){ return std::isdigit(c) != 0; })
               || out.port.size() > 5 || std::stoi(out.port) > 65535) {
        return fail(err, Errc::BadUrl, "invalid port \"" + out.port + "\"");
    }
    return true;
}

std::string join_host_port(const std::string& host, const std::string& port) {
    if (host.find(':') != std::string::npos) {
        return "[" + host + "]:" + port;
    }
    return host + ":" + port;
}

std::string host_header_value(const Url& u) {
    const std::string h = (u.host.find(':') != std::string::npos) ? "[" + u.host + "]" : u.host;
    if (u.port == default_port(u.scheme)) return h;
    return h + ":" + u.port;
}

std::string hdr_ci(const HttpHeaders& H, const char* name){
    auto it = H.find(name);
    if (it != H.end()) return it->second;
    for (const auto& kv : H){
        if (strcasecmp(kv.first.c_str(), name)==0) return kv.second;
    }
    return {};
}

bool has_hdr_ci(const HttpHeaders& H, const char* name){
    if (H.find(name) != H.end()) return true;
    for (const auto& kv : H){
        if (strcasecmp(kv.first.c_str(), name)==0) return true;
    }
    return false;
}

} // namespace td::internal
