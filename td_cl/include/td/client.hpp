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
#include <memory>
#include "td/client_config.hpp"
#include "td/dialer.hpp"
#include "td/http_response.hpp"
#include "td/tls_config.hpp"
#include "td/types.hpp"

namespace td {

// HTTP(S) client bound to one TLS policy and one dialer for its lifetime.
// Each request opens its own connection ("Connection: close").
// Requests may be issued from several threads at once.
class Client {
public:
    Client(const ClientConfig& cfg, const TlsConfig& tls, std::shared_ptr<Dialer> dialer);
    ~Client();

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    // Generic request:
    //  method:  e.g. "GET", "POST"
    //  url:     http://, https:// or file:// (GET only) absolute URL
    //  headers: extra request headers (e.g. basic_auth_header(...))
    //  body:    sent with Content-Length when non-empty
    bool request(const std::string& method,
                 const std::string& url,
                 const HttpHeaders& headers,
                 const std::string& body,
                 HttpResponse& out,
                 Error* err = nullptr);

    bool get(const std::string& url, HttpResponse& out, Error* err = nullptr);

    const ClientConfig& config() const;
    const TlsConfig& tls_config() const;
    const Dialer& dialer() const;

private:
    struct Impl;
    std::unique_ptr<Impl> _p;
};

} // namespace td
