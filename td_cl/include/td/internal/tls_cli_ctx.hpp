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
#include <openssl/ssl.h>
#include <string>
#include "td/tls_config.hpp"

namespace td::internal {

// TLS client context built from a resolved TlsConfig. Loads the custom trust
// pool when one is set (and then only it), system CA paths otherwise.
class TlsClientContext {
public:
    explicit TlsClientContext(const td::TlsConfig& cfg);
    ~TlsClientContext();

    SSL_CTX* ctx() const { return _ctx; }
    bool verify_peer() const { return _verify_peer; }

    // non-copyable
    TlsClientContext(const TlsClientContext&) = delete;
    TlsClientContext& operator=(const TlsClientContext&) = delete;

private:
    SSL_CTX* _ctx = nullptr;
    bool _verify_peer = true;
    void log_last_error(const char* where);
};

} // namespace td::internal
