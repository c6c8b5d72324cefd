/*
 * Part of the TrustDial (TD) project.
 *
 * SPDX-FileCopyrightText: 2025 TrustDial contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of TrustDial (TD). See LICENSE for details.
 * Coded by DooKoo2: https://github.com/Dookoo2
 */

#include "td/internal/tls_cli_ctx.hpp"
#include "td/log.hpp"
#include <openssl/ssl.h>
#include <openssl/err.h>

namespace td::internal {

TlsClientContext::TlsClientContext(const td::TlsConfig& cfg)
    : _verify_peer(!cfg.insecure_skip_verify) {
    OPENSSL_init_ssl(0, nullptr);

    const SSL_METHOD* method = TLS_client_method();
    _ctx = SSL_CTX_new(method);
    if (!_ctx) {
        log_last_error("SSL_CTX_new");
        return;
    }

    if (cfg.min_version != 0 && !SSL_CTX_set_min_proto_version(_ctx, cfg.min_version)) {
        log_last_error("set_min_proto");
    }
    if (!cfg.cipher_list.empty() && SSL_CTX_set_cipher_list(_ctx, cfg.cipher_list.c_str()) != 1) {
        log_last_error("set_cipher_list");
    }
    if (!cfg.cipher_suites.empty() && SSL_CTX_set_ciphersuites(_ctx, cfg.cipher_suites.c_str()) != 1) {
        log_last_error("set_ciphersuites");
    }

    // Trust store: a custom pool replaces the system roots.
    if (cfg.root_cas) {
        const TrustPool& pool = *cfg.root_cas;
        if (pool.rejected_inputs() > 0) {
            log_line("[TLS-CLI] " + std::to_string(pool.rejected_inputs()) +
                     " certificate inputs added nothing (malformed or duplicate)");
        }
        if (pool.empty()) {
            log_line("[TLS-CLI] trust pool is empty: no custom CA will be trusted");
        }
        const std::size_t n = pool.install(_ctx);
        if (n != cfg.root_cas->size()) {
            log_line("[TLS-CLI] trust store accepted " + std::to_string(n) + " of " +
                     std::to_string(cfg.root_cas->size()) + " pooled certificates");
        }
    } else {
        if (SSL_CTX_set_default_verify_paths(_ctx) != 1) {
            log_last_error("set_default_verify_paths");
        }
    }

    // Verification
    if (_verify_peer) {
        SSL_CTX_set_verify(_ctx, SSL_VERIFY_PEER, nullptr);
    } else {
        SSL_CTX_set_verify(_ctx, SSL_VERIFY_NONE, nullptr);
    }

    SSL_CTX_set_session_cache_mode(_ctx, SSL_SESS_CACHE_CLIENT);
}

TlsClientContext::~TlsClientContext() {
    if (_ctx) {
        SSL_CTX_free(_ctx);
        _ctx = nullptr;
    }
}

void TlsClientContext::log_last_error(const char* where) {
    unsigned long e;
    while ((e = ERR_get_error()) != 0) {
        char buf[256];
        ERR_error_string_n(e, buf, sizeof(buf));
        td::log_line(std::string("[TLS-CLI] error at ") + where + ": " + buf);
    }
}

} // namespace td::internal
