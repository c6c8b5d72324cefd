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
#include <memory>
#include <string>
#include "td/trust_pool.hpp"

namespace td {

namespace cipher_suites {
// TLS 1.2 (OpenSSL cipher-list syntax)
constexpr const char* kStrongTls12 =
    "ECDHE-ECDSA-AES256-GCM-SHA384:"
    "ECDHE-RSA-AES256-GCM-SHA384:"
    "ECDHE-ECDSA-AES128-GCM-SHA256:"
    "ECDHE-RSA-AES128-GCM-SHA256:"
    "ECDHE-ECDSA-CHACHA20-POLY1305:"
    "ECDHE-RSA-CHACHA20-POLY1305";

// TLS 1.3 (OpenSSL ciphersuites syntax)
constexpr const char* kStrongTls13 =
    "TLS_AES_256_GCM_SHA384:"
    "TLS_AES_128_GCM_SHA256:"
    "TLS_CHACHA20_POLY1305_SHA256";
} // namespace cipher_suites

// Resolved TLS policy of a client. A default-constructed value means
// "library defaults, verify the peer, system trust roots".
struct TlsConfig {
    int min_version = 0;           // e.g. TLS1_2_VERSION; 0 keeps the OpenSSL default
    std::string cipher_list;       // empty keeps the OpenSSL default
    std::string cipher_suites;     // empty keeps the OpenSSL default
    bool insecure_skip_verify = false;
    std::shared_ptr<const TrustPool> root_cas; // null: system default paths
};

// Baseline for every explicitly configured client: TLS 1.2 floor and the
// strong cipher lists above. No trust pool, verification on. Identical on
// every call.
TlsConfig secure_tls_config();

} // namespace td
