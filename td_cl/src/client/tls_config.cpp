/*
 * Part of the TrustDial (TD) project.
 *
 * SPDX-FileCopyrightText: 2025 TrustDial contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of TrustDial (TD). See LICENSE for details.
 * Coded by DooKoo2: https://github.com/Dookoo2
 */

#include "td/tls_config.hpp"
#include <openssl/ssl.h>

namespace td {

TlsConfig secure_tls_config() {
    TlsConfig cfg;
    cfg.min_version   = TLS1_2_VERSION;
    cfg.cipher_list   = cipher_suites::kStrongTls12;
    cfg.cipher_suites = cipher_suites::kStrongTls13;
    return cfg;
}

} // namespace td
