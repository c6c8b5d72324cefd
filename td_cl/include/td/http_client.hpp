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
#include <vector>
#include "td/client.hpp"
#include "td/client_config.hpp"
#include "td/dial_gate.hpp"
#include "td/tls_config.hpp"
#include "td/types.hpp"

namespace td {

// TLS policy the factory picks for (verify, certs):
//  certs non-empty   -> secure baseline + pool of certs; NoVerify also sets
//                       insecure_skip_verify and keeps the pool attached
//  Verify, no certs  -> library defaults, system roots
//  NoVerify, no certs-> insecure_skip_verify, no pool
// Malformed certificates are dropped silently; nothing here fails.
TlsConfig resolve_tls_config(SslHostnameVerification verify,
                             const std::vector<std::string>& certs);

// Returns a client whose every dial passes through `gate`
// (default_dial_gate() when null). Pure assembly: no network I/O.
std::unique_ptr<Client> get_http_client(SslHostnameVerification verify,
                                        const std::vector<std::string>& certs = {},
                                        std::shared_ptr<DialGate> gate = nullptr,
                                        const ClientConfig& cfg = ClientConfig{});

// Verifies the server's certificate chain and hostname.
std::unique_ptr<Client> get_validating_http_client(std::shared_ptr<DialGate> gate = nullptr,
                                                   const ClientConfig& cfg = ClientConfig{});

// Does not verify the server's certificate chain and hostname.
std::unique_ptr<Client> get_non_validating_http_client(std::shared_ptr<DialGate> gate = nullptr,
                                                       const ClientConfig& cfg = ClientConfig{});

} // namespace td
