/*
 * Part of the TrustDial (TD) project.
 *
 * SPDX-FileCopyrightText: 2025 TrustDial contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of TrustDial (TD). See LICENSE for details.
 * Coded by DooKoo2: https://github.com/Dookoo2
 */

#include "td/http_client.hpp"
#include "td/dialer.hpp"
#include <utility>

namespace td {

namespace {

std::unique_ptr<Client> make_gated_client(const TlsConfig& tls,
                                          std::shared_ptr<DialGate> gate,
                                          const ClientConfig& cfg) {
    if (!gate) gate = default_dial_gate();
    auto dialer = std::make_shared<GatedDialer>(std::make_shared<TcpDialer>(), std::move(gate));
    return std::make_unique<Client>(cfg, tls, std::move(dialer));
}

} // namespace

TlsConfig resolve_tls_config(SslHostnameVerification verify,
                             const std::vector<std::string>& certs) {
    if (!certs.empty()) {
        TlsConfig tls = secure_tls_config();
        tls.root_cas = build_trust_pool(certs);
        // Skipping verification keeps the custom pool attached.
        if (verify == SslHostnameVerification::NoVerify) {
            tls.insecure_skip_verify = true;
        }
        return tls;
    }
    TlsConfig tls;
    tls.insecure_skip_verify = (verify == SslHostnameVerification::NoVerify);
    return tls;
}

std::unique_ptr<Client> get_http_client(SslHostnameVerification verify,
                                        const std::vector<std::string>& certs,
                                        std::shared_ptr<DialGate> gate,
                                        const ClientConfig& cfg) {
    if (!certs.empty()) {
        return make_gated_client(resolve_tls_config(verify, certs), std::move(gate), cfg);
    }
    if (verify == SslHostnameVerification::Verify) {
        return get_validating_http_client(std::move(gate), cfg);
    }
    return get_non_validating_http_client(std::move(gate), cfg);
}

std::unique_ptr<Client> get_validating_http_client(std::shared_ptr<DialGate> gate,
                                                   const ClientConfig& cfg) {
    return make_gated_client(TlsConfig{}, std::move(gate), cfg);
}

std::unique_ptr<Client> get_non_validating_http_client(std::shared_ptr<DialGate> gate,
                                                       const ClientConfig& cfg) {
    TlsConfig tls;
    tls.insecure_skip_verify = true;
    return make_gated_client(tls, std::move(gate), cfg);
}

} // namespace td
