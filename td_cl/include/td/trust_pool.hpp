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
#include <openssl/x509.h>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace td {

// Set of trusted CA certificates built from PEM text.
// Adding a certificate that is already present is a no-op.
class TrustPool {
public:
    TrustPool() = default;

    // Parses every "CERTIFICATE" PEM block in `pem` (one or many concatenated
    // blocks). Blocks that do not parse are skipped, not reported as errors.
    // Returns the number of certificates actually added.
    std::size_t append_certs_from_pem(const std::string& pem);

    // Adds `cert` (the pool takes its own reference). False if already present.
    bool add_cert(X509* cert);

    bool contains(const X509* cert) const;
    std::size_t size() const { return _certs.size(); }
    bool empty() const { return _certs.empty(); }

    // One-line subject names, in insertion order.
    std::vector<std::string> subjects() const;

    // Adds every pooled certificate to ctx's verification store.
    // Returns the number of certificates the store accepted.
    std::size_t install(SSL_CTX* ctx) const;

    // Inputs given to build_trust_pool that added no certificate.
    std::size_t rejected_inputs() const { return _rejected_inputs; }

private:
    friend std::shared_ptr<const TrustPool> build_trust_pool(const std::vector<std::string>&);

    struct X509Free {
        void operator()(X509* x) const { X509_free(x); }
    };
    std::vector<std::unique_ptr<X509, X509Free>> _certs;
    std::size_t _rejected_inputs = 0;
};

// Builds a pool from zero or more PEM inputs. Never fails: an input with no
// valid certificate contributes nothing (counted in rejected_inputs()), so an
// all-invalid list yields an empty pool. Does no I/O and does not log.
std::shared_ptr<const TrustPool> build_trust_pool(const std::vector<std::string>& pem_certs);

} // namespace td
