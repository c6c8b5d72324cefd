/*
 * Part of the TrustDial (TD) project.
 *
 * SPDX-FileCopyrightText: 2025 TrustDial contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of TrustDial (TD). See LICENSE for details.
 * Coded by DooKoo2: https://github.com/Dookoo2
 */

#include "td/trust_pool.hpp"

#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/pem.h>

namespace td {

namespace {

constexpr const char* kBegin = "-----BEGIN CERTIFICATE-----";
constexpr const char* kEnd   = "-----END CERTIFICATE-----";

// Parses one PEM block. nullptr when the base64 or the DER inside is bad.
X509* parse_pem_block(const std::string& block) {
    BIO* bio = BIO_new_mem_buf(block.data(), (int)block.size());
    if (!bio) return nullptr;
    X509* cert = PEM_read_bio_X509(bio, nullptr, nullptr, nullptr);
    BIO_free(bio);
    ERR_clear_error();
    return cert;
}

} // namespace

std::size_t TrustPool::append_certs_from_pem(const std::string& pem) {
    std::size_t added = 0;
    std::size_t pos = 0;
    const std::string begin = kBegin;
    const std::string end = kEnd;

    // Walk the blocks one by one so a bad block does not hide later ones.
    while ((pos = pem.find(begin, pos)) != std::string::npos) {
        const std::size_t stop = pem.find(end, pos + begin.size());
        if (stop == std::string::npos) break;
        const std::size_t next_begin = pem.find(begin, pos + begin.size());
        if (next_begin != std::string::npos && next_begin < stop) {
            // BEGIN without its END: skip to the next BEGIN
            pos = next_begin;
            continue;
        }
        const std::string block = pem.substr(pos, stop + end.size() - pos) + "\n";
        pos = stop + end.size();

        X509* cert = parse_pem_block(block);
        if (!cert) continue;
        if (add_cert(cert)) ++added;
        X509_free(cert);
    }
    return added;
}

bool TrustPool::add_cert(X509* cert) {
    if (!cert || contains(cert)) return false;
    if (X509_up_ref(cert) != 1) return false;
    _certs.emplace_back(cert);
    return true;
}

bool TrustPool::contains(const X509* cert) const {
    if (!cert) return false;
    for (const auto& c : _certs) {
        if (X509_cmp(c.get(), cert) == 0) return true;
    }
    return false;
}

std::vector<std::string> TrustPool::subjects() const {
    std::vector<std::string> out;
    out.reserve(_certs.size());
    for (const auto& c : _certs) {
        char buf[512];
        X509_NAME_oneline(X509_get_subject_name(c.get()), buf, sizeof(buf));
        out.emplace_back(buf);
    }
    return out;
}

std::size_t TrustPool::install(SSL_CTX* ctx) const {
    if (!ctx) return 0;
    X509_STORE* store = SSL_CTX_get_cert_store(ctx);
    if (!store) return 0;
    std::size_t n = 0;
    for (const auto& c : _certs) {
        if (X509_STORE_add_cert(store, c.get()) == 1) ++n;
    }
    ERR_clear_error();
    return n;
}

std::shared_ptr<const TrustPool> build_trust_pool(const std::vector<std::string>& pem_certs) {
    auto pool = std::make_shared<TrustPool>();
    for (const auto& pem : pem_certs) {
        if (pool->append_certs_from_pem(pem) == 0) ++pool->_rejected_inputs;
    }
    return pool;
}

} // namespace td
