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
#include <cstddef>
#include <cstdint>
#include <string>

namespace td {

// Whether a TLS client checks the server certificate chain and hostname.
enum class SslHostnameVerification {
    Verify,    // validate chain + hostname
    NoVerify   // skip both (self-signed providers)
};

enum class Errc {
    Ok = 0,
    AuthFormat,         // malformed or missing Basic auth header
    ConnectionRefused,  // dial blocked by the dial gate
    BadAddress,
    BadUrl,
    UnsupportedScheme,
    ResolveFailed,
    ConnectFailed,
    TlsSetup,
    TlsHandshake,
    TlsVerify,
    Io,
    Protocol,
    UnknownSeries
};

struct Error {
    Errc code = Errc::Ok;
    std::string message;

    bool ok() const { return code == Errc::Ok; }
};

const char* errc_name(Errc c);

// Fills *err when err is non-null. Always returns false so callers can
// `return internal::fail(err, ...)`.
namespace internal {
bool fail(Error* err, Errc code, std::string message);
} // namespace internal

} // namespace td
