/*
 * Part of the TrustDial (TD) project.
 *
 * SPDX-FileCopyrightText: 2025 TrustDial contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of TrustDial (TD). See LICENSE for details.
 * Coded by DooKoo2: https://github.com/Dookoo2
 */

#include "td/types.hpp"
#include <utility>

namespace td {

const char* errc_name(Errc c) {
    switch (c) {
        case Errc::Ok:                return "ok";
        case Errc::AuthFormat:        return "auth_format";
        case Errc::ConnectionRefused: return "connection_refused";
        case Errc::BadAddress:        return "bad_address";
        case Errc::BadUrl:            return "bad_url";
        case Errc::UnsupportedScheme: return "unsupported_scheme";
        case Errc::ResolveFailed:     return "resolve_failed";
        case Errc::ConnectFailed:     return "connect_failed";
        case Errc::TlsSetup:          return "tls_setup";
        case Errc::TlsHandshake:      return "tls_handshake";
        case Errc::TlsVerify:         return "tls_verify";
        case Errc::Io:                return "io";
        case Errc::Protocol:          return "protocol";
        case Errc::UnknownSeries:     return "unknown_series";
    }
    return "unknown";
}

namespace internal {

bool fail(Error* err, Errc code, std::string message) {
    if (err) {
        err->code = code;
        err->message = std::move(message);
    }
    return false;
}

} // namespace internal
} // namespace td
