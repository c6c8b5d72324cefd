/*
 * Part of the TrustDial (TD) project.
 *
 * SPDX-FileCopyrightText: 2025 TrustDial contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of TrustDial (TD). See LICENSE for details.
 * Coded by DooKoo2: https://github.com/Dookoo2
 */

#include "td/dialer.hpp"
#include <utility>

namespace td {

std::unique_ptr<internal::TcpConn> TcpDialer::dial(const std::string& addr,
                                                   const DialOptions& opt,
                                                   Error* err) {
    std::string host, port;
    if (!split_host_port(addr, host, port) || port.empty()) {
        internal::fail(err, Errc::BadAddress, "invalid address \"" + addr + "\"");
        return nullptr;
    }
    auto conn = std::make_unique<internal::TcpConn>();
    if (!conn->open(host, port, opt.connect_timeout_sec, opt.io_timeout_sec, err)) {
        return nullptr;
    }
    return conn;
}

GatedDialer::GatedDialer(std::shared_ptr<Dialer> inner, std::shared_ptr<const DialGate> gate)
    : _inner(std::move(inner)), _gate(std::move(gate)) {
    // Without an explicit gate the process-wide switch still applies.
    if (!_gate) _gate = default_dial_gate();
}

std::unique_ptr<internal::TcpConn> GatedDialer::dial(const std::string& addr,
                                                     const DialOptions& opt,
                                                     Error* err) {
    // The gate is consulted on every dial, so a flip takes effect at once.
    if (!_gate->allow_dial(addr, err)) {
        return nullptr;
    }
    if (!_inner) {
        internal::fail(err, Errc::ConnectFailed, "no dialer configured");
        return nullptr;
    }
    return _inner->dial(addr, opt, err);
}

} // namespace td
