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
#include "td/dial_gate.hpp"
#include "td/types.hpp"
#include "td/internal/http_low.hpp"

namespace td {

struct DialOptions {
    int connect_timeout_sec = 5;
    int io_timeout_sec      = 5;
};

// The connect step of a transport. addr is "host:port" / "[v6]:port".
class Dialer {
public:
    virtual ~Dialer() = default;

    // Returns a connected socket, or nullptr with *err filled.
    virtual std::unique_ptr<internal::TcpConn> dial(const std::string& addr,
                                                    const DialOptions& opt,
                                                    Error* err) = 0;
};

// Plain getaddrinfo + connect.
class TcpDialer final : public Dialer {
public:
    std::unique_ptr<internal::TcpConn> dial(const std::string& addr,
                                            const DialOptions& opt,
                                            Error* err) override;
};

// Consults a DialGate before handing the dial to `inner`. A refused address
// never reaches the inner dialer, so no socket is created for it.
// A null gate means default_dial_gate().
class GatedDialer final : public Dialer {
public:
    GatedDialer(std::shared_ptr<Dialer> inner, std::shared_ptr<const DialGate> gate);

    std::unique_ptr<internal::TcpConn> dial(const std::string& addr,
                                            const DialOptions& opt,
                                            Error* err) override;

    const std::shared_ptr<const DialGate>& gate() const { return _gate; }

private:
    std::shared_ptr<Dialer> _inner;
    std::shared_ptr<const DialGate> _gate;
};

} // namespace td
