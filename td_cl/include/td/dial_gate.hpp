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
#include <atomic>
#include <memory>
#include <string>
#include "td/types.hpp"

namespace td {

// Splits "host:port" or "[v6-host]:port". False when the port separator is
// missing, brackets are unbalanced, or an unbracketed host holds a colon.
bool split_host_port(const std::string& addr, std::string& host, std::string& port);

// True when addr's host is the literal "localhost" or a loopback IP
// (127.0.0.0/8, ::1, ::ffff:127.0.0.0/104). Malformed addresses are not local.
bool is_local_addr(const std::string& addr);

// Blanket switch over outbound dials. While outgoing access is disallowed,
// only local addresses may be dialled. Safe to flip from any thread; each
// dial observes the value current at its own check.
class DialGate {
public:
    explicit DialGate(bool outgoing_access_allowed = true)
        : _outgoing_allowed(outgoing_access_allowed) {}

    void set_outgoing_access_allowed(bool allowed) {
        _outgoing_allowed.store(allowed, std::memory_order_relaxed);
    }
    bool outgoing_access_allowed() const {
        return _outgoing_allowed.load(std::memory_order_relaxed);
    }

    // Fails with Errc::ConnectionRefused when outgoing access is off and
    // addr is not local. Performs no I/O and does not log.
    [[nodiscard]] bool allow_dial(const std::string& addr, Error* err = nullptr) const;

    DialGate(const DialGate&) = delete;
    DialGate& operator=(const DialGate&) = delete;

private:
    std::atomic<bool> _outgoing_allowed;
};

// Process-wide gate used by clients that were not handed one explicitly.
std::shared_ptr<DialGate> default_dial_gate();

// Control surface over the process-wide gate.
void set_outgoing_access_allowed(bool allowed);
bool outgoing_access_allowed();

} // namespace td
