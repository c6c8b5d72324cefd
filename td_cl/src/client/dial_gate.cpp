/*
 * Part of the TrustDial (TD) project.
 *
 * SPDX-FileCopyrightText: 2025 TrustDial contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of TrustDial (TD). See LICENSE for details.
 * Coded by DooKoo2: https://github.com/Dookoo2
 */

#include "td/dial_gate.hpp"
#include <arpa/inet.h>
#include <netinet/in.h>
#include <cstring>

namespace td {

bool split_host_port(const std::string& addr, std::string& host, std::string& port) {
    host.clear();
    port.clear();
    if (addr.empty()) return false;

    if (addr[0] == '[') {
        const std::size_t close = addr.find(']');
        if (close == std::string::npos) return false;            // missing ']'
        if (close + 1 >= addr.size() || addr[close + 1] != ':') return false; // missing port
        if (addr.find('[', 1) != std::string::npos) return false;
        if (addr.find(']', close + 1) != std::string::npos) return false;
        host = addr.substr(1, close - 1);
        port = addr.substr(close + 2);
    } else {
        const std::size_t colon = addr.rfind(':');
        if (colon == std::string::npos) return false;            // missing port
        host = addr.substr(0, colon);
        if (host.find(':') != std::string::npos) {               // too many colons
            host.clear();
            return false;
        }
        if (host.find_first_of("[]") != std::string::npos) {
            host.clear();
            return false;
        }
        port = addr.substr(colon + 1);
    }
    if (port.find_first_of("[]") != std::string::npos) {
        host.clear();
        port.clear();
        return false;
    }
    return true;
}

static bool is_loopback_ip(const std::string& host) {
    unsigned char buf[16];
    if (::inet_pton(AF_INET, host.c_str(), buf) == 1) {
        return buf[0] == 127;
    }
    if (::inet_pton(AF_INET6, host.c_str(), buf) == 1) {
        static const unsigned char kLoop6[16] = {0,0,0,0, 0,0,0,0, 0,0,0,0, 0,0,0,1};
        if (std::memcmp(buf, kLoop6, sizeof(kLoop6)) == 0) return true;
        // ::ffff:127.x.y.z
        static const unsigned char kMapped[12] = {0,0,0,0, 0,0,0,0, 0,0,0xff,0xff};
        return std::memcmp(buf, kMapped, sizeof(kMapped)) == 0 && buf[12] == 127;
    }
    return false;
}

bool is_local_addr(const std::string& addr) {
    std::string host, port;
    if (!split_host_port(addr, host, port)) return false;
    return host == "localhost" || is_loopback_ip(host);
}

bool DialGate::allow_dial(const std::string& addr, Error* err) const {
    if (outgoing_access_allowed() || is_local_addr(addr)) return true;
    return internal::fail(err, Errc::ConnectionRefused,
                          "access to address \"" + addr + "\" not allowed");
}

std::shared_ptr<DialGate> default_dial_gate() {
    static const std::shared_ptr<DialGate> gate = std::make_shared<DialGate>(true);
    return gate;
}

void set_outgoing_access_allowed(bool allowed) {
    default_dial_gate()->set_outgoing_access_allowed(allowed);
}

bool outgoing_access_allowed() {
    return default_dial_gate()->outgoing_access_allowed();
}

} // namespace td
