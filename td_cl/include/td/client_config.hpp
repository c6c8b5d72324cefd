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
#include <string>
#include <cstddef>

namespace td {

// Public client configuration. Per-instance; copied into each Client.
struct ClientConfig {
    // Timeouts
    int connect_timeout_sec       = 5;   // TCP connect timeout
    int io_timeout_sec            = 5;   // recv/send timeout
    int tls_handshake_timeout_sec = 10;  // bounded SSL_connect

    // Request defaults
    std::string user_agent = "td-client/1";
    std::size_t max_response_bytes = 16u << 20;

    // Logging
    std::string log_file = "client.log";
};

} // namespace td
