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
#include "td/http_response.hpp"
#include "td/types.hpp"

namespace td::internal {

// RAII TCP connection with timeouts and basic send/recv helpers.
class TcpConn {
public:
    TcpConn() = default;
    explicit TcpConn(int fd) : _fd(fd) {}
    ~TcpConn();

    TcpConn(const TcpConn&) = delete;
    TcpConn& operator=(const TcpConn&) = delete;

    // Resolve host and connect with a bounded, non-blocking connect().
    bool open(const std::string& host, const std::string& port,
              int connect_timeout_sec, int io_timeout_sec, Error* err);

    void close();
    int  fd() const { return _fd; }

    bool send_all(const char* d, std::size_t len);

private:
    int _fd = -1;
};

// Parse an HTTP/1.x response head. hdr_end_off is the offset of the body.
bool parse_http_response(const std::string& head_and_maybe_body,
                         std::size_t& hdr_end_off,
                         int& status_code,
                         std::string& status_text,
                         HttpHeaders& headers);

// Decode a complete "Transfer-Encoding: chunked" body. False when the
// encoding is malformed or truncated.
bool decode_chunked(const std::string& in, std::string& out);

} // namespace td::internal
