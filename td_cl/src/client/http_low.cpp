/*
 * Part of the TrustDial (TD) project.
 *
 * SPDX-FileCopyrightText: 2025 TrustDial contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of TrustDial (TD). See LICENSE for details.
 * Coded by DooKoo2: https://github.com/Dookoo2
 */

#include "td/internal/http_low.hpp"
#include "td/log.hpp"
#include "td/internal/utils.hpp"

#include <sys/types.h>
#include <sys/socket.h>
#include <netdb.h>
#include <unistd.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <fcntl.h>
#include <poll.h>
#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <sstream>

namespace td::internal {

TcpConn::~TcpConn() { close(); }

bool TcpConn::open(const std::string& host, const std::string& port,
                   int connect_timeout_sec, int io_timeout_sec, Error* err) {
    close();

    struct addrinfo hints{};
    hints.ai_family   = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    int rc = getaddrinfo(host.c_str(), port.c_str(), &hints, &res);
    if (rc != 0 || !res) {
        const std::string msg = std::string("getaddrinfo failed: ") + gai_strerror(rc);
        td::log_line("[TCP] " + msg);
        return fail(err, Errc::ResolveFailed, msg);
    }

    const int connect_timeout_ms = std::max(1, connect_timeout_sec) * 1000;

    int s_ok = -1;
    int last_errno = 0;
    for (auto* p = res; p; p = p->ai_next) {
        int s = ::socket(p->ai_family, p->ai_socktype, p->ai_protocol);
        if (s < 0) { last_errno = errno; continue; }

        // Switch to non-blocking for a bounded-time connect
        int flags = fcntl(s, F_GETFL, 0);
        if (flags < 0) { last_errno = errno; ::close(s); continue; }
        if (fcntl(s, F_SETFL, flags | O_NONBLOCK) < 0) { last_errno = errno; ::close(s); continue; }

        int ret = ::connect(s, p->ai_addr, p->ai_addrlen);
        if (ret == 0) {
            // Connected immediately
        } else if (ret < 0 && errno == EINPROGRESS) {
            struct pollfd pfd;
            pfd.fd      = s;
            pfd.events  = POLLOUT;
            pfd.revents = 0;

            int pr = 0;
            do {
                pr = ::poll(&pfd, 1, connect_timeout_ms);
            } while (pr < 0 && errno == EINTR);
            if (pr <= 0 || !(pfd.revents & POLLOUT)) {
                last_errno = (pr == 0) ? ETIMEDOUT : errno;
                ::close(s);
                continue;
            }
            // Check the actual connect() status
            int soerr = 0;
            socklen_t slen = sizeof(soerr);
            if (getsockopt(s, SOL_SOCKET, SO_ERROR, &soerr, &slen) < 0 || soerr != 0) {
                last_errno = soerr ? soerr : errno;
                ::close(s);
                continue;
            }
        } else {
            last_errno = errno;
            ::close(s);
            continue;
        }

        // Back to blocking mode for normal I/O (SO_*TIMEO will work)
        (void)fcntl(s, F_SETFL, flags);

        int one = 1;
        setsockopt(s, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));

        timeval tv{std::max(1, io_timeout_sec), 0};
        setsockopt(s, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
        setsockopt(s, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

        s_ok = s;
        break;
    }
    freeaddrinfo(res);

    if (s_ok < 0) {
        const std::string msg = "connect to " + host + ":" + port + " failed: " +
                                (last_errno ? std::strerror(last_errno) : "no usable address");
        td::log_line("[TCP] " + msg);
        return fail(err, Errc::ConnectFailed, msg);
    }

    _fd = s_ok;
    return true;
}

void TcpConn::close(){
    if (_fd>=0) { ::close(_fd); _fd=-1; }
}

bool TcpConn::send_all(const char* d, std::size_t len) {
    std::size_t off = 0;
    while (off < len) {
        ssize_t n = ::send(_fd, d + off, len - off, MSG_NOSIGNAL);
        if (n <= 0) return false;
        off += (std::size_t)n;
    }
    return true;
}

bool parse_http_response(const std::string& head_and_maybe_body,
                         std::size_t& hdr_end_off,
                         int& status_code,
                         std::string& status_text,
                         HttpHeaders& headers)
{
    std::size_t hdr_end = head_and_maybe_body.find("\r\n\r\n");
    if (hdr_end == std::string::npos) return false;
    hdr_end_off = hdr_end + 4;

    std::string hdrs = head_and_maybe_body.substr(0, hdr_end);
    std::size_t line_end = hdrs.find("\r\n");
    if (line_end == std::string::npos) line_end = hdrs.size();
    std::string status = hdrs.substr(0, line_end);

    // "HTTP/1.1 200 OK"
    std::istringstream iss(status);
    std::string httpver;
    if (!(iss >> httpver >> status_code)) return false;
    if (httpver.compare(0, 5, "HTTP/") != 0) return false;
    std::getline(iss, status_text);
    if (!status_text.empty() && status_text[0] == ' ') status_text.erase(0,1);

    headers.clear();
    std::size_t pos = line_end + 2;
    while (pos < hdrs.size()) {
        std::size_t next = hdrs.find("\r\n", pos);
        if (next == std::string::npos) next = hdrs.size();
        std::string line = hdrs.substr(pos, next - pos);
        pos = next + 2;
        std::size_t c = line.find(':');
        if (c != std::string::npos) {
            std::string k = line.substr(0, c), v = line.substr(c + 1);
            trim_inplace(k);
            trim_inplace(v);
            headers[k] = v;
        }
    }
    return true;
}

bool decode_chunked(const std::string& in, std::string& out) {
    out.clear();
    std::string body;
    std::size_t pos = 0;
    while (true) {
        const std::size_t eol = in.find("\r\n", pos);
        if (eol == std::string::npos) return false;
        std::string size_line = in.substr(pos, eol - pos);
        const std::size_t ext = size_line.find(';');
        if (ext != std::string::npos) size_line.erase(ext);
        trim_inplace(size_line);
        if (size_line.empty()) return false;

        std::size_t size = 0;
        for (char c : size_line) {
            const int v = hexval(c);
            if (v < 0 || size > (SIZE_MAX >> 4)) return false;
            size = (size << 4) | (std::size_t)v;
        }
        pos = eol + 2;
        if (size == 0) {              // trailers, if any, are ignored
            out.swap(body);
            return true;
        }
        const std::size_t left = in.size() - pos;
        if (size > left || left - size < 2) return false;
        body.append(in, pos, size);
        pos += size;
        if (in.compare(pos, 2, "\r\n") != 0) return false;
        pos += 2;
    }
}

} // namespace td::internal
