/*
 * Part of the TrustDial (TD) project.
 *
 * SPDX-FileCopyrightText: 2025 TrustDial contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of TrustDial (TD). See LICENSE for details.
 * Coded by DooKoo2: https://github.com/Dookoo2
 */

#include "td/client.hpp"
#include "td/log.hpp"
#include "td/http_response.hpp"

#include "td/internal/utils.hpp"
#include "td/internal/http_parser.hpp"
#include "td/internal/http_low.hpp"
#include "td/internal/tls_cli_ctx.hpp"

#include <openssl/ssl.h>
#include <openssl/x509v3.h>
#include <openssl/err.h>

#include <sstream>
#include <fstream>
#include <algorithm>
#include <memory>
#include <utility>

#include <chrono>
#include <limits>
#include <cstring>

#include <poll.h>
#include <cerrno>
#include <fcntl.h>

#include <sys/types.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <arpa/inet.h>
#include <strings.h>

namespace {

// Returns remaining milliseconds until deadline, clamped to [0, INT_MAX].
[[nodiscard]] inline int remaining_ms(std::chrono::steady_clock::time_point deadline) noexcept {
    using namespace std::chrono;
    const auto now = steady_clock::now();
    if (now >= deadline) return 0;
    const auto ms = duration_cast<milliseconds>(deadline - now).count();
    if (ms <= 0) return 0;
    if (ms > static_cast<long long>(std::numeric_limits<int>::max())) {
        return std::numeric_limits<int>::max();
    }
    return static_cast<int>(ms);
}

// Drain OpenSSL error stack into logs.
inline void log_openssl_errors(const char* where) {
    unsigned long e = 0;
    while ((e = ::ERR_get_error()) != 0) {
        char buf[256];
        ::ERR_error_string_n(e, buf, sizeof(buf));
        td::log_line(std::string("[CLIENT] ") + where + ": " + buf);
    }
}

[[nodiscard]] bool wait_fd(int fd, short ev, std::chrono::steady_clock::time_point deadline) {
    const int ms = remaining_ms(deadline);
    if (ms <= 0) return false;
    pollfd pfd{};
    pfd.fd = fd;
    pfd.events = ev;
    int pr = 0;
    do {
        pr = ::poll(&pfd, 1, ms);
    } while (pr < 0 && errno == EINTR);
    return pr > 0;
}

// TLS handshake that handles WANT_READ/WANT_WRITE within a bounded deadline.
// Works with both blocking and non-blocking sockets.
[[nodiscard]] bool ssl_connect_with_deadline(SSL* ssl, int fd, int timeout_sec) {
    if (!ssl || fd < 0) return false;

    const int effective_timeout = std::max(1, timeout_sec);
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(effective_timeout);

    while (true) {
        ::ERR_clear_error();
        const int rc = ::SSL_connect(ssl);
        if (rc == 1) {
            return true;
        }

        const int ssl_err = ::SSL_get_error(ssl, rc);

        if (ssl_err == SSL_ERROR_WANT_READ || ssl_err == SSL_ERROR_WANT_WRITE) {
            const short ev = (ssl_err == SSL_ERROR_WANT_READ) ? POLLIN : POLLOUT;
            if (!wait_fd(fd, ev, deadline)) {
                td::log_line("[CLIENT] SSL_connect timeout");
                return false;
            }
            continue;
        }

        if (ssl_err == SSL_ERROR_SYSCALL) {
            const int e = errno;
            if (e == EINTR) {
                continue;
            }
            if (e == EAGAIN || e == EWOULDBLOCK) {
                if (!wait_fd(fd, POLLIN, deadline)) {
                    td::log_line("[CLIENT] SSL_connect timeout (EAGAIN)");
                    return false;
                }
                continue;
            }
            td::log_line(std::string("[CLIENT] SSL_connect syscall error: errno=") + std::to_string(e) +
                         " (" + std::strerror(e) + ")");
            log_openssl_errors("SSL_connect");
            return false;
        }

        // Protocol / certificate / other SSL-layer error.
        td::log_line(std::string("[CLIENT] SSL_connect failed: ssl_error=") + std::to_string(ssl_err));
        log_openssl_errors("SSL_connect");
        return false;
    }
}

bool is_ip_literal(const std::string& host) {
    unsigned char tmp[16];
    return ::inet_pton(AF_INET, host.c_str(), tmp) == 1 ||
           ::inet_pton(AF_INET6, host.c_str(), tmp) == 1;
}

// One request's connection: raw TCP, optionally wrapped in TLS.
struct Wire {
    std::unique_ptr<td::internal::TcpConn> tcp;
    std::unique_ptr<SSL, void(*)(SSL*)> ssl{nullptr, [](SSL* s){ if(s){ SSL_free(s); } }};

    ~Wire() {
        if (ssl && SSL_is_init_finished(ssl.get())) {
            SSL_shutdown(ssl.get());
            ERR_clear_error();
        }
    }

    bool send_all(const std::string& data) {
        if (ssl) {
            std::size_t off = 0;
            while (off < data.size()) {
                int n = SSL_write(ssl.get(), data.data() + off, (int)(data.size() - off));
                if (n <= 0) { ERR_clear_error(); return false; }
                off += (std::size_t)n;
            }
            return true;
        }
        return tcp->send_all(data.data(), data.size());
    }

    // >0 bytes read, 0 on orderly close, <0 on error.
    int read_some(char* buf, std::size_t n) {
        if (ssl) {
            int r = SSL_read(ssl.get(), buf, (int)std::min<std::size_t>(n, (std::size_t)std::numeric_limits<int>::max()));
            if (r > 0) return r;
            const int e = SSL_get_error(ssl.get(), r);
            if (e == SSL_ERROR_ZERO_RETURN) return 0;
            ERR_clear_error();
            return -1;
        }
        ssize_t r = ::recv(tcp->fd(), buf, n, 0);
        if (r < 0) return -1;
        return (int)r;
    }
};

std::string percent_decode(const std::string& s) {
    std::string o; o.reserve(s.size());
    for (std::size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' && i + 2 < s.size()) {
            int hi = td::internal::hexval(s[i+1]), lo = td::internal::hexval(s[i+2]);
            if (hi >= 0 && lo >= 0) { o.push_back((char)((hi << 4) | lo)); i += 2; continue; }
        }
        o.push_back(s[i]);
    }
    return o;
}

// file:// requests are served from the filesystem root, no dial involved.
void serve_file(const std::string& method, const std::string& url_path, td::HttpResponse& out) {
    out = td::HttpResponse{};
    if (method != "GET") {
        out.status_code = 405;
        out.status_text = "Method Not Allowed";
        out.headers["Content-Length"] = "0";
        return;
    }
    const std::string path = percent_decode(url_path.substr(0, url_path.find('?')));
    struct stat st{};
    std::ifstream in;
    if (::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode)) {
        in.open(path, std::ios::in | std::ios::binary);
    }
    if (!in.is_open()) {
        out.status_code = 404;
        out.status_text = "Not Found";
        out.body = "404 page not found\n";
        out.headers["Content-Length"] = std::to_string(out.body.size());
        return;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    out.status_code = 200;
    out.status_text = "OK";
    out.body = ss.str();
    out.headers["Content-Length"] = std::to_string(out.body.size());
}

} // namespace

namespace td {

struct Client::Impl {
    ClientConfig cfg;
    TlsConfig tls;
    std::shared_ptr<Dialer> dialer;
    std::unique_ptr<internal::TlsClientContext> tls_ctx;

    Impl(const ClientConfig& c, const TlsConfig& t, std::shared_ptr<Dialer> d)
        : cfg(c), tls(t), dialer(std::move(d)) {
        td::set_log_file(cfg.log_file);
        if (!dialer) {
            dialer = std::make_shared<TcpDialer>();
        }
        tls_ctx = std::make_unique<internal::TlsClientContext>(tls);
#ifdef SSL_OP_IGNORE_UNEXPECTED_EOF
        if (tls_ctx->ctx()) SSL_CTX_set_options(tls_ctx->ctx(), SSL_OP_IGNORE_UNEXPECTED_EOF);
#endif
    }

    bool start_tls(Wire& w, const internal::Url& u, Error* err) {
        if (!tls_ctx || !tls_ctx->ctx()) {
            td::log_line("[CLIENT] TLS ctx not ready");
            return internal::fail(err, Errc::TlsSetup, "TLS context not ready");
        }
        SSL* s = SSL_new(tls_ctx->ctx());
        if (!s) {
            td::log_line("[CLIENT] SSL_new failed");
            return internal::fail(err, Errc::TlsSetup, "SSL_new failed");
        }
        w.ssl.reset(s);
        SSL_set_fd(s, w.tcp->fd());

        const bool ip = is_ip_literal(u.host);
        if (!ip) {
            SSL_set_tlsext_host_name(s, u.host.c_str());
        }

        // Chain validation alone is not enough: the expected name has to be
        // set explicitly. Only applied when the peer is verified.
        if (tls_ctx->verify_peer()) {
            X509_VERIFY_PARAM* param = SSL_get0_param(s);
            if (!param) {
                td::log_line("[CLIENT] SSL_get0_param failed");
                return internal::fail(err, Errc::TlsSetup, "SSL_get0_param failed");
            }
            if (ip) {
                if (X509_VERIFY_PARAM_set1_ip_asc(param, u.host.c_str()) != 1) {
                    td::log_line("[CLIENT] X509_VERIFY_PARAM_set1_ip_asc failed");
                    return internal::fail(err, Errc::TlsSetup, "cannot set expected IP");
                }
            } else {
                if (SSL_set1_host(s, u.host.c_str()) != 1) {
                    td::log_line("[CLIENT] SSL_set1_host failed");
                    return internal::fail(err, Errc::TlsSetup, "cannot set expected host name");
                }
            }
        }

        // Handshake in non-blocking mode with a bounded deadline.
        const int fd = w.tcp->fd();
        const int old_flags = ::fcntl(fd, F_GETFL, 0);
        if (old_flags < 0 || ::fcntl(fd, F_SETFL, old_flags | O_NONBLOCK) < 0) {
            td::log_line("[CLIENT] fcntl(O_NONBLOCK) failed");
            return internal::fail(err, Errc::Io, "fcntl(O_NONBLOCK) failed");
        }
        const bool hs_ok = ssl_connect_with_deadline(s, fd, cfg.tls_handshake_timeout_sec);
        (void)::fcntl(fd, F_SETFL, old_flags);

        const long vr = SSL_get_verify_result(s);
        if (tls_ctx->verify_peer() && vr != X509_V_OK) {
            const std::string msg = std::string("certificate verify failed: ") +
                                    X509_verify_cert_error_string(vr);
            td::log_line("[CLIENT] TLS " + msg);
            w.ssl.reset();   // no close_notify on a failed session
            return internal::fail(err, Errc::TlsVerify, msg);
        }
        if (!hs_ok) {
            w.ssl.reset();
            return internal::fail(err, Errc::TlsHandshake, "TLS handshake with " + u.host + " failed");
        }
        return true;
    }

    bool read_response(Wire& w, const std::string& method, HttpResponse& out, Error* err) {
        std::string data;
        char buf[4096];
        std::size_t hdr_end_off = 0;

        while (data.find("\r\n\r\n") == std::string::npos) {
            const int n = w.read_some(buf, sizeof(buf));
            if (n <= 0) {
                return internal::fail(err, n == 0 ? Errc::Protocol : Errc::Io,
                                      "connection closed before response head");
            }
            data.append(buf, buf + n);
            if (data.size() > (1u<<20)) {
                return internal::fail(err, Errc::Protocol, "response head too large");
            }
        }
        if (!internal::parse_http_response(data, hdr_end_off, out.status_code, out.status_text, out.headers)) {
            return internal::fail(err, Errc::Protocol, "malformed response head");
        }
        std::string body = data.substr(hdr_end_off);

        const bool no_body = internal::upper_copy(method) == "HEAD" ||
                             out.status_code == 204 || out.status_code == 304 ||
                             (out.status_code >= 100 && out.status_code < 200);
        if (no_body) {
            out.body.clear();
            return true;
        }

        const bool chunked =
            internal::lower_copy(internal::hdr_ci(out.headers, "Transfer-Encoding")).find("chunked") != std::string::npos;
        const std::string cl = internal::hdr_ci(out.headers, "Content-Length");

        if (!chunked && !cl.empty()) {
            std::size_t content_len = 0;
            try { content_len = (std::size_t)std::stoull(cl); }
            catch (const std::exception&) {
                return internal::fail(err, Errc::Protocol, "bad Content-Length \"" + cl + "\"");
            }
            if (content_len > cfg.max_response_bytes) {
                return internal::fail(err, Errc::Protocol, "response body too large");
            }
            while (body.size() < content_len) {
                const std::size_t need = content_len - body.size();
                const int n = w.read_some(buf, std::min(sizeof(buf), need));
                if (n <= 0) return internal::fail(err, Errc::Io, "short response body");
                body.append(buf, buf + n);
            }
            body.resize(content_len);
            out.body.swap(body);
            return true;
        }

        // Chunked or delimited by close: read to EOF.
        while (true) {
            const int n = w.read_some(buf, sizeof(buf));
            if (n == 0) break;
            if (n < 0) return internal::fail(err, Errc::Io, "error reading response body");
            body.append(buf, buf + n);
            if (body.size() > cfg.max_response_bytes) {
                return internal::fail(err, Errc::Protocol, "response body too large");
            }
        }
        if (chunked) {
            std::string decoded;
            if (!internal::decode_chunked(body, decoded)) {
                return internal::fail(err, Errc::Protocol, "malformed chunked body");
            }
            body.swap(decoded);
        }
        out.body.swap(body);
        return true;
    }
};

Client::Client(const ClientConfig& cfg, const TlsConfig& tls, std::shared_ptr<Dialer> dialer)
    : _p(std::make_unique<Client::Impl>(cfg, tls, std::move(dialer))) {}

Client::~Client() = default;

const ClientConfig& Client::config() const { return _p->cfg; }
const TlsConfig& Client::tls_config() const { return _p->tls; }
const Dialer& Client::dialer() const { return *_p->dialer; }

bool Client::request(const std::string& method,
                     const std::string& url,
                     const HttpHeaders& headers,
                     const std::string& body,
                     HttpResponse& out,
                     Error* err)
{
    out = HttpResponse{};
    internal::Url u;
    if (!internal::parse_url(url, u, err)) return false;

    const std::string method_up = internal::upper_copy(method);
    if (u.scheme == "file") {
        serve_file(method_up, u.path, out);
        return true;
    }

    // Every connect goes through the dialer; a gated dialer may refuse here.
    Wire w;
    DialOptions opt;
    opt.connect_timeout_sec = _p->cfg.connect_timeout_sec;
    opt.io_timeout_sec      = _p->cfg.io_timeout_sec;
    w.tcp = _p->dialer->dial(internal::join_host_port(u.host, u.port), opt, err);
    if (!w.tcp) return false;

    if (u.scheme == "https" && !_p->start_tls(w, u, err)) return false;

    std::ostringstream req;
    req << method_up << " " << u.path << " HTTP/1.1\r\n";
    if (!internal::has_hdr_ci(headers, "Host")) {
        req << "Host: " << internal::host_header_value(u) << "\r\n";
    }
    if (!internal::has_hdr_ci(headers, "User-Agent")) {
        req << "User-Agent: " << _p->cfg.user_agent << "\r\n";
    }
    if (!internal::has_hdr_ci(headers, "Accept")) {
        req << "Accept: */*\r\n";
    }
    for (const auto& kv : headers) {
        if (strcasecmp(kv.first.c_str(), "Content-Length") == 0) continue;
        if (strcasecmp(kv.first.c_str(), "Connection") == 0) continue;
        req << kv.first << ": " << kv.second << "\r\n";
    }
    req << "Connection: close\r\n";
    if (!body.empty() || method_up == "POST" || method_up == "PUT" || method_up == "PATCH") {
        req << "Content-Length: " << body.size() << "\r\n";
    }
    req << "\r\n";

    if (!w.send_all(req.str()) || (!body.empty() && !w.send_all(body))) {
        td::log_line("[CLIENT] send to " + u.host + ":" + u.port + " failed");
        return internal::fail(err, Errc::Io, "send failed");
    }
    return _p->read_response(w, method_up, out, err);
}

bool Client::get(const std::string& url, HttpResponse& out, Error* err) {
    return request("GET", url, /*headers*/{}, /*body*/"", out, err);
}

} // namespace td
