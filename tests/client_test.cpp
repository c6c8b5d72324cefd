/*
 * Part of the TrustDial (TD) project.
 *
 * SPDX-FileCopyrightText: 2025 TrustDial contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of TrustDial (TD). See LICENSE for details.
 * Coded by DooKoo2: https://github.com/Dookoo2
 */

#include <gtest/gtest.h>
#include "td/basic_auth.hpp"
#include "td/client.hpp"
#include "td/http_client.hpp"
#include "support/loopback_server.hpp"
#include "support/test_certs.hpp"

#include <openssl/err.h>

#include <csignal>
#include <cstdio>
#include <fstream>
#include <unistd.h>

using namespace td;

namespace {

ClientConfig quiet_config() {
    ClientConfig cfg;
    cfg.log_file.clear();
    cfg.connect_timeout_sec = 2;
    cfg.io_timeout_sec = 2;
    cfg.tls_handshake_timeout_sec = 5;
    return cfg;
}

class TlsClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        pki = test::make_test_pki();
        test::LoopbackServer::Options opt;
        opt.tls = true;
        opt.cert_pem = pki.leaf.cert_pem;
        opt.key_pem = pki.leaf.key_pem;
        opt.body = "hello over tls";
        srv = std::make_unique<test::LoopbackServer>(opt);
        gate = std::make_shared<DialGate>(true);
    }

    test::TestPki pki;
    std::unique_ptr<test::LoopbackServer> srv;
    std::shared_ptr<DialGate> gate;
};

} // namespace

TEST(Client, PlainHttpRoundTrip) {
    test::LoopbackServer srv(test::LoopbackServer::Options{});
    auto cli = get_http_client(SslHostnameVerification::Verify, {}, std::make_shared<DialGate>(), quiet_config());

    HttpResponse resp;
    Error err;
    ASSERT_TRUE(cli->request("post", srv.url("127.0.0.1", "/echo?x=1"),
                             basic_auth_header("alice", "pa:ss"), "payload", resp, &err)) << err.message;
    EXPECT_EQ(resp.status_code, 200);
    EXPECT_EQ(resp.status_text, "OK");
    EXPECT_EQ(resp.body, "ok");

    const std::string req = srv.last_request();
    EXPECT_EQ(req.rfind("POST /echo?x=1 HTTP/1.1\r\n", 0), 0u);
    EXPECT_NE(req.find("Host: 127.0.0.1:" + std::to_string(srv.port()) + "\r\n"), std::string::npos);
    EXPECT_NE(req.find("Authorization: " + encode_basic_auth("alice", "pa:ss") + "\r\n"), std::string::npos);
    EXPECT_NE(req.find("Connection: close\r\n"), std::string::npos);
    EXPECT_NE(req.find("Content-Length: 7\r\n"), std::string::npos);
    EXPECT_EQ(req.substr(req.size() - 7), "payload");
}

TEST(Client, ChunkedResponseBody) {
    test::LoopbackServer::Options opt;
    opt.chunked = true;
    opt.body = "chunked body text";
    test::LoopbackServer srv(opt);
    auto cli = get_validating_http_client(std::make_shared<DialGate>(), quiet_config());

    HttpResponse resp;
    Error err;
    ASSERT_TRUE(cli->get(srv.url("localhost"), resp, &err)) << err.message;
    EXPECT_EQ(resp.body, "chunked body text");
}

TEST(Client, ClosedGateStillReachesLoopback) {
    test::LoopbackServer srv(test::LoopbackServer::Options{});
    auto gate = std::make_shared<DialGate>(false);
    auto cli = get_http_client(SslHostnameVerification::Verify, {}, gate, quiet_config());

    HttpResponse resp;
    Error err;
    ASSERT_TRUE(cli->get(srv.url("localhost"), resp, &err)) << err.message;
    EXPECT_EQ(resp.status_code, 200);

    EXPECT_FALSE(cli->get("http://93.184.216.34:80/", resp, &err));
    EXPECT_EQ(err.code, Errc::ConnectionRefused);
    EXPECT_EQ(srv.accepted(), 1);
}

TEST(Client, BadUrls) {
    auto cli = get_validating_http_client(std::make_shared<DialGate>(), quiet_config());
    HttpResponse resp;
    Error err;
    EXPECT_FALSE(cli->get("no-scheme.example", resp, &err));
    EXPECT_EQ(err.code, Errc::BadUrl);
    EXPECT_FALSE(cli->get("ftp://example.com/", resp, &err));
    EXPECT_EQ(err.code, Errc::UnsupportedScheme);
    EXPECT_FALSE(cli->get("http://:80/", resp, &err));
    EXPECT_EQ(err.code, Errc::BadUrl);
}

TEST(Client, FileUrlsNeedNoDial) {
    char tmpl[] = "/tmp/td_client_test_XXXXXX";
    const int fd = ::mkstemp(tmpl);
    ASSERT_GE(fd, 0);
    ::close(fd);
    {
        std::ofstream out(tmpl, std::ios::binary);
        out << "file contents";
    }

    // Even a fully closed gate does not affect file:// requests.
    auto cli = get_validating_http_client(std::make_shared<DialGate>(false), quiet_config());
    HttpResponse resp;
    Error err;
    ASSERT_TRUE(cli->get(std::string("file://") + tmpl, resp, &err)) << err.message;
    EXPECT_EQ(resp.status_code, 200);
    EXPECT_EQ(resp.body, "file contents");

    ASSERT_TRUE(cli->get(std::string("file://") + tmpl + ".missing", resp, &err));
    EXPECT_EQ(resp.status_code, 404);

    ASSERT_TRUE(cli->get("file:///", resp, &err));
    EXPECT_EQ(resp.status_code, 404);

    ASSERT_TRUE(cli->request("POST", std::string("file://") + tmpl, {}, "x", resp, &err));
    EXPECT_EQ(resp.status_code, 405);

    std::remove(tmpl);
}

TEST_F(TlsClientTest, VerifyWithCustomCaSucceeds) {
    auto cli = get_http_client(SslHostnameVerification::Verify, {pki.ca.cert_pem}, gate, quiet_config());
    HttpResponse resp;
    Error err;
    ASSERT_TRUE(cli->get(srv->url("localhost"), resp, &err)) << err.message;
    EXPECT_EQ(resp.status_code, 200);
    EXPECT_EQ(resp.body, "hello over tls");
}

TEST_F(TlsClientTest, VerifyChecksIpSan) {
    auto cli = get_http_client(SslHostnameVerification::Verify, {pki.ca.cert_pem}, gate, quiet_config());
    HttpResponse resp;
    Error err;
    ASSERT_TRUE(cli->get(srv->url("127.0.0.1"), resp, &err)) << err.message;
    EXPECT_EQ(resp.body, "hello over tls");
}

TEST_F(TlsClientTest, VerifyWithoutCustomCaFails) {
    auto cli = get_http_client(SslHostnameVerification::Verify, {}, gate, quiet_config());
    HttpResponse resp;
    Error err;
    EXPECT_FALSE(cli->get(srv->url("localhost"), resp, &err));
    EXPECT_EQ(err.code, Errc::TlsVerify);
    EXPECT_EQ(srv->served(), 0);
}

TEST_F(TlsClientTest, VerifyWithUnrelatedCaFails) {
    auto cli = get_http_client(SslHostnameVerification::Verify,
                               {test::make_unrelated_ca_pem()}, gate, quiet_config());
    HttpResponse resp;
    Error err;
    EXPECT_FALSE(cli->get(srv->url("localhost"), resp, &err));
    EXPECT_EQ(err.code, Errc::TlsVerify);
}

TEST_F(TlsClientTest, AllMalformedCertsTrustNothing) {
    auto cli = get_http_client(SslHostnameVerification::Verify, {"garbage"}, gate, quiet_config());
    HttpResponse resp;
    Error err;
    EXPECT_FALSE(cli->get(srv->url("localhost"), resp, &err));
    EXPECT_EQ(err.code, Errc::TlsVerify);
}

TEST_F(TlsClientTest, NoVerifyAcceptsUntrustedServer) {
    auto cli = get_http_client(SslHostnameVerification::NoVerify, {}, gate, quiet_config());
    HttpResponse resp;
    Error err;
    ASSERT_TRUE(cli->get(srv->url("localhost"), resp, &err)) << err.message;
    EXPECT_EQ(resp.body, "hello over tls");
}

TEST_F(TlsClientTest, NoVerifyWithPoolSkipsHostnameCheck) {
    // The pool does not contain the server's CA; skip-verify still connects
    // and the pool stays attached.
    auto cli = get_http_client(SslHostnameVerification::NoVerify,
                               {test::make_unrelated_ca_pem()}, gate, quiet_config());
    ASSERT_TRUE(cli->tls_config().root_cas);
    HttpResponse resp;
    Error err;
    ASSERT_TRUE(cli->get(srv->url("localhost"), resp, &err)) << err.message;
    EXPECT_EQ(resp.status_code, 200);
}

TEST_F(TlsClientTest, FailedTlsWriteLeavesNoOpenSslErrors) {
    test::LoopbackServer::Options opt;
    opt.tls = true;
    opt.cert_pem = pki.leaf.cert_pem;
    opt.key_pem = pki.leaf.key_pem;
    opt.drop_after_handshake = true;
    test::LoopbackServer dropping(opt);

    void (*old_handler)(int) = std::signal(SIGPIPE, SIG_IGN);
    auto cli = get_http_client(SslHostnameVerification::Verify, {pki.ca.cert_pem}, gate, quiet_config());
    HttpResponse resp;
    Error err;
    ERR_clear_error();
    EXPECT_FALSE(cli->request("POST", dropping.url("localhost"), {},
                              std::string(16u << 20, 'x'), resp, &err));
    EXPECT_NE(err.code, Errc::Ok);
    EXPECT_EQ(ERR_peek_error(), 0ul);

    // The same client keeps working against a healthy server.
    ASSERT_TRUE(cli->get(srv->url("localhost"), resp, &err)) << err.message;
    EXPECT_EQ(resp.body, "hello over tls");
    std::signal(SIGPIPE, old_handler);
}
