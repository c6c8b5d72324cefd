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

using namespace td;

TEST(BasicAuth, EncodeProducesRfc2617Value) {
    // Example from RFC 2617 section 2
    EXPECT_EQ(encode_basic_auth("Aladdin", "open sesame"), "Basic QWxhZGRpbjpvcGVuIHNlc2FtZQ==");
    EXPECT_EQ(encode_basic_auth("", ""), "Basic Og==");
}

TEST(BasicAuth, HeaderHoldsOnlyAuthorization) {
    const HttpHeaders h = basic_auth_header("user", "pass");
    ASSERT_EQ(h.size(), 1u);
    EXPECT_EQ(h.at("Authorization"), "Basic dXNlcjpwYXNz");
}

TEST(BasicAuth, PasswordKeepsColons) {
    Credentials c;
    Error err;
    ASSERT_TRUE(decode_basic_auth(encode_basic_auth("alice", "pa:ss"), c, &err)) << err.message;
    EXPECT_EQ(c.username, "alice");
    EXPECT_EQ(c.password, "pa:ss");

    ASSERT_TRUE(decode_basic_auth(encode_basic_auth("bob", ":::"), c));
    EXPECT_EQ(c.username, "bob");
    EXPECT_EQ(c.password, ":::");
}

TEST(BasicAuth, EmptyFieldsAndBinaryBytes) {
    Credentials c;
    ASSERT_TRUE(decode_basic_auth(encode_basic_auth("", "secret"), c));
    EXPECT_EQ(c.username, "");
    EXPECT_EQ(c.password, "secret");

    const std::string pw("\x00\xff\x01 p", 5);
    ASSERT_TRUE(decode_basic_auth(encode_basic_auth("u", pw), c));
    EXPECT_EQ(c.password, pw);
}

TEST(BasicAuth, WrongSchemeIsAuthFormat) {
    Credentials c;
    Error err;
    EXPECT_FALSE(decode_basic_auth("Bearer abcd", c, &err));
    EXPECT_EQ(err.code, Errc::AuthFormat);

    err = Error{};
    EXPECT_FALSE(decode_basic_auth("basic dXNlcjpwYXNz", c, &err));
    EXPECT_EQ(err.code, Errc::AuthFormat);
}

TEST(BasicAuth, InvalidBase64IsAuthFormat) {
    Credentials c;
    Error err;
    EXPECT_FALSE(decode_basic_auth("Basic not-base64!!", c, &err));
    EXPECT_EQ(err.code, Errc::AuthFormat);

    err = Error{};
    EXPECT_FALSE(decode_basic_auth("Basic dXNlcjpwYXNz=", c, &err));  // bad length
    EXPECT_EQ(err.code, Errc::AuthFormat);

    err = Error{};
    EXPECT_FALSE(decode_basic_auth("Basic dX=lcjpwYXNz", c, &err));   // '=' inside
    EXPECT_EQ(err.code, Errc::AuthFormat);
}

TEST(BasicAuth, MissingOrMisshapenHeaderIsAuthFormat) {
    Credentials c;
    for (const char* bad : {"", "Basic", "Basic ", "dXNlcjpwYXNz",
                            "Basic  dXNlcjpwYXNz", " Basic dXNlcjpwYXNz",
                            "Basic dXNlcjpwYXNz extra", "Basic dXNlcjpwYXNz "}) {
        Error err;
        EXPECT_FALSE(decode_basic_auth(bad, c, &err)) << '"' << bad << '"';
        EXPECT_EQ(err.code, Errc::AuthFormat) << '"' << bad << '"';
    }
}

TEST(BasicAuth, PayloadWithoutColonIsAuthFormat) {
    Credentials c;
    Error err;
    // base64("useronly")
    EXPECT_FALSE(decode_basic_auth("Basic dXNlcm9ubHk=", c, &err));
    EXPECT_EQ(err.code, Errc::AuthFormat);
    EXPECT_EQ(err.message, "invalid HTTP auth contents");
}

TEST(BasicAuth, ParseHeaderLooksUpAnyCase) {
    Credentials c;
    HttpHeaders h{{"authorization", encode_basic_auth("carol", "pw")}};
    ASSERT_TRUE(parse_basic_auth_header(h, c));
    EXPECT_EQ(c.username, "carol");
    EXPECT_EQ(c.password, "pw");

    Error err;
    EXPECT_FALSE(parse_basic_auth_header(HttpHeaders{}, c, &err));
    EXPECT_EQ(err.code, Errc::AuthFormat);
}
