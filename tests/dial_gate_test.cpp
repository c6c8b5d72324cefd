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
#include "td/dial_gate.hpp"

#include <atomic>
#include <thread>
#include <vector>

using namespace td;

TEST(SplitHostPort, Forms) {
    std::string h, p;
    ASSERT_TRUE(split_host_port("localhost:80", h, p));
    EXPECT_EQ(h, "localhost");
    EXPECT_EQ(p, "80");
    ASSERT_TRUE(split_host_port("[::1]:443", h, p));
    EXPECT_EQ(h, "::1");
    EXPECT_EQ(p, "443");
    ASSERT_TRUE(split_host_port(":8080", h, p));
    EXPECT_EQ(h, "");
    EXPECT_EQ(p, "8080");

    EXPECT_FALSE(split_host_port("bad-addr", h, p));
    EXPECT_FALSE(split_host_port("::1", h, p));
    EXPECT_FALSE(split_host_port("::1:80", h, p));
    EXPECT_FALSE(split_host_port("[::1]", h, p));
    EXPECT_FALSE(split_host_port("[::1:80", h, p));
    EXPECT_FALSE(split_host_port("", h, p));
}

TEST(IsLocalAddr, LoopbackAndLocalhost) {
    EXPECT_TRUE(is_local_addr("localhost:80"));
    EXPECT_TRUE(is_local_addr("127.0.0.1:8080"));
    EXPECT_TRUE(is_local_addr("127.255.0.9:1"));
    EXPECT_TRUE(is_local_addr("[::1]:443"));
    EXPECT_TRUE(is_local_addr("[::ffff:127.0.0.1]:443"));
}

TEST(IsLocalAddr, EverythingElseIsNotLocal) {
    EXPECT_FALSE(is_local_addr("93.184.216.34:80"));
    EXPECT_FALSE(is_local_addr("bad-addr"));
    EXPECT_FALSE(is_local_addr("localhost"));
    EXPECT_FALSE(is_local_addr("LOCALHOST:80"));
    EXPECT_FALSE(is_local_addr("localhost.example.com:80"));
    EXPECT_FALSE(is_local_addr("128.0.0.1:80"));
    EXPECT_FALSE(is_local_addr("0.0.0.0:80"));
    EXPECT_FALSE(is_local_addr("[::]:80"));
    EXPECT_FALSE(is_local_addr("[::2]:80"));
    EXPECT_FALSE(is_local_addr(":80"));
}

TEST(DialGate, OpenByDefault) {
    DialGate gate;
    EXPECT_TRUE(gate.outgoing_access_allowed());
    EXPECT_TRUE(gate.allow_dial("93.184.216.34:80"));
    EXPECT_TRUE(gate.allow_dial("bad-addr"));
}

TEST(DialGate, ClosedGateRefusesNonLocal) {
    DialGate gate(false);
    Error err;
    EXPECT_FALSE(gate.allow_dial("93.184.216.34:80", &err));
    EXPECT_EQ(err.code, Errc::ConnectionRefused);
    EXPECT_EQ(err.message, "access to address \"93.184.216.34:80\" not allowed");

    err = Error{};
    EXPECT_FALSE(gate.allow_dial("bad-addr", &err));
    EXPECT_EQ(err.code, Errc::ConnectionRefused);

    EXPECT_TRUE(gate.allow_dial("localhost:8080"));
    EXPECT_TRUE(gate.allow_dial("[::1]:443"));
}

TEST(DialGate, FlipTakesEffectOnNextCheck) {
    DialGate gate;
    EXPECT_TRUE(gate.allow_dial("10.0.0.1:22"));
    gate.set_outgoing_access_allowed(false);
    EXPECT_FALSE(gate.allow_dial("10.0.0.1:22"));
    gate.set_outgoing_access_allowed(true);
    EXPECT_TRUE(gate.allow_dial("10.0.0.1:22"));
}

TEST(DialGate, ConcurrentTogglesAndChecks) {
    DialGate gate;
    std::atomic<bool> stop{false};
    std::atomic<long> local_refusals{0};

    std::vector<std::thread> readers;
    for (int i = 0; i < 4; ++i) {
        readers.emplace_back([&] {
            while (!stop.load()) {
                (void)gate.allow_dial("8.8.8.8:53");
                if (!gate.allow_dial("127.0.0.1:80")) local_refusals.fetch_add(1);
            }
        });
    }
    for (int i = 0; i < 1000; ++i) {
        gate.set_outgoing_access_allowed(i % 2 == 0);
    }
    stop.store(true);
    for (auto& t : readers) t.join();

    EXPECT_EQ(local_refusals.load(), 0);
    gate.set_outgoing_access_allowed(false);
    EXPECT_FALSE(gate.allow_dial("8.8.8.8:53"));
}

TEST(DefaultDialGate, ProcessWideSwitch) {
    EXPECT_EQ(default_dial_gate().get(), default_dial_gate().get());
    const bool saved = outgoing_access_allowed();
    set_outgoing_access_allowed(false);
    EXPECT_FALSE(default_dial_gate()->allow_dial("93.184.216.34:80"));
    EXPECT_TRUE(default_dial_gate()->allow_dial("localhost:80"));
    set_outgoing_access_allowed(true);
    EXPECT_TRUE(default_dial_gate()->allow_dial("93.184.216.34:80"));
    set_outgoing_access_allowed(saved);
}
