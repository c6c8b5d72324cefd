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
#include <cstdint>

namespace td::internal {

void trim_inplace(std::string& s);
int  hexval(char c);
std::string lower_copy(std::string s);
std::string upper_copy(std::string s);
void secure_wipe(std::string& s);

// Standard (RFC 4648) base64 with padding, via OpenSSL EVP block coding.
std::string base64_encode(const std::string& data);
// Strict decode: standard alphabet only, length a multiple of 4, '=' only as
// trailing padding. No whitespace tolerated.
bool base64_decode(const std::string& b64, std::string& out);

} // namespace td::internal
