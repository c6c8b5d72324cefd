/*
 * Part of the TrustDial (TD) project.
 *
 * SPDX-FileCopyrightText: 2025 TrustDial contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of TrustDial (TD). See LICENSE for details.
 * Coded by DooKoo2: https://github.com/Dookoo2
 */

#include "td/internal/utils.hpp"
#include <cctype>
#include <openssl/crypto.h>
#include <openssl/evp.h>

namespace td::internal {

void trim_inplace(std::string& s) {
    std::size_t a = 0;
    while (a < s.size() && std::isspace((unsigned char)s[a])) ++a;
    std::size_t b = s.size();
    while (b > a && std::isspace((unsigned char)s[b-1])) --b;
    if (a > 0 || b < s.size()) s.assign(s.begin()+a, s.begin()+b);
}

int hexval(char c){
    if(c>='0'&&c<='9')return c-'0';
    if(c>='a'&&c<='f')return 10+(c-'a');
    if(c>='A'&&c<='F')return 10+(c-'A');
    return -1;
}

std::string upper_copy(std::string s){
    for(char& c: s) c = (char)std::toupper((unsigned char)c);
    return s;
}
std::string lower_copy(std::string s){
    for(char& c: s) c = (char)std::tolower((unsigned char)c);
    return s;
}

void secure_wipe(std::string& s){
    if(!s.empty()){
        OPENSSL_cleanse(s.data(), s.size());
        s.clear();
        s.shrink_to_fit();
    }
}

std::string base64_encode(const std::string& data){
    if (data.empty()) return {};
    std::string out;
    out.resize(4 * ((data.size() + 2) / 3) + 1);   // +1 for the NUL EVP writes
    const int n = EVP_EncodeBlock((unsigned char*)out.data(),
                                  (const unsigned char*)data.data(), (int)data.size());
    out.resize(n < 0 ? 0 : (std::size_t)n);
    return out;
}

static bool is_b64_char(unsigned char c){
    return std::isalnum(c) || c == '+' || c == '/';
}

bool base64_decode(const std::string& b64, std::string& out){
    out.clear();
    if (b64.empty()) return true;
    if (b64.size() % 4) return false;

    // '=' may only appear as the last one or two characters.
    std::size_t pad = 0;
    if (b64[b64.size()-1] == '=') ++pad;
    if (b64[b64.size()-2] == '=') ++pad;
    if (pad == 1 && b64[b64.size()-2] == '=') return false;
    for (std::size_t i = 0; i < b64.size() - pad; ++i) {
        if (!is_b64_char((unsigned char)b64[i])) return false;
    }

    std::string buf;
    buf.resize(3 * (b64.size() / 4));
    const int n = EVP_DecodeBlock((unsigned char*)buf.data(),
                                  (const unsigned char*)b64.data(), (int)b64.size());
    if (n < 0 || (std::size_t)n < pad) return false;
    // EVP_DecodeBlock counts padding as zero bytes.
    buf.resize((std::size_t)n - pad);
    out.swap(buf);
    return true;
}

} // namespace td::internal
