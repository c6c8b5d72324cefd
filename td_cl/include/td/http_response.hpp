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
#include <unordered_map>

namespace td {

using HttpHeaders = std::unordered_map<std::string, std::string>;

struct HttpResponse {
    int status_code = 0;
    std::string status_text;
    HttpHeaders headers;
    std::string body;
};

} // namespace td
