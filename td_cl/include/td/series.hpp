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
#include <functional>
#include <mutex>
#include <string>
#include <utility>
#include "td/types.hpp"

namespace td {

constexpr const char* kGenericLinuxSeries = "genericlinux";
constexpr const char* kUnknownSeries      = "unknown";

// Maps /etc/os-release content to a series name. Ubuntu yields its
// VERSION_CODENAME; any other Linux distribution yields "genericlinux".
std::string series_from_os_release(const std::string& os_release);

// Maps a Darwin kernel release (e.g. "14.5.0") to the macOS series name.
// Unknown majors produce "unknown" and Errc::UnknownSeries.
bool macos_series_from_kernel(const std::string& kernel_release, std::string& out, Error* err);

// Reads the series of the running host (uname + /etc/os-release).
bool read_host_series(std::string& out, Error* err);

// Computes a series once and serves the cached value (or cached error) to
// every later caller. Thread-safe.
class SeriesCache {
public:
    using Reader = std::function<bool(std::string&, Error*)>;

    explicit SeriesCache(Reader reader = read_host_series) : _reader(std::move(reader)) {}

    bool get(std::string& out, Error* err = nullptr);

private:
    Reader _reader;
    std::once_flag _once;
    std::string _series;
    Error _error;
};

// Series of the machine this process runs on; cached after the first call.
bool host_series(std::string& out, Error* err = nullptr);

} // namespace td
