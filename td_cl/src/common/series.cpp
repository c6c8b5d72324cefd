/*
 * Part of the TrustDial (TD) project.
 *
 * SPDX-FileCopyrightText: 2025 TrustDial contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of TrustDial (TD). See LICENSE for details.
 * Coded by DooKoo2: https://github.com/Dookoo2
 */

#include "td/series.hpp"
#include "td/internal/utils.hpp"

#include <fstream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <sys/utsname.h>

namespace td {

namespace {

// Darwin kernel major version -> macOS series.
const std::map<int, std::string> kMacOSXSeries = {
    {15, "elcapitan"},
    {14, "yosemite"},
    {13, "mavericks"},
    {12, "mountainlion"},
    {11, "lion"},
    {10, "snowleopard"},
    {9,  "leopard"},
    {8,  "tiger"},
    {7,  "panther"},
    {6,  "jaguar"},
    {5,  "puma"},
};

std::string unquote(std::string v) {
    internal::trim_inplace(v);
    if (v.size() >= 2 && (v.front() == '"' || v.front() == '\'') && v.back() == v.front()) {
        v = v.substr(1, v.size() - 2);
    }
    return v;
}

} // namespace

std::string series_from_os_release(const std::string& os_release) {
    std::map<std::string, std::string> kv;
    std::istringstream in(os_release);
    for (std::string line; std::getline(in, line); ) {
        internal::trim_inplace(line);
        if (line.empty() || line[0] == '#') continue;
        const std::size_t eq = line.find('=');
        if (eq == std::string::npos) continue;
        kv[line.substr(0, eq)] = unquote(line.substr(eq + 1));
    }
    if (kv["ID"] == "ubuntu") {
        if (!kv["VERSION_CODENAME"].empty()) return kv["VERSION_CODENAME"];
        if (!kv["UBUNTU_CODENAME"].empty())  return kv["UBUNTU_CODENAME"];
    }
    return kGenericLinuxSeries;
}

bool macos_series_from_kernel(const std::string& kernel_release, std::string& out, Error* err) {
    out = kUnknownSeries;
    const std::string major_s = kernel_release.substr(0, kernel_release.find('.'));
    int major = 0;
    try {
        std::size_t used = 0;
        major = std::stoi(major_s, &used);
        if (used != major_s.size()) throw std::invalid_argument(major_s);
    } catch (const std::exception&) {
        return internal::fail(err, Errc::UnknownSeries,
                              "cannot parse kernel version \"" + kernel_release + "\"");
    }
    auto it = kMacOSXSeries.find(major);
    if (it == kMacOSXSeries.end()) {
        return internal::fail(err, Errc::UnknownSeries,
                              "unknown series for darwin kernel " + std::to_string(major));
    }
    out = it->second;
    return true;
}

bool read_host_series(std::string& out, Error* err) {
    out = kUnknownSeries;
    struct utsname u{};
    if (::uname(&u) != 0) {
        return internal::fail(err, Errc::Io, "cannot determine host series: uname failed");
    }
    const std::string sysname = u.sysname;
    if (sysname == "Darwin") {
        return macos_series_from_kernel(u.release, out, err);
    }
    if (sysname != "Linux") {
        return internal::fail(err, Errc::UnknownSeries,
                              "cannot determine host series: unsupported OS " + sysname);
    }

    std::ifstream f("/etc/os-release");
    if (!f.good()) {
        out = kGenericLinuxSeries;
        return true;
    }
    std::ostringstream ss;
    ss << f.rdbuf();
    out = series_from_os_release(ss.str());
    return true;
}

bool SeriesCache::get(std::string& out, Error* err) {
    std::call_once(_once, [this] {
        if (!_reader(_series, &_error)) {
            if (_error.ok()) {
                _error = Error{Errc::UnknownSeries, "cannot determine host series"};
            }
        } else {
            _error = Error{};
        }
    });
    out = _series;
    if (!_error.ok()) {
        if (err) *err = _error;
        return false;
    }
    return true;
}

bool host_series(std::string& out, Error* err) {
    static SeriesCache cache;
    return cache.get(out, err);
}

} // namespace td
