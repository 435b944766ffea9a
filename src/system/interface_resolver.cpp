// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "interface_resolver.h"

#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>
#include <sys/stat.h>

namespace raspap {

namespace {

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t start = s.find_first_not_of(ws);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

InterfaceRoles defaults() {
    return InterfaceRoles{};
}

} // namespace

InterfaceResolver::InterfaceResolver(std::string conf_path) : conf_path_(std::move(conf_path)) {}

InterfaceRoles InterfaceResolver::parse(const std::string& content) {
    std::optional<std::string> iface;
    std::optional<std::string> ssid;
    bool in_global_section = true;

    std::istringstream stream(content);
    std::string raw;
    while (std::getline(stream, raw)) {
        std::string line = trim(raw);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        if (line.front() == '[' && line.back() == ']') {
            in_global_section = false;
            continue;
        }
        if (!in_global_section) {
            continue;
        }
        if (!iface && line.compare(0, 10, "interface=") == 0) {
            iface = trim(line.substr(10));
        } else if (!ssid && line.compare(0, 5, "ssid=") == 0) {
            ssid = line.substr(5);
        }
    }

    InterfaceRoles roles = defaults();
    if (ssid && !ssid->empty()) {
        roles.ap_ssid = ssid;
    }

    if (iface && (*iface == "wlan0" || *iface == "wlan1")) {
        roles.ap_iface = *iface;
        roles.client_iface = (*iface == "wlan0") ? "wlan1" : "wlan0";
        roles.from_config = true;
    } else if (iface) {
        spdlog::warn("[InterfaceResolver] Unsupported AP interface '{}', using defaults", *iface);
    }
    return roles;
}

InterfaceRoles InterfaceResolver::resolve() {
    std::lock_guard<std::mutex> lock(cache_mutex_);

    struct stat st {};
    if (stat(conf_path_.c_str(), &st) != 0) {
        if (!cache_valid_ || cached_.from_config) {
            spdlog::warn("[InterfaceResolver] {} not readable, using defaults (AP {}, client {})",
                         conf_path_, InterfaceRoles::DEFAULT_AP_IFACE,
                         InterfaceRoles::DEFAULT_CLIENT_IFACE);
        }
        cached_ = defaults();
        cache_valid_ = true;
        cached_mtime_ = {};
        return cached_;
    }

    if (cache_valid_ && st.st_mtim.tv_sec == cached_mtime_.tv_sec &&
        st.st_mtim.tv_nsec == cached_mtime_.tv_nsec) {
        return cached_;
    }

    std::ifstream file(conf_path_);
    if (!file.is_open()) {
        spdlog::warn("[InterfaceResolver] Cannot open {}, using defaults", conf_path_);
        cached_ = defaults();
        cache_valid_ = true;
        cached_mtime_ = st.st_mtim;
        return cached_;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    InterfaceRoles roles = parse(buffer.str());

    if (roles.from_config) {
        spdlog::info("[InterfaceResolver] AP interface: {}, client interface: {}", roles.ap_iface,
                     roles.client_iface);
    } else {
        spdlog::warn("[InterfaceResolver] Could not determine AP interface from {}, using defaults",
                     conf_path_);
    }

    cached_ = roles;
    cache_valid_ = true;
    cached_mtime_ = st.st_mtim;
    return cached_;
}

} // namespace raspap
