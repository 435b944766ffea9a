// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "wifi_backend_networkmanager.h"

#include "spdlog/spdlog.h"

#include <algorithm>
#include <cstdio>
#include <sstream>

namespace raspap {

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

} // namespace

// ============================================================================
// Lifecycle
// ============================================================================

WifiBackendNetworkManager::WifiBackendNetworkManager(ProcessRunner& runner,
                                                     const WifiBackendOptions& options)
    : runner_(runner), options_(options) {
    spdlog::debug("[WifiBackend] Initialized (NetworkManager mode)");
}

WifiBackendNetworkManager::~WifiBackendNetworkManager() {
    // Use fprintf - spdlog may be destroyed during static cleanup
    fprintf(stderr, "[WifiBackend] NetworkManager backend destroyed\n");
}

ProcessResult WifiBackendNetworkManager::exec_nmcli(std::vector<std::string> args, bool elevated) {
    return exec_nmcli(std::move(args), elevated, options_.command_timeout);
}

ProcessResult WifiBackendNetworkManager::exec_nmcli(std::vector<std::string> args, bool elevated,
                                                    std::chrono::milliseconds timeout) {
    Command cmd("nmcli", std::move(args), elevated, timeout);
    ProcessResult result = runner_.run(cmd);
    if (!result.ok()) {
        spdlog::trace("[WifiBackend] NM: '{}' failed: {}", cmd.to_string(),
                      result.error.technical_msg);
    }
    return result;
}

// ============================================================================
// Saved connections
// ============================================================================

std::vector<SavedNetwork> WifiBackendNetworkManager::list_saved(const std::string& iface) {
    (void)iface; // NM connection profiles are not bound to one device
    std::vector<SavedNetwork> saved;

    ProcessResult list = exec_nmcli({"-t", "-f", "NAME,TYPE", "connection", "show"});
    if (!list.ok()) {
        return saved;
    }

    for (const auto& conn_name : parse_wifi_connections(list.out)) {
        // The profile name is often not the SSID ("preconfigured", "Home 2")
        ProcessResult ssid_res =
            exec_nmcli({"-s", "-g", "802-11-wireless.ssid", "connection", "show", conn_name});
        if (!ssid_res.ok()) {
            continue;
        }
        std::string ssid = trim(ssid_res.out);
        if (ssid.empty()) {
            continue;
        }
        saved.push_back({conn_name, ssid});
    }

    spdlog::debug("[WifiBackend] NM: {} saved Wi-Fi connections", saved.size());
    return saved;
}

std::vector<std::string> WifiBackendNetworkManager::parse_wifi_connections(const std::string& output) {
    std::vector<std::string> names;
    std::istringstream stream(output);
    std::string line;

    while (std::getline(stream, line)) {
        if (line.empty()) {
            continue;
        }
        auto fields = split_nmcli_fields(line);
        if (fields.size() < 2 || fields[0].empty()) {
            continue;
        }
        const std::string& type = fields[fields.size() - 1];
        if (type == "802-11-wireless" || type == "wifi") {
            names.push_back(fields[0]);
        }
    }
    return names;
}

// ============================================================================
// Scanning
// ============================================================================

std::vector<WiFiNetwork> WifiBackendNetworkManager::scan(const std::string& iface) {
    // Request a rescan. NM rate-limits these and refuses while one is running,
    // which still leaves a usable cached listing.
    ProcessResult rescan = exec_nmcli({"device", "wifi", "rescan", "ifname", iface});
    if (!rescan.ok()) {
        spdlog::debug("[WifiBackend] NM: rescan on {} not accepted: {}", iface,
                      rescan.error.technical_msg);
    }

    ProcessResult list = exec_nmcli(
        {"-t", "-f", "IN-USE,SSID,SIGNAL,SECURITY", "device", "wifi", "list", "ifname", iface});
    if (!list.ok()) {
        return {};
    }
    return parse_scan_output(list.out);
}

std::optional<std::string> WifiBackendNetworkManager::connected_ssid(const std::string& iface) {
    ProcessResult list = exec_nmcli({"-t", "-f", "IN-USE,SSID,SIGNAL,SECURITY", "device", "wifi",
                                     "list", "ifname", iface, "--rescan", "no"});
    if (!list.ok()) {
        return std::nullopt;
    }
    return parse_active_ssid(list.out);
}

// ============================================================================
// Parsing
// ============================================================================

std::vector<std::string> WifiBackendNetworkManager::split_nmcli_fields(const std::string& line) {
    std::vector<std::string> fields;
    std::string current;

    for (size_t i = 0; i < line.size(); ++i) {
        if (line[i] == '\\' && i + 1 < line.size()) {
            char next = line[i + 1];
            if (next == ':') {
                // Escaped colon - literal ':'
                current += ':';
                ++i;
            } else if (next == '\\') {
                // Escaped backslash - literal '\'
                current += '\\';
                ++i;
            } else {
                current += line[i];
            }
        } else if (line[i] == ':') {
            fields.push_back(current);
            current.clear();
        } else if (line[i] != '\r') {
            current += line[i];
        }
    }

    fields.push_back(current);
    return fields;
}

std::vector<WiFiNetwork> WifiBackendNetworkManager::parse_scan_output(const std::string& output) {
    std::vector<WiFiNetwork> networks;
    if (output.empty()) {
        return networks;
    }

    std::istringstream stream(output);
    std::string line;

    while (std::getline(stream, line)) {
        if (line.empty()) {
            continue;
        }

        // Format: IN-USE:SSID:SIGNAL:SECURITY, IN-USE is " " or "*"
        auto fields = split_nmcli_fields(line);
        if (fields.size() < 4) {
            spdlog::trace("[WifiBackend] NM: Skipping malformed scan line ({} fields): {}",
                          fields.size(), line);
            continue;
        }

        const std::string& ssid = fields[1];
        const std::string& signal_str = fields[2];
        const std::string& security = fields[3];

        // Skip hidden networks (empty SSID)
        if (ssid.empty()) {
            continue;
        }

        // nmcli reports 0-100 percentage directly
        int signal = 0;
        try {
            signal = std::stoi(signal_str);
        } catch (const std::exception&) {
            spdlog::trace("[WifiBackend] NM: Invalid signal '{}' for SSID '{}'", signal_str, ssid);
            continue;
        }
        signal = std::max(0, std::min(100, signal));

        bool is_secured = false;
        std::string security_type = "Open";
        if (!security.empty() && security != "--") {
            security_type = detect_security_type(security, is_secured);
            if (!is_secured) {
                // Unknown but non-empty security
                is_secured = true;
                security_type = security;
            }
        }

        networks.emplace_back(ssid, signal, is_secured, security_type);
    }

    networks = deduplicate_by_ssid(networks);
    spdlog::debug("[WifiBackend] NM: Parsed {} networks from scan output", networks.size());
    return networks;
}

std::optional<std::string> WifiBackendNetworkManager::parse_active_ssid(const std::string& output) {
    std::istringstream stream(output);
    std::string line;
    while (std::getline(stream, line)) {
        auto fields = split_nmcli_fields(line);
        if (fields.size() >= 2 && fields[0] == "*" && !fields[1].empty()) {
            return fields[1];
        }
    }
    return std::nullopt;
}

// ============================================================================
// Connection Management
// ============================================================================

OrchestratorError WifiBackendNetworkManager::connect_saved(const std::string& iface,
                                                           const std::string& ssid) {
    OrchestratorError valid = validate_ssid(ssid);
    if (!valid.success()) {
        return valid;
    }

    spdlog::info("[WifiBackend] NM: Connecting {} to '{}'", iface, ssid);
    ProcessResult res = exec_nmcli({"device", "wifi", "connect", ssid, "ifname", iface}, true,
                                   options_.connect_timeout);
    if (!res.ok()) {
        spdlog::warn("[WifiBackend] NM: Connection to '{}' failed: {}", ssid,
                     res.error.technical_msg);
        return res.error;
    }

    spdlog::info("[WifiBackend] NM: Connected to '{}'", ssid);
    return ErrorHelper::success();
}

OrchestratorError WifiBackendNetworkManager::disconnect(const std::string& iface) {
    spdlog::info("[WifiBackend] NM: Disconnecting {}", iface);

    // nmcli reports an error when the device is already disconnected
    ProcessResult res = exec_nmcli({"device", "disconnect", iface}, true);
    if (!res.ok()) {
        spdlog::debug("[WifiBackend] NM: Disconnect result: {}", res.error.technical_msg);
        return res.error;
    }
    return ErrorHelper::success();
}

} // namespace raspap
