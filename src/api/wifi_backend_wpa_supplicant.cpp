// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "wifi_backend_wpa_supplicant.h"

#include "spdlog/spdlog.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <thread>

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

WifiBackendWpaSupplicant::WifiBackendWpaSupplicant(ProcessRunner& runner,
                                                   const WifiBackendOptions& options)
    : runner_(runner), options_(options) {
    spdlog::debug("[WifiBackend] Initialized (wpa_supplicant mode)");
}

WifiBackendWpaSupplicant::~WifiBackendWpaSupplicant() {
    // Use fprintf - spdlog may be destroyed during static cleanup
    fprintf(stderr, "[WifiBackend] wpa_supplicant backend destroyed\n");
}

// ============================================================================
// Command helpers
// ============================================================================

ProcessResult WifiBackendWpaSupplicant::wpa_cli(const std::string& iface,
                                                std::vector<std::string> args) {
    std::vector<std::string> full = {"-i", iface};
    full.insert(full.end(), args.begin(), args.end());
    Command cmd("wpa_cli", std::move(full), true, options_.command_timeout);

    ProcessResult result = runner_.run(cmd);
    if (!result.ok()) {
        spdlog::trace("[WifiBackend] wpa: '{}' failed: {}", cmd.to_string(),
                      result.error.technical_msg);
    }
    return result;
}

OrchestratorError WifiBackendWpaSupplicant::wpa_action(const std::string& iface,
                                                       std::vector<std::string> args) {
    std::string what = args.empty() ? "" : args[0];
    ProcessResult res = wpa_cli(iface, std::move(args));
    if (!res.ok()) {
        return res.error;
    }
    std::string reply = trim(res.out);
    if (reply.find("FAIL") != std::string::npos) {
        return OrchestratorError(ErrorCode::TOOL_FAILED, "wpa_cli " + what + " replied " + reply,
                                 "Wi-Fi command failed", "Check WiFi interface status");
    }
    return ErrorHelper::success();
}

// ============================================================================
// Queries
// ============================================================================

std::vector<SavedNetwork> WifiBackendWpaSupplicant::list_saved(const std::string& iface) {
    ProcessResult res = wpa_cli(iface, {"list_networks"});
    if (!res.ok()) {
        return {};
    }
    auto saved = parse_list_networks(res.out);
    spdlog::debug("[WifiBackend] wpa: {} saved networks on {}", saved.size(), iface);
    return saved;
}

std::vector<WiFiNetwork> WifiBackendWpaSupplicant::scan(const std::string& iface) {
    OrchestratorError trigger = wpa_action(iface, {"scan"});
    if (!trigger.success()) {
        // FAIL-BUSY when a scan is already running; results are still worth reading
        spdlog::debug("[WifiBackend] wpa: scan request on {}: {}", iface, trigger.technical_msg);
        if (trigger.code != ErrorCode::TOOL_FAILED) {
            return {};
        }
    }

    std::vector<WiFiNetwork> networks;
    for (int attempt = 1; attempt <= options_.scan_attempts; ++attempt) {
        ProcessResult res = wpa_cli(iface, {"scan_results"});
        if (!res.ok()) {
            return {};
        }
        networks = parse_scan_results(res.out);
        if (!networks.empty()) {
            break;
        }
        if (attempt < options_.scan_attempts) {
            spdlog::trace("[WifiBackend] wpa: no results yet (attempt {}/{})", attempt,
                          options_.scan_attempts);
            std::this_thread::sleep_for(options_.scan_retry_delay);
        }
    }
    return networks;
}

std::optional<std::string> WifiBackendWpaSupplicant::connected_ssid(const std::string& iface) {
    ProcessResult res = wpa_cli(iface, {"status"});
    if (!res.ok()) {
        return std::nullopt;
    }
    return parse_status_ssid(res.out);
}

// ============================================================================
// Actions
// ============================================================================

OrchestratorError WifiBackendWpaSupplicant::connect_saved(const std::string& iface,
                                                          const std::string& ssid) {
    OrchestratorError valid = validate_ssid(ssid);
    if (!valid.success()) {
        return valid;
    }

    ProcessResult list = wpa_cli(iface, {"list_networks"});
    if (!list.ok()) {
        return list.error;
    }

    std::string network_id;
    for (const auto& net : parse_list_networks(list.out)) {
        if (net.ssid == ssid) {
            network_id = net.id;
            break;
        }
    }
    if (network_id.empty()) {
        spdlog::debug("[WifiBackend] wpa: '{}' is not saved on {}", ssid, iface);
        return OrchestratorError(ErrorCode::INVALID_PARAMETERS,
                                 "No supplicant network for SSID " + ssid,
                                 "Network '" + ssid + "' is not saved");
    }

    spdlog::info("[WifiBackend] wpa: Selecting network {} ('{}') on {}", network_id, ssid, iface);
    for (const char* step : {"select_network", "enable_network"}) {
        OrchestratorError err = wpa_action(iface, {step, network_id});
        if (!err.success()) {
            spdlog::warn("[WifiBackend] wpa: {} {} failed: {}", step, network_id,
                         err.technical_msg);
            return err;
        }
    }

    OrchestratorError saved = wpa_action(iface, {"save_config"});
    if (!saved.success()) {
        // Association already requested; only persistence failed
        spdlog::warn("[WifiBackend] wpa: save_config failed: {}", saved.technical_msg);
    }
    return ErrorHelper::success();
}

OrchestratorError WifiBackendWpaSupplicant::disconnect(const std::string& iface) {
    spdlog::info("[WifiBackend] wpa: Disconnecting {}", iface);

    OrchestratorError result = wpa_action(iface, {"disconnect"});
    if (!result.success()) {
        spdlog::warn("[WifiBackend] wpa: disconnect failed: {}", result.technical_msg);
    }

    ProcessResult list = wpa_cli(iface, {"list_networks"});
    if (list.ok()) {
        for (const auto& net : parse_list_networks(list.out)) {
            OrchestratorError err = wpa_action(iface, {"disable_network", net.id});
            if (!err.success()) {
                spdlog::debug("[WifiBackend] wpa: disable_network {} failed: {}", net.id,
                              err.technical_msg);
            }
        }
    }

    OrchestratorError saved = wpa_action(iface, {"save_config"});
    if (!saved.success()) {
        spdlog::warn("[WifiBackend] wpa: save_config failed: {}", saved.technical_msg);
    }
    return result;
}

// ============================================================================
// Parsers
// ============================================================================

std::vector<SavedNetwork> WifiBackendWpaSupplicant::parse_list_networks(const std::string& raw) {
    std::vector<SavedNetwork> saved;
    std::istringstream stream(raw);
    std::string line;
    bool skip_header = true;

    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (skip_header) {
            // "network id / ssid / bssid / flags", possibly after a
            // "Selected interface 'wlan0'" banner
            if (line.compare(0, 10, "network id") == 0) {
                skip_header = false;
            }
            continue;
        }
        if (line.empty()) {
            continue;
        }

        auto fields = split_by_tabs(line);
        if (fields.size() < 2 || fields[0].empty() || fields[1].empty()) {
            spdlog::trace("[WifiBackend] wpa: Skipping malformed network line: {}", line);
            continue;
        }
        bool numeric_id = std::all_of(fields[0].begin(), fields[0].end(),
                                      [](unsigned char c) { return std::isdigit(c); });
        if (!numeric_id) {
            continue;
        }
        saved.push_back({fields[0], fields[1]});
    }
    return saved;
}

std::vector<WiFiNetwork> WifiBackendWpaSupplicant::parse_scan_results(const std::string& raw) {
    std::vector<WiFiNetwork> networks;

    if (raw.empty()) {
        return networks;
    }

    std::istringstream stream(raw);
    std::string line;
    bool skip_header = true;

    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (skip_header) {
            // Skip "bssid / frequency / signal level / flags / ssid"
            if (line.compare(0, 5, "bssid") == 0) {
                skip_header = false;
            }
            continue;
        }

        if (line.empty())
            continue;

        // Parse tab-separated fields: BSSID\tfreq\tsignal\tflags\tSSID
        // Note: Hidden networks may have only 4 fields (SSID completely absent)
        std::vector<std::string> fields = split_by_tabs(line);
        if (fields.size() < 4) {
            spdlog::trace("[WifiBackend] wpa: Skipping malformed scan line ({} fields): {}",
                          fields.size(), line);
            continue;
        }

        const std::string& bssid = fields[0];
        const std::string& signal_str = fields[2];
        const std::string& flags = fields[3];
        std::string ssid = (fields.size() >= 5) ? fields[4] : "";

        if (ssid.empty()) {
            spdlog::trace("[WifiBackend] wpa: Skipping hidden network: {}", bssid);
            continue;
        }

        int signal_dbm = 0;
        try {
            signal_dbm = std::stoi(signal_str);
        } catch (const std::exception& e) {
            spdlog::debug("[WifiBackend] wpa: Invalid signal strength '{}': {}", signal_str,
                          e.what());
            continue;
        }

        int signal_percent = dbm_to_percentage(signal_dbm);
        bool is_secured = false;
        std::string security_type = detect_security_type(flags, is_secured);
        networks.emplace_back(ssid, signal_percent, is_secured, security_type);

        spdlog::trace("[WifiBackend] wpa: Parsed network: '{}' {}% {} {}", ssid, signal_percent,
                      security_type, bssid);
    }

    return deduplicate_by_ssid(networks);
}

std::optional<std::string> WifiBackendWpaSupplicant::parse_status_ssid(const std::string& raw) {
    std::istringstream stream(raw);
    std::string line;
    bool completed = false;
    std::string ssid;

    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos)
            continue;

        std::string key = line.substr(0, eq_pos);
        std::string value = line.substr(eq_pos + 1);
        if (key == "wpa_state") {
            completed = (value == "COMPLETED");
        } else if (key == "ssid") {
            ssid = value;
        }
    }

    if (completed && !ssid.empty()) {
        return ssid;
    }
    return std::nullopt;
}

std::vector<SavedNetwork> WifiBackendWpaSupplicant::parse_supplicant_conf(const std::string& content) {
    std::vector<SavedNetwork> saved;
    std::istringstream stream(content);
    std::string raw;
    bool in_block = false;
    int index = 0;

    while (std::getline(stream, raw)) {
        std::string line = trim(raw);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        if (!in_block) {
            if (line.compare(0, 8, "network=") == 0 && line.find('{') != std::string::npos) {
                in_block = true;
            }
            continue;
        }
        if (line == "}") {
            in_block = false;
            ++index;
            continue;
        }
        if (line.compare(0, 5, "ssid=") == 0) {
            std::string value = line.substr(5);
            if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
                value = value.substr(1, value.size() - 2);
            }
            // Unquoted values (hex-encoded SSIDs) are kept as written
            if (!value.empty()) {
                saved.push_back({std::to_string(index), value});
            }
        }
    }
    return saved;
}

std::vector<SavedNetwork> WifiBackendWpaSupplicant::read_supplicant_conf(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        spdlog::debug("[WifiBackend] wpa: Cannot read {}", path);
        return {};
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse_supplicant_conf(buffer.str());
}

std::vector<std::string> WifiBackendWpaSupplicant::split_by_tabs(const std::string& str) {
    std::vector<std::string> parts;
    std::stringstream ss(str);
    std::string part;
    while (std::getline(ss, part, '\t')) {
        parts.push_back(part);
    }
    return parts;
}

int WifiBackendWpaSupplicant::dbm_to_percentage(int dbm) {
    return std::max(0, std::min(100, 2 * (dbm + 100)));
}

} // namespace raspap
