// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "wifi_backend.h"

#include "process_runner.h"
#include "spdlog/spdlog.h"
#include "wifi_backend_networkmanager.h"
#include "wifi_backend_wpa_supplicant.h"

#include <unordered_map>

namespace raspap {

WifiCapabilities WifiCapabilities::detect(ProcessRunner& runner) {
    WifiCapabilities caps;
    caps.has_nmcli = runner.has_command("nmcli");
    caps.has_wpa_cli = runner.has_command("wpa_cli");

    spdlog::info("[WifiBackend] Capabilities: nmcli={} wpa_cli={}", caps.has_nmcli,
                 caps.has_wpa_cli);
    if (!caps.any()) {
        spdlog::warn("[WifiBackend] Neither nmcli nor wpa_cli found - Wi-Fi list unavailable");
    }
    return caps;
}

std::vector<std::unique_ptr<WifiBackend>>
WifiBackend::create(ProcessRunner& runner, const WifiCapabilities& caps,
                    const WifiBackendOptions& options) {
    std::vector<std::unique_ptr<WifiBackend>> backends;

    if (caps.has_nmcli) {
        backends.push_back(std::make_unique<WifiBackendNetworkManager>(runner, options));
        spdlog::debug("[WifiBackend] NetworkManager backend enabled");
    }
    if (caps.has_wpa_cli) {
        backends.push_back(std::make_unique<WifiBackendWpaSupplicant>(runner, options));
        spdlog::debug("[WifiBackend] wpa_supplicant backend enabled");
    }
    return backends;
}

// Deduplicate networks by SSID, keeping the strongest signal for each.
// In mesh WiFi systems, multiple APs broadcast the same SSID - show only the best one.
std::vector<WiFiNetwork> WifiBackend::deduplicate_by_ssid(const std::vector<WiFiNetwork>& networks) {
    std::unordered_map<std::string, size_t> best_index_by_ssid;
    std::vector<std::string> order;

    for (size_t i = 0; i < networks.size(); ++i) {
        const auto& net = networks[i];
        auto it = best_index_by_ssid.find(net.ssid);
        if (it == best_index_by_ssid.end()) {
            best_index_by_ssid[net.ssid] = i;
            order.push_back(net.ssid);
        } else if (net.signal_strength > networks[it->second].signal_strength) {
            it->second = i;
        }
    }

    std::vector<WiFiNetwork> result;
    result.reserve(order.size());
    for (const auto& ssid : order) {
        result.push_back(networks[best_index_by_ssid[ssid]]);
    }

    if (result.size() < networks.size()) {
        spdlog::debug("[WifiBackend] Deduplicated {} networks to {} unique SSIDs", networks.size(),
                      result.size());
    }
    return result;
}

std::string WifiBackend::detect_security_type(const std::string& flags, bool& is_secured) {
    if (flags.find("WPA3") != std::string::npos || flags.find("SAE") != std::string::npos) {
        is_secured = true;
        return "WPA3";
    }
    if (flags.find("WPA2") != std::string::npos || flags.find("RSN") != std::string::npos) {
        is_secured = true;
        return "WPA2";
    }
    if (flags.find("WPA") != std::string::npos) {
        is_secured = true;
        return "WPA";
    }
    if (flags.find("WEP") != std::string::npos) {
        is_secured = true;
        return "WEP";
    }
    is_secured = false;
    return "Open";
}

OrchestratorError WifiBackend::validate_ssid(const std::string& ssid) {
    // 802.11 caps SSIDs at 32 octets
    if (ssid.empty() || ssid.length() > 32) {
        return OrchestratorError(ErrorCode::INVALID_PARAMETERS,
                                 "Invalid SSID length: " + std::to_string(ssid.length()),
                                 "Invalid network name", "Check that the network name is correct");
    }
    for (char ch : ssid) {
        unsigned char c = static_cast<unsigned char>(ch);
        // Reject control chars (0x00-0x1F) and DEL (0x7F)
        if (c < 32 || c == 127) {
            return OrchestratorError(ErrorCode::INVALID_PARAMETERS,
                                     "Invalid character in SSID: ASCII " + std::to_string(c),
                                     "Invalid network name",
                                     "Check that the network name is correct");
        }
    }
    return ErrorHelper::success();
}

} // namespace raspap
