// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
/**
 * @file wifi_manager.cpp
 * @brief Merges Wi-Fi backends into one view of the client interface
 *
 * @threading read_state() runs on the scheduler thread, actions on the action worker
 * @gotchas Scans on one interface hold a per-interface mutex for their whole duration
 *
 * @see wifi_backend.cpp
 */

#include "wifi_manager.h"

#include "spdlog/spdlog.h"
#include "wifi_backend_wpa_supplicant.h"

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <iterator>
#include <unordered_map>

namespace raspap {

// ============================================================================
// Constructor / Destructor
// ============================================================================

WifiManager::WifiManager(ProcessRunner& runner, const WifiCapabilities& caps,
                         const WifiBackendOptions& options, bool show_unsaved)
    : runner_(runner), caps_(caps), options_(options), show_unsaved_(show_unsaved) {
    backends_ = WifiBackend::create(runner_, caps_, options_);
    spdlog::debug("[WifiManager] Initialized with {} backend(s), show_unsaved={}",
                  backends_.size(), show_unsaved_);
}

WifiManager::~WifiManager() {
    // Use fprintf - spdlog may be destroyed during static cleanup
    fprintf(stderr, "[WifiManager] Destructor called\n");
}

std::mutex& WifiManager::lock_for(const std::string& iface) {
    std::lock_guard<std::mutex> lock(iface_locks_mutex_);
    auto& slot = iface_locks_[iface];
    if (!slot) {
        slot = std::make_unique<std::mutex>();
    }
    return *slot;
}

WifiBackend* WifiManager::backend_named(const char* name) const {
    for (const auto& backend : backends_) {
        if (std::strcmp(backend->name(), name) == 0) {
            return backend.get();
        }
    }
    return nullptr;
}

// ============================================================================
// State reading
// ============================================================================

std::set<std::string> WifiManager::collect_saved(const std::string& iface) {
    std::set<std::string> saved;
    for (const auto& backend : backends_) {
        for (const auto& net : backend->list_saved(iface)) {
            saved.insert(net.ssid);
        }
    }

    if (!caps_.has_wpa_cli) {
        for (const auto& net :
             WifiBackendWpaSupplicant::read_supplicant_conf(options_.wpa_supplicant_conf)) {
            saved.insert(net.ssid);
        }
    }
    return saved;
}

WifiState WifiManager::read_state(const InterfaceRoles& roles) {
    WifiState state;
    if (!caps_.any()) {
        state.available = false;
        return state;
    }

    const std::string& iface = roles.client_iface;
    std::lock_guard<std::mutex> iface_lock(lock_for(iface));

    std::set<std::string> saved = collect_saved(iface);

    std::vector<std::vector<WiFiNetwork>> scans;
    scans.reserve(backends_.size());
    for (const auto& backend : backends_) {
        scans.push_back(backend->scan(iface));
        spdlog::trace("[WifiManager] {} saw {} networks on {}", backend->name(),
                      scans.back().size(), iface);
    }

    for (const auto& backend : backends_) {
        auto ssid = backend->connected_ssid(iface);
        if (ssid) {
            state.connected_ssid = ssid;
            break;
        }
    }

    state.entries = merge_entries(saved, scans, show_unsaved_);
    spdlog::debug("[WifiManager] {}: {} saved, {} listed, connected={}", iface, saved.size(),
                  state.entries.size(), state.connected_ssid.value_or("<none>"));
    return state;
}

std::vector<ScanEntry> WifiManager::merge_entries(const std::set<std::string>& saved,
                                                  const std::vector<std::vector<WiFiNetwork>>& scans,
                                                  bool show_unsaved) {
    // Strongest sighting per SSID across all sources
    std::unordered_map<std::string, WiFiNetwork> best;
    for (const auto& scan : scans) {
        for (const auto& net : scan) {
            auto it = best.find(net.ssid);
            if (it == best.end()) {
                best.emplace(net.ssid, net);
            } else if (net.signal_strength > it->second.signal_strength) {
                it->second = net;
            }
        }
    }

    std::vector<ScanEntry> saved_in_range;
    std::vector<ScanEntry> unsaved_in_range;
    std::vector<ScanEntry> out_of_range;

    for (const auto& [ssid, net] : best) {
        ScanEntry entry;
        entry.ssid = ssid;
        entry.signal = net.signal_strength;
        entry.in_range = true;
        entry.security = net.security_type;
        entry.saved = saved.count(ssid) > 0;
        if (entry.saved) {
            saved_in_range.push_back(std::move(entry));
        } else if (show_unsaved) {
            unsaved_in_range.push_back(std::move(entry));
        }
    }

    for (const auto& ssid : saved) {
        if (best.count(ssid) == 0) {
            ScanEntry entry;
            entry.ssid = ssid;
            entry.saved = true;
            out_of_range.push_back(std::move(entry));
        }
    }

    auto by_signal = [](const ScanEntry& a, const ScanEntry& b) {
        if (a.signal != b.signal) {
            return a.signal > b.signal;
        }
        return a.ssid < b.ssid;
    };
    std::sort(saved_in_range.begin(), saved_in_range.end(), by_signal);
    std::sort(unsaved_in_range.begin(), unsaved_in_range.end(), by_signal);
    // out_of_range is already in SSID order (std::set iteration)

    std::vector<ScanEntry> merged;
    merged.reserve(saved_in_range.size() + unsaved_in_range.size() + out_of_range.size());
    for (auto* group : {&saved_in_range, &unsaved_in_range, &out_of_range}) {
        std::move(group->begin(), group->end(), std::back_inserter(merged));
    }
    return merged;
}

// ============================================================================
// Actions
// ============================================================================

OrchestratorError WifiManager::connect_saved(const std::string& iface, const std::string& ssid) {
    OrchestratorError valid = WifiBackend::validate_ssid(ssid);
    if (!valid.success()) {
        spdlog::warn("[WifiManager] Refusing connect: {}", valid.technical_msg);
        return valid;
    }
    if (!caps_.any()) {
        return ErrorHelper::tool_unavailable("nmcli/wpa_cli");
    }

    std::lock_guard<std::mutex> iface_lock(lock_for(iface));
    spdlog::info("[WifiManager] Connecting {} to saved network '{}'", iface, ssid);

    OrchestratorError result = ErrorHelper::tool_unavailable("wpa_cli");
    if (WifiBackend* wpa = backend_named("wpa_cli")) {
        result = wpa->connect_saved(iface, ssid);
        if (result.success()) {
            return result;
        }
        spdlog::debug("[WifiManager] Supplicant connect failed ({}), trying nmcli",
                      result.technical_msg);
    }

    if (WifiBackend* nm = backend_named("nmcli")) {
        result = nm->connect_saved(iface, ssid);
    }

    if (!result.success()) {
        spdlog::warn("[WifiManager] Connect to '{}' failed: {}", ssid, result.technical_msg);
    }
    return result;
}

OrchestratorError WifiManager::disconnect(const std::string& iface) {
    if (!caps_.any()) {
        return ErrorHelper::tool_unavailable("nmcli/wpa_cli");
    }

    std::lock_guard<std::mutex> iface_lock(lock_for(iface));
    spdlog::info("[WifiManager] Disconnecting {}", iface);

    WifiBackend* backend = backend_named("nmcli");
    if (!backend) {
        backend = backend_named("wpa_cli");
    }
    OrchestratorError result = backend->disconnect(iface);

    // Drop the leftover DHCP lease so the UI stops showing a stale IP
    ProcessResult flush = runner_.run(
        Command("ip", {"addr", "flush", "dev", iface}, true, options_.command_timeout));
    if (!flush.ok()) {
        spdlog::warn("[WifiManager] Address flush on {} failed: {}", iface,
                     flush.error.technical_msg);
    }
    return result;
}

} // namespace raspap
