// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "orchestrator_error.h"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace raspap {

class ProcessRunner;

/**
 * @brief One network seen by a single backend's scan
 */
struct WiFiNetwork {
    std::string ssid;          ///< Network name (SSID)
    int signal_strength;       ///< Signal strength (0-100 percentage)
    bool is_secured;           ///< True if network requires password
    std::string security_type; ///< Security type ("WPA2", "WPA3", "WEP", "Open")

    WiFiNetwork() : signal_strength(0), is_secured(false) {}

    WiFiNetwork(const std::string& ssid_, int strength, bool secured,
                const std::string& security = "")
        : ssid(ssid_), signal_strength(strength), is_secured(secured), security_type(security) {}
};

/**
 * @brief A stored network profile
 *
 * `id` is the supplicant network id or the NetworkManager connection name,
 * whichever the owning backend needs to act on it.
 */
struct SavedNetwork {
    std::string id;
    std::string ssid;
};

/**
 * @brief Merged per-SSID view shown in the network list
 */
struct ScanEntry {
    std::string ssid;
    int signal = 0;        ///< 0-100, 0 when not in range
    bool saved = false;    ///< A profile exists for this SSID
    bool in_range = false; ///< Seen by at least one live scan
    std::string security;  ///< Security type of the strongest sighting

    bool operator==(const ScanEntry& o) const {
        return ssid == o.ssid && signal == o.signal && saved == o.saved &&
               in_range == o.in_range && security == o.security;
    }
};

/**
 * @brief Result of one Wi-Fi read on the client interface
 */
struct WifiState {
    std::optional<std::string> connected_ssid;
    std::vector<ScanEntry> entries;
    bool available = true; ///< false when no scan tool exists on this system
};

/**
 * @brief Which Wi-Fi tools this system has, probed once at startup
 */
struct WifiCapabilities {
    bool has_nmcli = false;
    bool has_wpa_cli = false;

    bool any() const {
        return has_nmcli || has_wpa_cli;
    }

    static WifiCapabilities detect(ProcessRunner& runner);
};

/**
 * @brief Tunables shared by the command-line backends
 */
struct WifiBackendOptions {
    std::chrono::milliseconds command_timeout{10000};
    std::chrono::milliseconds connect_timeout{35000};
    int scan_attempts = 4;                             ///< wpa_cli scan_results polls
    std::chrono::milliseconds scan_retry_delay{800};   ///< Pause between polls
    std::string wpa_supplicant_conf = "/etc/wpa_supplicant/wpa_supplicant.conf";
};

/**
 * @brief Abstract Wi-Fi tool backend
 *
 * Each backend wraps one command-line tool and contributes its own view of
 * saved profiles, live scan results and the active SSID. WifiManager merges
 * the contributions. Backends are stateless between calls apart from their
 * options, and every query degrades to an empty result instead of failing:
 * a tool that errors simply contributes nothing.
 *
 * - WifiBackendNetworkManager: nmcli
 * - WifiBackendWpaSupplicant: wpa_cli
 */
class WifiBackend {
  public:
    virtual ~WifiBackend() = default;

    /// Short name for log messages ("nmcli", "wpa_cli")
    virtual const char* name() const = 0;

    // ========================================================================
    // Queries
    // ========================================================================

    /**
     * @brief Profiles this tool knows about for the interface
     */
    virtual std::vector<SavedNetwork> list_saved(const std::string& iface) = 0;

    /**
     * @brief Trigger a scan and return its results
     *
     * Hidden networks are dropped, and duplicate SSIDs (mesh systems, dual
     * band APs) collapse to the strongest sighting.
     */
    virtual std::vector<WiFiNetwork> scan(const std::string& iface) = 0;

    /**
     * @brief SSID the interface is associated with, if this tool can tell
     */
    virtual std::optional<std::string> connected_ssid(const std::string& iface) = 0;

    // ========================================================================
    // Actions
    // ========================================================================

    /**
     * @brief Activate an already saved profile
     */
    virtual OrchestratorError connect_saved(const std::string& iface, const std::string& ssid) = 0;

    /**
     * @brief Drop the current association
     */
    virtual OrchestratorError disconnect(const std::string& iface) = 0;

    // ========================================================================
    // Factory
    // ========================================================================

    /**
     * @brief Create every backend the capability probe found
     *
     * NetworkManager comes first: its answers win where the two disagree.
     */
    static std::vector<std::unique_ptr<WifiBackend>> create(ProcessRunner& runner,
                                                            const WifiCapabilities& caps,
                                                            const WifiBackendOptions& options);

    // ========================================================================
    // Shared helpers
    // ========================================================================

    /**
     * @brief Keep the strongest entry per SSID
     */
    static std::vector<WiFiNetwork> deduplicate_by_ssid(const std::vector<WiFiNetwork>& networks);

    /**
     * @brief Map a security flags string to (secured, label)
     */
    static std::string detect_security_type(const std::string& flags, bool& is_secured);

    /**
     * @brief Reject empty, overlong and control-character input
     */
    static OrchestratorError validate_ssid(const std::string& ssid);
};

} // namespace raspap
