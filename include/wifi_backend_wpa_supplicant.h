// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "process_runner.h"
#include "wifi_backend.h"

#include <string>
#include <vector>

namespace raspap {

/**
 * @brief wpa_supplicant Wi-Fi backend driven through wpa_cli
 *
 * All wpa_cli calls are elevated: the control socket is usually root-only on
 * RaspAP images. wpa_cli exits 0 even when the supplicant answers "FAIL", so
 * every action checks the reply text as well as the exit status.
 */
class WifiBackendWpaSupplicant : public WifiBackend {
  public:
    WifiBackendWpaSupplicant(ProcessRunner& runner, const WifiBackendOptions& options);
    ~WifiBackendWpaSupplicant() override;

    const char* name() const override {
        return "wpa_cli";
    }

    std::vector<SavedNetwork> list_saved(const std::string& iface) override;

    /**
     * @brief `scan` followed by up to scan_attempts polls of `scan_results`
     *
     * The supplicant answers scan_results immediately with whatever it has,
     * which right after a fresh scan request is often nothing.
     */
    std::vector<WiFiNetwork> scan(const std::string& iface) override;

    std::optional<std::string> connected_ssid(const std::string& iface) override;

    /**
     * @brief select_network, enable_network and save_config for the SSID's id
     */
    OrchestratorError connect_saved(const std::string& iface, const std::string& ssid) override;

    /**
     * @brief disconnect, then disable every saved network so the supplicant
     * does not immediately re-associate, then save_config
     */
    OrchestratorError disconnect(const std::string& iface) override;

    // ========================================================================
    // Parsers (encapsulate wpa_supplicant ugliness)
    // ========================================================================

    /**
     * @brief Parse `list_networks` (header line, then id/ssid/bssid/flags)
     */
    static std::vector<SavedNetwork> parse_list_networks(const std::string& raw);

    /**
     * @brief Parse `scan_results` (header line, then bssid/freq/signal/flags/ssid)
     *
     * Hidden networks are skipped. Results are deduplicated by SSID.
     */
    static std::vector<WiFiNetwork> parse_scan_results(const std::string& raw);

    /**
     * @brief SSID from `status` output when wpa_state=COMPLETED
     */
    static std::optional<std::string> parse_status_ssid(const std::string& raw);

    /**
     * @brief SSIDs of `network={ ... }` blocks in wpa_supplicant.conf
     *
     * Used when wpa_cli is not installed. Quoted ssid values are unquoted;
     * unquoted (hex-encoded) values are returned as written.
     */
    static std::vector<SavedNetwork> parse_supplicant_conf(const std::string& content);

    /**
     * @brief Read and parse a wpa_supplicant.conf file; empty on any error
     */
    static std::vector<SavedNetwork> read_supplicant_conf(const std::string& path);

    /**
     * @brief Normalize RSSI: -100 dBm or weaker is 0%, -50 dBm or stronger is 100%
     */
    static int dbm_to_percentage(int dbm);

    static std::vector<std::string> split_by_tabs(const std::string& str);

  private:
    ProcessRunner& runner_;
    WifiBackendOptions options_;

    ProcessResult wpa_cli(const std::string& iface, std::vector<std::string> args);

    /**
     * @brief Run an action and require an "OK" reply
     */
    OrchestratorError wpa_action(const std::string& iface, std::vector<std::string> args);
};

} // namespace raspap
