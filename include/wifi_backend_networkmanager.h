// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "process_runner.h"
#include "wifi_backend.h"

#include <string>
#include <vector>

namespace raspap {

/**
 * @brief NetworkManager Wi-Fi backend using the nmcli command-line interface
 *
 * Uses `nmcli -t` (terse) for stable, machine-parseable output. Every call
 * goes through the ProcessRunner as an argument vector, so SSIDs never pass
 * through a shell.
 *
 * @see wifi_backend_wpa_supplicant.h
 */
class WifiBackendNetworkManager : public WifiBackend {

  public:
    WifiBackendNetworkManager(ProcessRunner& runner, const WifiBackendOptions& options);
    ~WifiBackendNetworkManager() override;

    const char* name() const override {
        return "nmcli";
    }

    std::vector<SavedNetwork> list_saved(const std::string& iface) override;
    std::vector<WiFiNetwork> scan(const std::string& iface) override;
    std::optional<std::string> connected_ssid(const std::string& iface) override;

    OrchestratorError connect_saved(const std::string& iface, const std::string& ssid) override;
    OrchestratorError disconnect(const std::string& iface) override;

    /**
     * @brief Parse a single nmcli terse-mode line, respecting escaped colons
     *
     * nmcli -t uses ':' as field separator but escapes literal colons as '\:'.
     * This splits correctly on unescaped colons only.
     *
     * @param line Single line of nmcli -t output
     * @return Vector of unescaped field values
     */
    static std::vector<std::string> split_nmcli_fields(const std::string& line);

    /**
     * @brief Parse `nmcli -t -f IN-USE,SSID,SIGNAL,SECURITY device wifi list`
     *
     * Handles escaped colons in SSIDs, hidden networks and malformed lines.
     * Results are deduplicated by SSID.
     */
    static std::vector<WiFiNetwork> parse_scan_output(const std::string& output);

    /**
     * @brief Find the IN-USE ('*') row of the same scan listing
     */
    static std::optional<std::string> parse_active_ssid(const std::string& output);

    /**
     * @brief Wi-Fi connection names from `nmcli -t -f NAME,TYPE connection show`
     */
    static std::vector<std::string> parse_wifi_connections(const std::string& output);

  private:
    ProcessRunner& runner_;
    WifiBackendOptions options_;

    /**
     * @brief Run nmcli with the given arguments
     * @return Result; callers treat any failure as "no contribution"
     */
    ProcessResult exec_nmcli(std::vector<std::string> args, bool elevated = false);
    ProcessResult exec_nmcli(std::vector<std::string> args, bool elevated,
                             std::chrono::milliseconds timeout);
};

} // namespace raspap
