// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "interface_resolver.h"
#include "process_runner.h"
#include "wifi_backend.h"

#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace raspap {

/**
 * @brief Wi-Fi state reader and saved-network actions for the client interface
 *
 * Combines every available backend into one WifiState: saved profiles from
 * all tools, live scans from all tools, and the active SSID from whichever
 * tool can answer (NetworkManager first).
 *
 * Thread safety: read_state() and the actions may be called from different
 * threads. Work on the same interface is serialized so two scans never race
 * on one radio.
 */
class WifiManager {
  public:
    WifiManager(ProcessRunner& runner, const WifiCapabilities& caps,
                const WifiBackendOptions& options, bool show_unsaved = false);
    ~WifiManager();

    WifiManager(const WifiManager&) = delete;
    WifiManager& operator=(const WifiManager&) = delete;

    /**
     * @brief Query saved profiles, scans and the active SSID; never throws
     *
     * A failing backend contributes nothing. With no backend at all the
     * result has available == false.
     */
    WifiState read_state(const InterfaceRoles& roles);

    /**
     * @brief Switch the client interface to a saved network
     *
     * Tries the supplicant first and falls back to nmcli.
     */
    OrchestratorError connect_saved(const std::string& iface, const std::string& ssid);

    /**
     * @brief Drop the client association and flush the interface addresses
     */
    OrchestratorError disconnect(const std::string& iface);

    const WifiCapabilities& capabilities() const {
        return caps_;
    }

    /**
     * @brief Merge saved SSIDs with per-backend scan results
     *
     * Same SSID from several scans keeps the strongest signal. Saved networks
     * that no scan saw stay listed with in_range == false and signal 0.
     * Output order: saved in-range by descending signal (ties by SSID), then
     * unsaved in-range the same way (only when show_unsaved), then saved
     * out-of-range by SSID.
     */
    static std::vector<ScanEntry> merge_entries(const std::set<std::string>& saved,
                                                const std::vector<std::vector<WiFiNetwork>>& scans,
                                                bool show_unsaved);

  private:
    ProcessRunner& runner_;
    WifiCapabilities caps_;
    WifiBackendOptions options_;
    bool show_unsaved_;
    std::vector<std::unique_ptr<WifiBackend>> backends_; ///< NetworkManager first

    std::mutex iface_locks_mutex_;
    std::map<std::string, std::unique_ptr<std::mutex>> iface_locks_;

    std::mutex& lock_for(const std::string& iface);
    WifiBackend* backend_named(const char* name) const;
    std::set<std::string> collect_saved(const std::string& iface);
};

} // namespace raspap
