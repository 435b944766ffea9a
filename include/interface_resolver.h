// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <ctime>
#include <mutex>
#include <optional>
#include <string>

namespace raspap {

/**
 * @brief Which radio hosts the access point and which one connects outward
 *
 * Invariant: ap_iface != client_iface.
 */
struct InterfaceRoles {
    static constexpr const char* DEFAULT_AP_IFACE = "wlan1";
    static constexpr const char* DEFAULT_CLIENT_IFACE = "wlan0";

    std::string ap_iface = DEFAULT_AP_IFACE;
    std::string client_iface = DEFAULT_CLIENT_IFACE;
    std::optional<std::string> ap_ssid; ///< ssid= from the same file, if present
    bool from_config = false;           ///< false when the defaults were used

    bool operator==(const InterfaceRoles& o) const {
        return ap_iface == o.ap_iface && client_iface == o.client_iface && ap_ssid == o.ap_ssid;
    }
    bool operator!=(const InterfaceRoles& o) const {
        return !(*this == o);
    }
};

/**
 * @brief Derives InterfaceRoles from hostapd.conf
 *
 * Only the first `interface=` line of the global section counts. The client
 * interface follows the fixed wlan0/wlan1 convention. Any failure yields the
 * default pair; resolve() never throws.
 *
 * The parse is cached by file modification time, so calling resolve() on
 * every poll is cheap and still picks up edits.
 */
class InterfaceResolver {
  public:
    static constexpr const char* DEFAULT_HOSTAPD_CONF = "/etc/hostapd/hostapd.conf";

    explicit InterfaceResolver(std::string conf_path = DEFAULT_HOSTAPD_CONF);

    InterfaceRoles resolve();

    /**
     * @brief Parse hostapd.conf text (no caching, no I/O)
     */
    static InterfaceRoles parse(const std::string& content);

    const std::string& conf_path() const {
        return conf_path_;
    }

  private:
    std::string conf_path_;
    std::mutex cache_mutex_;
    bool cache_valid_ = false;
    struct timespec cached_mtime_ {};
    InterfaceRoles cached_;
};

} // namespace raspap
