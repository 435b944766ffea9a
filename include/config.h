// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "spdlog/spdlog.h"
#include "vpn_controller.h"

#include <chrono>
#include <string>
#include <vector>

#include "hv/json.hpp"

using json = nlohmann::json;

namespace raspap {

/**
 * @brief Application configuration (singleton)
 *
 * Loads config.json once at startup. Uses JSON pointer syntax (RFC 6901) for
 * nested value access. The file is optional: when it is missing or corrupt
 * every accessor returns its default. The daemon never writes the file; it
 * belongs to the presentation layer and the installer.
 *
 * Thread safety: initialize once at startup before any thread reads it.
 *
 * Example usage:
 * ```cpp
 * Config* cfg = Config::get_instance();
 * cfg->init("/opt/raspap-touch/config.json");
 * int interval = cfg->get<int>("/update_interval", 2);
 * ```
 */
class Config {
  private:
    static Config* instance;
    std::string path;
    bool loaded = false;

  protected:
    json data = json::object();

  public:
    Config();

    Config(Config& o) = delete;
    void operator=(const Config&) = delete;

    /**
     * @brief Load configuration from file
     *
     * A missing file or a parse error leaves an empty document (all
     * defaults) and logs a warning.
     *
     * @param config_path Path to JSON configuration file
     * @return true if the file was read and parsed
     */
    bool init(const std::string& config_path);

    /**
     * @brief Replace the document with parsed text (tests, --config -)
     * @return false on parse error; the document is then empty
     */
    bool load_string(const std::string& text);

    /**
     * @brief Get configuration value with default fallback
     *
     * Returns default_value if the path doesn't exist or holds a value of
     * the wrong type.
     *
     * @tparam T Value type to retrieve
     * @param json_ptr JSON pointer path (e.g., "/paths/hostapd_conf")
     * @param default_value Fallback value
     */
    template <typename T> T get(const std::string& json_ptr, const T& default_value) const {
        try {
            json::json_pointer ptr(json_ptr);
            if (data.contains(ptr)) {
                return data.at(ptr).template get<T>();
            }
        } catch (const json::exception& e) {
            spdlog::warn("[Config] Ignoring {}: {}", json_ptr, e.what());
        }
        return default_value;
    };

    /**
     * @brief Raw JSON at path, or null when absent
     */
    json get_json(const std::string& json_ptr) const;

    std::string get_path() const {
        return path;
    }

    bool is_loaded() const {
        return loaded;
    }

    /**
     * @brief Get singleton instance
     */
    static Config* get_instance();
};

/**
 * @brief Typed view of the settings the orchestrator consumes
 *
 * Derived once from Config and passed explicitly to components, so nothing
 * below main() reads the singleton.
 */
struct OrchestratorSettings {
    std::chrono::seconds update_interval{2};
    std::chrono::seconds geoip_interval{300};
    std::vector<VpnProfile> vpn_profiles;

    // Presentation-layer keys, carried through untouched
    std::string default_screen = "main";
    std::string theme;
    json fonts = json::object();

    std::string log_level;
    std::string log_dest = "auto";
    std::string log_path;

    std::string hostapd_conf = "/etc/hostapd/hostapd.conf";
    std::string ovpn_dir = "assets/ovpn";
    std::string wpa_supplicant_conf = "/etc/wpa_supplicant/wpa_supplicant.conf";

    std::string geoip_url = "http://ip-api.com/json/?fields=status,message,country,city";
    std::chrono::seconds geoip_debounce{3};
    bool show_unsaved = false;
    std::chrono::seconds vpn_connect_timeout{30};
    std::chrono::seconds command_timeout{10};

    static OrchestratorSettings from_config(const Config& config);
};

} // namespace raspap
