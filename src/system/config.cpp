// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "config.h"

#include <fstream>
#include <iterator>
#include <sys/stat.h>

namespace raspap {

Config* Config::instance{NULL};

namespace {

/// Seconds value clamped to a floor
std::chrono::seconds seconds_at_least(const Config& config, const std::string& ptr, int def,
                                      int floor) {
    int value = config.get<int>(ptr, def);
    if (value < floor) {
        spdlog::warn("[Config] {}={} below minimum, using {}", ptr, value, floor);
        value = floor;
    }
    return std::chrono::seconds(value);
}

std::vector<VpnProfile> parse_vpn_profiles(const json& list) {
    std::vector<VpnProfile> profiles;
    if (!list.is_array()) {
        if (!list.is_null()) {
            spdlog::warn("[Config] vpn_profiles is not a list, ignoring");
        }
        return profiles;
    }

    for (const auto& item : list) {
        if (!item.is_object() || !item.contains("file") || !item["file"].is_string()) {
            spdlog::warn("[Config] Skipping VPN profile without a file: {}", item.dump());
            continue;
        }
        VpnProfile profile;
        profile.file = item["file"].get<std::string>();
        if (item.contains("display_name") && item["display_name"].is_string()) {
            profile.display_name = item["display_name"].get<std::string>();
        } else {
            profile.display_name = profile.file;
        }
        profiles.push_back(std::move(profile));
    }
    return profiles;
}

} // namespace

Config::Config() {}

Config* Config::get_instance() {
    if (instance == nullptr) {
        instance = new Config();
    }
    return instance;
}

bool Config::init(const std::string& config_path) {
    path = config_path;
    loaded = false;
    data = json::object();

    struct stat buffer;
    if (stat(config_path.c_str(), &buffer) != 0) {
        spdlog::warn("[Config] {} not found, using built-in defaults", config_path);
        return false;
    }

    std::ifstream file(config_path);
    if (!file.is_open()) {
        spdlog::warn("[Config] Cannot open {}, using built-in defaults", config_path);
        return false;
    }

    spdlog::info("[Config] Loading config from {}", config_path);
    std::string text((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (!load_string(text)) {
        spdlog::warn("[Config] {} is corrupt, using built-in defaults", config_path);
        return false;
    }
    return true;
}

bool Config::load_string(const std::string& text) {
    try {
        json parsed = json::parse(text);
        if (!parsed.is_object()) {
            spdlog::error("[Config] Top level must be a JSON object");
            data = json::object();
            loaded = false;
            return false;
        }
        data = std::move(parsed);
        loaded = true;
        return true;
    } catch (const json::exception& e) {
        spdlog::error("[Config] Failed to parse config: {}", e.what());
        data = json::object();
        loaded = false;
        return false;
    }
}

json Config::get_json(const std::string& json_ptr) const {
    try {
        json::json_pointer ptr(json_ptr);
        if (data.contains(ptr)) {
            return data.at(ptr);
        }
    } catch (const json::exception& e) {
        spdlog::warn("[Config] Bad JSON pointer {}: {}", json_ptr, e.what());
    }
    return nullptr;
}

// ============================================================================
// OrchestratorSettings
// ============================================================================

OrchestratorSettings OrchestratorSettings::from_config(const Config& config) {
    OrchestratorSettings s;

    s.update_interval = seconds_at_least(config, "/update_interval", 2, 1);
    s.geoip_interval = seconds_at_least(config, "/geoip_interval", 300, 1);
    s.vpn_profiles = parse_vpn_profiles(config.get_json("/vpn_profiles"));

    s.default_screen = config.get<std::string>("/default_screen", s.default_screen);
    s.theme = config.get<std::string>("/theme", s.theme);
    json fonts = config.get_json("/fonts");
    if (fonts.is_object()) {
        s.fonts = fonts;
    }

    s.log_level = config.get<std::string>("/log_level", s.log_level);
    s.log_dest = config.get<std::string>("/log_dest", s.log_dest);
    s.log_path = config.get<std::string>("/log_path", s.log_path);

    s.hostapd_conf = config.get<std::string>("/paths/hostapd_conf", s.hostapd_conf);
    s.ovpn_dir = config.get<std::string>("/paths/ovpn_dir", s.ovpn_dir);
    s.wpa_supplicant_conf =
        config.get<std::string>("/paths/wpa_supplicant_conf", s.wpa_supplicant_conf);

    s.geoip_url = config.get<std::string>("/geoip/url", s.geoip_url);
    s.geoip_debounce = seconds_at_least(config, "/geoip/debounce_sec", 3, 0);
    s.show_unsaved = config.get<bool>("/wifi/show_unsaved", s.show_unsaved);
    s.vpn_connect_timeout = seconds_at_least(config, "/vpn/connect_timeout_sec", 30, 1);
    s.command_timeout = seconds_at_least(config, "/command_timeout_sec", 10, 1);

    spdlog::debug("[Config] update_interval={}s geoip_interval={}s vpn_profiles={}",
                  s.update_interval.count(), s.geoip_interval.count(), s.vpn_profiles.size());
    return s;
}

} // namespace raspap
