// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "config.h"

#include "test_helpers/temp_dir.h"

#include <catch2/catch_test_macros.hpp>

using namespace raspap;

// Test fixture for Config class testing
class ConfigTestFixture {
  protected:
    Config config;

    void setup_default_config() {
        REQUIRE(config.load_string(R"({
            "update_interval": 5,
            "geoip_interval": 600,
            "default_screen": "vpn",
            "theme": "dark",
            "fonts": {"body": "Montserrat", "size": 18},
            "vpn_profiles": [
                {"display_name": "Home", "file": "home.ovpn"},
                {"display_name": "Work", "file": "/etc/openvpn/work.conf"}
            ],
            "paths": {"hostapd_conf": "/tmp/hostapd.conf", "ovpn_dir": "/opt/ovpn"},
            "wifi": {"show_unsaved": true},
            "log_level": "debug"
        })"));
    }
};

// ============================================================================
// Raw accessors
// ============================================================================

TEST_CASE_METHOD(ConfigTestFixture, "Config: get() returns existing values", "[core][config][get]") {
    setup_default_config();

    REQUIRE(config.get<int>("/update_interval", 2) == 5);
    REQUIRE(config.get<std::string>("/theme", "") == "dark");
    REQUIRE(config.get<std::string>("/paths/ovpn_dir", "") == "/opt/ovpn");
    REQUIRE(config.get<bool>("/wifi/show_unsaved", false));
    REQUIRE(config.is_loaded());
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: get() falls back to the default",
                 "[core][config][get]") {
    setup_default_config();

    SECTION("missing key") {
        REQUIRE(config.get<int>("/nope", 42) == 42);
        REQUIRE(config.get<std::string>("/paths/missing", "x") == "x");
    }

    SECTION("wrong type") {
        REQUIRE(config.get<int>("/theme", 7) == 7);
        REQUIRE(config.get<std::string>("/update_interval", "fallback") == "fallback");
    }

    SECTION("malformed pointer") {
        REQUIRE(config.get<int>("no-leading-slash", 3) == 3);
    }
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: get_json", "[core][config][get]") {
    setup_default_config();

    REQUIRE(config.get_json("/fonts")["size"].get<int>() == 18);
    REQUIRE(config.get_json("/vpn_profiles").is_array());
    REQUIRE(config.get_json("/absent").is_null());
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: load_string rejects bad documents",
                 "[core][config][load]") {
    SECTION("syntax error") {
        REQUIRE_FALSE(config.load_string("{\"update_interval\": "));
    }

    SECTION("top level is not an object") {
        REQUIRE_FALSE(config.load_string("[1, 2, 3]"));
    }

    REQUIRE_FALSE(config.is_loaded());
    REQUIRE(config.get<int>("/update_interval", 2) == 2);
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: init from disk", "[core][config][load]") {
    TempDir dir("config");

    SECTION("valid file") {
        std::string path = dir.write("config.json", R"({"update_interval": 9})");
        REQUIRE(config.init(path));
        REQUIRE(config.get_path() == path);
        REQUIRE(config.get<int>("/update_interval", 2) == 9);
    }

    SECTION("missing file") {
        REQUIRE_FALSE(config.init(dir.file("absent.json")));
        REQUIRE_FALSE(config.is_loaded());
    }

    SECTION("corrupt file leaves defaults") {
        REQUIRE(config.load_string(R"({"update_interval": 9})"));
        std::string path = dir.write("config.json", "{ this is not json");
        REQUIRE_FALSE(config.init(path));
        REQUIRE(config.get<int>("/update_interval", 2) == 2);
    }
}

// ============================================================================
// OrchestratorSettings
// ============================================================================

TEST_CASE_METHOD(ConfigTestFixture, "OrchestratorSettings: values from config",
                 "[core][config][settings]") {
    setup_default_config();
    OrchestratorSettings s = OrchestratorSettings::from_config(config);

    REQUIRE(s.update_interval == std::chrono::seconds(5));
    REQUIRE(s.geoip_interval == std::chrono::seconds(600));
    REQUIRE(s.default_screen == "vpn");
    REQUIRE(s.theme == "dark");
    REQUIRE(s.fonts["body"].get<std::string>() == "Montserrat");
    REQUIRE(s.hostapd_conf == "/tmp/hostapd.conf");
    REQUIRE(s.ovpn_dir == "/opt/ovpn");
    REQUIRE(s.show_unsaved);
    REQUIRE(s.log_level == "debug");

    REQUIRE(s.vpn_profiles.size() == 2);
    VpnProfile home{"Home", "home.ovpn"};
    REQUIRE(s.vpn_profiles[0] == home);
    REQUIRE(s.vpn_profiles[1].file == "/etc/openvpn/work.conf");
}

TEST_CASE_METHOD(ConfigTestFixture, "OrchestratorSettings: defaults", "[core][config][settings]") {
    SECTION("empty document") {
        REQUIRE(config.load_string("{}"));
    }

    SECTION("corrupt document") {
        REQUIRE_FALSE(config.load_string("not json"));
    }

    OrchestratorSettings s = OrchestratorSettings::from_config(config);
    REQUIRE(s.update_interval == std::chrono::seconds(2));
    REQUIRE(s.geoip_interval == std::chrono::seconds(300));
    REQUIRE(s.vpn_profiles.empty());
    REQUIRE(s.default_screen == "main");
    REQUIRE(s.hostapd_conf == "/etc/hostapd/hostapd.conf");
    REQUIRE(s.ovpn_dir == "assets/ovpn");
    REQUIRE_FALSE(s.show_unsaved);
    REQUIRE(s.log_dest == "auto");
    REQUIRE(s.fonts.is_object());
}

TEST_CASE_METHOD(ConfigTestFixture, "OrchestratorSettings: intervals have a floor of one second",
                 "[core][config][settings]") {
    REQUIRE(config.load_string(R"({"update_interval": 0, "geoip_interval": -5})"));
    OrchestratorSettings s = OrchestratorSettings::from_config(config);
    REQUIRE(s.update_interval == std::chrono::seconds(1));
    REQUIRE(s.geoip_interval == std::chrono::seconds(1));
}

TEST_CASE_METHOD(ConfigTestFixture, "OrchestratorSettings: malformed VPN profiles",
                 "[core][config][settings]") {
    SECTION("entries without a file are skipped") {
        REQUIRE(config.load_string(R"({"vpn_profiles": [
            {"display_name": "No file"},
            "just-a-string",
            {"display_name": "Ok", "file": "ok.ovpn"},
            {"file": "bare.ovpn"}
        ]})"));
        OrchestratorSettings s = OrchestratorSettings::from_config(config);
        REQUIRE(s.vpn_profiles.size() == 2);
        REQUIRE(s.vpn_profiles[0].display_name == "Ok");
        REQUIRE(s.vpn_profiles[1].display_name == "bare.ovpn");
    }

    SECTION("not a list") {
        REQUIRE(config.load_string(R"({"vpn_profiles": {"file": "x.ovpn"}})"));
        REQUIRE(OrchestratorSettings::from_config(config).vpn_profiles.empty());
    }
}
