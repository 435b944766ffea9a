// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "wifi_backend_wpa_supplicant.h"

#include "mocks/mock_process_runner.h"
#include "test_helpers/temp_dir.h"

#include <catch2/catch_test_macros.hpp>

using namespace raspap;

static const char* SCAN_HEADER = "bssid / frequency / signal level / flags / ssid\n";
static const char* LIST_HEADER = "network id / ssid / bssid / flags\n";

static WifiBackendOptions fast_options() {
    WifiBackendOptions options;
    options.scan_retry_delay = std::chrono::milliseconds(1);
    return options;
}

// ============================================================================
// Parsers
// ============================================================================

TEST_CASE("wpa: dbm_to_percentage clamps to 0-100", "[wifi][wpa][parse]") {
    REQUIRE(WifiBackendWpaSupplicant::dbm_to_percentage(-100) == 0);
    REQUIRE(WifiBackendWpaSupplicant::dbm_to_percentage(-120) == 0);
    REQUIRE(WifiBackendWpaSupplicant::dbm_to_percentage(-70) == 60);
    REQUIRE(WifiBackendWpaSupplicant::dbm_to_percentage(-50) == 100);
    REQUIRE(WifiBackendWpaSupplicant::dbm_to_percentage(-30) == 100);
}

TEST_CASE("wpa: parse_scan_results", "[wifi][wpa][parse]") {
    SECTION("header skipped, dBm normalized, flags mapped") {
        std::string raw = std::string(SCAN_HEADER) +
                          "aa:bb:cc:dd:ee:01\t2412\t-60\t[WPA2-PSK-CCMP][ESS]\tHome\n"
                          "aa:bb:cc:dd:ee:02\t2437\t-85\t[ESS]\tCafe\n";
        auto nets = WifiBackendWpaSupplicant::parse_scan_results(raw);
        REQUIRE(nets.size() == 2);
        REQUIRE(nets[0].ssid == "Home");
        REQUIRE(nets[0].signal_strength == 80);
        REQUIRE(nets[0].security_type == "WPA2");
        REQUIRE(nets[1].signal_strength == 30);
        REQUIRE(nets[1].security_type == "Open");
        REQUIRE_FALSE(nets[1].is_secured);
    }

    SECTION("interface banner before the header") {
        std::string raw = "Selected interface 'wlan0'\n" + std::string(SCAN_HEADER) +
                          "aa:bb:cc:dd:ee:01\t2412\t-60\t[SAE]\tModern\n";
        auto nets = WifiBackendWpaSupplicant::parse_scan_results(raw);
        REQUIRE(nets.size() == 1);
        REQUIRE(nets[0].security_type == "WPA3");
    }

    SECTION("hidden network with no SSID column is skipped") {
        std::string raw = std::string(SCAN_HEADER) + "aa:bb:cc:dd:ee:01\t2412\t-60\t[ESS]\n";
        REQUIRE(WifiBackendWpaSupplicant::parse_scan_results(raw).empty());
    }

    SECTION("strongest BSS per SSID") {
        std::string raw = std::string(SCAN_HEADER) +
                          "aa:00\t2412\t-80\t[WPA2-PSK]\tMesh\n"
                          "aa:01\t5180\t-55\t[WPA2-PSK]\tMesh\n";
        auto nets = WifiBackendWpaSupplicant::parse_scan_results(raw);
        REQUIRE(nets.size() == 1);
        REQUIRE(nets[0].signal_strength == 90);
    }
}

TEST_CASE("wpa: parse_list_networks", "[wifi][wpa][parse]") {
    std::string raw = std::string(LIST_HEADER) +
                      "0\tHome\tany\t[CURRENT]\n"
                      "1\tOffice\tany\t[DISABLED]\n"
                      "x\tBogus\tany\t\n";
    auto saved = WifiBackendWpaSupplicant::parse_list_networks(raw);
    REQUIRE(saved.size() == 2);
    REQUIRE(saved[0].id == "0");
    REQUIRE(saved[0].ssid == "Home");
    REQUIRE(saved[1].id == "1");
    REQUIRE(saved[1].ssid == "Office");

    REQUIRE(WifiBackendWpaSupplicant::parse_list_networks("FAIL\n").empty());
}

TEST_CASE("wpa: parse_status_ssid needs a completed association", "[wifi][wpa][parse]") {
    REQUIRE(WifiBackendWpaSupplicant::parse_status_ssid("bssid=aa:bb\nssid=Home\nwpa_state=COMPLETED\n") ==
            std::optional<std::string>("Home"));
    REQUIRE_FALSE(
        WifiBackendWpaSupplicant::parse_status_ssid("ssid=Home\nwpa_state=ASSOCIATING\n").has_value());
    REQUIRE_FALSE(WifiBackendWpaSupplicant::parse_status_ssid("wpa_state=DISCONNECTED\n").has_value());
}

TEST_CASE("wpa: parse_supplicant_conf reads network blocks", "[wifi][wpa][parse]") {
    std::string conf = "ctrl_interface=DIR=/var/run/wpa_supplicant GROUP=netdev\n"
                       "update_config=1\n"
                       "country=FI\n"
                       "\n"
                       "network={\n"
                       "    ssid=\"Home\"\n"
                       "    psk=\"secret\"\n"
                       "}\n"
                       "# network={ ssid=\"Commented\" }\n"
                       "network={\n"
                       "\tssid=\"Office\"\n"
                       "\tkey_mgmt=WPA-PSK\n"
                       "}\n";
    auto saved = WifiBackendWpaSupplicant::parse_supplicant_conf(conf);
    REQUIRE(saved.size() == 2);
    REQUIRE(saved[0].ssid == "Home");
    REQUIRE(saved[1].ssid == "Office");

    SECTION("read from disk") {
        TempDir dir("wpa_conf");
        auto from_file = WifiBackendWpaSupplicant::read_supplicant_conf(dir.write("wpa.conf", conf));
        REQUIRE(from_file.size() == 2);
        REQUIRE(WifiBackendWpaSupplicant::read_supplicant_conf(dir.file("missing.conf")).empty());
    }
}

TEST_CASE("wpa: parse_supplicant_conf keeps unquoted hex SSIDs", "[wifi][wpa][parse]") {
    auto saved = WifiBackendWpaSupplicant::parse_supplicant_conf("network={\n"
                                                                 "    ssid=4b61666f\n"
                                                                 "    psk=\"x\"\n"
                                                                 "}\n"
                                                                 "network={\n"
                                                                 "    ssid=\"Cafe\"\n"
                                                                 "}\n"
                                                                 "network={\n"
                                                                 "    ssid=\n"
                                                                 "}\n");
    REQUIRE(saved.size() == 2);
    REQUIRE(saved[0].ssid == "4b61666f");
    REQUIRE(saved[0].id == "0");
    REQUIRE(saved[1].ssid == "Cafe");
    REQUIRE(saved[1].id == "1");
}

// ============================================================================
// Command flow
// ============================================================================

TEST_CASE("wpa: scan retries scan_results until non-empty", "[wifi][wpa]") {
    MockProcessRunner runner;
    runner.install("wpa_cli");
    runner.on("sudo -n wpa_cli -i wlan0 scan", MockProcessRunner::ok("OK\n"));
    runner.on("sudo -n wpa_cli -i wlan0 scan_results", MockProcessRunner::ok(SCAN_HEADER));
    runner.on("sudo -n wpa_cli -i wlan0 scan_results", MockProcessRunner::ok(SCAN_HEADER));
    runner.on("sudo -n wpa_cli -i wlan0 scan_results",
              MockProcessRunner::ok(std::string(SCAN_HEADER) + "aa\t2412\t-60\t[ESS]\tHome\n"));

    WifiBackendWpaSupplicant wpa(runner, fast_options());
    auto nets = wpa.scan("wlan0");

    REQUIRE(nets.size() == 1);
    REQUIRE(runner.count("sudo -n wpa_cli -i wlan0 scan_results") == 3);
}

TEST_CASE("wpa: scan gives up after the attempt limit", "[wifi][wpa]") {
    MockProcessRunner runner;
    runner.install("wpa_cli");
    runner.on("sudo -n wpa_cli -i wlan0 scan", MockProcessRunner::ok("FAIL-BUSY\n"));
    runner.on("sudo -n wpa_cli -i wlan0 scan_results", MockProcessRunner::ok(SCAN_HEADER));

    WifiBackendWpaSupplicant wpa(runner, fast_options());
    REQUIRE(wpa.scan("wlan0").empty());
    REQUIRE(runner.count("sudo -n wpa_cli -i wlan0 scan_results") == 4);
}

TEST_CASE("wpa: scan stops when sudo is refused", "[wifi][wpa]") {
    MockProcessRunner runner;
    runner.install("wpa_cli");
    runner.on("sudo -n wpa_cli -i wlan0 scan", MockProcessRunner::permission_denied());

    WifiBackendWpaSupplicant wpa(runner, fast_options());
    REQUIRE(wpa.scan("wlan0").empty());
    REQUIRE(runner.count("sudo -n wpa_cli -i wlan0 scan_results") == 0);
}

TEST_CASE("wpa: connect_saved selects the saved network id", "[wifi][wpa]") {
    MockProcessRunner runner;
    runner.install("wpa_cli");
    runner.on("sudo -n wpa_cli -i wlan0 list_networks",
              MockProcessRunner::ok(std::string(LIST_HEADER) + "0\tHome\tany\t\n3\tOffice\tany\t\n"));
    runner.on("sudo -n wpa_cli -i wlan0 select_network 3", MockProcessRunner::ok("OK\n"));
    runner.on("sudo -n wpa_cli -i wlan0 enable_network 3", MockProcessRunner::ok("OK\n"));
    runner.on("sudo -n wpa_cli -i wlan0 save_config", MockProcessRunner::ok("OK\n"));

    WifiBackendWpaSupplicant wpa(runner, fast_options());

    SECTION("known SSID") {
        REQUIRE(wpa.connect_saved("wlan0", "Office").success());
        auto calls = runner.calls();
        REQUIRE(calls.size() == 4);
        REQUIRE(calls[1] == "sudo -n wpa_cli -i wlan0 select_network 3");
        REQUIRE(calls[2] == "sudo -n wpa_cli -i wlan0 enable_network 3");
        REQUIRE(calls[3] == "sudo -n wpa_cli -i wlan0 save_config");
    }

    SECTION("unknown SSID is rejected before selecting anything") {
        auto err = wpa.connect_saved("wlan0", "Elsewhere");
        REQUIRE(err.code == ErrorCode::INVALID_PARAMETERS);
        REQUIRE(runner.count_prefix("sudo -n wpa_cli -i wlan0 select_network") == 0);
    }
}

TEST_CASE("wpa: FAIL reply with exit 0 is a failure", "[wifi][wpa]") {
    MockProcessRunner runner;
    runner.install("wpa_cli");
    runner.on("sudo -n wpa_cli -i wlan0 list_networks",
              MockProcessRunner::ok(std::string(LIST_HEADER) + "0\tHome\tany\t\n"));
    runner.on("sudo -n wpa_cli -i wlan0 select_network 0", MockProcessRunner::ok("FAIL\n"));

    WifiBackendWpaSupplicant wpa(runner, fast_options());
    auto err = wpa.connect_saved("wlan0", "Home");
    REQUIRE(err.code == ErrorCode::TOOL_FAILED);
    REQUIRE(runner.count("sudo -n wpa_cli -i wlan0 enable_network 0") == 0);
}

TEST_CASE("wpa: disconnect disables every saved network", "[wifi][wpa]") {
    MockProcessRunner runner;
    runner.install("wpa_cli");
    runner.on("sudo -n wpa_cli -i wlan0 disconnect", MockProcessRunner::ok("OK\n"));
    runner.on("sudo -n wpa_cli -i wlan0 list_networks",
              MockProcessRunner::ok(std::string(LIST_HEADER) + "0\tHome\tany\t\n1\tOffice\tany\t\n"));
    runner.on("sudo -n wpa_cli -i wlan0 disable_network 0", MockProcessRunner::ok("OK\n"));
    runner.on("sudo -n wpa_cli -i wlan0 disable_network 1", MockProcessRunner::ok("OK\n"));
    runner.on("sudo -n wpa_cli -i wlan0 save_config", MockProcessRunner::ok("OK\n"));

    WifiBackendWpaSupplicant wpa(runner, fast_options());
    REQUIRE(wpa.disconnect("wlan0").success());
    REQUIRE(runner.count("sudo -n wpa_cli -i wlan0 disable_network 0") == 1);
    REQUIRE(runner.count("sudo -n wpa_cli -i wlan0 disable_network 1") == 1);
    REQUIRE(runner.count("sudo -n wpa_cli -i wlan0 save_config") == 1);
}
