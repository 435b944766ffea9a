// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "system_status.h"

#include "raspap_api.h"
#include "mocks/mock_process_runner.h"
#include "test_helpers/temp_dir.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

using namespace raspap;
using Catch::Approx;

namespace {

const char* WLAN0_IP_JSON = R"([{"ifindex":3,"ifname":"wlan0","addr_info":[
    {"family":"inet","local":"192.168.1.20","prefixlen":24}]}])";

} // namespace

TEST_CASE("SystemStatusReader::parse_ip_json", "[system][parse]") {
    SECTION("first inet address") {
        REQUIRE(SystemStatusReader::parse_ip_json(WLAN0_IP_JSON) ==
                std::optional<std::string>("192.168.1.20"));
    }

    SECTION("interface without an address") {
        REQUIRE_FALSE(SystemStatusReader::parse_ip_json(
                          R"([{"ifindex":4,"ifname":"wlan1","addr_info":[]}])")
                          .has_value());
        REQUIRE_FALSE(SystemStatusReader::parse_ip_json("[{}]").has_value());
    }

    SECTION("nothing usable") {
        REQUIRE_FALSE(SystemStatusReader::parse_ip_json("").has_value());
        REQUIRE_FALSE(SystemStatusReader::parse_ip_json("Device \"wlan9\" does not exist.").has_value());
        REQUIRE_FALSE(SystemStatusReader::parse_ip_json("{}").has_value());
    }
}

TEST_CASE("SystemStatusReader::parse_millidegrees", "[system][parse]") {
    REQUIRE(SystemStatusReader::parse_millidegrees("48312\n").value() == Approx(48.312));
    REQUIRE(SystemStatusReader::parse_millidegrees("0").value() == Approx(0.0));
    REQUIRE_FALSE(SystemStatusReader::parse_millidegrees("").has_value());
    REQUIRE_FALSE(SystemStatusReader::parse_millidegrees("hot").has_value());
}

TEST_CASE("SystemStatusReader::read", "[system]") {
    TempDir dir("system_status");
    MockProcessRunner runner;
    InterfaceRoles roles; // ap wlan1, client wlan0

    SECTION("all sources answer") {
        runner.on("systemctl is-active hostapd", MockProcessRunner::ok("active\n"));
        runner.on("ip -j -4 addr show wlan0", MockProcessRunner::ok(WLAN0_IP_JSON));
        runner.on("ip -j -4 addr show wlan1",
                  MockProcessRunner::ok(
                      R"([{"ifname":"wlan1","addr_info":[{"family":"inet","local":"10.3.141.1"}]}])"));
        runner.on("hostname", MockProcessRunner::ok("raspap\n"));
        runner.on("uptime -p", MockProcessRunner::ok("up 2 hours, 5 minutes\n"));

        SystemStatusReader reader(runner, nullptr, std::chrono::milliseconds(1000),
                                  dir.write("temp", "51234\n"));
        SystemStatus status = reader.read(roles);

        REQUIRE(status.ap_active);
        REQUIRE(status.client_ip == std::optional<std::string>("192.168.1.20"));
        REQUIRE(status.ap_ip == std::optional<std::string>("10.3.141.1"));
        REQUIRE(status.hostname == "raspap");
        REQUIRE(status.uptime == "2 hours, 5 minutes");
        REQUIRE(status.cpu_temp_c.value() == Approx(51.234));
        REQUIRE(status.connected_clients == 0);
    }

    SECTION("every field degrades on its own") {
        runner.on("systemctl is-active hostapd", MockProcessRunner::fail(3));
        runner.on("hostname", MockProcessRunner::ok("raspap\n"));

        SystemStatusReader reader(runner, nullptr, std::chrono::milliseconds(1000),
                                  dir.file("no-thermal-zone"));
        SystemStatus status = reader.read(roles);

        REQUIRE_FALSE(status.ap_active);
        REQUIRE_FALSE(status.client_ip.has_value());
        REQUIRE_FALSE(status.ap_ip.has_value());
        REQUIRE(status.hostname == "raspap");
        REQUIRE(status.uptime.empty());
        REQUIRE_FALSE(status.cpu_temp_c.has_value());
    }

    SECTION("inactive hostapd") {
        ProcessResult inactive = MockProcessRunner::fail(3);
        inactive.out = "inactive\n";
        runner.on("systemctl is-active hostapd", inactive);
        SystemStatusReader reader(runner, nullptr, std::chrono::milliseconds(1000),
                                  dir.file("none"));
        REQUIRE_FALSE(reader.read(roles).ap_active);
    }

    SECTION("an API without a key reports zero clients") {
        RaspApApi api("http://127.0.0.1:1", "");
        SystemStatusReader reader(runner, &api, std::chrono::milliseconds(1000), dir.file("none"));
        REQUIRE(reader.read(roles).connected_clients == 0);
    }
}
