// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "state_store.h"

#include <catch2/catch_test_macros.hpp>

#include <thread>
#include <vector>

using namespace raspap;

TEST_CASE("StateStore: initial snapshot", "[state]") {
    StateStore store;
    auto snap = store.snapshot();
    REQUIRE(snap != nullptr);
    REQUIRE(snap->sequence == 0);
    REQUIRE_FALSE(snap->geo.has_value());
    REQUIRE(snap->vpn.kind == VpnStateKind::Disconnected);
}

TEST_CASE("StateStore: publish assigns increasing sequence numbers", "[state]") {
    StateStore store;

    CompositeState first;
    first.system.hostname = "one";
    REQUIRE(store.publish(first) == 1);

    CompositeState second;
    second.system.hostname = "two";
    second.sequence = 999; // ignored
    REQUIRE(store.publish(second) == 2);

    auto snap = store.snapshot();
    REQUIRE(snap->sequence == 2);
    REQUIRE(snap->system.hostname == "two");
    REQUIRE(snap->updated_at.time_since_epoch().count() > 0);
}

TEST_CASE("StateStore: published snapshots are immutable", "[state]") {
    StateStore store;
    CompositeState state;
    state.system.hostname = "before";
    store.publish(state);

    auto held = store.snapshot();
    state.system.hostname = "after";
    store.publish(state);

    REQUIRE(held->system.hostname == "before");
    REQUIRE(store.snapshot()->system.hostname == "after");
}

TEST_CASE("StateStore: modify keeps the rest of the snapshot", "[state]") {
    StateStore store;
    CompositeState state;
    state.system.hostname = "raspap";
    state.vpn.kind = VpnStateKind::Connected;
    store.publish(state);

    GeoLocation geo;
    geo.status = GeoLocation::Status::Ok;
    geo.country = "Finland";
    uint64_t seq = store.modify([&geo](CompositeState& s) { s.geo = geo; });

    auto snap = store.snapshot();
    REQUIRE(seq == 2);
    REQUIRE(snap->geo.has_value());
    REQUIRE(snap->geo->country == std::optional<std::string>("Finland"));
    REQUIRE(snap->system.hostname == "raspap");
    REQUIRE(snap->vpn.kind == VpnStateKind::Connected);
}

TEST_CASE("StateStore: listeners", "[state]") {
    StateStore store;
    std::vector<uint64_t> seen;

    ListenerId id =
        store.subscribe([&seen](std::shared_ptr<const CompositeState> s) { seen.push_back(s->sequence); });
    REQUIRE(id != INVALID_LISTENER_ID);

    store.publish(CompositeState{});
    store.modify([](CompositeState&) {});
    REQUIRE(seen == std::vector<uint64_t>{1, 2});

    SECTION("unsubscribe stops delivery") {
        REQUIRE(store.unsubscribe(id));
        REQUIRE_FALSE(store.unsubscribe(id));
        store.publish(CompositeState{});
        REQUIRE(seen.size() == 2);
    }

    SECTION("null listener is rejected") {
        REQUIRE(store.subscribe(nullptr) == INVALID_LISTENER_ID);
        REQUIRE_FALSE(store.unsubscribe(INVALID_LISTENER_ID));
    }

    SECTION("a listener may unsubscribe itself") {
        ListenerId self = INVALID_LISTENER_ID;
        int calls = 0;
        self = store.subscribe([&](std::shared_ptr<const CompositeState>) {
            ++calls;
            store.unsubscribe(self);
        });
        store.publish(CompositeState{});
        store.publish(CompositeState{});
        REQUIRE(calls == 1);
    }

    SECTION("listeners may read the snapshot") {
        uint64_t read_back = 0;
        store.subscribe([&](std::shared_ptr<const CompositeState>) {
            read_back = store.snapshot()->sequence;
        });
        uint64_t seq = store.publish(CompositeState{});
        REQUIRE(read_back == seq);
    }
}

TEST_CASE("StateStore: concurrent writers never lose a sequence", "[state][slow]") {
    StateStore store;
    constexpr int PER_THREAD = 200;

    std::thread a([&store]() {
        for (int i = 0; i < PER_THREAD; ++i) {
            store.publish(CompositeState{});
        }
    });
    std::thread b([&store]() {
        for (int i = 0; i < PER_THREAD; ++i) {
            store.modify([](CompositeState& s) { s.system.connected_clients++; });
        }
    });
    a.join();
    b.join();

    REQUIRE(store.snapshot()->sequence == 2 * PER_THREAD);
}

// ============================================================================
// JSON form
// ============================================================================

TEST_CASE("to_json: composite snapshot", "[state][json]") {
    CompositeState state;
    state.roles.ap_iface = "wlan0";
    state.roles.client_iface = "wlan1";
    state.roles.ap_ssid = "raspi-webgui";
    state.roles.from_config = true;

    ScanEntry entry;
    entry.ssid = "Home";
    entry.signal = 70;
    entry.saved = true;
    entry.in_range = true;
    entry.security = "WPA2";
    state.wifi.entries.push_back(entry);
    state.wifi.connected_ssid = "Home";

    state.vpn.kind = VpnStateKind::Connecting;
    state.vpn.profile = VpnProfile{"Home VPN", "home.ovpn"};

    state.system.hostname = "raspap";
    state.system.cpu_temp_c = 47.5;
    state.sequence = 12;

    json j = to_json(state);

    REQUIRE(j["sequence"].get<uint64_t>() == 12);
    REQUIRE(j["interfaces"]["ap"].get<std::string>() == "wlan0");
    REQUIRE(j["interfaces"]["client"].get<std::string>() == "wlan1");
    REQUIRE(j["interfaces"]["ap_ssid"].get<std::string>() == "raspi-webgui");
    REQUIRE(j["wifi"]["available"].get<bool>());
    REQUIRE(j["wifi"]["connected_ssid"].get<std::string>() == "Home");
    REQUIRE(j["wifi"]["networks"].size() == 1);
    REQUIRE(j["wifi"]["networks"][0]["signal"].get<int>() == 70);
    REQUIRE(j["wifi"]["networks"][0]["in_range"].get<bool>());
    REQUIRE(j["vpn"]["state"].get<std::string>() == "connecting");
    REQUIRE(j["vpn"]["profile"]["display_name"].get<std::string>() == "Home VPN");
    REQUIRE(j["geo"].is_null());
    REQUIRE(j["system"]["hostname"].get<std::string>() == "raspap");
    REQUIRE(j["system"]["client_ip"].is_null());
    REQUIRE(j["system"]["cpu_temp_c"].get<double>() == 47.5);
}

TEST_CASE("to_json: geolocation", "[state][json]") {
    GeoLocation geo;
    geo.status = GeoLocation::Status::Ok;
    geo.country = "Finland";
    geo.city = "Tampere";

    json j = to_json(geo);
    REQUIRE(j["status"].get<std::string>() == "ok");
    REQUIRE(j["display"].get<std::string>() == "Tampere, Finland");
    REQUIRE(j["message"].is_null());
    REQUIRE(j["error"].is_null());

    GeoLocation failed;
    failed.message = "HTTP 503";
    failed.error = ErrorHelper::network_unreachable("HTTP 503");
    json f = to_json(failed);
    REQUIRE(f["status"].get<std::string>() == "error");
    REQUIRE(f["error"].get<std::string>() == "network_unreachable");

    VpnState idle;
    json v = to_json(idle);
    REQUIRE(v["state"].get<std::string>() == "disconnected");
    REQUIRE(v["profile"].is_null());
}
