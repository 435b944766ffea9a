// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "state_store.h"

#include <spdlog/spdlog.h>

#include <utility>
#include <vector>

namespace raspap {

namespace {

int64_t epoch_ms(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

template <typename T> json optional_json(const std::optional<T>& value) {
    if (value) {
        return json(*value);
    }
    return nullptr;
}

} // namespace

StateStore::StateStore() : current_(std::make_shared<const CompositeState>()) {}

std::shared_ptr<const CompositeState> StateStore::snapshot() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return current_;
}

uint64_t StateStore::publish(CompositeState state) {
    std::lock_guard<std::mutex> lock(publish_mutex_);
    return publish_locked(std::move(state));
}

uint64_t StateStore::modify(const std::function<void(CompositeState&)>& change) {
    std::lock_guard<std::mutex> lock(publish_mutex_);
    CompositeState next = *snapshot();
    change(next);
    return publish_locked(std::move(next));
}

uint64_t StateStore::publish_locked(CompositeState state) {
    state.sequence = next_sequence_++;
    state.updated_at = std::chrono::system_clock::now();
    auto published = std::make_shared<const CompositeState>(std::move(state));

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        current_ = published;
    }

    // Copy so a listener may unsubscribe from inside its callback
    std::vector<StateListener> listeners;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        listeners.reserve(listeners_.size());
        for (const auto& entry : listeners_) {
            listeners.push_back(entry.second);
        }
    }
    for (const auto& listener : listeners) {
        listener(published);
    }

    spdlog::trace("[StateStore] Published snapshot #{}", published->sequence);
    return published->sequence;
}

ListenerId StateStore::subscribe(StateListener listener) {
    if (!listener) {
        spdlog::warn("[StateStore] subscribe called with null listener");
        return INVALID_LISTENER_ID;
    }

    ListenerId id = next_listener_id_.fetch_add(1);
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    listeners_.emplace(id, std::move(listener));
    spdlog::trace("[StateStore] Registered listener {}", id);
    return id;
}

bool StateStore::unsubscribe(ListenerId id) {
    if (id == INVALID_LISTENER_ID) {
        return false;
    }

    std::lock_guard<std::mutex> lock(listeners_mutex_);
    return listeners_.erase(id) > 0;
}

// ============================================================================
// JSON form
// ============================================================================

json to_json(const InterfaceRoles& roles) {
    return json{{"ap", roles.ap_iface},
                {"client", roles.client_iface},
                {"ap_ssid", optional_json(roles.ap_ssid)},
                {"from_config", roles.from_config}};
}

json to_json(const WifiState& wifi) {
    json networks = json::array();
    for (const auto& entry : wifi.entries) {
        networks.push_back(json{{"ssid", entry.ssid},
                            {"signal", entry.signal},
                            {"saved", entry.saved},
                            {"in_range", entry.in_range},
                            {"security", entry.security}});
    }
    return json{{"available", wifi.available},
                {"connected_ssid", optional_json(wifi.connected_ssid)},
                {"networks", networks}};
}

json to_json(const VpnState& vpn) {
    json profile = nullptr;
    if (vpn.profile) {
        profile = {{"display_name", vpn.profile->display_name}, {"file", vpn.profile->file}};
    }
    return json{{"state", vpn_state_name(vpn.kind)}, {"profile", profile}};
}

json to_json(const GeoLocation& geo) {
    return json{{"status", geo.ok() ? "ok" : "error"},
                {"country", optional_json(geo.country)},
                {"city", optional_json(geo.city)},
                {"message", optional_json(geo.message)},
                {"error", geo.error.success() ? json(nullptr) : json(error_code_name(geo.error.code))},
                {"display", geo.display()},
                {"fetched_at", epoch_ms(geo.fetched_at)}};
}

json to_json(const SystemStatus& system) {
    return json{{"ap_active", system.ap_active},
                {"client_ip", optional_json(system.client_ip)},
                {"ap_ip", optional_json(system.ap_ip)},
                {"hostname", system.hostname},
                {"uptime", system.uptime},
                {"cpu_temp_c", optional_json(system.cpu_temp_c)},
                {"connected_clients", system.connected_clients}};
}

json to_json(const CompositeState& state) {
    return json{{"sequence", state.sequence},
                {"updated_at", epoch_ms(state.updated_at)},
                {"interfaces", to_json(state.roles)},
                {"wifi", to_json(state.wifi)},
                {"vpn", to_json(state.vpn)},
                {"geo", state.geo ? to_json(*state.geo) : json(nullptr)},
                {"system", to_json(state.system)}};
}

} // namespace raspap
