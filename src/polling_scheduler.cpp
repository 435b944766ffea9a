// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "polling_scheduler.h"

#include <spdlog/spdlog.h>

#include <cstdio>
#include <exception>
#include <utility>

namespace raspap {

ConnectivitySignature ConnectivitySignature::of(const WifiState& wifi, const VpnState& vpn) {
    ConnectivitySignature sig;
    sig.wifi_connected = wifi.connected_ssid.has_value();
    sig.vpn = vpn.kind;
    return sig;
}

PollingScheduler::PollingScheduler(PollingSources sources, std::chrono::seconds update_interval,
                                   std::chrono::seconds geoip_interval)
    : src_(sources), update_interval_(update_interval), geoip_interval_(geoip_interval) {
    if (update_interval_ < std::chrono::seconds(1)) {
        update_interval_ = std::chrono::seconds(1);
    }
}

PollingScheduler::~PollingScheduler() {
    // Don't use spdlog in destructor - may be destroyed during static cleanup
    if (running_.load()) {
        fprintf(stderr, "[PollingScheduler] Destroyed while running, stopping\n");
    }
    stop();
}

// ============================================================================
// Lifecycle
// ============================================================================

void PollingScheduler::start() {
    if (running_.load()) {
        spdlog::debug("[PollingScheduler] Already running");
        return;
    }

    spdlog::info("[PollingScheduler] Starting (update every {}s, geolocation floor {}s)",
                 update_interval_.count(), geoip_interval_.count());

    stop_requested_.store(false);
    running_.store(true);
    polling_thread_ = std::thread(&PollingScheduler::polling_thread_func, this);
}

void PollingScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        stop_requested_.store(true);
    }
    wake_cv_.notify_all();

    if (polling_thread_.joinable()) {
        polling_thread_.join();
    }
    join_geo_worker();

    if (running_.exchange(false)) {
        spdlog::info("[PollingScheduler] Stopped");
    }
}

void PollingScheduler::request_refresh() {
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        refresh_requested_ = true;
    }
    wake_cv_.notify_one();
}

void PollingScheduler::polling_thread_func() {
    spdlog::debug("[PollingScheduler] Polling thread started");

    while (!stop_requested_.load()) {
        try {
            tick(Clock::now());
        } catch (const std::exception& e) {
            spdlog::error("[PollingScheduler] Tick failed: {}", e.what());
        }

        std::unique_lock<std::mutex> lock(wake_mutex_);
        wake_cv_.wait_for(lock, update_interval_,
                          [this] { return stop_requested_.load() || refresh_requested_; });
        refresh_requested_ = false;
    }

    spdlog::debug("[PollingScheduler] Polling thread exiting");
}

// ============================================================================
// Tick
// ============================================================================

std::optional<RefreshTrigger> PollingScheduler::tick(Clock::time_point now) {
    CompositeState state;
    state.roles = src_.resolver.resolve();
    state.wifi = src_.wifi.read_state(state.roles);
    state.vpn = src_.vpn.probe();
    state.system = src_.system.read(state.roles);
    state.geo = src_.geo.last_known();

    ConnectivitySignature signature = ConnectivitySignature::of(state.wifi, state.vpn);
    std::optional<RefreshTrigger> candidate = select_trigger(signature, now);

    src_.store.publish(std::move(state));

    if (!candidate || !src_.geo.should_fetch(*candidate, now)) {
        return std::nullopt;
    }
    if (!launch_geolocation(*candidate, now)) {
        return std::nullopt;
    }

    last_launch_ = now;
    if (candidate->reason == RefreshReason::StateChange) {
        state_change_pending_ = false;
    }
    return candidate;
}

std::optional<RefreshTrigger> PollingScheduler::select_trigger(const ConnectivitySignature& signature,
                                                               Clock::time_point now) {
    if (first_tick_) {
        first_tick_ = false;
        last_signature_ = signature;
        return RefreshTrigger{RefreshReason::Startup};
    }

    if (last_signature_ && signature != *last_signature_) {
        spdlog::info("[PollingScheduler] Connectivity changed: wifi {} -> {}, vpn {} -> {}",
                     last_signature_->wifi_connected ? "up" : "down",
                     signature.wifi_connected ? "up" : "down",
                     vpn_state_name(last_signature_->vpn), vpn_state_name(signature.vpn));
        state_change_pending_ = true;
    }
    last_signature_ = signature;

    if (state_change_pending_) {
        return RefreshTrigger{RefreshReason::StateChange};
    }
    if (!last_launch_ || now - *last_launch_ >= geoip_interval_) {
        return RefreshTrigger{RefreshReason::Periodic};
    }
    return std::nullopt;
}

// ============================================================================
// Geolocation worker
// ============================================================================

bool PollingScheduler::launch_geolocation(RefreshTrigger trigger, Clock::time_point now) {
    std::lock_guard<std::mutex> lock(geo_worker_mutex_);

    if (geo_busy_.load()) {
        spdlog::trace("[PollingScheduler] Geolocation worker busy, holding {} trigger",
                      refresh_reason_name(trigger.reason));
        return false;
    }
    if (geo_worker_.joinable()) {
        geo_worker_.join();
    }

    geo_busy_.store(true);
    geo_worker_ = std::thread([this, trigger, now]() {
        std::optional<GeoLocation> result = src_.geo.maybe_refresh(trigger, now);
        if (result && result->ok()) {
            GeoLocation geo = *result;
            src_.store.modify([&geo](CompositeState& state) { state.geo = geo; });
        }
        geo_busy_.store(false);
    });
    return true;
}

void PollingScheduler::wait_for_geolocation() {
    join_geo_worker();
}

void PollingScheduler::join_geo_worker() {
    std::lock_guard<std::mutex> lock(geo_worker_mutex_);
    if (geo_worker_.joinable()) {
        geo_worker_.join();
    }
}

} // namespace raspap
