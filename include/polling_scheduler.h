// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file polling_scheduler.h
 * @brief Periodic reconciliation loop for Wi-Fi, VPN and host status
 *
 * @threading One dedicated polling thread runs every tick, so ticks never
 *            overlap. Geolocation lookups run on a separate worker thread
 *            (at most one at a time) and republish the snapshot when they
 *            finish. request_refresh() may be called from any thread.
 * @gotchas   tick() is public for tests and --once; never call it while
 *            the polling thread is running.
 */

#pragma once

#include "geolocation.h"
#include "interface_resolver.h"
#include "state_store.h"
#include "system_status.h"
#include "vpn_controller.h"
#include "wifi_manager.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <thread>

namespace raspap {

/**
 * @brief The part of the state whose change means "the route out changed"
 */
struct ConnectivitySignature {
    bool wifi_connected = false;
    VpnStateKind vpn = VpnStateKind::Disconnected;

    bool operator==(const ConnectivitySignature& o) const {
        return wifi_connected == o.wifi_connected && vpn == o.vpn;
    }
    bool operator!=(const ConnectivitySignature& o) const {
        return !(*this == o);
    }

    static ConnectivitySignature of(const WifiState& wifi, const VpnState& vpn);
};

/**
 * @brief Components a tick reads from and publishes to
 */
struct PollingSources {
    InterfaceResolver& resolver;
    WifiManager& wifi;
    VpnController& vpn;
    SystemStatusReader& system;
    GeolocationRefresher& geo;
    StateStore& store;
};

class PollingScheduler {
  public:
    using Clock = std::chrono::steady_clock;

    PollingScheduler(PollingSources sources, std::chrono::seconds update_interval,
                     std::chrono::seconds geoip_interval);
    ~PollingScheduler();

    PollingScheduler(const PollingScheduler&) = delete;
    PollingScheduler& operator=(const PollingScheduler&) = delete;

    void start();

    /**
     * @brief Stop the polling thread and wait for any geolocation worker
     *
     * Callers that want in-flight tools killed promptly should cancel the
     * ProcessRunner first.
     */
    void stop();

    bool is_running() const {
        return running_.load();
    }

    /**
     * @brief Wake the loop for an immediate tick
     *
     * Requests made while a tick is pending collapse into one.
     */
    void request_refresh();

    /**
     * @brief Run one reconciliation pass and publish the result
     * @return Trigger offered to the geolocation worker, if one was launched
     */
    std::optional<RefreshTrigger> tick(Clock::time_point now);

    /**
     * @brief Block until the current geolocation worker (if any) finishes
     */
    void wait_for_geolocation();

    /**
     * @brief Which trigger this tick should offer, before launch policy
     *
     * Priority: startup on the first tick, then state_change while a
     * signature change is pending, then periodic once geoip_interval has
     * passed since the last launch.
     */
    std::optional<RefreshTrigger> select_trigger(const ConnectivitySignature& signature,
                                                 Clock::time_point now);

  private:
    PollingSources src_;
    std::chrono::seconds update_interval_;
    std::chrono::seconds geoip_interval_;

    std::thread polling_thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;
    bool refresh_requested_ = false; ///< Guarded by wake_mutex_

    // Trigger bookkeeping (polling thread only)
    bool first_tick_ = true;
    std::optional<ConnectivitySignature> last_signature_;
    bool state_change_pending_ = false;
    std::optional<Clock::time_point> last_launch_;

    std::mutex geo_worker_mutex_;
    std::thread geo_worker_;
    std::atomic<bool> geo_busy_{false};

    void polling_thread_func();
    bool launch_geolocation(RefreshTrigger trigger, Clock::time_point now);
    void join_geo_worker();
};

} // namespace raspap
