// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file orchestrator.h
 * @brief Owns every connectivity component and exposes the public surface
 *
 * The presentation layer talks only to this class: it reads snapshots (or
 * subscribes to them) and queues user actions. Nothing it calls blocks on
 * an external tool.
 *
 * @threading Three kinds of threads: the polling thread, at most one
 *            geolocation worker, and one action worker that runs queued
 *            connect/disconnect requests in order. Action callbacks run on
 *            the action worker.
 * @gotchas   stop() cancels the ProcessRunner first, so tools in flight are
 *            killed and queued actions complete with CANCELLED. An
 *            Orchestrator cannot be restarted after stop().
 */

#pragma once

#include "config.h"
#include "geolocation.h"
#include "interface_resolver.h"
#include "orchestrator_error.h"
#include "polling_scheduler.h"
#include "process_runner.h"
#include "raspap_api.h"
#include "state_store.h"
#include "system_status.h"
#include "vpn_controller.h"
#include "wifi_manager.h"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace raspap {

class Orchestrator {
  public:
    using ActionCallback = std::function<void(const OrchestratorError&)>;

    /**
     * @param settings Parsed configuration
     * @param runner Process runner to use; nullptr builds a SystemProcessRunner
     * @param lookup Geolocation source; nullptr builds an HttpGeoLookup from settings
     * @param api RaspAP API client; nullptr reads the environment
     */
    explicit Orchestrator(const OrchestratorSettings& settings,
                          std::unique_ptr<ProcessRunner> runner = nullptr,
                          std::unique_ptr<GeoLookup> lookup = nullptr,
                          std::unique_ptr<RaspApApi> api = nullptr);
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    void start();
    void stop();

    bool is_running() const {
        return running_.load();
    }

    /**
     * @brief Synchronous single pass: tick, wait for geolocation, snapshot
     *
     * Only valid while the polling thread is not running (--once).
     */
    std::shared_ptr<const CompositeState> poll_once();

    std::shared_ptr<const CompositeState> snapshot() const {
        return store_.snapshot();
    }

    StateStore& store() {
        return store_;
    }

    /// Ask for a tick now instead of at the next interval
    void refresh_now();

    const std::vector<VpnProfile>& vpn_profiles() const {
        return settings_.vpn_profiles;
    }

    const OrchestratorSettings& settings() const {
        return settings_;
    }

    const WifiCapabilities& wifi_capabilities() const {
        return wifi_.capabilities();
    }

    // ========================================================================
    // User actions (queued, run in order on the action worker)
    // ========================================================================

    /// Connect the configured profile at @p index (INVALID_PARAMETERS if out of range)
    void connect_vpn(std::size_t index, ActionCallback on_complete = nullptr);
    void connect_vpn(const VpnProfile& profile, ActionCallback on_complete = nullptr);
    void disconnect_vpn(ActionCallback on_complete = nullptr);

    /// Join a saved network on the client interface
    void connect_wifi(const std::string& ssid, ActionCallback on_complete = nullptr);
    void disconnect_wifi(ActionCallback on_complete = nullptr);

  private:
    struct Action {
        std::string name;
        std::function<OrchestratorError()> run;
        ActionCallback on_complete;
    };

    OrchestratorSettings settings_;

    // Declaration order is construction order
    std::unique_ptr<ProcessRunner> runner_;
    std::unique_ptr<GeoLookup> lookup_;
    std::unique_ptr<RaspApApi> api_;
    InterfaceResolver resolver_;
    WifiManager wifi_;
    VpnController vpn_;
    SystemStatusReader system_;
    GeolocationRefresher refresher_;
    StateStore store_;
    PollingScheduler scheduler_;

    std::atomic<bool> running_{false};
    std::atomic<bool> stopped_{false};

    std::thread action_thread_;
    std::mutex action_mutex_;
    std::condition_variable action_cv_;
    std::queue<Action> action_queue_;
    bool action_stop_ = false; ///< Guarded by action_mutex_

    void enqueue(std::string name, std::function<OrchestratorError()> run,
                 ActionCallback on_complete);
    void action_thread_func();
};

} // namespace raspap
