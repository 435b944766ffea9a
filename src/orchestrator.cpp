// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "orchestrator.h"

#include <spdlog/spdlog.h>

#include <cstdio>
#include <utility>

namespace raspap {

namespace {

WifiBackendOptions wifi_options(const OrchestratorSettings& settings) {
    WifiBackendOptions options;
    options.command_timeout = settings.command_timeout;
    options.wpa_supplicant_conf = settings.wpa_supplicant_conf;
    return options;
}

VpnOptions vpn_options(const OrchestratorSettings& settings) {
    VpnOptions options;
    options.ovpn_dir = settings.ovpn_dir;
    options.connect_timeout = settings.vpn_connect_timeout;
    options.command_timeout = settings.command_timeout;
    return options;
}

OrchestratorError not_running(const std::string& action) {
    return OrchestratorError(ErrorCode::NOT_INITIALIZED, action + " requested while stopped",
                             "Service is not running", "Restart the touch panel service");
}

} // namespace

Orchestrator::Orchestrator(const OrchestratorSettings& settings,
                           std::unique_ptr<ProcessRunner> runner, std::unique_ptr<GeoLookup> lookup,
                           std::unique_ptr<RaspApApi> api)
    : settings_(settings),
      runner_(runner ? std::move(runner) : std::make_unique<SystemProcessRunner>()),
      lookup_(lookup ? std::move(lookup) : std::make_unique<HttpGeoLookup>(settings.geoip_url)),
      api_(api ? std::move(api) : std::make_unique<RaspApApi>(RaspApApi::from_environment())),
      resolver_(settings.hostapd_conf),
      wifi_(*runner_, WifiCapabilities::detect(*runner_), wifi_options(settings),
            settings.show_unsaved),
      vpn_(*runner_, vpn_options(settings)), system_(*runner_, api_.get(), settings.command_timeout),
      refresher_(*lookup_, settings.geoip_interval, settings.geoip_debounce), store_(),
      scheduler_(PollingSources{resolver_, wifi_, vpn_, system_, refresher_, store_},
                 settings.update_interval, settings.geoip_interval) {
    spdlog::debug("[Orchestrator] Created: nmcli={}, wpa_cli={}, {} VPN profile(s)",
                  wifi_.capabilities().has_nmcli, wifi_.capabilities().has_wpa_cli,
                  settings_.vpn_profiles.size());
}

Orchestrator::~Orchestrator() {
    // Don't use spdlog in destructor - may be destroyed during static cleanup
    if (running_.load()) {
        fprintf(stderr, "[Orchestrator] Destroyed while running, stopping\n");
    }
    stop();
}

// ============================================================================
// Lifecycle
// ============================================================================

void Orchestrator::start() {
    if (stopped_.load()) {
        spdlog::error("[Orchestrator] start() after stop() is not supported");
        return;
    }
    if (running_.exchange(true)) {
        return;
    }

    spdlog::info("[Orchestrator] Starting");
    {
        std::lock_guard<std::mutex> lock(action_mutex_);
        action_stop_ = false;
    }
    action_thread_ = std::thread(&Orchestrator::action_thread_func, this);
    scheduler_.start();
}

void Orchestrator::stop() {
    if (stopped_.exchange(true)) {
        return;
    }

    // Kill children first so nothing below waits out a tool timeout
    runner_->cancel_all();
    scheduler_.stop();

    {
        std::lock_guard<std::mutex> lock(action_mutex_);
        action_stop_ = true;
    }
    action_cv_.notify_all();
    if (action_thread_.joinable()) {
        action_thread_.join();
    }

    // Anything still queued never ran
    std::queue<Action> leftover;
    {
        std::lock_guard<std::mutex> lock(action_mutex_);
        std::swap(leftover, action_queue_);
    }
    while (!leftover.empty()) {
        Action action = std::move(leftover.front());
        leftover.pop();
        if (action.on_complete) {
            action.on_complete(ErrorHelper::cancelled());
        }
    }

    running_.store(false);
}

std::shared_ptr<const CompositeState> Orchestrator::poll_once() {
    if (running_.load()) {
        spdlog::warn("[Orchestrator] poll_once() while polling thread runs; returning snapshot");
        return store_.snapshot();
    }
    scheduler_.tick(PollingScheduler::Clock::now());
    scheduler_.wait_for_geolocation();
    return store_.snapshot();
}

void Orchestrator::refresh_now() {
    scheduler_.request_refresh();
}

// ============================================================================
// User actions
// ============================================================================

void Orchestrator::connect_vpn(std::size_t index, ActionCallback on_complete) {
    if (index >= settings_.vpn_profiles.size()) {
        OrchestratorError err(ErrorCode::INVALID_PARAMETERS,
                              "VPN profile index " + std::to_string(index) + " out of range",
                              "Unknown VPN profile");
        spdlog::warn("[Orchestrator] {}", err.technical_msg);
        if (on_complete) {
            on_complete(err);
        }
        return;
    }
    connect_vpn(settings_.vpn_profiles[index], std::move(on_complete));
}

void Orchestrator::connect_vpn(const VpnProfile& profile, ActionCallback on_complete) {
    enqueue(
        "connect_vpn " + profile.display_name,
        [this, profile]() { return vpn_.connect(profile); }, std::move(on_complete));
}

void Orchestrator::disconnect_vpn(ActionCallback on_complete) {
    enqueue(
        "disconnect_vpn",
        [this]() { return vpn_.disconnect(resolver_.resolve().client_iface); },
        std::move(on_complete));
}

void Orchestrator::connect_wifi(const std::string& ssid, ActionCallback on_complete) {
    enqueue(
        "connect_wifi " + ssid,
        [this, ssid]() { return wifi_.connect_saved(resolver_.resolve().client_iface, ssid); },
        std::move(on_complete));
}

void Orchestrator::disconnect_wifi(ActionCallback on_complete) {
    enqueue(
        "disconnect_wifi", [this]() { return wifi_.disconnect(resolver_.resolve().client_iface); },
        std::move(on_complete));
}

void Orchestrator::enqueue(std::string name, std::function<OrchestratorError()> run,
                           ActionCallback on_complete) {
    {
        std::lock_guard<std::mutex> lock(action_mutex_);
        if (running_.load() && !action_stop_) {
            spdlog::debug("[Orchestrator] Queued {}", name);
            action_queue_.push(Action{std::move(name), std::move(run), std::move(on_complete)});
            action_cv_.notify_one();
            return;
        }
    }

    spdlog::warn("[Orchestrator] Rejected {}: not running", name);
    if (on_complete) {
        on_complete(not_running(name));
    }
}

void Orchestrator::action_thread_func() {
    spdlog::debug("[Orchestrator] Action worker started");

    while (true) {
        Action action;
        {
            std::unique_lock<std::mutex> lock(action_mutex_);
            action_cv_.wait(lock, [this] { return action_stop_ || !action_queue_.empty(); });
            if (action_stop_) {
                break;
            }
            action = std::move(action_queue_.front());
            action_queue_.pop();
        }

        spdlog::info("[Orchestrator] Running {}", action.name);
        OrchestratorError result = action.run();
        if (result.success()) {
            spdlog::info("[Orchestrator] {} done", action.name);
        } else {
            spdlog::warn("[Orchestrator] {} failed ({}): {}", action.name,
                         error_code_name(result.code), result.technical_msg);
        }

        // Reflect the outcome without waiting for the next interval
        scheduler_.request_refresh();

        if (action.on_complete) {
            action.on_complete(result);
        }
    }

    spdlog::debug("[Orchestrator] Action worker exiting");
}

} // namespace raspap
