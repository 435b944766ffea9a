// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file main.cpp
 * @brief raspap-touchd entry point
 *
 * Loads configuration, sets up logging, then either runs the orchestrator
 * until SIGTERM/SIGINT or (with --once) polls a single time and prints the
 * snapshot as JSON on stdout.
 */

#include "cli_args.h"
#include "config.h"
#include "logging_init.h"
#include "orchestrator.h"
#include "state_store.h"

#include "hv/hlog.h"

#include <spdlog/spdlog.h>

#include <chrono>
#include <climits>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <signal.h>
#include <string>
#include <thread>
#include <unistd.h>

// =============================================================================
// Signal Handling
// =============================================================================

static volatile sig_atomic_t g_quit = 0;

static void signal_handler(int sig) {
    (void)sig;
    g_quit = 1;
}

static void setup_signal_handlers() {
    signal(SIGTERM, signal_handler);
    signal(SIGINT, signal_handler);
    // Tool output goes through pipes; a reader that went away must not kill us
    signal(SIGPIPE, SIG_IGN);
}

// =============================================================================
// Helpers
// =============================================================================

/**
 * @brief config.json in the directory holding the executable
 *
 * Falls back to the working directory when /proc/self/exe is unreadable.
 */
static std::string default_config_path() {
    char exe_path[PATH_MAX];
    ssize_t len = readlink("/proc/self/exe", exe_path, sizeof(exe_path) - 1);
    if (len == -1) {
        return "config.json";
    }
    exe_path[len] = '\0';

    char* last_slash = strrchr(exe_path, '/');
    if (!last_slash) {
        return "config.json";
    }
    *last_slash = '\0';
    return std::string(exe_path) + "/config.json";
}

static raspap::logging::LogConfig make_log_config(const raspap::CliArgs& args,
                                                  const raspap::OrchestratorSettings& settings) {
    raspap::logging::LogConfig log_config;

    const char* env_level = std::getenv("LOG_LEVEL");
    log_config.level = raspap::logging::resolve_log_level(
        args.verbosity, env_level ? env_level : "", settings.log_level);

    std::string log_dest = args.log_dest.empty() ? settings.log_dest : args.log_dest;
    log_config.target = raspap::logging::parse_log_target(log_dest);

    log_config.file_path = args.log_file.empty() ? settings.log_path : args.log_file;

    // stdout carries the JSON snapshot in --once mode
    log_config.console_to_stderr = args.once;
    return log_config;
}

static void log_snapshot(const std::shared_ptr<const raspap::CompositeState>& state) {
    spdlog::debug("[Main] Snapshot #{}: client={} ssid={} vpn={} networks={} geo={}",
                  state->sequence, state->roles.client_iface,
                  state->wifi.connected_ssid.value_or("-"), raspap::vpn_state_name(state->vpn.kind),
                  state->wifi.entries.size(), state->geo ? state->geo->display() : "-");
}

// =============================================================================
// Main
// =============================================================================

int main(int argc, char** argv) {
    // libhv is chatty at its default level; quiet it until logging is configured
    hlog_set_level(LOG_LEVEL_WARN);

    raspap::CliArgs args;
    if (!raspap::parse_cli_args(argc, argv, args)) {
        return args.exit_requested ? 0 : 1;
    }

    setup_signal_handlers();

    std::string config_path = args.config_path.empty() ? default_config_path() : args.config_path;
    raspap::Config* config = raspap::Config::get_instance();
    config->init(config_path);

    raspap::OrchestratorSettings settings = raspap::OrchestratorSettings::from_config(*config);
    if (!args.hostapd_conf.empty()) {
        settings.hostapd_conf = args.hostapd_conf;
    }

    raspap::logging::init(make_log_config(args, settings));
    spdlog::info("[Main] raspap-touchd {} starting (config: {}{})", raspap::version_string(),
                 config_path, config->is_loaded() ? "" : ", defaults");

    raspap::Orchestrator orchestrator(settings);

    if (args.once) {
        auto state = orchestrator.poll_once();
        printf("%s\n", raspap::to_json(*state).dump(2).c_str());
        orchestrator.stop();
        return 0;
    }

    orchestrator.store().subscribe(log_snapshot);
    orchestrator.start();

    while (!g_quit) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    spdlog::info("[Main] Shutdown requested");
    orchestrator.stop();
    spdlog::info("[Main] Exiting");
    return 0;
}
