// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "vpn_controller.h"

#include "spdlog/spdlog.h"

#include <cstdio>
#include <dirent.h>
#include <sstream>
#include <sys/stat.h>

namespace raspap {

const char* vpn_state_name(VpnStateKind kind) {
    switch (kind) {
    case VpnStateKind::Disconnected:
        return "disconnected";
    case VpnStateKind::Connecting:
        return "connecting";
    case VpnStateKind::Connected:
        return "connected";
    case VpnStateKind::Disconnecting:
        return "disconnecting";
    }
    return "unknown";
}

VpnController::VpnController(ProcessRunner& runner, VpnOptions options)
    : runner_(runner), options_(std::move(options)) {
    spdlog::debug("[VpnController] Initialized (ovpn dir: {})", options_.ovpn_dir);
}

VpnController::~VpnController() {
    // Use fprintf - spdlog may be destroyed during static cleanup
    fprintf(stderr, "[VpnController] Destroyed\n");
}

ProcessResult VpnController::run(const std::string& program, std::vector<std::string> args,
                                 bool elevated) {
    return runner_.run(Command(program, std::move(args), elevated, options_.command_timeout));
}

void VpnController::set_state(VpnState next) {
    if (next.kind != state_.kind) {
        spdlog::info("[VpnController] {} -> {}{}", vpn_state_name(state_.kind),
                     vpn_state_name(next.kind),
                     next.profile ? " (" + next.profile->display_name + ")" : "");
    }
    state_ = std::move(next);
}

VpnState VpnController::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::string VpnController::profile_path(const VpnProfile& profile) const {
    if (!profile.file.empty() && profile.file[0] == '/') {
        return profile.file;
    }
    return options_.ovpn_dir + "/" + profile.file;
}

// ============================================================================
// Lifecycle
// ============================================================================

OrchestratorError VpnController::connect(const VpnProfile& profile) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (state_.kind == VpnStateKind::Connecting || state_.kind == VpnStateKind::Connected) {
        spdlog::debug("[VpnController] connect('{}') ignored: already {}", profile.display_name,
                      vpn_state_name(state_.kind));
        return ErrorHelper::success();
    }

    std::string path = profile_path(profile);
    struct stat st {};
    if (profile.file.empty() || stat(path.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
        spdlog::warn("[VpnController] Profile '{}' not found at {}", profile.display_name, path);
        return ErrorHelper::profile_not_found(path);
    }

    // Clear strays so the new tunnel is the only one; nothing to kill is fine
    ProcessResult killed = run("killall", {"openvpn"}, true);
    if (!killed.ok()) {
        spdlog::debug("[VpnController] killall before connect: {}", killed.error.technical_msg);
    }

    ProcessResult launched = run("openvpn", {"--daemon", "--config", path}, true);
    if (!launched.ok()) {
        spdlog::error("[VpnController] Failed to launch openvpn for '{}': {}",
                      profile.display_name, launched.error.technical_msg);
        return launched.error;
    }

    connecting_since_ = std::chrono::steady_clock::now();
    connect_timeout_logged_ = false;
    set_state({VpnStateKind::Connecting, profile});
    return ErrorHelper::success();
}

OrchestratorError VpnController::disconnect(const std::string& client_iface) {
    std::lock_guard<std::mutex> lock(mutex_);

    // Also stops an openvpn the liveness check has not adopted yet
    bool was_idle = state_.kind == VpnStateKind::Disconnected;
    if (!was_idle) {
        set_state({VpnStateKind::Disconnecting, state_.profile});
    }

    ProcessResult killed = run("killall", {"openvpn"}, true);
    killed_at_ = std::chrono::steady_clock::now();
    OrchestratorError result = ErrorHelper::success();
    if (!killed.ok() && killed.error.code != ErrorCode::TOOL_FAILED) {
        // TOOL_FAILED here only means no process was left to kill
        if (was_idle) {
            spdlog::debug("[VpnController] killall openvpn: {}", killed.error.technical_msg);
        } else {
            spdlog::warn("[VpnController] killall openvpn: {}", killed.error.technical_msg);
            result = killed.error;
        }
    }

    if (!client_iface.empty()) {
        remove_host_routes(client_iface);
    }

    set_state({VpnStateKind::Disconnected, std::nullopt});
    return result;
}

void VpnController::remove_host_routes(const std::string& client_iface) {
    ProcessResult routes = run("ip", {"-4", "route", "show", "dev", client_iface}, false);
    if (!routes.ok()) {
        spdlog::debug("[VpnController] Route listing on {} failed: {}", client_iface,
                      routes.error.technical_msg);
        return;
    }

    for (const auto& [dest, gw] : parse_host_routes(routes.out)) {
        ProcessResult del =
            run("ip", {"route", "del", dest, "via", gw, "dev", client_iface}, true);
        if (del.ok()) {
            spdlog::debug("[VpnController] Removed host route {} via {}", dest, gw);
        } else {
            spdlog::warn("[VpnController] Could not remove route {} via {}: {}", dest, gw,
                         del.error.technical_msg);
        }
    }
}

VpnState VpnController::probe() {
    std::lock_guard<std::mutex> lock(mutex_);

    // pgrep: 0 = match, 1 = no match, anything else = could not tell
    ProcessResult pgrep = run("pgrep", {"-x", "openvpn"}, false);
    bool alive;
    if (pgrep.ok()) {
        alive = true;
    } else if (pgrep.error.code == ErrorCode::TOOL_FAILED && pgrep.exit_code == 1) {
        alive = false;
    } else {
        spdlog::debug("[VpnController] Liveness probe inconclusive: {}",
                      pgrep.error.technical_msg);
        return state_;
    }

    switch (state_.kind) {
    case VpnStateKind::Connecting:
        if (!alive) {
            spdlog::warn("[VpnController] openvpn exited before the tunnel came up");
            set_state({VpnStateKind::Disconnected, std::nullopt});
        } else if (has_tunnel_link(options_.sys_class_net)) {
            set_state({VpnStateKind::Connected, state_.profile});
        } else if (!connect_timeout_logged_ &&
                   std::chrono::steady_clock::now() - connecting_since_ >=
                       options_.connect_timeout) {
            spdlog::warn("[VpnController] Tunnel not up after {}s, still waiting",
                         options_.connect_timeout.count());
            connect_timeout_logged_ = true;
        }
        break;
    case VpnStateKind::Connected:
        if (!alive) {
            spdlog::warn("[VpnController] openvpn is no longer running");
            set_state({VpnStateKind::Disconnected, std::nullopt});
        }
        break;
    case VpnStateKind::Disconnected:
        if (alive && killed_at_ &&
            std::chrono::steady_clock::now() - *killed_at_ < options_.exit_grace) {
            // Our own killall is still taking effect
            spdlog::debug("[VpnController] openvpn still exiting, not adopting it");
        } else if (alive) {
            spdlog::info("[VpnController] Found openvpn started outside this service");
            set_state({VpnStateKind::Connected, std::nullopt});
        }
        break;
    case VpnStateKind::Disconnecting:
        break;
    }
    return state_;
}

// ============================================================================
// Helpers
// ============================================================================

bool VpnController::has_tunnel_link(const std::string& sys_class_net) {
    DIR* dir = opendir(sys_class_net.c_str());
    if (!dir) {
        return false;
    }
    bool found = false;
    while (struct dirent* entry = readdir(dir)) {
        std::string name = entry->d_name;
        if (name.compare(0, 3, "tun") == 0 || name.compare(0, 3, "tap") == 0) {
            found = true;
            break;
        }
    }
    closedir(dir);
    return found;
}

std::vector<std::pair<std::string, std::string>>
VpnController::parse_host_routes(const std::string& output) {
    std::vector<std::pair<std::string, std::string>> routes;
    std::istringstream stream(output);
    std::string line;

    while (std::getline(stream, line)) {
        std::istringstream tokens(line);
        std::vector<std::string> words;
        std::string word;
        while (tokens >> word) {
            words.push_back(word);
        }
        if (words.size() < 3 || words[0] == "default") {
            continue;
        }

        // Host routes only: a bare address or a /32
        const std::string& dest = words[0];
        size_t slash = dest.find('/');
        if (slash != std::string::npos && dest.substr(slash) != "/32") {
            continue;
        }

        for (size_t i = 1; i + 1 < words.size(); ++i) {
            if (words[i] == "via") {
                routes.emplace_back(dest, words[i + 1]);
                break;
            }
        }
    }
    return routes;
}

} // namespace raspap
