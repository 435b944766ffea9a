// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "process_runner.h"

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace raspap {

/**
 * @brief A VPN profile listed in config.json
 */
struct VpnProfile {
    std::string display_name;
    std::string file; ///< Relative to the ovpn directory, or absolute

    bool operator==(const VpnProfile& o) const {
        return display_name == o.display_name && file == o.file;
    }
};

enum class VpnStateKind { Disconnected, Connecting, Connected, Disconnecting };

const char* vpn_state_name(VpnStateKind kind);

/**
 * @brief VPN lifecycle state
 *
 * `profile` is set while Connecting, and while Connected unless the running
 * openvpn was started by something other than this controller.
 */
struct VpnState {
    VpnStateKind kind = VpnStateKind::Disconnected;
    std::optional<VpnProfile> profile;

    bool operator==(const VpnState& o) const {
        return kind == o.kind && profile == o.profile;
    }
};

struct VpnOptions {
    std::string ovpn_dir = "assets/ovpn";
    std::string sys_class_net = "/sys/class/net"; ///< Where tun/tap links appear
    std::chrono::seconds connect_timeout{30};
    std::chrono::milliseconds command_timeout{10000};
    std::chrono::seconds exit_grace{10}; ///< After a kill, a lingering openvpn is not adopted
};

/**
 * @brief Idempotent manager for a single openvpn client process
 *
 * States: Disconnected -> Connecting -> Connected -> Disconnecting -> Disconnected.
 * One mutex covers every transition including its external commands, so a
 * connect can never interleave with a disconnect or a probe. At most one
 * openvpn instance is launched per connect.
 */
class VpnController {
  public:
    VpnController(ProcessRunner& runner, VpnOptions options);
    ~VpnController();

    /**
     * @brief Start openvpn for the profile
     *
     * No-op success while Connecting or Connected. A missing profile file
     * gives PROFILE_NOT_FOUND and launches nothing.
     */
    OrchestratorError connect(const VpnProfile& profile);

    /**
     * @brief Stop openvpn and remove host routes it left on client_iface
     *
     * Always ends Disconnected. The coarse killall is issued from any state;
     * from Disconnected its failure is ignored. An empty client_iface skips
     * the route cleanup.
     */
    OrchestratorError disconnect(const std::string& client_iface = "");

    /**
     * @brief Reconcile state with the process table and tunnel links
     */
    VpnState probe();

    VpnState status() const;

    /// Full path of a profile's config file
    std::string profile_path(const VpnProfile& profile) const;

    /**
     * @brief True if a tun* or tap* link exists under the given directory
     */
    static bool has_tunnel_link(const std::string& sys_class_net);

    /**
     * @brief (destination, gateway) pairs of host routes in `ip -4 route show dev X`
     */
    static std::vector<std::pair<std::string, std::string>>
    parse_host_routes(const std::string& output);

  private:
    ProcessRunner& runner_;
    VpnOptions options_;

    mutable std::mutex mutex_;
    VpnState state_;
    std::chrono::steady_clock::time_point connecting_since_{};
    bool connect_timeout_logged_ = false;
    std::optional<std::chrono::steady_clock::time_point> killed_at_;

    ProcessResult run(const std::string& program, std::vector<std::string> args, bool elevated);
    void remove_host_routes(const std::string& client_iface);
    void set_state(VpnState next);
};

} // namespace raspap
