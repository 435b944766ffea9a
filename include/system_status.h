// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "interface_resolver.h"
#include "process_runner.h"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace raspap {

class RaspApApi;

/**
 * @brief Host facts shown on the status screen
 */
struct SystemStatus {
    bool ap_active = false; ///< hostapd unit is active
    std::optional<std::string> client_ip;
    std::optional<std::string> ap_ip;
    std::string hostname;
    std::string uptime; ///< "3 hours, 2 minutes" (uptime -p without its "up ")
    std::optional<double> cpu_temp_c;
    int connected_clients = 0;
};

/**
 * @brief Gathers SystemStatus; every field degrades independently
 */
class SystemStatusReader {
  public:
    static constexpr const char* DEFAULT_THERMAL_PATH = "/sys/class/thermal/thermal_zone0/temp";

    SystemStatusReader(ProcessRunner& runner, const RaspApApi* api,
                       std::chrono::milliseconds command_timeout,
                       std::string thermal_path = DEFAULT_THERMAL_PATH);

    SystemStatus read(const InterfaceRoles& roles);

    /**
     * @brief First IPv4 address in `ip -j -4 addr show <iface>` output
     */
    static std::optional<std::string> parse_ip_json(const std::string& output);

    /**
     * @brief Millidegrees text from the thermal zone to degrees Celsius
     */
    static std::optional<double> parse_millidegrees(const std::string& text);

  private:
    ProcessRunner& runner_;
    const RaspApApi* api_;
    std::chrono::milliseconds command_timeout_;
    std::string thermal_path_;

    std::optional<std::string> interface_ip(const std::string& iface);
    std::string first_line(const std::string& program, std::vector<std::string> args);
};

} // namespace raspap
