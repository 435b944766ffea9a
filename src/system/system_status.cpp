// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "system_status.h"

#include "hv/json.hpp"
#include "raspap_api.h"

#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace raspap {

SystemStatusReader::SystemStatusReader(ProcessRunner& runner, const RaspApApi* api,
                                       std::chrono::milliseconds command_timeout,
                                       std::string thermal_path)
    : runner_(runner), api_(api), command_timeout_(command_timeout),
      thermal_path_(std::move(thermal_path)) {}

std::string SystemStatusReader::first_line(const std::string& program,
                                           std::vector<std::string> args) {
    ProcessResult res = runner_.run(Command(program, std::move(args), false, command_timeout_));
    std::string line;
    std::istringstream stream(res.out);
    std::getline(stream, line);
    while (!line.empty() && (line.back() == '\r' || line.back() == ' ')) {
        line.pop_back();
    }
    return line;
}

SystemStatus SystemStatusReader::read(const InterfaceRoles& roles) {
    SystemStatus status;

    // is-active prints the state and exits non-zero for anything but "active"
    status.ap_active = first_line("systemctl", {"is-active", "hostapd"}) == "active";
    status.client_ip = interface_ip(roles.client_iface);
    status.ap_ip = interface_ip(roles.ap_iface);
    status.hostname = first_line("hostname", {});
    status.uptime = first_line("uptime", {"-p"});
    if (status.uptime.compare(0, 3, "up ") == 0) {
        status.uptime.erase(0, 3);
    }

    std::ifstream temp_file(thermal_path_);
    if (temp_file.is_open()) {
        std::stringstream buffer;
        buffer << temp_file.rdbuf();
        status.cpu_temp_c = parse_millidegrees(buffer.str());
    }

    if (api_) {
        status.connected_clients = api_->connected_clients(roles.ap_iface);
    }

    spdlog::trace("[SystemStatus] hostapd={} client_ip={} ap_ip={} clients={}", status.ap_active,
                  status.client_ip.value_or("-"), status.ap_ip.value_or("-"),
                  status.connected_clients);
    return status;
}

std::optional<std::string> SystemStatusReader::interface_ip(const std::string& iface) {
    ProcessResult res = runner_.run(
        Command("ip", {"-j", "-4", "addr", "show", iface}, false, command_timeout_));
    if (!res.ok()) {
        return std::nullopt;
    }
    return parse_ip_json(res.out);
}

std::optional<std::string> SystemStatusReader::parse_ip_json(const std::string& output) {
    try {
        json data = json::parse(output);
        if (!data.is_array()) {
            return std::nullopt;
        }
        for (const auto& link : data) {
            if (!link.contains("addr_info") || !link["addr_info"].is_array()) {
                continue;
            }
            for (const auto& addr : link["addr_info"]) {
                if (addr.value("family", "") == "inet" && addr.contains("local") &&
                    addr["local"].is_string()) {
                    return addr["local"].get<std::string>();
                }
            }
        }
    } catch (const json::exception& e) {
        spdlog::debug("[SystemStatus] Unparsable ip output: {}", e.what());
    }
    return std::nullopt;
}

std::optional<double> SystemStatusReader::parse_millidegrees(const std::string& text) {
    try {
        long milli = std::stol(text);
        return static_cast<double>(milli) / 1000.0;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

} // namespace raspap
