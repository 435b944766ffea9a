// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "raspap_api.h"

#include "hv/json.hpp"
#include "hv/requests.h"

#include <spdlog/spdlog.h>

#include <cstdlib>

using json = nlohmann::json;

namespace raspap {

RaspApApi::RaspApApi(std::string base_url, std::string api_key, int timeout_sec)
    : base_url_(std::move(base_url)), api_key_(std::move(api_key)), timeout_sec_(timeout_sec) {
    while (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }
}

RaspApApi RaspApApi::from_environment() {
    const char* base = std::getenv("RASPAP_API_BASE_URL");
    const char* key = std::getenv("RASPAP_API_KEY");
    RaspApApi api((base && *base) ? base : DEFAULT_BASE_URL, key ? key : "");
    if (!api.has_credentials()) {
        spdlog::info("[RaspApApi] RASPAP_API_KEY not set, client count disabled");
    }
    return api;
}

OrchestratorError RaspApApi::query_clients(const std::string& ap_iface, int& count) const {
    count = 0;
    if (api_key_.empty()) {
        return ErrorHelper::success();
    }

    std::string url = base_url_ + "/clients/" + ap_iface;
    try {
        auto req = std::make_shared<HttpRequest>();
        req->method = HTTP_GET;
        req->url = url;
        req->timeout = timeout_sec_;
        req->headers["access_token"] = api_key_;

        auto resp = requests::request(req);
        if (!resp) {
            return ErrorHelper::network_unreachable("no response from " + url);
        }
        int status_code = static_cast<int>(resp->status_code);
        if (status_code < 200 || status_code >= 300) {
            return ErrorHelper::network_unreachable("GET " + url + " returned HTTP " +
                                                    std::to_string(status_code));
        }
        return parse_client_count(resp->body, count);
    } catch (const std::exception& e) {
        return ErrorHelper::network_unreachable(e.what());
    }
}

int RaspApApi::connected_clients(const std::string& ap_iface) const {
    int count = 0;
    OrchestratorError err = query_clients(ap_iface, count);
    if (!err.success()) {
        spdlog::debug("[RaspApApi] Client count unavailable ({}): {}", error_code_name(err.code),
                      err.technical_msg);
        return 0;
    }
    return count;
}

OrchestratorError RaspApApi::parse_client_count(const std::string& body, int& count) {
    count = 0;
    json data;
    try {
        data = json::parse(body);
    } catch (const json::parse_error& e) {
        return ErrorHelper::parse_error(std::string("unparsable clients response: ") + e.what());
    }
    if (!data.is_object()) {
        return ErrorHelper::parse_error("clients response is not a JSON object");
    }
    if (!data.contains("active_clients")) {
        return ErrorHelper::success();
    }

    const json& clients = data["active_clients"];
    if (!clients.is_array() && !clients.is_object()) {
        return ErrorHelper::parse_error("active_clients is neither a list nor an object");
    }
    count = static_cast<int>(clients.size());
    return ErrorHelper::success();
}

} // namespace raspap
