// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "geolocation.h"

#include "hv/json.hpp"
#include "hv/requests.h"

#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace raspap {

std::string GeoLocation::display() const {
    if (city && country) {
        return *city + ", " + *country;
    }
    if (country) {
        return *country;
    }
    if (city) {
        return *city;
    }
    return "";
}

const char* refresh_reason_name(RefreshReason reason) {
    switch (reason) {
    case RefreshReason::Startup:
        return "startup";
    case RefreshReason::Periodic:
        return "periodic";
    case RefreshReason::StateChange:
        return "state_change";
    }
    return "unknown";
}

namespace {

GeoLocation failed(OrchestratorError error) {
    GeoLocation result;
    result.message = error.technical_msg;
    result.error = std::move(error);
    return result;
}

} // namespace

// ============================================================================
// HttpGeoLookup
// ============================================================================

HttpGeoLookup::HttpGeoLookup(std::string url, int timeout_sec)
    : url_(std::move(url)), timeout_sec_(timeout_sec) {}

GeoLocation HttpGeoLookup::lookup() {
    GeoLocation result;

    try {
        auto req = std::make_shared<HttpRequest>();
        req->method = HTTP_GET;
        req->url = url_;
        req->timeout = timeout_sec_;
        req->headers["Accept"] = "application/json";

        auto resp = requests::request(req);
        if (!resp) {
            result = failed(ErrorHelper::network_unreachable("no response from " + url_));
        } else {
            int status_code = static_cast<int>(resp->status_code);
            if (status_code < 200 || status_code >= 300) {
                result = failed(
                    ErrorHelper::network_unreachable("HTTP " + std::to_string(status_code)));
            } else {
                result = parse_response(resp->body);
            }
        }
    } catch (const std::exception& e) {
        result = failed(ErrorHelper::network_unreachable(e.what()));
    }

    if (!result.ok()) {
        spdlog::debug("[GeoLookup] {} failed ({}): {}", url_, error_code_name(result.error.code),
                      result.error.technical_msg);
    }
    result.fetched_at = std::chrono::system_clock::now();
    return result;
}

GeoLocation HttpGeoLookup::parse_response(const std::string& body) {
    json data;
    try {
        data = json::parse(body);
    } catch (const json::parse_error& e) {
        return failed(ErrorHelper::parse_error(std::string("unparsable response: ") + e.what()));
    }
    if (!data.is_object()) {
        return failed(ErrorHelper::parse_error("response is not a JSON object"));
    }
    if (!data.contains("status") || !data["status"].is_string()) {
        return failed(ErrorHelper::parse_error("response has no status"));
    }

    std::string status = data["status"].get<std::string>();
    if (status != "success" && status != "ok") {
        std::string why = "lookup status '" + status + "'";
        if (data.contains("message") && data["message"].is_string()) {
            why = data["message"].get<std::string>();
        }
        return failed(ErrorHelper::network_unreachable(why));
    }

    GeoLocation result;
    result.status = GeoLocation::Status::Ok;
    if (data.contains("country") && data["country"].is_string()) {
        result.country = data["country"].get<std::string>();
    }
    if (data.contains("city") && data["city"].is_string()) {
        result.city = data["city"].get<std::string>();
    }
    return result;
}

// ============================================================================
// GeolocationRefresher
// ============================================================================

GeolocationRefresher::GeolocationRefresher(GeoLookup& lookup, std::chrono::seconds geoip_interval,
                                           std::chrono::seconds debounce)
    : lookup_(lookup), geoip_interval_(geoip_interval), debounce_(debounce) {}

bool GeolocationRefresher::should_fetch(RefreshTrigger trigger, Clock::time_point now) const {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!last_fetch_ || now - *last_fetch_ >= geoip_interval_) {
        return true;
    }
    if (trigger.reason == RefreshReason::StateChange &&
        (!last_state_fetch_ || now - *last_state_fetch_ >= debounce_)) {
        return true;
    }
    if (trigger.reason == RefreshReason::Startup && !startup_consumed_) {
        return true;
    }
    return false;
}

std::optional<GeoLocation> GeolocationRefresher::maybe_refresh(RefreshTrigger trigger,
                                                               Clock::time_point now) {
    if (!should_fetch(trigger, now)) {
        spdlog::trace("[Geolocation] {} trigger suppressed", refresh_reason_name(trigger.reason));
        return std::nullopt;
    }

    bool expected = false;
    if (!in_flight_.compare_exchange_strong(expected, true)) {
        spdlog::debug("[Geolocation] Lookup already in flight, skipping {} trigger",
                      refresh_reason_name(trigger.reason));
        return std::nullopt;
    }

    if (trigger.reason == RefreshReason::Startup) {
        std::lock_guard<std::mutex> lock(mutex_);
        startup_consumed_ = true;
    }

    spdlog::debug("[Geolocation] Fetching ({})", refresh_reason_name(trigger.reason));
    GeoLocation result = lookup_.lookup();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (result.ok()) {
            last_fetch_ = now;
            if (trigger.reason == RefreshReason::StateChange) {
                last_state_fetch_ = now;
            }
            last_good_ = result;
            spdlog::info("[Geolocation] Location: {}", result.display());
        } else {
            spdlog::warn("[Geolocation] Lookup failed ({}): {}", error_code_name(result.error.code),
                         result.error.technical_msg);
        }
    }

    in_flight_ = false;
    return result;
}

std::optional<GeoLocation> GeolocationRefresher::last_known() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_good_;
}

} // namespace raspap
