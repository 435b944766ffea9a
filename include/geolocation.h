// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "orchestrator_error.h"

#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>
#include <string>

namespace raspap {

/**
 * @brief Result of a geolocation lookup
 */
struct GeoLocation {
    enum class Status { Ok, Error };

    Status status = Status::Error;
    std::optional<std::string> country;
    std::optional<std::string> city;
    std::optional<std::string> message; ///< Service or transport error text
    OrchestratorError error;            ///< NETWORK_UNREACHABLE or PARSE_ERROR on failure
    std::chrono::system_clock::time_point fetched_at{};

    bool ok() const {
        return status == Status::Ok;
    }

    /// "City, Country" for the status bar; whichever part is known
    std::string display() const;
};

enum class RefreshReason { Startup, Periodic, StateChange };

const char* refresh_reason_name(RefreshReason reason);

struct RefreshTrigger {
    RefreshReason reason;
};

/**
 * @brief Remote lookup seam
 *
 * - HttpGeoLookup: ip-api.com style JSON endpoint (production)
 * - MockGeoLookup (tests/mocks): scripted answers
 */
class GeoLookup {
  public:
    virtual ~GeoLookup() = default;

    /// Perform one lookup; never throws, failures come back as Status::Error
    virtual GeoLocation lookup() = 0;
};

/**
 * @brief GET a JSON geolocation endpoint with libhv
 */
class HttpGeoLookup : public GeoLookup {
  public:
    static constexpr const char* DEFAULT_URL =
        "http://ip-api.com/json/?fields=status,message,country,city";
    static constexpr int DEFAULT_TIMEOUT_SEC = 5;

    explicit HttpGeoLookup(std::string url = DEFAULT_URL, int timeout_sec = DEFAULT_TIMEOUT_SEC);

    GeoLocation lookup() override;

    /**
     * @brief Interpret a response body
     *
     * `status` of "success" (ip-api) or "ok" is a success. A body that is not
     * a JSON object with a `status` string is PARSE_ERROR; any other status is
     * the service refusing the lookup (NETWORK_UNREACHABLE).
     */
    static GeoLocation parse_response(const std::string& body);

  private:
    std::string url_;
    int timeout_sec_;
};

/**
 * @brief Decides when a lookup is worth doing and keeps the last good answer
 *
 * A fetch happens when any of these hold:
 * - the periodic floor has passed since the last successful fetch (or there
 *   has never been one);
 * - the trigger is a state change and the debounce window has passed since
 *   the last successful state-change fetch;
 * - the trigger is the first startup trigger of this process.
 *
 * A failed lookup leaves both the stored value and the timers untouched.
 */
class GeolocationRefresher {
  public:
    using Clock = std::chrono::steady_clock;

    GeolocationRefresher(GeoLookup& lookup, std::chrono::seconds geoip_interval,
                         std::chrono::seconds debounce = std::chrono::seconds(3));

    /**
     * @brief Fetch if the policy allows it
     * @return The fetch outcome (ok or error), or nullopt when no fetch ran
     */
    std::optional<GeoLocation> maybe_refresh(RefreshTrigger trigger, Clock::time_point now);

    /// Last successful lookup, if any
    std::optional<GeoLocation> last_known() const;

    bool should_fetch(RefreshTrigger trigger, Clock::time_point now) const;

  private:
    GeoLookup& lookup_;
    std::chrono::seconds geoip_interval_;
    std::chrono::seconds debounce_;

    mutable std::mutex mutex_;
    std::optional<Clock::time_point> last_fetch_;
    std::optional<Clock::time_point> last_state_fetch_;
    bool startup_consumed_ = false;
    std::optional<GeoLocation> last_good_;

    std::atomic<bool> in_flight_{false};
};

} // namespace raspap
