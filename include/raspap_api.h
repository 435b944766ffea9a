// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "orchestrator_error.h"

#include <string>

namespace raspap {

/**
 * @brief Client for the RaspAP REST API (connected-client count only)
 *
 * Credentials come from the environment. Without an API key no request is
 * made and the count is 0; every failure also yields 0.
 */
class RaspApApi {
  public:
    static constexpr const char* DEFAULT_BASE_URL = "http://localhost:8081";
    static constexpr int DEFAULT_TIMEOUT_SEC = 5;

    RaspApApi(std::string base_url, std::string api_key, int timeout_sec = DEFAULT_TIMEOUT_SEC);

    /// Build from RASPAP_API_BASE_URL and RASPAP_API_KEY
    static RaspApApi from_environment();

    /**
     * @brief GET {base}/clients/{ap_iface} and count active_clients
     *
     * NETWORK_UNREACHABLE for transport or HTTP failures, PARSE_ERROR for a
     * body parse_client_count() rejects. @p count is 0 unless this succeeds.
     */
    OrchestratorError query_clients(const std::string& ap_iface, int& count) const;

    /// query_clients() with every failure logged and counted as 0
    int connected_clients(const std::string& ap_iface) const;

    /**
     * @brief Size of `active_clients` (array or object)
     *
     * A missing `active_clients` key counts as 0. A body that is not a JSON
     * object, or an `active_clients` of another type, is PARSE_ERROR.
     */
    static OrchestratorError parse_client_count(const std::string& body, int& count);

    bool has_credentials() const {
        return !api_key_.empty();
    }

    const std::string& base_url() const {
        return base_url_;
    }

  private:
    std::string base_url_;
    std::string api_key_;
    int timeout_sec_;
};

} // namespace raspap
