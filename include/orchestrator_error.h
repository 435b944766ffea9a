// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <string>

namespace raspap {

/**
 * @brief Result code shared by every orchestrator component
 */
enum class ErrorCode {
    SUCCESS = 0,         ///< Operation succeeded
    TOOL_UNAVAILABLE,    ///< Binary not found or not executable
    TOOL_TIMEOUT,        ///< External tool exceeded its time budget and was killed
    TOOL_FAILED,         ///< External tool exited non-zero (stderr retained)
    PERMISSION_DENIED,   ///< Elevation required but no passwordless sudo
    PROFILE_NOT_FOUND,   ///< VPN configuration file missing
    PARSE_ERROR,         ///< Unexpected tool or service output format
    NETWORK_UNREACHABLE, ///< Geolocation or RaspAP API request failed
    NOT_INITIALIZED,     ///< Component not started
    CANCELLED,           ///< Aborted by shutdown
    INVALID_PARAMETERS   ///< Rejected input (empty SSID, control characters...)
};

/**
 * @brief Detailed error information for orchestrator operations
 */
struct OrchestratorError {
    ErrorCode code;            ///< Primary error code
    std::string technical_msg; ///< Technical details for logging/debugging
    std::string user_msg;      ///< User-friendly message for UI display
    std::string suggestion;    ///< Suggested action for user (optional)

    OrchestratorError(ErrorCode c = ErrorCode::SUCCESS, const std::string& tech = "",
                      const std::string& user = "", const std::string& suggest = "")
        : code(c), technical_msg(tech), user_msg(user), suggestion(suggest) {}

    bool success() const {
        return code == ErrorCode::SUCCESS;
    }
    explicit operator bool() const {
        return success();
    }
};

/**
 * @brief Short stable name for an error code ("tool_timeout", ...)
 */
const char* error_code_name(ErrorCode code);

/**
 * @brief Factory helpers producing user-facing messages for common failures
 */
class ErrorHelper {
  public:
    static OrchestratorError tool_unavailable(const std::string& tool) {
        return OrchestratorError(ErrorCode::TOOL_UNAVAILABLE, tool + " not found in PATH",
                                 "Required system tool is missing",
                                 "Install " + tool + " or check the service PATH");
    }

    static OrchestratorError tool_timeout(const std::string& tool, int timeout_ms) {
        return OrchestratorError(ErrorCode::TOOL_TIMEOUT,
                                 tool + " timed out after " + std::to_string(timeout_ms) + " ms",
                                 "System command timed out", "Try again in a moment");
    }

    static OrchestratorError tool_failed(const std::string& tool, int exit_code,
                                         const std::string& stderr_text) {
        std::string tech = tool + " exited with code " + std::to_string(exit_code);
        if (!stderr_text.empty()) {
            tech += ": " + stderr_text;
        }
        return OrchestratorError(ErrorCode::TOOL_FAILED, tech, "System command failed");
    }

    static OrchestratorError permission_denied(const std::string& tool) {
        return OrchestratorError(ErrorCode::PERMISSION_DENIED,
                                 "sudo refused to run " + tool + " without a password",
                                 "Permission denied",
                                 "Grant passwordless sudo for " + tool + " to this user");
    }

    static OrchestratorError profile_not_found(const std::string& path) {
        return OrchestratorError(ErrorCode::PROFILE_NOT_FOUND, "VPN profile missing: " + path,
                                 "VPN profile not found",
                                 "Check vpn_profiles in config.json and the ovpn directory");
    }

    static OrchestratorError parse_error(const std::string& what) {
        return OrchestratorError(ErrorCode::PARSE_ERROR, what, "Unexpected response format");
    }

    static OrchestratorError network_unreachable(const std::string& what) {
        return OrchestratorError(ErrorCode::NETWORK_UNREACHABLE, what, "Network unreachable",
                                 "Check the uplink connection");
    }

    static OrchestratorError cancelled() {
        return OrchestratorError(ErrorCode::CANCELLED, "Operation cancelled by shutdown",
                                 "Cancelled");
    }

    static OrchestratorError success() {
        return OrchestratorError(ErrorCode::SUCCESS);
    }
};

} // namespace raspap
