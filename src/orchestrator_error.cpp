// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "orchestrator_error.h"

namespace raspap {

const char* error_code_name(ErrorCode code) {
    switch (code) {
    case ErrorCode::SUCCESS:
        return "success";
    case ErrorCode::TOOL_UNAVAILABLE:
        return "tool_unavailable";
    case ErrorCode::TOOL_TIMEOUT:
        return "tool_timeout";
    case ErrorCode::TOOL_FAILED:
        return "tool_failed";
    case ErrorCode::PERMISSION_DENIED:
        return "permission_denied";
    case ErrorCode::PROFILE_NOT_FOUND:
        return "profile_not_found";
    case ErrorCode::PARSE_ERROR:
        return "parse_error";
    case ErrorCode::NETWORK_UNREACHABLE:
        return "network_unreachable";
    case ErrorCode::NOT_INITIALIZED:
        return "not_initialized";
    case ErrorCode::CANCELLED:
        return "cancelled";
    case ErrorCode::INVALID_PARAMETERS:
        return "invalid_parameters";
    }
    return "unknown";
}

} // namespace raspap
