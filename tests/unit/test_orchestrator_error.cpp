// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "orchestrator_error.h"

#include <catch2/catch_test_macros.hpp>

#include <string>

using namespace raspap;

TEST_CASE("OrchestratorError: success and failure", "[error]") {
    SECTION("default is success") {
        OrchestratorError err;
        REQUIRE(err.success());
        REQUIRE(static_cast<bool>(err));
    }

    SECTION("non-success code is falsy") {
        OrchestratorError err = ErrorHelper::tool_timeout("nmcli", 10000);
        REQUIRE_FALSE(err.success());
        REQUIRE_FALSE(static_cast<bool>(err));
        REQUIRE(err.code == ErrorCode::TOOL_TIMEOUT);
        REQUIRE(err.technical_msg == "nmcli timed out after 10000 ms");
    }
}

TEST_CASE("ErrorHelper: tool_failed keeps stderr", "[error]") {
    OrchestratorError err = ErrorHelper::tool_failed("wpa_cli", 255, "Failed to connect");
    REQUIRE(err.code == ErrorCode::TOOL_FAILED);
    REQUIRE(err.technical_msg == "wpa_cli exited with code 255: Failed to connect");

    OrchestratorError quiet = ErrorHelper::tool_failed("pgrep", 1, "");
    REQUIRE(quiet.technical_msg == "pgrep exited with code 1");
}

TEST_CASE("ErrorHelper: user-facing text is set", "[error]") {
    REQUIRE_FALSE(ErrorHelper::permission_denied("openvpn").user_msg.empty());
    REQUIRE_FALSE(ErrorHelper::permission_denied("openvpn").suggestion.empty());
    REQUIRE_FALSE(ErrorHelper::profile_not_found("/x.ovpn").suggestion.empty());
    REQUIRE(ErrorHelper::cancelled().code == ErrorCode::CANCELLED);
    REQUIRE(ErrorHelper::parse_error("bad body").code == ErrorCode::PARSE_ERROR);
    REQUIRE(ErrorHelper::network_unreachable("HTTP 503").technical_msg == "HTTP 503");
}

TEST_CASE("error_code_name: stable identifiers", "[error]") {
    REQUIRE(std::string(error_code_name(ErrorCode::SUCCESS)) == "success");
    REQUIRE(std::string(error_code_name(ErrorCode::TOOL_UNAVAILABLE)) == "tool_unavailable");
    REQUIRE(std::string(error_code_name(ErrorCode::TOOL_TIMEOUT)) == "tool_timeout");
    REQUIRE(std::string(error_code_name(ErrorCode::PERMISSION_DENIED)) == "permission_denied");
    REQUIRE(std::string(error_code_name(ErrorCode::PROFILE_NOT_FOUND)) == "profile_not_found");
    REQUIRE(std::string(error_code_name(ErrorCode::PARSE_ERROR)) == "parse_error");
    REQUIRE(std::string(error_code_name(ErrorCode::NETWORK_UNREACHABLE)) == "network_unreachable");
}
