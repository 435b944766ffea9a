// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "process_runner.h"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <string>
#include <thread>

using namespace raspap;
using namespace std::chrono_literals;

// These tests exec real binaries from coreutils and /bin/sh.

TEST_CASE("Command: to_string renders the argv", "[process][command]") {
    SECTION("plain") {
        Command cmd("nmcli", {"device", "wifi", "list"});
        REQUIRE(cmd.to_string() == "nmcli device wifi list");
        REQUIRE_FALSE(cmd.elevated);
        REQUIRE(cmd.timeout == 10000ms);
    }

    SECTION("elevated commands show the sudo prefix") {
        Command cmd("wpa_cli", {"-i", "wlan0", "scan"}, true);
        REQUIRE(cmd.to_string() == "sudo -n wpa_cli -i wlan0 scan");
    }
}

TEST_CASE("SystemProcessRunner: exit status mapping", "[process][runner]") {
    SystemProcessRunner runner;

    SECTION("zero exit is success") {
        ProcessResult r = runner.run(Command("true", {}));
        REQUIRE(r.ok());
        REQUIRE(r.exit_code == 0);
    }

    SECTION("non-zero exit is TOOL_FAILED") {
        ProcessResult r = runner.run(Command("false", {}));
        REQUIRE_FALSE(r.ok());
        REQUIRE(r.error.code == ErrorCode::TOOL_FAILED);
        REQUIRE(r.exit_code == 1);
    }

    SECTION("stdout and stderr are captured separately") {
        ProcessResult r =
            runner.run(Command("sh", {"-c", "echo hello; echo oops >&2; exit 3"}));
        REQUIRE(r.exit_code == 3);
        REQUIRE(r.out == "hello\n");
        REQUIRE(r.err == "oops\n");
        REQUIRE(r.error.code == ErrorCode::TOOL_FAILED);
        REQUIRE(r.error.technical_msg.find("oops") != std::string::npos);
    }

    SECTION("arguments are passed verbatim, no shell expansion") {
        ProcessResult r = runner.run(Command("echo", {"$HOME; rm -rf /"}));
        REQUIRE(r.ok());
        REQUIRE(r.out == "$HOME; rm -rf /\n");
    }
}

TEST_CASE("SystemProcessRunner: missing tools", "[process][runner]") {
    SystemProcessRunner runner;

    SECTION("unknown program is TOOL_UNAVAILABLE without spawning") {
        ProcessResult r = runner.run(Command("raspap-no-such-tool-xyz", {}));
        REQUIRE(r.error.code == ErrorCode::TOOL_UNAVAILABLE);
        REQUIRE(r.exit_code == -1);
    }

    SECTION("has_command") {
        REQUIRE(runner.has_command("sh"));
        REQUIRE_FALSE(runner.has_command("raspap-no-such-tool-xyz"));
        REQUIRE_FALSE(runner.has_command(""));
    }

    SECTION("resolve_tool finds absolute paths and PATH entries") {
        REQUIRE(SystemProcessRunner::resolve_tool("/bin/sh") == "/bin/sh");
        REQUIRE_FALSE(SystemProcessRunner::resolve_tool("sh").empty());
        REQUIRE(SystemProcessRunner::resolve_tool("/nonexistent/sh").empty());
    }
}

TEST_CASE("SystemProcessRunner: timeout kills the child", "[process][runner][slow]") {
    SystemProcessRunner runner;

    auto start = std::chrono::steady_clock::now();
    ProcessResult r = runner.run(Command("sleep", {"10"}, false, 200ms));
    auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(r.error.code == ErrorCode::TOOL_TIMEOUT);
    REQUIRE(elapsed < 3s);
}

TEST_CASE("SystemProcessRunner: cancel_all", "[process][runner][slow]") {
    SystemProcessRunner runner;

    SECTION("kills an in-flight child") {
        ProcessResult r;
        std::thread worker([&]() { r = runner.run(Command("sleep", {"10"}, false, 20000ms)); });

        std::this_thread::sleep_for(300ms);
        auto start = std::chrono::steady_clock::now();
        runner.cancel_all();
        worker.join();

        REQUIRE(r.error.code == ErrorCode::CANCELLED);
        REQUIRE(std::chrono::steady_clock::now() - start < 3s);
    }

    SECTION("later calls fail fast") {
        runner.cancel_all();
        ProcessResult r = runner.run(Command("true", {}));
        REQUIRE(r.error.code == ErrorCode::CANCELLED);
    }
}
