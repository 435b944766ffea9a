// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "orchestrator_error.h"

#include <atomic>
#include <chrono>
#include <mutex>
#include <set>
#include <string>
#include <sys/types.h>
#include <vector>

namespace raspap {

/**
 * @brief Typed external command invocation
 *
 * Arguments are passed to execv() as-is; no shell ever sees them.
 */
struct Command {
    std::string program;           ///< Tool name ("nmcli") or absolute path
    std::vector<std::string> args; ///< Arguments after the program name
    bool elevated = false;         ///< Run through "sudo -n"
    std::chrono::milliseconds timeout{10000};

    Command() = default;
    Command(std::string prog, std::vector<std::string> a, bool elev = false,
            std::chrono::milliseconds t = std::chrono::milliseconds(10000))
        : program(std::move(prog)), args(std::move(a)), elevated(elev), timeout(t) {}

    /// Space-joined rendering for log messages only
    std::string to_string() const;
};

/**
 * @brief Outcome of one external command
 */
struct ProcessResult {
    int exit_code = -1;
    std::string out;
    std::string err;
    OrchestratorError error; ///< SUCCESS only when the tool ran and exited 0

    bool ok() const {
        return error.success();
    }
};

/**
 * @brief Single choke point for every external tool invocation
 *
 * Timeout and elevation policy live here so that no caller can forget them.
 * Implementations must be safe to call from several threads at once.
 *
 * - SystemProcessRunner: fork/exec with captured pipes (production)
 * - MockProcessRunner (tests/mocks): scripted responses
 */
class ProcessRunner {
  public:
    virtual ~ProcessRunner() = default;

    /**
     * @brief Run a command to completion or timeout
     *
     * Never throws. Distinguishes TOOL_UNAVAILABLE (not spawned), TOOL_TIMEOUT
     * (killed), PERMISSION_DENIED (sudo refused), TOOL_FAILED (non-zero exit)
     * and CANCELLED (runner shut down).
     */
    virtual ProcessResult run(const Command& cmd) = 0;

    /**
     * @brief Check whether a tool can be found on this system
     */
    virtual bool has_command(const std::string& name) = 0;

    /**
     * @brief Abort every in-flight command and refuse new ones
     */
    virtual void cancel_all() = 0;
};

/**
 * @brief fork/exec implementation of ProcessRunner
 *
 * Children run in their own process group so a timeout can take down
 * everything the tool spawned. stdout/stderr are captured through pipes and
 * capped at MAX_CAPTURE_BYTES each.
 */
class SystemProcessRunner : public ProcessRunner {
  public:
    static constexpr size_t MAX_CAPTURE_BYTES = 1024 * 1024;
    static constexpr auto KILL_GRACE = std::chrono::milliseconds(500);

    SystemProcessRunner();
    ~SystemProcessRunner() override;

    ProcessResult run(const Command& cmd) override;
    bool has_command(const std::string& name) override;
    void cancel_all() override;

    /**
     * @brief Locate an executable on PATH and the standard system directories
     * @return Absolute path, or empty string if not found
     */
    static std::string resolve_tool(const std::string& name);

  private:
    std::atomic<bool> cancelled_{false};
    std::mutex children_mutex_;
    std::set<pid_t> children_; ///< Process groups currently running

    void track(pid_t pid);
    void untrack(pid_t pid);
    static void terminate_group(pid_t pid);
};

} // namespace raspap
