// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "process_runner.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sstream>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace raspap {

namespace {

constexpr int POLL_INTERVAL_MS = 50;

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

/// Read whatever is available on a non-blocking fd; closes it on EOF
void drain(int& fd, std::string& buffer) {
    if (fd < 0) {
        return;
    }
    char chunk[4096];
    while (true) {
        ssize_t n = read(fd, chunk, sizeof(chunk));
        if (n > 0) {
            constexpr size_t cap = SystemProcessRunner::MAX_CAPTURE_BYTES;
            size_t room = buffer.size() < cap ? cap - buffer.size() : 0;
            buffer.append(chunk, std::min(static_cast<size_t>(n), room));
            continue;
        }
        if (n == 0) {
            close_fd(fd);
            return;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno != EAGAIN && errno != EWOULDBLOCK) {
            close_fd(fd);
        }
        return;
    }
}

std::string trim_trailing(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ')) {
        s.pop_back();
    }
    return s;
}

} // namespace

std::string Command::to_string() const {
    std::string s = elevated ? "sudo -n " + program : program;
    for (const auto& a : args) {
        s += ' ';
        s += a;
    }
    return s;
}

SystemProcessRunner::SystemProcessRunner() {
    spdlog::debug("[ProcessRunner] Initialized");
}

SystemProcessRunner::~SystemProcessRunner() {
    cancel_all();
    // Use fprintf - spdlog may be destroyed during static cleanup
    fprintf(stderr, "[ProcessRunner] Destroyed\n");
}

std::string SystemProcessRunner::resolve_tool(const std::string& name) {
    if (name.empty()) {
        return "";
    }
    if (name.find('/') != std::string::npos) {
        return access(name.c_str(), X_OK) == 0 ? name : "";
    }

    // PATH first, then the usual system directories: systemd services often
    // run with a minimal PATH that lacks /usr/sbin and /sbin.
    std::vector<std::string> dirs;
    if (const char* path_env = std::getenv("PATH")) {
        std::stringstream ss(path_env);
        std::string dir;
        while (std::getline(ss, dir, ':')) {
            if (!dir.empty()) {
                dirs.push_back(dir);
            }
        }
    }
    for (const char* d : {"/usr/local/sbin", "/usr/local/bin", "/usr/sbin", "/usr/bin", "/sbin",
                          "/bin"}) {
        dirs.emplace_back(d);
    }

    for (const auto& dir : dirs) {
        std::string candidate = dir + "/" + name;
        if (access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
    }
    return "";
}

bool SystemProcessRunner::has_command(const std::string& name) {
    return !resolve_tool(name).empty();
}

void SystemProcessRunner::cancel_all() {
    cancelled_ = true;
    std::lock_guard<std::mutex> lock(children_mutex_);
    for (pid_t pid : children_) {
        kill(-pid, SIGTERM);
    }
}

void SystemProcessRunner::track(pid_t pid) {
    std::lock_guard<std::mutex> lock(children_mutex_);
    children_.insert(pid);
}

void SystemProcessRunner::untrack(pid_t pid) {
    std::lock_guard<std::mutex> lock(children_mutex_);
    children_.erase(pid);
}

void SystemProcessRunner::terminate_group(pid_t pid) {
    kill(-pid, SIGTERM);
    auto deadline = std::chrono::steady_clock::now() + KILL_GRACE;
    while (std::chrono::steady_clock::now() < deadline) {
        int status = 0;
        pid_t r = waitpid(pid, &status, WNOHANG);
        if (r == pid || (r < 0 && errno != EINTR)) {
            // Leader gone; still sweep any stragglers in its group
            kill(-pid, SIGKILL);
            return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(POLL_INTERVAL_MS));
    }
    kill(-pid, SIGKILL);
    int status = 0;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
}

ProcessResult SystemProcessRunner::run(const Command& cmd) {
    ProcessResult result;

    if (cancelled_) {
        result.error = ErrorHelper::cancelled();
        return result;
    }

    std::string tool_path = resolve_tool(cmd.program);
    if (tool_path.empty()) {
        spdlog::debug("[ProcessRunner] Tool not found: {}", cmd.program);
        result.error = ErrorHelper::tool_unavailable(cmd.program);
        return result;
    }

    std::vector<std::string> argv_strings;
    if (cmd.elevated) {
        std::string sudo_path = resolve_tool("sudo");
        if (sudo_path.empty()) {
            result.error = ErrorHelper::tool_unavailable("sudo");
            return result;
        }
        argv_strings = {sudo_path, "-n", tool_path};
    } else {
        argv_strings = {tool_path};
    }
    argv_strings.insert(argv_strings.end(), cmd.args.begin(), cmd.args.end());

    // Build argv before fork: no allocation in the child
    std::vector<char*> argv;
    argv.reserve(argv_strings.size() + 1);
    for (auto& s : argv_strings) {
        argv.push_back(const_cast<char*>(s.c_str()));
    }
    argv.push_back(nullptr);

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    if (pipe2(out_pipe, O_CLOEXEC) < 0 || pipe2(err_pipe, O_CLOEXEC) < 0) {
        spdlog::error("[ProcessRunner] pipe() failed: {}", strerror(errno));
        close_fd(out_pipe[0]);
        close_fd(out_pipe[1]);
        result.error = OrchestratorError(ErrorCode::TOOL_FAILED, "pipe() failed",
                                         "System command failed");
        return result;
    }

    spdlog::trace("[ProcessRunner] exec: {}", cmd.to_string());

    pid_t pid = fork();
    if (pid < 0) {
        spdlog::error("[ProcessRunner] fork() failed: {}", strerror(errno));
        close_fd(out_pipe[0]);
        close_fd(out_pipe[1]);
        close_fd(err_pipe[0]);
        close_fd(err_pipe[1]);
        result.error = OrchestratorError(ErrorCode::TOOL_FAILED, "fork() failed",
                                         "System command failed");
        return result;
    }

    if (pid == 0) {
        // Child: own process group so a timeout can kill the whole tree
        setpgid(0, 0);
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        execv(argv[0], argv.data());
        _exit(127);
    }

    setpgid(pid, pid);
    track(pid);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    int out_fd = out_pipe[0];
    int err_fd = err_pipe[0];
    fcntl(out_fd, F_SETFL, fcntl(out_fd, F_GETFL) | O_NONBLOCK);
    fcntl(err_fd, F_SETFL, fcntl(err_fd, F_GETFL) | O_NONBLOCK);

    const auto deadline = std::chrono::steady_clock::now() + cmd.timeout;
    int status = 0;
    bool exited = false;
    bool timed_out = false;
    bool was_cancelled = false;

    while (true) {
        pollfd fds[2];
        nfds_t nfds = 0;
        if (out_fd >= 0) {
            fds[nfds++] = {out_fd, POLLIN, 0};
        }
        if (err_fd >= 0) {
            fds[nfds++] = {err_fd, POLLIN, 0};
        }
        if (nfds > 0) {
            int pr = poll(fds, nfds, POLL_INTERVAL_MS);
            if (pr < 0 && errno != EINTR) {
                spdlog::debug("[ProcessRunner] poll() failed: {}", strerror(errno));
            }
        } else {
            std::this_thread::sleep_for(std::chrono::milliseconds(POLL_INTERVAL_MS));
        }

        drain(out_fd, result.out);
        drain(err_fd, result.err);

        if (!exited) {
            pid_t r = waitpid(pid, &status, WNOHANG);
            if (r == pid) {
                exited = true;
            } else if (r < 0 && errno != EINTR) {
                spdlog::error("[ProcessRunner] waitpid() failed: {}", strerror(errno));
                exited = true;
                status = -1;
            }
        }

        if (exited) {
            // A daemonizing tool may leave a grandchild holding the pipes;
            // the leader's exit is what we wait for.
            drain(out_fd, result.out);
            drain(err_fd, result.err);
            break;
        }

        if (cancelled_) {
            was_cancelled = true;
            terminate_group(pid);
            break;
        }

        if (std::chrono::steady_clock::now() >= deadline) {
            timed_out = true;
            terminate_group(pid);
            break;
        }
    }

    untrack(pid);
    close_fd(out_fd);
    close_fd(err_fd);

    if (was_cancelled) {
        result.error = ErrorHelper::cancelled();
        return result;
    }

    if (timed_out) {
        spdlog::warn("[ProcessRunner] Command timed out: {}", cmd.to_string());
        result.error = ErrorHelper::tool_timeout(
            cmd.program,
            static_cast<int>(
                std::chrono::duration_cast<std::chrono::milliseconds>(cmd.timeout).count()));
        return result;
    }

    result.exit_code = (status >= 0 && WIFEXITED(status)) ? WEXITSTATUS(status) : -1;
    std::string err_text = trim_trailing(result.err);

    if (result.exit_code == 0) {
        result.error = ErrorHelper::success();
    } else if (cmd.elevated && err_text.find("password is required") != std::string::npos) {
        spdlog::warn("[ProcessRunner] sudo refused (no passwordless sudo): {}", cmd.to_string());
        result.error = ErrorHelper::permission_denied(cmd.program);
    } else if (result.exit_code == 127 && err_text.empty()) {
        result.error = ErrorHelper::tool_unavailable(cmd.program);
    } else {
        spdlog::debug("[ProcessRunner] '{}' exited with code {}", cmd.to_string(),
                      result.exit_code);
        result.error = ErrorHelper::tool_failed(cmd.program, result.exit_code, err_text);
    }
    return result;
}

} // namespace raspap
