// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "child_process.h"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

extern char** environ;

namespace kiro2api {

namespace {

constexpr auto POLL_INTERVAL = std::chrono::milliseconds(50);

/// Both ends are close-on-exec from creation, so a concurrent popen() never inherits them
int open_status_pipe(int fds[2]) {
#ifdef __linux__
    return pipe2(fds, O_CLOEXEC);
#else
    // No pipe2(): FD_CLOEXEC is set right after creation
    if (pipe(fds) != 0) {
        return -1;
    }
    for (int i = 0; i < 2; i++) {
        int flags = fcntl(fds[i], F_GETFD);
        if (flags >= 0) {
            fcntl(fds[i], F_SETFD, flags | FD_CLOEXEC);
        }
    }
    return 0;
#endif
}

/// Inherited environment with overrides applied (KEY=VALUE strings)
std::vector<std::string> build_environment(
    const std::vector<std::pair<std::string, std::string>>& overrides) {
    std::vector<std::string> env;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        std::string key = entry.substr(0, entry.find('='));
        bool overridden = false;
        for (const auto& kv : overrides) {
            if (kv.first == key) {
                overridden = true;
                break;
            }
        }
        if (!overridden) {
            env.push_back(std::move(entry));
        }
    }
    for (const auto& kv : overrides) {
        env.push_back(kv.first + "=" + kv.second);
    }
    return env;
}

/// Report errno to the parent and exit (async-signal-safe)
[[noreturn]] void child_fail(int fd) {
    int err = errno;
    ssize_t ignored = write(fd, &err, sizeof(err));
    (void)ignored;
    _exit(127);
}

} // namespace

SidecarError ChildProcess::spawn(const SpawnOptions& opts, std::unique_ptr<ChildProcess>& out) {
    out.reset();

    int log_fd = open(opts.log_path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (log_fd < 0) {
        return SidecarErrorHelper::spawn_failed("open log file failed (" + opts.log_path +
                                                "): " + strerror(errno));
    }

    int null_fd = open("/dev/null", O_RDONLY | O_CLOEXEC);
    if (null_fd < 0) {
        std::string reason = strerror(errno);
        close(log_fd);
        return SidecarErrorHelper::spawn_failed("open /dev/null failed: " + reason);
    }

    int status_pipe[2];
    if (open_status_pipe(status_pipe) != 0) {
        std::string reason = strerror(errno);
        close(log_fd);
        close(null_fd);
        return SidecarErrorHelper::spawn_failed("pipe failed: " + reason);
    }

    // Everything the child needs is prepared before fork()
    std::vector<std::string> arg_strings;
    arg_strings.push_back(opts.executable);
    arg_strings.insert(arg_strings.end(), opts.args.begin(), opts.args.end());
    std::vector<char*> child_argv;
    for (auto& arg : arg_strings) {
        child_argv.push_back(const_cast<char*>(arg.c_str()));
    }
    child_argv.push_back(nullptr);

    std::vector<std::string> env_strings = build_environment(opts.env);
    std::vector<char*> child_envp;
    for (auto& entry : env_strings) {
        child_envp.push_back(const_cast<char*>(entry.c_str()));
    }
    child_envp.push_back(nullptr);

    pid_t pid = fork();

    if (pid < 0) {
        std::string reason = strerror(errno);
        close(log_fd);
        close(null_fd);
        close(status_pipe[0]);
        close(status_pipe[1]);
        return SidecarErrorHelper::spawn_failed("fork failed: " + reason);
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls from here on
        if (dup2(null_fd, STDIN_FILENO) < 0 || dup2(log_fd, STDOUT_FILENO) < 0 ||
            dup2(log_fd, STDERR_FILENO) < 0) {
            child_fail(status_pipe[1]);
        }
        if (!opts.working_dir.empty() && chdir(opts.working_dir.c_str()) != 0) {
            child_fail(status_pipe[1]);
        }
        execve(opts.executable.c_str(), child_argv.data(), child_envp.data());
        child_fail(status_pipe[1]);
    }

    // Parent
    close(status_pipe[1]);
    close(log_fd);
    close(null_fd);

    int child_errno = 0;
    ssize_t n;
    do {
        n = read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close(status_pipe[0]);

    if (n > 0) {
        // exec never happened; the child has already exited with 127
        int status;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        spdlog::error("[ChildProcess] exec of {} failed: {}", opts.executable,
                      strerror(child_errno));
        return SidecarErrorHelper::spawn_failed("failed to start sidecar with runtime '" +
                                                opts.executable +
                                                "': " + strerror(child_errno));
    }

    spdlog::info("[ChildProcess] Started {} (PID {})", opts.executable, pid);
    out.reset(new ChildProcess(pid));
    return SidecarErrorHelper::success();
}

ChildProcess::~ChildProcess() {
    if (!exit_) {
        spdlog::warn("[ChildProcess] Handle for PID {} destroyed while running, terminating",
                     pid_);
        terminate();
    }
}

bool ChildProcess::reap(bool block) {
    if (exit_) {
        return true;
    }

    int status = 0;
    pid_t result;
    do {
        result = waitpid(pid_, &status, block ? 0 : WNOHANG);
    } while (result < 0 && errno == EINTR);

    if (result == 0) {
        return false;
    }

    ChildExit info;
    if (result < 0) {
        // ECHILD: reaped elsewhere, status unknown
        spdlog::debug("[ChildProcess] waitpid({}) failed: {}", pid_, strerror(errno));
        info.exit_code = -1;
    } else if (WIFEXITED(status)) {
        info.exit_code = WEXITSTATUS(status);
        spdlog::info("[ChildProcess] PID {} exited with code {}", pid_, info.exit_code);
    } else if (WIFSIGNALED(status)) {
        info.was_signaled = true;
        info.signal_num = WTERMSIG(status);
        spdlog::info("[ChildProcess] PID {} killed by signal {} ({})", pid_, info.signal_num,
                     strsignal(info.signal_num));
    }
    exit_ = info;
    return true;
}

bool ChildProcess::is_alive() {
    return !reap(false);
}

void ChildProcess::terminate(std::chrono::milliseconds grace) {
    if (reap(false)) {
        return;
    }

    spdlog::debug("[ChildProcess] Sending SIGTERM to PID {}", pid_);
    kill(pid_, SIGTERM);

    auto deadline = std::chrono::steady_clock::now() + grace;
    while (std::chrono::steady_clock::now() < deadline) {
        if (reap(false)) {
            return;
        }
        std::this_thread::sleep_for(POLL_INTERVAL);
    }

    spdlog::warn("[ChildProcess] PID {} still running after {}ms, sending SIGKILL", pid_,
                 grace.count());
    kill(pid_, SIGKILL);
    reap(true);
}

} // namespace kiro2api
