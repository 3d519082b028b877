// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <coro/coro.hpp>
#include <coro/io_scheduler.hpp>

#include <sys/types.h>

#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace arena::engine {

struct LaunchParams
{
    std::string executable;
    std::vector<std::string> args; // already expanded
    std::filesystem::path workdir; // created if missing; child chdir()s into it
    std::vector<std::string> extra_env; // KEY=VALUE appended to the inherited environment
};

// Replaces {name} placeholders in each argument. Unknown placeholders are kept verbatim.
std::vector<std::string> expand_args(
    const std::vector<std::string> &templ, const std::map<std::string, std::string> &vars);

// One child process in its own process group. stdout/stderr go to
// engine_stdout.log / engine_stderr.log inside the working directory.
// The destructor kills the group if it is still running.
class ChildProcess
{
public:
    ChildProcess() = default;
    ~ChildProcess();
    ChildProcess(const ChildProcess &) = delete;
    ChildProcess &operator=(const ChildProcess &) = delete;
    ChildProcess(ChildProcess &&other) noexcept;
    ChildProcess &operator=(ChildProcess &&other) noexcept;

    // Fails (with error text) when fork fails or when execve fails in the child;
    // exec failures are reported synchronously through a close-on-exec pipe.
    bool spawn(const LaunchParams &params, std::string &error);

    // Non-blocking liveness check; reaps the child and records its exit status.
    bool running();
    pid_t pid() const { return m_pid; }
    std::optional<int> exit_code() const { return m_exit_code; }
    std::optional<int> term_signal() const { return m_term_signal; }
    std::string describe_exit() const;

    // SIGTERM to the group, wait up to grace, then SIGKILL. Yields to the
    // scheduler while waiting. Returns false when SIGKILL was needed.
    coro::task<bool> terminate(std::shared_ptr<coro::io_scheduler> scheduler, std::chrono::milliseconds grace);

    // Immediate SIGKILL + blocking reap.
    void kill_now();

private:
    void record_status(int status);

    pid_t m_pid{-1};
    bool m_reaped{false};
    std::optional<int> m_exit_code;
    std::optional<int> m_term_signal;
};

} // namespace arena::engine
