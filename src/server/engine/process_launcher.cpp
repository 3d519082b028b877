// SPDX-License-Identifier: Apache-2.0
#include "server/engine/process_launcher.hpp"

#include "common/logger.hpp"
#include "common/metrics.hpp"

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <csignal>
#include <cstring>

extern char **environ;

namespace arena::engine {

std::vector<std::string> expand_args(
    const std::vector<std::string> &templ, const std::map<std::string, std::string> &vars)
{
    std::vector<std::string> out;
    out.reserve(templ.size());
    for (const auto &arg : templ) {
        std::string s = arg;
        for (const auto &[key, value] : vars) {
            std::string token = "{" + key + "}";
            size_t pos = 0;
            while ((pos = s.find(token, pos)) != std::string::npos) {
                s.replace(pos, token.size(), value);
                pos += value.size();
            }
        }
        out.push_back(std::move(s));
    }
    return out;
}

ChildProcess::~ChildProcess()
{
    kill_now();
}

ChildProcess::ChildProcess(ChildProcess &&other) noexcept
    : m_pid(other.m_pid), m_reaped(other.m_reaped), m_exit_code(other.m_exit_code),
      m_term_signal(other.m_term_signal)
{
    other.m_pid = -1;
}

ChildProcess &ChildProcess::operator=(ChildProcess &&other) noexcept
{
    if (this != &other) {
        kill_now();
        m_pid = other.m_pid;
        m_reaped = other.m_reaped;
        m_exit_code = other.m_exit_code;
        m_term_signal = other.m_term_signal;
        other.m_pid = -1;
    }
    return *this;
}

bool ChildProcess::spawn(const LaunchParams &params, std::string &error)
{
    if (m_pid > 0) {
        error = "process already spawned";
        return false;
    }
    std::error_code ec;
    std::filesystem::create_directories(params.workdir, ec);
    if (ec) {
        error = "cannot create workdir " + params.workdir.string() + ": " + ec.message();
        return false;
    }
    std::string out_path = (params.workdir / "engine_stdout.log").string();
    std::string err_path = (params.workdir / "engine_stderr.log").string();
    std::string workdir = params.workdir.string();

    // Everything the child needs is prepared before fork.
    std::vector<std::string> env_list;
    for (char **env = environ; env && *env; ++env)
        env_list.emplace_back(*env);
    for (const auto &e : params.extra_env)
        env_list.push_back(e);
    std::vector<char *> envp;
    envp.reserve(env_list.size() + 1);
    for (auto &entry : env_list)
        envp.push_back(entry.data());
    envp.push_back(nullptr);
    std::vector<char *> argv;
    argv.reserve(params.args.size() + 2);
    argv.push_back(const_cast<char *>(params.executable.c_str()));
    for (const auto &arg : params.args)
        argv.push_back(const_cast<char *>(arg.c_str()));
    argv.push_back(nullptr);

    int exec_pipe[2];
    if (::pipe2(exec_pipe, O_CLOEXEC) != 0) {
        error = std::string("pipe2 failed: ") + std::strerror(errno);
        return false;
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        error = std::string("fork failed: ") + std::strerror(errno);
        ::close(exec_pipe[0]);
        ::close(exec_pipe[1]);
        return false;
    }

    if (pid == 0) {
        ::close(exec_pipe[0]);
        (void)::setpgid(0, 0);
        int out_fd = ::open(out_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
        int err_fd = ::open(err_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
        if (out_fd >= 0) {
            ::dup2(out_fd, STDOUT_FILENO);
            ::close(out_fd);
        }
        if (err_fd >= 0) {
            ::dup2(err_fd, STDERR_FILENO);
            ::close(err_fd);
        }
        int dev_null = ::open("/dev/null", O_RDONLY);
        if (dev_null >= 0) {
            ::dup2(dev_null, STDIN_FILENO);
            ::close(dev_null);
        }
        int err = 0;
        if (::chdir(workdir.c_str()) != 0) {
            err = errno;
        } else {
            ::execve(params.executable.c_str(), argv.data(), envp.data());
            err = errno;
        }
        ssize_t w = ::write(exec_pipe[1], &err, sizeof(err));
        (void)w;
        ::_exit(127);
    }

    ::close(exec_pipe[1]);
    // Also set from the parent so a signal sent before the child runs still hits the group.
    (void)::setpgid(pid, pid);
    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(exec_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    ::close(exec_pipe[0]);

    m_pid = pid;
    m_reaped = false;
    m_exit_code.reset();
    m_term_signal.reset();
    if (n > 0) {
        // exec (or chdir) failed; the child exits 127 right away
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        record_status(status);
        error = "exec " + params.executable + " failed: " + std::strerror(child_errno);
        return false;
    }
    log::info("[launcher] spawned pid={} exe={} workdir={}", pid, params.executable, workdir);
    return true;
}

void ChildProcess::record_status(int status)
{
    m_reaped = true;
    if (WIFEXITED(status))
        m_exit_code = WEXITSTATUS(status);
    else if (WIFSIGNALED(status))
        m_term_signal = WTERMSIG(status);
}

bool ChildProcess::running()
{
    if (m_pid <= 0 || m_reaped)
        return false;
    int status = 0;
    pid_t r = ::waitpid(m_pid, &status, WNOHANG);
    if (r == 0)
        return true;
    if (r == m_pid) {
        record_status(status);
        return false;
    }
    if (r < 0 && errno == ECHILD) {
        // reaped elsewhere
        m_reaped = true;
        return false;
    }
    return true;
}

std::string ChildProcess::describe_exit() const
{
    if (m_exit_code)
        return "exit code " + std::to_string(*m_exit_code);
    if (m_term_signal)
        return std::string("signal ") + ::strsignal(*m_term_signal);
    return "running";
}

coro::task<bool> ChildProcess::terminate(
    std::shared_ptr<coro::io_scheduler> scheduler, std::chrono::milliseconds grace)
{
    if (!running())
        co_return true;
    ::kill(-m_pid, SIGTERM);
    auto deadline = std::chrono::steady_clock::now() + grace;
    while (std::chrono::steady_clock::now() < deadline) {
        if (!running()) {
            log::debug("[launcher] pid={} exited after SIGTERM ({})", m_pid, describe_exit());
            co_return true;
        }
        co_await scheduler->yield_for(std::chrono::milliseconds(20));
    }
    log::warn("[launcher] pid={} ignored SIGTERM for {}ms, sending SIGKILL", m_pid, grace.count());
    metrics::inc(metrics::runtime().engine_forced_kills);
    kill_now();
    co_return false;
}

void ChildProcess::kill_now()
{
    if (m_pid <= 0 || m_reaped)
        return;
    ::kill(-m_pid, SIGKILL);
    ::kill(m_pid, SIGKILL);
    int status = 0;
    pid_t r;
    do {
        r = ::waitpid(m_pid, &status, 0);
    } while (r < 0 && errno == EINTR);
    if (r == m_pid)
        record_status(status);
    else
        m_reaped = true;
}

} // namespace arena::engine
