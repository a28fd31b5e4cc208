//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerProcess.cpp
// Purpose: fork/exec based child process with stdio pipes and stderr drain
//==========================================================================================================

#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/eventfd.h>
#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <cstring>
#include <filesystem>
#include <mutex>
#include <thread>
#include <vector>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "mcppool/ServerProcess.hpp"

namespace mcppool {

namespace {
constexpr std::chrono::milliseconds kDestructorGrace{500};

std::once_flag gSigpipeOnce;

// Writes to a dead child must fail with EPIPE instead of killing the host process
void ignoreSigpipe() {
    std::call_once(gSigpipeOnce, []() {
        struct sigaction sa{};
        sa.sa_handler = SIG_IGN;
        ::sigemptyset(&sa.sa_mask);
        if (::sigaction(SIGPIPE, &sa, nullptr) != 0) {
            LOG_WARN("ServerProcess: failed to ignore SIGPIPE (errno={} msg={})", errno, ::strerror(errno));
        }
    });
}

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

struct PipePair {
    int fds[2]{-1, -1};
    bool open() { return ::pipe2(fds, O_CLOEXEC) == 0; }
    void close() {
        closeFd(fds[0]);
        closeFd(fds[1]);
    }
};
// Python servers run from a sibling venv when one exists, and must not buffer stdout
void applyPythonLaunchRules(const ServerConfig& config, std::string& command,
                            std::map<std::string, std::string>& env) {
    if ((config.command != "python" && config.command != "python3") || config.args.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::path script(config.args.front());
    if (std::filesystem::exists(script, ec)) {
        auto venvPython = script.parent_path() / "venv" / "bin" / "python";
        if (std::filesystem::exists(venvPython, ec)) {
            command = venvPython.string();
            LOG_INFO("[{}] using virtualenv interpreter {}", config.name, command);
        } else {
            LOG_DEBUG("[{}] no virtualenv beside {}; using {}", config.name, script.string(), command);
        }
    }

    auto cfgPath = config.env.find("PYTHONPATH");
    if (cfgPath != config.env.end()) {
        const std::string inherited = GetEnvOrDefault("PYTHONPATH", "");
        env["PYTHONPATH"] = inherited.empty() ? cfgPath->second : cfgPath->second + ":" + inherited;
    }
    env["PYTHONIOENCODING"] = "utf-8";
    env["PYTHONUNBUFFERED"] = "1";
}
} // namespace

class ServerProcess::Impl {
public:
    std::string name;
    pid_t pid{-1};
    int stdinFd{-1};
    int stdoutFd{-1};
    int stderrFd{-1};
    int wakeEventFd{-1};

    std::mutex writeMutex;      // serializes lines on stdin; guards stdinFd
    std::mutex waitMutex;       // guards exitCode and waitpid
    std::mutex terminateMutex;
    std::optional<int> exitCode;
    bool terminated{false};
    std::thread stderrThread;

    ~Impl() {
        closeFd(stdinFd);
        closeFd(stdoutFd);
        closeFd(stderrFd);
        closeFd(wakeEventFd);
    }

    std::optional<int> reap(bool block) {
        std::lock_guard<std::mutex> lk(waitMutex);
        if (exitCode.has_value() || pid <= 0) {
            return exitCode;
        }
        int status = 0;
        pid_t r;
        do {
            r = ::waitpid(pid, &status, block ? 0 : WNOHANG);
        } while (r < 0 && errno == EINTR);
        if (r == pid) {
            if (WIFEXITED(status)) {
                exitCode = WEXITSTATUS(status);
            } else if (WIFSIGNALED(status)) {
                exitCode = 128 + WTERMSIG(status);
            } else {
                exitCode = -1;
            }
            LOG_INFO("[{}] process {} exited with status {}", name, pid, exitCode.value());
        } else if (r < 0) {
            LOG_WARN("[{}] waitpid({}) failed (errno={} msg={})", name, pid, errno, ::strerror(errno));
            exitCode = -1;
        }
        return exitCode;
    }

    void emitStderrLines(std::string& buffer, bool flush) {
        std::size_t pos;
        while ((pos = buffer.find('\n')) != std::string::npos) {
            std::string line = buffer.substr(0, pos);
            buffer.erase(0, pos + 1);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (!line.empty()) {
                LOG_INFO("[{}] stderr: {}", name, line);
            }
        }
        if (flush && !buffer.empty()) {
            LOG_INFO("[{}] stderr: {}", name, buffer);
            buffer.clear();
        }
    }

    void startStderrDrain() {
        stderrThread = std::thread([this]() {
            std::string buffer;
            std::array<char, 4096> tmp{};
            for (;;) {
                struct pollfd pfds[2];
                pfds[0].fd = stderrFd; pfds[0].events = POLLIN; pfds[0].revents = 0;
                pfds[1].fd = wakeEventFd; pfds[1].events = POLLIN; pfds[1].revents = 0;
                int rc = ::poll(pfds, 2, -1);
                if (rc < 0) {
                    if (errno == EINTR) {
                        continue;
                    }
                    LOG_ERROR("[{}] stderr poll failed (errno={} msg={})", name, errno, ::strerror(errno));
                    break;
                }
                if (pfds[1].revents & POLLIN) {
                    break;
                }
                if (pfds[0].revents & (POLLIN | POLLHUP | POLLERR)) {
                    ssize_t n = ::read(stderrFd, tmp.data(), tmp.size());
                    if (n > 0) {
                        buffer.append(tmp.data(), static_cast<std::size_t>(n));
                        emitStderrLines(buffer, false);
                        continue;
                    }
                    if (n == 0) {
                        break;
                    }
                    if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
                        continue;
                    }
                    LOG_WARN("[{}] stderr read failed (errno={} msg={})", name, errno, ::strerror(errno));
                    break;
                }
            }
            emitStderrLines(buffer, true);
        });
    }

    void stopStderrDrain() {
        if (wakeEventFd >= 0) {
            uint64_t one = 1;
            ssize_t w;
            do {
                w = ::write(wakeEventFd, &one, sizeof(one));
            } while (w < 0 && errno == EINTR);
            if (w < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
                LOG_WARN("[{}] eventfd write failed (errno={} msg={})", name, errno, ::strerror(errno));
            }
        }
        if (stderrThread.joinable()) {
            stderrThread.join();
        }
    }
};

ServerProcess::ServerProcess() : pImpl(std::make_unique<Impl>()) {}

ServerProcess::~ServerProcess() {
    Terminate(kDestructorGrace);
}

Result<std::unique_ptr<ServerProcess>> ServerProcess::Spawn(const ServerConfig& config) {
    FUNC_SCOPE();
    if (config.command.empty()) {
        return Error(ErrorCode::SpawnError, "server '" + config.name + "' has an empty command");
    }
    ignoreSigpipe();

    // Everything the child needs is built before fork; the child only calls async-signal-safe functions
    auto env = SnapshotEnvironment();
    for (const auto& [k, v] : config.env) {
        env[k] = v;
    }
    std::string command = config.command;
    applyPythonLaunchRules(config, command, env);

    std::vector<std::string> argvStore;
    argvStore.push_back(command);
    argvStore.insert(argvStore.end(), config.args.begin(), config.args.end());
    std::vector<char*> argv;
    for (auto& a : argvStore) {
        argv.push_back(a.data());
    }
    argv.push_back(nullptr);
    std::vector<std::string> envStore;
    envStore.reserve(env.size());
    for (const auto& [k, v] : env) {
        envStore.push_back(k + "=" + v);
    }
    std::vector<char*> envp;
    for (auto& e : envStore) {
        envp.push_back(e.data());
    }
    envp.push_back(nullptr);

    PipePair in, out, err, status;
    if (!in.open() || !out.open() || !err.open() || !status.open()) {
        int e = errno;
        in.close(); out.close(); err.close(); status.close();
        LOG_ERROR("[{}] pipe creation failed (errno={} msg={})", config.name, e, ::strerror(e));
        return Error(ErrorCode::SpawnError, fmt::format("pipe creation failed: {}", ::strerror(e)));
    }

    int wakeFd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (wakeFd < 0) {
        int e = errno;
        in.close(); out.close(); err.close(); status.close();
        LOG_ERROR("[{}] eventfd creation failed (errno={} msg={})", config.name, e, ::strerror(e));
        return Error(ErrorCode::SpawnError, fmt::format("eventfd creation failed: {}", ::strerror(e)));
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        int e = errno;
        in.close(); out.close(); err.close(); status.close();
        closeFd(wakeFd);
        LOG_ERROR("[{}] fork failed (errno={} msg={})", config.name, e, ::strerror(e));
        return Error(ErrorCode::SpawnError, fmt::format("fork failed: {}", ::strerror(e)));
    }

    if (pid == 0) {
        struct sigaction sa{};
        sa.sa_handler = SIG_DFL;
        ::sigemptyset(&sa.sa_mask);

        int childErr = 0;
        if (::sigaction(SIGPIPE, &sa, nullptr) != 0 ||
            ::dup2(in.fds[0], STDIN_FILENO) < 0 ||
            ::dup2(out.fds[1], STDOUT_FILENO) < 0 ||
            ::dup2(err.fds[1], STDERR_FILENO) < 0) {
            childErr = errno;
        } else {
            ::execvpe(argv[0], argv.data(), envp.data());
            childErr = errno;
        }
        ssize_t ignored = ::write(status.fds[1], &childErr, sizeof(childErr));
        (void)ignored;
        ::_exit(127);
    }

    closeFd(in.fds[0]);
    closeFd(out.fds[1]);
    closeFd(err.fds[1]);
    closeFd(status.fds[1]);

    // The status pipe closes on successful exec (CLOEXEC); an errno arrives otherwise
    int childErrno = 0;
    ssize_t n;
    do {
        n = ::read(status.fds[0], &childErrno, sizeof(childErrno));
    } while (n < 0 && errno == EINTR);
    closeFd(status.fds[0]);

    if (n > 0) {
        int st = 0;
        pid_t r;
        do {
            r = ::waitpid(pid, &st, 0);
        } while (r < 0 && errno == EINTR);
        in.close(); out.close(); err.close();
        closeFd(wakeFd);
        LOG_ERROR("[{}] failed to start '{}': {}", config.name, command, ::strerror(childErrno));
        return Error(ErrorCode::SpawnError,
                     fmt::format("cannot execute '{}': {}", command, ::strerror(childErrno)));
    }

    int flags = ::fcntl(out.fds[0], F_GETFL, 0);
    if (flags < 0 || ::fcntl(out.fds[0], F_SETFL, flags | O_NONBLOCK) < 0) {
        LOG_WARN("[{}] could not make stdout non-blocking (errno={} msg={})", config.name, errno, ::strerror(errno));
    }

    std::unique_ptr<ServerProcess> proc(new ServerProcess());
    Impl& impl = *proc->pImpl;
    impl.name = config.name;
    impl.pid = pid;
    impl.stdinFd = in.fds[1];
    impl.stdoutFd = out.fds[0];
    impl.stderrFd = err.fds[0];
    impl.wakeEventFd = wakeFd;
    impl.startStderrDrain();

    LOG_INFO("[{}] started '{}' (pid {})", config.name, command, pid);
    return Result<std::unique_ptr<ServerProcess>>(std::move(proc));
}

Status ServerProcess::WriteLine(const std::string& line) {
    std::string payload = line;
    if (payload.empty() || payload.back() != '\n') {
        payload.push_back('\n');
    }

    std::lock_guard<std::mutex> lk(pImpl->writeMutex);
    if (pImpl->stdinFd < 0) {
        return Error(ErrorCode::BrokenPipe, "stdin of '" + pImpl->name + "' is closed");
    }
    std::size_t total = 0;
    while (total < payload.size()) {
        ssize_t w = ::write(pImpl->stdinFd, payload.data() + total, payload.size() - total);
        if (w > 0) {
            total += static_cast<std::size_t>(w);
            continue;
        }
        if (w < 0 && errno == EINTR) {
            continue;
        }
        int e = errno;
        LOG_WARN("[{}] write to stdin failed (errno={} msg={})", pImpl->name, e, ::strerror(e));
        return Error(ErrorCode::BrokenPipe, fmt::format("write to '{}' failed: {}", pImpl->name, ::strerror(e)));
    }
    return Status::Ok();
}

std::optional<int> ServerProcess::ExitCode() {
    return pImpl->reap(false);
}

pid_t ServerProcess::Pid() const { return pImpl->pid; }
int ServerProcess::StdoutFd() const { return pImpl->stdoutFd; }
const std::string& ServerProcess::Name() const { return pImpl->name; }

void ServerProcess::CloseStdin() {
    std::lock_guard<std::mutex> lk(pImpl->writeMutex);
    closeFd(pImpl->stdinFd);
}

void ServerProcess::Terminate(std::chrono::milliseconds grace) {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lk(pImpl->terminateMutex);
    if (pImpl->terminated || pImpl->pid <= 0) {
        return;
    }
    pImpl->terminated = true;

    // A writer blocked on a full pipe holds writeMutex; it is released by EPIPE once the child is gone
    bool stdinClosed = false;
    {
        std::unique_lock<std::mutex> wl(pImpl->writeMutex, std::try_to_lock);
        if (wl.owns_lock()) {
            closeFd(pImpl->stdinFd);
            stdinClosed = true;
        }
    }

    if (!pImpl->reap(false).has_value()) {
        LOG_DEBUG("[{}] sending SIGTERM to {}", pImpl->name, pImpl->pid);
        if (::kill(pImpl->pid, SIGTERM) != 0 && errno != ESRCH) {
            LOG_WARN("[{}] SIGTERM failed (errno={} msg={})", pImpl->name, errno, ::strerror(errno));
        }
        auto deadline = std::chrono::steady_clock::now() + grace;
        while (!pImpl->reap(false).has_value() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        if (!pImpl->reap(false).has_value()) {
            LOG_WARN("[{}] did not exit within {} ms; sending SIGKILL", pImpl->name,
                     static_cast<long long>(grace.count()));
            if (::kill(pImpl->pid, SIGKILL) != 0 && errno != ESRCH) {
                LOG_WARN("[{}] SIGKILL failed (errno={} msg={})", pImpl->name, errno, ::strerror(errno));
            }
            (void)pImpl->reap(true);
        }
    }

    if (!stdinClosed) {
        CloseStdin();
    }
    pImpl->stopStderrDrain();
    closeFd(pImpl->stderrFd);
}

} // namespace mcppool
