//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ChildProcess.cpp
// Purpose: Boost.Process based spawning and lifetime control of tool-server processes
//==========================================================================================================

#include <unistd.h>
#include <fcntl.h>
#include <errno.h>
#include <csignal>
#include <cstring>
#include <sys/types.h>
#include <sys/wait.h>

#include <format>
#include <mutex>
#include <system_error>
#include <thread>

#include <boost/process/args.hpp>
#include <boost/process/child.hpp>
#include <boost/process/env.hpp>
#include <boost/process/environment.hpp>
#include <boost/process/exe.hpp>
#include <boost/process/extend.hpp>
#include <boost/process/io.hpp>
#include <boost/process/pipe.hpp>
#include <boost/process/search_path.hpp>

#include "logging/Logger.h"
#include "mcphost/ChildProcess.hpp"
#include "mcphost/errors/Errors.h"

namespace bp = boost::process;

namespace mcphost {

namespace {
std::once_flag gSigpipeOnce;

// Writes to a peer that has gone away must surface as EPIPE, not terminate the host.
void ignoreSigpipe() {
    std::call_once(gSigpipeOnce, []() {
        if (::signal(SIGPIPE, SIG_IGN) == SIG_ERR) {
            LOG_WARN("ChildProcess: failed to ignore SIGPIPE (errno={} msg={})", errno, ::strerror(errno));
        }
    });
}

// Pipes are created close-on-exec; dup2 in the child clears the flag on fds 0/1/2 only.
bp::pipe makePipe() {
    int fds[2]{-1, -1};
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        throw errors::SessionError(errors::ErrorKind::SpawnFailure,
            std::format("pipe2 failed (errno={} msg={})", errno, ::strerror(errno)));
    }
    return bp::pipe(fds[0], fds[1]);
}

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}
} // namespace

class ChildProcess::Impl {
public:
    mutable std::mutex mutex;
    bp::child child;
    int pid{-1};
    int stdinFd{-1};
    int stdoutFd{-1};
    int stderrFd{-1};
    bool exited{false};
    std::optional<int> exitCode;
    std::string description;

    ~Impl() {
        std::lock_guard<std::mutex> lock(mutex);
        terminateLocked();
        closeFd(stdinFd);
        closeFd(stdoutFd);
        closeFd(stderrFd);
    }

    // Polls without blocking; records the exit status once the process is reaped.
    bool runningLocked() {
        if (exited || !child.valid()) {
            return false;
        }
        std::error_code ec;
        bool alive = child.running(ec);
        if (ec) {
            LOG_WARN("ChildProcess: status query failed for pid {} ({})", pid, ec.message());
            return alive;
        }
        if (!alive) {
            exited = true;
            exitCode = child.exit_code();
        }
        return alive;
    }

    void terminateLocked() {
        if (!child.valid() || !runningLocked()) {
            return;
        }
        // Still unreaped, so the pid cannot have been recycled.
        if (::kill(pid, SIGKILL) != 0 && errno != ESRCH) {
            LOG_WARN("ChildProcess: kill({}) failed (errno={} msg={})", pid, errno, ::strerror(errno));
        }
        int status = 0;
        pid_t r;
        do {
            r = ::waitpid(pid, &status, 0);
        } while (r < 0 && errno == EINTR);
        exited = true;
        if (r == pid) {
            exitCode = WIFEXITED(status) ? WEXITSTATUS(status) : (WIFSIGNALED(status) ? WTERMSIG(status) : status);
        }
        // Reaped here; keep the boost handle from signalling a recycled pid later.
        child.detach();
        LOG_INFO("ChildProcess: terminated pid {} ({})", pid, description);
    }
};

ChildProcess::ChildProcess() : pImpl(std::make_unique<Impl>()) {}

ChildProcess::~ChildProcess() = default;

std::unique_ptr<ChildProcess> ChildProcess::Spawn(const ServerConfig& config) {
    FUNC_SCOPE();
    using errors::ErrorKind;
    using errors::SessionError;

    if (config.command.empty()) {
        throw SessionError(ErrorKind::SpawnFailure, std::format("Server '{}': empty command", config.name));
    }
    ignoreSigpipe();

    boost::filesystem::path exePath;
    if (config.command.find('/') != std::string::npos) {
        exePath = config.command;
    } else {
        exePath = bp::search_path(config.command);
        if (exePath.empty()) {
            throw SessionError(ErrorKind::SpawnFailure,
                std::format("Server '{}': command '{}' not found in PATH", config.name, config.command));
        }
    }

    bp::environment env = boost::this_process::environment();
    for (const auto& [key, value] : config.env) {
        env[key] = value;
    }

    bp::pipe inPipe = makePipe();
    bp::pipe outPipe = makePipe();
    bp::pipe errPipe = makePipe();

    std::unique_ptr<ChildProcess> proc(new ChildProcess());
    auto& impl = *proc->pImpl;
    impl.description = exePath.string();
    for (const auto& a : config.args) {
        impl.description += " " + a;
    }

    std::error_code ec;
    impl.child = bp::child(
        bp::exe(exePath),
        bp::args(config.args),
        env,
        bp::std_in < inPipe,
        bp::std_out > outPipe,
        bp::std_err > errPipe,
        bp::extend::on_exec_setup = [](auto&) { ::signal(SIGPIPE, SIG_DFL); },
        ec);
    if (ec || !impl.child.valid()) {
        throw SessionError(ErrorKind::SpawnFailure,
            std::format("Server '{}': failed to start '{}': {}", config.name, impl.description,
                        ec ? ec.message() : std::string("invalid child handle")));
    }

    // The child-side ends were closed by boost on success; take ownership of the parent-side ends.
    impl.stdinFd = inPipe.native_sink();
    inPipe.assign_sink(-1);
    impl.stdoutFd = outPipe.native_source();
    outPipe.assign_source(-1);
    impl.stderrFd = errPipe.native_source();
    errPipe.assign_source(-1);
    impl.pid = static_cast<int>(impl.child.id());

    LOG_INFO("ChildProcess: started '{}' as pid {} for server '{}'", impl.description, impl.pid, config.name);
    return proc;
}

int ChildProcess::Pid() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->pid;
}

int ChildProcess::StdinFd() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->stdinFd;
}

int ChildProcess::StdoutFd() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->stdoutFd;
}

int ChildProcess::StderrFd() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->stderrFd;
}

void ChildProcess::CloseStdin() {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    closeFd(pImpl->stdinFd);
}

bool ChildProcess::IsRunning() {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->runningLocked();
}

std::optional<int> ChildProcess::ExitCode() {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    (void)pImpl->runningLocked();
    return pImpl->exitCode;
}

bool ChildProcess::WaitForExit(std::chrono::milliseconds timeout) {
    FUNC_SCOPE();
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        {
            std::lock_guard<std::mutex> lock(pImpl->mutex);
            if (!pImpl->runningLocked()) {
                return true;
            }
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

void ChildProcess::Terminate() {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    pImpl->terminateLocked();
}

const std::string& ChildProcess::Description() const {
    return pImpl->description;
}

} // namespace mcphost
