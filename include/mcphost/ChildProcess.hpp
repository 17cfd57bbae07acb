//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ChildProcess.hpp
// Purpose: Tool-server process handle with redirected stdin/stdout/stderr pipes
//==========================================================================================================
#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "mcphost/Protocol.h"

namespace mcphost {

//==========================================================================================================
// ChildProcess
// Purpose: Owns one spawned peer process and the parent's ends of its three standard-stream pipes.
//          The destructor kills the process if it is still running and reaps it.
// Notes:
//   All pipe descriptors are close-on-exec in the parent, so concurrently spawned peers never inherit
//   each other's pipes. The peer starts with the default SIGPIPE disposition.
//==========================================================================================================
class ChildProcess {
public:
    //==========================================================================================================
    // Spawn
    // Purpose: Starts config.command with config.args; config.env is layered over the inherited environment.
    //          A command without '/' is resolved through PATH.
    // Throws:
    //   errors::SessionError(SpawnFailure) when the executable cannot be found or started.
    //==========================================================================================================
    static std::unique_ptr<ChildProcess> Spawn(const ServerConfig& config);

    ~ChildProcess();
    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    int Pid() const;

    // Parent-side pipe ends; -1 once closed.
    int StdinFd() const;
    int StdoutFd() const;
    int StderrFd() const;

    //==========================================================================================================
    // CloseStdin
    // Purpose: Closes the write end of the peer's stdin so it observes EOF. Idempotent.
    //==========================================================================================================
    void CloseStdin();

    bool IsRunning();

    //==========================================================================================================
    // ExitCode
    // Returns:
    //   Exit status once the process has exited (signal number when it was killed), otherwise nullopt.
    //==========================================================================================================
    std::optional<int> ExitCode();

    //==========================================================================================================
    // WaitForExit
    // Purpose: Blocks until the process exits or the timeout elapses.
    // Returns:
    //   true when the process has exited.
    //==========================================================================================================
    bool WaitForExit(std::chrono::milliseconds timeout);

    //==========================================================================================================
    // Terminate
    // Purpose: Kills the process if still running and reaps it. Idempotent.
    //==========================================================================================================
    void Terminate();

    // Command line used for diagnostics.
    const std::string& Description() const;

private:
    ChildProcess();

    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcphost
