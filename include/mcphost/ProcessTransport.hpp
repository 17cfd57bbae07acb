//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProcessTransport.hpp
// Purpose: Newline-delimited JSON transport over a child process's standard streams
//==========================================================================================================
#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "mcphost/SessionOptions.h"
#include "mcphost/errors/Errors.h"

namespace mcphost {

class ChildProcess;

//==========================================================================================================
// ProcessTransport
// Purpose: Writes single-line messages to the peer's stdin and delivers each line the peer prints on
//          stdout to one consumer. The peer's stderr is drained on the same reader thread into a bounded
//          ring of recent lines and logged at WARN.
// Notes:
//   - The transport never kills the process; that belongs to the owning session's teardown.
//   - Handlers run on the reader thread. They must not call Close().
//==========================================================================================================
class ProcessTransport {
public:
    using LineHandler = std::function<void(const std::string& line)>;
    using ErrorHandler = std::function<void(errors::ErrorKind kind, const std::string& message)>;
    using StderrHandler = std::function<void(const std::string& line)>;

    //==========================================================================================================
    // Ctor
    // Args:
    //   child: Process whose pipes are used. Must outlive the transport.
    //   options: Supplies maxLineBytes, writeTimeout and stderrLines.
    //==========================================================================================================
    ProcessTransport(ChildProcess& child, const SessionOptions& options);
    ~ProcessTransport();
    ProcessTransport(const ProcessTransport&) = delete;
    ProcessTransport& operator=(const ProcessTransport&) = delete;

    //==========================================================================================================
    // SetStderrHandler
    // Purpose: Optional; install before Start(). Called once per stderr line on a dispatch thread separate
    //          from the reader, so a slow handler delays neither stdout lines nor the stderr tail. Queued
    //          lines are delivered before Close() returns; the handler must not call Close().
    //==========================================================================================================
    void SetStderrHandler(StderrHandler handler);

    //==========================================================================================================
    // Start
    // Purpose: Launches the sole reader thread.
    // Args:
    //   onLine: Called for every non-blank line (trailing '\r' stripped). An exception thrown from it is
    //           reported as onError(MalformedMessage) and the loop continues.
    //   onError: Called with MalformedMessage for oversized or rejected lines, and once with PeerClosed when
    //            the peer's stdout reaches end of stream.
    //==========================================================================================================
    void Start(LineHandler onLine, ErrorHandler onError);

    //==========================================================================================================
    // Send
    // Purpose: Writes line + '\n' atomically with respect to other senders.
    // Throws:
    //   SessionError(TransportClosed) after CloseInput()/Close() or when the pipe is broken.
    //   SessionError(Timeout) when the peer stops draining its stdin for longer than the write timeout;
    //   the input side is then closed because the stream holds a partial line.
    //   SessionError(InvalidArgument) when line contains a newline.
    //==========================================================================================================
    void Send(const std::string& line);

    //==========================================================================================================
    // CloseInput
    // Purpose: Closes the peer's stdin (the peer sees EOF). Subsequent Send() calls fail. Idempotent.
    //==========================================================================================================
    void CloseInput();

    //==========================================================================================================
    // Close
    // Purpose: Closes the input side, wakes the reader and joins it. No handler runs after Close returns.
    //          Idempotent.
    //==========================================================================================================
    void Close();

    bool IsReading() const;

    // Most recent peer stderr lines, oldest first.
    std::vector<std::string> StderrTail() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcphost
