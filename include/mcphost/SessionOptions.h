//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SessionOptions.h
// Purpose: Timeouts, limits and handshake identity applied to every session
//==========================================================================================================
#pragma once

#include <chrono>
#include <cstddef>
#include <string>

#include "mcphost/Protocol.h"

namespace mcphost {

//==========================================================================================================
// SessionOptions
// Purpose: Per-session tunables. Defaults suit interactive tool servers.
// Fields:
//   requestTimeout: Deadline for each ordinary request (tools/list, tools/call, resources/read).
//   initializeTimeout: Deadline for the initialize request only.
//   shutdownTimeout: Deadline for the shutdown request issued during close.
//   exitGracePeriod: Time the peer gets to exit on its own after stdin closes, before it is killed.
//   writeTimeout: Maximum time a single line write may stall on a full pipe.
//   maxLineBytes: Inbound lines longer than this are discarded and reported as malformed.
//   stderrLines: Number of peer stderr lines retained for diagnostics.
//   protocolVersion: Announced in initialize.
//   clientInfo: Announced in initialize.
//==========================================================================================================
struct SessionOptions {
    std::chrono::milliseconds requestTimeout{30000};
    std::chrono::milliseconds initializeTimeout{10000};
    std::chrono::milliseconds shutdownTimeout{5000};
    std::chrono::milliseconds exitGracePeriod{500};
    std::chrono::milliseconds writeTimeout{30000};
    std::size_t maxLineBytes{16 * 1024 * 1024};
    std::size_t stderrLines{200};
    std::string protocolVersion{DEFAULT_PROTOCOL_VERSION};
    Implementation clientInfo;

    SessionOptions();

    //==========================================================================================================
    // FromConfigString
    // Purpose: Builds options from "key=value" pairs separated by ';' or whitespace. Unknown keys and
    //          malformed values are ignored.
    // Keys:
    //   request_timeout_ms (alias timeout_ms), init_timeout_ms, shutdown_timeout_ms, exit_grace_ms,
    //   write_timeout_ms, max_line_bytes, stderr_lines, protocol_version, client_name, client_version
    //==========================================================================================================
    static SessionOptions FromConfigString(const std::string& config);

    //==========================================================================================================
    // ApplyEnvironment
    // Purpose: Applies MCPHOST_REQUEST_TIMEOUT_MS, MCPHOST_INIT_TIMEOUT_MS, MCPHOST_SHUTDOWN_TIMEOUT_MS and
    //          MCPHOST_PROTOCOL_VERSION when set.
    //==========================================================================================================
    SessionOptions& ApplyEnvironment();
};

} // namespace mcphost
