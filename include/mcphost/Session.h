//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Session.h
// Purpose: One client connection to one tool-server process
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

#include "mcphost/JSONRPCTypes.h"
#include "mcphost/Protocol.h"
#include "mcphost/SessionOptions.h"
#include "mcphost/ToolCatalog.h"
#include "mcphost/errors/Errors.h"

namespace mcphost {

//==========================================================================================================
// SessionState
// Purpose: Lifecycle of a session. Transitions only move forward:
//   Unconnected -> Starting -> Initializing -> Ready -> Closing -> Closed
//   Starting | Initializing | Ready -> Failed (spawn/handshake failure or peer exit)
// Closed and Failed are terminal.
//==========================================================================================================
enum class SessionState {
    Unconnected,
    Starting,
    Initializing,
    Ready,
    Closing,
    Closed,
    Failed
};

std::string_view ToString(SessionState state);

//==========================================================================================================
// SessionEvent
// Purpose: Observability record emitted by a session (state changes, peer stderr, stray traffic).
// Fields:
//   kind: What happened.
//   session: Name of the emitting session.
//   state: Session state at the time of the event.
//   message: Human-readable detail (the stderr line, the notification method, the bad line, ...).
//==========================================================================================================
struct SessionEvent {
    enum class Kind {
        StateChanged,
        PeerStderr,
        MalformedLine,
        PeerNotification,
        UnknownResponse
    };

    Kind kind;
    std::string session;
    SessionState state;
    std::string message;
};

using SessionEventHandler = std::function<void(const SessionEvent&)>;
using NotificationHandler = std::function<void(const std::string& method, const JSONValue& params)>;

//==========================================================================================================
// Session
// Purpose: Owns one peer process, its transport and the pending-request table. Performs the
//          initialize handshake and exposes the tool and resource operations.
// Notes:
//   - All public methods are safe to call from multiple threads concurrently.
//   - Requests made from different threads may complete in any order; each caller receives exactly
//     its own response.
//   - Handlers run on the session's reader thread and must not call Close().
//==========================================================================================================
class Session {
public:
    Session(std::string name, SessionOptions options = SessionOptions());
    ~Session();
    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    //==========================================================================================================
    // Start
    // Purpose: Spawns the peer, performs initialize / initialized and moves to Ready.
    // Throws:
    //   errors::SessionError(SpawnFailure) when the process cannot be started.
    //   errors::SessionError(HandshakeTimeout) when initialize does not complete in time.
    //   errors::SessionError(HandshakeFailed) when the peer rejects initialize or exits; the message carries
    //   the exit status and recent stderr lines.
    //   errors::SessionError(InvalidArgument) when the session was already started.
    // On failure the process is reaped and the session is Failed.
    //==========================================================================================================
    void Start(const ServerConfig& config);

    //==========================================================================================================
    // ListTools
    // Purpose: Fetches the tool catalog once and returns the cached copy afterwards.
    // Throws:
    //   errors::SessionError(NotReady | Timeout | Cancelled | PeerError | PeerClosed | MalformedCatalog ...)
    //==========================================================================================================
    std::shared_ptr<const ToolCatalog> ListTools(std::stop_token stopToken = {});

    //==========================================================================================================
    // CallTool
    // Purpose: Invokes a tool and flattens its content to text.
    // Args:
    //   arguments: Object of tool arguments; null is sent as {}.
    // Returns:
    //   All text content blocks joined with '\n' and trimmed. When the result has no content array the
    //   compact JSON of the whole result is returned.
    //==========================================================================================================
    std::string CallTool(const std::string& toolName, const JSONValue& arguments,
                         std::stop_token stopToken = {});

    //==========================================================================================================
    // ReadResource
    // Purpose: Reads a resource and returns the bytes of its first content entry.
    // Throws:
    //   errors::SessionError(NoContent) when the result lists no contents.
    //   errors::SessionError(EmptyResource) when the first entry has neither text nor a non-empty blob.
    //   errors::SessionError(MalformedMessage) when the blob is not valid base64.
    //==========================================================================================================
    std::vector<uint8_t> ReadResource(const std::string& uri, std::stop_token stopToken = {});

    //==========================================================================================================
    // SendRequest
    // Purpose: Generic request; blocks until the response, deadline, cancellation or session loss.
    // Args:
    //   timeout: Overrides options.requestTimeout when set; zero disables the deadline.
    // Returns:
    //   The result member of the response.
    //==========================================================================================================
    JSONValue SendRequest(const std::string& method, std::optional<JSONValue> params = std::nullopt,
                          std::stop_token stopToken = {},
                          std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    // Fire-and-forget notification. Throws NotReady outside Ready.
    void SendNotification(const std::string& method, std::optional<JSONValue> params = std::nullopt);

    //==========================================================================================================
    // Close
    // Purpose: Graceful shutdown: shutdown request, exit notification, stdin EOF, grace period, then kill.
    //          Every outstanding request fails with SessionClosed. Idempotent; safe from any thread
    //          except a handler.
    //==========================================================================================================
    void Close();

    SessionState State() const;
    const std::string& Name() const;
    std::optional<ServerInfo> GetServerInfo() const;
    std::vector<std::string> StderrTail() const;
    std::optional<int> ExitCode() const;
    std::size_t PendingRequestCount() const;

    // Install before Start(); replaced handlers take effect for subsequent events. PeerStderr events arrive
    // on a stderr dispatch thread, other peer events on the reader thread; handlers must not call Close().
    void SetEventHandler(SessionEventHandler handler);
    void SetNotificationHandler(const std::string& method, NotificationHandler handler);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcphost
