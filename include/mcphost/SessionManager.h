//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SessionManager.h
// Purpose: Registry of named tool-server sessions and the collaborator-facing operations on them
//==========================================================================================================

#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

#include "mcphost/Session.h"

namespace mcphost {

//==========================================================================================================
// SessionManager
// Purpose: Owns every Session by unique name. Callers address sessions by name only; in-flight
//          operations hold a temporary shared reference so a concurrent Disconnect cannot destroy a
//          session under a running call.
// Notes:
//   Unknown names fail with errors::SessionError(UnknownSession). The destructor closes everything.
//==========================================================================================================
class SessionManager {
public:
    explicit SessionManager(SessionOptions options = SessionOptions());
    ~SessionManager();
    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    //==========================================================================================================
    // Connect
    // Purpose: Spawns the server, runs the handshake and registers the session once Ready.
    // Throws:
    //   errors::SessionError(DuplicateSession) when the name is connected or connecting (no side effects).
    //   Any Start() failure; the failed session is not registered.
    //==========================================================================================================
    void Connect(const std::string& name, const std::string& command,
                 const std::vector<std::string>& args = {},
                 const std::map<std::string, std::string>& env = {});
    void Connect(const ServerConfig& config);

    //==========================================================================================================
    // ConnectAll
    // Purpose: Connects several servers concurrently.
    // Returns:
    //   Failure message per server name that did not connect (empty when all succeeded).
    //==========================================================================================================
    std::map<std::string, std::string> ConnectAll(const std::vector<ServerConfig>& configs);

    // Closes and forgets the session; an unknown name is logged and ignored.
    void Disconnect(const std::string& name);

    // Sorted snapshot of registered session names.
    std::vector<std::string> ListConnected() const;
    bool IsConnected(const std::string& name) const;
    SessionState GetState(const std::string& name) const;
    std::optional<ServerInfo> GetServerInfo(const std::string& name) const;

    std::shared_ptr<const ToolCatalog> ListTools(const std::string& name, std::stop_token stopToken = {});

    std::string CallTool(const std::string& name, const std::string& toolName, const JSONValue& arguments,
                         std::stop_token stopToken = {});

    //==========================================================================================================
    // CallTool (JSON text)
    // Purpose: As above with arguments given as JSON text; blank text means {}.
    // Throws:
    //   errors::SessionError(InvalidArgument) when the text is not valid JSON.
    //==========================================================================================================
    std::string CallTool(const std::string& name, const std::string& toolName, const std::string& argumentsJson,
                         std::stop_token stopToken = {});

    //==========================================================================================================
    // ReadResource
    // Purpose: Reads a resource from the named session; an empty name selects the first session in
    //          name order.
    //==========================================================================================================
    std::vector<uint8_t> ReadResource(const std::string& name, const std::string& uri, std::stop_token stopToken = {});

    //==========================================================================================================
    // SaveResourceToFile / SaveScreenshotToFile
    // Purpose: Reads a resource and writes its bytes to path, creating parent directories. The screenshot
    //          variant reads "screenshot://<screenshotName>".
    // Throws:
    //   errors::SessionError(IoFailure) when the file cannot be written.
    //==========================================================================================================
    void SaveResourceToFile(const std::string& uri, const std::string& path, const std::string& name = "");
    void SaveScreenshotToFile(const std::string& screenshotName, const std::string& path, const std::string& name = "");

    //==========================================================================================================
    // CloseAll
    // Purpose: Disconnects every session independently.
    // Returns:
    //   One message per session whose close reported an error.
    //==========================================================================================================
    std::vector<std::string> CloseAll();

    // Applied to sessions connected afterwards.
    void SetEventHandler(SessionEventHandler handler);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcphost
