//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: Protocol identities, server launch configuration and method names used by the client runtime
//==========================================================================================================

#pragma once

#include <map>
#include <string>
#include <vector>

namespace mcphost {

// Default protocol version announced in the initialize request.
constexpr const char* DEFAULT_PROTOCOL_VERSION = "0.1.0";

// Default client identity announced in the initialize request.
constexpr const char* DEFAULT_CLIENT_NAME = "mcphost";

// Name/version pair exchanged during the handshake.
struct Implementation {
    std::string name;
    std::string version;

    Implementation() = default;
    Implementation(std::string name, std::string version)
        : name(std::move(name)), version(std::move(version)) {}
};

//==========================================================================================================
// ServerInfo
// Purpose: What the peer reported about itself in its initialize result.
// Fields:
//   name/version: serverInfo member (empty when the peer omitted it).
//   protocolVersion: Protocol version the peer agreed to (empty when omitted).
//==========================================================================================================
struct ServerInfo {
    std::string name;
    std::string version;
    std::string protocolVersion;
};

//==========================================================================================================
// ServerConfig
// Purpose: Fully resolved launch description for one tool server.
// Fields:
//   name: Unique session key.
//   command: Executable path, or a bare name resolved via PATH.
//   args: Arguments passed verbatim (no shell interpretation).
//   env: Variables added to (or overriding) the inherited environment.
//==========================================================================================================
struct ServerConfig {
    std::string name;
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
};

namespace Methods {
    // Client to server
    constexpr const char* Initialize = "initialize";
    constexpr const char* ListTools = "tools/list";
    constexpr const char* CallTool = "tools/call";
    constexpr const char* ReadResource = "resources/read";
    constexpr const char* Shutdown = "shutdown";

    // Server to client
    constexpr const char* Ping = "ping";

    // Notifications
    constexpr const char* Initialized = "initialized";
    constexpr const char* Exit = "exit";
    constexpr const char* ToolListChanged = "notifications/tools/list_changed";
    constexpr const char* Log = "notifications/message";
}

} // namespace mcphost
