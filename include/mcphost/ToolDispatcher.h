//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolDispatcher.h
// Purpose: Generic invoke-by-name surface over one managed session's discovered tools
//==========================================================================================================

#pragma once

#include <memory>
#include <stop_token>
#include <string>

#include "mcphost/SessionManager.h"
#include "mcphost/ToolCatalog.h"

namespace mcphost {

//==========================================================================================================
// ToolDispatcher
// Purpose: Binds one session of a SessionManager to a single dynamic entry point so an orchestration
//          layer can call any discovered tool without per-tool bindings.
// Notes:
//   The manager must outlive the dispatcher.
//==========================================================================================================
class ToolDispatcher {
public:
    //==========================================================================================================
    // Ctor
    // Args:
    //   manager: Session owner used for every call.
    //   serverName: Session the dispatcher is bound to.
    //   pluginName: Display name; defaults to serverName. Sanitized with SanitizeName().
    //==========================================================================================================
    ToolDispatcher(SessionManager& manager, std::string serverName, const std::string& pluginName = "");

    //==========================================================================================================
    // SanitizeName
    // Purpose: Keeps ASCII letters, digits and '_'; an empty result becomes "mcp".
    //==========================================================================================================
    static std::string SanitizeName(const std::string& name);

    //==========================================================================================================
    // InvokeTool
    // Purpose: Calls toolName with arguments given as JSON object text; blank text means {}.
    // Throws:
    //   errors::SessionError(InvalidArgument) when the text is not a JSON object.
    //   Any CallTool failure of the bound session.
    //==========================================================================================================
    std::string InvokeTool(const std::string& toolName, const std::string& argumentsJson,
                           std::stop_token stopToken = {});

    //==========================================================================================================
    // DescribeTools
    // Purpose: Human-readable catalog listing each tool with its parameters.
    //==========================================================================================================
    std::string DescribeTools();

    std::shared_ptr<const ToolCatalog> Tools();

    const std::string& PluginName() const { return pluginName_; }
    const std::string& ServerName() const { return serverName_; }

private:
    SessionManager& manager_;
    std::string serverName_;
    std::string pluginName_;
};

} // namespace mcphost
