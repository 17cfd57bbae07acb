//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolDispatcher.cpp
// Purpose: Dynamic tool invocation and catalog description
//==========================================================================================================

#include "mcphost/ToolDispatcher.h"

#include <format>

#include "logging/Logger.h"
#include "mcphost/errors/Errors.h"

namespace mcphost {

using errors::ErrorKind;
using errors::SessionError;

ToolDispatcher::ToolDispatcher(SessionManager& manager, std::string serverName, const std::string& pluginName)
    : manager_(manager),
      serverName_(std::move(serverName)),
      pluginName_(SanitizeName(pluginName.empty() ? serverName_ : pluginName)) {
    FUNC_SCOPE();
}

std::string ToolDispatcher::SanitizeName(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        const bool keep = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_';
        if (keep) {
            out.push_back(c);
        }
    }
    return out.empty() ? std::string("mcp") : out;
}

std::string ToolDispatcher::InvokeTool(const std::string& toolName, const std::string& argumentsJson,
                                       std::stop_token stopToken) {
    FUNC_SCOPE();
    JSONValue arguments{JSONValue::Object{}};
    try {
        if (argumentsJson.find_first_not_of(" \t\r\n") != std::string::npos) {
            arguments = ParseJSON(argumentsJson);
        }
    } catch (const std::runtime_error& e) {
        throw SessionError(ErrorKind::InvalidArgument,
                           std::format("Arguments for '{}' are not valid JSON: {}", toolName, e.what()));
    }
    if (!arguments.IsObject()) {
        throw SessionError(ErrorKind::InvalidArgument,
                           std::format("Arguments for '{}' must be a JSON object", toolName));
    }
    LOG_DEBUG("ToolDispatcher[{}]: invoking '{}'", pluginName_, toolName);
    return manager_.CallTool(serverName_, toolName, arguments, stopToken);
}

std::string ToolDispatcher::DescribeTools() {
    FUNC_SCOPE();
    auto catalog = Tools();
    std::string out = "Available MCP Tools:\n";
    for (const auto& tool : *catalog) {
        out += std::format("- {}: {}\n", tool.name, tool.description);
        const auto params = tool.Parameters();
        if (!params.empty()) {
            out += "  Parameters:\n";
            for (const auto& p : params) {
                out += std::format("    {} ({}){}: {}\n", p.name, p.type, p.required ? " [Required]" : "", p.description);
            }
        }
        out += "\n";
    }
    return out;
}

std::shared_ptr<const ToolCatalog> ToolDispatcher::Tools() {
    return manager_.ListTools(serverName_);
}

} // namespace mcphost
