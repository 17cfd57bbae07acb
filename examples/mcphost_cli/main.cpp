//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: Command-line host that launches one tool server, then lists, calls or reads from it
//==========================================================================================================

#include "logging/Logger.h"
#include "mcphost/SessionManager.h"
#include "mcphost/ToolDispatcher.h"
#include "mcphost/version.h"
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <vector>

using namespace mcphost;

//==========================================================================================================
// getArgValue
// Purpose: Parses key=value style CLI options.
// Args:
//   argc: Argument count
//   argv: Argument vector
//   key: Key string including leading dashes (e.g., "--command")
// Returns:
//   Optional string containing the value when present
//==========================================================================================================
static std::optional<std::string> getArgValue(int argc, char** argv, const std::string& key) {
    for (size_t i = 1; i < static_cast<size_t>(argc); ++i) {
        std::string a = argv[i];
        auto eq = a.find('=');
        if (eq != std::string::npos) {
            std::string k = a.substr(0, eq);
            std::string v = a.substr(eq + 1);
            if (k == key) {
                return v;
            }
        }
    }
    return std::nullopt;
}

// Splits "a,b,c" into its non-empty parts.
static std::vector<std::string> splitList(const std::string& s) {
    std::vector<std::string> out;
    std::string cur;
    for (char c : s) {
        if (c == ',') {
            if (!cur.empty()) { out.push_back(cur); }
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty()) { out.push_back(cur); }
    return out;
}

static void printUsage() {
    std::cerr << "mcphost " << getVersionString() << "\n"
              << "Usage: mcphost_cli --command=<exe> [--name=<session>] [--args=a,b] [--env=K=V,K2=V2]\n"
              << "                   [--config=\"request_timeout_ms=30000; init_timeout_ms=10000\"]\n"
              << "                   [--tool=<name> [--arguments=<json>]] [--resource=<uri> [--out=<path>]]\n"
              << "The discovered tools are always listed first.\n";
}

int main(int argc, char** argv) {
    FUNC_SCOPE();
    Logger::setLogLevel(LogLevel::LOG_INFO_LEVEL);
    Logger::configureFromEnvironment();

    auto command = getArgValue(argc, argv, "--command");
    if (!command.has_value() || command->empty()) {
        printUsage();
        return 2;
    }

    ServerConfig config;
    config.name = getArgValue(argc, argv, "--name").value_or("server");
    config.command = *command;
    config.args = splitList(getArgValue(argc, argv, "--args").value_or(""));
    for (const auto& kv : splitList(getArgValue(argc, argv, "--env").value_or(""))) {
        auto eq = kv.find('=');
        if (eq == std::string::npos) {
            LOG_ERROR("Ignoring --env entry without '=': {}", kv);
            continue;
        }
        config.env[kv.substr(0, eq)] = kv.substr(eq + 1);
    }

    SessionOptions options = SessionOptions::FromConfigString(getArgValue(argc, argv, "--config").value_or(""));
    options.ApplyEnvironment();

    SessionManager manager(options);
    manager.SetEventHandler([](const SessionEvent& ev) {
        if (ev.kind == SessionEvent::Kind::PeerStderr) {
            LOG_DEBUG("[{} stderr] {}", ev.session, ev.message);
        }
    });

    int rc = 0;
    try {
        manager.Connect(config);
        if (auto info = manager.GetServerInfo(config.name); info.has_value()) {
            LOG_INFO("Connected to {} {} (protocol {})", info->name, info->version, info->protocolVersion);
        }

        ToolDispatcher dispatcher(manager, config.name);
        std::cout << dispatcher.DescribeTools();
        if (auto tool = getArgValue(argc, argv, "--tool"); tool.has_value()) {
            std::cout << dispatcher.InvokeTool(*tool, getArgValue(argc, argv, "--arguments").value_or("{}")) << std::endl;
        }
        if (auto uri = getArgValue(argc, argv, "--resource"); uri.has_value()) {
            if (auto out = getArgValue(argc, argv, "--out"); out.has_value()) {
                manager.SaveResourceToFile(*uri, *out, config.name);
            } else {
                const auto bytes = manager.ReadResource(config.name, *uri);
                std::cout.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
                std::cout << std::endl;
            }
        }
    } catch (const errors::SessionError& e) {
        LOG_ERROR("{} ({})", e.what(), errors::ToString(e.kind()));
        rc = 1;
    }

    for (const auto& err : manager.CloseAll()) {
        LOG_ERROR("{}", err);
    }
    return rc;
}
