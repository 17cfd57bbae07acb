//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SessionManager.cpp
// Purpose: Named session registry, concurrent connect and ordered teardown
//==========================================================================================================

#include "mcphost/SessionManager.h"

#include <filesystem>
#include <format>
#include <fstream>
#include <future>
#include <mutex>
#include <set>
#include <utility>

#include "logging/Logger.h"

namespace mcphost {

using errors::ErrorKind;
using errors::SessionError;

class SessionManager::Impl {
public:
    const SessionOptions options;

    mutable std::mutex mutex;
    std::map<std::string, std::shared_ptr<Session>> sessions;
    std::set<std::string> connecting;
    SessionEventHandler eventHandler;

    explicit Impl(SessionOptions opts) : options(std::move(opts)) {}

    std::shared_ptr<Session> find(const std::string& name) const {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = sessions.find(name);
        if (it == sessions.end()) {
            throw SessionError(ErrorKind::UnknownSession, std::format("No session named '{}'", name));
        }
        return it->second;
    }

    std::shared_ptr<Session> findOrFirst(const std::string& name) const {
        if (!name.empty()) {
            return find(name);
        }
        std::lock_guard<std::mutex> lock(mutex);
        if (sessions.empty()) {
            throw SessionError(ErrorKind::UnknownSession, "No sessions are connected");
        }
        return sessions.begin()->second;
    }

    static void writeFile(const std::string& path, const std::vector<uint8_t>& bytes) {
        namespace fs = std::filesystem;
        const fs::path target(path);
        std::error_code ec;
        if (target.has_parent_path()) {
            fs::create_directories(target.parent_path(), ec);
            if (ec) {
                throw SessionError(ErrorKind::IoFailure,
                                   std::format("Cannot create directory '{}': {}", target.parent_path().string(), ec.message()));
            }
        }
        std::ofstream out(target, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw SessionError(ErrorKind::IoFailure, std::format("Cannot open '{}' for writing", path));
        }
        out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        out.close();
        if (!out) {
            throw SessionError(ErrorKind::IoFailure, std::format("Failed writing {} bytes to '{}'", bytes.size(), path));
        }
    }
};

SessionManager::SessionManager(SessionOptions options) : pImpl(std::make_unique<Impl>(std::move(options))) {
    FUNC_SCOPE();
}

SessionManager::~SessionManager() {
    FUNC_SCOPE();
    for (const auto& err : CloseAll()) {
        LOG_ERROR("SessionManager: {}", err);
    }
}

void SessionManager::Connect(const std::string& name, const std::string& command,
                             const std::vector<std::string>& args,
                             const std::map<std::string, std::string>& env) {
    ServerConfig config;
    config.name = name;
    config.command = command;
    config.args = args;
    config.env = env;
    Connect(config);
}

void SessionManager::Connect(const ServerConfig& config) {
    FUNC_SCOPE();
    if (config.name.empty()) {
        throw SessionError(ErrorKind::InvalidArgument, "Session name must not be empty");
    }
    SessionEventHandler handler;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        if (pImpl->sessions.count(config.name) != 0 || pImpl->connecting.count(config.name) != 0) {
            throw SessionError(ErrorKind::DuplicateSession,
                               std::format("A session named '{}' is already connected", config.name));
        }
        pImpl->connecting.insert(config.name);
        handler = pImpl->eventHandler;
    }

    LOG_INFO("SessionManager: connecting '{}' ({})", config.name, config.command);
    auto session = std::make_shared<Session>(config.name, pImpl->options);
    if (handler) {
        session->SetEventHandler(handler);
    }
    try {
        session->Start(config);
    } catch (const std::exception&) {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        pImpl->connecting.erase(config.name);
        throw;
    }

    std::lock_guard<std::mutex> lock(pImpl->mutex);
    pImpl->connecting.erase(config.name);
    pImpl->sessions.emplace(config.name, std::move(session));
    LOG_INFO("SessionManager: '{}' connected ({} session(s))", config.name, pImpl->sessions.size());
}

std::map<std::string, std::string> SessionManager::ConnectAll(const std::vector<ServerConfig>& configs) {
    FUNC_SCOPE();
    std::vector<std::pair<std::string, std::future<void>>> attempts;
    attempts.reserve(configs.size());
    for (const auto& config : configs) {
        attempts.emplace_back(config.name, std::async(std::launch::async, [this, config]() { Connect(config); }));
    }

    std::map<std::string, std::string> failures;
    for (auto& [name, fut] : attempts) {
        try {
            fut.get();
        } catch (const std::exception& e) {
            LOG_ERROR("SessionManager: failed to connect '{}': {}", name, e.what());
            failures[name] = e.what();
        }
    }
    return failures;
}

void SessionManager::Disconnect(const std::string& name) {
    FUNC_SCOPE();
    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        auto it = pImpl->sessions.find(name);
        if (it == pImpl->sessions.end()) {
            LOG_WARN("SessionManager: disconnect of unknown session '{}' ignored", name);
            return;
        }
        session = std::move(it->second);
        pImpl->sessions.erase(it);
    }
    session->Close();
    LOG_INFO("SessionManager: '{}' disconnected", name);
}

std::vector<std::string> SessionManager::ListConnected() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    std::vector<std::string> names;
    names.reserve(pImpl->sessions.size());
    for (const auto& [name, session] : pImpl->sessions) {
        names.push_back(name);
    }
    return names;
}

bool SessionManager::IsConnected(const std::string& name) const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->sessions.count(name) != 0;
}

SessionState SessionManager::GetState(const std::string& name) const {
    return pImpl->find(name)->State();
}

std::optional<ServerInfo> SessionManager::GetServerInfo(const std::string& name) const {
    return pImpl->find(name)->GetServerInfo();
}

std::shared_ptr<const ToolCatalog> SessionManager::ListTools(const std::string& name, std::stop_token stopToken) {
    FUNC_SCOPE();
    return pImpl->find(name)->ListTools(stopToken);
}

std::string SessionManager::CallTool(const std::string& name, const std::string& toolName,
                                     const JSONValue& arguments, std::stop_token stopToken) {
    FUNC_SCOPE();
    auto session = pImpl->find(name);
    LOG_DEBUG("SessionManager: calling '{}' on '{}'", toolName, name);
    return session->CallTool(toolName, arguments, stopToken);
}

std::string SessionManager::CallTool(const std::string& name, const std::string& toolName,
                                     const std::string& argumentsJson, std::stop_token stopToken) {
    JSONValue arguments(JSONValue::Object{});
    if (argumentsJson.find_first_not_of(" \t\r\n") != std::string::npos) {
        try {
            arguments = ParseJSON(argumentsJson);
        } catch (const std::runtime_error& e) {
            throw SessionError(ErrorKind::InvalidArgument,
                               std::format("Arguments for tool '{}' are not valid JSON: {}", toolName, e.what()));
        }
    }
    if (!arguments.IsObject()) {
        throw SessionError(ErrorKind::InvalidArgument,
                           std::format("Arguments for tool '{}' must be a JSON object", toolName));
    }
    return CallTool(name, toolName, arguments, stopToken);
}

std::vector<uint8_t> SessionManager::ReadResource(const std::string& name, const std::string& uri,
                                                  std::stop_token stopToken) {
    FUNC_SCOPE();
    auto session = pImpl->findOrFirst(name);
    LOG_DEBUG("SessionManager: reading '{}' from '{}'", uri, session->Name());
    return session->ReadResource(uri, stopToken);
}

void SessionManager::SaveResourceToFile(const std::string& uri, const std::string& path, const std::string& name) {
    FUNC_SCOPE();
    const auto bytes = ReadResource(name, uri);
    Impl::writeFile(path, bytes);
    LOG_INFO("SessionManager: saved '{}' ({} bytes) to {}", uri, bytes.size(), path);
}

void SessionManager::SaveScreenshotToFile(const std::string& screenshotName, const std::string& path,
                                          const std::string& name) {
    SaveResourceToFile("screenshot://" + screenshotName, path, name);
}

std::vector<std::string> SessionManager::CloseAll() {
    FUNC_SCOPE();
    std::vector<std::string> errors;
    for (const auto& name : ListConnected()) {
        try {
            Disconnect(name);
        } catch (const std::exception& e) {
            LOG_ERROR("SessionManager: closing '{}' failed: {}", name, e.what());
            errors.push_back(std::format("{}: {}", name, e.what()));
        }
    }
    return errors;
}

void SessionManager::SetEventHandler(SessionEventHandler handler) {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    pImpl->eventHandler = std::move(handler);
}

} // namespace mcphost
