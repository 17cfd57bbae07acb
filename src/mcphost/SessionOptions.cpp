//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SessionOptions.cpp
// Purpose: Config-string and environment parsing for SessionOptions
//==========================================================================================================

#include "mcphost/SessionOptions.h"

#include <cstdint>
#include <stdexcept>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "mcphost/version.h"

namespace mcphost {

namespace {
bool parseUint(const std::string& s, uint64_t& out) {
    try {
        std::size_t used = 0;
        unsigned long long v = std::stoull(s, &used);
        if (used != s.size()) {
            return false;
        }
        out = static_cast<uint64_t>(v);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}
} // namespace

SessionOptions::SessionOptions()
    : clientInfo(DEFAULT_CLIENT_NAME, getVersionString()) {}

SessionOptions SessionOptions::FromConfigString(const std::string& config) {
    FUNC_SCOPE();
    SessionOptions opts;
    std::string token;
    for (std::size_t i = 0; i < config.size();) {
        // Skip separators and spaces
        while (i < config.size() && (config[i] == ';' || config[i] == ' ' || config[i] == '\t')) ++i;
        if (i >= config.size()) break;
        std::size_t start = i;
        while (i < config.size() && config[i] != ';' && config[i] != ' ' && config[i] != '\t') ++i;
        token = config.substr(start, i - start);
        auto eq = token.find('=');
        if (eq == std::string::npos) {
            LOG_WARN("SessionOptions: ignoring token without '=': {}", token);
            continue;
        }
        const auto key = token.substr(0, eq);
        const auto val = token.substr(eq + 1);
        uint64_t v = 0;
        if (key == "request_timeout_ms" || key == "timeout_ms") {
            if (parseUint(val, v)) opts.requestTimeout = std::chrono::milliseconds(v);
        } else if (key == "init_timeout_ms") {
            if (parseUint(val, v)) opts.initializeTimeout = std::chrono::milliseconds(v);
        } else if (key == "shutdown_timeout_ms") {
            if (parseUint(val, v)) opts.shutdownTimeout = std::chrono::milliseconds(v);
        } else if (key == "exit_grace_ms") {
            if (parseUint(val, v)) opts.exitGracePeriod = std::chrono::milliseconds(v);
        } else if (key == "write_timeout_ms") {
            if (parseUint(val, v)) opts.writeTimeout = std::chrono::milliseconds(v);
        } else if (key == "max_line_bytes") {
            if (parseUint(val, v) && v > 0) opts.maxLineBytes = static_cast<std::size_t>(v);
        } else if (key == "stderr_lines") {
            if (parseUint(val, v)) opts.stderrLines = static_cast<std::size_t>(v);
        } else if (key == "protocol_version") {
            if (!val.empty()) opts.protocolVersion = val;
        } else if (key == "client_name") {
            if (!val.empty()) opts.clientInfo.name = val;
        } else if (key == "client_version") {
            if (!val.empty()) opts.clientInfo.version = val;
        } else {
            LOG_DEBUG("SessionOptions: unknown key '{}'", key);
        }
    }
    return opts;
}

SessionOptions& SessionOptions::ApplyEnvironment() {
    FUNC_SCOPE();
    if (auto v = GetEnvUint("MCPHOST_REQUEST_TIMEOUT_MS")) {
        requestTimeout = std::chrono::milliseconds(*v);
    }
    if (auto v = GetEnvUint("MCPHOST_INIT_TIMEOUT_MS")) {
        initializeTimeout = std::chrono::milliseconds(*v);
    }
    if (auto v = GetEnvUint("MCPHOST_SHUTDOWN_TIMEOUT_MS")) {
        shutdownTimeout = std::chrono::milliseconds(*v);
    }
    const std::string pv = GetEnvOrDefault("MCPHOST_PROTOCOL_VERSION", "");
    if (!pv.empty()) {
        protocolVersion = pv;
    }
    return *this;
}

} // namespace mcphost
