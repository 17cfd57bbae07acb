//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_session_options.cpp
// Purpose: SessionOptions defaults, config-string parsing and environment overrides
//==========================================================================================================

#include <gtest/gtest.h>

#include <cstdlib>

#include "env/EnvVars.h"
#include "mcphost/SessionOptions.h"
#include "mcphost/version.h"

using namespace mcphost;
using namespace std::chrono_literals;

TEST(SessionOptions, Defaults) {
    SessionOptions o;
    EXPECT_EQ(o.requestTimeout, 30000ms);
    EXPECT_EQ(o.initializeTimeout, 10000ms);
    EXPECT_EQ(o.shutdownTimeout, 5000ms);
    EXPECT_EQ(o.exitGracePeriod, 500ms);
    EXPECT_EQ(o.maxLineBytes, 16u * 1024u * 1024u);
    EXPECT_EQ(o.stderrLines, 200u);
    EXPECT_EQ(o.protocolVersion, "0.1.0");
    EXPECT_EQ(o.clientInfo.name, "mcphost");
    EXPECT_EQ(o.clientInfo.version, getVersionString());
}

TEST(SessionOptions, FromConfigStringParsesKnownKeys) {
    auto o = SessionOptions::FromConfigString(
        "request_timeout_ms=1500; init_timeout_ms=250;shutdown_timeout_ms=100 exit_grace_ms=20;"
        "write_timeout_ms=900;max_line_bytes=4096;stderr_lines=5;protocol_version=2024-11-05;"
        "client_name=host;client_version=0.0.1");
    EXPECT_EQ(o.requestTimeout, 1500ms);
    EXPECT_EQ(o.initializeTimeout, 250ms);
    EXPECT_EQ(o.shutdownTimeout, 100ms);
    EXPECT_EQ(o.exitGracePeriod, 20ms);
    EXPECT_EQ(o.writeTimeout, 900ms);
    EXPECT_EQ(o.maxLineBytes, 4096u);
    EXPECT_EQ(o.stderrLines, 5u);
    EXPECT_EQ(o.protocolVersion, "2024-11-05");
    EXPECT_EQ(o.clientInfo.name, "host");
    EXPECT_EQ(o.clientInfo.version, "0.0.1");
}

TEST(SessionOptions, FromConfigStringIgnoresJunk) {
    auto o = SessionOptions::FromConfigString("timeout_ms=abc;bogus=1;noequals;max_line_bytes=0;timeout_ms=12x");
    EXPECT_EQ(o.requestTimeout, 30000ms);
    EXPECT_EQ(o.maxLineBytes, 16u * 1024u * 1024u);
}

TEST(SessionOptions, TimeoutAlias) {
    EXPECT_EQ(SessionOptions::FromConfigString("timeout_ms=42").requestTimeout, 42ms);
}

TEST(SessionOptions, ApplyEnvironmentOverrides) {
    ::setenv("MCPHOST_REQUEST_TIMEOUT_MS", "777", 1);
    ::setenv("MCPHOST_INIT_TIMEOUT_MS", "not-a-number", 1);
    ::setenv("MCPHOST_PROTOCOL_VERSION", "9.9", 1);
    SessionOptions o;
    o.ApplyEnvironment();
    ::unsetenv("MCPHOST_REQUEST_TIMEOUT_MS");
    ::unsetenv("MCPHOST_INIT_TIMEOUT_MS");
    ::unsetenv("MCPHOST_PROTOCOL_VERSION");

    EXPECT_EQ(o.requestTimeout, 777ms);
    EXPECT_EQ(o.initializeTimeout, 10000ms);
    EXPECT_EQ(o.protocolVersion, "9.9");
}

TEST(EnvVars, GetEnvHelpers) {
    ::unsetenv("MCPHOST_TEST_UNSET");
    EXPECT_EQ(GetEnvOrDefault("MCPHOST_TEST_UNSET", "dflt"), "dflt");
    EXPECT_EQ(GetEnvOrDefault(nullptr, "dflt"), "dflt");
    EXPECT_FALSE(GetEnvUint("MCPHOST_TEST_UNSET").has_value());
    ::setenv("MCPHOST_TEST_UINT", "123", 1);
    ASSERT_TRUE(GetEnvUint("MCPHOST_TEST_UINT").has_value());
    EXPECT_EQ(*GetEnvUint("MCPHOST_TEST_UINT"), 123u);
    ::setenv("MCPHOST_TEST_UINT", "12ab", 1);
    EXPECT_FALSE(GetEnvUint("MCPHOST_TEST_UINT").has_value());
    ::unsetenv("MCPHOST_TEST_UINT");
}

TEST(Version, StringMatchesParts) {
    auto v = getVersion();
    EXPECT_EQ(getVersionString(), std::to_string(v.major) + "." + std::to_string(v.minor) + "." + std::to_string(v.patch));
}
