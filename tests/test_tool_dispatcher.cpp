//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_tool_dispatcher.cpp
// Purpose: Name sanitizing, catalog description and invoke-by-name through a managed session
//==========================================================================================================

#include <gtest/gtest.h>

#include <string>

#include "mcphost/ToolDispatcher.h"

#ifndef MCPHOST_STUB_PEER
#error "MCPHOST_STUB_PEER must name the stub peer executable"
#endif

using namespace mcphost;

namespace {
void connectStub(SessionManager& mgr, const std::string& name) {
    mgr.Connect(name, MCPHOST_STUB_PEER, {"normal"});
}
} // namespace

TEST(ToolDispatcher, SanitizeName) {
    EXPECT_EQ(ToolDispatcher::SanitizeName("my-server.v2"), "myserverv2");
    EXPECT_EQ(ToolDispatcher::SanitizeName("calc_tools"), "calc_tools");
    EXPECT_EQ(ToolDispatcher::SanitizeName("---"), "mcp");
    EXPECT_EQ(ToolDispatcher::SanitizeName(""), "mcp");
    EXPECT_EQ(ToolDispatcher::SanitizeName("caf\xc3\xa9"), "caf");
}

TEST(ToolDispatcher, PluginNameDefaultsToServerName) {
    SessionManager mgr;
    ToolDispatcher byServer(mgr, "calc-server");
    EXPECT_EQ(byServer.PluginName(), "calcserver");
    EXPECT_EQ(byServer.ServerName(), "calc-server");
    ToolDispatcher named(mgr, "calc-server", "Calculator Plugin");
    EXPECT_EQ(named.PluginName(), "CalculatorPlugin");
}

TEST(ToolDispatcher, InvokeToolByName) {
    SessionManager mgr;
    connectStub(mgr, "calc");
    ToolDispatcher d(mgr, "calc");
    EXPECT_EQ(d.InvokeTool("add", R"({"a":40,"b":2})"), "42");
    EXPECT_EQ(d.InvokeTool("echo", R"({"text":"hi there"})"), "hi there");
    EXPECT_EQ(d.InvokeTool("echo", "  "), "");
}

TEST(ToolDispatcher, InvokeToolRejectsBadArguments) {
    SessionManager mgr;
    connectStub(mgr, "calc");
    ToolDispatcher d(mgr, "calc");
    try {
        (void)d.InvokeTool("add", "{oops");
        FAIL() << "expected InvalidArgument";
    } catch (const errors::SessionError& e) {
        EXPECT_EQ(e.kind(), errors::ErrorKind::InvalidArgument);
    }
    try {
        (void)d.InvokeTool("add", "[1,2]");
        FAIL() << "expected InvalidArgument";
    } catch (const errors::SessionError& e) {
        EXPECT_EQ(e.kind(), errors::ErrorKind::InvalidArgument);
    }
}

TEST(ToolDispatcher, UnboundSessionIsUnknown) {
    SessionManager mgr;
    ToolDispatcher d(mgr, "ghost");
    try {
        (void)d.InvokeTool("add", "{}");
        FAIL() << "expected UnknownSession";
    } catch (const errors::SessionError& e) {
        EXPECT_EQ(e.kind(), errors::ErrorKind::UnknownSession);
    }
}

TEST(ToolDispatcher, DescribeToolsListsParameters) {
    SessionManager mgr;
    connectStub(mgr, "calc");
    ToolDispatcher d(mgr, "calc");
    const std::string text = d.DescribeTools();
    EXPECT_EQ(text.rfind("Available MCP Tools:\n", 0), 0u);
    EXPECT_NE(text.find("- add: Adds two numbers\n"
                        "  Parameters:\n"
                        "    a (number) [Required]: First addend\n"
                        "    b (number) [Required]: Second addend\n"
                        "\n"),
              std::string::npos)
        << text;
    EXPECT_NE(text.find("    text (string): \n"), std::string::npos) << text;
    // Tools without parameters get no Parameters block.
    EXPECT_NE(text.find("- never: "), std::string::npos);
    EXPECT_EQ(d.Tools()->size(), mgr.ListTools("calc")->size());
}
