//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_child_process.cpp
// Purpose: Spawning, exit status, termination and spawn failures
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <string>

#include <unistd.h>

#include "mcphost/ChildProcess.hpp"
#include "mcphost/errors/Errors.h"

using namespace mcphost;
using namespace std::chrono_literals;

namespace {
ServerConfig shell(const std::string& script) {
    ServerConfig c;
    c.name = "sh";
    c.command = "/bin/sh";
    c.args = {"-c", script};
    return c;
}
} // namespace

TEST(ChildProcess, ReportsExitCode) {
    auto p = ChildProcess::Spawn(shell("exit 7"));
    ASSERT_NE(p, nullptr);
    EXPECT_GT(p->Pid(), 0);
    ASSERT_TRUE(p->WaitForExit(5s));
    EXPECT_FALSE(p->IsRunning());
    ASSERT_TRUE(p->ExitCode().has_value());
    EXPECT_EQ(*p->ExitCode(), 7);
}

TEST(ChildProcess, ResolvesBareCommandThroughPath) {
    ServerConfig c;
    c.name = "true";
    c.command = "true";
    auto p = ChildProcess::Spawn(c);
    ASSERT_TRUE(p->WaitForExit(5s));
    EXPECT_EQ(p->ExitCode().value_or(-1), 0);
}

TEST(ChildProcess, PassesEnvironmentOverrides) {
    auto c = shell("test \"$MCPHOST_CHILD_VAR\" = expected");
    c.env["MCPHOST_CHILD_VAR"] = "expected";
    auto p = ChildProcess::Spawn(c);
    ASSERT_TRUE(p->WaitForExit(5s));
    EXPECT_EQ(p->ExitCode().value_or(-1), 0);
}

TEST(ChildProcess, ClosingStdinLetsCatExit) {
    ServerConfig c;
    c.name = "cat";
    c.command = "/bin/cat";
    auto p = ChildProcess::Spawn(c);
    EXPECT_GE(p->StdinFd(), 0);
    EXPECT_TRUE(p->IsRunning());
    EXPECT_FALSE(p->WaitForExit(50ms));
    p->CloseStdin();
    EXPECT_EQ(p->StdinFd(), -1);
    ASSERT_TRUE(p->WaitForExit(5s));
    EXPECT_EQ(p->ExitCode().value_or(-1), 0);
}

TEST(ChildProcess, TerminateKillsAndReaps) {
    auto p = ChildProcess::Spawn(shell("sleep 30"));
    ASSERT_TRUE(p->IsRunning());
    const int pid = p->Pid();
    p->Terminate();
    EXPECT_FALSE(p->IsRunning());
    EXPECT_TRUE(p->ExitCode().has_value());
    // Reaped: no such process remains.
    EXPECT_NE(::kill(pid, 0), 0);
    p->Terminate();
}

TEST(ChildProcess, SpawnFailures) {
    ServerConfig missing;
    missing.name = "missing";
    missing.command = "mcphost-definitely-not-a-command";
    try {
        (void)ChildProcess::Spawn(missing);
        FAIL() << "expected SpawnFailure";
    } catch (const errors::SessionError& e) {
        EXPECT_EQ(e.kind(), errors::ErrorKind::SpawnFailure);
    }

    ServerConfig badPath;
    badPath.name = "bad";
    badPath.command = "/nonexistent/dir/server";
    EXPECT_THROW((void)ChildProcess::Spawn(badPath), errors::SessionError);

    ServerConfig empty;
    empty.name = "empty";
    EXPECT_THROW((void)ChildProcess::Spawn(empty), errors::SessionError);
}

TEST(ChildProcess, DescriptionIncludesArguments) {
    auto p = ChildProcess::Spawn(shell("exit 0"));
    EXPECT_NE(p->Description().find("/bin/sh -c exit 0"), std::string::npos);
    p->WaitForExit(5s);
}
