//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_process_transport.cpp
// Purpose: Line framing, stderr capture and write-side failures over real child processes
//==========================================================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <future>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "mcphost/ChildProcess.hpp"
#include "mcphost/ProcessTransport.hpp"
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

ServerConfig cat() {
    ServerConfig c;
    c.name = "cat";
    c.command = "/bin/cat";
    return c;
}

// Collects reader callbacks so tests can wait on them.
struct Collector {
    std::mutex m;
    std::condition_variable cv;
    std::vector<std::string> lines;
    std::vector<std::pair<errors::ErrorKind, std::string>> errors;
    bool closed{false};

    ProcessTransport::LineHandler onLine() {
        return [this](const std::string& l) {
            std::lock_guard<std::mutex> lock(m);
            lines.push_back(l);
            cv.notify_all();
        };
    }
    ProcessTransport::ErrorHandler onError() {
        return [this](errors::ErrorKind k, const std::string& msg) {
            std::lock_guard<std::mutex> lock(m);
            errors.emplace_back(k, msg);
            if (k == errors::ErrorKind::PeerClosed) closed = true;
            cv.notify_all();
        };
    }
    bool waitLines(std::size_t n, std::chrono::milliseconds t = 5s) {
        std::unique_lock<std::mutex> lock(m);
        return cv.wait_for(lock, t, [&] { return lines.size() >= n; });
    }
    bool waitClosed(std::chrono::milliseconds t = 5s) {
        std::unique_lock<std::mutex> lock(m);
        return cv.wait_for(lock, t, [&] { return closed; });
    }
    std::size_t count(errors::ErrorKind k) {
        std::lock_guard<std::mutex> lock(m);
        std::size_t n = 0;
        for (const auto& e : errors) if (e.first == k) ++n;
        return n;
    }
};

} // namespace

TEST(ProcessTransport, EchoesLinesThroughCat) {
    auto child = ChildProcess::Spawn(cat());
    SessionOptions opts;
    ProcessTransport t(*child, opts);
    Collector c;
    t.Start(c.onLine(), c.onError());
    EXPECT_TRUE(t.IsReading());

    t.Send(R"({"jsonrpc":"2.0","method":"a"})");
    t.Send(R"({"jsonrpc":"2.0","method":"b"})");
    ASSERT_TRUE(c.waitLines(2));
    EXPECT_EQ(c.lines[0], R"({"jsonrpc":"2.0","method":"a"})");
    EXPECT_EQ(c.lines[1], R"({"jsonrpc":"2.0","method":"b"})");

    t.CloseInput();
    ASSERT_TRUE(c.waitClosed());
    t.Close();
    EXPECT_FALSE(t.IsReading());
}

TEST(ProcessTransport, StripsCarriageReturnAndSkipsBlankLines) {
    auto child = ChildProcess::Spawn(shell("printf 'one\\r\\n\\n   \\ntwo\\nthree'"));
    SessionOptions opts;
    ProcessTransport t(*child, opts);
    Collector c;
    t.Start(c.onLine(), c.onError());
    ASSERT_TRUE(c.waitClosed());
    t.Close();
    // A final unterminated line is delivered at end of stream.
    EXPECT_EQ(c.lines, (std::vector<std::string>{"one", "two", "three"}));
}

TEST(ProcessTransport, OversizedLineReportedAndSkipped) {
    auto child = ChildProcess::Spawn(shell("echo 0123456789012345678901234567890123456789; echo short"));
    SessionOptions opts;
    opts.maxLineBytes = 16;
    ProcessTransport t(*child, opts);
    Collector c;
    t.Start(c.onLine(), c.onError());
    ASSERT_TRUE(c.waitClosed());
    t.Close();
    EXPECT_EQ(c.lines, (std::vector<std::string>{"short"}));
    EXPECT_EQ(c.count(errors::ErrorKind::MalformedMessage), 1u);
}

TEST(ProcessTransport, HandlerExceptionReportedAsMalformed) {
    auto child = ChildProcess::Spawn(shell("echo bad; echo good"));
    SessionOptions opts;
    ProcessTransport t(*child, opts);
    Collector c;
    auto record = c.onLine();
    t.Start([&](const std::string& l) {
                if (l == "bad") throw std::runtime_error("cannot parse");
                record(l);
            },
            c.onError());
    ASSERT_TRUE(c.waitClosed());
    t.Close();
    EXPECT_EQ(c.lines, (std::vector<std::string>{"good"}));
    EXPECT_EQ(c.count(errors::ErrorKind::MalformedMessage), 1u);
}

TEST(ProcessTransport, CapturesBoundedStderrTail) {
    auto child = ChildProcess::Spawn(shell("echo e1 >&2; echo e2 >&2; echo e3 >&2"));
    SessionOptions opts;
    opts.stderrLines = 2;
    ProcessTransport t(*child, opts);
    std::mutex m;
    std::vector<std::string> seen;
    t.SetStderrHandler([&](const std::string& l) { std::lock_guard<std::mutex> lock(m); seen.push_back(l); });
    Collector c;
    t.Start(c.onLine(), c.onError());
    ASSERT_TRUE(c.waitClosed());
    t.Close();
    EXPECT_EQ(t.StderrTail(), (std::vector<std::string>{"e2", "e3"}));
    std::lock_guard<std::mutex> lock(m);
    EXPECT_EQ(seen, (std::vector<std::string>{"e1", "e2", "e3"}));
}

TEST(ProcessTransport, SlowStderrHandlerDoesNotStallStdout) {
    auto child = ChildProcess::Spawn(shell("echo err >&2; sleep 0.2; echo out; cat"));
    SessionOptions opts;
    ProcessTransport t(*child, opts);
    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();
    std::atomic<int> handled{0};
    t.SetStderrHandler([gate, &handled](const std::string&) {
        gate.wait();
        ++handled;
    });
    Collector c;
    t.Start(c.onLine(), c.onError());
    // The handler is still blocked while stdout keeps flowing.
    ASSERT_TRUE(c.waitLines(1, 3s));
    EXPECT_EQ(c.lines[0], "out");
    EXPECT_EQ(handled.load(), 0);
    EXPECT_EQ(t.StderrTail(), (std::vector<std::string>{"err"}));

    release.set_value();
    t.CloseInput();
    ASSERT_TRUE(c.waitClosed());
    t.Close();
    EXPECT_EQ(handled.load(), 1);
}

TEST(ProcessTransport, SendRejectsEmbeddedNewline) {
    auto child = ChildProcess::Spawn(cat());
    SessionOptions opts;
    ProcessTransport t(*child, opts);
    Collector c;
    t.Start(c.onLine(), c.onError());
    try {
        t.Send("a\nb");
        FAIL() << "expected InvalidArgument";
    } catch (const errors::SessionError& e) {
        EXPECT_EQ(e.kind(), errors::ErrorKind::InvalidArgument);
    }
    t.Close();
}

TEST(ProcessTransport, SendAfterCloseInputFails) {
    auto child = ChildProcess::Spawn(cat());
    SessionOptions opts;
    ProcessTransport t(*child, opts);
    Collector c;
    t.Start(c.onLine(), c.onError());
    t.CloseInput();
    try {
        t.Send("{}");
        FAIL() << "expected TransportClosed";
    } catch (const errors::SessionError& e) {
        EXPECT_EQ(e.kind(), errors::ErrorKind::TransportClosed);
    }
    t.Close();
}

TEST(ProcessTransport, SendToExitedPeerFails) {
    auto child = ChildProcess::Spawn(shell("exit 0"));
    ASSERT_TRUE(child->WaitForExit(5s));
    SessionOptions opts;
    ProcessTransport t(*child, opts);
    Collector c;
    t.Start(c.onLine(), c.onError());
    try {
        t.Send("{}");
        FAIL() << "expected TransportClosed";
    } catch (const errors::SessionError& e) {
        EXPECT_EQ(e.kind(), errors::ErrorKind::TransportClosed);
    }
    t.Close();
}

TEST(ProcessTransport, StalledPeerTimesOutWrite) {
    // The peer never reads its stdin, so the pipe fills.
    auto child = ChildProcess::Spawn(shell("sleep 30"));
    SessionOptions opts;
    opts.writeTimeout = 200ms;
    ProcessTransport t(*child, opts);
    Collector c;
    t.Start(c.onLine(), c.onError());
    const std::string big(1024 * 1024, 'x');
    const auto start = std::chrono::steady_clock::now();
    try {
        t.Send(big);
        FAIL() << "expected Timeout";
    } catch (const errors::SessionError& e) {
        EXPECT_EQ(e.kind(), errors::ErrorKind::Timeout);
    }
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
    // The stream now holds a partial line; further writes are refused.
    EXPECT_THROW(t.Send("{}"), errors::SessionError);
    child->Terminate();
    t.Close();
}

TEST(ProcessTransport, ConcurrentSendersNeverInterleave) {
    auto child = ChildProcess::Spawn(cat());
    SessionOptions opts;
    ProcessTransport t(*child, opts);
    Collector c;
    t.Start(c.onLine(), c.onError());

    constexpr int kThreads = 8;
    constexpr int kPerThread = 50;
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&t, i]() {
            for (int j = 0; j < kPerThread; ++j) {
                t.Send(std::string(2000, static_cast<char>('a' + i)) + std::to_string(j));
            }
        });
    }
    for (auto& th : threads) th.join();
    ASSERT_TRUE(c.waitLines(kThreads * kPerThread));
    t.Close();

    std::set<std::string> unique(c.lines.begin(), c.lines.end());
    EXPECT_EQ(unique.size(), static_cast<std::size_t>(kThreads * kPerThread));
    for (const auto& l : c.lines) {
        ASSERT_GE(l.size(), 2000u);
        EXPECT_EQ(l.find_first_not_of(l[0]), 2000u);
    }
}

TEST(ProcessTransport, StartTwiceFails) {
    auto child = ChildProcess::Spawn(cat());
    SessionOptions opts;
    ProcessTransport t(*child, opts);
    Collector c;
    t.Start(c.onLine(), c.onError());
    EXPECT_THROW(t.Start(c.onLine(), c.onError()), errors::SessionError);
    t.Close();
}
