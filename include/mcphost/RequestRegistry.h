//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RequestRegistry.h
// Purpose: Correlation table for in-flight JSON-RPC requests with per-request deadlines and cancellation
//==========================================================================================================
#pragma once

#include <chrono>
#include <cstddef>
#include <exception>
#include <future>
#include <memory>
#include <stop_token>
#include <string>

#include "mcphost/JSONRPCTypes.h"
#include "mcphost/errors/Errors.h"

namespace mcphost {

//==========================================================================================================
// RequestRegistry
// Purpose: Tracks outstanding requests by correlation id and completes each waiter exactly once: with a
//          result, a rejection, a deadline expiry (Timeout), a caller cancellation (Cancelled) or a bulk
//          cancellation (CancelAll). Entries are removed under one mutex and completed outside it.
// Notes:
//   One background thread sleeps until the nearest deadline and expires entries. Expiry of one entry never
//   affects another.
//==========================================================================================================
class RequestRegistry {
public:
    RequestRegistry();
    ~RequestRegistry();
    RequestRegistry(const RequestRegistry&) = delete;
    RequestRegistry& operator=(const RequestRegistry&) = delete;

    //==========================================================================================================
    // Register
    // Purpose: Adds a pending entry and returns the future its waiter blocks on.
    // Args:
    //   id: Correlation id (string form).
    //   method: Method name, used in diagnostics.
    //   timeout: Relative deadline; zero disables the deadline.
    //   stopToken: Optional caller cancellation; firing it rejects the entry with Cancelled.
    // Throws:
    //   SessionError(DuplicateId) when id is already pending.
    //   SessionError(SessionClosed) after Stop().
    //==========================================================================================================
    std::future<JSONValue> Register(const std::string& id, const std::string& method,
                                    std::chrono::milliseconds timeout, std::stop_token stopToken = {});

    //==========================================================================================================
    // Resolve / Reject
    // Purpose: Removes the entry and completes its waiter.
    // Returns:
    //   false (and logs) when the id is not pending.
    //==========================================================================================================
    bool Resolve(const std::string& id, JSONValue result);
    bool Reject(const std::string& id, std::exception_ptr error);
    bool Reject(const std::string& id, errors::ErrorKind kind, const std::string& message);

    //==========================================================================================================
    // CancelAll
    // Purpose: Rejects every outstanding entry with SessionError(kind, reason).
    // Returns:
    //   Number of entries cancelled.
    //==========================================================================================================
    std::size_t CancelAll(errors::ErrorKind kind, const std::string& reason);

    std::size_t PendingCount() const;

    //==========================================================================================================
    // Stop
    // Purpose: Cancels everything with SessionClosed, refuses new registrations and joins the timer thread.
    //          Idempotent.
    //==========================================================================================================
    void Stop();

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcphost
