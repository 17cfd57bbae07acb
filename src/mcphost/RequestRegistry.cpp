//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RequestRegistry.cpp
// Purpose: Pending-request table, deadline thread and cancellation plumbing
//==========================================================================================================

#include <algorithm>
#include <condition_variable>
#include <format>
#include <functional>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

#include "logging/Logger.h"
#include "mcphost/RequestRegistry.h"

namespace mcphost {

using errors::ErrorKind;
using errors::SessionError;

class RequestRegistry::Impl {
public:
    using clock = std::chrono::steady_clock;
    using StopCallback = std::stop_callback<std::function<void()>>;

    struct Entry {
        std::string method;
        std::promise<JSONValue> promise;
        clock::time_point deadline{clock::time_point::max()};
        std::chrono::milliseconds timeout{0};
        bool cancelled{false};
        // Destroyed only outside the mutex: its destructor waits for a running callback, which locks the mutex.
        std::unique_ptr<StopCallback> onStop;
    };
    using Map = std::unordered_map<std::string, Entry>;

    mutable std::mutex mutex;
    std::condition_variable cv;
    Map pending;
    bool stopped{false};
    std::thread reaper;

    Impl() {
        reaper = std::thread([this]() { reapLoop(); });
    }

    static void fail(Entry& e, ErrorKind kind, const std::string& message) {
        e.promise.set_exception(std::make_exception_ptr(SessionError(kind, message)));
    }

    void markCancelled(const std::string& id) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            auto it = pending.find(id);
            if (it == pending.end()) {
                return;
            }
            it->second.cancelled = true;
        }
        cv.notify_all();
    }

    void reapLoop() {
        std::unique_lock<std::mutex> lock(mutex);
        while (!stopped) {
            const auto now = clock::now();
            auto next = clock::time_point::max();
            std::vector<std::pair<std::string, Map::node_type>> due;
            for (auto it = pending.begin(); it != pending.end();) {
                if (it->second.cancelled || it->second.deadline <= now) {
                    auto cur = it++;
                    std::string id = cur->first;
                    due.emplace_back(std::move(id), pending.extract(cur));
                } else {
                    next = std::min(next, it->second.deadline);
                    ++it;
                }
            }
            if (!due.empty()) {
                lock.unlock();
                for (auto& [id, node] : due) {
                    Entry& e = node.mapped();
                    if (e.cancelled) {
                        LOG_DEBUG("RequestRegistry: request '{}' (id {}) cancelled by caller", e.method, id);
                        fail(e, ErrorKind::Cancelled,
                             std::format("Request '{}' (id {}) was cancelled by the caller", e.method, id));
                    } else {
                        LOG_WARN("RequestRegistry: request '{}' (id {}) timed out after {} ms", e.method, id, e.timeout.count());
                        fail(e, ErrorKind::Timeout,
                             std::format("Request '{}' (id {}) timed out after {} ms", e.method, id, e.timeout.count()));
                    }
                }
                due.clear();
                lock.lock();
                continue;
            }
            if (next == clock::time_point::max()) {
                cv.wait(lock);
            } else {
                cv.wait_until(lock, next);
            }
        }
    }
};

RequestRegistry::RequestRegistry() : pImpl(std::make_unique<Impl>()) {
    FUNC_SCOPE();
}

RequestRegistry::~RequestRegistry() {
    FUNC_SCOPE();
    Stop();
}

std::future<JSONValue> RequestRegistry::Register(const std::string& id, const std::string& method,
                                                 std::chrono::milliseconds timeout, std::stop_token stopToken) {
    FUNC_SCOPE();
    std::future<JSONValue> fut;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        if (pImpl->stopped) {
            throw SessionError(ErrorKind::SessionClosed, std::format("Cannot send '{}': session closed", method));
        }
        if (pImpl->pending.count(id) != 0) {
            throw SessionError(ErrorKind::DuplicateId, std::format("Request id {} is already pending", id));
        }
        Impl::Entry entry;
        entry.method = method;
        entry.timeout = timeout;
        if (timeout.count() > 0) {
            entry.deadline = Impl::clock::now() + timeout;
        }
        fut = entry.promise.get_future();
        pImpl->pending.emplace(id, std::move(entry));
    }
    pImpl->cv.notify_all();

    if (stopToken.stop_possible()) {
        // Runs inline when the token has already fired; must not be constructed under the mutex.
        auto onStop = std::make_unique<Impl::StopCallback>(
            stopToken, std::function<void()>([impl = pImpl.get(), id]() { impl->markCancelled(id); }));
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        auto it = pImpl->pending.find(id);
        if (it != pImpl->pending.end()) {
            it->second.onStop = std::move(onStop);
        }
        // Otherwise already completed: onStop is released after the lock.
    }
    return fut;
}

bool RequestRegistry::Resolve(const std::string& id, JSONValue result) {
    FUNC_SCOPE();
    Impl::Map::node_type node;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        node = pImpl->pending.extract(id);
    }
    if (node.empty()) {
        LOG_WARN("RequestRegistry: response for unknown or completed id {}", id);
        return false;
    }
    node.mapped().promise.set_value(std::move(result));
    return true;
}

bool RequestRegistry::Reject(const std::string& id, std::exception_ptr error) {
    FUNC_SCOPE();
    Impl::Map::node_type node;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        node = pImpl->pending.extract(id);
    }
    if (node.empty()) {
        LOG_WARN("RequestRegistry: rejection for unknown or completed id {}", id);
        return false;
    }
    node.mapped().promise.set_exception(std::move(error));
    return true;
}

bool RequestRegistry::Reject(const std::string& id, errors::ErrorKind kind, const std::string& message) {
    return Reject(id, std::make_exception_ptr(SessionError(kind, message)));
}

std::size_t RequestRegistry::CancelAll(errors::ErrorKind kind, const std::string& reason) {
    FUNC_SCOPE();
    Impl::Map drained;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        drained.swap(pImpl->pending);
    }
    for (auto& [id, entry] : drained) {
        LOG_DEBUG("RequestRegistry: cancelling '{}' (id {}): {}", entry.method, id, reason);
        Impl::fail(entry, kind, reason);
    }
    if (!drained.empty()) {
        LOG_INFO("RequestRegistry: cancelled {} pending request(s) ({})", drained.size(), std::string(errors::ToString(kind)));
    }
    return drained.size();
}

std::size_t RequestRegistry::PendingCount() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->pending.size();
}

void RequestRegistry::Stop() {
    FUNC_SCOPE();
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        pImpl->stopped = true;
    }
    (void)CancelAll(ErrorKind::SessionClosed, "Session closed");
    pImpl->cv.notify_all();
    if (pImpl->reaper.joinable() && pImpl->reaper.get_id() != std::this_thread::get_id()) {
        pImpl->reaper.join();
    }
}

} // namespace mcphost
