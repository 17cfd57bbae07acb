//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProcessTransport.cpp
// Purpose: Line-framed stdio transport to a child process (epoll reader, serialized writer)
//==========================================================================================================

#include <unistd.h>
#include <fcntl.h>
#include <errno.h>
#include <poll.h>
#include <cstring>
#include <sys/epoll.h>
#include <sys/eventfd.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <format>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>

#include <boost/circular_buffer.hpp>

#include "logging/Logger.h"
#include "mcphost/ChildProcess.hpp"
#include "mcphost/ProcessTransport.hpp"

namespace mcphost {

using errors::ErrorKind;
using errors::SessionError;

namespace {
void setNonBlocking(int fd) {
    if (fd < 0) {
        return;
    }
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags >= 0) {
        (void)::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

bool isBlank(std::string_view s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; });
}

constexpr int WriteSliceMs = 50;
constexpr int ReaderWaitMs = 200;
constexpr std::size_t StderrQueueLimit = 4096;
} // namespace

class ProcessTransport::Impl {
public:
    ChildProcess& child;
    const std::size_t maxLineBytes;
    const std::chrono::milliseconds writeTimeout;
    const int pid;

    LineHandler lineHandler;
    ErrorHandler errorHandler;
    StderrHandler stderrHandler;

    std::thread readerThread;
    std::atomic<bool> stopping{false};
    std::atomic<bool> readerRunning{false};
    std::atomic<bool> inputAbort{false};
    int wakeEventFd{-1};

    std::mutex writeMutex; // serializes writers and guards inputClosed
    bool inputClosed{false};

    mutable std::mutex stderrMutex;
    boost::circular_buffer<std::string> stderrRing;

    // Handler dispatch runs on its own thread so a slow handler never stalls the reader.
    std::thread stderrThread;
    std::mutex stderrQueueMutex;
    std::condition_variable stderrQueueCv;
    std::deque<std::string> stderrQueue;
    bool stderrQueueStop{false};
    std::size_t stderrDropped{0};

    // Reader-thread-only framing state
    std::string outBuf;
    std::string errBuf;
    bool discarding{false};

    Impl(ChildProcess& c, const SessionOptions& options)
        : child(c),
          maxLineBytes(std::max<std::size_t>(options.maxLineBytes, 1)),
          writeTimeout(options.writeTimeout),
          pid(c.Pid()),
          stderrRing(std::max<std::size_t>(options.stderrLines, 1)) {
        wakeEventFd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
        if (wakeEventFd < 0) {
            LOG_ERROR("ProcessTransport: failed to create eventfd (errno={} msg={})", errno, ::strerror(errno));
        }
        setNonBlocking(child.StdinFd());
        setNonBlocking(child.StdoutFd());
        setNonBlocking(child.StderrFd());
    }

    ~Impl() {
        if (wakeEventFd >= 0) { ::close(wakeEventFd); wakeEventFd = -1; }
    }

    void wake() {
        if (wakeEventFd < 0) {
            return;
        }
        uint64_t one = 1;
        for (;;) {
            ssize_t w = ::write(wakeEventFd, &one, sizeof(one));
            if (w >= 0 || errno == EAGAIN || errno == EWOULDBLOCK) {
                break;
            }
            if (errno == EINTR) {
                continue;
            }
            LOG_WARN("ProcessTransport: eventfd write failed (errno={} msg={})", errno, ::strerror(errno));
            break;
        }
    }

    void closeInputLocked() {
        if (!inputClosed) {
            inputClosed = true;
            child.CloseStdin();
            LOG_DEBUG("ProcessTransport: closed stdin of pid {}", pid);
        }
    }

    void reportError(ErrorKind kind, const std::string& message) {
        if (errorHandler) {
            errorHandler(kind, message);
        }
    }

    void deliverLine(std::string line) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (isBlank(line)) {
            return;
        }
        LOG_DEBUG("ProcessTransport: <- {}", line);
        try {
            if (lineHandler) {
                lineHandler(line);
            }
        } catch (const std::exception& e) {
            LOG_WARN("ProcessTransport: rejected line from pid {}: {}", pid, e.what());
            reportError(ErrorKind::MalformedMessage, e.what());
        }
    }

    void appendStdout(const char* data, std::size_t n) {
        std::string_view chunk(data, n);
        if (discarding) {
            auto nl = chunk.find('\n');
            if (nl == std::string_view::npos) {
                return;
            }
            chunk.remove_prefix(nl + 1);
            discarding = false;
        }
        outBuf.append(chunk);
        std::size_t start = 0;
        while (true) {
            auto nl = outBuf.find('\n', start);
            if (nl == std::string::npos) {
                break;
            }
            if (nl - start > maxLineBytes) {
                reportOversized(nl - start);
            } else {
                deliverLine(outBuf.substr(start, nl - start));
            }
            start = nl + 1;
        }
        outBuf.erase(0, start);
        if (outBuf.size() > maxLineBytes) {
            reportOversized(outBuf.size());
            outBuf.clear();
            discarding = true;
        }
    }

    void reportOversized(std::size_t size) {
        const std::string msg = std::format("line of at least {} bytes exceeds limit of {} bytes; discarded", size, maxLineBytes);
        LOG_WARN("ProcessTransport: {}", msg);
        reportError(ErrorKind::MalformedMessage, msg);
    }

    void recordStderr(std::string line) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            return;
        }
        LOG_WARN("ProcessTransport: stderr (pid {}): {}", pid, line);
        {
            std::lock_guard<std::mutex> lock(stderrMutex);
            stderrRing.push_back(line);
        }
        if (stderrHandler) {
            std::lock_guard<std::mutex> lock(stderrQueueMutex);
            if (stderrQueue.size() >= StderrQueueLimit) {
                stderrQueue.pop_front();
                ++stderrDropped;
            }
            stderrQueue.push_back(std::move(line));
            stderrQueueCv.notify_one();
        }
    }

    void stderrDispatchLoop() {
        std::unique_lock<std::mutex> lock(stderrQueueMutex);
        for (;;) {
            stderrQueueCv.wait(lock, [this] { return stderrQueueStop || !stderrQueue.empty(); });
            if (stderrQueue.empty()) {
                break;
            }
            std::string line = std::move(stderrQueue.front());
            stderrQueue.pop_front();
            lock.unlock();
            try {
                stderrHandler(line);
            } catch (const std::exception& e) {
                LOG_WARN("ProcessTransport: stderr handler threw: {}", e.what());
            }
            lock.lock();
        }
        if (stderrDropped > 0) {
            LOG_WARN("ProcessTransport: {} stderr line(s) from pid {} not delivered to a slow handler", stderrDropped, pid);
        }
    }

    void stopStderrDispatch() {
        {
            std::lock_guard<std::mutex> lock(stderrQueueMutex);
            stderrQueueStop = true;
        }
        stderrQueueCv.notify_all();
        if (stderrThread.joinable()) {
            if (stderrThread.get_id() == std::this_thread::get_id()) {
                LOG_ERROR("ProcessTransport: Close() called from the stderr handler; detaching");
                stderrThread.detach();
            } else {
                stderrThread.join();
            }
        }
    }

    void appendStderr(const char* data, std::size_t n) {
        errBuf.append(data, n);
        std::size_t start = 0;
        while (true) {
            auto nl = errBuf.find('\n', start);
            if (nl == std::string::npos) {
                break;
            }
            recordStderr(errBuf.substr(start, nl - start));
            start = nl + 1;
        }
        errBuf.erase(0, start);
        if (errBuf.size() > maxLineBytes) {
            recordStderr(errBuf.substr(0, maxLineBytes));
            errBuf.clear();
        }
    }

    // Reads until the pipe is drained. Returns false at end of stream or on a hard read error.
    template <typename Sink>
    bool drain(int fd, Sink&& sink) {
        std::array<char, 8192> tmp{};
        for (;;) {
            ssize_t n = ::read(fd, tmp.data(), tmp.size());
            if (n > 0) {
                sink(tmp.data(), static_cast<std::size_t>(n));
                continue;
            }
            if (n == 0) {
                return false;
            }
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                return true;
            }
            LOG_ERROR("ProcessTransport: read error on fd {} (errno={} msg={})", fd, errno, ::strerror(errno));
            return false;
        }
    }

    void readerLoop() {
        const int outFd = child.StdoutFd();
        const int errFd = child.StderrFd();
        auto onOut = [this](const char* d, std::size_t n) { appendStdout(d, n); };
        auto onErr = [this](const char* d, std::size_t n) { appendStderr(d, n); };

        int ep = ::epoll_create1(EPOLL_CLOEXEC);
        if (ep < 0) {
            LOG_ERROR("ProcessTransport: epoll_create1 failed (errno={} msg={})", errno, ::strerror(errno));
            readerRunning = false;
            reportError(ErrorKind::PeerClosed, "transport reader could not start");
            return;
        }
        auto watch = [ep](int fd) {
            if (fd < 0) return;
            epoll_event ev{}; ev.events = EPOLLIN | EPOLLRDHUP; ev.data.fd = fd;
            if (::epoll_ctl(ep, EPOLL_CTL_ADD, fd, &ev) != 0) {
                LOG_ERROR("ProcessTransport: epoll_ctl add fd {} failed (errno={} msg={})", fd, errno, ::strerror(errno));
            }
        };
        watch(outFd);
        watch(errFd);
        watch(wakeEventFd);

        bool outOpen = outFd >= 0;
        bool errOpen = errFd >= 0;
        while (!stopping && outOpen) {
            std::array<epoll_event, 3> events{};
            int rc = ::epoll_wait(ep, events.data(), static_cast<int>(events.size()), ReaderWaitMs);
            if (rc < 0) {
                if (errno == EINTR) {
                    continue;
                }
                LOG_ERROR("ProcessTransport: epoll_wait failed (errno={} msg={})", errno, ::strerror(errno));
                break;
            }
            for (int i = 0; i < rc && !stopping; ++i) {
                const int fd = events[static_cast<std::size_t>(i)].data.fd;
                if (fd == wakeEventFd) {
                    uint64_t v = 0;
                    ssize_t r;
                    do { r = ::read(fd, &v, sizeof(v)); } while (r < 0 && errno == EINTR);
                } else if (fd == errFd && errOpen) {
                    if (!drain(errFd, onErr)) {
                        errOpen = false;
                        (void)::epoll_ctl(ep, EPOLL_CTL_DEL, errFd, nullptr);
                    }
                } else if (fd == outFd && outOpen) {
                    outOpen = drain(outFd, onOut);
                }
            }
        }
        ::close(ep);

        if (stopping) {
            readerRunning = false;
            return;
        }

        // Output stream ended: collect whatever diagnostics the peer left behind before reporting.
        if (errOpen) {
            (void)drain(errFd, onErr);
        }
        if (!errBuf.empty()) {
            recordStderr(errBuf);
            errBuf.clear();
        }
        if (!discarding && !outBuf.empty()) {
            std::string last;
            last.swap(outBuf);
            deliverLine(std::move(last));
        }
        LOG_INFO("ProcessTransport: end of stream from pid {}", pid);
        readerRunning = false;
        reportError(ErrorKind::PeerClosed, "peer closed its output stream");
    }
};

ProcessTransport::ProcessTransport(ChildProcess& child, const SessionOptions& options)
    : pImpl(std::make_unique<Impl>(child, options)) {
    FUNC_SCOPE();
}

ProcessTransport::~ProcessTransport() {
    FUNC_SCOPE();
    Close();
}

void ProcessTransport::SetStderrHandler(StderrHandler handler) {
    FUNC_SCOPE();
    pImpl->stderrHandler = std::move(handler);
}

void ProcessTransport::Start(LineHandler onLine, ErrorHandler onError) {
    FUNC_SCOPE();
    if (pImpl->readerThread.joinable() || pImpl->stopping) {
        throw SessionError(ErrorKind::TransportClosed, "transport already started or closed");
    }
    pImpl->lineHandler = std::move(onLine);
    pImpl->errorHandler = std::move(onError);
    if (pImpl->stderrHandler) {
        pImpl->stderrThread = std::thread([this]() { pImpl->stderrDispatchLoop(); });
    }
    pImpl->readerRunning = true;
    pImpl->readerThread = std::thread([this]() { pImpl->readerLoop(); });
    LOG_DEBUG("ProcessTransport: reader started for pid {}", pImpl->pid);
}

void ProcessTransport::Send(const std::string& line) {
    FUNC_SCOPE();
    if (line.find('\n') != std::string::npos) {
        throw SessionError(ErrorKind::InvalidArgument, "message contains a raw newline");
    }
    std::lock_guard<std::mutex> lock(pImpl->writeMutex);
    const int fd = pImpl->child.StdinFd();
    if (pImpl->inputClosed || pImpl->inputAbort || fd < 0) {
        throw SessionError(ErrorKind::TransportClosed, "transport input is closed");
    }
    LOG_DEBUG("ProcessTransport: -> {}", line);

    std::string frame;
    frame.reserve(line.size() + 1);
    frame.append(line);
    frame.push_back('\n');

    using clock = std::chrono::steady_clock;
    const bool bounded = pImpl->writeTimeout.count() > 0;
    const auto deadline = clock::now() + pImpl->writeTimeout;
    std::size_t total = 0;
    while (total < frame.size()) {
        ssize_t w = ::write(fd, frame.data() + total, frame.size() - total);
        if (w > 0) {
            total += static_cast<std::size_t>(w);
            continue;
        }
        if (w < 0 && errno == EINTR) {
            continue;
        }
        if (w < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            if (pImpl->inputAbort) {
                pImpl->closeInputLocked();
                throw SessionError(ErrorKind::TransportClosed, "transport closed during write");
            }
            if (bounded && clock::now() >= deadline) {
                LOG_ERROR("ProcessTransport: write timeout ({} ms) to pid {}", static_cast<long long>(pImpl->writeTimeout.count()), pImpl->pid);
                pImpl->closeInputLocked();
                throw SessionError(ErrorKind::Timeout,
                    std::format("write to peer stalled for more than {} ms", pImpl->writeTimeout.count()));
            }
            pollfd p{};
            p.fd = fd;
            p.events = POLLOUT;
            int rc = ::poll(&p, 1, WriteSliceMs);
            if (rc > 0 && (p.revents & (POLLERR | POLLHUP | POLLNVAL))) {
                pImpl->closeInputLocked();
                throw SessionError(ErrorKind::TransportClosed, "peer closed its input stream");
            }
            if (rc < 0 && errno != EINTR) {
                const int err = errno;
                pImpl->closeInputLocked();
                throw SessionError(ErrorKind::TransportClosed,
                    std::format("poll failed while writing (errno={} msg={})", err, ::strerror(err)));
            }
            continue;
        }
        const int err = (w < 0) ? errno : EIO;
        pImpl->closeInputLocked();
        if (err == EPIPE) {
            throw SessionError(ErrorKind::TransportClosed, "peer closed its input stream (broken pipe)");
        }
        throw SessionError(ErrorKind::TransportClosed,
            std::format("write failed (errno={} msg={})", err, ::strerror(err)));
    }
}

void ProcessTransport::CloseInput() {
    FUNC_SCOPE();
    pImpl->inputAbort = true;
    std::lock_guard<std::mutex> lock(pImpl->writeMutex);
    pImpl->closeInputLocked();
}

void ProcessTransport::Close() {
    FUNC_SCOPE();
    CloseInput();
    pImpl->stopping = true;
    pImpl->wake();
    if (pImpl->readerThread.joinable()) {
        if (pImpl->readerThread.get_id() == std::this_thread::get_id()) {
            LOG_ERROR("ProcessTransport: Close() called from the reader thread; detaching");
            pImpl->readerThread.detach();
        } else {
            pImpl->readerThread.join();
        }
    }
    // Lines already queued are still delivered before Close() returns.
    pImpl->stopStderrDispatch();
}

bool ProcessTransport::IsReading() const {
    return pImpl->readerRunning.load();
}

std::vector<std::string> ProcessTransport::StderrTail() const {
    std::lock_guard<std::mutex> lock(pImpl->stderrMutex);
    return std::vector<std::string>(pImpl->stderrRing.begin(), pImpl->stderrRing.end());
}

} // namespace mcphost
