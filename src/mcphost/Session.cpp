//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Session.cpp
// Purpose: Handshake state machine, request correlation and teardown for one tool-server session
//==========================================================================================================

#include "mcphost/Session.h"

#include <format>
#include <initializer_list>
#include <map>
#include <mutex>
#include <unordered_map>

#include "logging/Logger.h"
#include "mcphost/Base64.h"
#include "mcphost/ChildProcess.hpp"
#include "mcphost/ProcessTransport.hpp"
#include "mcphost/RequestRegistry.h"

namespace mcphost {

using errors::ErrorKind;
using errors::SessionError;

std::string_view ToString(SessionState state) {
    switch (state) {
        case SessionState::Unconnected: return "Unconnected";
        case SessionState::Starting: return "Starting";
        case SessionState::Initializing: return "Initializing";
        case SessionState::Ready: return "Ready";
        case SessionState::Closing: return "Closing";
        case SessionState::Closed: return "Closed";
        case SessionState::Failed: return "Failed";
    }
    return "Unknown";
}

namespace {

bool isTerminal(SessionState s) {
    return s == SessionState::Closed || s == SessionState::Failed;
}

std::shared_ptr<JSONValue> makeShared(JSONValue v) {
    return std::make_shared<JSONValue>(std::move(v));
}

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    const auto first = s.find_first_not_of(ws);
    if (first == std::string::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

} // namespace

class Session::Impl {
public:
    const std::string name;
    const SessionOptions options;

    mutable std::mutex stateMutex;
    SessionState state{SessionState::Unconnected};
    uint64_t nextId{0};
    std::optional<ServerInfo> serverInfo;

    std::mutex handlerMutex;
    SessionEventHandler eventHandler;
    std::unordered_map<std::string, NotificationHandler> notificationHandlers;

    std::mutex catalogMutex;
    std::shared_ptr<const ToolCatalog> catalog;

    std::mutex closeMutex;
    std::mutex teardownMutex;
    // Guards publication of child/transport; both live until the Impl is destroyed.
    mutable std::mutex ioMutex;
    bool tornDown{false};

    // Destruction order matters: transport (reader thread) goes first, then the process, then the registry.
    RequestRegistry registry;
    std::unique_ptr<ChildProcess> child;
    std::unique_ptr<ProcessTransport> transport;

    Impl(std::string n, SessionOptions opts) : name(std::move(n)), options(std::move(opts)) {}

    SessionState currentState() const {
        std::lock_guard<std::mutex> lock(stateMutex);
        return state;
    }

    void emit(SessionEvent::Kind kind, const std::string& message) {
        SessionEventHandler handler;
        {
            std::lock_guard<std::mutex> lock(handlerMutex);
            handler = eventHandler;
        }
        if (!handler) {
            return;
        }
        SessionEvent ev{kind, name, currentState(), message};
        try {
            handler(ev);
        } catch (const std::exception& e) {
            LOG_WARN("Session '{}': event handler threw: {}", name, e.what());
        }
    }

    //==========================================================================================================
    // Moves to 'to' when the current state is one of 'from'. Terminal states never change.
    //==========================================================================================================
    bool transition(std::initializer_list<SessionState> from, SessionState to) {
        SessionState prev;
        {
            std::lock_guard<std::mutex> lock(stateMutex);
            prev = state;
            if (isTerminal(prev) || prev == to) {
                return false;
            }
            bool allowed = from.size() == 0;
            for (SessionState s : from) {
                if (s == prev) { allowed = true; break; }
            }
            if (!allowed) {
                return false;
            }
            state = to;
        }
        LOG_INFO("Session '{}': {} -> {}", name, ToString(prev), ToString(to));
        emit(SessionEvent::Kind::StateChanged, std::format("{} -> {}", ToString(prev), ToString(to)));
        return true;
    }

    // Unconditional forward move (any non-terminal state).
    bool setState(SessionState to) {
        return transition({}, to);
    }

    //==========================================================================================================
    // request
    // Purpose: Registers, writes and waits. 'internal' admits the handshake and shutdown requests, which
    //          run while Initializing / Closing.
    //==========================================================================================================
    JSONValue request(const std::string& method, std::optional<JSONValue> params,
                      std::chrono::milliseconds timeout, std::stop_token stopToken, bool internal) {
        std::string id;
        std::future<JSONValue> fut;
        {
            std::lock_guard<std::mutex> lock(stateMutex);
            const bool ok = state == SessionState::Ready ||
                            (internal && (state == SessionState::Initializing || state == SessionState::Closing));
            if (!ok) {
                throw SessionError(ErrorKind::NotReady,
                                   std::format("Session '{}' is not ready (state {})", name, ToString(state)));
            }
            id = std::to_string(++nextId);
            fut = registry.Register(id, method, timeout, stopToken);
        }

        LOG_DEBUG("Session '{}': -> {} (id {})", name, method, id);
        JSONRPCRequest req(JSONRPCId{id}, method, std::move(params));
        try {
            transport->Send(req.Serialize());
        } catch (const SessionError& e) {
            LOG_WARN("Session '{}': failed to send {} (id {}): {}", name, method, id, e.what());
            registry.Reject(id, std::current_exception());
        }
        return fut.get();
    }

    void notify(const std::string& method, std::optional<JSONValue> params) {
        JSONRPCNotification n(method, std::move(params));
        LOG_DEBUG("Session '{}': -> notification {}", name, method);
        transport->Send(n.Serialize());
    }

    //==========================================================================================================
    // Reader-thread dispatch
    //==========================================================================================================
    void handleLine(const std::string& line) {
        const JSONValue doc = ParseJSON(line);
        switch (ClassifyMessage(doc)) {
            case MessageKind::Response:
                handleResponse(doc);
                break;
            case MessageKind::Request:
                handlePeerRequest(doc);
                break;
            case MessageKind::Notification:
                handleNotification(doc);
                break;
            case MessageKind::Invalid:
                throw std::runtime_error("not a JSON-RPC request, response or notification");
        }
    }

    void handleResponse(const JSONValue& doc) {
        JSONRPCResponse resp;
        if (!resp.FromValue(doc)) {
            throw std::runtime_error("response id is neither a string nor an integer");
        }
        const std::string id = IdToString(resp.id);
        if (id.empty()) {
            LOG_WARN("Session '{}': response with null id ignored", name);
            emit(SessionEvent::Kind::UnknownResponse, SerializeJSON(doc));
            return;
        }

        bool matched = false;
        if (resp.error) {
            if (auto pe = errors::mcpErrorFromErrorValue(*resp.error)) {
                const std::string msg = std::format("Peer '{}' returned error {}: {}", name, pe->code, pe->message);
                matched = registry.Reject(id, std::make_exception_ptr(SessionError(ErrorKind::PeerError, msg, *pe)));
            } else {
                matched = registry.Reject(id, ErrorKind::MalformedMessage,
                                          std::format("Peer '{}' sent a malformed error object for id {}", name, id));
            }
        } else if (resp.result) {
            LOG_DEBUG("Session '{}': <- response (id {})", name, id);
            matched = registry.Resolve(id, std::move(*resp.result));
        } else {
            matched = registry.Reject(id, ErrorKind::MalformedMessage,
                                      std::format("Peer '{}' sent a response with neither result nor error (id {})", name, id));
        }
        if (!matched) {
            emit(SessionEvent::Kind::UnknownResponse, id);
        }
    }

    void handlePeerRequest(const JSONValue& doc) {
        JSONRPCRequest req;
        if (!req.FromValue(doc)) {
            throw std::runtime_error("peer request has an invalid id or method");
        }
        std::string reply;
        if (req.method == Methods::Ping) {
            LOG_DEBUG("Session '{}': answering peer ping", name);
            reply = JSONRPCResponse(req.id, JSONValue(JSONValue::Object{})).Serialize();
        } else {
            LOG_WARN("Session '{}': peer requested unsupported method '{}'", name, req.method);
            reply = CreateErrorResponse(req.id, JSONRPCErrorCodes::MethodNotFound, "Method not found")->Serialize();
        }
        try {
            transport->Send(reply);
        } catch (const SessionError& e) {
            LOG_WARN("Session '{}': could not answer peer request '{}': {}", name, req.method, e.what());
        }
    }

    void handleNotification(const JSONValue& doc) {
        JSONRPCNotification n;
        if (!n.FromValue(doc)) {
            throw std::runtime_error("notification without a method name");
        }
        const JSONValue params = n.params ? *n.params : JSONValue(JSONValue::Object{});
        if (n.method == Methods::ToolListChanged) {
            LOG_INFO("Session '{}': peer reports a changed tool list; cached catalog retained", name);
        } else if (n.method == Methods::Log) {
            LOG_INFO("Session '{}': peer log: {}", name, SerializeJSON(params));
        } else {
            LOG_DEBUG("Session '{}': <- notification {}", name, n.method);
        }

        NotificationHandler handler;
        {
            std::lock_guard<std::mutex> lock(handlerMutex);
            auto it = notificationHandlers.find(n.method);
            if (it != notificationHandlers.end()) {
                handler = it->second;
            }
        }
        if (handler) {
            try {
                handler(n.method, params);
            } catch (const std::exception& e) {
                LOG_WARN("Session '{}': handler for '{}' threw: {}", name, n.method, e.what());
            }
        }
        emit(SessionEvent::Kind::PeerNotification, n.method);
    }

    void handleTransportError(ErrorKind kind, const std::string& message) {
        if (kind == ErrorKind::PeerClosed) {
            LOG_WARN("Session '{}': {}", name, message);
            transition({SessionState::Starting, SessionState::Initializing, SessionState::Ready}, SessionState::Failed);
            registry.CancelAll(ErrorKind::PeerClosed, std::format("Peer '{}' closed: {}", name, message));
            return;
        }
        LOG_WARN("Session '{}': {}: {}", name, errors::ToString(kind), message);
        emit(SessionEvent::Kind::MalformedLine, message);
    }

    //==========================================================================================================
    // teardown
    // Purpose: The single release path for Close, handshake failure and destruction. Cancels pending work,
    //          closes stdin, gives the peer the grace period, kills it if needed and joins every thread.
    //==========================================================================================================
    void teardown(SessionState finalState, ErrorKind kind, const std::string& reason) {
        std::lock_guard<std::mutex> lock(teardownMutex);
        if (tornDown) {
            setState(finalState);
            return;
        }
        tornDown = true;

        ChildProcess* child = nullptr;
        ProcessTransport* transport = nullptr;
        {
            std::lock_guard<std::mutex> ioLock(ioMutex);
            child = this->child.get();
            transport = this->transport.get();
        }
        registry.CancelAll(kind, reason);
        if (transport) {
            transport->CloseInput();
        }
        if (child) {
            if (!child->WaitForExit(options.exitGracePeriod)) {
                LOG_WARN("Session '{}': peer did not exit within {} ms; killing pid {}", name,
                         options.exitGracePeriod.count(), child->Pid());
                child->Terminate();
            }
            if (auto code = child->ExitCode()) {
                LOG_INFO("Session '{}': peer exited with code {}", name, *code);
            }
        }
        if (transport) {
            transport->Close();
        }
        registry.Stop();
        setState(finalState);
    }

    std::string handshakeDiagnostics() {
        std::string out;
        if (child) {
            if (auto code = child->ExitCode()) {
                out += std::format("; exit code {}", *code);
            }
        }
        if (transport) {
            const auto tail = transport->StderrTail();
            if (!tail.empty()) {
                out += "; stderr:";
                for (const auto& l : tail) {
                    out += "\n  ";
                    out += l;
                }
            }
        }
        return out;
    }
};

Session::Session(std::string name, SessionOptions options)
    : pImpl(std::make_unique<Impl>(std::move(name), std::move(options))) {
    FUNC_SCOPE();
}

Session::~Session() {
    FUNC_SCOPE();
    try {
        Close();
    } catch (const std::exception& e) {
        LOG_ERROR("Session '{}': error while closing: {}", pImpl->name, e.what());
    }
}

void Session::Start(const ServerConfig& config) {
    FUNC_SCOPE();
    if (!pImpl->transition({SessionState::Unconnected}, SessionState::Starting)) {
        throw SessionError(ErrorKind::InvalidArgument,
                           std::format("Session '{}' was already started (state {})", pImpl->name,
                                       ToString(pImpl->currentState())));
    }

    try {
        auto spawned = ChildProcess::Spawn(config);
        std::lock_guard<std::mutex> lock(pImpl->ioMutex);
        pImpl->child = std::move(spawned);
    } catch (const SessionError& e) {
        LOG_ERROR("Session '{}': spawn failed: {}", pImpl->name, e.what());
        pImpl->teardown(SessionState::Failed, ErrorKind::SessionClosed, e.what());
        throw;
    }
    LOG_INFO("Session '{}': started '{}' (pid {})", pImpl->name, pImpl->child->Description(), pImpl->child->Pid());

    Impl* impl = pImpl.get();
    try {
        {
            std::lock_guard<std::mutex> lock(pImpl->ioMutex);
            pImpl->transport = std::make_unique<ProcessTransport>(*pImpl->child, pImpl->options);
        }
        pImpl->transport->SetStderrHandler([impl](const std::string& line) {
            impl->emit(SessionEvent::Kind::PeerStderr, line);
        });
        pImpl->transport->Start(
            [impl](const std::string& line) { impl->handleLine(line); },
            [impl](ErrorKind kind, const std::string& message) { impl->handleTransportError(kind, message); });
    } catch (const SessionError& e) {
        LOG_ERROR("Session '{}': transport start failed: {}", pImpl->name, e.what());
        pImpl->teardown(SessionState::Failed, ErrorKind::SessionClosed, e.what());
        throw;
    }

    if (!pImpl->transition({SessionState::Starting}, SessionState::Initializing)) {
        throw SessionError(ErrorKind::SessionClosed,
                           std::format("Session '{}' was closed while starting", pImpl->name));
    }

    JSONValue::Object clientInfo;
    clientInfo["name"] = makeShared(JSONValue(pImpl->options.clientInfo.name));
    clientInfo["version"] = makeShared(JSONValue(pImpl->options.clientInfo.version));
    JSONValue::Object capabilities;
    capabilities["tools"] = makeShared(JSONValue(JSONValue::Object{}));
    JSONValue::Object params;
    params["protocolVersion"] = makeShared(JSONValue(pImpl->options.protocolVersion));
    params["clientInfo"] = makeShared(JSONValue(std::move(clientInfo)));
    params["capabilities"] = makeShared(JSONValue(std::move(capabilities)));

    JSONValue result;
    try {
        result = pImpl->request(Methods::Initialize, JSONValue(std::move(params)), pImpl->options.initializeTimeout,
                                {}, true);
        pImpl->notify(Methods::Initialized, JSONValue(JSONValue::Object{}));
    } catch (const SessionError& e) {
        const ErrorKind kind = e.kind() == ErrorKind::Timeout ? ErrorKind::HandshakeTimeout : ErrorKind::HandshakeFailed;
        if (e.kind() == ErrorKind::PeerClosed) {
            // Give the exiting peer a moment so its status can be reported.
            pImpl->child->WaitForExit(pImpl->options.exitGracePeriod);
        }
        const std::string message = std::format("Handshake with '{}' failed: {}{}", pImpl->name, e.what(),
                                                pImpl->handshakeDiagnostics());
        LOG_ERROR("{}", message);
        pImpl->teardown(SessionState::Failed, ErrorKind::SessionClosed, message);
        if (e.peerError()) {
            throw SessionError(kind, message, *e.peerError());
        }
        throw SessionError(kind, message);
    }

    ServerInfo info;
    if (const std::string* pv = result.FindString("protocolVersion")) {
        info.protocolVersion = *pv;
    }
    if (const JSONValue* si = result.Find("serverInfo")) {
        if (const std::string* n = si->FindString("name")) info.name = *n;
        if (const std::string* v = si->FindString("version")) info.version = *v;
    }
    {
        std::lock_guard<std::mutex> lock(pImpl->stateMutex);
        pImpl->serverInfo = info;
    }

    if (!pImpl->transition({SessionState::Initializing}, SessionState::Ready)) {
        const std::string message = std::format("Handshake with '{}' failed: peer went away after initialize{}",
                                                pImpl->name, pImpl->handshakeDiagnostics());
        LOG_ERROR("{}", message);
        pImpl->teardown(SessionState::Failed, ErrorKind::SessionClosed, message);
        throw SessionError(ErrorKind::HandshakeFailed, message);
    }
    LOG_INFO("Session '{}': ready (server {} {}, protocol {})", pImpl->name, info.name, info.version,
             info.protocolVersion);
}

std::shared_ptr<const ToolCatalog> Session::ListTools(std::stop_token stopToken) {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lock(pImpl->catalogMutex);
    if (pImpl->catalog) {
        if (pImpl->currentState() != SessionState::Ready) {
            throw SessionError(ErrorKind::NotReady, std::format("Session '{}' is not ready (state {})", pImpl->name,
                                                                ToString(pImpl->currentState())));
        }
        return pImpl->catalog;
    }
    JSONValue result = pImpl->request(Methods::ListTools, JSONValue(JSONValue::Object{}),
                                      pImpl->options.requestTimeout, stopToken, false);
    pImpl->catalog = std::make_shared<const ToolCatalog>(ToolCatalog::FromListResult(result));
    LOG_INFO("Session '{}': discovered {} tool(s)", pImpl->name, pImpl->catalog->size());
    return pImpl->catalog;
}

std::string Session::CallTool(const std::string& toolName, const JSONValue& arguments, std::stop_token stopToken) {
    FUNC_SCOPE();
    JSONValue::Object params;
    params["name"] = makeShared(JSONValue(toolName));
    params["arguments"] = makeShared(arguments.IsNull() ? JSONValue(JSONValue::Object{}) : arguments);

    const JSONValue result = pImpl->request(Methods::CallTool, JSONValue(std::move(params)),
                                            pImpl->options.requestTimeout, stopToken, false);

    if (const JSONValue* isError = result.Find("isError")) {
        if (const bool* flag = std::get_if<bool>(&isError->value); flag && *flag) {
            LOG_WARN("Session '{}': tool '{}' reported an error", pImpl->name, toolName);
        }
    }

    const JSONValue* content = result.Find("content");
    const auto* blocks = content ? std::get_if<JSONValue::Array>(&content->value) : nullptr;
    if (!blocks) {
        return SerializeJSON(result);
    }
    std::string text;
    bool first = true;
    for (const auto& block : *blocks) {
        if (!block) {
            continue;
        }
        const std::string* type = block->FindString("type");
        const std::string* t = block->FindString("text");
        if (type && *type == "text" && t) {
            if (!first) {
                text.push_back('\n');
            }
            text += *t;
            first = false;
        }
    }
    return trim(text);
}

std::vector<uint8_t> Session::ReadResource(const std::string& uri, std::stop_token stopToken) {
    FUNC_SCOPE();
    JSONValue::Object params;
    params["uri"] = makeShared(JSONValue(uri));

    const JSONValue result = pImpl->request(Methods::ReadResource, JSONValue(std::move(params)),
                                            pImpl->options.requestTimeout, stopToken, false);

    const JSONValue* contents = result.Find("contents");
    const auto* entries = contents ? std::get_if<JSONValue::Array>(&contents->value) : nullptr;
    if (!entries || entries->empty()) {
        throw SessionError(ErrorKind::NoContent, std::format("Resource '{}' returned no content", uri));
    }
    const auto& entry = entries->front();
    if (entry) {
        if (const std::string* text = entry->FindString("text")) {
            return std::vector<uint8_t>(text->begin(), text->end());
        }
        if (const std::string* blob = entry->FindString("blob"); blob && !blob->empty()) {
            return DecodeBase64(*blob);
        }
    }
    throw SessionError(ErrorKind::EmptyResource, std::format("Resource '{}' has neither text nor blob content", uri));
}

JSONValue Session::SendRequest(const std::string& method, std::optional<JSONValue> params,
                               std::stop_token stopToken, std::optional<std::chrono::milliseconds> timeout) {
    FUNC_SCOPE();
    return pImpl->request(method, std::move(params), timeout.value_or(pImpl->options.requestTimeout), stopToken, false);
}

void Session::SendNotification(const std::string& method, std::optional<JSONValue> params) {
    FUNC_SCOPE();
    if (pImpl->currentState() != SessionState::Ready) {
        throw SessionError(ErrorKind::NotReady, std::format("Session '{}' is not ready (state {})", pImpl->name,
                                                            ToString(pImpl->currentState())));
    }
    pImpl->notify(method, std::move(params));
}

void Session::Close() {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lock(pImpl->closeMutex);
    const std::string reason = std::format("Session '{}' closed", pImpl->name);

    switch (pImpl->currentState()) {
        case SessionState::Closed:
            return;
        case SessionState::Failed:
            pImpl->teardown(SessionState::Failed, ErrorKind::SessionClosed, reason);
            return;
        case SessionState::Unconnected:
        case SessionState::Starting:
        case SessionState::Initializing:
        case SessionState::Closing:
            pImpl->teardown(SessionState::Closed, ErrorKind::SessionClosed, reason);
            return;
        case SessionState::Ready:
            break;
    }

    if (!pImpl->transition({SessionState::Ready}, SessionState::Closing)) {
        // Lost the race with a peer exit.
        pImpl->teardown(SessionState::Failed, ErrorKind::SessionClosed, reason);
        return;
    }

    try {
        pImpl->request(Methods::Shutdown, std::nullopt, pImpl->options.shutdownTimeout, {}, true);
    } catch (const SessionError& e) {
        if (e.peerError() && e.peerError()->code == JSONRPCErrorCodes::MethodNotFound) {
            LOG_WARN("Session '{}': peer does not implement shutdown; sending exit", pImpl->name);
        } else {
            LOG_WARN("Session '{}': shutdown failed: {}", pImpl->name, e.what());
        }
    }
    try {
        pImpl->notify(Methods::Exit, std::nullopt);
    } catch (const SessionError& e) {
        LOG_WARN("Session '{}': exit notification not delivered: {}", pImpl->name, e.what());
    }
    pImpl->teardown(SessionState::Closed, ErrorKind::SessionClosed, reason);
}

SessionState Session::State() const {
    return pImpl->currentState();
}

const std::string& Session::Name() const {
    return pImpl->name;
}

std::optional<ServerInfo> Session::GetServerInfo() const {
    std::lock_guard<std::mutex> lock(pImpl->stateMutex);
    return pImpl->serverInfo;
}

std::vector<std::string> Session::StderrTail() const {
    ProcessTransport* transport = nullptr;
    {
        std::lock_guard<std::mutex> lock(pImpl->ioMutex);
        transport = pImpl->transport.get();
    }
    return transport ? transport->StderrTail() : std::vector<std::string>{};
}

std::optional<int> Session::ExitCode() const {
    ChildProcess* child = nullptr;
    {
        std::lock_guard<std::mutex> lock(pImpl->ioMutex);
        child = pImpl->child.get();
    }
    if (!child) {
        return std::nullopt;
    }
    return child->ExitCode();
}

std::size_t Session::PendingRequestCount() const {
    return pImpl->registry.PendingCount();
}

void Session::SetEventHandler(SessionEventHandler handler) {
    std::lock_guard<std::mutex> lock(pImpl->handlerMutex);
    pImpl->eventHandler = std::move(handler);
}

void Session::SetNotificationHandler(const std::string& method, NotificationHandler handler) {
    std::lock_guard<std::mutex> lock(pImpl->handlerMutex);
    if (handler) {
        pImpl->notificationHandlers[method] = std::move(handler);
    } else {
        pImpl->notificationHandlers.erase(method);
    }
}

} // namespace mcphost
