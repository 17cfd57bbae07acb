//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Session error taxonomy plus typed JSON-RPC error mapping helpers
//==========================================================================================================

#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include "mcphost/JSONRPCTypes.h"

namespace mcphost {
namespace errors {

// Categorization of common JSON-RPC and MCP error codes.
enum class ErrorCategory {
    JsonRpcParse,
    JsonRpcInvalidRequest,
    JsonRpcMethodNotFound,
    JsonRpcInvalidParams,
    JsonRpcInternal,
    McpInvalidRequestId,
    McpMethodNotAllowed,
    McpResourceNotFound,
    McpToolNotFound,
    McpPromptNotFound,
    Unknown
};

// Typed error object reported by a peer in a JSON-RPC error response.
struct McpError {
    int code{0};
    std::string message;
    std::optional<JSONValue> data;
    ErrorCategory category{ErrorCategory::Unknown};
};

// Map a JSON-RPC/MCP numeric error code to an ErrorCategory.
inline ErrorCategory errorCategoryFromCode(int code) {
    switch (code) {
        case JSONRPCErrorCodes::ParseError: return ErrorCategory::JsonRpcParse;
        case JSONRPCErrorCodes::InvalidRequest: return ErrorCategory::JsonRpcInvalidRequest;
        case JSONRPCErrorCodes::MethodNotFound: return ErrorCategory::JsonRpcMethodNotFound;
        case JSONRPCErrorCodes::InvalidParams: return ErrorCategory::JsonRpcInvalidParams;
        case JSONRPCErrorCodes::InternalError: return ErrorCategory::JsonRpcInternal;
        case JSONRPCErrorCodes::InvalidRequestId: return ErrorCategory::McpInvalidRequestId;
        case JSONRPCErrorCodes::MethodNotAllowed: return ErrorCategory::McpMethodNotAllowed;
        case JSONRPCErrorCodes::ResourceNotFound: return ErrorCategory::McpResourceNotFound;
        case JSONRPCErrorCodes::ToolNotFound: return ErrorCategory::McpToolNotFound;
        case JSONRPCErrorCodes::PromptNotFound: return ErrorCategory::McpPromptNotFound;
        default: return ErrorCategory::Unknown;
    }
}

// Convert a JSON-RPC error object (shape: { code, message, data? }) to McpError.
// Returns std::nullopt when the input is not a valid error object.
//
// Args:
//   errVal: JSONValue expected to be an Object with code/message and optional data.
//
// Returns:
//   std::optional<McpError> populated when shape is valid.
inline std::optional<McpError> mcpErrorFromErrorValue(const JSONValue& errVal) {
    const JSONValue* codeVal = errVal.Find("code");
    const std::string* message = errVal.FindString("message");
    if (!codeVal || !message) {
        return std::nullopt;
    }
    int code = 0;
    if (const auto* i = std::get_if<int64_t>(&codeVal->value)) {
        code = static_cast<int>(*i);
    } else if (const auto* d = std::get_if<double>(&codeVal->value)) {
        code = static_cast<int>(*d);
    } else {
        return std::nullopt;
    }

    McpError e;
    e.code = code;
    e.message = *message;
    if (const JSONValue* data = errVal.Find("data")) {
        e.data = *data;
    }
    e.category = errorCategoryFromCode(code);
    return e;
}

// Create a JSONValue error object from a typed McpError.
inline JSONValue makeErrorValue(const McpError& err) {
    return CreateErrorObject(err.code, err.message, err.data);
}

//==========================================================================================================
// ErrorKind
// Purpose: Failure taxonomy for every operation of the client runtime.
//==========================================================================================================
enum class ErrorKind {
    SpawnFailure,       // the peer process could not be started
    HandshakeTimeout,   // no initialize response within the handshake deadline
    HandshakeFailed,    // initialize rejected, or the peer exited during the handshake
    Timeout,            // a request deadline (or write deadline) elapsed
    Cancelled,          // the caller's stop token fired
    PeerError,          // the peer answered with a JSON-RPC error object
    MalformedMessage,   // undecodable line, response without result/error, bad base64
    PeerClosed,         // the peer closed its output stream or exited
    SessionClosed,      // the session was closed while the request was outstanding
    TransportClosed,    // write after close or to a broken pipe
    NotReady,           // operation invoked outside the Ready state
    DuplicateSession,
    UnknownSession,
    DuplicateId,
    EmptyResource,      // first resource content has neither text nor blob
    NoContent,          // resource response had no content entries
    MalformedCatalog,   // tools/list result violated the catalog shape
    InvalidArgument,
    IoFailure           // local file I/O failed
};

//==========================================================================================================
// ToString
// Purpose: Stable identifier for an ErrorKind (used in messages and tests).
//==========================================================================================================
inline std::string_view ToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::SpawnFailure: return "SpawnFailure";
        case ErrorKind::HandshakeTimeout: return "HandshakeTimeout";
        case ErrorKind::HandshakeFailed: return "HandshakeFailed";
        case ErrorKind::Timeout: return "Timeout";
        case ErrorKind::Cancelled: return "Cancelled";
        case ErrorKind::PeerError: return "PeerError";
        case ErrorKind::MalformedMessage: return "MalformedMessage";
        case ErrorKind::PeerClosed: return "PeerClosed";
        case ErrorKind::SessionClosed: return "SessionClosed";
        case ErrorKind::TransportClosed: return "TransportClosed";
        case ErrorKind::NotReady: return "NotReady";
        case ErrorKind::DuplicateSession: return "DuplicateSession";
        case ErrorKind::UnknownSession: return "UnknownSession";
        case ErrorKind::DuplicateId: return "DuplicateId";
        case ErrorKind::EmptyResource: return "EmptyResource";
        case ErrorKind::NoContent: return "NoContent";
        case ErrorKind::MalformedCatalog: return "MalformedCatalog";
        case ErrorKind::InvalidArgument: return "InvalidArgument";
        case ErrorKind::IoFailure: return "IoFailure";
    }
    return "Unknown";
}

//==========================================================================================================
// SessionError
// Purpose: The single exception type thrown by the runtime. Waiters receive it through std::future.
// Fields:
//   kind: Taxonomy entry.
//   peerError: Present for PeerError (and HandshakeFailed caused by an initialize error response).
//==========================================================================================================
class SessionError : public std::runtime_error {
public:
    SessionError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}
    SessionError(ErrorKind kind, const std::string& message, McpError peerError)
        : std::runtime_error(message), kind_(kind), peerError_(std::move(peerError)) {}

    ErrorKind kind() const noexcept { return kind_; }
    const std::optional<McpError>& peerError() const noexcept { return peerError_; }

private:
    ErrorKind kind_;
    std::optional<McpError> peerError_;
};

} // namespace errors
} // namespace mcphost
