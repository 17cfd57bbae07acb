//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_errors.cpp
// Purpose: GoogleTests for the error taxonomy and JSON-RPC error mapping helpers
//==========================================================================================================

#include <gtest/gtest.h>
#include "mcphost/JSONRPCTypes.h"
#include "mcphost/errors/Errors.h"

using namespace mcphost;

TEST(Errors, CategoryMapping) {
    using mcphost::errors::ErrorCategory;
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::ParseError), ErrorCategory::JsonRpcParse);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::InvalidRequest), ErrorCategory::JsonRpcInvalidRequest);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::MethodNotFound), ErrorCategory::JsonRpcMethodNotFound);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::InvalidParams), ErrorCategory::JsonRpcInvalidParams);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::InternalError), ErrorCategory::JsonRpcInternal);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::ResourceNotFound), ErrorCategory::McpResourceNotFound);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::ToolNotFound), ErrorCategory::McpToolNotFound);
    EXPECT_EQ(errors::errorCategoryFromCode(12345), ErrorCategory::Unknown);
}

TEST(Errors, FromErrorValue_Valid) {
    JSONValue::Object dataObj; dataObj["foo"] = std::make_shared<JSONValue>(std::string("bar"));
    JSONValue::Object errObj;
    errObj["code"] = std::make_shared<JSONValue>(static_cast<int64_t>(JSONRPCErrorCodes::MethodNotFound));
    errObj["message"] = std::make_shared<JSONValue>(std::string("Method not found"));
    errObj["data"] = std::make_shared<JSONValue>(dataObj);

    auto parsed = errors::mcpErrorFromErrorValue(JSONValue{errObj});
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->code, JSONRPCErrorCodes::MethodNotFound);
    EXPECT_EQ(parsed->message, "Method not found");
    EXPECT_EQ(parsed->category, errors::ErrorCategory::JsonRpcMethodNotFound);
    ASSERT_TRUE(parsed->data.has_value());
    ASSERT_NE(parsed->data->FindString("foo"), nullptr);
    EXPECT_EQ(*parsed->data->FindString("foo"), "bar");
}

TEST(Errors, FromErrorValue_DoubleCodeAccepted) {
    auto v = ParseJSON(R"({"code":-32602.0,"message":"bad"})");
    auto parsed = errors::mcpErrorFromErrorValue(v);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->code, JSONRPCErrorCodes::InvalidParams);
}

TEST(Errors, FromErrorValue_Invalid) {
    EXPECT_FALSE(errors::mcpErrorFromErrorValue(ParseJSON(R"({"message":"no code"})")).has_value());
    EXPECT_FALSE(errors::mcpErrorFromErrorValue(ParseJSON(R"({"code":"x","message":"m"})")).has_value());
    EXPECT_FALSE(errors::mcpErrorFromErrorValue(ParseJSON(R"({"code":1})")).has_value());
    EXPECT_FALSE(errors::mcpErrorFromErrorValue(ParseJSON("[1,2]")).has_value());
}

TEST(Errors, MakeErrorValueRoundTrips) {
    errors::McpError e;
    e.code = JSONRPCErrorCodes::ToolNotFound;
    e.message = "Unknown tool";
    auto v = errors::makeErrorValue(e);
    auto back = errors::mcpErrorFromErrorValue(v);
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(back->code, e.code);
    EXPECT_EQ(back->message, e.message);
    EXPECT_EQ(back->category, errors::ErrorCategory::McpToolNotFound);
}

TEST(Errors, SessionErrorCarriesKindAndPeerError) {
    errors::SessionError plain(errors::ErrorKind::Timeout, "too slow");
    EXPECT_EQ(plain.kind(), errors::ErrorKind::Timeout);
    EXPECT_STREQ(plain.what(), "too slow");
    EXPECT_FALSE(plain.peerError().has_value());

    errors::McpError pe;
    pe.code = -32001;
    pe.message = "nope";
    errors::SessionError withPeer(errors::ErrorKind::PeerError, "peer said nope", pe);
    ASSERT_TRUE(withPeer.peerError().has_value());
    EXPECT_EQ(withPeer.peerError()->code, -32001);

    // Catchable as std::runtime_error
    try {
        throw withPeer;
    } catch (const std::runtime_error& e) {
        EXPECT_STREQ(e.what(), "peer said nope");
    }
}

TEST(Errors, KindNamesAreStable) {
    EXPECT_EQ(errors::ToString(errors::ErrorKind::SpawnFailure), "SpawnFailure");
    EXPECT_EQ(errors::ToString(errors::ErrorKind::HandshakeTimeout), "HandshakeTimeout");
    EXPECT_EQ(errors::ToString(errors::ErrorKind::PeerClosed), "PeerClosed");
    EXPECT_EQ(errors::ToString(errors::ErrorKind::EmptyResource), "EmptyResource");
    EXPECT_EQ(errors::ToString(errors::ErrorKind::IoFailure), "IoFailure");
}
