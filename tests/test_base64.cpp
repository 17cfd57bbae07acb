//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_base64.cpp
// Purpose: Resource blob decoding
//==========================================================================================================

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "mcphost/Base64.h"
#include "mcphost/errors/Errors.h"

using namespace mcphost;

namespace {
std::string asString(const std::vector<uint8_t>& v) {
    return std::string(v.begin(), v.end());
}

void expectMalformed(const std::string& in) {
    try {
        (void)DecodeBase64(in);
        FAIL() << "expected MalformedMessage for '" << in << "'";
    } catch (const errors::SessionError& e) {
        EXPECT_EQ(e.kind(), errors::ErrorKind::MalformedMessage);
    }
}
} // namespace

TEST(Base64, DecodesPaddedInput) {
    EXPECT_EQ(asString(DecodeBase64("aGk=")), "hi");
    EXPECT_EQ(asString(DecodeBase64("aGVsbG8=")), "hello");
    EXPECT_EQ(asString(DecodeBase64("Zm9vYmFy")), "foobar");
    EXPECT_EQ(asString(DecodeBase64("Zg==")), "f");
}

TEST(Base64, ToleratesMissingPaddingAndWhitespace) {
    EXPECT_EQ(asString(DecodeBase64("aGk")), "hi");
    EXPECT_EQ(asString(DecodeBase64("Zg")), "f");
    EXPECT_EQ(asString(DecodeBase64("Zm9v\nYmFy\r\n")), "foobar");
}

TEST(Base64, DecodesUnpaddedFullQuantums) {
    EXPECT_EQ(DecodeBase64("AAAA"), (std::vector<uint8_t>{0x00, 0x00, 0x00}));
    EXPECT_EQ(asString(DecodeBase64("YWJj")), "abc");
    EXPECT_EQ(asString(DecodeBase64("Zm9vYmFyYmF6")), "foobarbaz");
}

TEST(Base64, DecodesBinaryBytes) {
    const std::vector<uint8_t> expected{0x00, 0xFF, 0x10, 0x80};
    EXPECT_EQ(DecodeBase64("AP8QgA=="), expected);
}

TEST(Base64, EmptyInputYieldsNoBytes) {
    EXPECT_TRUE(DecodeBase64("").empty());
    EXPECT_TRUE(DecodeBase64(" \n").empty());
}

TEST(Base64, RejectsMalformedInput) {
    expectMalformed("!!!!");
    expectMalformed("aGk=aGk=");
    expectMalformed("a");
    expectMalformed("a===");
}
