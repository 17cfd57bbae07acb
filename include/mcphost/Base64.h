//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Base64.h
// Purpose: Base64 decoding of resource blobs
//==========================================================================================================
#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace mcphost {

//==========================================================================================================
// DecodeBase64
// Purpose: Decodes standard-alphabet base64. Whitespace is ignored and missing '=' padding is tolerated.
// Throws:
//   errors::SessionError(MalformedMessage) on characters outside the alphabet, misplaced padding, or an
//   impossible length.
//==========================================================================================================
std::vector<uint8_t> DecodeBase64(const std::string& encoded);

} // namespace mcphost
