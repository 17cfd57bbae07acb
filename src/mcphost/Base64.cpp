//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Base64.cpp
// Purpose: Base64 decoding via Boost.Serialization dataflow iterators
//==========================================================================================================

#include "mcphost/Base64.h"

#include <cctype>
#include <format>

#include <boost/archive/iterators/binary_from_base64.hpp>
#include <boost/archive/iterators/dataflow_exception.hpp>
#include <boost/archive/iterators/transform_width.hpp>

#include "logging/Logger.h"
#include "mcphost/errors/Errors.h"

namespace mcphost {

using errors::ErrorKind;
using errors::SessionError;

std::vector<uint8_t> DecodeBase64(const std::string& encoded) {
    namespace it = boost::archive::iterators;
    using Decoder = it::transform_width<it::binary_from_base64<std::string::const_iterator>, 8, 6>;

    std::string clean;
    clean.reserve(encoded.size());
    for (char c : encoded) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            clean.push_back(c);
        }
    }
    if (clean.empty()) {
        return {};
    }
    if (clean.size() % 4 == 1) {
        throw SessionError(ErrorKind::MalformedMessage,
                           std::format("Invalid base64: impossible length {}", clean.size()));
    }
    while (clean.size() % 4 != 0) {
        clean.push_back('=');
    }

    std::size_t pad = 0;
    while (pad < clean.size() && clean[clean.size() - 1 - pad] == '=') {
        ++pad;
    }
    if (pad > 2 || clean.find('=') < clean.size() - pad) {
        throw SessionError(ErrorKind::MalformedMessage, "Invalid base64: misplaced padding");
    }
    // binary_from_base64 rejects '='; zero bits decode to bytes that are dropped below.
    clean.replace(clean.size() - pad, pad, pad, 'A');

    std::vector<uint8_t> out;
    try {
        out.assign(Decoder(clean.cbegin()), Decoder(clean.cend()));
    } catch (const it::dataflow_exception& e) {
        LOG_DEBUG("DecodeBase64: {}", e.what());
        throw SessionError(ErrorKind::MalformedMessage, std::format("Invalid base64: {}", e.what()));
    }
    out.resize(out.size() - pad);
    return out;
}

} // namespace mcphost
