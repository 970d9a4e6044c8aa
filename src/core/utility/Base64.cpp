/*
 * Base64.cpp - Base64 encoding/decoding utility
 * This file is part of TGStream.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TGStream is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "tgstream.h"

namespace TGStream {
namespace Core {
namespace Utility {

namespace {

const char s_standard_alphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
const char s_url_alphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

// -1 for anything that is not a sextet in either alphabet
int sextetValue(unsigned char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+' || c == '-') return 62;
    if (c == '/' || c == '_') return 63;
    return -1;
}

std::string encodeWith(const std::vector<uint8_t>& data, const char* alphabet, bool pad) {
    std::string out;
    out.reserve(((data.size() + 2) / 3) * 4);

    size_t i = 0;
    while (i + 3 <= data.size()) {
        uint32_t triple = (static_cast<uint32_t>(data[i]) << 16) |
                          (static_cast<uint32_t>(data[i + 1]) << 8) |
                          static_cast<uint32_t>(data[i + 2]);
        out += alphabet[(triple >> 18) & 0x3F];
        out += alphabet[(triple >> 12) & 0x3F];
        out += alphabet[(triple >> 6) & 0x3F];
        out += alphabet[triple & 0x3F];
        i += 3;
    }

    size_t remaining = data.size() - i;
    if (remaining == 1) {
        uint32_t triple = static_cast<uint32_t>(data[i]) << 16;
        out += alphabet[(triple >> 18) & 0x3F];
        out += alphabet[(triple >> 12) & 0x3F];
        if (pad) out += "==";
    } else if (remaining == 2) {
        uint32_t triple = (static_cast<uint32_t>(data[i]) << 16) |
                          (static_cast<uint32_t>(data[i + 1]) << 8);
        out += alphabet[(triple >> 18) & 0x3F];
        out += alphabet[(triple >> 12) & 0x3F];
        out += alphabet[(triple >> 6) & 0x3F];
        if (pad) out += '=';
    }

    return out;
}

} // anonymous namespace

std::vector<uint8_t> Base64::decode(const std::string& input) {
    std::vector<uint8_t> out;
    out.reserve((input.size() / 4) * 3 + 3);

    uint32_t accumulator = 0;
    int bits = 0;

    for (unsigned char c : input) {
        if (c == '=') {
            break; // padding ends the payload
        }
        int value = sextetValue(c);
        if (value < 0) {
            continue; // whitespace, line breaks and stray characters
        }
        accumulator = (accumulator << 6) | static_cast<uint32_t>(value);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<uint8_t>((accumulator >> bits) & 0xFF));
        }
    }

    return out;
}

std::string Base64::encode(const std::vector<uint8_t>& data) {
    return encodeWith(data, s_standard_alphabet, true);
}

std::string Base64::encodeUrl(const std::vector<uint8_t>& data) {
    return encodeWith(data, s_url_alphabet, false);
}

} // namespace Utility
} // namespace Core
} // namespace TGStream
