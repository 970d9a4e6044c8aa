/*
 * Base64.h - Base64 encoding/decoding utility
 * This file is part of TGStream.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TGStream is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef TGSTREAM_CORE_UTILITY_BASE64_H
#define TGSTREAM_CORE_UTILITY_BASE64_H

#include <string>
#include <vector>
#include <cstdint>

namespace TGStream {
namespace Core {
namespace Utility {

/**
 * @brief Base64 encoder/decoder
 *
 * Accepts both the standard alphabet and the URL-safe one ('-' and '_'),
 * with or without '=' padding, since stream identifiers travel in URL paths.
 */
class Base64 {
public:
    /**
     * @brief Decode a Base64 encoded string
     *
     * @param input Base64 or base64url encoded string
     * @return Decoded binary data. Whitespace and characters outside
     *         both alphabets are skipped.
     */
    static std::vector<uint8_t> decode(const std::string& input);

    /**
     * @brief Encode binary data to Base64 string
     *
     * @param data Binary data to encode
     * @return Base64 encoded string
     */
    static std::string encode(const std::vector<uint8_t>& data);

    /**
     * @brief Encode binary data with the URL-safe alphabet and no padding
     */
    static std::string encodeUrl(const std::vector<uint8_t>& data);
};

} // namespace Utility
} // namespace Core
} // namespace TGStream

#endif // TGSTREAM_CORE_UTILITY_BASE64_H
