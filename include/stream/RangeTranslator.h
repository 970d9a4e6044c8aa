/*
 * RangeTranslator.h - HTTP Range parsing and chunk plan derivation
 * This file is part of TGStream.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TGStream is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef RANGETRANSLATOR_H
#define RANGETRANSLATOR_H

// No direct includes - all includes should be in tgstream.h

namespace TGStream {
namespace Stream {

/**
 * @brief Inclusive byte interval requested by a client
 */
struct ByteRange {
    uint64_t start = 0;
    uint64_t end = 0;
    bool partial = false;   ///< A Range header was present (206 rather than 200)

    uint64_t length() const { return end - start + 1; }
};

/**
 * @brief Chunk-aligned fetch description for one ByteRange
 *
 * offset is the first chunk-aligned byte to fetch. The first delivered
 * chunk drops its leading first_cut bytes, the last one is cut to last_cut
 * bytes. A single-chunk plan applies both to the same chunk.
 */
struct FetchPlan {
    uint64_t offset = 0;
    uint64_t first_cut = 0;
    uint64_t last_cut = 0;
    uint64_t chunk_count = 0;
    uint64_t length = 0;
    uint32_t chunk_size = 0;
};

class RangeTranslator {
public:
    /**
     * @brief Parse a Range header against a file size
     * @param header Raw header value, empty when the request had none
     * @param file_size Total size of the file
     * @throws RangeNotSatisfiableException when unparsable or out of bounds
     */
    static ByteRange parse(const std::string& header, uint64_t file_size);

    /**
     * @brief Derive the chunk plan for a validated range
     * @throws std::invalid_argument if chunk_size is zero
     */
    static FetchPlan plan(const ByteRange& range, uint32_t chunk_size);

    /**
     * @brief Value for a 206 Content-Range header
     */
    static std::string contentRange(const ByteRange& range, uint64_t file_size);

    /**
     * @brief Value for a 416 Content-Range header
     */
    static std::string unsatisfiedContentRange(uint64_t file_size);
};

} // namespace Stream
} // namespace TGStream

#endif // RANGETRANSLATOR_H
