/*
 * ChunkSource.h - Interface to one authenticated storage connection
 * This file is part of TGStream.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TGStream is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef CHUNKSOURCE_H
#define CHUNKSOURCE_H

// No direct includes - all includes should be in tgstream.h

namespace TGStream {
namespace Stream {

/**
 * @brief One connection able to fetch chunks of remote files
 *
 * Implementations are shared by every stream that selects them and must be
 * safe to call from several worker threads at once.
 */
class ChunkSource {
public:
    virtual ~ChunkSource() = default;

    /**
     * @brief Fetch up to length bytes starting at offset
     *
     * The returned buffer is shorter than length only at end of file; an
     * empty buffer means there is no more data. When cancel becomes true the
     * transfer is abandoned and whatever was read (possibly nothing) is
     * returned; callers must check the flag before using the result.
     *
     * @throws UpstreamTransientException on flood wait or a dropped connection
     * @throws UpstreamRelocatedException when the file moved to another dc
     * @throws UpstreamFatalException on anything else
     */
    virtual std::vector<uint8_t> fetch(const FileLocator& locator,
                                       uint64_t offset,
                                       uint32_t length,
                                       const std::atomic<bool>& cancel) = 0;

    /**
     * @brief Forget the cached session for a file and bind it to new_dc
     *
     * Updates locator.dc_id; the next fetch negotiates a fresh session.
     */
    virtual void relocate(FileLocator& locator, int new_dc) = 0;

    /**
     * @brief Short human readable name for logs
     */
    virtual std::string describe() const = 0;
};

} // namespace Stream
} // namespace TGStream

#endif // CHUNKSOURCE_H
