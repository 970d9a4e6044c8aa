/*
 * FileLocator.h - Resolved description of a remote media file
 * This file is part of TGStream.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TGStream is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef FILELOCATOR_H
#define FILELOCATOR_H

// No direct includes - all includes should be in tgstream.h

namespace TGStream {
namespace Stream {

/**
 * @brief Everything needed to fetch and serve one remote file
 *
 * Produced by a FileResolver and never modified afterwards. The location
 * handle is opaque to everything but the ChunkSource that issued it.
 */
struct FileLocator {
    std::string unique_id;
    uint64_t size = 0;
    std::string mime_type;
    std::string file_name;
    int dc_id = 0;
    std::string location;
};

} // namespace Stream
} // namespace TGStream

#endif // FILELOCATOR_H
