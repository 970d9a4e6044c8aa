/*
 * FileResolver.h - Message to file metadata lookup
 * This file is part of TGStream.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TGStream is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef FILERESOLVER_H
#define FILERESOLVER_H

// No direct includes - all includes should be in tgstream.h

namespace TGStream {
namespace Upstream {

class FileResolver {
public:
    virtual ~FileResolver() = default;

    /**
     * @brief Look up the media file attached to a message
     * @param chat_id Full chat id (with the -100 channel prefix)
     * @param message_id Message id within the chat
     * @throws FileNotFoundException if the message carries no media
     * @throws UpstreamFatalException if the lookup failed
     */
    virtual Stream::FileLocator resolve(int64_t chat_id, int64_t message_id) = 0;
};

} // namespace Upstream
} // namespace TGStream

#endif // FILERESOLVER_H
