/*
 * IdentifierCodec.h - Stream identifier path segment codec
 * This file is part of TGStream.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TGStream is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef IDENTIFIERCODEC_H
#define IDENTIFIERCODEC_H

// No direct includes - all includes should be in tgstream.h

namespace TGStream {
namespace Upstream {

/**
 * @brief Decoded {id} path segment
 *
 * chat_id is the channel id as stored by the indexer, without the -100
 * prefix Telegram uses for channels.
 */
struct StreamIdentifier {
    int64_t chat_id = 0;
    int64_t message_id = 0;
    std::string hash;

    int64_t fullChatId() const;
};

class IdentifierCodec {
public:
    /**
     * @brief Decode a base64url JSON identifier
     * @throws InvalidRequestException if the token is not valid base64 JSON
     *         or lacks chat_id or msg_id
     */
    static StreamIdentifier decode(const std::string& token);

    static std::string encode(const StreamIdentifier& id);

    /**
     * @brief Compare the identifier's hash against a resolved file
     *
     * An identifier without a hash always passes.
     * @throws HashMismatchException if the hash is not the first six
     *         characters of the file's unique id
     */
    static void verifyHash(const StreamIdentifier& id, const Stream::FileLocator& locator);
};

} // namespace Upstream
} // namespace TGStream

#endif // IDENTIFIERCODEC_H
