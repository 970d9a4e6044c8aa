/*
 * GatewayChunkSource.h - Chunk source backed by an MTProto file gateway
 * This file is part of TGStream.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TGStream is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef GATEWAYCHUNKSOURCE_H
#define GATEWAYCHUNKSOURCE_H

// No direct includes - all includes should be in tgstream.h

namespace TGStream {
namespace Upstream {

/**
 * @brief Fetches file chunks through a gateway process over HTTP
 *
 * The gateway holds one authorized Telegram session. Media sessions for the
 * data center a file lives on are negotiated on first use and cached per
 * file until the file is relocated. The cache keeps the most recently used
 * session_cache_size files.
 */
class GatewayChunkSource : public Stream::ChunkSource {
public:
    static const size_t DEFAULT_SESSION_CACHE = 256;

    GatewayChunkSource(std::string base_url, int dc_id, int timeout_seconds,
                       size_t session_cache_size = DEFAULT_SESSION_CACHE);

    std::vector<uint8_t> fetch(const Stream::FileLocator& locator,
                               uint64_t offset,
                               uint32_t length,
                               const std::atomic<bool>& cancel) override;

    void relocate(Stream::FileLocator& locator, int new_dc) override;

    std::string describe() const override;

    const std::string& baseUrl() const { return m_base_url; }
    size_t cachedSessions();

    /**
     * @brief Translate a non-2xx gateway reply into the matching exception
     */
    [[noreturn]] static void throwForStatus(const HTTPClient::Response& response, const std::string& what);

private:
    struct Session {
        int dc_id = 0;
        std::string token;
    };

    std::string sessionFor(const Stream::FileLocator& locator);
    void dropSession(const std::string& unique_id);

    std::string m_base_url;
    int m_dc_id;
    int m_timeout;

    std::mutex m_mutex;
    Core::LRUCache<std::string, Session> m_sessions;
};

} // namespace Upstream
} // namespace TGStream

#endif // GATEWAYCHUNKSOURCE_H
