/*
 * GatewayFileResolver.h - File metadata lookup through MTProto gateways
 * This file is part of TGStream.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TGStream is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef GATEWAYFILERESOLVER_H
#define GATEWAYFILERESOLVER_H

// No direct includes - all includes should be in tgstream.h

namespace TGStream {
namespace Upstream {

/**
 * @brief Resolves messages through the configured gateways, with a cache
 *
 * Lookups rotate over the gateways; a gateway that cannot be reached is
 * skipped in favor of the next one. Successful results are remembered, the
 * least recently used entry is dropped once the cache is full.
 */
class GatewayFileResolver : public FileResolver {
public:
    GatewayFileResolver(std::vector<Core::GatewayEndpoint> gateways, size_t cache_size, int timeout_seconds);

    Stream::FileLocator resolve(int64_t chat_id, int64_t message_id) override;

    size_t cachedCount() const;

    /**
     * @brief Build a locator from a gateway /message reply body
     * @throws UpstreamFatalException if required fields are missing
     */
    static Stream::FileLocator parseMessageReply(const std::string& body);

private:
    using Key = std::pair<int64_t, int64_t>;

    std::vector<Core::GatewayEndpoint> m_gateways;
    int m_timeout;
    std::atomic<size_t> m_next_gateway{0};

    mutable std::mutex m_mutex;
    Core::LRUCache<Key, Stream::FileLocator> m_cache;
};

} // namespace Upstream
} // namespace TGStream

#endif // GATEWAYFILERESOLVER_H
