/*
 * ClientPool.h - Least-loaded selection over storage connections
 * This file is part of TGStream.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TGStream is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef CLIENTPOOL_H
#define CLIENTPOOL_H

// No direct includes - all includes should be in tgstream.h

namespace TGStream {
namespace Stream {

/**
 * @brief Set of storage connections with an outstanding-request counter each
 *
 * Connections are added once at startup, before any stream is served. After
 * that the pool is only read, and the load counters are atomics, so select()
 * and the guards take no lock.
 */
class ClientPool {
public:
    /**
     * @brief Holds one unit of load on a connection for its lifetime
     */
    class LoadGuard {
    public:
        LoadGuard(ClientPool& pool, size_t index);
        ~LoadGuard();
        LoadGuard(const LoadGuard&) = delete;
        LoadGuard& operator=(const LoadGuard&) = delete;
    private:
        ClientPool& m_pool;
        size_t m_index;
    };

    explicit ClientPool(Core::AffinityPolicy policy = Core::AffinityPolicy::Advisory);

    /**
     * @brief Register a connection
     * @param source Connection implementation
     * @param dc_id Data center the connection's session lives on
     * @return Index of the new connection
     */
    size_t add(std::shared_ptr<ChunkSource> source, int dc_id);

    /**
     * @brief Pick the connection a new stream should use
     *
     * The lowest load wins and ties go to the connection added first. With
     * the prefer policy only connections on target_dc are considered when
     * there are any.
     * @throws UpstreamFatalException if the pool is empty
     */
    size_t select(int target_dc) const;

    size_t size() const { return m_connections.size(); }
    Core::AffinityPolicy policy() const { return m_policy; }

    std::shared_ptr<ChunkSource> source(size_t index) const;
    int dcOf(size_t index) const;
    int load(size_t index) const;

    /**
     * @brief Current load per connection index
     */
    std::map<size_t, int> workLoads() const;

    /**
     * @brief Data center per connection index
     */
    std::map<size_t, int> dcMap() const;

private:
    struct Connection {
        std::shared_ptr<ChunkSource> source;
        int dc_id = 0;
        std::atomic<int> load{0};
    };

    const Connection& at(size_t index) const;

    Core::AffinityPolicy m_policy;
    std::vector<std::unique_ptr<Connection>> m_connections;
};

} // namespace Stream
} // namespace TGStream

#endif // CLIENTPOOL_H
