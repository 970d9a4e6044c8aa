/*
 * ClientPool.cpp - Least-loaded selection over storage connections
 * This file is part of TGStream.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TGStream is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "tgstream.h"

namespace TGStream {
namespace Stream {

ClientPool::LoadGuard::LoadGuard(ClientPool& pool, size_t index)
    : m_pool(pool), m_index(index)
{
    m_pool.m_connections.at(m_index)->load.fetch_add(1);
}

ClientPool::LoadGuard::~LoadGuard()
{
    m_pool.m_connections.at(m_index)->load.fetch_sub(1);
}

ClientPool::ClientPool(Core::AffinityPolicy policy)
    : m_policy(policy)
{
}

size_t ClientPool::add(std::shared_ptr<ChunkSource> source, int dc_id)
{
    if (!source) {
        throw std::invalid_argument("ClientPool::add: null source");
    }
    auto connection = std::make_unique<Connection>();
    connection->source = std::move(source);
    connection->dc_id = dc_id;
    m_connections.push_back(std::move(connection));

    size_t index = m_connections.size() - 1;
    Debug::log("pool", "Added connection ", index, " (", m_connections.back()->source->describe(),
               ") on dc ", dc_id);
    return index;
}

size_t ClientPool::select(int target_dc) const
{
    if (m_connections.empty()) {
        throw Core::UpstreamFatalException("No storage connections configured");
    }
    if (m_connections.size() == 1) {
        return 0;
    }

    auto pick = [this](bool same_dc_only, int dc) -> std::optional<size_t> {
        std::optional<size_t> best;
        int best_load = 0;
        for (size_t i = 0; i < m_connections.size(); ++i) {
            if (same_dc_only && m_connections[i]->dc_id != dc) continue;
            int load = m_connections[i]->load.load();
            if (!best || load < best_load) {
                best = i;
                best_load = load;
            }
        }
        return best;
    };

    if (m_policy == Core::AffinityPolicy::Prefer) {
        if (auto same = pick(true, target_dc)) {
            DEBUG_LOG_LAZY("pool", "Selected connection ", *same, " on preferred dc ", target_dc);
            return *same;
        }
    }

    size_t index = *pick(false, 0);
    if (m_connections[index]->dc_id != target_dc) {
        DEBUG_LOG_LAZY("pool", "Selected connection ", index, " on dc ", m_connections[index]->dc_id,
                       " for file on dc ", target_dc);
    }
    return index;
}

const ClientPool::Connection& ClientPool::at(size_t index) const
{
    if (index >= m_connections.size()) {
        throw std::out_of_range("ClientPool: no connection " + std::to_string(index));
    }
    return *m_connections[index];
}

std::shared_ptr<ChunkSource> ClientPool::source(size_t index) const
{
    return at(index).source;
}

int ClientPool::dcOf(size_t index) const
{
    return at(index).dc_id;
}

int ClientPool::load(size_t index) const
{
    return at(index).load.load();
}

std::map<size_t, int> ClientPool::workLoads() const
{
    std::map<size_t, int> loads;
    for (size_t i = 0; i < m_connections.size(); ++i) {
        loads[i] = m_connections[i]->load.load();
    }
    return loads;
}

std::map<size_t, int> ClientPool::dcMap() const
{
    std::map<size_t, int> dcs;
    for (size_t i = 0; i < m_connections.size(); ++i) {
        dcs[i] = m_connections[i]->dc_id;
    }
    return dcs;
}

} // namespace Stream
} // namespace TGStream
