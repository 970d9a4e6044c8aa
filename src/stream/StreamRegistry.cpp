/*
 * StreamRegistry.cpp - Process-wide table of active and recent streams
 * This file is part of TGStream.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TGStream is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "tgstream.h"

namespace TGStream {
namespace Stream {

const char* toString(StreamStatus status)
{
    switch (status) {
        case StreamStatus::Active: return "active";
        case StreamStatus::Finished: return "finished";
        case StreamStatus::Error: return "error";
        case StreamStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

StreamRegistry::StreamRegistry(std::chrono::milliseconds grace, size_t recent_capacity, Clock clock)
    : m_grace_seconds(std::chrono::duration<double>(grace).count())
    , m_recent_capacity(recent_capacity)
    , m_clock(std::move(clock))
{
}

std::string StreamRegistry::generateId()
{
    return Core::System::randomHex(8);
}

std::string StreamRegistry::registerStream(StreamRecord record)
{
    if (record.stream_id.empty()) {
        record.stream_id = generateId();
    }
    std::string id = record.stream_id;

    auto entry = std::make_shared<Entry>();
    entry->record = std::move(record);
    const double now = m_clock();

    std::lock_guard<std::mutex> lock(m_mutex);
    prune_unlocked(now);
    if (!m_active.emplace(id, entry).second) {
        throw std::invalid_argument("Stream id already registered: " + id);
    }
    Debug::log("registry", "Registered stream ", id, " (", m_active.size(), " active)");
    return id;
}

std::shared_ptr<StreamRegistry::Entry> StreamRegistry::find_unlocked(const std::string& id) const
{
    auto it = m_active.find(id);
    return it == m_active.end() ? nullptr : it->second;
}

bool StreamRegistry::update(const std::string& id, const std::function<void(StreamRecord&)>& fn)
{
    std::shared_ptr<Entry> entry;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        entry = find_unlocked(id);
    }
    if (!entry) {
        return false;
    }
    std::lock_guard<std::mutex> lock(entry->mutex);
    fn(entry->record);
    return true;
}

std::optional<StreamRecord> StreamRegistry::get(const std::string& id) const
{
    std::shared_ptr<Entry> entry;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        entry = find_unlocked(id);
        if (!entry) {
            for (auto it = m_recent.rbegin(); it != m_recent.rend(); ++it) {
                if (it->stream_id == id) {
                    return *it;
                }
            }
            return std::nullopt;
        }
    }
    std::lock_guard<std::mutex> lock(entry->mutex);
    return entry->record;
}

std::vector<StreamRecord> StreamRegistry::listActive() const
{
    std::vector<std::shared_ptr<Entry>> entries;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        entries.reserve(m_active.size());
        for (const auto& [id, entry] : m_active) {
            entries.push_back(entry);
        }
    }

    std::vector<StreamRecord> records;
    records.reserve(entries.size());
    for (const auto& entry : entries) {
        std::lock_guard<std::mutex> lock(entry->mutex);
        records.push_back(entry->record);
    }
    std::sort(records.begin(), records.end(), [](const StreamRecord& a, const StreamRecord& b) {
        return a.start_time < b.start_time;
    });
    return records;
}

std::vector<StreamRecord> StreamRegistry::listRecent() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return std::vector<StreamRecord>(m_recent.begin(), m_recent.end());
}

size_t StreamRegistry::prune(double now)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return prune_unlocked(now);
}

size_t StreamRegistry::prune_unlocked(double now)
{
    std::vector<StreamRecord> retired;

    for (auto it = m_active.begin(); it != m_active.end();) {
        std::unique_lock<std::mutex> entry_lock(it->second->mutex);
        const StreamRecord& record = it->second->record;
        if (!isTerminal(record.status) || now - record.last_update <= m_grace_seconds) {
            ++it;
            continue;
        }
        retired.push_back(record);
        entry_lock.unlock();
        it = m_active.erase(it);
    }

    std::sort(retired.begin(), retired.end(), [](const StreamRecord& a, const StreamRecord& b) {
        return a.last_update < b.last_update;
    });
    for (auto& record : retired) {
        m_recent.push_back(std::move(record));
    }
    while (m_recent.size() > m_recent_capacity) {
        m_recent.pop_front();
    }

    if (!retired.empty()) {
        Debug::log("registry", "Pruned ", retired.size(), " streams, ", m_active.size(), " still active");
    }
    return retired.size();
}

size_t StreamRegistry::activeCount() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_active.size();
}

} // namespace Stream
} // namespace TGStream
