/*
 * mock_chunk_source.cpp - In-memory upstream for engine and handler tests
 * This file is part of TGStream.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TGStream is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "mock_chunk_source.h"

using TGStream::Core::FileNotFoundException;
using TGStream::Core::UpstreamFatalException;
using TGStream::Core::UpstreamRelocatedException;
using TGStream::Core::UpstreamTransientException;
using TGStream::Stream::FileLocator;

namespace TestFramework {

std::vector<uint8_t> makePatternFile(size_t size)
{
    std::vector<uint8_t> data(size);
    for (size_t i = 0; i < size; ++i) {
        data[i] = static_cast<uint8_t>((i * 31 + 7) & 0xFF);
    }
    return data;
}

MockChunkSource::MockChunkSource(std::vector<uint8_t> data)
    : m_data(std::move(data))
{
}

std::vector<uint8_t> MockChunkSource::fetch(const FileLocator& locator,
                                            uint64_t offset,
                                            uint32_t length,
                                            const std::atomic<bool>& cancel)
{
    ++m_fetches;
    m_last_dc = locator.dc_id;

    int now_running = ++m_concurrent;
    int seen = m_max_concurrent.load();
    while (now_running > seen && !m_max_concurrent.compare_exchange_weak(seen, now_running)) {
    }

    struct Running {
        std::atomic<int>& count;
        ~Running() { --count; }
    } running{m_concurrent};

    std::optional<Fault> fault;
    std::chrono::milliseconds delay(0);
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_offsets.push_back(offset);
        auto it = m_faults.find(offset);
        if (it != m_faults.end() && !it->second.empty()) {
            fault = it->second.front();
            it->second.pop_front();
        }
        auto d = m_delays.find(offset);
        if (d != m_delays.end()) {
            delay = d->second;
        }
    }

    if (!waitWhileHeld(cancel)) {
        return {};
    }

    auto deadline = std::chrono::steady_clock::now() + delay;
    while (std::chrono::steady_clock::now() < deadline) {
        if (cancel) {
            return {};
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }

    if (fault) {
        switch (fault->kind) {
            case FaultKind::Transient:
                throw UpstreamTransientException("FLOOD_WAIT", std::chrono::milliseconds(fault->value));
            case FaultKind::Relocate:
                throw UpstreamRelocatedException("FILE_MIGRATE", fault->value);
            case FaultKind::Fatal:
                throw UpstreamFatalException("FILE_REFERENCE_EXPIRED");
        }
    }

    if (offset >= m_data.size()) {
        return {};
    }
    uint64_t end = std::min<uint64_t>(m_data.size(), offset + length);
    return std::vector<uint8_t>(m_data.begin() + offset, m_data.begin() + end);
}

bool MockChunkSource::waitWhileHeld(const std::atomic<bool>& cancel)
{
    std::unique_lock<std::mutex> lock(m_mutex);
    while (m_held) {
        if (cancel) {
            return false;
        }
        m_cv.wait_for(lock, std::chrono::milliseconds(2));
    }
    return !cancel;
}

void MockChunkSource::relocate(FileLocator& locator, int new_dc)
{
    ++m_relocations;
    locator.dc_id = new_dc;
}

void MockChunkSource::addFault(uint64_t offset, Fault fault)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_faults[offset].push_back(fault);
}

void MockChunkSource::setDelay(uint64_t offset, std::chrono::milliseconds delay)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_delays[offset] = delay;
}

void MockChunkSource::hold()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_held = true;
}

void MockChunkSource::release()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_held = false;
    }
    m_cv.notify_all();
}

std::vector<uint64_t> MockChunkSource::fetchedOffsets() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_offsets;
}

void MockFileResolver::add(int64_t chat_id, int64_t message_id, FileLocator locator)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_files[{chat_id, message_id}] = std::move(locator);
}

FileLocator MockFileResolver::resolve(int64_t chat_id, int64_t message_id)
{
    ++m_resolves;
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_files.find({chat_id, message_id});
    if (it == m_files.end()) {
        throw FileNotFoundException("Message " + std::to_string(message_id) + " has no media");
    }
    return it->second;
}

} // namespace TestFramework
