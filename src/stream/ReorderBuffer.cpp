/*
 * ReorderBuffer.cpp - Index-keyed buffer releasing chunks in order
 * This file is part of TGStream.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TGStream is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "tgstream.h"

namespace TGStream {
namespace Stream {

ReorderBuffer::ReorderBuffer(uint64_t first_index)
    : m_next(first_index), m_bytes(0)
{
}

void ReorderBuffer::put(uint64_t index, std::vector<uint8_t> data)
{
    if (index < m_next) {
        throw std::logic_error("ReorderBuffer: chunk " + std::to_string(index) + " already delivered");
    }
    size_t bytes = data.size();
    if (!m_chunks.emplace(index, std::move(data)).second) {
        throw std::logic_error("ReorderBuffer: duplicate chunk " + std::to_string(index));
    }
    m_bytes += bytes;
}

bool ReorderBuffer::ready() const
{
    return !m_chunks.empty() && m_chunks.begin()->first == m_next;
}

std::vector<uint8_t> ReorderBuffer::take()
{
    if (!ready()) {
        throw std::logic_error("ReorderBuffer: chunk " + std::to_string(m_next) + " not available");
    }
    auto it = m_chunks.begin();
    std::vector<uint8_t> data = std::move(it->second);
    m_chunks.erase(it);
    m_bytes -= data.size();
    ++m_next;
    return data;
}

void ReorderBuffer::clear()
{
    m_chunks.clear();
    m_bytes = 0;
}

} // namespace Stream
} // namespace TGStream
