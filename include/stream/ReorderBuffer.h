/*
 * ReorderBuffer.h - Index-keyed buffer releasing chunks in order
 * This file is part of TGStream.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TGStream is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef REORDERBUFFER_H
#define REORDERBUFFER_H

// No direct includes - all includes should be in tgstream.h

namespace TGStream {
namespace Stream {

/**
 * @brief Holds chunks that completed out of order until their turn
 *
 * Not synchronized; the owner serializes access.
 */
class ReorderBuffer {
public:
    explicit ReorderBuffer(uint64_t first_index = 0);

    /**
     * @brief Store a completed chunk
     * @throws std::logic_error if index was already delivered or stored
     */
    void put(uint64_t index, std::vector<uint8_t> data);

    /**
     * @brief True when the chunk at nextIndex() is present
     */
    bool ready() const;

    /**
     * @brief Remove and return the chunk at nextIndex(), advancing the cursor
     * @throws std::logic_error if !ready()
     */
    std::vector<uint8_t> take();

    uint64_t nextIndex() const { return m_next; }
    size_t size() const { return m_chunks.size(); }
    size_t bufferedBytes() const { return m_bytes; }
    void clear();

private:
    std::map<uint64_t, std::vector<uint8_t>> m_chunks;
    uint64_t m_next;
    size_t m_bytes;
};

} // namespace Stream
} // namespace TGStream

#endif // REORDERBUFFER_H
