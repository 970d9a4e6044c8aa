/*
 * LRUCache.h - Size-bounded map dropping the least recently used entry
 * This file is part of TGStream.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TGStream is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef LRUCACHE_H
#define LRUCACHE_H

// No direct includes - all includes should be in tgstream.h

namespace TGStream {
namespace Core {

/**
 * @brief Map with a fixed number of entries
 *
 * Lookups and stores move an entry to the front; storing into a full
 * cache drops the entry at the back. Not synchronized, callers hold their
 * own lock. Key must be ordered with operator<.
 */
template<typename Key, typename Value>
class LRUCache {
public:
    /**
     * @param capacity Maximum number of entries (0 = store nothing)
     */
    explicit LRUCache(size_t capacity)
        : m_capacity(capacity) {
    }

    std::optional<Value> get(const Key& key) {
        auto it = m_index.find(key);
        if (it == m_index.end()) {
            return std::nullopt;
        }
        m_order.splice(m_order.begin(), m_order, it->second);
        return it->second->second;
    }

    void put(const Key& key, Value value) {
        if (m_capacity == 0) {
            return;
        }
        auto it = m_index.find(key);
        if (it != m_index.end()) {
            it->second->second = std::move(value);
            m_order.splice(m_order.begin(), m_order, it->second);
            return;
        }
        m_order.emplace_front(key, std::move(value));
        m_index[key] = m_order.begin();
        while (m_order.size() > m_capacity) {
            m_index.erase(m_order.back().first);
            m_order.pop_back();
        }
    }

    /**
     * @return true if the key was present
     */
    bool erase(const Key& key) {
        auto it = m_index.find(key);
        if (it == m_index.end()) {
            return false;
        }
        m_order.erase(it->second);
        m_index.erase(it);
        return true;
    }

    void clear() {
        m_order.clear();
        m_index.clear();
    }

    size_t size() const { return m_order.size(); }
    size_t capacity() const { return m_capacity; }

private:
    using Entry = std::pair<Key, Value>;

    size_t m_capacity;
    std::list<Entry> m_order;
    std::map<Key, typename std::list<Entry>::iterator> m_index;
};

} // namespace Core
} // namespace TGStream

#endif // LRUCACHE_H
