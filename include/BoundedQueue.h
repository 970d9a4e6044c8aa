/*
 * BoundedQueue.h - Thread-safe bounded queue
 * This file is part of TGStream.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TGStream is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef BOUNDEDQUEUE_H
#define BOUNDEDQUEUE_H

// No direct includes - all includes should be in tgstream.h

namespace TGStream {
namespace Core {

/**
 * @brief Thread-safe queue with an item limit
 *
 * Producers never block: a push into a full queue fails and is counted, so
 * hot paths (chunk delivery) can hand work to a background thread without
 * ever waiting on it.
 */
template<typename T>
class BoundedQueue {
public:
    /**
     * @brief Constructor
     * @param max_items Maximum number of items (0 = unlimited)
     */
    explicit BoundedQueue(size_t max_items = 0)
        : m_max_items(max_items)
        , m_rejected(0) {
    }

    /**
     * @brief Try to push an item (non-blocking)
     * @param item Item to push
     * @return true if item was pushed, false if queue is full
     */
    bool tryPush(T&& item) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_max_items > 0 && m_queue.size() >= m_max_items) {
            ++m_rejected;
            return false;
        }
        m_queue.push(std::move(item));
        return true;
    }

    bool tryPush(const T& item) {
        T copy = item;
        return tryPush(std::move(copy));
    }

    /**
     * @brief Try to pop an item (non-blocking)
     * @param item Reference to store the popped item
     * @return true if item was popped, false if queue is empty
     */
    bool tryPop(T& item) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_queue.empty()) {
            return false;
        }
        item = std::move(m_queue.front());
        m_queue.pop();
        return true;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_queue.size();
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_queue.empty();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(m_mutex);
        while (!m_queue.empty()) {
            m_queue.pop();
        }
    }

    /**
     * @brief Number of pushes refused because the queue was full
     */
    uint64_t rejectedCount() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_rejected;
    }

    size_t getMaxItems() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_max_items;
    }

private:
    mutable std::mutex m_mutex;
    std::queue<T> m_queue;
    size_t m_max_items;
    uint64_t m_rejected;
};

} // namespace Core
} // namespace TGStream

#endif // BOUNDEDQUEUE_H
