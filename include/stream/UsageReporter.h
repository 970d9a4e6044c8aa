/*
 * UsageReporter.h - Background hand-off of per-stream byte counts
 * This file is part of TGStream.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TGStream is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef USAGEREPORTER_H
#define USAGEREPORTER_H

// No direct includes - all includes should be in tgstream.h

namespace TGStream {
namespace Stream {

struct UsageDelta {
    std::string stream_id;
    uint64_t bytes = 0;
    double timestamp = 0.0;
};

/**
 * @brief Accounts delivered bytes without slowing delivery down
 *
 * Engines call report() from their delivery path. Deltas go into a bounded
 * queue that a background thread drains into the sink; a full queue drops
 * the delta and counts it.
 */
class UsageReporter {
public:
    using Sink = std::function<void(const UsageDelta&)>;

    UsageReporter(Sink sink, size_t queue_capacity);
    ~UsageReporter();

    UsageReporter(const UsageReporter&) = delete;
    UsageReporter& operator=(const UsageReporter&) = delete;

    /**
     * @brief Queue a delta for the sink (never blocks)
     * @return false if the queue was full and the delta was dropped
     */
    bool report(const std::string& stream_id, uint64_t bytes);

    /**
     * @brief Block until every delta queued so far reached the sink
     */
    void flush();

    uint64_t deliveredBytes() const { return m_delivered_bytes.load(); }
    uint64_t droppedCount() const { return m_queue.rejectedCount(); }

    /**
     * @brief Sink writing each delta to the "usage" debug channel
     */
    static Sink logSink();

    /**
     * @brief Sink POSTing each delta as JSON to url
     *
     * Failures are logged and the delta is discarded.
     */
    static Sink httpSink(const std::string& url, int timeout_seconds);

private:
    void reporterThreadLoop();

    Sink m_sink;
    Core::BoundedQueue<UsageDelta> m_queue;
    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::condition_variable m_idle_cv;
    std::atomic<bool> m_shutdown{false};
    std::atomic<uint64_t> m_delivered_bytes{0};
    uint64_t m_queued = 0;
    uint64_t m_processed = 0;
    std::thread m_thread;
};

} // namespace Stream
} // namespace TGStream

#endif // USAGEREPORTER_H
