/*
 * PrefetchEngine.h - Bounded read-ahead with in-order chunk delivery
 * This file is part of TGStream.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TGStream is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef PREFETCHENGINE_H
#define PREFETCHENGINE_H

// No direct includes - all includes should be in tgstream.h

namespace TGStream {
namespace Stream {

struct EngineOptions {
    size_t parallelism = 4;
    size_t prefetch = 8;
    int max_transient_retries = 5;
    std::chrono::milliseconds base_backoff{250};
    std::chrono::milliseconds max_backoff{30000};
    uint64_t usage_threshold = 8ull * 1024 * 1024;

    static EngineOptions fromConfig(const Core::Config& config);
};

/**
 * @brief Streams one FetchPlan out of a ClientPool connection
 *
 * start() spawns up to parallelism worker threads that claim chunk indices
 * in order and fetch them. Finished chunks wait in a ReorderBuffer until
 * the consumer pulls them with nextChunk(), which returns them trimmed to
 * the requested range and strictly in order. Workers stop claiming once
 * in-flight plus buffered chunks reach the prefetch window, so a slow
 * consumer holds the whole engine back.
 *
 * The engine is used by exactly one consumer thread; cancel() may be
 * called from any thread.
 */
class PrefetchEngine {
public:
    enum class State {
        Starting,
        Streaming,
        Finished,
        Cancelled,
        Error
    };

    static const char* toString(State state);

    /**
     * @param pool Connection pool; client_index must be valid in it
     * @param client_index Connection every fetch of this stream goes through
     * @param locator File to read; rebound on relocation
     * @param plan Chunk plan from RangeTranslator::plan()
     * @param options Concurrency and retry settings
     * @param registry Optional registry holding this stream's record
     * @param stream_id Id of the record in registry
     * @param usage Optional usage reporter
     */
    PrefetchEngine(ClientPool& pool,
                   size_t client_index,
                   FileLocator locator,
                   FetchPlan plan,
                   EngineOptions options,
                   StreamRegistry* registry = nullptr,
                   std::string stream_id = std::string(),
                   UsageReporter* usage = nullptr);

    /**
     * @brief Cancels outstanding work and joins the workers
     */
    ~PrefetchEngine();

    PrefetchEngine(const PrefetchEngine&) = delete;
    PrefetchEngine& operator=(const PrefetchEngine&) = delete;

    /**
     * @brief Launch the fetch workers
     * @throws std::logic_error if called twice
     */
    void start();

    /**
     * @brief Block until the next piece of the range is available
     * @param out Receives the bytes, never empty when true is returned
     * @return false once the range is complete or the stream was cancelled
     * @throws UpstreamFatalException when a chunk could not be fetched;
     *         every chunk before it is returned first, including ones
     *         still in flight when the failure happened
     */
    bool nextChunk(std::vector<uint8_t>& out);

    /**
     * @brief Stop the stream
     *
     * Aborts in-flight transfers and wakes backoff waits. Safe to call
     * repeatedly and after the stream ended; only the first call on a live
     * stream changes its state.
     */
    void cancel();

    State state() const;
    uint64_t deliveredBytes() const { return m_delivered.load(); }
    const std::string& streamId() const { return m_stream_id; }

private:
    void workerLoop(size_t worker);
    std::optional<std::vector<uint8_t>> fetchWithRetry(uint64_t index);
    std::vector<uint8_t> trim(uint64_t index, std::vector<uint8_t> data) const;
    void fail(uint64_t index, const std::string& why);
    void finish_unlocked();
    void reportUsage(bool final);
    void updateRecord(const std::function<void(StreamRecord&)>& fn);
    bool stopping_unlocked() const;
    bool abandoned_unlocked(uint64_t index) const;
    bool awaitingBeforeError_unlocked() const;

    ClientPool& m_pool;
    size_t m_client_index;
    std::shared_ptr<ChunkSource> m_source;
    FileLocator m_locator;
    FetchPlan m_plan;
    EngineOptions m_options;
    StreamRegistry* m_registry;
    std::string m_stream_id;
    UsageReporter* m_usage;

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    State m_state;
    std::atomic<bool> m_cancel{false};
    std::vector<std::thread> m_workers;

    ReorderBuffer m_buffer;
    uint64_t m_next_dispatch = 0;
    std::set<uint64_t> m_in_flight;
    uint64_t m_end_index;
    uint64_t m_error_index;
    std::string m_error;

    ThroughputMeter m_meter;
    std::atomic<uint64_t> m_delivered{0};
    uint64_t m_usage_pending = 0;
};

} // namespace Stream
} // namespace TGStream

#endif // PREFETCHENGINE_H
