/*
 * PrefetchEngine.cpp - Bounded read-ahead with in-order chunk delivery
 * This file is part of TGStream.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TGStream is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "tgstream.h"

namespace TGStream {
namespace Stream {

using Core::UpstreamFatalException;
using Core::UpstreamRelocatedException;
using Core::UpstreamTransientException;

EngineOptions EngineOptions::fromConfig(const Core::Config& config)
{
    EngineOptions options;
    options.parallelism = config.parallelism;
    options.prefetch = config.prefetch;
    options.max_transient_retries = config.max_transient_retries;
    options.usage_threshold = config.usage_report_threshold;
    return options;
}

const char* PrefetchEngine::toString(State state)
{
    switch (state) {
        case State::Starting: return "starting";
        case State::Streaming: return "streaming";
        case State::Finished: return "finished";
        case State::Cancelled: return "cancelled";
        case State::Error: return "error";
    }
    return "unknown";
}

PrefetchEngine::PrefetchEngine(ClientPool& pool,
                               size_t client_index,
                               FileLocator locator,
                               FetchPlan plan,
                               EngineOptions options,
                               StreamRegistry* registry,
                               std::string stream_id,
                               UsageReporter* usage)
    : m_pool(pool)
    , m_client_index(client_index)
    , m_source(pool.source(client_index))
    , m_locator(std::move(locator))
    , m_plan(plan)
    , m_options(options)
    , m_registry(registry)
    , m_stream_id(std::move(stream_id))
    , m_usage(usage)
    , m_state(State::Starting)
    , m_buffer(0)
    , m_end_index(plan.chunk_count)
    , m_error_index(std::numeric_limits<uint64_t>::max())
{
    if (m_plan.chunk_size == 0 || m_plan.chunk_count == 0) {
        throw std::invalid_argument("PrefetchEngine: empty fetch plan");
    }
    if (m_options.parallelism == 0 || m_options.prefetch == 0) {
        throw std::invalid_argument("PrefetchEngine: parallelism and prefetch must be positive");
    }
}

PrefetchEngine::~PrefetchEngine()
{
    cancel();
    for (auto& worker : m_workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void PrefetchEngine::start()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state == State::Cancelled) {
            return;
        }
        if (m_state != State::Starting) {
            throw std::logic_error("PrefetchEngine::start called twice");
        }
        m_state = State::Streaming;
    }

    size_t workers = static_cast<size_t>(std::min<uint64_t>(m_options.parallelism, m_plan.chunk_count));
    Debug::log("engine", "Stream ", m_stream_id, ": ", m_plan.chunk_count, " chunks from byte ",
               m_plan.offset, " via ", m_source->describe(), ", ", workers, " workers, window ",
               m_options.prefetch);

    for (size_t i = 0; i < workers; ++i) {
        m_workers.emplace_back(&PrefetchEngine::workerLoop, this, i);
    }
}

bool PrefetchEngine::stopping_unlocked() const
{
    return m_cancel.load() || m_state != State::Streaming;
}

// Chunks past a failure are never delivered, so their fetches can stop
bool PrefetchEngine::abandoned_unlocked(uint64_t index) const
{
    return m_cancel.load() || index >= m_error_index;
}

bool PrefetchEngine::awaitingBeforeError_unlocked() const
{
    uint64_t next = m_buffer.nextIndex();
    return next < m_error_index && m_in_flight.count(next) > 0;
}

void PrefetchEngine::workerLoop(size_t worker)
{
    Core::System::setThisThreadName("tgs-fetch-" + std::to_string(worker));

    while (true) {
        uint64_t index;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this] {
                return stopping_unlocked() || m_next_dispatch >= m_end_index ||
                       m_in_flight.size() + m_buffer.size() < m_options.prefetch;
            });
            if (stopping_unlocked() || m_next_dispatch >= m_end_index) {
                return;
            }
            index = m_next_dispatch++;
            m_in_flight.insert(index);
        }

        std::optional<std::vector<uint8_t>> data;
        try {
            data = fetchWithRetry(index);
        } catch (const std::exception& e) {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_in_flight.erase(index);
            }
            fail(index, e.what());
            return;
        }

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_in_flight.erase(index);
            if (data && !abandoned_unlocked(index) && index < m_end_index) {
                if (data->empty()) {
                    Debug::log("engine", "Stream ", m_stream_id, ": end of data at chunk ", index);
                    m_end_index = index;
                } else {
                    if (data->size() < m_plan.chunk_size && index + 1 < m_end_index) {
                        Debug::log("engine", "Stream ", m_stream_id, ": short read of ", data->size(),
                                   " bytes at chunk ", index, ", treating as end of file");
                        m_end_index = index + 1;
                    }
                    m_buffer.put(index, std::move(*data));
                }
            }
        }
        m_cv.notify_all();

        if (!data) {
            return;
        }
    }
}

std::optional<std::vector<uint8_t>> PrefetchEngine::fetchWithRetry(uint64_t index)
{
    const uint64_t offset = m_plan.offset + index * m_plan.chunk_size;
    int transient_failures = 0;
    bool relocated = false;

    FileLocator locator;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        locator = m_locator;
    }

    while (true) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (abandoned_unlocked(index)) {
                break;
            }
        }
        try {
            std::vector<uint8_t> data;
            {
                ClientPool::LoadGuard load(m_pool, m_client_index);
                data = m_source->fetch(locator, offset, m_plan.chunk_size, m_cancel);
            }
            if (m_cancel) {
                return std::nullopt;
            }
            return data;
        } catch (const UpstreamTransientException& e) {
            ++transient_failures;
            if (transient_failures > m_options.max_transient_retries) {
                throw UpstreamFatalException("Giving up on byte " + std::to_string(offset) + " after " +
                                             std::to_string(transient_failures) +
                                             " transient failures: " + e.what());
            }

            auto wait = e.retryAfter();
            if (wait.count() <= 0) {
                wait = m_options.base_backoff * (1 << std::min(transient_failures - 1, 10));
                wait = std::min(wait, m_options.max_backoff);
            }
            Debug::log("engine", "Stream ", m_stream_id, ": ", e.what(), " at byte ", offset,
                       ", retry ", transient_failures, "/", m_options.max_transient_retries,
                       " in ", wait.count(), "ms");

            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait_for(lock, wait, [this, index] { return abandoned_unlocked(index); });
        } catch (const UpstreamRelocatedException& e) {
            if (relocated) {
                throw UpstreamFatalException("File relocated again (dc " + std::to_string(e.newDc()) +
                                             ") while fetching byte " + std::to_string(offset));
            }
            relocated = true;
            Debug::log("engine", "Stream ", m_stream_id, ": file moved to dc ", e.newDc(),
                       " at byte ", offset);

            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_locator.dc_id != e.newDc()) {
                m_source->relocate(m_locator, e.newDc());
            }
            locator = m_locator;
        }
    }
    return std::nullopt;
}

std::vector<uint8_t> PrefetchEngine::trim(uint64_t index, std::vector<uint8_t> data) const
{
    size_t begin = (index == 0) ? static_cast<size_t>(m_plan.first_cut) : 0;
    size_t end = data.size();
    if (index == m_plan.chunk_count - 1) {
        end = std::min(end, static_cast<size_t>(m_plan.last_cut));
    }
    if (begin >= end) {
        return {};
    }
    if (begin == 0 && end == data.size()) {
        return data;
    }
    return std::vector<uint8_t>(data.begin() + begin, data.begin() + end);
}

bool PrefetchEngine::nextChunk(std::vector<uint8_t>& out)
{
    while (true) {
        uint64_t index;
        std::vector<uint8_t> data;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            if (m_state == State::Starting) {
                throw std::logic_error("PrefetchEngine::nextChunk before start");
            }
            m_cv.wait(lock, [this] {
                if (m_state == State::Error) {
                    return m_buffer.ready() || !awaitingBeforeError_unlocked();
                }
                return m_state != State::Streaming ||
                       m_buffer.nextIndex() >= m_end_index ||
                       m_buffer.ready();
            });

            if (m_state == State::Finished || m_state == State::Cancelled) {
                return false;
            }

            if (m_buffer.ready() && m_buffer.nextIndex() < m_error_index &&
                m_buffer.nextIndex() < m_end_index) {
                index = m_buffer.nextIndex();
                data = m_buffer.take();
            } else if (m_state == State::Error) {
                std::string why = m_error;
                lock.unlock();
                reportUsage(true);
                throw UpstreamFatalException(why);
            } else {
                finish_unlocked();
                lock.unlock();
                m_cv.notify_all();

                double now = Core::System::unixTime();
                uint64_t total = m_delivered.load();
                double avg = m_meter.averageMbps();
                updateRecord([now, total, avg](StreamRecord& record) {
                    record.status = StreamStatus::Finished;
                    record.total_bytes = total;
                    record.avg_mbps = avg;
                    record.last_update = now;
                    record.end_time = now;
                });
                reportUsage(true);
                Debug::log("engine", "Stream ", m_stream_id, " finished, ", total, " bytes");
                return false;
            }
        }
        // A window slot is free again
        m_cv.notify_all();

        data = trim(index, std::move(data));
        if (data.empty()) {
            continue;
        }

        auto now = ThroughputMeter::Clock::now();
        m_meter.record(data.size(), now);
        uint64_t total = m_delivered.fetch_add(data.size()) + data.size();
        double instant = m_meter.instantMbps(now);
        double avg = m_meter.averageMbps(now);
        double peak = m_meter.peakMbps();
        double wall = Core::System::unixTime();
        updateRecord([=](StreamRecord& record) {
            record.total_bytes = total;
            record.instant_mbps = instant;
            record.avg_mbps = avg;
            record.peak_mbps = peak;
            record.last_update = wall;
        });

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_usage_pending += data.size();
        }
        reportUsage(false);

        out = std::move(data);
        return true;
    }
}

void PrefetchEngine::finish_unlocked()
{
    m_state = State::Finished;
    // Workers may still be fetching past an early end of data
    m_cancel = true;
    m_buffer.clear();
}

void PrefetchEngine::cancel()
{
    bool ended = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_cancel = true;
        ended = m_state == State::Finished || m_state == State::Cancelled || m_state == State::Error;
        if (!ended) {
            m_state = State::Cancelled;
            m_buffer.clear();
        }
    }
    m_cv.notify_all();
    if (ended) {
        // Bytes handed out after a failure are still owed to the usage sink
        reportUsage(true);
        return;
    }

    double now = Core::System::unixTime();
    uint64_t total = m_delivered.load();
    updateRecord([now, total](StreamRecord& record) {
        record.status = StreamStatus::Cancelled;
        record.total_bytes = total;
        record.last_update = now;
        record.end_time = now;
    });
    reportUsage(true);
    Debug::log("engine", "Stream ", m_stream_id, " cancelled after ", total, " bytes");
}

void PrefetchEngine::fail(uint64_t index, const std::string& why)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (index >= m_end_index || index >= m_error_index) {
            return;
        }
        if (m_state == State::Error) {
            // An earlier chunk failed after a later one did; the stream now stops there
            m_error = why;
            m_error_index = index;
            m_cv.notify_all();
            return;
        }
        if (m_state != State::Streaming) {
            return;
        }
        // Dispatch stops here; fetches below index keep running so their
        // bytes still reach the consumer before the error does
        m_state = State::Error;
        m_error = why;
        m_error_index = index;
    }
    m_cv.notify_all();
    reportUsage(true);

    uint64_t offset = m_plan.offset + index * m_plan.chunk_size;
    Debug::error("engine", "Stream ", m_stream_id, " failed at byte ", offset, ": ", why);

    double now = Core::System::unixTime();
    updateRecord([now, why](StreamRecord& record) {
        record.status = StreamStatus::Error;
        record.error = why;
        record.last_update = now;
        record.end_time = now;
    });
}

PrefetchEngine::State PrefetchEngine::state() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state;
}

void PrefetchEngine::reportUsage(bool final)
{
    uint64_t bytes = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_usage_pending == 0 || (!final && m_usage_pending < m_options.usage_threshold)) {
            return;
        }
        bytes = m_usage_pending;
        m_usage_pending = 0;
    }
    if (m_usage) {
        m_usage->report(m_stream_id, bytes);
    }
}

void PrefetchEngine::updateRecord(const std::function<void(StreamRecord&)>& fn)
{
    if (m_registry && !m_stream_id.empty()) {
        m_registry->update(m_stream_id, fn);
    }
}

} // namespace Stream
} // namespace TGStream
