/*
 * UsageReporter.cpp - Background hand-off of per-stream byte counts
 * This file is part of TGStream.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TGStream is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "tgstream.h"

namespace TGStream {
namespace Stream {

UsageReporter::UsageReporter(Sink sink, size_t queue_capacity)
    : m_sink(std::move(sink))
    , m_queue(queue_capacity)
{
    if (!m_sink) {
        throw std::invalid_argument("UsageReporter: sink must be set");
    }
    m_thread = std::thread(&UsageReporter::reporterThreadLoop, this);
    Debug::log("usage", "Usage reporter thread started");
}

UsageReporter::~UsageReporter()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_shutdown = true;
    }
    m_cv.notify_all();
    if (m_thread.joinable()) {
        m_thread.join();
    }
    if (droppedCount() > 0) {
        Debug::log("usage", "Usage reporter stopped, ", droppedCount(), " deltas dropped");
    }
}

bool UsageReporter::report(const std::string& stream_id, uint64_t bytes)
{
    if (bytes == 0) {
        return true;
    }
    UsageDelta delta;
    delta.stream_id = stream_id;
    delta.bytes = bytes;
    delta.timestamp = Core::System::unixTime();

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_queue.tryPush(std::move(delta))) {
            DEBUG_LOG_LAZY("usage", "Queue full, dropped ", bytes, " bytes for stream ", stream_id);
            return false;
        }
        ++m_queued;
    }
    m_cv.notify_one();
    return true;
}

void UsageReporter::flush()
{
    std::unique_lock<std::mutex> lock(m_mutex);
    uint64_t target = m_queued;
    m_idle_cv.wait(lock, [this, target] { return m_processed >= target || m_shutdown; });
}

void UsageReporter::reporterThreadLoop()
{
    Core::System::setThisThreadName("usage-reporter");

    while (true) {
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this] { return m_processed < m_queued || m_shutdown; });
            if (m_shutdown && m_processed >= m_queued) break;
        }

        UsageDelta delta;
        while (m_queue.tryPop(delta)) {
            try {
                m_sink(delta);
                m_delivered_bytes += delta.bytes;
            } catch (const std::exception& e) {
                Debug::error("usage", "Sink failed for stream ", delta.stream_id, ": ", e.what());
            }
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                ++m_processed;
            }
            m_idle_cv.notify_all();
        }
    }
    m_idle_cv.notify_all();
}

UsageReporter::Sink UsageReporter::logSink()
{
    return [](const UsageDelta& delta) {
        Debug::log("usage", "stream ", delta.stream_id, " +", delta.bytes, " bytes");
    };
}

UsageReporter::Sink UsageReporter::httpSink(const std::string& url, int timeout_seconds)
{
    return [url, timeout_seconds](const UsageDelta& delta) {
        Json::Value body;
        body["stream_id"] = delta.stream_id;
        body["bytes"] = Json::UInt64(delta.bytes);
        body["timestamp"] = delta.timestamp;

        Json::StreamWriterBuilder builder;
        builder["indentation"] = "";
        std::string payload = Json::writeString(builder, body);

        auto response = HTTPClient::post(url, payload, "application/json", {}, timeout_seconds);
        if (!response.success) {
            Debug::error("usage", "Usage report for stream ", delta.stream_id, " failed: ",
                         response.statusMessage);
        }
    };
}

} // namespace Stream
} // namespace TGStream
