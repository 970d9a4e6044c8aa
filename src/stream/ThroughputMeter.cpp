/*
 * ThroughputMeter.cpp - Instant, average and peak transfer rate
 * This file is part of TGStream.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TGStream is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "tgstream.h"

namespace TGStream {
namespace Stream {

ThroughputMeter::ThroughputMeter(Clock::duration window, Clock::time_point start)
    : m_window(window)
    , m_start(start)
    , m_window_bytes(0)
    , m_total(0)
    , m_peak(0.0)
{
}

double ThroughputMeter::toMbps(uint64_t bytes, double seconds)
{
    if (seconds <= 0.0) return 0.0;
    return static_cast<double>(bytes) * 8.0 / 1e6 / seconds;
}

void ThroughputMeter::expire(Clock::time_point now)
{
    while (!m_samples.empty() && now - m_samples.front().first >= m_window) {
        m_window_bytes -= m_samples.front().second;
        m_samples.pop_front();
    }
}

void ThroughputMeter::record(uint64_t bytes, Clock::time_point now)
{
    m_total += bytes;
    m_samples.emplace_back(now, bytes);
    m_window_bytes += bytes;
    m_peak = std::max(m_peak, instantMbps(now));
}

double ThroughputMeter::instantMbps(Clock::time_point now)
{
    expire(now);
    // Early in a stream the window is not full yet
    auto span = std::min(m_window, now - m_start);
    double seconds = std::chrono::duration<double>(span).count();
    return toMbps(m_window_bytes, seconds);
}

double ThroughputMeter::averageMbps(Clock::time_point now) const
{
    double elapsed = std::chrono::duration<double>(now - m_start).count();
    return toMbps(m_total, elapsed);
}

} // namespace Stream
} // namespace TGStream
