/*
 * ThroughputMeter.h - Instant, average and peak transfer rate
 * This file is part of TGStream.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TGStream is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef THROUGHPUTMETER_H
#define THROUGHPUTMETER_H

// No direct includes - all includes should be in tgstream.h

namespace TGStream {
namespace Stream {

/**
 * @brief Rate tracking for one stream
 *
 * Rates are megabits per second. The instant rate covers the bytes recorded
 * within the sliding window; average is total bytes over elapsed time; peak
 * is the highest instant rate seen at any record().
 */
class ThroughputMeter {
public:
    using Clock = std::chrono::steady_clock;

    explicit ThroughputMeter(Clock::duration window = std::chrono::seconds(2),
                             Clock::time_point start = Clock::now());

    void record(uint64_t bytes, Clock::time_point now = Clock::now());

    double instantMbps(Clock::time_point now = Clock::now());
    double averageMbps(Clock::time_point now = Clock::now()) const;
    double peakMbps() const { return m_peak; }
    uint64_t totalBytes() const { return m_total; }

    static double toMbps(uint64_t bytes, double seconds);

private:
    void expire(Clock::time_point now);

    Clock::duration m_window;
    Clock::time_point m_start;
    std::deque<std::pair<Clock::time_point, uint64_t>> m_samples;
    uint64_t m_window_bytes;
    uint64_t m_total;
    double m_peak;
};

} // namespace Stream
} // namespace TGStream

#endif // THROUGHPUTMETER_H
