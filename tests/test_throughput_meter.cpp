/*
 * test_throughput_meter.cpp - Sliding window rate accounting
 * This file is part of TGStream.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TGStream is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "tgstream.h"
#include "test_framework.h"

using TGStream::Stream::ThroughputMeter;
using namespace TestFramework;
using namespace std::chrono;

class MeterConversionTest : public TestCase {
public:
    MeterConversionTest() : TestCase("Bytes per second to megabits") {}

protected:
    void runTest() override {
        ASSERT_NEAR(8.0, ThroughputMeter::toMbps(1000000, 1.0), 1e-9, "1 MB in 1 s is 8 Mbit/s");
        ASSERT_NEAR(4.0, ThroughputMeter::toMbps(1000000, 2.0), 1e-9, "1 MB in 2 s is 4 Mbit/s");
        ASSERT_NEAR(0.0, ThroughputMeter::toMbps(1000000, 0.0), 1e-9, "Zero duration gives zero");
    }
};

class MeterWindowTest : public TestCase {
public:
    MeterWindowTest() : TestCase("Instant rate follows the two second window") {}

protected:
    void runTest() override {
        auto t0 = ThroughputMeter::Clock::now();
        ThroughputMeter meter(seconds(2), t0);

        ASSERT_NEAR(0.0, meter.instantMbps(t0), 1e-9, "No time elapsed");

        meter.record(1000000, t0 + seconds(1));
        ASSERT_NEAR(8.0, meter.instantMbps(t0 + seconds(1)), 1e-9, "Partial window uses elapsed time");

        meter.record(1000000, t0 + seconds(2));
        ASSERT_NEAR(8.0, meter.instantMbps(t0 + seconds(2)), 1e-9, "Full window");

        ASSERT_NEAR(4.0, meter.instantMbps(t0 + milliseconds(3500)), 1e-9, "Oldest sample expired");
        ASSERT_NEAR(0.0, meter.instantMbps(t0 + seconds(10)), 1e-9, "Everything expired");

        ASSERT_NEAR(2.0, meter.averageMbps(t0 + seconds(8)), 1e-9, "Average over the whole stream");
        ASSERT_NEAR(8.0, meter.peakMbps(), 1e-9, "Peak keeps the best instant rate");
        ASSERT_EQUALS(2000000u, meter.totalBytes(), "Total bytes");
    }
};

class MeterPeakTest : public TestCase {
public:
    MeterPeakTest() : TestCase("Peak never decreases") {}

protected:
    void runTest() override {
        auto t0 = ThroughputMeter::Clock::now();
        ThroughputMeter meter(seconds(2), t0);

        meter.record(500000, t0 + seconds(2));
        double first = meter.peakMbps();
        ASSERT_NEAR(2.0, first, 1e-9, "Peak after first sample");

        meter.record(3000000, t0 + seconds(3));
        ASSERT_NEAR(14.0, meter.peakMbps(), 1e-9, "Burst raises the peak");

        meter.record(1, t0 + seconds(20));
        ASSERT_NEAR(14.0, meter.peakMbps(), 1e-9, "Slow sample leaves the peak alone");
    }
};

int main(int argc, char* argv[]) {
    (void)argc;
    (void)argv;

    TestSuite suite("ThroughputMeter Tests");

    suite.addTest(std::make_unique<MeterConversionTest>());
    suite.addTest(std::make_unique<MeterWindowTest>());
    suite.addTest(std::make_unique<MeterPeakTest>());

    auto results = suite.runAll();
    suite.printResults(results);

    return suite.getFailureCount(results) > 0 ? 1 : 0;
}
