/*
 * test_prefetch_engine.cpp - Parallel chunk fetching with in-order delivery
 * This file is part of TGStream.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TGStream is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "tgstream.h"
#include "test_framework.h"
#include "mock_chunk_source.h"

using namespace TGStream::Stream;
using TGStream::Core::UpstreamFatalException;
using namespace TestFramework;

namespace {

const uint32_t CHUNK = 4096;

FileLocator makeLocator(uint64_t size)
{
    FileLocator locator;
    locator.unique_id = "AgADBAADq6cx";
    locator.size = size;
    locator.mime_type = "video/mp4";
    locator.file_name = "clip.mp4";
    locator.dc_id = 2;
    locator.location = "doc:1:2";
    return locator;
}

FetchPlan planFor(const std::string& header, uint64_t size)
{
    return RangeTranslator::plan(RangeTranslator::parse(header, size), CHUNK);
}

EngineOptions fastOptions(size_t parallelism = 4, size_t prefetch = 8)
{
    EngineOptions options;
    options.parallelism = parallelism;
    options.prefetch = prefetch;
    options.max_transient_retries = 5;
    options.base_backoff = std::chrono::milliseconds(5);
    options.max_backoff = std::chrono::milliseconds(50);
    return options;
}

std::vector<uint8_t> drain(PrefetchEngine& engine)
{
    std::vector<uint8_t> out;
    std::vector<uint8_t> chunk;
    while (engine.nextChunk(chunk)) {
        out.insert(out.end(), chunk.begin(), chunk.end());
    }
    return out;
}

std::vector<uint8_t> slice(const std::vector<uint8_t>& data, uint64_t start, uint64_t end)
{
    return std::vector<uint8_t>(data.begin() + start, data.begin() + end + 1);
}

} // anonymous namespace

class EngineFullFileTest : public TestCase {
public:
    EngineFullFileTest() : TestCase("Whole file arrives in order despite out-of-order fetches") {}

protected:
    void runTest() override {
        auto file = makePatternFile(10 * CHUNK + 100);
        auto source = std::make_shared<MockChunkSource>(file);
        source->setDelay(0, std::chrono::milliseconds(40));
        source->setDelay(CHUNK, std::chrono::milliseconds(20));
        source->setDelay(3 * CHUNK, std::chrono::milliseconds(10));

        ClientPool pool;
        pool.add(source, 2);

        PrefetchEngine engine(pool, 0, makeLocator(file.size()), planFor("", file.size()), fastOptions());
        engine.start();
        std::vector<uint8_t> out = drain(engine);

        ASSERT_EQUALS(file.size(), out.size(), "Delivered length");
        ASSERT_TRUE(out == file, "Delivered bytes match the file");
        ASSERT_TRUE(engine.state() == PrefetchEngine::State::Finished, "Engine finished");
        ASSERT_EQUALS(static_cast<uint64_t>(file.size()), engine.deliveredBytes(), "Delivered counter");
        ASSERT_EQUALS(11, source->fetchCount(), "One fetch per chunk");
        ASSERT_TRUE(source->maxConcurrent() <= 4, "Never more fetches than parallelism");
        ASSERT_TRUE(TestPatterns::waitFor([&]() { return pool.load(0) == 0; }), "Load released");

        std::vector<uint8_t> again;
        ASSERT_FALSE(engine.nextChunk(again), "Finished engine stays finished");
    }
};

class EngineRangeTest : public TestCase {
public:
    EngineRangeTest() : TestCase("Ranges are trimmed to the exact bytes") {}

protected:
    void runTest() override {
        auto file = makePatternFile(8 * CHUNK + 17);
        auto source = std::make_shared<MockChunkSource>(file);
        ClientPool pool;
        pool.add(source, 2);

        const std::vector<std::pair<uint64_t, uint64_t>> ranges = {
            {5000, 30000}, {10, 20}, {CHUNK, 2 * CHUNK}, {CHUNK - 1, CHUNK}, {file.size() - 1, file.size() - 1},
        };
        for (const auto& r : ranges) {
            std::string header = "bytes=" + std::to_string(r.first) + "-" + std::to_string(r.second);
            PrefetchEngine engine(pool, 0, makeLocator(file.size()), planFor(header, file.size()),
                                  fastOptions(3, 3));
            engine.start();
            std::vector<uint8_t> out = drain(engine);
            ASSERT_TRUE(out == slice(file, r.first, r.second), "Bytes for " + header);
        }
    }
};

class EngineFloodWaitTest : public TestCase {
public:
    EngineFloodWaitTest() : TestCase("Flood waits are retried after the advised delay") {}

protected:
    void runTest() override {
        auto file = makePatternFile(6 * CHUNK);
        auto source = std::make_shared<MockChunkSource>(file);
        source->addFault(2 * CHUNK, {MockChunkSource::FaultKind::Transient, 30});
        source->addFault(2 * CHUNK, {MockChunkSource::FaultKind::Transient, 0});

        ClientPool pool;
        pool.add(source, 2);

        auto started = std::chrono::steady_clock::now();
        PrefetchEngine engine(pool, 0, makeLocator(file.size()), planFor("", file.size()), fastOptions());
        engine.start();
        std::vector<uint8_t> out = drain(engine);
        auto elapsed = std::chrono::steady_clock::now() - started;

        ASSERT_TRUE(out == file, "Bytes survive the retries");
        ASSERT_EQUALS(8, source->fetchCount(), "Two extra attempts");
        ASSERT_TRUE(elapsed >= std::chrono::milliseconds(30), "Advised delay was honoured");
    }
};

class EngineTransientExhaustedTest : public TestCase {
public:
    EngineTransientExhaustedTest() : TestCase("Too many transient failures end the stream") {}

protected:
    void runTest() override {
        auto file = makePatternFile(8 * CHUNK);
        auto source = std::make_shared<MockChunkSource>(file);
        for (int i = 0; i < 3; ++i) {
            source->addFault(3 * CHUNK, {MockChunkSource::FaultKind::Transient, 25});
        }

        ClientPool pool;
        pool.add(source, 2);
        StreamRegistry registry(std::chrono::seconds(3), 10);
        StreamRecord record;
        record.stream_id = "s1";
        registry.registerStream(record);

        EngineOptions options = fastOptions();
        options.max_transient_retries = 2;
        PrefetchEngine engine(pool, 0, makeLocator(file.size()), planFor("", file.size()), options,
                              &registry, "s1");
        engine.start();

        std::vector<uint8_t> out;
        std::vector<uint8_t> chunk;
        bool threw = false;
        try {
            while (engine.nextChunk(chunk)) {
                out.insert(out.end(), chunk.begin(), chunk.end());
            }
        } catch (const UpstreamFatalException& e) {
            threw = true;
            ASSERT_TRUE(std::string(e.what()).find("transient") != std::string::npos, "Reason is reported");
        }

        ASSERT_TRUE(threw, "Stream fails once retries are exhausted");
        ASSERT_TRUE(out == slice(file, 0, 3 * CHUNK - 1), "Chunks before the failure were delivered");
        ASSERT_TRUE(engine.state() == PrefetchEngine::State::Error, "Engine in error state");

        auto final_record = registry.get("s1");
        ASSERT_TRUE(final_record.has_value(), "Record still present");
        ASSERT_TRUE(final_record->status == StreamStatus::Error, "Record marked as error");
        ASSERT_FALSE(final_record->error.empty(), "Record carries the reason");
        ASSERT_TRUE(final_record->end_time > 0.0, "End time set");
    }
};

class EngineFatalTest : public TestCase {
public:
    EngineFatalTest() : TestCase("Fatal upstream error on the first chunk") {}

protected:
    void runTest() override {
        auto file = makePatternFile(4 * CHUNK);
        auto source = std::make_shared<MockChunkSource>(file);
        source->addFault(0, {MockChunkSource::FaultKind::Fatal, 0});

        ClientPool pool;
        pool.add(source, 2);
        PrefetchEngine engine(pool, 0, makeLocator(file.size()), planFor("", file.size()), fastOptions());
        engine.start();

        std::vector<uint8_t> chunk;
        TestPatterns::assertThrows<UpstreamFatalException>([&]() { engine.nextChunk(chunk); },
                                                           "FILE_REFERENCE_EXPIRED", "Fatal error surfaces");
        ASSERT_EQUALS(0u, engine.deliveredBytes(), "Nothing delivered");
        ASSERT_TRUE(TestPatterns::waitFor([&]() { return pool.load(0) == 0; }), "Load released after failure");
    }
};

class EngineRelocationTest : public TestCase {
public:
    EngineRelocationTest() : TestCase("A relocated file is followed once") {}

protected:
    void runTest() override {
        auto file = makePatternFile(5 * CHUNK);
        auto source = std::make_shared<MockChunkSource>(file);
        source->addFault(CHUNK, {MockChunkSource::FaultKind::Relocate, 4});

        ClientPool pool;
        pool.add(source, 2);
        PrefetchEngine engine(pool, 0, makeLocator(file.size()), planFor("", file.size()), fastOptions());
        engine.start();
        std::vector<uint8_t> out = drain(engine);

        ASSERT_TRUE(out == file, "Relocation is transparent to the client");
        ASSERT_EQUALS(1, source->relocations(), "Locator moved once");
        ASSERT_EQUALS(6, source->fetchCount(), "Relocated chunk fetched twice");
    }
};

class EngineDoubleRelocationTest : public TestCase {
public:
    EngineDoubleRelocationTest() : TestCase("A second relocation of the same chunk is fatal") {}

protected:
    void runTest() override {
        auto file = makePatternFile(3 * CHUNK);
        auto source = std::make_shared<MockChunkSource>(file);
        source->addFault(0, {MockChunkSource::FaultKind::Relocate, 4});
        source->addFault(0, {MockChunkSource::FaultKind::Relocate, 5});

        ClientPool pool;
        pool.add(source, 2);
        PrefetchEngine engine(pool, 0, makeLocator(file.size()), planFor("", file.size()), fastOptions());
        engine.start();

        std::vector<uint8_t> chunk;
        TestPatterns::assertThrows<UpstreamFatalException>([&]() { engine.nextChunk(chunk); },
                                                           "relocated again", "Second move is not followed");
        ASSERT_EQUALS(1, source->relocations(), "Only the first move was applied");
    }
};

class EngineCancelTest : public TestCase {
public:
    EngineCancelTest() : TestCase("Cancellation stops delivery and fetching") {}

protected:
    void runTest() override {
        auto file = makePatternFile(40 * CHUNK);
        auto source = std::make_shared<MockChunkSource>(file);
        ClientPool pool;
        pool.add(source, 2);
        StreamRegistry registry(std::chrono::seconds(3), 10);
        StreamRecord record;
        record.stream_id = "cancel-me";
        registry.registerStream(record);

        PrefetchEngine engine(pool, 0, makeLocator(file.size()), planFor("", file.size()), fastOptions(),
                              &registry, "cancel-me");
        engine.start();

        std::vector<uint8_t> chunk;
        ASSERT_TRUE(engine.nextChunk(chunk), "First chunk");
        ASSERT_TRUE(engine.nextChunk(chunk), "Second chunk");

        engine.cancel();
        engine.cancel();
        ASSERT_TRUE(engine.state() == PrefetchEngine::State::Cancelled, "Engine cancelled");
        ASSERT_FALSE(engine.nextChunk(chunk), "No chunks after cancel");
        ASSERT_EQUALS(static_cast<uint64_t>(2 * CHUNK), engine.deliveredBytes(), "Delivered before cancel");

        auto final_record = registry.get("cancel-me");
        ASSERT_TRUE(final_record->status == StreamStatus::Cancelled, "Record marked cancelled");
        ASSERT_EQUALS(static_cast<uint64_t>(2 * CHUNK), final_record->total_bytes, "Record byte count");

        ASSERT_TRUE(TestPatterns::waitFor([&]() { return source->concurrent() == 0; }), "Fetches drained");
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        int fetched = source->fetchCount();
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        ASSERT_EQUALS(fetched, source->fetchCount(), "No new fetches after cancel");
        ASSERT_TRUE(fetched < 40, "Fetching stopped early");
    }
};

class EngineCancelInFlightTest : public TestCase {
public:
    EngineCancelInFlightTest() : TestCase("Cancellation interrupts fetches in flight") {}

protected:
    void runTest() override {
        auto file = makePatternFile(20 * CHUNK);
        auto source = std::make_shared<MockChunkSource>(file);
        source->hold();
        ClientPool pool;
        pool.add(source, 2);

        auto engine = std::make_unique<PrefetchEngine>(pool, 0, makeLocator(file.size()),
                                                       planFor("", file.size()), fastOptions(4, 8));
        engine->start();
        ASSERT_TRUE(TestPatterns::waitFor([&]() { return source->concurrent() == 4; }), "All workers fetching");
        ASSERT_EQUALS(4, pool.load(0), "Every fetch counts as load");

        auto started = std::chrono::steady_clock::now();
        engine->cancel();
        engine.reset();
        auto elapsed = std::chrono::steady_clock::now() - started;

        ASSERT_TRUE(elapsed < std::chrono::seconds(1), "Workers exit promptly");
        ASSERT_EQUALS(0, source->concurrent(), "No fetch left running");
        ASSERT_EQUALS(0, pool.load(0), "Load released on cancel");
    }
};

class EngineBackpressureTest : public TestCase {
public:
    EngineBackpressureTest() : TestCase("Read-ahead stops at the prefetch window") {}

protected:
    void runTest() override {
        auto file = makePatternFile(50 * CHUNK);
        auto source = std::make_shared<MockChunkSource>(file);
        ClientPool pool;
        pool.add(source, 2);

        PrefetchEngine engine(pool, 0, makeLocator(file.size()), planFor("", file.size()), fastOptions(4, 6));
        engine.start();

        ASSERT_TRUE(TestPatterns::waitFor([&]() { return source->fetchCount() >= 6; }), "Window filled");
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        ASSERT_EQUALS(6, source->fetchCount(), "Slow reader holds fetching at the window");

        std::vector<uint8_t> chunk;
        ASSERT_TRUE(engine.nextChunk(chunk), "Read one chunk");
        ASSERT_TRUE(TestPatterns::waitFor([&]() { return source->fetchCount() == 7; }), "One slot reopened");
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        ASSERT_EQUALS(7, source->fetchCount(), "Exactly one more fetch");

        std::vector<uint8_t> out(chunk);
        std::vector<uint8_t> rest = drain(engine);
        out.insert(out.end(), rest.begin(), rest.end());
        ASSERT_TRUE(out == file, "Whole file after the stall");
        ASSERT_TRUE(source->maxConcurrent() <= 4, "Parallelism bound held");
    }
};

class EngineEndOfDataTest : public TestCase {
public:
    EngineEndOfDataTest() : TestCase("Upstream shorter than advertised ends the stream cleanly") {}

protected:
    void runTest() override {
        // Ends inside a chunk: short read
        auto short_file = makePatternFile(6 * CHUNK + 300);
        auto short_source = std::make_shared<MockChunkSource>(short_file);
        ClientPool short_pool;
        short_pool.add(short_source, 2);
        PrefetchEngine short_engine(short_pool, 0, makeLocator(10 * CHUNK), planFor("", 10 * CHUNK),
                                    fastOptions(2, 4));
        short_engine.start();
        ASSERT_TRUE(drain(short_engine) == short_file, "Short read delivers what exists");
        ASSERT_TRUE(short_engine.state() == PrefetchEngine::State::Finished, "Finished after short read");

        // Ends on a chunk boundary: empty chunk
        auto aligned_file = makePatternFile(6 * CHUNK);
        auto aligned_source = std::make_shared<MockChunkSource>(aligned_file);
        ClientPool aligned_pool;
        aligned_pool.add(aligned_source, 2);
        PrefetchEngine aligned_engine(aligned_pool, 0, makeLocator(10 * CHUNK), planFor("", 10 * CHUNK),
                                      fastOptions(2, 4));
        aligned_engine.start();
        ASSERT_TRUE(drain(aligned_engine) == aligned_file, "Empty chunk ends the stream");
        ASSERT_TRUE(aligned_engine.state() == PrefetchEngine::State::Finished, "Finished at end of data");
    }
};

class EngineUsageTest : public TestCase {
public:
    EngineUsageTest() : TestCase("Usage is reported in threshold sized deltas") {}

protected:
    void runTest() override {
        std::mutex mutex;
        std::vector<UsageDelta> deltas;
        UsageReporter usage([&](const UsageDelta& delta) {
            std::lock_guard<std::mutex> lock(mutex);
            deltas.push_back(delta);
        }, 64);

        auto file = makePatternFile(10 * CHUNK);
        auto source = std::make_shared<MockChunkSource>(file);
        ClientPool pool;
        pool.add(source, 2);

        EngineOptions options = fastOptions();
        options.usage_threshold = 3 * CHUNK;
        {
            PrefetchEngine engine(pool, 0, makeLocator(file.size()), planFor("", file.size()), options,
                                  nullptr, "usage-stream", &usage);
            engine.start();
            drain(engine);
        }
        usage.flush();

        std::lock_guard<std::mutex> lock(mutex);
        ASSERT_EQUALS(4u, deltas.size(), "Three full deltas and the remainder");
        uint64_t total = 0;
        for (const auto& delta : deltas) {
            ASSERT_EQUALS("usage-stream", delta.stream_id, "Delta stream id");
            ASSERT_TRUE(delta.timestamp > 0.0, "Delta timestamp");
            total += delta.bytes;
        }
        ASSERT_EQUALS(static_cast<uint64_t>(file.size()), total, "Deltas add up to the delivered bytes");
        ASSERT_EQUALS(static_cast<uint64_t>(CHUNK), deltas.back().bytes, "Remainder flushed at the end");
        ASSERT_EQUALS(total, usage.deliveredBytes(), "Reporter counted the bytes");
    }
};

class EngineRegistryTest : public TestCase {
public:
    EngineRegistryTest() : TestCase("Stream record follows the engine") {}

protected:
    void runTest() override {
        auto file = makePatternFile(4 * CHUNK);
        auto source = std::make_shared<MockChunkSource>(file);
        ClientPool pool;
        pool.add(source, 2);
        StreamRegistry registry(std::chrono::milliseconds(0), 10);
        StreamRecord record;
        record.stream_id = "tracked";
        record.start_time = TGStream::Core::System::unixTime();
        registry.registerStream(record);

        PrefetchEngine engine(pool, 0, makeLocator(file.size()), planFor("", file.size()), fastOptions(),
                              &registry, "tracked");
        engine.start();

        std::vector<uint8_t> chunk;
        ASSERT_TRUE(engine.nextChunk(chunk), "First chunk");
        auto mid = registry.get("tracked");
        ASSERT_TRUE(mid->status == StreamStatus::Active, "Active while streaming");
        ASSERT_EQUALS(static_cast<uint64_t>(CHUNK), mid->total_bytes, "Bytes so far");

        drain(engine);
        auto done = registry.get("tracked");
        ASSERT_TRUE(done->status == StreamStatus::Finished, "Finished at the end");
        ASSERT_EQUALS(static_cast<uint64_t>(file.size()), done->total_bytes, "Total bytes");
        ASSERT_TRUE(done->end_time >= done->start_time, "End time set");

        ASSERT_EQUALS(1u, registry.prune(done->last_update + 1.0), "Finished stream retires");
        ASSERT_EQUALS(1u, registry.listRecent().size(), "Now in the recent list");
    }
};

class EngineMisuseTest : public TestCase {
public:
    EngineMisuseTest() : TestCase("Engine rejects invalid use") {}

protected:
    void runTest() override {
        auto source = std::make_shared<MockChunkSource>(makePatternFile(CHUNK));
        ClientPool pool;
        pool.add(source, 2);

        FetchPlan empty_plan;
        TestPatterns::assertThrows<std::invalid_argument>(
            [&]() { PrefetchEngine engine(pool, 0, makeLocator(CHUNK), empty_plan, fastOptions()); }, "",
            "Empty plan");
        TestPatterns::assertThrows<std::invalid_argument>(
            [&]() { PrefetchEngine engine(pool, 0, makeLocator(CHUNK), planFor("", CHUNK), fastOptions(0, 4)); },
            "", "Zero parallelism");

        PrefetchEngine engine(pool, 0, makeLocator(CHUNK), planFor("", CHUNK), fastOptions());
        std::vector<uint8_t> chunk;
        TestPatterns::assertThrows<std::logic_error>([&]() { engine.nextChunk(chunk); }, "before start",
                                                     "Reading before start");
        engine.start();
        TestPatterns::assertThrows<std::logic_error>([&]() { engine.start(); }, "twice", "Starting twice");
        ASSERT_TRUE(drain(engine).size() == CHUNK, "Still streams after misuse");

        PrefetchEngine never_started(pool, 0, makeLocator(CHUNK), planFor("", CHUNK), fastOptions());
        never_started.cancel();
        TestPatterns::assertNoThrow([&]() { never_started.start(); }, "Start after cancel is a no-op");
        ASSERT_TRUE(never_started.state() == PrefetchEngine::State::Cancelled, "Stays cancelled");
    }
};

class EngineErrorAfterSlowChunkTest : public TestCase {
public:
    EngineErrorAfterSlowChunkTest() : TestCase("Chunks before a failure arrive even when they finish later") {}

protected:
    void runTest() override {
        auto file = makePatternFile(4 * CHUNK);
        auto source = std::make_shared<MockChunkSource>(file);
        source->setDelay(0, std::chrono::milliseconds(100));
        source->addFault(CHUNK, {MockChunkSource::FaultKind::Fatal, 0});

        ClientPool pool;
        pool.add(source, 2);
        PrefetchEngine engine(pool, 0, makeLocator(file.size()), planFor("", file.size()), fastOptions(4, 8));
        engine.start();

        std::vector<uint8_t> out;
        std::vector<uint8_t> chunk;
        bool threw = false;
        try {
            while (engine.nextChunk(chunk)) {
                out.insert(out.end(), chunk.begin(), chunk.end());
            }
        } catch (const UpstreamFatalException& e) {
            threw = true;
            ASSERT_TRUE(std::string(e.what()).find("FILE_REFERENCE_EXPIRED") != std::string::npos,
                        "Failure reason");
        }

        ASSERT_TRUE(threw, "Failure reaches the consumer");
        ASSERT_TRUE(out == slice(file, 0, CHUNK - 1), "Slow first chunk delivered before the error");
        ASSERT_EQUALS(static_cast<uint64_t>(CHUNK), engine.deliveredBytes(), "Delivered byte count");
        ASSERT_TRUE(engine.state() == PrefetchEngine::State::Error, "Engine in error state");
    }
};

class EngineUsageAfterErrorTest : public TestCase {
public:
    EngineUsageAfterErrorTest() : TestCase("Usage is flushed when a failed stream is dropped") {}

protected:
    void runTest() override {
        std::mutex mutex;
        uint64_t reported = 0;
        UsageReporter usage([&](const UsageDelta& delta) {
            std::lock_guard<std::mutex> lock(mutex);
            reported += delta.bytes;
        }, 64);

        auto file = makePatternFile(4 * CHUNK);
        auto source = std::make_shared<MockChunkSource>(file);
        source->addFault(CHUNK, {MockChunkSource::FaultKind::Fatal, 0});
        ClientPool pool;
        pool.add(source, 2);

        EngineOptions options = fastOptions(1, 2);
        options.usage_threshold = 100 * CHUNK;
        uint64_t delivered = 0;
        {
            PrefetchEngine engine(pool, 0, makeLocator(file.size()), planFor("", file.size()), options,
                                  nullptr, "dropped", &usage);
            engine.start();
            std::vector<uint8_t> chunk;
            ASSERT_TRUE(engine.nextChunk(chunk), "First chunk delivered");
            ASSERT_TRUE(TestPatterns::waitFor([&]() { return engine.state() == PrefetchEngine::State::Error; }),
                        "Second chunk fails");
            delivered = engine.deliveredBytes();
            // Dropped without reading the error
        }
        usage.flush();

        std::lock_guard<std::mutex> lock(mutex);
        ASSERT_EQUALS(static_cast<uint64_t>(CHUNK), delivered, "One chunk delivered");
        ASSERT_EQUALS(delivered, reported, "Delivered bytes were reported");
    }
};

class EngineRandomOrderTest : public TestCase {
public:
    EngineRandomOrderTest() : TestCase("Random completion order still yields the file in order") {}

protected:
    void runTest() override {
        const size_t chunks = 64;
        auto file = makePatternFile(chunks * CHUNK - 123);
        auto source = std::make_shared<MockChunkSource>(file);

        std::mt19937 rng(20240917);
        std::uniform_int_distribution<int> delay_ms(0, 12);
        for (size_t i = 0; i < chunks; ++i) {
            source->setDelay(i * CHUNK, std::chrono::milliseconds(delay_ms(rng)));
        }

        ClientPool pool;
        pool.add(source, 2);
        PrefetchEngine engine(pool, 0, makeLocator(file.size()), planFor("bytes=777-", file.size()),
                              fastOptions(8, 16));
        engine.start();

        ASSERT_TRUE(drain(engine) == slice(file, 777, file.size() - 1), "Bytes in order and gap free");
        ASSERT_TRUE(source->maxConcurrent() <= 8, "Parallelism respected");
        ASSERT_TRUE(source->maxConcurrent() > 1, "Fetches overlapped");
        ASSERT_EQUALS(static_cast<int>(chunks), source->fetchCount(), "Each chunk fetched once");
    }
};

class EngineRepeatableTest : public TestCase {
public:
    EngineRepeatableTest() : TestCase("The same range twice gives identical bytes") {}

protected:
    void runTest() override {
        auto file = makePatternFile(12 * CHUNK + 55);
        auto source = std::make_shared<MockChunkSource>(file);
        source->setDelay(2 * CHUNK, std::chrono::milliseconds(15));
        source->setDelay(5 * CHUNK, std::chrono::milliseconds(5));
        ClientPool pool;
        pool.add(source, 2);

        const std::string range = "bytes=5000-40000";
        std::vector<std::vector<uint8_t>> runs;
        for (int i = 0; i < 2; ++i) {
            PrefetchEngine engine(pool, 0, makeLocator(file.size()), planFor(range, file.size()), fastOptions());
            engine.start();
            runs.push_back(drain(engine));
        }

        ASSERT_TRUE(runs[0] == runs[1], "Both runs match");
        ASSERT_TRUE(runs[0] == slice(file, 5000, 40000), "And match the file");
    }
};

int main(int argc, char* argv[]) {
    (void)argc;
    (void)argv;

    TestSuite suite("PrefetchEngine Tests");

    suite.addTest(std::make_unique<EngineFullFileTest>());
    suite.addTest(std::make_unique<EngineRangeTest>());
    suite.addTest(std::make_unique<EngineFloodWaitTest>());
    suite.addTest(std::make_unique<EngineTransientExhaustedTest>());
    suite.addTest(std::make_unique<EngineFatalTest>());
    suite.addTest(std::make_unique<EngineRelocationTest>());
    suite.addTest(std::make_unique<EngineDoubleRelocationTest>());
    suite.addTest(std::make_unique<EngineCancelTest>());
    suite.addTest(std::make_unique<EngineCancelInFlightTest>());
    suite.addTest(std::make_unique<EngineBackpressureTest>());
    suite.addTest(std::make_unique<EngineEndOfDataTest>());
    suite.addTest(std::make_unique<EngineUsageTest>());
    suite.addTest(std::make_unique<EngineRegistryTest>());
    suite.addTest(std::make_unique<EngineMisuseTest>());
    suite.addTest(std::make_unique<EngineErrorAfterSlowChunkTest>());
    suite.addTest(std::make_unique<EngineUsageAfterErrorTest>());
    suite.addTest(std::make_unique<EngineRandomOrderTest>());
    suite.addTest(std::make_unique<EngineRepeatableTest>());

    auto results = suite.runAll();
    suite.printResults(results);

    return suite.getFailureCount(results) > 0 ? 1 : 0;
}
