/*
 * test_bounded_queue.cpp - Tests for BoundedQueue
 * This file is part of TGStream.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TGStream is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "tgstream.h"
#include "test_framework.h"

using TGStream::Core::BoundedQueue;
using TGStream::Stream::UsageDelta;
using namespace TestFramework;

namespace {

UsageDelta makeDelta(int n) {
    UsageDelta delta;
    delta.stream_id = "stream" + std::to_string(n);
    delta.bytes = static_cast<uint64_t>(n) * 1024;
    delta.timestamp = n;
    return delta;
}

} // anonymous namespace

class BoundedQueueBasicTest : public TestCase {
public:
    BoundedQueueBasicTest() : TestCase("BoundedQueue basic operations") {}

protected:
    void runTest() override {
        BoundedQueue<UsageDelta> queue(3);

        ASSERT_TRUE(queue.empty(), "New queue should be empty");
        ASSERT_EQUALS(0u, queue.size(), "New queue size should be 0");

        ASSERT_TRUE(queue.tryPush(makeDelta(1)), "Should be able to push first item");
        ASSERT_TRUE(queue.tryPush(makeDelta(2)), "Should be able to push second item");
        ASSERT_TRUE(queue.tryPush(makeDelta(3)), "Should be able to push third item");
        ASSERT_FALSE(queue.tryPush(makeDelta(4)), "Fourth push must fail, queue full");
        ASSERT_EQUALS(3u, queue.size(), "Queue size should be 3");
        ASSERT_EQUALS(1u, queue.rejectedCount(), "Refused push is counted");

        UsageDelta popped;
        ASSERT_TRUE(queue.tryPop(popped), "Should be able to pop item");
        ASSERT_EQUALS("stream1", popped.stream_id, "Items come out in FIFO order");
        ASSERT_EQUALS(1024u, popped.bytes, "Popped bytes");
        ASSERT_EQUALS(2u, queue.size(), "Queue size should be 2 after pop");

        ASSERT_TRUE(queue.tryPush(makeDelta(4)), "Should be able to push after pop");
    }
};

class BoundedQueueUnlimitedTest : public TestCase {
public:
    BoundedQueueUnlimitedTest() : TestCase("BoundedQueue without a limit") {}

protected:
    void runTest() override {
        BoundedQueue<int> queue;
        for (int i = 0; i < 10000; ++i) {
            ASSERT_TRUE(queue.tryPush(i), "Unlimited queue accepts every push");
        }
        ASSERT_EQUALS(10000u, queue.size(), "All items queued");
        ASSERT_EQUALS(0u, queue.rejectedCount(), "Nothing rejected");
        ASSERT_EQUALS(0u, queue.getMaxItems(), "Zero means unlimited");

        int value = -1;
        ASSERT_TRUE(queue.tryPop(value), "Pop from unlimited queue");
        ASSERT_EQUALS(0, value, "First item");
    }
};

class BoundedQueueClearTest : public TestCase {
public:
    BoundedQueueClearTest() : TestCase("BoundedQueue clear") {}

protected:
    void runTest() override {
        BoundedQueue<UsageDelta> queue(5);
        for (int i = 0; i < 3; i++) {
            queue.tryPush(makeDelta(i));
        }
        ASSERT_EQUALS(3u, queue.size(), "Queue should have 3 items");

        queue.clear();
        ASSERT_TRUE(queue.empty(), "Queue should be empty after clear");

        UsageDelta popped;
        ASSERT_FALSE(queue.tryPop(popped), "Pop from empty queue fails");
    }
};

class BoundedQueueThreadTest : public TestCase {
public:
    BoundedQueueThreadTest() : TestCase("BoundedQueue producer and consumer threads") {}

protected:
    void runTest() override {
        BoundedQueue<UsageDelta> queue(16);
        const int total = 2000;
        std::atomic<int> pushed{0};
        std::atomic<int> rejected{0};
        std::atomic<bool> producer_done{false};
        uint64_t popped_bytes = 0;
        uint64_t pushed_bytes = 0;

        std::thread producer([&]() {
            for (int i = 0; i < total; ++i) {
                if (queue.tryPush(makeDelta(i))) {
                    pushed++;
                    pushed_bytes += static_cast<uint64_t>(i) * 1024;
                } else {
                    rejected++;
                }
            }
            producer_done = true;
        });

        int popped = 0;
        while (!producer_done || !queue.empty()) {
            UsageDelta delta;
            if (queue.tryPop(delta)) {
                popped++;
                popped_bytes += delta.bytes;
            } else {
                std::this_thread::yield();
            }
        }
        producer.join();

        ASSERT_EQUALS(total, pushed.load() + rejected.load(), "Every push is either queued or rejected");
        ASSERT_EQUALS(pushed.load(), popped, "Every queued item is popped once");
        ASSERT_EQUALS(pushed_bytes, popped_bytes, "No item is lost or duplicated");
        ASSERT_EQUALS(static_cast<uint64_t>(rejected.load()), queue.rejectedCount(), "Rejections are counted");
    }
};

int main(int argc, char* argv[]) {
    (void)argc;
    (void)argv;

    TestSuite suite("BoundedQueue Tests");

    suite.addTest(std::make_unique<BoundedQueueBasicTest>());
    suite.addTest(std::make_unique<BoundedQueueUnlimitedTest>());
    suite.addTest(std::make_unique<BoundedQueueClearTest>());
    suite.addTest(std::make_unique<BoundedQueueThreadTest>());

    auto results = suite.runAll();
    suite.printResults(results);

    return suite.getFailureCount(results) > 0 ? 1 : 0;
}
