#include <gtest/gtest.h>

#include "framestream/display_loop.hpp"
#include "framestream/handoff_queue.hpp"
#include "framestream/test_pattern.hpp"

#include <atomic>
#include <thread>

namespace framestream {
namespace {

TEST(HandoffQueueTest, FullQueueRejectsWithoutBlocking) {
    const size_t capacity = 4;
    HandoffQueue<int> queue(capacity);

    int full_signals = 0;
    for (int i = 0; i < static_cast<int>(capacity) + 1; ++i) {
        int value = i;
        if (!queue.try_enqueue(std::move(value))) {
            full_signals++;
        }
    }
    EXPECT_GE(full_signals, 1);

    std::vector<int> drained;
    EXPECT_EQ(queue.drain(drained), capacity);
    EXPECT_LE(drained.size(), capacity);
    EXPECT_EQ(drained, (std::vector<int>{0, 1, 2, 3}));
}

TEST(HandoffQueueTest, DrainOnEmptyReturnsNothing) {
    HandoffQueue<int> queue(2);
    std::vector<int> drained;
    EXPECT_EQ(queue.drain(drained), 0u);
    EXPECT_TRUE(drained.empty());
}

TEST(HandoffQueueTest, WrapsAroundAfterDrain) {
    HandoffQueue<int> queue(2);
    std::vector<int> drained;
    for (int round = 0; round < 5; ++round) {
        EXPECT_TRUE(queue.try_enqueue(round * 10));
        EXPECT_TRUE(queue.try_enqueue(round * 10 + 1));
        EXPECT_FALSE(queue.try_enqueue(99));
        drained.clear();
        EXPECT_EQ(queue.drain(drained), 2u);
        EXPECT_EQ(drained, (std::vector<int>{round * 10, round * 10 + 1}));
    }
}

TEST(HandoffQueueTest, ZeroCapacityIsRejected) {
    EXPECT_THROW(HandoffQueue<int>(0), std::invalid_argument);
}

TEST(HandoffQueueTest, SingleProducerSingleConsumerKeepsOrder) {
    HandoffQueue<int> queue(16);
    const int total = 100000;
    std::atomic<bool> done{false};
    std::vector<int> received;
    received.reserve(total);

    std::thread consumer([&]() {
        std::vector<int> batch;
        while (!done.load() || !batch.empty()) {
            batch.clear();
            queue.drain(batch);
            received.insert(received.end(), batch.begin(), batch.end());
            if (batch.empty()) {
                std::this_thread::yield();
            }
        }
    });

    int rejected = 0;
    for (int i = 0; i < total; ++i) {
        int value = i;
        if (!queue.try_enqueue(std::move(value))) {
            rejected++;
        }
    }
    done.store(true);
    consumer.join();

    std::vector<int> rest;
    queue.drain(rest);
    received.insert(received.end(), rest.begin(), rest.end());

    EXPECT_EQ(static_cast<int>(received.size()) + rejected, total);
    for (size_t i = 1; i < received.size(); ++i) {
        ASSERT_LT(received[i - 1], received[i]);
    }
}

TEST(CoalesceTest, KeepsLatestImagePerSource) {
    std::vector<DisplayItem> items;
    for (uint32_t frame = 0; frame < 3; ++frame) {
        items.push_back({"a", make_test_pattern(2, 2, 1, frame)});
    }
    items.push_back({"b", make_test_pattern(2, 2, 1, 42)});

    auto latest = coalesce_latest(std::move(items));
    ASSERT_EQ(latest.size(), 2u);
    EXPECT_EQ(latest["a"].data, make_test_pattern(2, 2, 1, 2).data);
    EXPECT_EQ(latest["b"].data, make_test_pattern(2, 2, 1, 42).data);
}

class RecordingSink : public FrameSink {
public:
    void show(const std::string& source_id, const Image& image) override {
        shown.emplace_back(source_id, image.shape);
    }

    std::vector<std::pair<std::string, std::vector<int>>> shown;
};

TEST(DisplayLoopTest, RefreshShowsOneFramePerSource) {
    DisplayQueue queue(8);
    RecordingSink sink;
    DisplayLoop loop(queue, sink, std::chrono::milliseconds(1));

    EXPECT_EQ(loop.refresh_once(), 0u);

    for (uint32_t frame = 0; frame < 3; ++frame) {
        EXPECT_TRUE(queue.try_enqueue(DisplayItem{"cam1", make_test_pattern(4, 2, 3, frame)}));
    }
    EXPECT_TRUE(queue.try_enqueue(DisplayItem{"cam2", make_test_pattern(2, 2, 1, 0)}));

    EXPECT_EQ(loop.refresh_once(), 2u);
    ASSERT_EQ(sink.shown.size(), 2u);
    EXPECT_EQ(sink.shown[0].first, "cam1");
    EXPECT_EQ(sink.shown[0].second, (std::vector<int>{2, 4, 3}));
    EXPECT_EQ(sink.shown[1].first, "cam2");
    EXPECT_EQ(loop.shown_count(), 2u);
    EXPECT_EQ(loop.coalesced_count(), 2u);
}

TEST(DisplayLoopTest, RunReturnsOnStop) {
    DisplayQueue queue(2);
    RecordingSink sink;
    DisplayLoop loop(queue, sink, std::chrono::milliseconds(1));
    StopToken stop;

    std::thread render([&]() { loop.run(stop); });
    EXPECT_TRUE(queue.try_enqueue(DisplayItem{"cam", make_test_pattern(2, 2, 1, 0)}));
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    stop.request_stop();
    render.join();

    EXPECT_EQ(loop.shown_count(), 1u);
}

} // namespace
} // namespace framestream
