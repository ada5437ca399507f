#include <atomic>
#include <chrono>
#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

#include <terf/pipeline.hpp>

using namespace terf;

TEST(PipelineTest, QueueIsFifo) {
    auto token = std::make_shared<CancellationToken>();
    BoundedQueue<int> q(4, token);
    for (int i = 0; i < 4; ++i)
        EXPECT_TRUE(q.push(i));
    q.close();
    for (int i = 0; i < 4; ++i) {
        auto v = q.pop();
        ASSERT_TRUE(v.has_value());
        EXPECT_EQ(*v, i);
    }
    EXPECT_FALSE(q.pop().has_value());
    EXPECT_FALSE(q.push(9));
}

TEST(PipelineTest, ProducerConsumerThroughSmallQueue) {
    auto token = std::make_shared<CancellationToken>();
    BoundedQueue<int> q(1, token);
    std::vector<int> seen;
    {
        TaskGroup group(token);
        group.spawn([&] {
            for (int i = 0; i < 1000; ++i)
                ASSERT_TRUE(q.push(i));
            q.close();
        });
        group.spawn([&] {
            while (auto v = q.pop())
                seen.push_back(*v);
        });
        group.wait();
    }
    ASSERT_EQ(seen.size(), 1000u);
    for (int i = 0; i < 1000; ++i)
        EXPECT_EQ(seen[static_cast<std::size_t>(i)], i);
}

TEST(PipelineTest, CancelWakesBlockedPush) {
    auto token = std::make_shared<CancellationToken>();
    BoundedQueue<int> q(1, token);
    ASSERT_TRUE(q.push(1));
    std::atomic<bool> result{true};
    std::thread t([&] { result = q.push(2); });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    token->cancel();
    t.join();
    EXPECT_FALSE(result.load());
    EXPECT_FALSE(q.pop().has_value());
}

TEST(PipelineTest, CancelWakesBlockedPop) {
    auto token = std::make_shared<CancellationToken>();
    BoundedQueue<int> q(1, token);
    std::atomic<bool> got{true};
    std::thread t([&] { got = q.pop().has_value(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    token->cancel();
    t.join();
    EXPECT_FALSE(got.load());
}

TEST(PipelineTest, SubscribeAfterCancelRunsImmediately) {
    CancellationToken token;
    token.cancel();
    bool ran = false;
    token.subscribe([&] { ran = true; });
    EXPECT_TRUE(ran);
    EXPECT_TRUE(token.cancelled());
}

TEST(PipelineTest, FirstErrorCancelsGroup) {
    auto token = std::make_shared<CancellationToken>();
    BoundedQueue<int> q(1, token);
    TaskGroup group(token);
    // Blocks forever unless the failure below cancels the queue.
    group.spawn([&] {
        while (q.pop()) {
        }
    });
    group.spawn([] { throw std::runtime_error("boom"); });
    try {
        group.wait();
        FAIL() << "expected the task error";
    } catch (const std::runtime_error& e) {
        EXPECT_STREQ(e.what(), "boom");
    }
    EXPECT_TRUE(group.token()->cancelled());
}

TEST(PipelineTest, WaitWithoutErrors) {
    TaskGroup group;
    std::atomic<int> count{0};
    for (int i = 0; i < 8; ++i)
        group.spawn([&] { ++count; });
    EXPECT_NO_THROW(group.wait());
    EXPECT_EQ(count.load(), 8);
    EXPECT_FALSE(group.token()->cancelled());
}

TEST(PipelineTest, DefaultThreadCountIsPositive) { EXPECT_GE(default_thread_count(), 1u); }

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
