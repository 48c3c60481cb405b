#include "InProcessQueue.hpp"
#include "PosixMessageQueue.hpp"
#include "common/Errors.hpp"
#include "transport/coro/CoroTask.hpp"
#include "transport/coro/coroIoContext.hpp"

#include <gtest/gtest.h>

#include <unistd.h>

#include <chrono>
#include <thread>

using namespace takclient;
using namespace takclient::pipeline;
using takclient::transport::CoroIoContext;
using takclient::transport::Task;
using namespace std::chrono_literals;

namespace {

Task<void> get_once(IQueue<int>& queue, CoroIoContext& ctx, std::chrono::milliseconds timeout,
                    std::optional<int>& out, bool& finished) {
    out = co_await queue.get(ctx, timeout);
    finished = true;
}

Task<void> get_frame(PosixMessageQueue& queue, CoroIoContext& ctx, std::optional<message::DecodedFrame>& out) {
    out = co_await queue.get(ctx, 5s);
}

std::string unique_mq_name(const char* tag) {
    return std::string("/takclient_test_") + tag + "_" + std::to_string(::getpid());
}

} // namespace

TEST(InProcessQueue, FifoOrder) {
    InProcessQueue<int> q;
    q.put(1);
    q.put(2);
    q.put(3);
    EXPECT_EQ(q.size(), 3u);
    EXPECT_EQ(q.try_get(), 1);
    EXPECT_EQ(q.try_get(), 2);
    EXPECT_EQ(q.try_get(), 3);
    EXPECT_FALSE(q.try_get().has_value());
    EXPECT_TRUE(q.empty());
}

TEST(InProcessQueue, FullQueueDropsOldest) {
    InProcessQueue<int> q(2);
    EXPECT_FALSE(q.put(1));
    EXPECT_FALSE(q.put(2));
    EXPECT_TRUE(q.put(3));
    EXPECT_EQ(q.size(), 2u);
    EXPECT_EQ(q.try_get(), 2);
    EXPECT_EQ(q.try_get(), 3);
}

TEST(InProcessQueue, ZeroCapacityIsUnbounded) {
    InProcessQueue<int> q(0);
    for (int i = 0; i < 1000; ++i) EXPECT_FALSE(q.put(i));
    EXPECT_EQ(q.size(), 1000u);
    EXPECT_EQ(q.capacity(), 0u);
}

TEST(InProcessQueue, PopForTimesOutOnEmptyQueue) {
    InProcessQueue<int> q;
    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(q.pop_for(20ms).has_value());
    EXPECT_GE(std::chrono::steady_clock::now() - start, 15ms);
}

TEST(InProcessQueue, PopForWakesOnPut) {
    InProcessQueue<int> q;
    std::thread producer([&] {
        std::this_thread::sleep_for(10ms);
        q.put(42);
    });
    EXPECT_EQ(q.pop_for(5s), 42);
    producer.join();
}

TEST(InProcessQueue, ShutdownReleasesWaiters) {
    InProcessQueue<int> q;
    std::thread stopper([&] {
        std::this_thread::sleep_for(10ms);
        q.shutdown();
    });
    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(q.pop_for(5s).has_value());
    EXPECT_LT(std::chrono::steady_clock::now() - start, 4s);
    stopper.join();
}

TEST(QueueAwaitable, ReadyElementCompletesWithoutSuspending) {
    CoroIoContext ctx;
    InProcessQueue<int> q;
    q.put(7);
    std::optional<int> out;
    bool finished = false;
    auto task = get_once(q, ctx, 1s, out, finished);
    EXPECT_TRUE(finished);
    EXPECT_EQ(out, 7);
    EXPECT_EQ(ctx.pending_count(), 0u);
}

TEST(QueueAwaitable, TimesOutWithNullopt) {
    CoroIoContext ctx;
    InProcessQueue<int> q;
    std::optional<int> out{-1};
    bool finished = false;
    auto start = std::chrono::steady_clock::now();
    auto task = get_once(q, ctx, 30ms, out, finished);
    EXPECT_FALSE(finished);
    EXPECT_TRUE(ctx.run_until([&] { return task.done(); }));
    EXPECT_TRUE(finished);
    EXPECT_FALSE(out.has_value());
    EXPECT_GE(std::chrono::steady_clock::now() - start, 25ms);
}

TEST(QueueAwaitable, ResumesWhenAnotherThreadProduces) {
    CoroIoContext ctx;
    InProcessQueue<int> q;
    std::optional<int> out;
    bool finished = false;
    auto task = get_once(q, ctx, 5s, out, finished);
    std::thread producer([&] {
        std::this_thread::sleep_for(10ms);
        q.put(99);
    });
    EXPECT_TRUE(ctx.run_until([&] { return task.done(); }));
    producer.join();
    EXPECT_EQ(out, 99);
}

TEST(PosixMessageQueue, EventAndRawFramesSurviveTheQueue) {
    PosixMessageQueue q(unique_mq_name("roundtrip"), 4);
    auto ev = message::make_event("a-f-G-U-C", "unit-1", std::chrono::seconds(60), {1.5, -2.25, 10.0});
    ev.detail = "<contact callsign=\"ONE\"/>";
    EXPECT_FALSE(q.put(ev));
    EXPECT_FALSE(q.put(message::RawFrame{std::string("\xbf\x03" "abc", 5)}));
    EXPECT_EQ(q.size(), 2u);

    auto first = q.try_get();
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(std::holds_alternative<message::CotEvent>(*first));
    EXPECT_EQ(std::get<message::CotEvent>(*first), ev);

    auto second = q.try_get();
    ASSERT_TRUE(second.has_value());
    ASSERT_TRUE(std::holds_alternative<message::RawFrame>(*second));
    EXPECT_EQ(std::get<message::RawFrame>(*second).bytes, std::string("\xbf\x03" "abc", 5));

    EXPECT_FALSE(q.try_get().has_value());
}

TEST(PosixMessageQueue, FullQueueDropsOldest) {
    PosixMessageQueue q(unique_mq_name("drop"), 2);
    EXPECT_FALSE(q.put(message::RawFrame{"one"}));
    EXPECT_FALSE(q.put(message::RawFrame{"two"}));
    EXPECT_TRUE(q.put(message::RawFrame{"three"}));
    EXPECT_EQ(std::get<message::RawFrame>(*q.try_get()).bytes, "two");
    EXPECT_EQ(std::get<message::RawFrame>(*q.try_get()).bytes, "three");
}

TEST(PosixMessageQueue, OversizedFrameIsRejected) {
    PosixMessageQueue q(unique_mq_name("big"), 2, 64);
    EXPECT_THROW(q.put(message::RawFrame{std::string(200, 'x')}), ChannelIOError);
}

TEST(PosixMessageQueue, SecondHandleSharesMessages) {
    const auto name = unique_mq_name("shared");
    PosixMessageQueue producer(name, 4, 8192, true);
    PosixMessageQueue consumer(name, 4, 8192, false);
    producer.put(message::RawFrame{"hello"});
    auto got = consumer.try_get();
    ASSERT_TRUE(got.has_value());
    EXPECT_EQ(std::get<message::RawFrame>(*got).bytes, "hello");
}

TEST(PosixMessageQueue, AwaitableGetPollsTheQueue) {
    CoroIoContext ctx;
    PosixMessageQueue q(unique_mq_name("await"), 4);
    std::optional<message::DecodedFrame> out;
    auto task = get_frame(q, ctx, out);
    EXPECT_FALSE(task.done());
    q.put(message::RawFrame{"late"});
    EXPECT_TRUE(ctx.run_until([&] { return task.done(); }));
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(std::get<message::RawFrame>(*out).bytes, "late");
}
