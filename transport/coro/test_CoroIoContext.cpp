#include "CoroChannelAdapter.hpp"
#include "CoroTask.hpp"
#include "coroIoContext.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <deque>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <vector>

using namespace takclient::transport;
using namespace std::chrono_literals;

namespace {

/** In-memory channel: reads would-block until bytes are queued; writes accept up to `write_quota`. */
class FakeChannel : public IChannelReader, public IChannelWriter {
public:
    bool try_read(void* buffer, size_t size, size_t& bytes_read, std::error_code& error) override {
        bytes_read = 0;
        if (read_error) {
            error = read_error;
            return true;
        }
        if (inbound.empty()) return false;
        size_t n = std::min(size, inbound.size());
        std::copy(inbound.begin(), inbound.begin() + static_cast<std::ptrdiff_t>(n), static_cast<char*>(buffer));
        inbound.erase(inbound.begin(), inbound.begin() + static_cast<std::ptrdiff_t>(n));
        bytes_read = n;
        error.clear();
        return true;
    }
    bool try_write(const void* buffer, size_t size, size_t& bytes_written, std::error_code& error) override {
        bytes_written = 0;
        if (write_quota == 0) return false;
        size_t n = std::min(size, write_quota);
        outbound.append(static_cast<const char*>(buffer), n);
        write_quota -= n;
        bytes_written = n;
        error.clear();
        return true;
    }
    void close() override { ++close_calls; }
    bool is_open() const override { return close_calls == 0; }
    int get_handle() const override { return -1; }
    std::string local_endpoint() const override { return "fake"; }
    std::string remote_endpoint() const override { return "fake"; }
    std::string socket_type() const override { return "fake"; }

    std::deque<char> inbound;
    std::string outbound;
    size_t write_quota{SIZE_MAX};
    std::error_code read_error;
    int close_calls{0};
};

Task<void> sleeper(CoroIoContext& ctx, std::chrono::milliseconds d, std::vector<int>& order, int id) {
    co_await ctx.sleep_for(d);
    order.push_back(id);
}

Task<size_t> read_into(std::shared_ptr<CoroChannelAdapter> adapter, char* buf, size_t size) {
    co_return co_await adapter->async_read(buf, size);
}

Task<size_t> write_all(std::shared_ptr<CoroChannelAdapter> adapter, std::string data) {
    size_t offset = 0;
    while (offset < data.size()) {
        offset += co_await adapter->async_write(data.data() + offset, data.size() - offset);
    }
    co_return offset;
}

Task<void> throws_after_sleep(CoroIoContext& ctx) {
    co_await ctx.sleep_for(1ms);
    throw std::runtime_error("boom");
}

} // namespace

TEST(CoroIoContext, TimersResumeInDeadlineOrder) {
    auto ctx = std::make_shared<CoroIoContext>();
    std::vector<int> order;
    auto slow = sleeper(*ctx, 30ms, order, 2);
    auto fast = sleeper(*ctx, 5ms, order, 1);
    EXPECT_TRUE(ctx->run_until([&] { return slow.done() && fast.done(); }));
    EXPECT_EQ(order, (std::vector<int>{1, 2}));
    EXPECT_EQ(ctx->pending_count(), 0u);
    EXPECT_GE(ctx->get_total_operations_processed(), 2u);
}

TEST(CoroIoContext, StopFromAnotherThreadReturnsFalse) {
    auto ctx = std::make_shared<CoroIoContext>();
    std::vector<int> order;
    auto task = sleeper(*ctx, 10s, order, 1);
    std::thread stopper([&] {
        std::this_thread::sleep_for(20ms);
        ctx->stop();
    });
    EXPECT_FALSE(ctx->run_until([&] { return task.done(); }));
    stopper.join();
    EXPECT_TRUE(ctx->stopped());
    EXPECT_FALSE(task.done());
    ctx->cancel_pending();
    EXPECT_EQ(ctx->pending_count(), 0u);

    ctx->restart();
    EXPECT_FALSE(ctx->stopped());
}

TEST(CoroIoContext, RunReturnsWhenNoWorkIsLeft) {
    auto ctx = std::make_shared<CoroIoContext>();
    std::vector<int> order;
    auto task = sleeper(*ctx, 5ms, order, 7);
    ctx->run();
    EXPECT_TRUE(task.done());
    EXPECT_EQ(order, std::vector<int>{7});
}

TEST(CoroIoContext, WorkGuardKeepsRunAlive) {
    auto ctx = std::make_shared<CoroIoContext>();
    auto guard = std::make_unique<CoroIoContext::WorkGuard>(ctx->make_work_guard());
    std::thread releaser([&] {
        std::this_thread::sleep_for(30ms);
        guard.reset();
    });
    auto start = std::chrono::steady_clock::now();
    ctx->run();
    EXPECT_GE(std::chrono::steady_clock::now() - start, 25ms);
    releaser.join();
}

TEST(CoroIoContext, TaskCapturesException) {
    auto ctx = std::make_shared<CoroIoContext>();
    auto task = throws_after_sleep(*ctx);
    EXPECT_TRUE(ctx->run_until([&] { return task.done(); }));
    EXPECT_TRUE(task.failed());
    EXPECT_THROW(task.rethrow_if_failed(), std::runtime_error);
}

TEST(CoroIoContext, StatisticsByCategory) {
    auto ctx = std::make_shared<CoroIoContext>();
    std::vector<int> order;
    auto task = sleeper(*ctx, 2ms, order, 1);
    ctx->run_until([&] { return task.done(); });
    auto histograms = ctx->get_completion_attempt_histograms_by_category();
    size_t timers = 0;
    for (auto count : histograms[static_cast<size_t>(CoroIoContext::PendingOpCategory::Timer)]) timers += count;
    EXPECT_EQ(timers, 1u);
    EXPECT_NE(ctx->format_detailed_statistics().find("Timer"), std::string::npos);
    ctx->reset_statistics();
    EXPECT_EQ(ctx->get_total_operations_processed(), 0u);
}

TEST(CoroChannelAdapter, ReadCompletesImmediatelyWhenDataIsBuffered) {
    auto ctx = std::make_shared<CoroIoContext>();
    auto fake = std::make_shared<FakeChannel>();
    fake->inbound.assign({'a', 'b', 'c'});
    auto adapter = std::make_shared<CoroChannelAdapter>(ChannelPair{fake, fake, "fake"}, ctx);
    char buf[8];
    auto task = read_into(adapter, buf, sizeof(buf));
    ASSERT_TRUE(task.done());
    EXPECT_EQ(task.get_result(), 3u);
    EXPECT_EQ(std::string(buf, 3), "abc");
    EXPECT_EQ(ctx->pending_count(), 0u);
}

TEST(CoroChannelAdapter, ReadSuspendsUntilDataArrives) {
    auto ctx = std::make_shared<CoroIoContext>();
    auto fake = std::make_shared<FakeChannel>();
    auto adapter = std::make_shared<CoroChannelAdapter>(ChannelPair{fake, fake, "fake"}, ctx);
    char buf[8];
    auto task = read_into(adapter, buf, sizeof(buf));
    EXPECT_FALSE(task.done());
    EXPECT_EQ(ctx->pending_count(), 1u);
    fake->inbound.assign({'x', 'y'});
    EXPECT_TRUE(ctx->run_until([&] { return task.done(); }));
    EXPECT_EQ(task.get_result(), 2u);
}

TEST(CoroChannelAdapter, ReadErrorSurfacesAsSystemError) {
    auto ctx = std::make_shared<CoroIoContext>();
    auto fake = std::make_shared<FakeChannel>();
    fake->read_error = std::make_error_code(std::errc::connection_reset);
    auto adapter = std::make_shared<CoroChannelAdapter>(ChannelPair{fake, fake, "fake"}, ctx);
    char buf[8];
    auto task = read_into(adapter, buf, sizeof(buf));
    ASSERT_TRUE(task.done());
    try {
        task.get_result();
        FAIL() << "expected std::system_error";
    } catch (const std::system_error& e) {
        EXPECT_EQ(e.code(), std::make_error_code(std::errc::connection_reset));
    }
}

TEST(CoroChannelAdapter, PartialWritesAreResumed) {
    auto ctx = std::make_shared<CoroIoContext>();
    auto fake = std::make_shared<FakeChannel>();
    fake->write_quota = 4;
    auto adapter = std::make_shared<CoroChannelAdapter>(ChannelPair{nullptr, fake, "fake"}, ctx);
    auto task = write_all(adapter, "0123456789");
    EXPECT_FALSE(task.done());
    EXPECT_EQ(fake->outbound, "0123");
    fake->write_quota = SIZE_MAX;
    EXPECT_TRUE(ctx->run_until([&] { return task.done(); }));
    EXPECT_EQ(task.get_result(), 10u);
    EXPECT_EQ(fake->outbound, "0123456789");
    EXPECT_FALSE(adapter->can_read());
    EXPECT_TRUE(adapter->can_write());
}

TEST(CoroChannelAdapter, CloseClosesSharedEndOnce) {
    auto ctx = std::make_shared<CoroIoContext>();
    auto fake = std::make_shared<FakeChannel>();
    auto adapter = std::make_shared<CoroChannelAdapter>(ChannelPair{fake, fake, "fake"}, ctx);
    adapter->close();
    EXPECT_EQ(fake->close_calls, 1);
}
