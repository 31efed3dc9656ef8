#include <gtest/gtest.h>
#include "../libmender/include/event_bus.hpp"
#include "../libmender/include/thread_pool.hpp"
#include <atomic>
#include <chrono>
#include <latch>
#include <string>

using namespace mender;

TEST(ThreadPoolTest, RunsEveryTask)
{
    ThreadPool pool(4);
    EXPECT_EQ(pool.size(), 4u);

    std::vector<std::future<int>> futures;
    for (int i = 0; i < 100; ++i) {
        futures.push_back(pool.enqueue([i](const std::stop_token&) { return i * 2; }));
    }
    int sum = 0;
    for (auto& f : futures) sum += f.get();
    EXPECT_EQ(sum, 9900);

    pool.wait_idle();
    EXPECT_FALSE(pool.stop_requested());
}

TEST(ThreadPoolTest, ExceptionsReachTheFuture)
{
    ThreadPool pool(1);
    auto f = pool.enqueue([](const std::stop_token&) -> int { throw std::runtime_error("boom"); });
    EXPECT_THROW(f.get(), std::runtime_error);
}

TEST(ThreadPoolTest, StopDiscardsQueuedTasksAndSignalsRunningOnes)
{
    ThreadPool pool(1);
    std::latch started(1);
    std::atomic<bool> saw_stop{false};

    auto running = pool.enqueue([&](const std::stop_token& st) {
        started.count_down();
        while (!st.stop_requested()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        saw_stop = true;
    });
    started.wait();

    std::vector<std::future<void>> queued;
    for (int i = 0; i < 5; ++i) {
        queued.push_back(pool.enqueue([](const std::stop_token&) {}));
    }
    pool.request_stop();

    running.get();
    EXPECT_TRUE(saw_stop.load());
    for (auto& f : queued) {
        EXPECT_THROW(f.get(), std::future_error);
    }
    EXPECT_TRUE(pool.stop_requested());
    EXPECT_THROW(pool.enqueue([](const std::stop_token&) {}), std::runtime_error);
}

namespace {
    struct Ping { int value = 0; };
    struct Pong { std::string text; };
}

TEST(EventBusTest, DeliversByEventType)
{
    EventBus bus;
    int pings = 0;
    std::string pongs;
    bus.subscribe<Ping>([&](const Ping& p) { pings += p.value; });
    bus.subscribe<Ping>([&](const Ping& p) { pings += p.value * 10; });
    bus.subscribe<Pong>([&](const Pong& p) { pongs += p.text; });

    bus.publish(Ping{2});
    bus.publish(Pong{"ok"});

    EXPECT_EQ(pings, 22);
    EXPECT_EQ(pongs, "ok");
    EXPECT_EQ(bus.subscriber_count<Ping>(), 2u);
}

TEST(EventBusTest, PublishWithoutSubscribersIsANoOp)
{
    const EventBus bus;
    bus.publish(Ping{1});
    EXPECT_EQ(bus.subscriber_count<Pong>(), 0u);
}
