#include "../libtinythis/include/event_bus.hpp"
#include "../libtinythis/include/logger.hpp"
#include "../libtinythis/include/mailbox.hpp"
#include "../libtinythis/include/thread_pool.hpp"

#include <gtest/gtest.h>

#include <atomic>

using namespace tinythis;

namespace {

    struct Entry {
        LogLevel level;
        std::string message;
        std::string tag;
    };

    class CaptureSink final : public ILogSink {
    public:
        explicit CaptureSink(std::vector<Entry>& out) : out_(out) {}

        void log(const LogLevel level, const std::string_view message, const std::string_view tag) override {
            out_.push_back({level, std::string(message), std::string(tag)});
        }

    private:
        std::vector<Entry>& out_;
    };

    class LoggerTest : public ::testing::Test {
    protected:
        void SetUp() override { Logger::clear_sinks(); }
        void TearDown() override { Logger::clear_sinks(); }
    };

    struct Ping { int value; };
    struct Pong { std::string text; };

} // namespace

TEST_F(LoggerTest, FansOutToEverySink) {
    std::vector<Entry> first;
    std::vector<Entry> second;
    Logger::add_sink(std::make_unique<CaptureSink>(first));
    Logger::add_sink(std::make_unique<CaptureSink>(second));

    Logger::log(LogLevel::Warning, "disk almost full", "queue");
    Logger::log(LogLevel::Info, "hello");

    ASSERT_EQ(first.size(), 2u);
    ASSERT_EQ(second.size(), 2u);
    EXPECT_EQ(first[0].level, LogLevel::Warning);
    EXPECT_EQ(first[0].message, "disk almost full");
    EXPECT_EQ(first[0].tag, "queue");
    EXPECT_EQ(first[1].tag, "tinythis");
}

TEST_F(LoggerTest, NoneIsNeverEmitted) {
    std::vector<Entry> out;
    Logger::add_sink(std::make_unique<CaptureSink>(out));
    Logger::log(LogLevel::None, "silent");
    EXPECT_TRUE(out.empty());
}

TEST_F(LoggerTest, ClearSinksStopsDelivery) {
    std::vector<Entry> out;
    Logger::add_sink(std::make_unique<CaptureSink>(out));
    Logger::clear_sinks();
    Logger::log(LogLevel::Error, "lost");
    EXPECT_TRUE(out.empty());
}

TEST_F(LoggerTest, LevelNamesRoundTrip) {
    for (const auto level : {LogLevel::Debug, LogLevel::Info, LogLevel::Warning, LogLevel::Error, LogLevel::None}) {
        EXPECT_EQ(Logger::string_to_level(Logger::level_to_string(level)), level);
    }
    EXPECT_EQ(Logger::string_to_level("warning"), LogLevel::Warning);
    EXPECT_EQ(Logger::string_to_level("debug"), LogLevel::Debug);
    EXPECT_FALSE(Logger::string_to_level("verbose").has_value());
}

TEST(EventBus, DeliversByType) {
    EventBus bus;
    std::vector<int> pings;
    std::vector<std::string> pongs;
    bus.subscribe<Ping>([&pings](const Ping& p) { pings.push_back(p.value); });
    bus.subscribe<Ping>([&pings](const Ping& p) { pings.push_back(p.value * 10); });
    bus.subscribe<Pong>([&pongs](const Pong& p) { pongs.push_back(p.text); });

    bus.publish(Ping{1});
    bus.publish(Pong{"x"});

    EXPECT_EQ(pings, (std::vector<int>{1, 10}));
    EXPECT_EQ(pongs, (std::vector<std::string>{"x"}));
}

TEST(EventBus, PublishWithoutSubscribersIsANoOp) {
    EventBus bus;
    EXPECT_NO_THROW(bus.publish(Ping{3}));
}

TEST(EventBus, HandlerMayPublish) {
    EventBus bus;
    std::vector<std::string> seen;
    bus.subscribe<Ping>([&bus](const Ping& p) { bus.publish(Pong{std::to_string(p.value)}); });
    bus.subscribe<Pong>([&seen](const Pong& p) { seen.push_back(p.text); });

    bus.publish(Ping{7});
    EXPECT_EQ(seen, (std::vector<std::string>{"7"}));

    bus.clear();
    bus.publish(Ping{8});
    EXPECT_EQ(seen.size(), 1u);
}

TEST(EventBus, UnsubscribeRemovesOnlyThatHandler) {
    EventBus bus;
    std::vector<int> seen;
    const SubscriptionId first = bus.subscribe<Ping>([&seen](const Ping& p) { seen.push_back(p.value); });
    const SubscriptionId second = bus.subscribe<Ping>([&seen](const Ping& p) { seen.push_back(-p.value); });
    EXPECT_NE(first, second);

    bus.unsubscribe(first);
    bus.unsubscribe(first + second + 100);
    bus.publish(Ping{4});
    EXPECT_EQ(seen, (std::vector<int>{-4}));
}

TEST(Mailbox, PreservesOrder) {
    Mailbox<int> box;
    EXPECT_TRUE(box.empty());
    box.push(1);
    box.push(2);
    EXPECT_EQ(box.try_pop(), 1);
    EXPECT_EQ(box.wait_pop(std::chrono::milliseconds(10)), 2);
    EXPECT_FALSE(box.try_pop().has_value());
    EXPECT_FALSE(box.wait_pop(std::chrono::milliseconds(10)).has_value());
}

TEST(ThreadPool, RunsTasksAndReturnsResults) {
    ThreadPool pool(2);
    auto a = pool.enqueue([](const std::stop_token&) { return 21 * 2; });
    auto b = pool.enqueue([](const std::stop_token&) { return std::string("done"); });
    EXPECT_EQ(a.get(), 42);
    EXPECT_EQ(b.get(), "done");
    pool.wait_idle();
}

TEST(ThreadPool, ExceptionsReachTheFuture) {
    ThreadPool pool;
    auto f = pool.enqueue([](const std::stop_token&) -> int { throw std::runtime_error("boom"); });
    EXPECT_THROW(f.get(), std::runtime_error);
}

TEST(ThreadPool, StopReachesRunningTask) {
    std::atomic<bool> saw_stop{false};
    std::future<void> f;
    {
        ThreadPool pool;
        std::atomic<bool> running{false};
        f = pool.enqueue([&](const std::stop_token& st) {
            running = true;
            while (!st.stop_requested()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
            }
            saw_stop = true;
        });
        while (!running) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        pool.request_stop();
        EXPECT_THROW(pool.enqueue([](const std::stop_token&) {}), std::runtime_error);
    }
    EXPECT_TRUE(saw_stop);
    EXPECT_NO_THROW(f.get());
}

TEST(ThreadPool, StopDropsQueuedTasks) {
    ThreadPool pool(1, "test");
    std::atomic<bool> release{false};
    std::atomic<bool> running{false};
    auto first = pool.enqueue([&](const std::stop_token&) {
        running = true;
        while (!release) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    });
    auto second = pool.enqueue([](const std::stop_token&) {});
    while (!running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    EXPECT_EQ(pool.busy(), 2u);
    EXPECT_FALSE(pool.wait_idle_for(std::chrono::milliseconds(20)));
    EXPECT_EQ(pool.request_stop(), 1u);
    release = true;
    EXPECT_TRUE(pool.wait_idle_for(std::chrono::seconds(5)));
    EXPECT_EQ(pool.busy(), 0u);
    EXPECT_NO_THROW(first.get());
    // the dropped task's promise is destroyed unfulfilled
    EXPECT_THROW(second.get(), std::future_error);
}
