#include "sweeper.h"
#include "cache.h"
#include <gtest/gtest.h>
#include <atomic>
#include <thread>
#include <vector>
#include <chrono>
#include <string>

using namespace std::chrono_literals;

// Helper sleep wrapper
static void short_wait(int ms = 300) {
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

// Records how often it was swept and pretends to remove one entry each time
class CountingCache {
public:
    std::size_t remove_expired() {
        calls_++;
        return 1;
    }
    std::size_t calls() const { return calls_.load(); }

private:
    std::atomic<std::size_t> calls_{0};
};

using StringCache = Cache<std::string, std::string>;

TEST(SweeperTest, RejectsNullCache) {
    EXPECT_THROW(Sweeper<StringCache>(nullptr, 100ms), std::invalid_argument);
}

TEST(SweeperTest, RejectsNonPositiveInterval) {
    auto cache = std::make_shared<StringCache>();
    EXPECT_THROW(Sweeper<StringCache>(cache, 0ms), std::invalid_argument);
    EXPECT_THROW(Sweeper<StringCache>(cache, -5ms), std::invalid_argument);
}

TEST(SweeperTest, DoesNothingUntilStarted) {
    auto cache = std::make_shared<CountingCache>();
    Sweeper<CountingCache> sweeper(cache, 10ms);
    short_wait(100);

    EXPECT_FALSE(sweeper.running());
    EXPECT_EQ(cache->calls(), 0u);
}

TEST(SweeperTest, SweepsPeriodically) {
    auto cache = std::make_shared<CountingCache>();
    Sweeper<CountingCache> sweeper(cache, 20ms);
    sweeper.start();
    EXPECT_TRUE(sweeper.running());

    short_wait();
    sweeper.stop();

    EXPECT_GE(cache->calls(), 3u);
    EXPECT_EQ(sweeper.sweeps(), cache->calls());
    EXPECT_EQ(sweeper.removed(), cache->calls());
}

TEST(SweeperTest, NoSweepsAfterStop) {
    auto cache = std::make_shared<CountingCache>();
    Sweeper<CountingCache> sweeper(cache, 10ms);
    sweeper.start();
    short_wait(100);
    sweeper.stop();
    EXPECT_FALSE(sweeper.running());

    auto calls = cache->calls();
    short_wait(100);
    EXPECT_EQ(cache->calls(), calls);
}

TEST(SweeperTest, StopReturnsPromptlyWithLongInterval) {
    auto cache = std::make_shared<CountingCache>();
    Sweeper<CountingCache> sweeper(cache, std::chrono::hours(1));
    sweeper.start();

    auto begin = std::chrono::steady_clock::now();
    sweeper.stop();
    auto elapsed = std::chrono::steady_clock::now() - begin;

    EXPECT_LT(elapsed, 1s);
    EXPECT_EQ(cache->calls(), 0u);
}

TEST(SweeperTest, StartAndStopAreIdempotent) {
    auto cache = std::make_shared<CountingCache>();
    Sweeper<CountingCache> sweeper(cache, 1h);
    sweeper.start();
    sweeper.start();
    EXPECT_TRUE(sweeper.running());

    sweeper.stop();
    sweeper.stop();
    EXPECT_FALSE(sweeper.running());

    // Can be restarted after a stop
    sweeper.start();
    EXPECT_TRUE(sweeper.running());
}

TEST(SweeperTest, SweepNowRemovesExpiredEntries) {
    auto cache = std::make_shared<StringCache>();
    cache->set("A", "Apple", 1ms);
    cache->set("B", "Banana");
    short_wait(20);

    Sweeper<StringCache> sweeper(cache, 1h);
    EXPECT_EQ(sweeper.sweep_now(), 1u);
    EXPECT_EQ(sweeper.sweep_now(), 0u);

    EXPECT_EQ(sweeper.sweeps(), 2u);
    EXPECT_EQ(sweeper.removed(), 1u);
    EXPECT_FALSE(cache->contains("A"));
    EXPECT_TRUE(cache->contains("B"));
}

TEST(SweeperTest, BackgroundSweepClearsExpiredEntries) {
    auto cache = std::make_shared<StringCache>(std::chrono::milliseconds(20));
    for (int i = 0; i < 10; i++) {
        cache->set("Key" + std::to_string(i), "Value" + std::to_string(i));
    }
    cache->set("keep", "forever", std::chrono::hours(1));

    Sweeper<StringCache> sweeper(cache, 50ms);
    sweeper.start();
    short_wait();
    sweeper.stop();

    EXPECT_EQ(cache->size(), 1u);
    EXPECT_EQ(cache->get("keep").value(), "forever");
    EXPECT_EQ(sweeper.removed(), 10u);
}

TEST(SweeperTest, CacheOutlivesCallerHandle) {
    auto cache = std::make_shared<StringCache>(std::chrono::milliseconds(1));
    Sweeper<StringCache> sweeper(cache, 10ms);
    cache->set("A", "Apple");
    cache.reset();

    sweeper.start();
    short_wait(100);
    sweeper.stop();

    EXPECT_GE(sweeper.removed(), 1u);
}

TEST(SweeperTest, ConcurrentStartStopIsSafe) {
    auto cache = std::make_shared<CountingCache>();
    Sweeper<CountingCache> sweeper(cache, 1ms);

    auto toggle = [&sweeper](bool start_first) {
        for (int i = 0; i < 200; i++) {
            if ((i % 2 == 0) == start_first) {
                sweeper.start();
            } else {
                sweeper.stop();
            }
        }
    };

    std::vector<std::thread> threads;
    threads.emplace_back(toggle, true);
    threads.emplace_back(toggle, false);
    threads.emplace_back(toggle, true);
    for (auto& t : threads) t.join();

    sweeper.stop();
    EXPECT_FALSE(sweeper.running());

    sweeper.start();
    EXPECT_TRUE(sweeper.running());
    sweeper.stop();
}
