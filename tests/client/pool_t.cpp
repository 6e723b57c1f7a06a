#include "../../src/client/pool.hxx"
#include "client_env.h"
#include <atomic>
#include <boost/optional.hpp>
#include <gtest/gtest.h>
#include <thread>
#include <vector>

using namespace ledger;

static std::atomic<uint64_t> test_int{ 0 };
static std::atomic<uint64_t> last_destroyed{ 0 };

static const auto no_wait = std::chrono::milliseconds(0);
static const auto long_wait = std::chrono::seconds(10);

static std::shared_ptr<pool<uint64_t>>
create_pool(size_t size)
{
    return std::make_shared<pool<uint64_t>>(
      size, [&] { return ++test_int; }, [&](uint64_t& t) { last_destroyed.store(t); });
}

TEST(PoolTests, SimpleGet)
{
    auto pool = create_pool(1);
    ASSERT_EQ(1, pool->available());
    ASSERT_EQ(0, pool->size());
    auto i = pool->try_get(no_wait);
    ASSERT_TRUE(i);
    ASSERT_TRUE(*i > 0);
    ASSERT_EQ(0, pool->available());
    ASSERT_EQ(0, pool->size());
}

TEST(PoolTests, GetTimesOutWhenNoPermits)
{
    auto pool = create_pool(1);
    auto i = pool->try_get(no_wait);
    ASSERT_TRUE(i);
    auto start = std::chrono::steady_clock::now();
    ASSERT_FALSE(pool->try_get(std::chrono::milliseconds(20)));
    ASSERT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(20));
}

TEST(PoolTests, ZeroSizePoolNeverHandsOut)
{
    auto pool = create_pool(0);
    ASSERT_FALSE(pool->try_get(no_wait));
    ASSERT_EQ(0, pool->available());
}

TEST(PoolTests, WillCallDestroyFnOnClose)
{
    uint64_t t1;
    {
        auto pool = create_pool(1);
        auto i = pool->try_get(no_wait);
        t1 = *i;
        pool->release(t1, true);
    }
    ASSERT_EQ(last_destroyed.load(), t1);
}

TEST(PoolTests, SimpleGetAndRelease)
{
    auto pool = create_pool(1);
    auto i = pool->try_get(no_wait);
    pool->release(*i, true);
    ASSERT_EQ(1, pool->available());
    ASSERT_EQ(1, pool->size());
    auto j = pool->try_get(no_wait);
    ASSERT_EQ(*i, *j);
    ASSERT_EQ(0, pool->available());
    ASSERT_EQ(0, pool->size());
    pool->release(*j, true);
}

TEST(PoolTests, ForceNewSkipsIdle)
{
    auto pool = create_pool(2);
    auto i = pool->try_get(no_wait);
    pool->release(*i, true);
    auto j = pool->try_get(no_wait, true);
    ASSERT_NE(*i, *j);
    ASSERT_EQ(1, pool->size());
    pool->release(*j, true);
    ASSERT_EQ(2, pool->size());
}

TEST(PoolTests, UnusableObjectsAreDiscarded)
{
    auto pool = create_pool(1);
    last_destroyed = 0;
    auto i = pool->try_get(no_wait);
    pool->release(*i, false);
    ASSERT_EQ(1, pool->available());
    ASSERT_EQ(0, pool->size());
    ASSERT_EQ(0, last_destroyed.load());
    auto j = pool->try_get(no_wait);
    ASSERT_NE(*i, *j);
    pool->release(*j, true);
}

TEST(PoolTests, FailedCreateReturnsPermit)
{
    pool<uint64_t> p(
      1, []() -> uint64_t { throw std::runtime_error("cannot create"); }, [](uint64_t&) {});
    ASSERT_THROW(static_cast<void>(p.try_get(no_wait)), std::runtime_error);
    ASSERT_EQ(1, p.available());
    ASSERT_THROW(static_cast<void>(p.try_get(no_wait)), std::runtime_error);
    ASSERT_EQ(1, p.available());
}

TEST(PoolTests, ReleaseAfterCloseDestroys)
{
    auto pool = create_pool(1);
    auto i = pool->try_get(no_wait);
    pool->close();
    ASSERT_TRUE(pool->is_closed());
    pool->release(*i, true);
    ASSERT_EQ(*i, last_destroyed.load());
    ASSERT_EQ(0, pool->size());
}

TEST(PoolTests, GetWillWait)
{
    auto pool = create_pool(2);
    auto i = pool->try_get(no_wait);
    auto j = pool->try_get(no_wait);
    std::atomic<uint64_t> thr_get(0);
    std::thread thr = std::thread([&]() {
        auto k = pool->try_get(long_wait);
        if (k) {
            thr_get = *k;
        }
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    ASSERT_EQ(0, thr_get.load());
    ASSERT_EQ(0, pool->available());
    // ok, now release one so the thread can run
    pool->release(*i, true);
    if (thr.joinable()) {
        client_log->trace("joining...");
        thr.join();
    }
    ASSERT_EQ(*i, thr_get.load());
    ASSERT_EQ(0, pool->available());
    pool->release(*i, true);
    pool->release(*j, true);
    ASSERT_EQ(2, pool->available());
    ASSERT_EQ(2, pool->size());
}

TEST(PoolTests, MaximumTimeoutWaitsForRelease)
{
    auto pool = create_pool(1);
    auto i = pool->try_get(no_wait);
    ASSERT_TRUE(i);
    std::thread releaser([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        pool->release(*i, true);
    });
    auto start = std::chrono::steady_clock::now();
    auto j = pool->try_get(std::chrono::milliseconds::max());
    auto waited = std::chrono::steady_clock::now() - start;
    releaser.join();
    ASSERT_TRUE(j);
    ASSERT_EQ(*i, *j);
    ASSERT_GE(waited, std::chrono::milliseconds(40));
    pool->release(*j, true);
}

TEST(PoolTests, CheckedOutNeverExceedsCapacity)
{
    const size_t capacity = 3;
    auto pool = create_pool(capacity);
    std::atomic<size_t> checked_out{ 0 };
    std::atomic<size_t> max_checked_out{ 0 };
    std::atomic<size_t> timeouts{ 0 };
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; t++) {
        threads.emplace_back([&]() {
            for (int n = 0; n < 50; n++) {
                auto item = pool->try_get(long_wait);
                if (!item) {
                    ++timeouts;
                    continue;
                }
                auto now = ++checked_out;
                auto seen = max_checked_out.load();
                while (now > seen && !max_checked_out.compare_exchange_weak(seen, now)) {
                }
                std::this_thread::sleep_for(std::chrono::microseconds(100));
                --checked_out;
                pool->release(*item, n % 5 != 0);
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    ASSERT_EQ(0, timeouts.load());
    ASSERT_LE(max_checked_out.load(), capacity);
    ASSERT_EQ(capacity, pool->available());
    ASSERT_LE(pool->size(), capacity);
}

TEST(PoolTests, EventCounterTracksEvents)
{
    auto pool = create_pool(1);
    pool_event_counter<uint64_t> counter;
    pool->set_event_handler([&counter](pool_event e, const uint64_t& t) { counter.handler(e, t); });
    auto i = pool->try_get(no_wait);
    pool->release(*i, true);
    auto j = pool->try_get(no_wait);
    pool->release(*j, false);
    ASSERT_EQ(1, counter.create.load());
    ASSERT_EQ(1, counter.reuse.load());
    ASSERT_EQ(1, counter.add.load());
    ASSERT_EQ(1, counter.discard.load());
    ASSERT_EQ(0, counter.destroy.load());
}

int
main(int argc, char* argv[])
{
    testing::InitGoogleTest(&argc, argv);
    testing::AddGlobalTestEnvironment(new ClientTestEnvironment());
    return RUN_ALL_TESTS();
}
