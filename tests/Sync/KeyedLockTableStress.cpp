/// @file KeyedLockTableStress.cpp
/// @brief Concurrency stress tests for KeyLock::Sync::KeyedLockTable.

#include <KeyLock/Sync/KeyedLockTable.hpp>

#include <atomic>
#include <catch2/catch_test_macros.hpp>
#include <latch>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace KeyLock::Sync;

namespace
{
    constexpr int kThreadCount = 1000;

    template<typename TBody>
    void RunThreads(int count, TBody&& body)
    {
        std::vector<std::thread> threads;
        threads.reserve(static_cast<std::size_t>(count));
        for (int i = 0; i < count; ++i)
        {
            threads.emplace_back([&body, i] { body(i); });
        }
        for (auto& thread: threads)
        {
            thread.join();
        }
    }
}// namespace

TEST_CASE("KeyedLockTable counts to a thousand under contention", "[Sync][KeyedLockTable][Stress]")
{
    KeyedLockTable<std::string, int> table(CleanupPolicy::RetainAfterUse);
    std::atomic<int>                 failures {0};

    RunThreads(kThreadCount, [&](int) {
        auto result = table.WithLock("f", [] { return 0; }, [](int& value) { ++value; });
        if (!result)
        {
            failures.fetch_add(1, std::memory_order_relaxed);
        }
    });

    REQUIRE(failures.load() == 0);
    auto total = table.WithLock("f", [] { return 0; }, [](int& value) { return value; });
    REQUIRE(total.has_value());
    CHECK(*total == kThreadCount);
}

TEST_CASE("KeyedLockTable AutoCleanup leaves nothing behind after contention", "[Sync][KeyedLockTable][Stress]")
{
    KeyedLockTable<std::string, int> table(CleanupPolicy::AutoCleanup);
    std::atomic<int>                 failures {0};

    RunThreads(kThreadCount, [&](int) {
        auto result = table.WithLock("f", [] { return 0; }, [](int& value) { ++value; });
        if (!result)
        {
            failures.fetch_add(1, std::memory_order_relaxed);
        }
    });

    REQUIRE(failures.load() == 0);
    CHECK(table.Size() == 0U);

    // The entry is gone, so a fresh initializer has to run.
    CHECK_THROWS_AS(table.WithLock("f", []() -> int { throw std::runtime_error("initializer ran"); }, [](int&) {}),
                    std::runtime_error);
    CHECK_FALSE(table.Contains("f"));
}

TEST_CASE("KeyedLockTable runs the initializer once under a creation race", "[Sync][KeyedLockTable][Stress]")
{
    constexpr int kRacers = 64;

    KeyedLockTable<std::string, int> table(CleanupPolicy::RetainAfterUse);
    std::atomic<int>                 initializations {0};
    std::atomic<int>                 failures {0};
    std::vector<const int*>          seen(kRacers, nullptr);
    std::latch                       start {kRacers};

    RunThreads(kRacers, [&](int index) {
        start.arrive_and_wait();
        auto guard = table.Acquire("race", [&] {
            initializations.fetch_add(1, std::memory_order_relaxed);
            return 0;
        });
        if (!guard)
        {
            failures.fetch_add(1, std::memory_order_relaxed);
            return;
        }
        seen[static_cast<std::size_t>(index)] = &guard->Get();
    });

    REQUIRE(failures.load() == 0);
    CHECK(initializations.load() == 1);
    for (const int* address: seen)
    {
        CHECK(address == seen.front());
    }
}

TEST_CASE("KeyedLockTable admits one holder per key at a time", "[Sync][KeyedLockTable][Stress]")
{
    constexpr int kThreads    = 32;
    constexpr int kIterations = 200;

    for (CleanupPolicy policy: {CleanupPolicy::RetainAfterUse, CleanupPolicy::AutoCleanup})
    {
        KeyedLockTable<int, int> table(policy);
        std::atomic<int>         inside[4] {};
        std::atomic<bool>        overlapped {false};
        std::atomic<int>         failures {0};

        RunThreads(kThreads, [&](int index) {
            for (int i = 0; i < kIterations; ++i)
            {
                const int key    = (index + i) % 4;
                auto      result = table.WithLock(key, [] { return 0; }, [&](int& value) {
                    if (inside[key].fetch_add(1) != 0)
                    {
                        overlapped.store(true);
                    }
                    ++value;
                    inside[key].fetch_sub(1);
                });
                if (!result)
                {
                    failures.fetch_add(1, std::memory_order_relaxed);
                }
            }
        });

        CHECK(failures.load() == 0);
        CHECK_FALSE(overlapped.load());
        if (policy == CleanupPolicy::AutoCleanup)
        {
            CHECK(table.Size() == 0U);
        }
        else
        {
            int total = 0;
            for (int key = 0; key < 4; ++key)
            {
                auto value = table.WithLock(key, [] { return 0; }, [](int& v) { return v; });
                REQUIRE(value.has_value());
                total += *value;
            }
            CHECK(total == kThreads * kIterations);
        }
    }
}

TEST_CASE("KeyedLockTable TryRemove never waits on a held key", "[Sync][KeyedLockTable][Stress]")
{
    KeyedLockTable<std::string, int> table(CleanupPolicy::RetainAfterUse);

    auto held = table.Acquire("held", [] { return 0; });
    REQUIRE(held.has_value());

    std::atomic<int> wouldBlock {0};
    RunThreads(16, [&](int) {
        if (table.TryRemove("held") == RemoveResult::WouldBlock)
        {
            wouldBlock.fetch_add(1, std::memory_order_relaxed);
        }
    });
    CHECK(wouldBlock.load() == 16);

    held->Release();
    CHECK(table.TryRemove("held") == RemoveResult::Success);
}

TEST_CASE("KeyedLockTable nested guards on different keys do not deadlock", "[Sync][KeyedLockTable][Stress]")
{
    KeyedLockTable<int, int> table(CleanupPolicy::AutoCleanup);
    std::atomic<int>         failures {0};

    RunThreads(8, [&](int index) {
        for (int i = 0; i < 100; ++i)
        {
            // Fixed key order per pair keeps the test itself free of lock-order inversions.
            auto first = table.Acquire(0, [] { return 0; });
            auto other = table.Acquire(1 + (index + i) % 3, [] { return 0; });
            if (!first || !other)
            {
                failures.fetch_add(1, std::memory_order_relaxed);
                continue;
            }
            **first += 1;
            **other += 1;
        }
    });

    CHECK(failures.load() == 0);
    CHECK(table.Size() == 0U);
}
