/// @file Guarded.cpp
/// @brief Tests for KeyLock::Sync::Guarded.

#include <KeyLock/Sync/Guarded.hpp>

#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <string>
#include <thread>

using namespace KeyLock::Sync;

namespace
{
    struct Pinned
    {
        explicit Pinned(int v) : value(v) {}
        Pinned(const Pinned&)            = delete;
        Pinned& operator=(const Pinned&) = delete;

        int value {0};
    };
}// namespace

TEST_CASE("Guarded starts unpoisoned", "[Sync][Guarded]")
{
    Guarded<std::string> guarded(std::in_place, "value");
    CHECK_FALSE(guarded.IsPoisoned());
}

TEST_CASE("Guarded poison is sticky until cleared", "[Sync][Guarded]")
{
    Guarded<int> guarded(std::in_place, 1);
    guarded.Poison();
    CHECK(guarded.IsPoisoned());
    CHECK(guarded.IsPoisoned());

    guarded.ClearPoison();
    CHECK_FALSE(guarded.IsPoisoned());
}

TEST_CASE("Guarded builds non-movable values from an initializer", "[Sync][Guarded]")
{
    int calls = 0;
    Guarded<Pinned> guarded(InitializeWith, [&] {
        ++calls;
        return Pinned {42};
    });
    CHECK(calls == 1);
    CHECK_FALSE(guarded.IsPoisoned());
}

TEST_CASE("Guarded exposes its inner mutex for probing", "[Sync][Guarded]")
{
    Guarded<int, TimedMutex> guarded(std::in_place, 0);
    auto&                    mutex = guarded.NativeMutex();

    REQUIRE(mutex.try_lock());

    bool acquiredElsewhere = true;
    std::thread([&] { acquiredElsewhere = mutex.TryLockFor(std::chrono::milliseconds {5}); }).join();
    CHECK_FALSE(acquiredElsewhere);

    mutex.unlock();
    std::thread([&] {
        acquiredElsewhere = mutex.TryLockFor(std::chrono::milliseconds {5});
        if (acquiredElsewhere)
        {
            mutex.unlock();
        }
    }).join();
    CHECK(acquiredElsewhere);
}
