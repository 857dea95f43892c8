/// @file LockError.cpp
/// @brief Tests for lock error codes and their string/errc mappings.

#include <KeyLock/Sync/LockError.hpp>

#include <catch2/catch_test_macros.hpp>
#include <system_error>

using namespace KeyLock::Sync;

TEST_CASE("LockErrorCode names", "[Sync][LockError]")
{
    CHECK(ToString(LockErrorCode::Ok) == "Ok");
    CHECK(ToString(LockErrorCode::Poisoned) == "Poisoned");
    CHECK(ToString(LockErrorCode::WouldBlock) == "WouldBlock");
    CHECK(ToString(LockErrorCode::TimedOut) == "TimedOut");
}

TEST_CASE("RemoveResult names", "[Sync][LockError]")
{
    CHECK(ToString(RemoveResult::Success) == "Success");
    CHECK(ToString(RemoveResult::NotFound) == "NotFound");
    CHECK(ToString(RemoveResult::WouldBlock) == "WouldBlock");
    CHECK(ToString(RemoveResult::Poisoned) == "Poisoned");
}

TEST_CASE("LockError maps onto std::errc", "[Sync][LockError]")
{
    CHECK(ToErrorCode(MakeLockError(LockErrorCode::Poisoned)) == std::errc::state_not_recoverable);
    CHECK(ToErrorCode(MakeLockError(LockErrorCode::WouldBlock)) == std::errc::resource_unavailable_try_again);
    CHECK(ToErrorCode(MakeLockError(LockErrorCode::TimedOut)) == std::errc::timed_out);
    CHECK_FALSE(ToErrorCode(MakeLockError(LockErrorCode::Ok)));
}

TEST_CASE("LockError equality and IsOk", "[Sync][LockError]")
{
    const LockError ok {};
    CHECK(ok.IsOk());
    CHECK(ok == MakeLockError(LockErrorCode::Ok));
    CHECK_FALSE(MakeLockError(LockErrorCode::Poisoned).IsOk());
    CHECK(MakeLockError(LockErrorCode::Poisoned) != MakeLockError(LockErrorCode::TimedOut));
}
