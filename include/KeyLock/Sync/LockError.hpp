/// @file LockError.hpp
/// @brief Error codes and expected type for keyed lock operations.
#pragma once

#include <expected>
#include <string_view>
#include <system_error>

#include <KeyLock/Defines.hpp>
#include <KeyLock/Primitives.hpp>

namespace KeyLock::Sync
{
    /// @brief Reasons an acquisition can fail.
    enum class LockErrorCode : KeyLock::UInt8
    {
        Ok,
        /// A previous holder failed inside its critical section. Never cleared implicitly.
        Poisoned,
        /// A non-blocking attempt found the lock held.
        WouldBlock,
        /// A timed attempt expired before the lock became free.
        TimedOut,
    };

    struct LockError final
    {
        LockErrorCode code {LockErrorCode::Ok};

        [[nodiscard]] constexpr bool IsOk() const noexcept { return code == LockErrorCode::Ok; }

        [[nodiscard]] constexpr bool operator==(const LockError&) const noexcept = default;
    };

    template<typename T>
    using LockExpected = std::expected<T, LockError>;

    [[nodiscard]] constexpr LockError MakeLockError(LockErrorCode code) noexcept
    {
        return LockError {code};
    }

    /// @brief Outcome of removing (or recovering) a keyed entry. Every value is an expected result, not a fault.
    enum class RemoveResult : KeyLock::UInt8
    {
        Success,
        NotFound,
        WouldBlock,
        Poisoned,
    };

    [[nodiscard]] KEYLOCK_API std::string_view ToString(LockErrorCode code) noexcept;
    [[nodiscard]] KEYLOCK_API std::string_view ToString(RemoveResult result) noexcept;

    /// @brief Maps a lock error onto the closest `std::errc` value.
    [[nodiscard]] KEYLOCK_API std::error_code ToErrorCode(LockError error) noexcept;
}// namespace KeyLock::Sync
