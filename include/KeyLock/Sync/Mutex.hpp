/// @file Mutex.hpp
/// @brief Mutex wrappers used for the outer (map) and inner (per-key) locks.
#pragma once

#include <chrono>
#include <mutex>

namespace KeyLock::Sync
{
    /// @brief Wraps a standard mutex with KeyLock's naming plus the lowercase Lockable interface.
    ///
    /// Timed operations are only available when `TNative` supports them.
    template<typename TNative>
    class BasicMutex
    {
    public:
        using NativeType = TNative;

        BasicMutex()                             = default;
        BasicMutex(const BasicMutex&)            = delete;
        BasicMutex& operator=(const BasicMutex&) = delete;
        ~BasicMutex()                            = default;

        void Lock()
        {
            m_mutex.lock();
        }

        void Unlock()
        {
            m_mutex.unlock();
        }

        [[nodiscard]] bool TryLock() noexcept
        {
            return m_mutex.try_lock();
        }

        template<typename Rep, typename Period>
        [[nodiscard]] bool TryLockFor(const std::chrono::duration<Rep, Period>& timeout)
            requires requires(TNative& native, const std::chrono::duration<Rep, Period>& d) { native.try_lock_for(d); }
        {
            return m_mutex.try_lock_for(timeout);
        }

        void lock()
        {
            Lock();
        }

        void unlock()
        {
            Unlock();
        }

        [[nodiscard]] bool try_lock() noexcept
        {
            return TryLock();
        }

        template<typename Rep, typename Period>
        [[nodiscard]] bool try_lock_for(const std::chrono::duration<Rep, Period>& timeout)
            requires requires(TNative& native, const std::chrono::duration<Rep, Period>& d) { native.try_lock_for(d); }
        {
            return TryLockFor(timeout);
        }

    private:
        TNative m_mutex {};
    };

    using Mutex = BasicMutex<std::mutex>;

    /// @brief Inner lock for tables that need `TryAcquireFor`.
    using TimedMutex = BasicMutex<std::timed_mutex>;
}// namespace KeyLock::Sync
