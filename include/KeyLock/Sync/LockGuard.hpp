/// @file LockGuard.hpp
/// @brief Small RAII helpers for KeyLock synchronization primitives.
#pragma once

#include <utility>

#include <KeyLock/Sync/Concepts.hpp>

namespace KeyLock::Sync
{
    template<BasicLockableConcept TLockable>
    class LockGuard final
    {
    public:
        explicit LockGuard(TLockable& lockable)
            : m_lockable(lockable)
        {
            m_lockable.lock();
        }

        LockGuard(const LockGuard&)            = delete;
        LockGuard& operator=(const LockGuard&) = delete;

        LockGuard(LockGuard&& other) noexcept
            : m_lockable(other.m_lockable)
            , m_owns(other.m_owns)
        {
            other.m_owns = false;
        }

        LockGuard& operator=(LockGuard&&) = delete;

        ~LockGuard()
        {
            if (m_owns)
            {
                m_lockable.unlock();
            }
        }

    private:
        TLockable& m_lockable;
        bool       m_owns {true};
    };

    /// @brief Non-blocking scoped lock: attempts the lock once and owns it only on success.
    template<TryLockableConcept TLockable>
    class TryLockGuard final
    {
    public:
        explicit TryLockGuard(TLockable& lockable)
            : m_lockable(lockable)
            , m_owns(static_cast<bool>(lockable.try_lock()))
        {
        }

        TryLockGuard(const TryLockGuard&)            = delete;
        TryLockGuard& operator=(const TryLockGuard&) = delete;

        TryLockGuard(TryLockGuard&& other) noexcept
            : m_lockable(other.m_lockable)
            , m_owns(std::exchange(other.m_owns, false))
        {
        }

        TryLockGuard& operator=(TryLockGuard&&) = delete;

        ~TryLockGuard()
        {
            Unlock();
        }

        [[nodiscard]] bool OwnsLock() const noexcept
        {
            return m_owns;
        }

        [[nodiscard]] explicit operator bool() const noexcept
        {
            return m_owns;
        }

        /// @brief Releases the lock before the end of scope. No-op if the attempt failed.
        void Unlock()
        {
            if (m_owns)
            {
                m_owns = false;
                m_lockable.unlock();
            }
        }

    private:
        TLockable& m_lockable;
        bool       m_owns {false};
    };
}// namespace KeyLock::Sync
