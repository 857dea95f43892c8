/// @file OwnedLockGuard.hpp
/// @brief Lock guards that own the handle to the mutex they lock.
///
/// A plain scoped lock must not outlive the mutex it refers to. `OwnedLockGuard` instead stores the owning handle
/// (`std::shared_ptr`, `std::unique_ptr`, `Memory::TracedHandle`, ...) next to the lock, so the guard can be
/// returned from the scope that produced it and keeps the protected value alive on its own.
#pragma once

#include <chrono>
#include <exception>
#include <expected>
#include <utility>

#include <KeyLock/Sync/Concepts.hpp>
#include <KeyLock/Sync/Config.hpp>
#include <KeyLock/Sync/Guarded.hpp>
#include <KeyLock/Sync/LockError.hpp>

namespace KeyLock::Sync
{
    /// @brief RAII exclusive access to the value of a `Guarded` reached through an owning handle.
    ///
    /// Release order is fixed: the inner lock is dropped first, then the handle. Dropping the last handle may run
    /// the value's destructor, which must never happen while the lock still appears held.
    ///
    /// If the guard is released while an exception that started inside its critical section is unwinding, the
    /// value is poisoned (see `KEYLOCK_SYNC_POISON_ON_UNWIND`).
    ///
    /// @tparam THandle Owning handle to a `Guarded<T, TMutex>`. Must not be null when locking.
    template<StableHandleConcept THandle>
    class OwnedLockGuard final
    {
    public:
        using HandleType  = THandle;
        using GuardedType = typename THandle::element_type;
        using ValueType   = typename GuardedType::ValueType;
        using MutexType   = typename GuardedType::MutexType;

        static_assert(IsGuardedV<GuardedType>, "OwnedLockGuard requires a handle to a Sync::Guarded<T>.");

        OwnedLockGuard(const OwnedLockGuard&)            = delete;
        OwnedLockGuard& operator=(const OwnedLockGuard&) = delete;

        OwnedLockGuard(OwnedLockGuard&& other) noexcept
            : m_handle(std::move(other.m_handle))
            , m_owns(std::exchange(other.m_owns, false))
            , m_uncaughtOnLock(other.m_uncaughtOnLock)
        {
        }

        OwnedLockGuard& operator=(OwnedLockGuard&& other) noexcept
        {
            if (this != &other)
            {
                Release();
                m_handle         = std::move(other.m_handle);
                m_owns           = std::exchange(other.m_owns, false);
                m_uncaughtOnLock = other.m_uncaughtOnLock;
            }
            return *this;
        }

        ~OwnedLockGuard()
        {
            Release();
        }

        /// @brief Blocks until the mutex is free.
        /// @return The guard, or `Poisoned` if a previous holder failed. The lock is not kept in that case.
        [[nodiscard]] static LockExpected<OwnedLockGuard> Lock(THandle handle)
        {
            (*handle).NativeMutex().lock();
            return Adopt(std::move(handle));
        }

        /// @brief Single non-blocking attempt; `WouldBlock` when the mutex is held.
        [[nodiscard]] static LockExpected<OwnedLockGuard> TryLock(THandle handle)
        {
            if (!(*handle).NativeMutex().try_lock())
            {
                return std::unexpected(MakeLockError(LockErrorCode::WouldBlock));
            }
            return Adopt(std::move(handle));
        }

        /// @brief Waits at most `timeout`; `TimedOut` when the mutex stayed held.
        template<typename Rep, typename Period>
        [[nodiscard]] static LockExpected<OwnedLockGuard> TryLockFor(THandle handle, const std::chrono::duration<Rep, Period>& timeout)
            requires TimedLockableConcept<MutexType>
        {
            if (!(*handle).NativeMutex().try_lock_for(timeout))
            {
                return std::unexpected(MakeLockError(LockErrorCode::TimedOut));
            }
            return Adopt(std::move(handle));
        }

        [[nodiscard]] ValueType& operator*() noexcept { return (*m_handle).m_value; }
        [[nodiscard]] const ValueType& operator*() const noexcept { return (*m_handle).m_value; }
        [[nodiscard]] ValueType* operator->() noexcept { return &(*m_handle).m_value; }
        [[nodiscard]] const ValueType* operator->() const noexcept { return &(*m_handle).m_value; }

        [[nodiscard]] ValueType& Get() noexcept { return (*m_handle).m_value; }
        [[nodiscard]] const ValueType& Get() const noexcept { return (*m_handle).m_value; }

        [[nodiscard]] bool OwnsLock() const noexcept
        {
            return m_owns;
        }

        /// @brief Marks the value poisoned; every later lock attempt fails until it is cleared.
        void Poison() noexcept
        {
            if (m_owns)
            {
                (*m_handle).Poison();
            }
        }

        /// @brief Unlocks, then drops the handle. Safe to call more than once.
        void Release() noexcept
        {
            Unlock();
            THandle released {std::move(m_handle)};
        }

        /// @brief Unlocks early and hands the handle back instead of dropping it.
        [[nodiscard]] THandle IntoHandle() && noexcept
        {
            Unlock();
            return std::move(m_handle);
        }

    private:
        OwnedLockGuard(THandle handle) noexcept
            : m_handle(std::move(handle))
            , m_owns(true)
            , m_uncaughtOnLock(std::uncaught_exceptions())
        {
        }

        // Expects the mutex to be locked by the caller. On poison the lock is given back before the handle drops.
        [[nodiscard]] static LockExpected<OwnedLockGuard> Adopt(THandle handle)
        {
            if ((*handle).IsPoisoned())
            {
                (*handle).NativeMutex().unlock();
                return std::unexpected(MakeLockError(LockErrorCode::Poisoned));
            }
            return OwnedLockGuard(std::move(handle));
        }

        void Unlock() noexcept
        {
            if (!m_owns)
            {
                return;
            }
            m_owns = false;

            auto& guarded = *m_handle;
#if KEYLOCK_SYNC_POISON_ON_UNWIND
            if (std::uncaught_exceptions() > m_uncaughtOnLock)
            {
                guarded.Poison();
            }
#endif
            guarded.NativeMutex().unlock();
        }

        THandle m_handle {};
        bool    m_owns {false};
        int     m_uncaughtOnLock {0};
    };

    /// @brief Locks the `Guarded` behind `handle`, moving the handle into the returned guard.
    template<StableHandleConcept THandle>
    [[nodiscard]] LockExpected<OwnedLockGuard<THandle>> OwnedLock(THandle handle)
    {
        return OwnedLockGuard<THandle>::Lock(std::move(handle));
    }

    template<StableHandleConcept THandle>
    [[nodiscard]] LockExpected<OwnedLockGuard<THandle>> TryOwnedLock(THandle handle)
    {
        return OwnedLockGuard<THandle>::TryLock(std::move(handle));
    }

    template<StableHandleConcept THandle, typename Rep, typename Period>
    [[nodiscard]] LockExpected<OwnedLockGuard<THandle>> TryOwnedLockFor(THandle handle, const std::chrono::duration<Rep, Period>& timeout)
    {
        return OwnedLockGuard<THandle>::TryLockFor(std::move(handle), timeout);
    }
}// namespace KeyLock::Sync
