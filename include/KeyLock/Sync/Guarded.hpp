/// @file Guarded.hpp
/// @brief `KeyLock::Sync::Guarded<T, TMutex>`: a value that can only be reached through its own lock.
#pragma once

#include <atomic>
#include <functional>
#include <type_traits>
#include <utility>

#include <KeyLock/Sync/Concepts.hpp>
#include <KeyLock/Sync/Mutex.hpp>

namespace KeyLock::Sync
{
    template<StableHandleConcept THandle>
    class OwnedLockGuard;

    /// @brief Tag selecting the constructor that builds the value from the result of a callable.
    struct InitializeWithTag final
    {
        explicit InitializeWithTag() = default;
    };

    inline constexpr InitializeWithTag InitializeWith {};

    /// @brief A value, its inner mutex and a poison flag.
    ///
    /// The value is only reachable through an `OwnedLockGuard`, which requires the `Guarded` to live behind a
    /// stable-address handle. `Guarded` is neither copyable nor movable so the value cannot change address while
    /// a guard points at it.
    ///
    /// Poisoning records that a holder failed inside its critical section. It is sticky: only `ClearPoison()`
    /// resets it.
    template<typename T, TryLockableConcept TMutex = Mutex>
    class Guarded final
    {
    public:
        using ValueType = T;
        using MutexType = TMutex;

        template<typename... Args>
        explicit Guarded(std::in_place_t, Args&&... args)
            requires std::is_constructible_v<T, Args...>
            : m_value(std::forward<Args>(args)...)
        {
        }

        /// @brief Constructs the value from `initializer()`; the result is materialized in place.
        template<typename TInit>
        Guarded(InitializeWithTag, TInit&& initializer)
            requires std::is_invocable_v<TInit>
            : m_value(std::invoke(std::forward<TInit>(initializer)))
        {
        }

        Guarded(const Guarded&)            = delete;
        Guarded& operator=(const Guarded&) = delete;
        Guarded(Guarded&&)                 = delete;
        Guarded& operator=(Guarded&&)      = delete;
        ~Guarded()                         = default;

        [[nodiscard]] bool IsPoisoned() const noexcept
        {
            return m_poisoned.load(std::memory_order_acquire);
        }

        void Poison() noexcept
        {
            m_poisoned.store(true, std::memory_order_release);
        }

        /// @brief Explicit recovery. The caller takes responsibility for the value's consistency.
        void ClearPoison() noexcept
        {
            m_poisoned.store(false, std::memory_order_release);
        }

        /// @brief The inner lock. Exposed for non-blocking probes; locking it does not grant value access.
        [[nodiscard]] TMutex& NativeMutex() noexcept
        {
            return m_mutex;
        }

    private:
        template<StableHandleConcept THandle>
        friend class OwnedLockGuard;

        TMutex            m_mutex {};
        std::atomic<bool> m_poisoned {false};
        T                 m_value;
    };

    template<typename T>
    struct IsGuarded : std::false_type
    {
    };

    template<typename T, typename TMutex>
    struct IsGuarded<Guarded<T, TMutex>> : std::true_type
    {
    };

    template<typename T>
    inline constexpr bool IsGuardedV = IsGuarded<std::remove_cv_t<T>>::value;
}// namespace KeyLock::Sync
