/// @file Concepts.hpp
/// @brief Concepts for synchronization primitives and the handles that own them.
#pragma once

#include <chrono>
#include <concepts>
#include <type_traits>

namespace KeyLock::Sync
{
    template<typename T>
    concept BasicLockableConcept = requires(T lockable) {
        lockable.lock();
        lockable.unlock();
    };

    template<typename T>
    concept TryLockableConcept = BasicLockableConcept<T> && requires(T lockable) {
        {
            lockable.try_lock()
        } -> std::convertible_to<bool>;
    };

    template<typename T>
    concept TimedLockableConcept = TryLockableConcept<T> && requires(T lockable, std::chrono::milliseconds timeout) {
        {
            lockable.try_lock_for(timeout)
        } -> std::convertible_to<bool>;
    };

    /// @brief A movable owning handle whose pointee never changes address while the handle lives.
    ///
    /// `std::unique_ptr`, `std::shared_ptr` and `Memory::TracedHandle` all qualify.
    template<typename THandle>
    concept StableHandleConcept = std::movable<THandle> && std::is_default_constructible_v<THandle> &&
                                  requires(const THandle& handle) {
                                      typename THandle::element_type;
                                      {
                                          *handle
                                      } -> std::same_as<typename THandle::element_type&>;
                                      static_cast<bool>(handle);
                                  };

    /// @brief A stable handle with shared ownership and an observable reference count.
    template<typename THandle>
    concept SharedHandleConcept = StableHandleConcept<THandle> && std::copyable<THandle> &&
                                  requires(const THandle& handle) {
                                      {
                                          handle.use_count()
                                      } -> std::convertible_to<long>;
                                  };
}// namespace KeyLock::Sync
