/// @file KeyedLockTable.hpp
/// @brief `KeyLock::Sync::KeyedLockTable`: a namespace of lazily created, reference-counted per-key locks.
///
/// Lock ordering (holds on every path, including cleanup):
/// - The outer lock guards the key -> entry map and is only held for bookkeeping.
/// - The outer lock is never held while blocking on an inner lock. The only inner-lock operation performed under
///   it is a non-blocking `try_lock` probe.
/// - New holders attach to an entry only under the outer lock. Later copies are made by someone who already holds a
///   counted reference, so "use_count() == baseline" observed under the outer lock means nobody else can reach the
///   entry.
#pragma once

#include <cassert>
#include <chrono>
#include <expected>
#include <functional>
#include <memory>
#include <type_traits>
#include <unordered_map>
#include <utility>

#include <KeyLock/Containers/KeyTraits.hpp>
#include <KeyLock/Primitives.hpp>
#include <KeyLock/Sync/Concepts.hpp>
#include <KeyLock/Sync/Config.hpp>
#include <KeyLock/Sync/Guarded.hpp>
#include <KeyLock/Sync/LockError.hpp>
#include <KeyLock/Sync/LockGuard.hpp>
#include <KeyLock/Sync/Mutex.hpp>
#include <KeyLock/Sync/OwnedLockGuard.hpp>

#if KEYLOCK_SYNC_TRACE_HANDLES
#include <KeyLock/Memory/TracedHandle.hpp>
#endif

namespace KeyLock::Sync
{
    /// @brief What happens to an entry once nobody uses it any more.
    enum class CleanupPolicy : KeyLock::UInt8
    {
        /// Entries persist until `TryRemove` succeeds.
        RetainAfterUse,
        /// Every guard release opportunistically removes its entry if it became unused.
        AutoCleanup,
    };

#if KEYLOCK_SYNC_TRACE_HANDLES
    template<typename T>
    using DefaultEntryHandle = Memory::TracedHandle<T>;
#else
    template<typename T>
    using DefaultEntryHandle = std::shared_ptr<T>;
#endif

    /// @brief Holds many `Guarded<V>` values keyed by `K`, created on first use.
    ///
    /// Copies are cheap and share the same namespace. Every access to a value goes through a guard returned by
    /// `Acquire` (or a scoped `WithLock`). Guards own a reference to their entry, so they may outlive both the
    /// lookup and the table object that produced them.
    ///
    /// A failing critical section poisons only its own key; the rest of the table stays usable.
    ///
    /// @tparam K       Key type. Owned by the table once inserted.
    /// @tparam V       Protected value type. Built by the caller's initializer, never copied or moved afterwards.
    /// @tparam THash   Hash; transparent hashes enable lookups by borrowed key forms.
    /// @tparam TEqual  Equality matching `THash`.
    /// @tparam TMutex  Inner (per-key) lock. Use `TimedMutex` to enable `TryAcquireFor`.
    /// @tparam THandle Shared handle template used for entries.
    template<typename K,
             typename V,
             typename THash                = Containers::KeyHash<K>,
             typename TEqual               = Containers::KeyEqual<K>,
             TryLockableConcept TMutex     = Mutex,
             template<typename> class THandle = DefaultEntryHandle>
    class KeyedLockTable
    {
    public:
        using KeyType    = K;
        using ValueType  = V;
        using EntryType  = Guarded<V, TMutex>;
        using HandleType = THandle<EntryType>;

        static_assert(SharedHandleConcept<HandleType>, "KeyedLockTable entries need a copyable, reference-counted handle.");

        class Guard;

    private:
        using EntryMap = std::unordered_map<K, HandleType, THash, TEqual>;

        struct State final
        {
            explicit State(CleanupPolicy cleanupPolicy) noexcept
                : policy(cleanupPolicy)
            {
            }

            Mutex               mutex {};
            EntryMap            entries {};
            const CleanupPolicy policy;
        };

        // One reference held by an in-flight acquisition, plus the key node it came from.
        struct Attachment final
        {
            HandleType handle {};
            const K*   key {nullptr};
        };

    public:
        /// @brief Exclusive access to one entry's value.
        ///
        /// Releasing (destructor or `Release()`) unlocks the entry, then, under `AutoCleanup`, removes it from the
        /// table if nobody else references it before control returns to the caller.
        class Guard final
        {
        public:
            Guard(Guard&&) noexcept = default;

            Guard& operator=(Guard&& other) noexcept
            {
                if (this != &other)
                {
                    Release();
                    m_lock  = std::move(other.m_lock);
                    m_state = std::move(other.m_state);
                    m_key   = std::exchange(other.m_key, nullptr);
                }
                return *this;
            }

            Guard(const Guard&)            = delete;
            Guard& operator=(const Guard&) = delete;

            ~Guard()
            {
                Release();
            }

            // Value and key access require OwnsLock(); released and moved-from guards hold neither.
            [[nodiscard]] V& operator*() noexcept { return Get(); }
            [[nodiscard]] const V& operator*() const noexcept { return Get(); }
            [[nodiscard]] V* operator->() noexcept { return &Get(); }
            [[nodiscard]] const V* operator->() const noexcept { return &Get(); }

            [[nodiscard]] V& Get() noexcept
            {
                assert(m_lock.OwnsLock() && "KeyedLockTable::Guard accessed after release");
                return *m_lock;
            }

            [[nodiscard]] const V& Get() const noexcept
            {
                assert(m_lock.OwnsLock() && "KeyedLockTable::Guard accessed after release");
                return *m_lock;
            }

            /// @brief The key this guard locks. Valid while the guard owns its lock.
            [[nodiscard]] const K& Key() const noexcept
            {
                assert(m_lock.OwnsLock() && "KeyedLockTable::Guard accessed after release");
                return *m_key;
            }

            [[nodiscard]] bool OwnsLock() const noexcept { return m_lock.OwnsLock(); }

            /// @brief Marks the entry poisoned; later acquisitions fail until `ClearPoison`.
            void Poison() noexcept { m_lock.Poison(); }

            /// @brief Unlocks the entry and drops this guard's reference. Safe to call more than once.
            void Release() noexcept
            {
                if (!m_lock.OwnsLock())
                {
                    return;
                }

                HandleType handle = std::move(m_lock).IntoHandle();
                if (m_state->policy == CleanupPolicy::AutoCleanup)
                {
                    KeyedLockTable::ReleaseReference(*m_state, *m_key, std::move(handle));
                }
            }

        private:
            friend class KeyedLockTable;

            Guard(OwnedLockGuard<HandleType>&& lock, std::shared_ptr<State> state, const K* key) noexcept
                : m_lock(std::move(lock))
                , m_state(std::move(state))
                , m_key(key)
            {
            }

            OwnedLockGuard<HandleType> m_lock;
            std::shared_ptr<State>     m_state;
            const K*                   m_key {nullptr};
        };

        explicit KeyedLockTable(CleanupPolicy policy = CleanupPolicy::RetainAfterUse)
            : m_state(std::make_shared<State>(policy))
        {
        }

        // Copies share the namespace. Moves fall back to copies, so no table is ever left without state.
        KeyedLockTable(const KeyedLockTable&)            = default;
        KeyedLockTable& operator=(const KeyedLockTable&) = default;
        ~KeyedLockTable()                                = default;

        [[nodiscard]] CleanupPolicy Policy() const noexcept
        {
            return m_state->policy;
        }

        /// @brief Finds the entry for `key`, creating it with `initializer()` if absent, and locks it.
        ///
        /// The initializer runs at most once per creation, under the outer lock; if it throws, the table is left
        /// unchanged and the exception propagates. Blocks until the entry's inner lock is free.
        ///
        /// @return A guard, or `Poisoned` if an earlier holder failed.
        template<typename Q, typename TInit>
        [[nodiscard]] LockExpected<Guard> Acquire(const Q& key, TInit&& initializer)
        {
            return LockAttached(Attach(key, std::forward<TInit>(initializer)),
                                [](HandleType handle) { return OwnedLock(std::move(handle)); });
        }

        /// @brief Like `Acquire`, but returns `WouldBlock` instead of waiting for a held entry.
        template<typename Q, typename TInit>
        [[nodiscard]] LockExpected<Guard> TryAcquire(const Q& key, TInit&& initializer)
        {
            return LockAttached(Attach(key, std::forward<TInit>(initializer)),
                                [](HandleType handle) { return TryOwnedLock(std::move(handle)); });
        }

        /// @brief Like `Acquire`, but gives up with `TimedOut` after `timeout`.
        template<typename Q, typename TInit, typename Rep, typename Period>
        [[nodiscard]] LockExpected<Guard> TryAcquireFor(const Q& key, TInit&& initializer, const std::chrono::duration<Rep, Period>& timeout)
            requires TimedLockableConcept<TMutex>
        {
            return LockAttached(Attach(key, std::forward<TInit>(initializer)),
                                [&timeout](HandleType handle) { return TryOwnedLockFor(std::move(handle), timeout); });
        }

        /// @brief Runs `body(value)` with the entry for `key` locked.
        ///
        /// The lock is released on every exit path. If `body` throws, the entry is poisoned and the exception
        /// propagates. `body` never runs on a poisoned entry.
        template<typename Q, typename TInit, typename TBody>
        auto WithLock(const Q& key, TInit&& initializer, TBody&& body) -> LockExpected<std::invoke_result_t<TBody, V&>>
        {
            using Result = std::invoke_result_t<TBody, V&>;
            static_assert(!std::is_reference_v<Result>, "WithLock bodies must return by value.");

            auto guard = Acquire(key, std::forward<TInit>(initializer));
            if (!guard)
            {
                return std::unexpected(guard.error());
            }

            if constexpr (std::is_void_v<Result>)
            {
                std::invoke(std::forward<TBody>(body), **guard);
                return {};
            }
            else
            {
                return std::invoke(std::forward<TBody>(body), **guard);
            }
        }

        /// @brief Removes the entry for `key` if nobody uses it. Never waits on an inner lock.
        ///
        /// @return `Success`, `NotFound`, `WouldBlock` (referenced or locked), or `Poisoned` (left in place).
        template<typename Q>
        RemoveResult TryRemove(const Q& key)
        {
            HandleType   removed {};
            RemoveResult result;
            {
                LockGuard lock(m_state->mutex);
                auto      it = m_state->entries.find(key);
                if (it == m_state->entries.end())
                {
                    return RemoveResult::NotFound;
                }
                result = RemoveIfUnused(m_state->entries, it, 1, removed);
            }
            return result;
        }

        /// @brief Clears the poison flag of the entry for `key`. Never waits on an inner lock.
        ///
        /// The value is kept as the failed holder left it. Under `AutoCleanup` an entry that is unused once
        /// recovered is removed right away.
        template<typename Q>
        RemoveResult ClearPoison(const Q& key)
        {
            HandleType removed {};
            {
                LockGuard lock(m_state->mutex);
                auto      it = m_state->entries.find(key);
                if (it == m_state->entries.end())
                {
                    return RemoveResult::NotFound;
                }

                (*it->second).ClearPoison();
                if (m_state->policy == CleanupPolicy::AutoCleanup)
                {
                    (void) RemoveIfUnused(m_state->entries, it, 1, removed);
                }
            }
            return RemoveResult::Success;
        }

        template<typename Q>
        [[nodiscard]] bool Contains(const Q& key) const
        {
            LockGuard lock(m_state->mutex);
            return m_state->entries.find(key) != m_state->entries.end();
        }

        [[nodiscard]] UIntSize Size() const
        {
            LockGuard lock(m_state->mutex);
            return m_state->entries.size();
        }

    private:
        template<typename Q, typename TInit>
        [[nodiscard]] Attachment Attach(const Q& key, TInit&& initializer)
        {
            LockGuard lock(m_state->mutex);
            auto&     entries = m_state->entries;
            auto      it      = entries.find(key);
            if (it == entries.end())
            {
                HandleType handle {std::make_shared<EntryType>(InitializeWith, std::forward<TInit>(initializer))};
                it = entries.emplace(K(key), std::move(handle)).first;
            }
            return Attachment {it->second, &it->first};
        }

        // Locks the attached entry through `lockEntry`. If locking throws, the acquisition's reference still goes
        // through the cleanup path before the exception propagates.
        template<typename TLockEntry>
        [[nodiscard]] LockExpected<Guard> LockAttached(Attachment&& attached, TLockEntry&& lockEntry)
        {
            try
            {
                auto locked = std::invoke(std::forward<TLockEntry>(lockEntry), HandleType {attached.handle});
                return Bind(std::move(locked), std::move(attached));
            }
            catch (...)
            {
                if (m_state->policy == CleanupPolicy::AutoCleanup && attached.handle)
                {
                    ReleaseReference(*m_state, *attached.key, std::move(attached.handle));
                }
                throw;
            }
        }

        // `attached` still holds the acquisition's own reference; the guard (if any) holds another.
        [[nodiscard]] LockExpected<Guard> Bind(LockExpected<OwnedLockGuard<HandleType>>&& locked, Attachment&& attached)
        {
            if (!locked)
            {
                if (m_state->policy == CleanupPolicy::AutoCleanup)
                {
                    ReleaseReference(*m_state, *attached.key, std::move(attached.handle));
                }
                return std::unexpected(locked.error());
            }
            return Guard(std::move(*locked), m_state, attached.key);
        }

        // Called with the inner lock already released. The caller's reference is dropped while the outer lock is
        // still held, so the last releaser of a key always observes the baseline count.
        static void ReleaseReference(State& state, const K& key, HandleType handle)
        {
            HandleType removed {};
            {
                LockGuard lock(state.mutex);
                auto      it = state.entries.find(key);
                if (it != state.entries.end() && &*it->second == &*handle)
                {
                    (void) RemoveIfUnused(state.entries, it, 2, removed);
                }
                handle = HandleType {};
            }
        }

        // Requires the outer lock. `expectedUses` is the table's own reference plus the caller's.
        // The removed handle is handed out so the value is destroyed after the outer lock is released.
        static RemoveResult RemoveIfUnused(EntryMap& entries, typename EntryMap::iterator it, UseCount expectedUses, HandleType& removed)
        {
            if (it->second.use_count() > expectedUses)
            {
                return RemoveResult::WouldBlock;
            }

            {
                TryLockGuard probe((*it->second).NativeMutex());
                if (!probe)
                {
                    return RemoveResult::WouldBlock;
                }
                if ((*it->second).IsPoisoned())
                {
                    return RemoveResult::Poisoned;
                }
            }

            removed = std::move(it->second);
            entries.erase(it);
            return RemoveResult::Success;
        }

        std::shared_ptr<State> m_state;
    };
}// namespace KeyLock::Sync
