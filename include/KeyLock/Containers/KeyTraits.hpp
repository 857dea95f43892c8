/// @file KeyTraits.hpp
/// @brief Hashing and equality for keyed lock tables, with allocation-free heterogeneous lookup.
///
/// `KeyHash<K>` / `KeyEqual<K>` are the defaults of `Sync::KeyedLockTable`. Where a cheaper borrowed form of `K`
/// exists they are transparent, so a table keyed by `std::string` can be probed with a `std::string_view` or a
/// string literal; only the insert path materializes an owned key.
#pragma once

#include <concepts>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include <KeyLock/Hashing/FNV.hpp>

namespace KeyLock::Containers
{
    template<typename K>
    struct KeyHash : std::hash<K>
    {
    };

    template<typename K>
    struct KeyEqual : std::equal_to<K>
    {
    };

    template<>
    struct KeyHash<std::string>
    {
        using is_transparent = void;

        [[nodiscard]] std::size_t operator()(std::string_view key) const noexcept
        {
            return static_cast<std::size_t>(Hashing::FNV1a64(key));
        }
    };

    template<>
    struct KeyEqual<std::string>
    {
        using is_transparent = void;

        [[nodiscard]] bool operator()(std::string_view lhs, std::string_view rhs) const noexcept
        {
            return lhs == rhs;
        }
    };

    template<>
    struct KeyHash<std::filesystem::path>
    {
        [[nodiscard]] std::size_t operator()(const std::filesystem::path& key) const noexcept
        {
            return std::filesystem::hash_value(key);
        }
    };

    /// @brief Key that shares ownership of its payload.
    ///
    /// Copying a `SharedKey` never copies the payload, which makes it suitable for large keys that the caller also
    /// keeps elsewhere. It hashes and compares like the payload, so tables keyed by `SharedKey<T>` can be probed
    /// with a plain `T` (or anything `T`'s own traits accept) without building a new `SharedKey`.
    template<typename T>
    class SharedKey final
    {
    public:
        using PayloadType = T;

        explicit SharedKey(std::shared_ptr<const T> payload) noexcept
            : m_payload(std::move(payload))
        {
        }

        template<typename Q>
            requires(!std::same_as<std::remove_cvref_t<Q>, SharedKey> && std::constructible_from<T, const Q&>)
        explicit SharedKey(const Q& payload)
            : m_payload(std::make_shared<const T>(payload))
        {
        }

        [[nodiscard]] const T& Get() const noexcept { return *m_payload; }

        [[nodiscard]] const std::shared_ptr<const T>& Payload() const noexcept { return m_payload; }

        [[nodiscard]] bool operator==(const SharedKey& other) const
        {
            return KeyEqual<T> {}(Get(), other.Get());
        }

    private:
        std::shared_ptr<const T> m_payload;
    };

    template<typename T>
    struct KeyHash<SharedKey<T>>
    {
        using is_transparent = void;

        [[nodiscard]] std::size_t operator()(const SharedKey<T>& key) const
        {
            return KeyHash<T> {}(key.Get());
        }

        template<typename Q>
            requires(!std::same_as<Q, SharedKey<T>> && std::invocable<const KeyHash<T>&, const Q&>)
        [[nodiscard]] std::size_t operator()(const Q& probe) const
        {
            return KeyHash<T> {}(probe);
        }
    };

    template<typename T>
    struct KeyEqual<SharedKey<T>>
    {
        using is_transparent = void;

        [[nodiscard]] bool operator()(const SharedKey<T>& lhs, const SharedKey<T>& rhs) const
        {
            return KeyEqual<T> {}(lhs.Get(), rhs.Get());
        }

        template<typename Q>
            requires(!std::same_as<Q, SharedKey<T>> && std::invocable<const KeyEqual<T>&, const T&, const Q&>)
        [[nodiscard]] bool operator()(const SharedKey<T>& lhs, const Q& rhs) const
        {
            return KeyEqual<T> {}(lhs.Get(), rhs);
        }

        template<typename Q>
            requires(!std::same_as<Q, SharedKey<T>> && std::invocable<const KeyEqual<T>&, const Q&, const T&>)
        [[nodiscard]] bool operator()(const Q& lhs, const SharedKey<T>& rhs) const
        {
            return KeyEqual<T> {}(lhs, rhs.Get());
        }
    };
}// namespace KeyLock::Containers
