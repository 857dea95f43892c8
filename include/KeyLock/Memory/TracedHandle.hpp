/// @file TracedHandle.hpp
/// @brief `TracedHandle<T>`: a `std::shared_ptr<T>` that reports every clone and drop.
///
/// Meant for chasing leaked references to keyed lock entries. The wrapper is transparent: it neither adds nor hides
/// references, so `use_count()` and everything derived from it behave exactly as with the bare `std::shared_ptr`.
#pragma once

#include <cstddef>
#include <iosfwd>
#include <memory>
#include <utility>

#include <KeyLock/Defines.hpp>
#include <KeyLock/Primitives.hpp>

namespace KeyLock::Memory
{
    namespace detail
    {
        enum class HandleTraceEvent : KeyLock::UInt8
        {
            Clone,
            Drop,
        };

        /// @brief Writes one trace line: `[TracedHandle] thread <id>: <event> handle to <inner> (use_count=<n>)`.
        KEYLOCK_API void WriteHandleTrace(HandleTraceEvent event, const void* inner, KeyLock::UseCount useCount);
    }// namespace detail

    /// @brief Redirects trace output. `nullptr` restores the default (`std::cerr`).
    KEYLOCK_API void SetHandleTraceStream(std::ostream* stream) noexcept;

    template<class T>
    class TracedHandle
    {
    public:
        using element_type = T;

        TracedHandle() noexcept = default;
        TracedHandle(std::nullptr_t) noexcept {}

        explicit TracedHandle(std::shared_ptr<T> inner) noexcept
            : m_inner(std::move(inner))
        {
        }

        TracedHandle(const TracedHandle& other)
            : m_inner(other.m_inner)
        {
            if (m_inner)
            {
                detail::WriteHandleTrace(detail::HandleTraceEvent::Clone, m_inner.get(), m_inner.use_count());
            }
        }

        TracedHandle(TracedHandle&& other) noexcept = default;

        TracedHandle& operator=(const TracedHandle& other)
        {
            if (this != &other)
            {
                TracedHandle copy(other);
                Swap(copy);
            }
            return *this;
        }

        TracedHandle& operator=(TracedHandle&& other) noexcept
        {
            if (this != &other)
            {
                TracedHandle released(std::move(*this));
                m_inner = std::move(other.m_inner);
            }
            return *this;
        }

        ~TracedHandle()
        {
            if (m_inner)
            {
                detail::WriteHandleTrace(detail::HandleTraceEvent::Drop, m_inner.get(), m_inner.use_count());
            }
        }

        [[nodiscard]] T*   Get() const noexcept { return m_inner.get(); }
        [[nodiscard]] T&   operator*() const noexcept { return *m_inner; }
        [[nodiscard]] T*   operator->() const noexcept { return m_inner.get(); }
        explicit           operator bool() const noexcept { return m_inner != nullptr; }
        [[nodiscard]] bool operator==(std::nullptr_t) const noexcept { return m_inner == nullptr; }

        [[nodiscard]] KeyLock::UseCount use_count() const noexcept
        {
            return m_inner.use_count();
        }

        void Swap(TracedHandle& other) noexcept
        {
            m_inner.swap(other.m_inner);
        }

    private:
        std::shared_ptr<T> m_inner {};
    };

    /// @brief Factory mirroring `std::make_shared`.
    template<class T, class... Args>
    [[nodiscard]] TracedHandle<T> MakeTraced(Args&&... args)
    {
        return TracedHandle<T>(std::make_shared<T>(std::forward<Args>(args)...));
    }
}// namespace KeyLock::Memory
