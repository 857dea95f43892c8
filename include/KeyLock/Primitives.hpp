// Fundamental type aliases shared by every KeyLock module.
#pragma once
#include <cstddef>
#include <cstdint>

namespace KeyLock
{
    /// @brief Represents a 64-bit unsigned integer.
    using UInt64 = std::uint64_t;
    /// @brief Represents an 8-bit unsigned integer.
    using UInt8 = std::uint8_t;

    using UIntSize = std::size_t;

    /// @brief Reference count as reported by shared handles (`use_count()`).
    using UseCount = long;
}// namespace KeyLock
