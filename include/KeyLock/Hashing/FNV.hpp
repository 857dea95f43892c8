// FNV.hpp
// FNV-1a 64-bit hashing used for KeyLock's string-like keys.
#pragma once

#include <KeyLock/Primitives.hpp>
#include <string_view>

namespace KeyLock::Hashing
{
    inline constexpr UInt64 FNV1a64Offset = 14695981039346656037ull;
    inline constexpr UInt64 FNV1a64Prime  = 1099511628211ull;

    /// @brief Compute FNV-1a 64-bit hash (byte buffer).
    /// @param seed Running hash; pass a previous result to continue hashing across buffers.
    constexpr UInt64 FNV1a64(const UInt8* data, UIntSize len, UInt64 seed = FNV1a64Offset) noexcept
    {
        UInt64 hash = seed;
        for (UIntSize i = 0; i < len; ++i)
            hash = (hash ^ data[i]) * FNV1a64Prime;
        return hash;
    }

    /// @brief Compute FNV-1a 64-bit hash for a string_view.
    constexpr UInt64 FNV1a64(std::string_view sv, UInt64 seed = FNV1a64Offset) noexcept
    {
        UInt64 hash = seed;
        for (UIntSize i = 0; i < sv.size(); ++i)
            hash = (hash ^ static_cast<UInt8>(sv[i])) * FNV1a64Prime;
        return hash;
    }
}// namespace KeyLock::Hashing
