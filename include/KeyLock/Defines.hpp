#pragma once

#ifndef KEYLOCK_API
#if defined(_WIN32) || defined(__CYGWIN__)
#if defined(KEYLOCK_SHARED_BUILD)
#define KEYLOCK_API __declspec(dllexport)
#elif defined(KEYLOCK_SHARED)
#define KEYLOCK_API __declspec(dllimport)
#else
#define KEYLOCK_API
#endif
#define KEYLOCK_LOCAL
#else
#if defined(KEYLOCK_SHARED_BUILD) || defined(KEYLOCK_SHARED)
#define KEYLOCK_API __attribute__((visibility("default")))
#else
#define KEYLOCK_API
#endif
#define KEYLOCK_LOCAL __attribute__((visibility("hidden")))
#endif
#endif
#ifndef KEYLOCK_LOCAL
#define KEYLOCK_LOCAL
#endif

namespace KeyLock
{
    [[noreturn]] inline void Unreachable()
    {
#if defined(_MSC_VER) && !defined(__clang__)// MSVC
        __assume(false);
#else// GCC, Clang
        __builtin_unreachable();
#endif
    }
}// namespace KeyLock
