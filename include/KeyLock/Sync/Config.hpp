/// @file Config.hpp
/// @brief Compile-time configuration and capability macros for KeyLock::Sync.
#pragma once

#if defined(__cpp_exceptions) || defined(__EXCEPTIONS) || defined(_CPPUNWIND)
#define KEYLOCK_SYNC_HAS_EXCEPTIONS 1
#else
#define KEYLOCK_SYNC_HAS_EXCEPTIONS 0
#endif

// Guards released while an exception unwinds through their critical section poison the protected value.
#ifndef KEYLOCK_SYNC_POISON_ON_UNWIND
#define KEYLOCK_SYNC_POISON_ON_UNWIND 1
#endif

#if !KEYLOCK_SYNC_HAS_EXCEPTIONS
#undef KEYLOCK_SYNC_POISON_ON_UNWIND
#define KEYLOCK_SYNC_POISON_ON_UNWIND 0
#endif

// When enabled, KeyedLockTable stores its entries behind Memory::TracedHandle, which logs every handle clone and drop.
// Only meant for leak hunting; locking and cleanup decisions are identical either way.
#ifndef KEYLOCK_SYNC_TRACE_HANDLES
#define KEYLOCK_SYNC_TRACE_HANDLES 0
#endif
