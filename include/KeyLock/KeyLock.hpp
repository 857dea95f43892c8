#pragma once
#include <KeyLock/Containers/KeyTraits.hpp>
#include <KeyLock/Defines.hpp>
#include <KeyLock/Hashing/FNV.hpp>
#include <KeyLock/Memory/TracedHandle.hpp>
#include <KeyLock/Primitives.hpp>
#include <KeyLock/Sync/Concepts.hpp>
#include <KeyLock/Sync/Config.hpp>
#include <KeyLock/Sync/Guarded.hpp>
#include <KeyLock/Sync/KeyedLockTable.hpp>
#include <KeyLock/Sync/LockError.hpp>
#include <KeyLock/Sync/LockGuard.hpp>
#include <KeyLock/Sync/Mutex.hpp>
#include <KeyLock/Sync/OwnedLockGuard.hpp>
