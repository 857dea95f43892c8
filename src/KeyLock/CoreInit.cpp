#include <KeyLock/Defines.hpp>
#include <KeyLock/KeyLock.hpp>

namespace KeyLock::detail
{
    // Linker anchor; also compiles the umbrella header once as part of the library build.
    KEYLOCK_LOCAL void CoreLinkAnchor() noexcept {}
}// namespace KeyLock::detail
