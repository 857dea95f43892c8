#include <KeyLock/Sync/LockError.hpp>

namespace KeyLock::Sync
{
    std::string_view ToString(LockErrorCode code) noexcept
    {
        switch (code)
        {
            case LockErrorCode::Ok: return "Ok";
            case LockErrorCode::Poisoned: return "Poisoned";
            case LockErrorCode::WouldBlock: return "WouldBlock";
            case LockErrorCode::TimedOut: return "TimedOut";
        }
        KeyLock::Unreachable();
    }

    std::string_view ToString(RemoveResult result) noexcept
    {
        switch (result)
        {
            case RemoveResult::Success: return "Success";
            case RemoveResult::NotFound: return "NotFound";
            case RemoveResult::WouldBlock: return "WouldBlock";
            case RemoveResult::Poisoned: return "Poisoned";
        }
        KeyLock::Unreachable();
    }

    std::error_code ToErrorCode(LockError error) noexcept
    {
        switch (error.code)
        {
            case LockErrorCode::Poisoned: return std::make_error_code(std::errc::state_not_recoverable);
            case LockErrorCode::WouldBlock: return std::make_error_code(std::errc::resource_unavailable_try_again);
            case LockErrorCode::TimedOut: return std::make_error_code(std::errc::timed_out);
            case LockErrorCode::Ok: break;
        }

        return {};
    }
}// namespace KeyLock::Sync
