#include <KeyLock/Memory/TracedHandle.hpp>

#include <atomic>
#include <iostream>
#include <mutex>
#include <thread>

namespace KeyLock::Memory
{
    namespace
    {
        std::mutex& TraceMutex() noexcept
        {
            static std::mutex mutex;
            return mutex;
        }

        std::atomic<std::ostream*>& TraceStream() noexcept
        {
            static std::atomic<std::ostream*> stream {nullptr};
            return stream;
        }
    }// namespace

    void SetHandleTraceStream(std::ostream* stream) noexcept
    {
        TraceStream().store(stream, std::memory_order_release);
    }

    namespace detail
    {
        void WriteHandleTrace(HandleTraceEvent event, const void* inner, KeyLock::UseCount useCount)
        {
            std::lock_guard<std::mutex> lock(TraceMutex());
            std::ostream*               stream = TraceStream().load(std::memory_order_acquire);
            std::ostream&               out    = stream ? *stream : std::cerr;

            out << "[TracedHandle] thread " << std::this_thread::get_id() << ": "
                << (event == HandleTraceEvent::Clone ? "cloning" : "dropping") << " handle to " << inner
                << " (use_count=" << useCount << ")" << std::endl;
        }
    }// namespace detail
}// namespace KeyLock::Memory
