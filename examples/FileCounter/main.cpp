// main.cpp
// A thousand threads increment a counter stored in one file, serialized per path by a KeyedLockTable.
#include <KeyLock/Sync/KeyedLockTable.hpp>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace KeyLock::Sync;

namespace
{
    constexpr int kThreads = 1000;

    using FileTable = KeyedLockTable<std::filesystem::path, std::fstream>;

    std::fstream OpenCounter(const std::filesystem::path& path)
    {
        std::fstream file(path, std::ios::in | std::ios::out);
        if (!file.is_open())
        {
            throw std::runtime_error("cannot open " + path.string());
        }
        return file;
    }

    // Reads the counter, adds one, and rewrites it in place.
    void Increment(std::fstream& file)
    {
        long long value = 0;
        file.clear();
        file.seekg(0);
        file >> value;

        file.clear();
        file.seekp(0);
        file << (value + 1) << '\n';
        file.flush();
        if (!file)
        {
            throw std::runtime_error("counter write failed");
        }
    }
}// namespace

int main()
{
    const auto path = std::filesystem::temp_directory_path() / "keylock_file_counter.txt";
    {
        std::ofstream init(path, std::ios::trunc);
        init << 0 << '\n';
    }

    FileTable                table(CleanupPolicy::AutoCleanup);
    std::atomic<int>         failures {0};
    std::vector<std::thread> threads;
    threads.reserve(kThreads);

    for (int i = 0; i < kThreads; ++i)
    {
        threads.emplace_back([&] {
            try
            {
                auto result = table.WithLock(path, [&] { return OpenCounter(path); }, Increment);
                if (!result)
                {
                    std::cerr << "[FileCounter] lock failed: " << ToString(result.error().code) << "\n";
                    failures.fetch_add(1);
                }
            }
            catch (const std::exception& e)
            {
                std::cerr << "[FileCounter] " << e.what() << "\n";
                failures.fetch_add(1);
            }
        });
    }
    for (auto& thread: threads)
    {
        thread.join();
    }

    long long total = 0;
    {
        std::ifstream in(path);
        in >> total;
    }
    std::filesystem::remove(path);

    std::cout << "[FileCounter] counter = " << total << " (expected " << kThreads << "), open entries = " << table.Size()
              << "\n";
    return (failures.load() == 0 && total == kThreads && table.Size() == 0) ? 0 : 1;
}
