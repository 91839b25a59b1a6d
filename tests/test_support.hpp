#pragma once

// Minimal helpers shared by the test executables (run via CTest).

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <string>
#include <thread>

#include <fmt/core.h>

namespace testing_support
{
    struct TestContext
    {
        int failures = 0;

        void check(bool cond, const std::string &msg)
        {
            if (!cond)
            {
                ++failures;
                fmt::print(stderr, "[FAIL] {}\n", msg);
            }
        }

        void checkContains(const std::string &haystack, const std::string &needle, const std::string &msg)
        {
            check(haystack.find(needle) != std::string::npos,
                  fmt::format("{} (got '{}')", msg, haystack));
        }

        int finish(const std::string &suiteName) const
        {
            if (failures != 0)
            {
                fmt::print(stderr, "[FAILURES] {}\n", failures);
                return EXIT_FAILURE;
            }
            fmt::print("[OK] {}\n", suiteName);
            return EXIT_SUCCESS;
        }
    };

    /**
     * Fresh directory under the system temp dir, removed on destruction.
     */
    class TempDir
    {
    public:
        explicit TempDir(const std::string &prefix)
        {
            static std::atomic<unsigned> counter{0};
            std::random_device random;
            path_ = std::filesystem::temp_directory_path() /
                    fmt::format("{}-{}-{}", prefix, random(), counter.fetch_add(1));
            std::filesystem::create_directories(path_);
        }

        ~TempDir()
        {
            std::error_code ec;
            std::filesystem::remove_all(path_, ec);
        }

        TempDir(const TempDir &) = delete;
        TempDir &operator=(const TempDir &) = delete;

        const std::filesystem::path &path() const { return path_; }

        std::filesystem::path operator/(const std::string &name) const { return path_ / name; }

    private:
        std::filesystem::path path_;
    };

    inline void writeFile(const std::filesystem::path &path, const std::string &content)
    {
        std::filesystem::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
    }

    inline std::string readFile(const std::filesystem::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    /**
     * Deterministic pseudo-random payload so offsets are distinguishable.
     */
    inline std::string makePayload(std::size_t size, std::uint32_t seed = 1)
    {
        std::string data(size, '\0');
        std::uint32_t state = seed;
        for (char &c : data)
        {
            state = state * 1664525u + 1013904223u;
            c = static_cast<char>(state >> 24);
        }
        return data;
    }

    /**
     * Poll until the predicate holds or the timeout expires.
     */
    template <typename Predicate>
    bool waitUntil(Predicate predicate, std::chrono::milliseconds timeout = std::chrono::milliseconds(5000))
    {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (!predicate())
        {
            if (std::chrono::steady_clock::now() >= deadline)
            {
                return false;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        return true;
    }
}
