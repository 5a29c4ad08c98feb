// File: tests/unit/StringRegistryConcurrencyTests.cpp
// Purpose: Stress the registry from several threads at once.
// Key invariants: Racing interns of equal text agree on one Handle; resolve
//                 observes only fully published entries.
// Ownership/Lifetime: Threads borrow a registry owned by the test body.
// Links: src/intern/StringRegistry.hpp

#include <gtest/gtest.h>

#include "intern/StringRegistry.hpp"

#include <atomic>
#include <string>
#include <thread>
#include <vector>

using namespace glossa::intern;

namespace
{
constexpr int kThreads = 8;
} // namespace

TEST(StringRegistryConcurrency, SameTextFromManyThreadsYieldsOneHandle)
{
    StringRegistry registry;
    std::vector<Handle> results(kThreads);
    std::atomic<int> failures{0};
    std::atomic<bool> go{false};

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t)
    {
        threads.emplace_back(
            [&, t]
            {
                while (!go.load(std::memory_order_acquire))
                    std::this_thread::yield();
                for (int i = 0; i < 1000; ++i)
                {
                    auto h = registry.intern("shared/asset/path");
                    if (!h)
                    {
                        failures.fetch_add(1);
                        return;
                    }
                    results[t] = h.value();
                }
            });
    }
    go.store(true, std::memory_order_release);
    for (auto &thread : threads)
        thread.join();

    EXPECT_EQ(failures.load(), 0);
    EXPECT_EQ(registry.size(), 1u);
    for (const Handle &h : results)
        EXPECT_EQ(h, results.front());
}

TEST(StringRegistryConcurrency, OverlappingInsertsStayConsistent)
{
    StringRegistry registry;
    constexpr int kPerThread = 2000;
    constexpr int kDistinct = 3000;
    std::vector<std::vector<Handle>> seen(kThreads, std::vector<Handle>(kPerThread));
    std::atomic<int> failures{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t)
    {
        threads.emplace_back(
            [&, t]
            {
                for (int i = 0; i < kPerThread; ++i)
                {
                    // Each thread starts at a different offset so ranges overlap.
                    const int key = (i + t * 500) % kDistinct;
                    auto h = registry.intern("name_" + std::to_string(key));
                    if (!h)
                    {
                        failures.fetch_add(1);
                        continue;
                    }
                    seen[t][i] = h.value();
                }
            });
    }
    for (auto &thread : threads)
        thread.join();

    ASSERT_EQ(failures.load(), 0);
    for (int t = 0; t < kThreads; ++t)
    {
        for (int i = 0; i < kPerThread; ++i)
        {
            const int key = (i + t * 500) % kDistinct;
            auto text = registry.resolve(seen[t][i]);
            ASSERT_TRUE(text.hasValue());
            EXPECT_EQ(text.value(), "name_" + std::to_string(key));
            auto found = registry.find("name_" + std::to_string(key));
            ASSERT_TRUE(found.has_value());
            EXPECT_EQ(*found, seen[t][i]);
        }
    }

    // Thread ranges start 500 keys apart and together cover every key.
    EXPECT_EQ(registry.size(), static_cast<size_t>(kDistinct));
}

TEST(StringRegistryConcurrency, ResolveRunsAlongsideInsertion)
{
    StringRegistry registry;
    auto anchor = registry.intern("anchor");
    ASSERT_TRUE(anchor.hasValue());
    const Handle anchorHandle = anchor.value();

    std::atomic<bool> done{false};
    std::atomic<int> mismatches{0};

    std::thread writer(
        [&]
        {
            for (int i = 0; i < 20000; ++i)
            {
                if (!registry.intern("w" + std::to_string(i)))
                    mismatches.fetch_add(1);
            }
            done.store(true, std::memory_order_release);
        });

    std::vector<std::thread> readers;
    for (int r = 0; r < kThreads - 1; ++r)
    {
        readers.emplace_back(
            [&]
            {
                while (!done.load(std::memory_order_acquire))
                {
                    auto text = registry.resolve(anchorHandle);
                    if (!text || text.value() != "anchor")
                        mismatches.fetch_add(1);

                    // With one writer every index up to size() is published.
                    const size_t n = registry.size();
                    if (n > 0)
                    {
                        const Handle last{static_cast<uint32_t>(n), registry.tag()};
                        if (!registry.resolve(last))
                            mismatches.fetch_add(1);
                    }
                }
            });
    }

    writer.join();
    for (auto &reader : readers)
        reader.join();

    EXPECT_EQ(mismatches.load(), 0);
    EXPECT_EQ(registry.size(), 20001u);
}
