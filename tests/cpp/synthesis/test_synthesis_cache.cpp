/**
 * @file test_synthesis_cache.cpp
 * @brief Unit tests for the single-flight synthesis cache
 */

#include "core/text_key.h"
#include "synthesis/synthesis_cache.h"

#include <atomic>
#include <chrono>
#include <gtest/gtest.h>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace subdub;
using namespace subdub::synthesis;

namespace {

ProduceResult makeAudio(std::size_t frames) {
    ProduceResult result;
    result.ok = true;
    auto buffer = std::make_shared<audio::SampleBuffer>(24000, 1);
    buffer->samples.assign(frames, 0.5f);
    result.buffer = buffer;
    return result;
}

}  // namespace

TEST(SynthesisCache, FirstCallProducesLaterCallsHit) {
    SynthesisCache cache;
    int produced = 0;
    auto producer = [&] {
        ++produced;
        return makeAudio(10);
    };

    CacheLookup first = cache.getOrCreate("Yes", producer);
    CacheLookup second = cache.getOrCreate("Yes", producer);

    EXPECT_EQ(produced, 1);
    EXPECT_TRUE(first.ok);
    EXPECT_EQ(first.origin, CacheOrigin::Produced);
    EXPECT_EQ(second.origin, CacheOrigin::Hit);
    EXPECT_EQ(first.buffer, second.buffer);
    EXPECT_EQ(first.textHash, textHash("Yes"));
    EXPECT_EQ(cache.hitCount("Yes"), 1u);
    EXPECT_EQ(cache.size(), 1u);
}

TEST(SynthesisCache, KeyIsNormalizedText) {
    SynthesisCache cache;
    int produced = 0;
    auto producer = [&] {
        ++produced;
        return makeAudio(10);
    };
    cache.getOrCreate("Hello\nworld", producer);
    CacheLookup lookup = cache.getOrCreate("  Hello world ", producer);
    EXPECT_EQ(produced, 1);
    EXPECT_EQ(lookup.origin, CacheOrigin::Hit);
}

TEST(SynthesisCache, ConcurrentRequestsShareOneProduction) {
    SynthesisCache cache;
    std::atomic<int> produced{0};
    auto producer = [&] {
        produced.fetch_add(1);
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        return makeAudio(100);
    };

    constexpr int kThreads = 8;
    std::vector<CacheLookup> results(kThreads);
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&, i] { results[i] = cache.getOrCreate("same text", producer); });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(produced.load(), 1);
    int producers = 0;
    for (const auto& r : results) {
        EXPECT_TRUE(r.ok);
        ASSERT_TRUE(r.buffer);
        EXPECT_EQ(r.buffer->frames(), 100u);
        if (r.origin == CacheOrigin::Produced) {
            ++producers;
        }
    }
    EXPECT_EQ(producers, 1);
    EXPECT_EQ(cache.hitCount("same text"), static_cast<std::size_t>(kThreads - 1));
}

TEST(SynthesisCache, FailedProductionIsRetriedLater) {
    SynthesisCache cache;
    int calls = 0;
    auto failing = [&] {
        ++calls;
        ProduceResult result;
        result.message = "service down";
        return result;
    };

    CacheLookup first = cache.getOrCreate("x", failing);
    EXPECT_FALSE(first.ok);
    EXPECT_EQ(first.message, "service down");
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_FALSE(cache.contains("x"));

    CacheLookup second = cache.getOrCreate("x", [&] {
        ++calls;
        return makeAudio(5);
    });
    EXPECT_TRUE(second.ok);
    EXPECT_EQ(second.origin, CacheOrigin::Produced);
    EXPECT_EQ(calls, 2);
}

TEST(SynthesisCache, ThrowingProducerBecomesFailure) {
    SynthesisCache cache;
    CacheLookup lookup = cache.getOrCreate("boom", []() -> ProduceResult {
        throw std::runtime_error("producer exploded");
    });
    EXPECT_FALSE(lookup.ok);
    EXPECT_EQ(lookup.message, "producer exploded");
}

TEST(SynthesisCache, EntriesAndClear) {
    SynthesisCache cache;
    cache.getOrCreate("a", [] { return makeAudio(1); });
    cache.getOrCreate("b", [] { return makeAudio(2); });
    cache.getOrCreate("a", [] { return makeAudio(1); });

    auto entries = cache.entries();
    ASSERT_EQ(entries.size(), 2u);
    std::size_t hits = 0;
    for (const auto& e : entries) {
        hits += e.hitCount;
        EXPECT_TRUE(e.buffer);
    }
    EXPECT_EQ(hits, 1u);

    cache.clear();
    EXPECT_EQ(cache.size(), 0u);
}
