#pragma once

#include "audio/sample_buffer.h"

#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace subdub {
namespace synthesis {

// Outcome of one production for a cache key.
struct ProduceResult {
    bool ok = false;
    std::shared_ptr<const audio::SampleBuffer> buffer;
    bool loadedFromDisk = false;  // Served by the persisted text cache, no synthesis call
    std::string message;
};

enum class CacheOrigin {
    Produced,  // This caller ran the producer
    Hit,       // Entry was already complete
    Joined,    // Waited on another caller's in-flight production
};

struct CacheLookup {
    bool ok = false;
    CacheOrigin origin = CacheOrigin::Produced;
    std::shared_ptr<const audio::SampleBuffer> buffer;
    bool loadedFromDisk = false;
    std::string textHash;
    std::string message;
};

struct CacheEntry {
    std::string textHash;
    std::shared_ptr<const audio::SampleBuffer> buffer;
    std::size_t hitCount = 0;
};

// Run-scoped, single-flight map from normalized cue text to synthesized audio.
//
// Exactly one producer runs per distinct key; concurrent requesters for the same
// key block on that production instead of starting their own. A failed
// production is handed to every waiter and then dropped, so a later request for
// the key runs the producer again.
class SynthesisCache {
   public:
    using Producer = std::function<ProduceResult()>;

    SynthesisCache() = default;
    SynthesisCache(const SynthesisCache&) = delete;
    SynthesisCache& operator=(const SynthesisCache&) = delete;

    CacheLookup getOrCreate(const std::string& text, const Producer& producer);

    // Completed entries only.
    std::size_t size() const;
    bool contains(const std::string& text) const;
    std::size_t hitCount(const std::string& text) const;
    std::vector<CacheEntry> entries() const;

    void clear();

   private:
    struct Slot {
        std::shared_future<ProduceResult> result;
        std::string textHash;
        std::size_t hitCount = 0;
        bool ready = false;
    };

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Slot> slots_;
};

}  // namespace synthesis
}  // namespace subdub
