#include "synthesis/synthesis_cache.h"

#include "core/text_key.h"
#include "logging/logger.h"

#include <exception>

namespace subdub {
namespace synthesis {

CacheLookup SynthesisCache::getOrCreate(const std::string& text, const Producer& producer) {
    const std::string key = normalizeCueText(text);

    std::unique_lock<std::mutex> lock(mutex_);
    auto it = slots_.find(key);
    if (it != slots_.end()) {
        Slot& slot = it->second;
        ++slot.hitCount;
        const bool wasReady = slot.ready;
        std::shared_future<ProduceResult> pending = slot.result;
        std::string hash = slot.textHash;
        lock.unlock();

        const ProduceResult& produced = pending.get();
        CacheLookup lookup;
        lookup.ok = produced.ok;
        lookup.origin = wasReady ? CacheOrigin::Hit : CacheOrigin::Joined;
        lookup.buffer = produced.buffer;
        lookup.textHash = std::move(hash);
        lookup.message = produced.message;
        return lookup;
    }

    std::promise<ProduceResult> promise;
    Slot slot;
    slot.result = promise.get_future().share();
    slot.textHash = textHash(key);
    const std::string hash = slot.textHash;
    slots_.emplace(key, std::move(slot));
    lock.unlock();

    ProduceResult produced;
    try {
        produced = producer();
    } catch (const std::exception& e) {
        LOG_ERROR("Synthesis producer for [{}] threw: {}", hash, e.what());
        produced = ProduceResult{};
        produced.message = e.what();
    }
    promise.set_value(produced);

    lock.lock();
    auto done = slots_.find(key);
    if (done != slots_.end()) {
        if (produced.ok) {
            done->second.ready = true;
        } else {
            slots_.erase(done);
        }
    }
    lock.unlock();

    CacheLookup lookup;
    lookup.ok = produced.ok;
    lookup.origin = CacheOrigin::Produced;
    lookup.buffer = produced.buffer;
    lookup.loadedFromDisk = produced.loadedFromDisk;
    lookup.textHash = hash;
    lookup.message = produced.message;
    return lookup;
}

std::size_t SynthesisCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t count = 0;
    for (const auto& entry : slots_) {
        if (entry.second.ready) {
            ++count;
        }
    }
    return count;
}

bool SynthesisCache::contains(const std::string& text) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = slots_.find(normalizeCueText(text));
    return it != slots_.end() && it->second.ready;
}

std::size_t SynthesisCache::hitCount(const std::string& text) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = slots_.find(normalizeCueText(text));
    return it != slots_.end() ? it->second.hitCount : 0;
}

std::vector<CacheEntry> SynthesisCache::entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<CacheEntry> out;
    out.reserve(slots_.size());
    for (const auto& entry : slots_) {
        if (!entry.second.ready) {
            continue;
        }
        CacheEntry item;
        item.textHash = entry.second.textHash;
        item.buffer = entry.second.result.get().buffer;
        item.hitCount = entry.second.hitCount;
        out.push_back(std::move(item));
    }
    return out;
}

void SynthesisCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    // In-flight producers still hold their promise; they find no slot and skip bookkeeping.
    slots_.clear();
}

}  // namespace synthesis
}  // namespace subdub
