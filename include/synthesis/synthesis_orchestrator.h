#pragma once

#include "audio/sample_buffer.h"
#include "core/dub_constants.h"
#include "core/error_codes.h"
#include "subtitle/cue_timeline.h"
#include "synthesis/reorder_buffer.h"
#include "synthesis/synthesizer.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>

namespace subdub {

namespace metrics {
class StatsCollector;
}

namespace synthesis {

class SegmentStore;
class SynthesisCache;

enum class SegmentOrigin {
    Generated,  // Synthesized in this run
    Cached,     // Same text already synthesized (this run or the persisted text cache)
    Resumed,    // Loaded from a previous run's segment file
    Empty,      // Blank text, no synthesis
    Failed,     // Retries exhausted; audio is slot-length silence
};

const char* segmentOriginToString(SegmentOrigin origin);

// Per-cue output of the orchestrator, in the working format.
struct CueAudio {
    SegmentOrigin origin = SegmentOrigin::Failed;
    std::shared_ptr<const audio::SampleBuffer> audio;
    std::string textHash;
    std::string message;
};

struct OrchestratorConfig {
    std::string voice = DubConstants::DEFAULT_VOICE;
    std::size_t batchSize = DubConstants::DEFAULT_BATCH_SIZE;
    int retries = DubConstants::DEFAULT_RETRIES;
    std::chrono::milliseconds timeout{DubConstants::DEFAULT_TIMEOUT_MS};
    std::chrono::milliseconds backoffBase{DubConstants::DEFAULT_BACKOFF_MS};
    bool resume = false;
    int sampleRate = audio::kDefaultSampleRate;
};

using CueAudioSink = ReorderBuffer<CueAudio>;

// Runs synthesis for a whole timeline in batches of `batchSize` concurrent
// requests. Results reach the sink as each request completes, tagged with their
// timeline position.
class SynthesisOrchestrator {
   public:
    SynthesisOrchestrator(Synthesizer& synthesizer, SynthesisCache& cache, SegmentStore& store,
                          OrchestratorConfig config, metrics::StatsCollector* stats = nullptr);

    SynthesisOrchestrator(const SynthesisOrchestrator&) = delete;
    SynthesisOrchestrator& operator=(const SynthesisOrchestrator&) = delete;

    // Blocks until every cue was delivered or a fatal error stopped the run.
    // On success the sink is closed; on a fatal error it is aborted.
    ErrorCode submit(const subtitle::CueTimeline& timeline, CueAudioSink& sink);

    // Stops scheduling further batches and interrupts retry backoff.
    void cancel();
    bool cancelled() const {
        return cancelled_.load(std::memory_order_acquire);
    }

    const OrchestratorConfig& config() const {
        return config_;
    }

   private:
    ErrorCode processCue(std::size_t position, const subtitle::Cue& cue, CueAudioSink& sink);
    SynthesisResult synthesizeWithRetry(const std::string& text, int cueIndex);
    // False when cancelled during the wait.
    bool waitBackoff(std::chrono::milliseconds delay);
    CueAudio failedCue(const subtitle::Cue& cue, const std::string& hash,
                       const std::string& message) const;

    Synthesizer& synthesizer_;
    SynthesisCache& cache_;
    SegmentStore& store_;
    OrchestratorConfig config_;
    metrics::StatsCollector* stats_;

    std::atomic<bool> cancelled_{false};
    std::mutex cancelMutex_;
    std::condition_variable cancelCv_;
};

}  // namespace synthesis
}  // namespace subdub
