#pragma once

#include "audio/sample_buffer.h"
#include "fitting/slot_result.h"
#include "fitting/time_stretcher.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>

namespace subdub {

namespace metrics {
class StatsCollector;
}

namespace fitting {

// Input of one fit() call. `audio` is in the working format; null, empty or a
// failed cue means whatever remains of the slot is filled with silence.
struct SlotRequest {
    std::size_t position = 0;
    int cueIndex = 0;
    std::chrono::milliseconds start{0};
    std::chrono::milliseconds end{0};
    std::shared_ptr<const audio::SampleBuffer> audio;
    bool failed = false;
};

struct FittedSlot {
    SlotResult result;
    // Audio to place after the leading silence; shares the raw buffer when no
    // stretch was needed. Null for silence-only slots.
    std::shared_ptr<const audio::SampleBuffer> audio;
};

// Sequential time-slot filling.
//
// Keeps a cursor at the end of the audio placed so far. Each cue starts at
// max(start, cursor), is compressed up to maxSpeed when its audio is longer than
// the remaining slot, and is padded with silence when shorter. Audio that still
// does not fit pushes the cursor into the following cue; the overflow is carried
// forward until a gap absorbs it.
class SlotFitter {
   public:
    SlotFitter(TimeStretcher& stretcher, double maxSpeed,
               int sampleRate = audio::kDefaultSampleRate,
               metrics::StatsCollector* stats = nullptr);

    // Cues must be fitted in position order, each exactly once.
    // Throws std::invalid_argument otherwise.
    FittedSlot fit(const SlotRequest& request);

    std::int64_t cursorFrames() const {
        return cursor_;
    }
    std::size_t fittedCount() const {
        return nextPosition_;
    }
    double maxSpeed() const {
        return maxSpeed_;
    }
    int sampleRate() const {
        return sampleRate_;
    }

   private:
    TimeStretcher& stretcher_;
    double maxSpeed_;
    int sampleRate_;
    metrics::StatsCollector* stats_;
    std::int64_t cursor_ = 0;
    std::size_t nextPosition_ = 0;
};

}  // namespace fitting
}  // namespace subdub
