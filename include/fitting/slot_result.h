#pragma once

#include <cstddef>
#include <cstdint>

namespace subdub {
namespace fitting {

enum class OverlapSeverity {
    None,
    Partial,  // Previous audio runs into the slot but part of it remains
    Full,     // Previous audio already covers the whole slot
};

const char* overlapSeverityToString(OverlapSeverity severity);

// Placement of one cue on the output timeline. All durations are frame counts
// at the working sample rate.
struct SlotResult {
    int cueIndex = 0;
    std::size_t position = 0;

    std::int64_t slotFrames = 0;            // Nominal end - start
    std::int64_t rawFrames = 0;             // Synthesized length before fitting
    std::int64_t fittedFrames = 0;          // Length after stretching
    std::int64_t leadingSilenceFrames = 0;  // Gap between the cursor and the cue start
    std::int64_t silenceFrames = 0;         // Trailing silence up to the slot end

    double stretchFactor = 1.0;
    bool overlapDetected = false;
    OverlapSeverity overlapSeverity = OverlapSeverity::None;
    bool lateStart = false;
    bool stretchFailed = false;

    double fittedSeconds(int sampleRate) const {
        return sampleRate > 0 ? static_cast<double>(fittedFrames) / sampleRate : 0.0;
    }
    double silenceSeconds(int sampleRate) const {
        return sampleRate > 0 ? static_cast<double>(silenceFrames) / sampleRate : 0.0;
    }
};

}  // namespace fitting
}  // namespace subdub
