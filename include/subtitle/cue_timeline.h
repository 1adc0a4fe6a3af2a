#ifndef SUBDUB_CUE_TIMELINE_H
#define SUBDUB_CUE_TIMELINE_H

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace subdub {
namespace subtitle {

struct Cue {
    int index = 0;  // Index as written in the subtitle file
    std::chrono::milliseconds start{0};
    std::chrono::milliseconds end{0};
    std::string text;

    std::chrono::milliseconds length() const {
        return end - start;
    }
};

// Immutable, start-ordered list of cues. Positions (0..size-1) identify cues
// throughout the pipeline; Cue::index is only carried for log output.
class CueTimeline {
   public:
    CueTimeline() = default;

    // Validates start < end for every cue and stable-sorts by start.
    // Returns false and fills `error` for the first invalid cue.
    static bool create(std::vector<Cue> cues, CueTimeline& out, std::string& error);

    std::size_t size() const {
        return cues_.size();
    }
    bool empty() const {
        return cues_.empty();
    }
    const Cue& at(std::size_t position) const {
        return cues_.at(position);
    }
    const std::vector<Cue>& cues() const {
        return cues_;
    }

    std::vector<Cue>::const_iterator begin() const {
        return cues_.begin();
    }
    std::vector<Cue>::const_iterator end() const {
        return cues_.end();
    }

    // End of the last cue (0 when empty).
    std::chrono::milliseconds span() const;

   private:
    explicit CueTimeline(std::vector<Cue> cues) : cues_(std::move(cues)) {}

    std::vector<Cue> cues_;
};

}  // namespace subtitle
}  // namespace subdub

#endif  // SUBDUB_CUE_TIMELINE_H
