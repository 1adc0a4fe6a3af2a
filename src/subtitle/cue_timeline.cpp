#include "subtitle/cue_timeline.h"

#include "logging/logger.h"

#include <algorithm>

namespace subdub {
namespace subtitle {

bool CueTimeline::create(std::vector<Cue> cues, CueTimeline& out, std::string& error) {
    for (const auto& cue : cues) {
        if (cue.start.count() < 0) {
            error = "cue " + std::to_string(cue.index) + " starts before 0";
            return false;
        }
        if (cue.start >= cue.end) {
            error = "cue " + std::to_string(cue.index) + " has start >= end (" +
                    std::to_string(cue.start.count()) + "ms >= " +
                    std::to_string(cue.end.count()) + "ms)";
            return false;
        }
    }

    auto byStart = [](const Cue& a, const Cue& b) { return a.start < b.start; };
    if (!std::is_sorted(cues.begin(), cues.end(), byStart)) {
        LOG_WARN("Cues are not ordered by start time; reordering {} cues", cues.size());
        std::stable_sort(cues.begin(), cues.end(), byStart);
    }

    out = CueTimeline(std::move(cues));
    return true;
}

std::chrono::milliseconds CueTimeline::span() const {
    std::chrono::milliseconds last{0};
    for (const auto& cue : cues_) {
        last = std::max(last, cue.end);
    }
    return last;
}

}  // namespace subtitle
}  // namespace subdub
