#include "fitting/slot_fitter.h"

#include "logging/logger.h"
#include "metrics/stats_collector.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace subdub {
namespace fitting {

const char* overlapSeverityToString(OverlapSeverity severity) {
    switch (severity) {
    case OverlapSeverity::Partial:
        return "partial";
    case OverlapSeverity::Full:
        return "full";
    case OverlapSeverity::None:
    default:
        return "none";
    }
}

SlotFitter::SlotFitter(TimeStretcher& stretcher, double maxSpeed, int sampleRate,
                       metrics::StatsCollector* stats)
    : stretcher_(stretcher), maxSpeed_(maxSpeed), sampleRate_(sampleRate), stats_(stats) {
    if (!(maxSpeed_ >= 1.0)) {
        throw std::invalid_argument("maxSpeed must be >= 1.0");
    }
    if (sampleRate_ <= 0) {
        throw std::invalid_argument("sampleRate must be positive");
    }
}

FittedSlot SlotFitter::fit(const SlotRequest& request) {
    if (request.position != nextPosition_) {
        throw std::invalid_argument("SlotFitter: cue position " +
                                    std::to_string(request.position) + " fitted out of order (expected " +
                                    std::to_string(nextPosition_) + ")");
    }
    ++nextPosition_;

    const std::int64_t startF = audio::millisecondsToFrames(request.start.count(), sampleRate_);
    const std::int64_t endF = audio::millisecondsToFrames(request.end.count(), sampleRate_);

    FittedSlot fitted;
    SlotResult& r = fitted.result;
    r.cueIndex = request.cueIndex;
    r.position = request.position;
    r.slotFrames = endF - startF;

    const std::int64_t placeStart = std::max(startF, cursor_);
    if (startF > cursor_) {
        r.leadingSilenceFrames = startF - cursor_;
    }
    const std::int64_t effective = endF - placeStart;
    if (startF < cursor_) {
        r.overlapDetected = true;
        r.overlapSeverity = effective > 0 ? OverlapSeverity::Partial : OverlapSeverity::Full;
        LOG_DEBUG("Cue {}: previous audio overlaps by {} frames ({})", request.cueIndex,
                  cursor_ - startF, overlapSeverityToString(r.overlapSeverity));
    }

    const bool hasAudio = !request.failed && request.audio && !request.audio->empty();
    r.rawFrames = hasAudio ? static_cast<std::int64_t>(request.audio->frames()) : 0;

    if (!hasAudio) {
        r.fittedFrames = 0;
        r.silenceFrames = std::max<std::int64_t>(effective, 0);
    } else {
        const double raw = static_cast<double>(r.rawFrames);
        const double desired = effective > 0 ? raw / static_cast<double>(effective) : maxSpeed_;
        r.lateStart = effective <= 0 || desired > maxSpeed_;
        r.stretchFactor = r.lateStart ? maxSpeed_ : std::clamp(desired, 1.0, maxSpeed_);

        if (!r.lateStart && r.rawFrames <= effective) {
            // Fits as is; the remainder of the slot becomes trailing silence.
            r.stretchFactor = 1.0;
            r.fittedFrames = r.rawFrames;
            fitted.audio = request.audio;
        } else if (r.stretchFactor <= 1.0) {
            // maxSpeed == 1.0: nothing to compress with.
            r.fittedFrames = r.rawFrames;
            fitted.audio = request.audio;
        } else {
            const std::int64_t targetFrames =
                r.lateStart ? static_cast<std::int64_t>(std::llround(raw / maxSpeed_)) : effective;

            audio::SampleBuffer stretched;
            StretchResult sr = stretcher_.stretch(*request.audio, r.stretchFactor, stretched);
            if (sr.ok()) {
                fitted.audio = std::make_shared<const audio::SampleBuffer>(
                    audio::fitToFrames(stretched, static_cast<std::size_t>(targetFrames)));
                r.fittedFrames = targetFrames;
            } else {
                LOG_WARN("Cue {}: time-stretch x{:.3f} failed ({}: {}), using raw audio",
                         request.cueIndex, r.stretchFactor, stretchStatusToString(sr.status),
                         sr.message);
                r.stretchFailed = true;
                fitted.audio = request.audio;
                r.fittedFrames = r.rawFrames;
            }
        }
        r.silenceFrames = std::max<std::int64_t>(effective - r.fittedFrames, 0);
    }

    if (r.lateStart) {
        LOG_DEBUG("Cue {}: audio overruns its slot by {} frames at x{:.2f}", request.cueIndex,
                  r.fittedFrames - std::max<std::int64_t>(effective, 0), r.stretchFactor);
    }

    cursor_ = placeStart + r.fittedFrames + r.silenceFrames;

    if (stats_) {
        stats_->recordSlot(r);
    }
    return fitted;
}

}  // namespace fitting
}  // namespace subdub
