#pragma once

#include "audio/sample_buffer.h"

#include <memory>
#include <string>

namespace subdub {
namespace fitting {

enum class StretchStatus {
    Ok,
    Unsupported,
    InvalidInput,
    Error,
};

struct StretchResult {
    StretchStatus status = StretchStatus::Error;
    std::string message;

    bool ok() const {
        return status == StretchStatus::Ok;
    }
};

const char* stretchStatusToString(StretchStatus status);

// Pitch-preserving tempo change. `factor` > 1 shortens the audio: the output
// holds roughly frames / factor frames at the input sample rate. The caller
// trims or pads to the exact length it needs.
class TimeStretcher {
   public:
    virtual ~TimeStretcher() = default;

    virtual const char* name() const = 0;

    virtual StretchResult stretch(const audio::SampleBuffer& input, double factor,
                                  audio::SampleBuffer& output) = 0;
};

// "rubberband" or "bypass" (case-insensitive). Unknown names fall back to bypass.
std::unique_ptr<TimeStretcher> createTimeStretcher(const std::string& backend);

}  // namespace fitting
}  // namespace subdub
