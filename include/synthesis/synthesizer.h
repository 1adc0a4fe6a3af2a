#pragma once

#include "audio/sample_buffer.h"

#include <chrono>
#include <string>

namespace subdub {
namespace synthesis {

enum class SynthesisStatus {
    Ok,
    TransientError,  // Network hiccup, service busy; worth retrying
    Timeout,         // Attempt exceeded its deadline; counts toward the retry budget
    PermanentError,  // Retrying cannot help (bad voice, missing binary)
};

struct SynthesisResult {
    SynthesisStatus status = SynthesisStatus::TransientError;
    std::string message;
    audio::SampleBuffer audio;  // Native format of the engine; converted by the caller

    bool ok() const {
        return status == SynthesisStatus::Ok;
    }
};

const char* synthesisStatusToString(SynthesisStatus status);

// Speech synthesis collaborator. Implementations must be safe to call from
// several threads at once; the orchestrator runs one call per in-flight cue.
class Synthesizer {
   public:
    virtual ~Synthesizer() = default;

    virtual const char* name() const = 0;

    virtual SynthesisResult synthesize(const std::string& text, const std::string& voice,
                                       std::chrono::milliseconds timeout) = 0;
};

}  // namespace synthesis
}  // namespace subdub
