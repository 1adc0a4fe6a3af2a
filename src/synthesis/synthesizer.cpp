#include "synthesis/synthesizer.h"

namespace subdub {
namespace synthesis {

const char* synthesisStatusToString(SynthesisStatus status) {
    switch (status) {
    case SynthesisStatus::Ok:
        return "ok";
    case SynthesisStatus::TransientError:
        return "transient_error";
    case SynthesisStatus::Timeout:
        return "timeout";
    case SynthesisStatus::PermanentError:
    default:
        return "permanent_error";
    }
}

}  // namespace synthesis
}  // namespace subdub
