#pragma once

#include "audio/audio_io.h"
#include "audio/sample_buffer.h"
#include "core/config_loader.h"
#include "core/error_codes.h"
#include "metrics/stats_collector.h"
#include "subtitle/cue_timeline.h"

#include <filesystem>
#include <string>

namespace subdub {

namespace synthesis {
class Synthesizer;
class SegmentStore;
}  // namespace synthesis
namespace fitting {
class TimeStretcher;
}
namespace media {
class DurationProbe;
}

namespace pipeline {

struct RunResult {
    ErrorCode code = ErrorCode::OK;
    std::string message;
    metrics::RunStats stats;

    bool ok() const {
        return code == ErrorCode::OK;
    }
};

// ./temp/<hash of the subtitle file content>. Empty path if the file cannot be read.
std::filesystem::path defaultWorkDir(const std::string& subtitlePath);

// Output file and container for a run. `formatName` (may be empty) wins over the
// extension; when they disagree the format's extension is appended to the path.
ErrorCode resolveOutputTarget(const std::string& outputPath, const std::string& formatName,
                              std::string& resolvedPath, AudioIO::TrackFormat& format,
                              std::string& error);

// One dubbing run: subtitles in, one track of the target duration out.
//
// Synthesis runs on a producer thread; the calling thread consumes results in
// cue order, fits each one into its slot and appends it to the assembly buffer.
class DubbingPipeline {
   public:
    DubbingPipeline(DubConfig config, synthesis::Synthesizer& synthesizer,
                    fitting::TimeStretcher& stretcher, media::DurationProbe& probe);

    DubbingPipeline(const DubbingPipeline&) = delete;
    DubbingPipeline& operator=(const DubbingPipeline&) = delete;

    RunResult run(const std::string& subtitlePath, const std::string& outputPath);

    // Synthesis, fitting and assembly of a parsed timeline. `output` is left
    // untouched when run.noConcat is set.
    ErrorCode render(const subtitle::CueTimeline& timeline, double targetSeconds,
                     synthesis::SegmentStore& store, audio::SampleBuffer& output,
                     std::string& error);

    metrics::StatsCollector& stats() {
        return stats_;
    }
    const DubConfig& config() const {
        return config_;
    }

   private:
    RunResult finish(ErrorCode code, std::string message);

    DubConfig config_;
    synthesis::Synthesizer& synthesizer_;
    fitting::TimeStretcher& stretcher_;
    media::DurationProbe& probe_;
    metrics::StatsCollector stats_;
};

}  // namespace pipeline
}  // namespace subdub
