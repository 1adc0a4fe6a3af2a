#include "pipeline/dubbing_pipeline.h"

#include "assembly/assembly_buffer.h"
#include "core/duration_parser.h"
#include "core/text_key.h"
#include "fitting/slot_fitter.h"
#include "fitting/time_stretcher.h"
#include "logging/logger.h"
#include "media/duration_probe.h"
#include "subtitle/srt_parser.h"
#include "synthesis/segment_store.h"
#include "synthesis/synthesis_cache.h"
#include "synthesis/synthesis_orchestrator.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <exception>
#include <fstream>
#include <sstream>
#include <system_error>
#include <thread>

namespace subdub {
namespace pipeline {

namespace fs = std::filesystem;

std::filesystem::path defaultWorkDir(const std::string& subtitlePath) {
    std::ifstream file(subtitlePath, std::ios::binary);
    if (!file.is_open()) {
        return {};
    }
    std::ostringstream content;
    content << file.rdbuf();

    char hex[17];
    std::snprintf(hex, sizeof(hex), "%016llx",
                  static_cast<unsigned long long>(fnv1a64(content.str())));
    return fs::current_path() / DubConstants::DEFAULT_TEMP_ROOT / hex;
}

ErrorCode resolveOutputTarget(const std::string& outputPath, const std::string& formatName,
                              std::string& resolvedPath, AudioIO::TrackFormat& format,
                              std::string& error) {
    const std::string extension = AudioIO::extensionOf(outputPath);
    AudioIO::TrackFormat fromExtension;
    const bool extensionKnown = AudioIO::parseTrackFormat(extension, fromExtension);

    resolvedPath = outputPath;
    if (formatName.empty()) {
        if (!extensionKnown) {
            error = "cannot infer the output format from '" + outputPath +
                    "' (use .wav, .flac, .ogg or .opus, or pass --format)";
            return ErrorCode::VALIDATION_UNSUPPORTED_FORMAT;
        }
        format = fromExtension;
        return ErrorCode::OK;
    }

    if (!AudioIO::parseTrackFormat(formatName, format)) {
        error = "unsupported output format '" + formatName + "'";
        return ErrorCode::VALIDATION_UNSUPPORTED_FORMAT;
    }
    if (!extensionKnown || fromExtension != format) {
        std::string suffix = formatName;
        std::transform(suffix.begin(), suffix.end(), suffix.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        resolvedPath += "." + suffix;
        LOG_INFO("Output format '{}' does not match the file name, writing {}", formatName,
                 resolvedPath);
    }
    return ErrorCode::OK;
}

DubbingPipeline::DubbingPipeline(DubConfig config, synthesis::Synthesizer& synthesizer,
                                 fitting::TimeStretcher& stretcher, media::DurationProbe& probe)
    : config_(std::move(config)), synthesizer_(synthesizer), stretcher_(stretcher), probe_(probe) {}

RunResult DubbingPipeline::finish(ErrorCode code, std::string message) {
    RunResult result;
    result.code = code;
    result.message = std::move(message);
    result.stats = stats_.snapshot();
    if (code != ErrorCode::OK) {
        LOG_ERROR("{} ({}): {}", errorCodeToString(code), errorCodeToHex(code), result.message);
    }
    return result;
}

ErrorCode DubbingPipeline::render(const subtitle::CueTimeline& timeline, double targetSeconds,
                                  synthesis::SegmentStore& store, audio::SampleBuffer& output,
                                  std::string& error) {
    const int sampleRate = config_.output.sampleRate;
    stats_.setTotal(timeline.size());

    synthesis::OrchestratorConfig orchConfig;
    orchConfig.voice = config_.synthesis.voice;
    orchConfig.batchSize = static_cast<std::size_t>(config_.orchestration.batchSize);
    orchConfig.retries = config_.synthesis.retries;
    orchConfig.timeout = std::chrono::milliseconds(config_.synthesis.timeoutMs);
    orchConfig.backoffBase = std::chrono::milliseconds(config_.synthesis.backoffMs);
    orchConfig.resume = config_.run.resume;
    orchConfig.sampleRate = sampleRate;

    synthesis::SynthesisCache cache;
    synthesis::SynthesisOrchestrator orchestrator(synthesizer_, cache, store, orchConfig, &stats_);
    synthesis::CueAudioSink sink(timeline.size());

    ErrorCode synthesisCode = ErrorCode::OK;
    std::thread producer([&] { synthesisCode = orchestrator.submit(timeline, sink); });

    if (config_.run.noConcat) {
        producer.join();
        cache.clear();
        if (synthesisCode != ErrorCode::OK) {
            error = sink.abortReason();
        }
        return synthesisCode;
    }

    ErrorCode code = ErrorCode::OK;
    try {
        fitting::SlotFitter fitter(stretcher_, config_.fitting.maxSpeed, sampleRate, &stats_);
        assembly::AssemblyBuffer assembly(sampleRate);

        while (auto item = sink.popNext()) {
            const std::size_t position = item->first;
            const subtitle::Cue& cue = timeline.at(position);
            const synthesis::CueAudio& cueAudio = item->second;

            fitting::SlotRequest request;
            request.position = position;
            request.cueIndex = cue.index;
            request.start = cue.start;
            request.end = cue.end;
            request.audio = cueAudio.audio;
            request.failed = cueAudio.origin == synthesis::SegmentOrigin::Failed;

            fitting::FittedSlot slot = fitter.fit(request);
            assembly.appendSilence(slot.result.leadingSilenceFrames);
            assembly.append(slot.audio);
            assembly.appendSilence(slot.result.silenceFrames);

            LOG_EVERY_N(INFO, 50, "Fitted {}/{} cues", position + 1, timeline.size());
        }

        producer.join();

        if (synthesisCode != ErrorCode::OK) {
            error = "synthesis stopped: " + sink.abortReason();
            code = synthesisCode;
        } else if (fitter.fittedCount() != timeline.size()) {
            error = "only " + std::to_string(fitter.fittedCount()) + " of " +
                    std::to_string(timeline.size()) + " cues reached the assembly";
            code = ErrorCode::INTERNAL_UNKNOWN;
        } else {
            assembly.seal();
            LOG_INFO("Assembled {:.3f}s of audio, target {:.3f}s",
                     audio::framesToSeconds(assembly.cursorFrames(), sampleRate), targetSeconds);
            code = assembly.finalize(targetSeconds, output);
            if (code != ErrorCode::OK) {
                error = "final assembly failed";
            } else {
                stats_.setDurations(targetSeconds, output.durationSeconds());
            }
        }
    } catch (const std::exception& e) {
        orchestrator.cancel();
        sink.abort(e.what());
        if (producer.joinable()) {
            producer.join();
        }
        error = e.what();
        code = ErrorCode::INTERNAL_UNKNOWN;
    }

    cache.clear();
    return code;
}

RunResult DubbingPipeline::run(const std::string& subtitlePath, const std::string& outputPath) {
    stats_.reset();
    std::string error;

    std::error_code ec;
    if (!fs::exists(subtitlePath, ec)) {
        return finish(ErrorCode::VALIDATION_FILE_NOT_FOUND,
                      "subtitle file not found: " + subtitlePath);
    }

    ErrorCode code = validateDubConfig(config_, error);
    if (code != ErrorCode::OK) {
        return finish(code, error);
    }

    std::string trackPath;
    AudioIO::TrackFormat trackFormat = AudioIO::TrackFormat::Wav;
    if (!config_.run.noConcat) {
        code = resolveOutputTarget(outputPath, config_.output.format, trackPath, trackFormat,
                                   error);
        if (code != ErrorCode::OK) {
            return finish(code, error);
        }
    }

    // The target must resolve before any synthesis request is made.
    double targetSeconds = 0.0;
    if (!config_.run.noConcat) {
        media::TargetDurationRequest targetRequest{config_.target.duration,
                                                   config_.target.referenceMedia};
        code = media::resolveTargetDuration(targetRequest, probe_, targetSeconds, error);
        if (code != ErrorCode::OK) {
            return finish(code, error);
        }
    }

    std::vector<subtitle::Cue> cues;
    if (!subtitle::parseSrtFile(subtitlePath, cues)) {
        return finish(ErrorCode::MEDIA_SUBTITLE_EMPTY,
                      "no valid subtitle entry in " + subtitlePath);
    }
    subtitle::CueTimeline timeline;
    if (!subtitle::CueTimeline::create(std::move(cues), timeline, error)) {
        return finish(ErrorCode::VALIDATION_INVALID_CUE, error);
    }

    fs::path workDir = config_.run.tempDir.empty() ? defaultWorkDir(subtitlePath)
                                                   : fs::path(config_.run.tempDir);
    synthesis::SegmentStore store(workDir);
    if (workDir.empty() || !store.prepare()) {
        return finish(ErrorCode::IO_WORKDIR_FAILED,
                      "cannot prepare working directory " + workDir.string());
    }
    LOG_INFO("Working directory: {}", workDir.string());

    if (!config_.run.noConcat) {
        fs::path parent = fs::absolute(trackPath, ec).parent_path();
        if (!parent.empty() && !fs::exists(parent, ec)) {
            fs::create_directories(parent, ec);
            if (ec) {
                return finish(ErrorCode::IO_OUTPUT_WRITE_FAILED,
                              "cannot create output directory " + parent.string());
            }
            LOG_INFO("Created output directory: {}", parent.string());
        }
    }

    LOG_INFO("Processing {} subtitle cues (max speed x{:.2f}, stretcher {})", timeline.size(),
             config_.fitting.maxSpeed, stretcher_.name());

    audio::SampleBuffer track;
    code = render(timeline, targetSeconds, store, track, error);
    if (code != ErrorCode::OK) {
        LOG_INFO("Segments written so far are kept in {} (use --resume)", workDir.string());
        stats_.logSummary();
        return finish(code, error);
    }

    if (config_.run.noConcat) {
        LOG_INFO("Skipping concatenation (--no-concat); segments saved in {}", workDir.string());
    } else {
        LOG_INFO("Writing {} ({}, {} frames)", trackPath,
                 AudioIO::trackFormatToString(trackFormat), track.frames());
        if (!AudioIO::writeAudioFile(trackPath, track, trackFormat)) {
            stats_.logSummary();
            return finish(ErrorCode::IO_OUTPUT_WRITE_FAILED, "cannot write " + trackPath);
        }
    }

    stats_.logSummary();
    RunResult result = finish(ErrorCode::OK, "");

    if (!config_.output.statsFile.empty() &&
        !metrics::writeStatsFile(config_.output.statsFile, result.stats)) {
        LOG_WARN("Could not write stats file {}", config_.output.statsFile);
    }

    const bool cleanRun = result.stats.failed == 0;
    if (cleanRun && !config_.run.resume && !config_.run.keepTemp && !config_.run.noConcat) {
        store.removeAll();
        LOG_INFO("Cleaned working directory (including cache)");
    } else {
        LOG_INFO("Working directory kept: {}", workDir.string());
    }
    return result;
}

}  // namespace pipeline
}  // namespace subdub
