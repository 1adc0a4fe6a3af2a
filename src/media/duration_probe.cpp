#include "media/duration_probe.h"

#include "core/duration_parser.h"
#include "core/process_runner.h"
#include "logging/logger.h"

#include <cmath>
#include <cstdlib>
#include <filesystem>

namespace subdub {
namespace media {

FfprobeDurationProbe::FfprobeDurationProbe(std::string executable,
                                           std::chrono::milliseconds timeout)
    : executable_(std::move(executable)), timeout_(timeout) {}

std::optional<double> parseProbeOutput(const std::string& output) {
    std::size_t begin = output.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return std::nullopt;
    }
    std::size_t end = output.find_first_of(" \t\r\n", begin);
    std::string token = output.substr(begin, end == std::string::npos ? end : end - begin);

    char* parsedEnd = nullptr;
    double value = std::strtod(token.c_str(), &parsedEnd);
    if (parsedEnd == token.c_str() || *parsedEnd != '\0' || !std::isfinite(value) || value < 0.0) {
        return std::nullopt;
    }
    return value;
}

std::optional<double> FfprobeDurationProbe::probeSeconds(const std::string& mediaPath) {
    ProcessResult proc = runProcess({executable_, "-v", "error", "-show_entries",
                                     "format=duration", "-of", "csv=p=0", mediaPath},
                                    timeout_, true);
    if (!proc.started) {
        LOG_ERROR("Cannot run {} (is FFmpeg installed?)", executable_);
        return std::nullopt;
    }
    if (!proc.succeeded()) {
        LOG_ERROR("{} failed on {} (exit {}{})", executable_, mediaPath, proc.exitCode,
                  proc.timedOut ? ", timed out" : "");
        return std::nullopt;
    }
    auto seconds = parseProbeOutput(proc.output);
    if (!seconds) {
        LOG_ERROR("{} reported no duration for {}", executable_, mediaPath);
    }
    return seconds;
}

ErrorCode resolveTargetDuration(const TargetDurationRequest& request, DurationProbe& probe,
                                double& seconds, std::string& error) {
    const bool hasExplicit = !request.explicitDuration.empty();
    const bool hasReference = !request.referenceMedia.empty();

    if (hasExplicit && hasReference) {
        error = "both an expected duration and a reference media file were given";
        return ErrorCode::VALIDATION_AMBIGUOUS_TARGET;
    }
    if (!hasExplicit && !hasReference) {
        error = "no target duration: pass --expected-duration or --ref-media";
        return ErrorCode::VALIDATION_NO_TARGET_DURATION;
    }

    if (hasExplicit) {
        auto parsed = parseDurationString(request.explicitDuration);
        if (!parsed) {
            error = "invalid duration '" + request.explicitDuration + "'";
            return ErrorCode::VALIDATION_NO_TARGET_DURATION;
        }
        seconds = *parsed;
        LOG_INFO("Target duration: {} (explicit)", formatDuration(seconds));
        return ErrorCode::OK;
    }

    std::error_code ec;
    if (!std::filesystem::exists(request.referenceMedia, ec)) {
        error = "reference media not found: " + request.referenceMedia;
        return ErrorCode::VALIDATION_FILE_NOT_FOUND;
    }
    auto probed = probe.probeSeconds(request.referenceMedia);
    if (!probed) {
        error = "cannot determine the duration of " + request.referenceMedia;
        return ErrorCode::MEDIA_PROBE_FAILED;
    }
    seconds = *probed;
    LOG_INFO("Target duration: {} (from {} via {})", formatDuration(seconds),
             request.referenceMedia, probe.name());
    return ErrorCode::OK;
}

}  // namespace media
}  // namespace subdub
