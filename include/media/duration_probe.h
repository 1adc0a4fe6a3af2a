#pragma once

#include "core/error_codes.h"

#include <chrono>
#include <optional>
#include <string>

namespace subdub {
namespace media {

// Reports the duration of a media file in seconds.
class DurationProbe {
   public:
    virtual ~DurationProbe() = default;

    virtual const char* name() const = 0;
    virtual std::optional<double> probeSeconds(const std::string& mediaPath) = 0;
};

// Runs `ffprobe -v error -show_entries format=duration -of csv=p=0 <file>`.
class FfprobeDurationProbe final : public DurationProbe {
   public:
    explicit FfprobeDurationProbe(std::string executable = "ffprobe",
                                  std::chrono::milliseconds timeout = std::chrono::seconds(30));

    const char* name() const override {
        return "ffprobe";
    }
    std::optional<double> probeSeconds(const std::string& mediaPath) override;

   private:
    std::string executable_;
    std::chrono::milliseconds timeout_;
};

// Parse ffprobe's duration output ("93.480000\n"). std::nullopt for "N/A" or garbage.
std::optional<double> parseProbeOutput(const std::string& output);

struct TargetDurationRequest {
    std::string explicitDuration;  // "HH:MM:SS[.fff]", "MM:SS[.fff]" or seconds
    std::string referenceMedia;    // File whose duration is probed
};

// Exactly one of the two sources must be set and resolve.
ErrorCode resolveTargetDuration(const TargetDurationRequest& request, DurationProbe& probe,
                                double& seconds, std::string& error);

}  // namespace media
}  // namespace subdub
