#include "fitting/time_stretcher.h"

#include "logging/logger.h"

#include <algorithm>
#include <cctype>
#include <exception>
#include <vector>

#ifdef SUBDUB_ENABLE_RUBBERBAND
#include <rubberband/RubberBandStretcher.h>
#endif

namespace subdub {
namespace fitting {
namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

StretchResult checkInput(const audio::SampleBuffer& input, double factor) {
    if (input.empty() || input.sampleRate <= 0 || input.channels <= 0) {
        return {StretchStatus::InvalidInput, "empty input buffer"};
    }
    if (!(factor >= 1.0)) {
        return {StretchStatus::InvalidInput, "stretch factor must be >= 1.0"};
    }
    return {StretchStatus::Ok, ""};
}

class BypassTimeStretcher final : public TimeStretcher {
   public:
    const char* name() const override {
        return "bypass";
    }

    StretchResult stretch(const audio::SampleBuffer& input, double factor,
                          audio::SampleBuffer& output) override {
        output = audio::SampleBuffer(input.sampleRate, input.channels);
        StretchResult check = checkInput(input, factor);
        if (!check.ok()) {
            return check;
        }
        return {StretchStatus::Unsupported, "time-stretching is disabled (bypass backend)"};
    }
};

#ifdef SUBDUB_ENABLE_RUBBERBAND

class RubberBandTimeStretcher final : public TimeStretcher {
   public:
    const char* name() const override {
        return "rubberband";
    }

    StretchResult stretch(const audio::SampleBuffer& input, double factor,
                          audio::SampleBuffer& output) override {
        output = audio::SampleBuffer(input.sampleRate, input.channels);
        StretchResult check = checkInput(input, factor);
        if (!check.ok()) {
            return check;
        }

        const std::size_t channels = static_cast<std::size_t>(input.channels);
        const std::size_t frames = input.frames();

        // RubberBand works on planar channels.
        std::vector<std::vector<float>> planar(channels, std::vector<float>(frames));
        for (std::size_t i = 0; i < frames; ++i) {
            for (std::size_t c = 0; c < channels; ++c) {
                planar[c][i] = input.samples[i * channels + c];
            }
        }
        std::vector<const float*> inPtrs(channels);
        for (std::size_t c = 0; c < channels; ++c) {
            inPtrs[c] = planar[c].data();
        }

        try {
            RubberBand::RubberBandStretcher stretcher(
                static_cast<size_t>(input.sampleRate), channels,
                RubberBand::RubberBandStretcher::OptionProcessOffline |
                    RubberBand::RubberBandStretcher::OptionThreadingNever,
                1.0 / factor, 1.0);
            stretcher.setExpectedInputDuration(frames);
            stretcher.setMaxProcessSize(frames);

            stretcher.study(inPtrs.data(), frames, true);
            stretcher.process(inPtrs.data(), frames, true);

            std::vector<std::vector<float>> outPlanar(channels);
            std::vector<float*> outPtrs(channels);
            int available = 0;
            while ((available = stretcher.available()) > 0) {
                const auto chunk = static_cast<std::size_t>(available);
                std::vector<std::vector<float>> block(channels, std::vector<float>(chunk));
                for (std::size_t c = 0; c < channels; ++c) {
                    outPtrs[c] = block[c].data();
                }
                std::size_t got = stretcher.retrieve(outPtrs.data(), chunk);
                for (std::size_t c = 0; c < channels; ++c) {
                    outPlanar[c].insert(outPlanar[c].end(), block[c].begin(),
                                        block[c].begin() + static_cast<std::ptrdiff_t>(got));
                }
            }

            const std::size_t outFrames = outPlanar.empty() ? 0 : outPlanar[0].size();
            output.samples.resize(outFrames * channels);
            for (std::size_t i = 0; i < outFrames; ++i) {
                for (std::size_t c = 0; c < channels; ++c) {
                    output.samples[i * channels + c] = outPlanar[c][i];
                }
            }
        } catch (const std::exception& e) {
            output.samples.clear();
            return {StretchStatus::Error, std::string("RubberBand failed: ") + e.what()};
        }

        if (output.empty()) {
            return {StretchStatus::Error, "RubberBand produced no output"};
        }
        return {StretchStatus::Ok, ""};
    }
};

#else  // SUBDUB_ENABLE_RUBBERBAND

class RubberBandTimeStretcher final : public TimeStretcher {
   public:
    const char* name() const override {
        return "rubberband";
    }

    StretchResult stretch(const audio::SampleBuffer& input, double factor,
                          audio::SampleBuffer& output) override {
        output = audio::SampleBuffer(input.sampleRate, input.channels);
        StretchResult check = checkInput(input, factor);
        if (!check.ok()) {
            return check;
        }
        return {StretchStatus::Unsupported,
                "RubberBand backend is not enabled at build time (rebuild with "
                "SUBDUB_ENABLE_RUBBERBAND=ON)"};
    }
};

#endif  // SUBDUB_ENABLE_RUBBERBAND

}  // namespace

const char* stretchStatusToString(StretchStatus status) {
    switch (status) {
    case StretchStatus::Ok:
        return "ok";
    case StretchStatus::Unsupported:
        return "unsupported";
    case StretchStatus::InvalidInput:
        return "invalid_input";
    case StretchStatus::Error:
    default:
        return "error";
    }
}

std::unique_ptr<TimeStretcher> createTimeStretcher(const std::string& backend) {
    std::string lower = toLower(backend);

    if (lower == "bypass" || lower == "none") {
        return std::make_unique<BypassTimeStretcher>();
    }

    if (lower == "rubberband" || lower == "rubber-band") {
        return std::make_unique<RubberBandTimeStretcher>();
    }

    LOG_WARN("Stretcher: Unknown backend '{}' (falling back to bypass)", backend);
    return std::make_unique<BypassTimeStretcher>();
}

}  // namespace fitting
}  // namespace subdub
