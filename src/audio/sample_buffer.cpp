#include "audio/sample_buffer.h"

#include <algorithm>
#include <cmath>

namespace subdub {
namespace audio {

double SampleBuffer::durationSeconds() const {
    if (sampleRate <= 0) {
        return 0.0;
    }
    return static_cast<double>(frames()) / static_cast<double>(sampleRate);
}

SampleBuffer makeSilence(std::size_t frames, int sampleRate, int channels) {
    SampleBuffer buffer(sampleRate, channels);
    buffer.samples.assign(frames * static_cast<std::size_t>(channels), 0.0f);
    return buffer;
}

std::int64_t secondsToFrames(double seconds, int sampleRate) {
    return static_cast<std::int64_t>(std::llround(seconds * static_cast<double>(sampleRate)));
}

std::int64_t millisecondsToFrames(std::int64_t milliseconds, int sampleRate) {
    // Integer path first: exact whenever the rate is a multiple of 1000.
    if (sampleRate % 1000 == 0) {
        return milliseconds * (sampleRate / 1000);
    }
    return static_cast<std::int64_t>(
        std::llround(static_cast<double>(milliseconds) * sampleRate / 1000.0));
}

double framesToSeconds(std::int64_t frames, int sampleRate) {
    if (sampleRate <= 0) {
        return 0.0;
    }
    return static_cast<double>(frames) / static_cast<double>(sampleRate);
}

SampleBuffer toWorkingFormat(const SampleBuffer& input, int targetRate) {
    const std::size_t inFrames = input.frames();
    const int channels = std::max(input.channels, 1);

    std::vector<float> mono(inFrames, 0.0f);
    if (channels == 1) {
        std::copy(input.samples.begin(), input.samples.begin() + inFrames, mono.begin());
    } else {
        const float scale = 1.0f / static_cast<float>(channels);
        for (std::size_t i = 0; i < inFrames; ++i) {
            float sum = 0.0f;
            for (int c = 0; c < channels; ++c) {
                sum += input.samples[i * channels + c];
            }
            mono[i] = sum * scale;
        }
    }

    SampleBuffer output(targetRate, kWorkingChannels);
    if (input.sampleRate == targetRate || input.sampleRate <= 0 || inFrames == 0) {
        output.samples = std::move(mono);
        return output;
    }

    const double ratio = static_cast<double>(input.sampleRate) / static_cast<double>(targetRate);
    const auto outFrames = static_cast<std::size_t>(
        std::llround(static_cast<double>(inFrames) / ratio));
    output.samples.resize(outFrames);
    for (std::size_t i = 0; i < outFrames; ++i) {
        double pos = static_cast<double>(i) * ratio;
        auto idx = static_cast<std::size_t>(pos);
        if (idx + 1 >= inFrames) {
            output.samples[i] = mono[inFrames - 1];
            continue;
        }
        auto frac = static_cast<float>(pos - static_cast<double>(idx));
        output.samples[i] = mono[idx] + (mono[idx + 1] - mono[idx]) * frac;
    }
    return output;
}

SampleBuffer fitToFrames(const SampleBuffer& input, std::size_t frames) {
    SampleBuffer output(input.sampleRate, input.channels);
    const std::size_t wanted = frames * static_cast<std::size_t>(std::max(input.channels, 1));
    const std::size_t copied = std::min(wanted, input.samples.size());
    output.samples.reserve(wanted);
    output.samples.assign(input.samples.begin(), input.samples.begin() + copied);
    output.samples.resize(wanted, 0.0f);
    return output;
}

}  // namespace audio
}  // namespace subdub
