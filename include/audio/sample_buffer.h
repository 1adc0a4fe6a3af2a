#ifndef SUBDUB_SAMPLE_BUFFER_H
#define SUBDUB_SAMPLE_BUFFER_H

#include <cstddef>
#include <cstdint>
#include <vector>

namespace subdub {
namespace audio {

// Working format of the whole pipeline: mono at 24 kHz.
constexpr int kDefaultSampleRate = 24000;
constexpr int kWorkingChannels = 1;

// Owned, interleaved float samples.
struct SampleBuffer {
    int sampleRate = kDefaultSampleRate;
    int channels = kWorkingChannels;
    std::vector<float> samples;

    SampleBuffer() = default;
    SampleBuffer(int rate, int channelCount) : sampleRate(rate), channels(channelCount) {}

    std::size_t frames() const {
        return channels > 0 ? samples.size() / static_cast<std::size_t>(channels) : 0;
    }
    bool empty() const {
        return samples.empty();
    }
    double durationSeconds() const;
};

SampleBuffer makeSilence(std::size_t frames, int sampleRate, int channels = kWorkingChannels);

// Exact frame count for a duration, rounded to the nearest frame.
std::int64_t secondsToFrames(double seconds, int sampleRate);
std::int64_t millisecondsToFrames(std::int64_t milliseconds, int sampleRate);
double framesToSeconds(std::int64_t frames, int sampleRate);

// Downmix to mono and convert to `targetRate` (linear interpolation).
// Used once, where synthesized audio enters the pipeline.
SampleBuffer toWorkingFormat(const SampleBuffer& input, int targetRate);

// Copy `input` and trim or zero-pad its tail so it holds exactly `frames` frames.
SampleBuffer fitToFrames(const SampleBuffer& input, std::size_t frames);

}  // namespace audio
}  // namespace subdub

#endif  // SUBDUB_SAMPLE_BUFFER_H
