#pragma once

#include "audio/sample_buffer.h"
#include "core/error_codes.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace subdub {
namespace assembly {

// Ordered, append-only list of fitted chunks for the output track.
//
// Chunks are kept by reference and silence as plain frame counts; nothing is
// copied until finalize(), which builds the output in one pass and adjusts only
// the tail to the requested length.
class AssemblyBuffer {
   public:
    explicit AssemblyBuffer(int sampleRate = audio::kDefaultSampleRate);

    AssemblyBuffer(const AssemblyBuffer&) = delete;
    AssemblyBuffer& operator=(const AssemblyBuffer&) = delete;

    // Chunks must be mono at the buffer's sample rate. Throws std::logic_error once
    // sealed and std::invalid_argument on a format mismatch.
    void append(std::shared_ptr<const audio::SampleBuffer> chunk);
    void appendSilence(std::int64_t frames);

    void seal();
    bool sealed() const {
        return sealed_;
    }
    bool finalized() const {
        return finalized_;
    }

    // Frames appended so far.
    std::int64_t cursorFrames() const {
        return cursor_;
    }
    std::size_t chunkCount() const {
        return chunks_.size();
    }
    int sampleRate() const {
        return sampleRate_;
    }

    // Concatenate everything and trim or zero-pad the tail to exactly
    // round(targetSeconds * sampleRate) frames. Seals the buffer. Only the first
    // call succeeds.
    ErrorCode finalize(double targetSeconds, audio::SampleBuffer& out);

   private:
    struct Chunk {
        std::shared_ptr<const audio::SampleBuffer> audio;  // Null for silence
        std::int64_t silenceFrames = 0;
    };

    int sampleRate_;
    std::vector<Chunk> chunks_;
    std::int64_t cursor_ = 0;
    bool sealed_ = false;
    bool finalized_ = false;
};

}  // namespace assembly
}  // namespace subdub
