#include "assembly/assembly_buffer.h"

#include "logging/logger.h"

#include <algorithm>
#include <stdexcept>

namespace subdub {
namespace assembly {

namespace {
constexpr double kExcessWarnSeconds = 1.0;
}

AssemblyBuffer::AssemblyBuffer(int sampleRate) : sampleRate_(sampleRate) {
    if (sampleRate_ <= 0) {
        throw std::invalid_argument("AssemblyBuffer: sampleRate must be positive");
    }
}

void AssemblyBuffer::append(std::shared_ptr<const audio::SampleBuffer> chunk) {
    if (sealed_) {
        throw std::logic_error("AssemblyBuffer: append after seal");
    }
    if (!chunk || chunk->empty()) {
        return;
    }
    if (chunk->sampleRate != sampleRate_ || chunk->channels != audio::kWorkingChannels) {
        throw std::invalid_argument("AssemblyBuffer: chunk is not mono at the working rate");
    }
    cursor_ += static_cast<std::int64_t>(chunk->frames());
    chunks_.push_back(Chunk{std::move(chunk), 0});
}

void AssemblyBuffer::appendSilence(std::int64_t frames) {
    if (sealed_) {
        throw std::logic_error("AssemblyBuffer: append after seal");
    }
    if (frames <= 0) {
        return;
    }
    // Adjacent silence runs collapse into one entry.
    if (!chunks_.empty() && !chunks_.back().audio) {
        chunks_.back().silenceFrames += frames;
    } else {
        chunks_.push_back(Chunk{nullptr, frames});
    }
    cursor_ += frames;
}

void AssemblyBuffer::seal() {
    sealed_ = true;
}

ErrorCode AssemblyBuffer::finalize(double targetSeconds, audio::SampleBuffer& out) {
    if (finalized_) {
        LOG_ERROR("AssemblyBuffer: finalize called twice");
        return ErrorCode::ASSEMBLY_ALREADY_FINALIZED;
    }
    if (!(targetSeconds >= 0.0)) {
        LOG_ERROR("AssemblyBuffer: invalid target duration {}", targetSeconds);
        return ErrorCode::VALIDATION_NO_TARGET_DURATION;
    }
    sealed_ = true;
    finalized_ = true;

    const std::int64_t targetFrames = audio::secondsToFrames(targetSeconds, sampleRate_);

    out = audio::SampleBuffer(sampleRate_, audio::kWorkingChannels);
    // Zero-filled up front: silence runs and tail padding need no further writes.
    out.samples.assign(static_cast<std::size_t>(targetFrames), 0.0f);

    std::int64_t written = 0;
    for (const Chunk& chunk : chunks_) {
        if (written >= targetFrames) {
            break;
        }
        if (!chunk.audio) {
            written += chunk.silenceFrames;
            continue;
        }
        const auto frames = static_cast<std::int64_t>(chunk.audio->frames());
        const std::int64_t n = std::min(frames, targetFrames - written);
        std::copy(chunk.audio->samples.begin(), chunk.audio->samples.begin() + n,
                  out.samples.begin() + written);
        written += frames;
    }

    if (cursor_ < targetFrames) {
        LOG_INFO("Assembly: padded {} frames ({:.3f}s) of silence to reach the target",
                 targetFrames - cursor_,
                 audio::framesToSeconds(targetFrames - cursor_, sampleRate_));
    } else if (cursor_ > targetFrames) {
        const double excess = audio::framesToSeconds(cursor_ - targetFrames, sampleRate_);
        if (excess > kExcessWarnSeconds) {
            LOG_WARN("Assembly: trimmed {:.3f}s of audio past the target duration", excess);
        } else {
            LOG_DEBUG("Assembly: trimmed {} frames past the target duration",
                      cursor_ - targetFrames);
        }
    }
    return ErrorCode::OK;
}

}  // namespace assembly
}  // namespace subdub
