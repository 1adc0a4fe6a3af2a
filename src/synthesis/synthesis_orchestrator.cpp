#include "synthesis/synthesis_orchestrator.h"

#include "core/text_key.h"
#include "logging/logger.h"
#include "metrics/stats_collector.h"
#include "synthesis/segment_store.h"
#include "synthesis/synthesis_cache.h"

#include <algorithm>
#include <exception>
#include <future>
#include <random>
#include <vector>

namespace subdub {
namespace synthesis {

namespace {

double backoffJitter() {
    thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_real_distribution<double> dist(1.0, 3.0);
    return dist(rng);
}

}  // namespace

const char* segmentOriginToString(SegmentOrigin origin) {
    switch (origin) {
    case SegmentOrigin::Generated:
        return "generated";
    case SegmentOrigin::Cached:
        return "cached";
    case SegmentOrigin::Resumed:
        return "resumed";
    case SegmentOrigin::Empty:
        return "empty";
    case SegmentOrigin::Failed:
    default:
        return "failed";
    }
}

SynthesisOrchestrator::SynthesisOrchestrator(Synthesizer& synthesizer, SynthesisCache& cache,
                                             SegmentStore& store, OrchestratorConfig config,
                                             metrics::StatsCollector* stats)
    : synthesizer_(synthesizer),
      cache_(cache),
      store_(store),
      config_(std::move(config)),
      stats_(stats) {
    if (config_.batchSize == 0) {
        LOG_WARN("Orchestrator: batchSize 0 is invalid, using 1");
        config_.batchSize = 1;
    }
    if (config_.retries < 0) {
        config_.retries = 0;
    }
}

void SynthesisOrchestrator::cancel() {
    {
        std::lock_guard<std::mutex> lock(cancelMutex_);
        cancelled_.store(true, std::memory_order_release);
    }
    cancelCv_.notify_all();
}

bool SynthesisOrchestrator::waitBackoff(std::chrono::milliseconds delay) {
    std::unique_lock<std::mutex> lock(cancelMutex_);
    return !cancelCv_.wait_for(lock, delay,
                               [this] { return cancelled_.load(std::memory_order_acquire); });
}

SynthesisResult SynthesisOrchestrator::synthesizeWithRetry(const std::string& text,
                                                           int cueIndex) {
    const int attempts = 1 + config_.retries;
    SynthesisResult last;
    for (int attempt = 0; attempt < attempts; ++attempt) {
        if (cancelled()) {
            last.status = SynthesisStatus::PermanentError;
            last.message = "cancelled";
            return last;
        }
        if (stats_) {
            stats_->recordSynthesisAttempt();
        }

        last = synthesizer_.synthesize(text, config_.voice, config_.timeout);
        if (last.ok() && last.audio.empty()) {
            last.status = SynthesisStatus::TransientError;
            last.message = "synthesizer returned no audio";
        }
        if (last.ok()) {
            if (attempt > 0) {
                LOG_INFO("Cue {}: synthesis succeeded on attempt {}", cueIndex, attempt + 1);
            }
            return last;
        }
        if (last.status == SynthesisStatus::PermanentError) {
            LOG_ERROR("Cue {}: synthesis failed permanently: {}", cueIndex, last.message);
            return last;
        }

        LOG_WARN("Cue {}: synthesis attempt {}/{} failed ({}): {}", cueIndex, attempt + 1,
                 attempts, synthesisStatusToString(last.status), last.message);
        if (attempt + 1 < attempts) {
            auto delay = std::chrono::milliseconds(static_cast<long long>(
                (attempt + 1) * static_cast<double>(config_.backoffBase.count()) *
                backoffJitter()));
            if (!waitBackoff(delay)) {
                last.message = "cancelled";
                return last;
            }
        }
    }
    return last;
}

CueAudio SynthesisOrchestrator::failedCue(const subtitle::Cue& cue, const std::string& hash,
                                          const std::string& message) const {
    CueAudio out;
    out.origin = SegmentOrigin::Failed;
    out.textHash = hash;
    out.message = message;
    const std::int64_t frames =
        audio::millisecondsToFrames(cue.length().count(), config_.sampleRate);
    out.audio = std::make_shared<const audio::SampleBuffer>(audio::makeSilence(
        static_cast<std::size_t>(std::max<std::int64_t>(frames, 0)), config_.sampleRate));
    return out;
}

ErrorCode SynthesisOrchestrator::processCue(std::size_t position, const subtitle::Cue& cue,
                                            CueAudioSink& sink) {
    const std::string text = normalizeCueText(cue.text);
    const std::string hash = textHash(text);

    if (config_.resume) {
        audio::SampleBuffer previous;
        if (store_.loadSegment(position, hash, previous)) {
            CueAudio out;
            out.origin = SegmentOrigin::Resumed;
            out.textHash = hash;
            out.audio = std::make_shared<const audio::SampleBuffer>(
                previous.sampleRate == config_.sampleRate &&
                        previous.channels == audio::kWorkingChannels
                    ? std::move(previous)
                    : audio::toWorkingFormat(previous, config_.sampleRate));
            if (stats_) {
                stats_->recordResumed();
            }
            LOG_DEBUG("Cue {}: resumed from segment file", cue.index);
            sink.push(position, std::move(out));
            return ErrorCode::OK;
        }
    }

    CacheLookup lookup = cache_.getOrCreate(text, [&]() {
        ProduceResult produced;
        audio::SampleBuffer stored;
        if (store_.loadCached(hash, stored)) {
            produced.ok = true;
            produced.loadedFromDisk = true;
            produced.buffer = std::make_shared<const audio::SampleBuffer>(
                audio::toWorkingFormat(stored, config_.sampleRate));
            return produced;
        }

        SynthesisResult result = synthesizeWithRetry(text, cue.index);
        if (!result.ok()) {
            produced.message = result.message;
            return produced;
        }
        auto working = std::make_shared<const audio::SampleBuffer>(
            audio::toWorkingFormat(result.audio, config_.sampleRate));
        if (!store_.saveCached(hash, *working)) {
            LOG_WARN("Cue {}: could not persist text cache entry {}", cue.index, hash);
        }
        produced.ok = true;
        produced.buffer = std::move(working);
        return produced;
    });

    if (!lookup.ok) {
        LOG_WARN("Cue {}: synthesis failed, substituting {:.3f}s of silence ({})", cue.index,
                 std::chrono::duration<double>(cue.length()).count(), lookup.message);
        if (stats_) {
            stats_->recordFailed();
        }
        sink.push(position, failedCue(cue, hash, lookup.message));
        return ErrorCode::OK;
    }

    CueAudio out;
    out.textHash = hash;
    out.audio = lookup.buffer;
    if (lookup.origin == CacheOrigin::Produced && !lookup.loadedFromDisk) {
        out.origin = SegmentOrigin::Generated;
        if (stats_) {
            stats_->recordGenerated();
        }
    } else {
        out.origin = SegmentOrigin::Cached;
        if (stats_) {
            stats_->recordCached();
        }
    }

    if (!store_.saveSegment(position, hash, *out.audio)) {
        LOG_ERROR("Cue {}: cannot write segment file {}", cue.index,
                  store_.segmentPath(position, hash).string());
        return ErrorCode::IO_SEGMENT_WRITE_FAILED;
    }

    LOG_TRACE("Cue {}: {} ({} frames)", cue.index, segmentOriginToString(out.origin),
              out.audio->frames());
    sink.push(position, std::move(out));
    return ErrorCode::OK;
}

ErrorCode SynthesisOrchestrator::submit(const subtitle::CueTimeline& timeline,
                                        CueAudioSink& sink) {
    std::vector<std::size_t> pending;
    pending.reserve(timeline.size());

    for (std::size_t pos = 0; pos < timeline.size(); ++pos) {
        const subtitle::Cue& cue = timeline.at(pos);
        if (isBlankText(cue.text)) {
            CueAudio out;
            out.origin = SegmentOrigin::Empty;
            out.audio = std::make_shared<const audio::SampleBuffer>(config_.sampleRate,
                                                                    audio::kWorkingChannels);
            if (stats_) {
                stats_->recordEmpty();
            }
            sink.push(pos, std::move(out));
            continue;
        }
        pending.push_back(pos);
    }

    const std::size_t batchCount =
        (pending.size() + config_.batchSize - 1) / config_.batchSize;
    LOG_INFO("Synthesizing {} cue(s) in {} batch(es) of up to {} (voice {})", pending.size(),
             batchCount, config_.batchSize, config_.voice);

    ErrorCode fatal = ErrorCode::OK;
    for (std::size_t batch = 0; batch < batchCount; ++batch) {
        if (cancelled()) {
            fatal = ErrorCode::IO_CANCELLED;
            break;
        }

        const std::size_t first = batch * config_.batchSize;
        const std::size_t last = std::min(first + config_.batchSize, pending.size());

        std::vector<std::pair<std::size_t, std::future<ErrorCode>>> tasks;
        tasks.reserve(last - first);
        for (std::size_t i = first; i < last; ++i) {
            const std::size_t pos = pending[i];
            tasks.emplace_back(pos, std::async(std::launch::async, [this, pos, &timeline, &sink] {
                                   return processCue(pos, timeline.at(pos), sink);
                               }));
        }

        for (auto& task : tasks) {
            ErrorCode code = ErrorCode::OK;
            try {
                code = task.second.get();
            } catch (const std::exception& e) {
                const subtitle::Cue& cue = timeline.at(task.first);
                LOG_ERROR("Cue {}: synthesis task threw: {}", cue.index, e.what());
                if (stats_) {
                    stats_->recordFailed();
                }
                sink.push(task.first, failedCue(cue, textHash(cue.text), e.what()));
            }
            if (code != ErrorCode::OK && fatal == ErrorCode::OK) {
                fatal = code;
            }
        }

        LOG_DEBUG("Batch {}/{} done", batch + 1, batchCount);
        if (fatal != ErrorCode::OK) {
            break;
        }
    }

    if (fatal != ErrorCode::OK) {
        LOG_ERROR("Synthesis stopped: {} ({})", errorCodeToString(fatal),
                  errorCodeToHex(fatal));
        sink.abort(errorCodeToString(fatal));
        return fatal;
    }
    sink.close();
    return ErrorCode::OK;
}

}  // namespace synthesis
}  // namespace subdub
