/**
 * @file test_synthesis_orchestrator.cpp
 * @brief Tests for batched synthesis with caching, retry and resume
 */

#include "core/text_key.h"
#include "metrics/stats_collector.h"
#include "support/fake_synthesizer.h"
#include "support/temp_dir.h"
#include "synthesis/segment_store.h"
#include "synthesis/synthesis_cache.h"
#include "synthesis/synthesis_orchestrator.h"

#include <fstream>
#include <gtest/gtest.h>
#include <map>

using namespace subdub;
using namespace subdub::synthesis;
using subdub::testing_support::FakeSynthesizer;
using subdub::testing_support::ScopedTempDir;
using std::chrono::milliseconds;

namespace {

subtitle::CueTimeline makeTimeline(const std::vector<std::pair<int, std::string>>& startsAndTexts,
                                   int lengthMs = 2000) {
    std::vector<subtitle::Cue> cues;
    int index = 1;
    for (const auto& entry : startsAndTexts) {
        subtitle::Cue cue;
        cue.index = index++;
        cue.start = milliseconds(entry.first);
        cue.end = milliseconds(entry.first + lengthMs);
        cue.text = entry.second;
        cues.push_back(cue);
    }
    subtitle::CueTimeline timeline;
    std::string error;
    EXPECT_TRUE(subtitle::CueTimeline::create(std::move(cues), timeline, error)) << error;
    return timeline;
}

OrchestratorConfig fastConfig() {
    OrchestratorConfig config;
    config.voice = "test-voice";
    config.batchSize = 4;
    config.retries = 2;
    config.backoffBase = milliseconds(0);
    config.timeout = milliseconds(1000);
    return config;
}

std::map<std::size_t, CueAudio> drain(CueAudioSink& sink) {
    std::map<std::size_t, CueAudio> out;
    while (auto item = sink.popNext()) {
        out.emplace(item->first, std::move(item->second));
    }
    return out;
}

class OrchestratorTest : public ::testing::Test {
   protected:
    ScopedTempDir temp;
    FakeSynthesizer synthesizer{12000};
    metrics::StatsCollector stats;

    std::map<std::size_t, CueAudio> runOnce(const subtitle::CueTimeline& timeline,
                                            OrchestratorConfig config, SegmentStore& store,
                                            ErrorCode expected = ErrorCode::OK) {
        SynthesisCache cache;
        SynthesisOrchestrator orchestrator(synthesizer, cache, store, config, &stats);
        CueAudioSink sink(timeline.size());
        EXPECT_EQ(orchestrator.submit(timeline, sink), expected);
        return drain(sink);
    }
};

}  // namespace

TEST_F(OrchestratorTest, RepeatedTextIsSynthesizedOnce) {
    SegmentStore store(temp.path());
    ASSERT_TRUE(store.prepare());
    auto timeline = makeTimeline({{0, "Yes"}, {3000, "Yes"}});

    auto results = runOnce(timeline, fastConfig(), store);

    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(synthesizer.calls(), 1);
    auto snapshot = stats.snapshot();
    EXPECT_EQ(snapshot.generated, 1u);
    EXPECT_EQ(snapshot.cached, 1u);
    EXPECT_EQ(results[0].audio, results[1].audio);
}

TEST_F(OrchestratorTest, NIdenticalTextsGiveNMinusOneHits) {
    SegmentStore store(temp.path());
    ASSERT_TRUE(store.prepare());
    std::vector<std::pair<int, std::string>> cues;
    for (int i = 0; i < 9; ++i) {
        cues.emplace_back(i * 2500, "Same line");
    }
    auto timeline = makeTimeline(cues);

    SynthesisCache cache;
    SynthesisOrchestrator orchestrator(synthesizer, cache, store, fastConfig(), &stats);
    CueAudioSink sink(timeline.size());
    ASSERT_EQ(orchestrator.submit(timeline, sink), ErrorCode::OK);

    EXPECT_EQ(synthesizer.calls(), 1);
    EXPECT_EQ(cache.hitCount("Same line"), 8u);
    EXPECT_EQ(stats.snapshot().generated, 1u);
    EXPECT_EQ(stats.snapshot().cached, 8u);
}

TEST_F(OrchestratorTest, TransientFailuresThenSuccessCountAsGenerated) {
    SegmentStore store(temp.path());
    ASSERT_TRUE(store.prepare());
    synthesizer.script("Flaky", {SynthesisStatus::TransientError, SynthesisStatus::Timeout});
    auto timeline = makeTimeline({{0, "Flaky"}});

    auto results = runOnce(timeline, fastConfig(), store);

    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].origin, SegmentOrigin::Generated);
    EXPECT_EQ(synthesizer.callsFor("Flaky"), 3);
    EXPECT_EQ(stats.snapshot().generated, 1u);
    EXPECT_EQ(stats.snapshot().failed, 0u);
    EXPECT_EQ(stats.snapshot().synthesisAttempts, 3u);
}

TEST_F(OrchestratorTest, ExhaustedRetriesGiveSlotLengthSilence) {
    SegmentStore store(temp.path());
    ASSERT_TRUE(store.prepare());
    synthesizer.script("Down", {SynthesisStatus::TransientError, SynthesisStatus::TransientError,
                                SynthesisStatus::TransientError});
    auto timeline = makeTimeline({{1000, "Down"}}, 1500);

    auto results = runOnce(timeline, fastConfig(), store);

    ASSERT_EQ(results.size(), 1u);
    const CueAudio& cue = results[0];
    EXPECT_EQ(cue.origin, SegmentOrigin::Failed);
    ASSERT_TRUE(cue.audio);
    EXPECT_EQ(cue.audio->frames(), 36000u);  // 1.5 s at 24 kHz
    for (float s : cue.audio->samples) {
        ASSERT_EQ(s, 0.0f);
    }
    EXPECT_EQ(synthesizer.callsFor("Down"), 3);
    EXPECT_EQ(stats.snapshot().failed, 1u);
    EXPECT_FALSE(std::filesystem::exists(store.segmentPath(0, textHash("Down"))));
}

TEST_F(OrchestratorTest, PermanentErrorIsNotRetried) {
    SegmentStore store(temp.path());
    ASSERT_TRUE(store.prepare());
    synthesizer.script("Bad voice", {SynthesisStatus::PermanentError});
    auto timeline = makeTimeline({{0, "Bad voice"}});

    auto results = runOnce(timeline, fastConfig(), store);

    EXPECT_EQ(results[0].origin, SegmentOrigin::Failed);
    EXPECT_EQ(synthesizer.callsFor("Bad voice"), 1);
}

TEST_F(OrchestratorTest, BlankTextBypassesSynthesis) {
    SegmentStore store(temp.path());
    ASSERT_TRUE(store.prepare());
    auto timeline = makeTimeline({{0, "  \n "}, {3000, "Hi"}});

    auto results = runOnce(timeline, fastConfig(), store);

    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0].origin, SegmentOrigin::Empty);
    EXPECT_TRUE(results[0].audio->empty());
    EXPECT_EQ(synthesizer.calls(), 1);
    EXPECT_EQ(stats.snapshot().empty, 1u);
}

TEST_F(OrchestratorTest, BatchSizeBoundsConcurrency) {
    SegmentStore store(temp.path());
    ASSERT_TRUE(store.prepare());
    synthesizer.setDelay(milliseconds(20));
    std::vector<std::pair<int, std::string>> cues;
    for (int i = 0; i < 7; ++i) {
        cues.emplace_back(i * 2500, "Line " + std::to_string(i));
    }
    auto timeline = makeTimeline(cues);
    OrchestratorConfig config = fastConfig();
    config.batchSize = 2;

    auto results = runOnce(timeline, config, store);

    EXPECT_EQ(results.size(), 7u);
    EXPECT_EQ(synthesizer.calls(), 7);
    EXPECT_LE(synthesizer.maxInFlight(), 2);
}

TEST_F(OrchestratorTest, ResumeLoadsSegmentsWithoutSynthesis) {
    SegmentStore store(temp.path());
    ASSERT_TRUE(store.prepare());
    auto timeline = makeTimeline({{0, "One"}, {3000, "Two"}});

    auto first = runOnce(timeline, fastConfig(), store);
    ASSERT_EQ(synthesizer.calls(), 2);
    EXPECT_TRUE(std::filesystem::exists(store.segmentPath(1, textHash("Two"))));

    OrchestratorConfig config = fastConfig();
    config.resume = true;
    stats.reset();
    auto second = runOnce(timeline, config, store);

    EXPECT_EQ(synthesizer.calls(), 2);
    EXPECT_EQ(stats.snapshot().resumed, 2u);
    for (std::size_t pos = 0; pos < 2; ++pos) {
        EXPECT_EQ(second[pos].origin, SegmentOrigin::Resumed);
        EXPECT_EQ(second[pos].audio->samples, first[pos].audio->samples);
    }
}

TEST_F(OrchestratorTest, PersistedTextCacheAvoidsSynthesis) {
    SegmentStore store(temp.path());
    ASSERT_TRUE(store.prepare());
    audio::SampleBuffer stored(24000, 1);
    stored.samples.assign(2400, 0.25f);
    ASSERT_TRUE(store.saveCached(textHash("Known"), stored));

    auto results = runOnce(makeTimeline({{0, "Known"}}), fastConfig(), store);

    EXPECT_EQ(synthesizer.calls(), 0);
    EXPECT_EQ(results[0].origin, SegmentOrigin::Cached);
    EXPECT_EQ(results[0].audio->samples, stored.samples);
}

TEST_F(OrchestratorTest, SegmentWriteFailureIsFatal) {
    // A regular file where the working directory should be.
    auto blocker = temp.path() / "not_a_directory";
    std::ofstream(blocker) << "x";
    SegmentStore store(blocker);

    SynthesisCache cache;
    SynthesisOrchestrator orchestrator(synthesizer, cache, store, fastConfig(), &stats);
    auto timeline = makeTimeline({{0, "A"}, {3000, "B"}});
    CueAudioSink sink(timeline.size());

    EXPECT_EQ(orchestrator.submit(timeline, sink), ErrorCode::IO_SEGMENT_WRITE_FAILED);
    EXPECT_TRUE(sink.aborted());
    EXPECT_FALSE(sink.popNext().has_value());
}

TEST_F(OrchestratorTest, CancelStopsBeforeFirstBatch) {
    SegmentStore store(temp.path());
    ASSERT_TRUE(store.prepare());
    SynthesisCache cache;
    SynthesisOrchestrator orchestrator(synthesizer, cache, store, fastConfig(), &stats);
    orchestrator.cancel();

    auto timeline = makeTimeline({{0, "A"}});
    CueAudioSink sink(timeline.size());
    EXPECT_EQ(orchestrator.submit(timeline, sink), ErrorCode::IO_CANCELLED);
    EXPECT_TRUE(sink.aborted());
    EXPECT_EQ(synthesizer.calls(), 0);
}

TEST_F(OrchestratorTest, VoiceAndStatsAreForwarded) {
    SegmentStore store(temp.path());
    ASSERT_TRUE(store.prepare());
    runOnce(makeTimeline({{0, "Hello"}}), fastConfig(), store);
    EXPECT_EQ(synthesizer.lastVoice(), "test-voice");
}
