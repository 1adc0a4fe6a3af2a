/**
 * @file test_assembly_buffer.cpp
 * @brief Tests for sample-accurate output assembly
 */

#include "assembly/assembly_buffer.h"

#include <gtest/gtest.h>

using namespace subdub;
using subdub::assembly::AssemblyBuffer;

namespace {

std::shared_ptr<const audio::SampleBuffer> chunk(std::size_t frames, float level,
                                                 int sampleRate = 24000) {
    auto buf = std::make_shared<audio::SampleBuffer>(sampleRate, 1);
    buf->samples.assign(frames, level);
    return buf;
}

}  // namespace

TEST(AssemblyBuffer, OutputHasExactTargetLength) {
    AssemblyBuffer buffer(24000);
    buffer.append(chunk(12000, 0.5f));
    buffer.appendSilence(6000);

    audio::SampleBuffer out;
    ASSERT_EQ(buffer.finalize(1.7, out), ErrorCode::OK);
    EXPECT_EQ(out.frames(), 40800u);
    EXPECT_EQ(out.sampleRate, 24000);
    EXPECT_EQ(out.channels, 1);
}

TEST(AssemblyBuffer, ChunksAndSilenceLandAtTheirOffsets) {
    AssemblyBuffer buffer(24000);
    buffer.appendSilence(100);
    buffer.append(chunk(50, 0.25f));
    buffer.appendSilence(10);
    buffer.append(chunk(40, -0.5f));
    EXPECT_EQ(buffer.cursorFrames(), 200);

    audio::SampleBuffer out;
    ASSERT_EQ(buffer.finalize(300.0 / 24000.0, out), ErrorCode::OK);
    ASSERT_EQ(out.frames(), 300u);
    EXPECT_EQ(out.samples[99], 0.0f);
    EXPECT_EQ(out.samples[100], 0.25f);
    EXPECT_EQ(out.samples[149], 0.25f);
    EXPECT_EQ(out.samples[150], 0.0f);
    EXPECT_EQ(out.samples[160], -0.5f);
    EXPECT_EQ(out.samples[199], -0.5f);
    for (std::size_t i = 200; i < 300; ++i) {
        ASSERT_EQ(out.samples[i], 0.0f) << "padding at " << i;
    }
}

TEST(AssemblyBuffer, OverlongContentIsTrimmedAtTheTail) {
    AssemblyBuffer buffer(24000);
    buffer.append(chunk(24000, 0.1f));
    buffer.append(chunk(24000, 0.2f));

    audio::SampleBuffer out;
    ASSERT_EQ(buffer.finalize(1.5, out), ErrorCode::OK);
    ASSERT_EQ(out.frames(), 36000u);
    EXPECT_EQ(out.samples[23999], 0.1f);
    EXPECT_EQ(out.samples[24000], 0.2f);
    EXPECT_EQ(out.samples.back(), 0.2f);
}

TEST(AssemblyBuffer, AdjacentSilenceIsMerged) {
    AssemblyBuffer buffer(24000);
    buffer.appendSilence(10);
    buffer.appendSilence(20);
    buffer.appendSilence(0);
    EXPECT_EQ(buffer.chunkCount(), 1u);
    EXPECT_EQ(buffer.cursorFrames(), 30);
}

TEST(AssemblyBuffer, ZeroTargetGivesEmptyTrack) {
    AssemblyBuffer buffer(24000);
    buffer.append(chunk(100, 0.3f));
    audio::SampleBuffer out;
    ASSERT_EQ(buffer.finalize(0.0, out), ErrorCode::OK);
    EXPECT_TRUE(out.empty());
}

TEST(AssemblyBuffer, SecondFinalizeFails) {
    AssemblyBuffer buffer(24000);
    buffer.append(chunk(100, 0.3f));
    audio::SampleBuffer out;
    ASSERT_EQ(buffer.finalize(0.01, out), ErrorCode::OK);

    audio::SampleBuffer again;
    EXPECT_EQ(buffer.finalize(0.01, again), ErrorCode::ASSEMBLY_ALREADY_FINALIZED);
    EXPECT_TRUE(buffer.finalized());
}

TEST(AssemblyBuffer, NegativeTargetIsRejected) {
    AssemblyBuffer buffer(24000);
    audio::SampleBuffer out;
    EXPECT_EQ(buffer.finalize(-1.0, out), ErrorCode::VALIDATION_NO_TARGET_DURATION);
    EXPECT_FALSE(buffer.finalized());
}

TEST(AssemblyBuffer, AppendAfterSealThrows) {
    AssemblyBuffer buffer(24000);
    buffer.seal();
    EXPECT_THROW(buffer.append(chunk(10, 0.1f)), std::logic_error);
    EXPECT_THROW(buffer.appendSilence(10), std::logic_error);
}

TEST(AssemblyBuffer, FormatMismatchThrows) {
    AssemblyBuffer buffer(24000);
    EXPECT_THROW(buffer.append(chunk(10, 0.1f, 48000)), std::invalid_argument);

    auto stereo = std::make_shared<audio::SampleBuffer>(24000, 2);
    stereo->samples.assign(20, 0.1f);
    EXPECT_THROW(buffer.append(stereo), std::invalid_argument);
}
