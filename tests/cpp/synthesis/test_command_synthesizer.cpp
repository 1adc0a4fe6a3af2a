/**
 * @file test_command_synthesizer.cpp
 * @brief Tests for the external-command synthesizer and process runner
 */

#include "audio/audio_io.h"
#include "core/process_runner.h"
#include "support/temp_dir.h"
#include "synthesis/command_synthesizer.h"

#include <gtest/gtest.h>

using namespace subdub;
using namespace subdub::synthesis;
using subdub::testing_support::ScopedTempDir;
using std::chrono::milliseconds;

TEST(CommandSynthesizer, ExpandsPlaceholdersInEveryArgument) {
    auto args = CommandSynthesizer::expandCommand(
        {"tts", "--voice={voice}", "{text}", "-o", "{output}"}, "Hello there", "en-GB-Test",
        "/tmp/out.mp3");
    ASSERT_EQ(args.size(), 5u);
    EXPECT_EQ(args[0], "tts");
    EXPECT_EQ(args[1], "--voice=en-GB-Test");
    EXPECT_EQ(args[2], "Hello there");
    EXPECT_EQ(args[4], "/tmp/out.mp3");
}

TEST(CommandSynthesizer, PlaceholdersInsideCueTextStayLiteral) {
    auto args = CommandSynthesizer::expandCommand({"{text}"}, "say {voice}", "v", "o");
    EXPECT_EQ(args[0], "say {voice}");
}

TEST(CommandSynthesizer, EmptyTemplateIsRejected) {
    CommandSynthesizerConfig config;
    config.command.clear();
    EXPECT_THROW(CommandSynthesizer{config}, std::invalid_argument);
}

TEST(CommandSynthesizer, ReadsAudioWrittenByTheCommand) {
    ScopedTempDir temp;
    audio::SampleBuffer source(24000, 1);
    source.samples.assign(4800, 0.5f);
    const std::string sourcePath = (temp.path() / "voice.wav").string();
    ASSERT_TRUE(AudioIO::writeAudioFile(sourcePath, source));

    CommandSynthesizerConfig config;
    config.command = {"cp", sourcePath, "{output}"};
    config.outputExtension = "wav";
    config.scratchDir = temp.path();
    CommandSynthesizer synthesizer(config);

    SynthesisResult result = synthesizer.synthesize("ignored", "voice", milliseconds(5000));
    ASSERT_TRUE(result.ok()) << result.message;
    EXPECT_EQ(result.audio.frames(), 4800u);
    EXPECT_FLOAT_EQ(result.audio.samples[0], 0.5f);
}

TEST(CommandSynthesizer, MissingBinaryIsPermanent) {
    CommandSynthesizerConfig config;
    config.command = {"subdub-no-such-tts-binary", "{text}"};
    CommandSynthesizer synthesizer(config);

    SynthesisResult result = synthesizer.synthesize("Hi", "v", milliseconds(2000));
    EXPECT_EQ(result.status, SynthesisStatus::PermanentError);
}

TEST(CommandSynthesizer, NonZeroExitIsTransient) {
    CommandSynthesizerConfig config;
    config.command = {"sh", "-c", "exit 3"};
    CommandSynthesizer synthesizer(config);

    SynthesisResult result = synthesizer.synthesize("Hi", "v", milliseconds(2000));
    EXPECT_EQ(result.status, SynthesisStatus::TransientError);
}

TEST(CommandSynthesizer, Exit127IsPermanent) {
    CommandSynthesizerConfig config;
    config.command = {"sh", "-c", "exit 127"};
    CommandSynthesizer synthesizer(config);

    EXPECT_EQ(synthesizer.synthesize("Hi", "v", milliseconds(2000)).status,
              SynthesisStatus::PermanentError);
}

TEST(CommandSynthesizer, SuccessWithoutOutputFileIsTransient) {
    CommandSynthesizerConfig config;
    config.command = {"true"};
    CommandSynthesizer synthesizer(config);

    EXPECT_EQ(synthesizer.synthesize("Hi", "v", milliseconds(2000)).status,
              SynthesisStatus::TransientError);
}

TEST(CommandSynthesizer, SlowCommandTimesOut) {
    CommandSynthesizerConfig config;
    config.command = {"sleep", "5"};
    CommandSynthesizer synthesizer(config);

    auto start = std::chrono::steady_clock::now();
    SynthesisResult result = synthesizer.synthesize("Hi", "v", milliseconds(200));
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(result.status, SynthesisStatus::Timeout);
    EXPECT_LT(elapsed, std::chrono::seconds(4));
}

TEST(ProcessRunner, CapturesStdout) {
    ProcessResult result = runProcess({"echo", "12.5"}, milliseconds(2000), true);
    ASSERT_TRUE(result.succeeded());
    EXPECT_EQ(result.output, "12.5\n");
}

TEST(ProcessRunner, ReportsExitCode) {
    ProcessResult result = runProcess({"sh", "-c", "exit 4"}, milliseconds(2000));
    EXPECT_TRUE(result.started);
    EXPECT_TRUE(result.exited);
    EXPECT_EQ(result.exitCode, 4);
    EXPECT_FALSE(result.succeeded());
}
