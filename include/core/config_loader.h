#ifndef SUBDUB_CONFIG_LOADER_H
#define SUBDUB_CONFIG_LOADER_H

#include "core/dub_constants.h"
#include "core/error_codes.h"

#include <filesystem>
#include <string>
#include <vector>

constexpr const char* DEFAULT_CONFIG_FILE = "subdub.json";

namespace subdub {

struct DubConfig {
    struct SynthesisConfig {
        std::string voice = DubConstants::DEFAULT_VOICE;
        // argv template of the TTS command; {text}, {voice}, {output} are substituted
        std::vector<std::string> command = {"edge-tts", "--voice", "{voice}", "--text",
                                            "{text}", "--write-media", "{output}"};
        std::string outputExtension = "mp3";
        int timeoutMs = DubConstants::DEFAULT_TIMEOUT_MS;
        int retries = DubConstants::DEFAULT_RETRIES;
        int backoffMs = DubConstants::DEFAULT_BACKOFF_MS;
    } synthesis;

    struct FittingConfig {
        double maxSpeed = DubConstants::DEFAULT_MAX_SPEED;
        std::string stretcher = DubConstants::DEFAULT_STRETCHER;  // "rubberband" | "bypass"
    } fitting;

    struct OrchestrationConfig {
        int batchSize = DubConstants::DEFAULT_BATCH_SIZE;
    } orchestration;

    struct RunConfig {
        bool resume = false;
        bool keepTemp = false;
        bool noConcat = false;
        std::string tempDir = "";  // Empty = ./temp/<hash of the subtitle file>
    } run;

    struct OutputConfig {
        int sampleRate = DubConstants::DEFAULT_SAMPLE_RATE;
        std::string format = "";  // Empty = from the output file extension
        std::string statsFile = "";
    } output;

    struct TargetConfig {
        std::string duration = "";        // Explicit target, e.g. "01:23:45.250"
        std::string referenceMedia = "";  // Media file whose duration is the target
    } target;
};

// Reads `configPath` over the defaults. Out-of-range values are replaced by
// defaults with a warning. Returns false when the file is missing (defaults are
// kept) or cannot be parsed.
bool loadDubConfig(const std::filesystem::path& configPath, DubConfig& outConfig,
                   bool verbose = true);

// Checks values that cannot be repaired silently (e.g. after CLI overrides).
// Returns VALIDATION_INVALID_CONFIG with a message for the first problem found.
ErrorCode validateDubConfig(const DubConfig& config, std::string& error);

}  // namespace subdub

#endif  // SUBDUB_CONFIG_LOADER_H
