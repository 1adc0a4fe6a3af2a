#include "core/config_loader.h"
#include "core/error_codes.h"
#include "fitting/time_stretcher.h"
#include "logging/logger.h"
#include "media/duration_probe.h"
#include "pipeline/dubbing_pipeline.h"
#include "synthesis/command_synthesizer.h"

#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

namespace {

void printUsage(const char* programName) {
    std::cout << "subdub - subtitle dubbing with time-aligned speech" << std::endl;
    std::cout << "Usage: " << programName << " <input.srt> <output> [options]" << std::endl;
    std::cout << std::endl;
    std::cout << "Target duration (exactly one):" << std::endl;
    std::cout << "  --expected-duration <t>  HH:MM:SS[.fff], MM:SS[.fff] or seconds" << std::endl;
    std::cout << "  --ref-media <file>       Use the duration of this media file (ffprobe)"
              << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --voice <name>           TTS voice (default: " << DubConstants::DEFAULT_VOICE
              << ")" << std::endl;
    std::cout << "  --max-speed <x>          Maximum speed-up factor (default: "
              << DubConstants::DEFAULT_MAX_SPEED << ")" << std::endl;
    std::cout << "  --batch-size <n>         Concurrent synthesis requests (default: "
              << DubConstants::DEFAULT_BATCH_SIZE << ")" << std::endl;
    std::cout << "  --retries <n>            Retries per cue (default: "
              << DubConstants::DEFAULT_RETRIES << ")" << std::endl;
    std::cout << "  --timeout-ms <ms>        Timeout per synthesis attempt" << std::endl;
    std::cout << "  --stretcher <name>       rubberband | bypass" << std::endl;
    std::cout << "  --format <fmt>           wav | flac | ogg | opus (default: from extension)"
              << std::endl;
    std::cout << "  --temp <dir>             Working directory (default: ./temp/<hash>)"
              << std::endl;
    std::cout << "  --keep-temp              Keep the working directory" << std::endl;
    std::cout << "  --resume                 Reuse segments of a previous run" << std::endl;
    std::cout << "  --no-concat              Only synthesize segments, skip the output track"
              << std::endl;
    std::cout << "  --config <file>          JSON config (default: " << DEFAULT_CONFIG_FILE << ")"
              << std::endl;
    std::cout << "  --log-file <file>        Log file (default: <output>.log)" << std::endl;
    std::cout << "  --log-level <level>      trace | debug | info | warn | error" << std::endl;
    std::cout << "  --stats-file <file>      Write run statistics as JSON" << std::endl;
    std::cout << "  --help                   Show this help message" << std::endl;
    std::cout << std::endl;
    std::cout << "Examples:" << std::endl;
    std::cout << "  " << programName << " movie.srt dub.wav --ref-media movie.mp4" << std::endl;
    std::cout << "  " << programName
              << " talk.srt talk.opus --expected-duration 00:42:10.5 --max-speed 1.8"
              << std::endl;
}

struct CliOptions {
    std::string inputFile;
    std::string outputFile;
    std::string configPath = DEFAULT_CONFIG_FILE;

    std::optional<std::string> voice;
    std::optional<std::string> tempDir;
    std::optional<std::string> refMedia;
    std::optional<std::string> expectedDuration;
    std::optional<double> maxSpeed;
    std::optional<int> batchSize;
    std::optional<int> retries;
    std::optional<int> timeoutMs;
    std::optional<std::string> stretcher;
    std::optional<std::string> format;
    std::optional<std::string> logFile;
    std::optional<std::string> logLevel;
    std::optional<std::string> statsFile;
    bool keepTemp = false;
    bool resume = false;
    bool noConcat = false;
};

bool parseArguments(int argc, char* argv[], CliOptions& options) {
    if (argc < 3) {
        return false;
    }

    options.inputFile = argv[1];
    options.outputFile = argv[2];

    try {
        for (int i = 3; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "--help" || arg == "-h") {
                return false;
            } else if (arg == "--voice" && i + 1 < argc) {
                options.voice = argv[++i];
            } else if (arg == "--temp" && i + 1 < argc) {
                options.tempDir = argv[++i];
            } else if (arg == "--keep-temp") {
                options.keepTemp = true;
            } else if (arg == "--resume") {
                options.resume = true;
            } else if ((arg == "--ref-media" || arg == "--ref-video") && i + 1 < argc) {
                options.refMedia = argv[++i];
            } else if (arg == "--expected-duration" && i + 1 < argc) {
                options.expectedDuration = argv[++i];
            } else if (arg == "--max-speed" && i + 1 < argc) {
                options.maxSpeed = std::stod(argv[++i]);
            } else if (arg == "--batch-size" && i + 1 < argc) {
                options.batchSize = std::stoi(argv[++i]);
            } else if (arg == "--retries" && i + 1 < argc) {
                options.retries = std::stoi(argv[++i]);
            } else if (arg == "--timeout-ms" && i + 1 < argc) {
                options.timeoutMs = std::stoi(argv[++i]);
            } else if (arg == "--stretcher" && i + 1 < argc) {
                options.stretcher = argv[++i];
            } else if (arg == "--format" && i + 1 < argc) {
                options.format = argv[++i];
            } else if (arg == "--no-concat") {
                options.noConcat = true;
            } else if (arg == "--config" && i + 1 < argc) {
                options.configPath = argv[++i];
            } else if (arg == "--log-file" && i + 1 < argc) {
                options.logFile = argv[++i];
            } else if (arg == "--log-level" && i + 1 < argc) {
                options.logLevel = argv[++i];
            } else if (arg == "--stats-file" && i + 1 < argc) {
                options.statsFile = argv[++i];
            } else {
                std::cerr << "Unknown option: " << arg << std::endl;
                return false;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Invalid numeric value: " << e.what() << std::endl;
        return false;
    }

    return true;
}

void applyOverrides(const CliOptions& options, subdub::DubConfig& config) {
    if (options.voice) {
        config.synthesis.voice = *options.voice;
    }
    if (options.tempDir) {
        config.run.tempDir = *options.tempDir;
    }
    if (options.keepTemp) {
        config.run.keepTemp = true;
    }
    if (options.resume) {
        config.run.resume = true;
    }
    if (options.noConcat) {
        config.run.noConcat = true;
    }
    // A target given on the command line replaces both config sources.
    if (options.refMedia || options.expectedDuration) {
        config.target.referenceMedia = options.refMedia.value_or("");
        config.target.duration = options.expectedDuration.value_or("");
    }
    if (options.maxSpeed) {
        config.fitting.maxSpeed = *options.maxSpeed;
    }
    if (options.batchSize) {
        config.orchestration.batchSize = *options.batchSize;
    }
    if (options.retries) {
        config.synthesis.retries = *options.retries;
    }
    if (options.timeoutMs) {
        config.synthesis.timeoutMs = *options.timeoutMs;
    }
    if (options.stretcher) {
        config.fitting.stretcher = *options.stretcher;
    }
    if (options.format) {
        config.output.format = *options.format;
    }
    if (options.statsFile) {
        config.output.statsFile = *options.statsFile;
    }
}

std::string defaultLogFile(const std::string& outputFile) {
    std::filesystem::path path(outputFile);
    path.replace_extension(".log");
    return path.string();
}

}  // namespace

int main(int argc, char* argv[]) {
    CliOptions options;
    if (!parseArguments(argc, argv, options)) {
        printUsage(argv[0]);
        return 1;
    }

    subdub::logging::initializeEarly();

    subdub::DubConfig config;
    subdub::loadDubConfig(options.configPath, config);
    applyOverrides(options, config);

    subdub::logging::LogConfig logConfig;
    if (!subdub::logging::loadLogConfig(options.configPath, logConfig)) {
        std::cerr << "Warning: ignoring the logging section of " << options.configPath
                  << std::endl;
    }
    if (options.logLevel) {
        logConfig.level = subdub::logging::stringToLevel(*options.logLevel);
    }
    if (options.logFile) {
        logConfig.filePath = *options.logFile;
    } else if (logConfig.filePath.empty()) {
        logConfig.filePath = defaultLogFile(options.outputFile);
    }
    // Re-create the sinks with the file attached.
    subdub::logging::shutdown();
    if (!subdub::logging::initialize(logConfig)) {
        std::cerr << "Error: cannot initialize logging to " << logConfig.filePath << std::endl;
        return 1;
    }

    LOG_INFO("subdub: {} -> {}", options.inputFile, options.outputFile);

    int exitCode = 1;
    try {
        subdub::synthesis::CommandSynthesizerConfig synthConfig;
        synthConfig.command = config.synthesis.command;
        synthConfig.outputExtension = config.synthesis.outputExtension;
        subdub::synthesis::CommandSynthesizer synthesizer(synthConfig);

        auto stretcher = subdub::fitting::createTimeStretcher(config.fitting.stretcher);
        subdub::media::FfprobeDurationProbe probe;

        subdub::pipeline::DubbingPipeline pipeline(config, synthesizer, *stretcher, probe);
        subdub::pipeline::RunResult result = pipeline.run(options.inputFile, options.outputFile);

        if (result.ok()) {
            LOG_INFO("Done.");
            exitCode = 0;
        } else {
            std::cerr << "Error: " << result.message << " ("
                      << subdub::errorCodeToString(result.code) << ")" << std::endl;
        }
    } catch (const std::exception& e) {
        LOG_CRITICAL("Fatal error: {}", e.what());
    }

    subdub::logging::shutdown();
    return exitCode;
}
