#include "synthesis/command_synthesizer.h"

#include "audio/audio_io.h"
#include "core/process_runner.h"
#include "logging/logger.h"

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <system_error>
#include <unistd.h>

namespace subdub {
namespace synthesis {

namespace {

constexpr int kCommandNotFound = 127;

void replaceAll(std::string& s, const std::string& from, const std::string& to) {
    std::size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
}

}  // namespace

CommandSynthesizer::CommandSynthesizer(CommandSynthesizerConfig config)
    : config_(std::move(config)) {
    if (config_.command.empty()) {
        throw std::invalid_argument("CommandSynthesizer: empty command template");
    }
}

std::vector<std::string> CommandSynthesizer::expandCommand(const std::vector<std::string>& tmpl,
                                                           const std::string& text,
                                                           const std::string& voice,
                                                           const std::string& output) {
    std::vector<std::string> args;
    args.reserve(tmpl.size());
    for (std::string arg : tmpl) {
        // {text} last so placeholders inside the cue text stay literal.
        replaceAll(arg, "{voice}", voice);
        replaceAll(arg, "{output}", output);
        replaceAll(arg, "{text}", text);
        args.push_back(std::move(arg));
    }
    return args;
}

std::filesystem::path CommandSynthesizer::nextOutputPath() {
    const unsigned long n = counter_.fetch_add(1, std::memory_order_relaxed);
    return config_.scratchDir / ("subdub_tts_" + std::to_string(getpid()) + "_" +
                                 std::to_string(n) + "." + config_.outputExtension);
}

SynthesisResult CommandSynthesizer::synthesize(const std::string& text, const std::string& voice,
                                               std::chrono::milliseconds timeout) {
    SynthesisResult result;
    const std::filesystem::path outputPath = nextOutputPath();
    const auto args = expandCommand(config_.command, text, voice, outputPath.string());

    ProcessResult proc = runProcess(args, timeout);

    if (!proc.started) {
        result.status = proc.spawnError == ENOENT ? SynthesisStatus::PermanentError
                                                  : SynthesisStatus::TransientError;
        result.message = "cannot start '" + args[0] + "': " + std::strerror(proc.spawnError);
    } else if (proc.timedOut) {
        result.status = SynthesisStatus::Timeout;
        result.message = "timed out after " + std::to_string(timeout.count()) + " ms";
    } else if (!proc.exited || proc.exitCode != 0) {
        result.status = proc.exitCode == kCommandNotFound ? SynthesisStatus::PermanentError
                                                          : SynthesisStatus::TransientError;
        result.message = "'" + args[0] + "' exited with status " + std::to_string(proc.exitCode);
    } else if (!AudioIO::readAudioFile(outputPath.string(), result.audio) ||
               result.audio.empty()) {
        result.status = SynthesisStatus::TransientError;
        result.message = "no readable audio in " + outputPath.string();
    } else {
        result.status = SynthesisStatus::Ok;
    }

    std::error_code ec;
    std::filesystem::remove(outputPath, ec);
    return result;
}

}  // namespace synthesis
}  // namespace subdub
