#pragma once

#include "synthesis/synthesizer.h"

#include <atomic>
#include <filesystem>
#include <string>
#include <vector>

namespace subdub {
namespace synthesis {

struct CommandSynthesizerConfig {
    // argv template; "{text}", "{voice}" and "{output}" are substituted in every element.
    std::vector<std::string> command = {"edge-tts",  "--voice", "{voice}", "--text",
                                        "{text}",    "--write-media", "{output}"};
    // Extension of the file the command writes (must be readable by libsndfile).
    std::string outputExtension = "mp3";
    // Where the per-request output files go; removed after each call.
    std::filesystem::path scratchDir = std::filesystem::temp_directory_path();
};

// Synthesizer backed by an external command-line TTS tool.
//
// Exit status 127 or a binary missing from PATH is a permanent error; any other
// failure is transient. The child is killed when the timeout expires.
class CommandSynthesizer final : public Synthesizer {
   public:
    explicit CommandSynthesizer(CommandSynthesizerConfig config);

    const char* name() const override {
        return "command";
    }

    SynthesisResult synthesize(const std::string& text, const std::string& voice,
                               std::chrono::milliseconds timeout) override;

    // Template expansion, exposed for tests.
    static std::vector<std::string> expandCommand(const std::vector<std::string>& tmpl,
                                                  const std::string& text,
                                                  const std::string& voice,
                                                  const std::string& output);

   private:
    std::filesystem::path nextOutputPath();

    CommandSynthesizerConfig config_;
    std::atomic<unsigned long> counter_{0};
};

}  // namespace synthesis
}  // namespace subdub
