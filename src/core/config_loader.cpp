#include "core/config_loader.h"

#include "audio/audio_io.h"
#include "logging/logger.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace subdub {

static std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

static std::string validateStretcher(const std::string& str, bool verbose) {
    std::string lower = toLower(str);
    if (lower == "rubberband" || lower == "bypass") {
        return lower;
    }
    if (verbose) {
        LOG_WARN("Config: Unknown fitting.stretcher '{}', using '{}'", str,
                 DubConstants::DEFAULT_STRETCHER);
    }
    return DubConstants::DEFAULT_STRETCHER;
}

bool loadDubConfig(const std::filesystem::path& configPath, DubConfig& outConfig, bool verbose) {
    outConfig = DubConfig{};

    std::ifstream file(configPath);
    if (!file.is_open()) {
        if (verbose) {
            std::cout << "Config: " << configPath << " not found, using defaults" << '\n';
        }
        return false;
    }

    try {
        nlohmann::json j;
        file >> j;

        if (j.contains("synthesis") && j["synthesis"].is_object()) {
            auto syn = j["synthesis"];
            try {
                if (syn.contains("voice") && syn["voice"].is_string()) {
                    outConfig.synthesis.voice = syn["voice"].get<std::string>();
                }
                if (syn.contains("command") && syn["command"].is_array()) {
                    auto command = syn["command"].get<std::vector<std::string>>();
                    if (!command.empty()) {
                        outConfig.synthesis.command = std::move(command);
                    } else if (verbose) {
                        LOG_WARN("Config: synthesis.command is empty, using edge-tts");
                    }
                }
                if (syn.contains("outputExtension") && syn["outputExtension"].is_string()) {
                    outConfig.synthesis.outputExtension =
                        syn["outputExtension"].get<std::string>();
                }
                if (syn.contains("timeoutMs") && syn["timeoutMs"].is_number_integer()) {
                    outConfig.synthesis.timeoutMs = syn["timeoutMs"].get<int>();
                }
                if (syn.contains("retries") && syn["retries"].is_number_integer()) {
                    outConfig.synthesis.retries = syn["retries"].get<int>();
                }
                if (syn.contains("backoffMs") && syn["backoffMs"].is_number_integer()) {
                    outConfig.synthesis.backoffMs = syn["backoffMs"].get<int>();
                }
            } catch (const std::exception& e) {
                if (verbose) {
                    LOG_WARN("Config: Invalid synthesis settings, using defaults: {}", e.what());
                }
                outConfig.synthesis = DubConfig::SynthesisConfig{};
            }

            if (outConfig.synthesis.timeoutMs <= 0) {
                if (verbose) {
                    LOG_WARN("Config: synthesis.timeoutMs must be positive, using {}",
                             DubConstants::DEFAULT_TIMEOUT_MS);
                }
                outConfig.synthesis.timeoutMs = DubConstants::DEFAULT_TIMEOUT_MS;
            }
            if (outConfig.synthesis.retries < 0 ||
                outConfig.synthesis.retries > DubConstants::MAX_RETRIES) {
                if (verbose) {
                    LOG_WARN("Config: synthesis.retries must be 0..{} (got {}), using {}",
                             DubConstants::MAX_RETRIES, outConfig.synthesis.retries,
                             DubConstants::DEFAULT_RETRIES);
                }
                outConfig.synthesis.retries = DubConstants::DEFAULT_RETRIES;
            }
            outConfig.synthesis.backoffMs = std::max(0, outConfig.synthesis.backoffMs);
        }

        if (j.contains("fitting") && j["fitting"].is_object()) {
            auto fit = j["fitting"];
            if (fit.contains("maxSpeed") && fit["maxSpeed"].is_number()) {
                double maxSpeed = fit["maxSpeed"].get<double>();
                if (maxSpeed >= 1.0 && maxSpeed <= DubConstants::MAX_SPEED_LIMIT) {
                    outConfig.fitting.maxSpeed = maxSpeed;
                } else if (verbose) {
                    LOG_WARN("Config: fitting.maxSpeed must be 1.0..{} (got {}), using {}",
                             DubConstants::MAX_SPEED_LIMIT, maxSpeed,
                             DubConstants::DEFAULT_MAX_SPEED);
                }
            }
            if (fit.contains("stretcher") && fit["stretcher"].is_string()) {
                outConfig.fitting.stretcher =
                    validateStretcher(fit["stretcher"].get<std::string>(), verbose);
            }
        }

        if (j.contains("orchestration") && j["orchestration"].is_object()) {
            auto orch = j["orchestration"];
            if (orch.contains("batchSize") && orch["batchSize"].is_number_integer()) {
                int batchSize = orch["batchSize"].get<int>();
                if (batchSize >= 1 && batchSize <= DubConstants::MAX_BATCH_SIZE) {
                    outConfig.orchestration.batchSize = batchSize;
                } else if (verbose) {
                    LOG_WARN("Config: orchestration.batchSize must be 1..{} (got {}), using {}",
                             DubConstants::MAX_BATCH_SIZE, batchSize,
                             DubConstants::DEFAULT_BATCH_SIZE);
                }
            }
        }

        if (j.contains("run") && j["run"].is_object()) {
            auto run = j["run"];
            if (run.contains("resume") && run["resume"].is_boolean()) {
                outConfig.run.resume = run["resume"].get<bool>();
            }
            if (run.contains("keepTemp") && run["keepTemp"].is_boolean()) {
                outConfig.run.keepTemp = run["keepTemp"].get<bool>();
            }
            if (run.contains("noConcat") && run["noConcat"].is_boolean()) {
                outConfig.run.noConcat = run["noConcat"].get<bool>();
            }
            if (run.contains("tempDir") && run["tempDir"].is_string()) {
                outConfig.run.tempDir = run["tempDir"].get<std::string>();
            }
        }

        if (j.contains("output") && j["output"].is_object()) {
            auto output = j["output"];
            if (output.contains("sampleRate") && output["sampleRate"].is_number_integer()) {
                int rate = output["sampleRate"].get<int>();
                if (rate >= DubConstants::MIN_SAMPLE_RATE && rate <= DubConstants::MAX_SAMPLE_RATE) {
                    outConfig.output.sampleRate = rate;
                } else if (verbose) {
                    LOG_WARN("Config: output.sampleRate {} out of range, using {}", rate,
                             DubConstants::DEFAULT_SAMPLE_RATE);
                }
            }
            if (output.contains("format") && output["format"].is_string()) {
                std::string format = toLower(output["format"].get<std::string>());
                AudioIO::TrackFormat parsed;
                if (format.empty() || AudioIO::parseTrackFormat(format, parsed)) {
                    outConfig.output.format = format;
                } else if (verbose) {
                    LOG_WARN("Config: Unsupported output.format '{}', using the file extension",
                             format);
                }
            }
            if (output.contains("statsFile") && output["statsFile"].is_string()) {
                outConfig.output.statsFile = output["statsFile"].get<std::string>();
            }
        }

        if (j.contains("target") && j["target"].is_object()) {
            auto target = j["target"];
            if (target.contains("duration") && target["duration"].is_string()) {
                outConfig.target.duration = target["duration"].get<std::string>();
            }
            if (target.contains("referenceMedia") && target["referenceMedia"].is_string()) {
                outConfig.target.referenceMedia = target["referenceMedia"].get<std::string>();
            }
        }

        if (verbose) {
            std::cout << "Config: Loaded from " << std::filesystem::absolute(configPath) << '\n';
        }
        return true;
    } catch (const std::exception& e) {
        if (verbose) {
            LOG_ERROR("Config: Failed to parse {}: {}", configPath.string(), e.what());
        }
        outConfig = DubConfig{};
        return false;
    }
}

ErrorCode validateDubConfig(const DubConfig& config, std::string& error) {
    if (!(config.fitting.maxSpeed >= 1.0) ||
        config.fitting.maxSpeed > DubConstants::MAX_SPEED_LIMIT) {
        error = "max speed must be between 1.0 and " +
                std::to_string(DubConstants::MAX_SPEED_LIMIT);
        return ErrorCode::VALIDATION_INVALID_CONFIG;
    }
    if (config.orchestration.batchSize < 1 ||
        config.orchestration.batchSize > DubConstants::MAX_BATCH_SIZE) {
        error = "batch size must be between 1 and " + std::to_string(DubConstants::MAX_BATCH_SIZE);
        return ErrorCode::VALIDATION_INVALID_CONFIG;
    }
    if (config.synthesis.retries < 0 || config.synthesis.retries > DubConstants::MAX_RETRIES) {
        error = "retries must be between 0 and " + std::to_string(DubConstants::MAX_RETRIES);
        return ErrorCode::VALIDATION_INVALID_CONFIG;
    }
    if (config.synthesis.timeoutMs <= 0) {
        error = "synthesis timeout must be positive";
        return ErrorCode::VALIDATION_INVALID_CONFIG;
    }
    if (config.synthesis.command.empty()) {
        error = "synthesis command is empty";
        return ErrorCode::VALIDATION_INVALID_CONFIG;
    }
    if (config.synthesis.voice.empty()) {
        error = "voice is empty";
        return ErrorCode::VALIDATION_INVALID_CONFIG;
    }
    if (config.output.sampleRate < DubConstants::MIN_SAMPLE_RATE ||
        config.output.sampleRate > DubConstants::MAX_SAMPLE_RATE) {
        error = "output sample rate out of range";
        return ErrorCode::VALIDATION_INVALID_CONFIG;
    }
    AudioIO::TrackFormat format;
    if (!config.output.format.empty() && !AudioIO::parseTrackFormat(config.output.format, format)) {
        error = "unsupported output format '" + config.output.format + "'";
        return ErrorCode::VALIDATION_UNSUPPORTED_FORMAT;
    }
    return ErrorCode::OK;
}

}  // namespace subdub
