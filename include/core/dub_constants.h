#ifndef SUBDUB_DUB_CONSTANTS_H
#define SUBDUB_DUB_CONSTANTS_H

// Defaults and limits shared by the config loader and the CLI

namespace DubConstants {

// Audio
constexpr int DEFAULT_SAMPLE_RATE = 24000;
constexpr int MIN_SAMPLE_RATE = 8000;
constexpr int MAX_SAMPLE_RATE = 192000;

// Slot fitting
constexpr double DEFAULT_MAX_SPEED = 1.5;
constexpr double MAX_SPEED_LIMIT = 4.0;  // Above this speech stops being intelligible

// Orchestration
constexpr int DEFAULT_BATCH_SIZE = 10;
constexpr int MAX_BATCH_SIZE = 64;
constexpr int DEFAULT_RETRIES = 10;
constexpr int MAX_RETRIES = 20;
constexpr int DEFAULT_TIMEOUT_MS = 60000;
constexpr int DEFAULT_BACKOFF_MS = 1000;

constexpr const char* DEFAULT_VOICE = "en-US-JennyNeural";
constexpr const char* DEFAULT_STRETCHER = "rubberband";
constexpr const char* DEFAULT_TEMP_ROOT = "temp";

}  // namespace DubConstants

#endif  // SUBDUB_DUB_CONSTANTS_H
