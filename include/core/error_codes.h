#ifndef SUBDUB_ERROR_CODES_H
#define SUBDUB_ERROR_CODES_H

#include <cstdint>
#include <string>

namespace subdub {

/**
 * @brief Error codes reported by a dubbing run.
 *
 * Categories use the upper nibble of the low 16 bits (0xF000 mask):
 * - 0x1xxx: Speech synthesis
 * - 0x2xxx: Slot fitting / time-stretch
 * - 0x3xxx: Working directory and output I/O
 * - 0x4xxx: Media collaborators (probe, subtitles)
 * - 0x5xxx: Validation
 * - 0xFxxx: Internal (reserved)
 */
enum class ErrorCode : uint32_t {
    OK = 0,

    // Speech synthesis (0x1000)
    SYNTHESIS_TRANSIENT_FAILURE = 0x1001,
    SYNTHESIS_TIMEOUT = 0x1002,
    SYNTHESIS_PERMANENT_FAILURE = 0x1003,
    SYNTHESIS_RETRIES_EXHAUSTED = 0x1004,
    SYNTHESIS_INVALID_AUDIO = 0x1005,

    // Slot fitting (0x2000)
    STRETCH_FAILED = 0x2001,
    STRETCH_UNSUPPORTED = 0x2002,
    ASSEMBLY_ALREADY_FINALIZED = 0x2003,

    // I/O (0x3000)
    IO_WORKDIR_FAILED = 0x3001,
    IO_SEGMENT_WRITE_FAILED = 0x3002,
    IO_SEGMENT_READ_FAILED = 0x3003,
    IO_OUTPUT_WRITE_FAILED = 0x3004,
    IO_CANCELLED = 0x3005,

    // Media collaborators (0x4000)
    MEDIA_PROBE_FAILED = 0x4001,
    MEDIA_SUBTITLE_PARSE_FAILED = 0x4002,
    MEDIA_SUBTITLE_EMPTY = 0x4003,

    // Validation (0x5000)
    VALIDATION_INVALID_CONFIG = 0x5001,
    VALIDATION_FILE_NOT_FOUND = 0x5002,
    VALIDATION_NO_TARGET_DURATION = 0x5003,
    VALIDATION_AMBIGUOUS_TARGET = 0x5004,
    VALIDATION_INVALID_CUE = 0x5005,
    VALIDATION_UNSUPPORTED_FORMAT = 0x5006,

    // Internal (0xF000)
    INTERNAL_UNKNOWN = 0xF001,
};

/**
 * @brief Convert ErrorCode to its name (e.g. "SYNTHESIS_TIMEOUT").
 * @return "UNKNOWN_ERROR" for unmapped values
 */
const char* errorCodeToString(ErrorCode code);

/**
 * @brief Category name for an error code (e.g. "synthesis"), "internal" when unmapped.
 */
const char* getErrorCategory(ErrorCode code);

/**
 * @brief Hex form of an error code (e.g. "0x1002").
 */
std::string errorCodeToHex(ErrorCode code);

/**
 * @brief Reverse of errorCodeToString; INTERNAL_UNKNOWN when not found.
 */
ErrorCode stringToErrorCode(const std::string& str);

constexpr bool isSynthesisError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x1000;
}
constexpr bool isFittingError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x2000;
}
constexpr bool isIoError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x3000;
}
constexpr bool isMediaError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x4000;
}
constexpr bool isValidationError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x5000;
}
constexpr bool isInternalError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0xF000;
}

/**
 * @brief Check if a synthesis attempt that failed with this code may be retried.
 *
 * Retryable: SYNTHESIS_TRANSIENT_FAILURE, SYNTHESIS_TIMEOUT
 */
constexpr bool isRetryable(ErrorCode code) {
    return code == ErrorCode::SYNTHESIS_TRANSIENT_FAILURE || code == ErrorCode::SYNTHESIS_TIMEOUT;
}

/**
 * @brief Errors that abort a run. Synthesis and fitting errors are absorbed per cue.
 */
constexpr bool isFatal(ErrorCode code) {
    return code != ErrorCode::OK && !isSynthesisError(code) &&
           code != ErrorCode::STRETCH_FAILED && code != ErrorCode::STRETCH_UNSUPPORTED;
}

}  // namespace subdub

#endif  // SUBDUB_ERROR_CODES_H
