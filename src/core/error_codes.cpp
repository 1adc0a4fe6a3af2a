#include "core/error_codes.h"

#include <iomanip>
#include <sstream>
#include <unordered_map>

namespace subdub {

static const std::unordered_map<ErrorCode, const char*> kErrorCodeStrings = {
    {ErrorCode::OK, "OK"},

    // Speech synthesis
    {ErrorCode::SYNTHESIS_TRANSIENT_FAILURE, "SYNTHESIS_TRANSIENT_FAILURE"},
    {ErrorCode::SYNTHESIS_TIMEOUT, "SYNTHESIS_TIMEOUT"},
    {ErrorCode::SYNTHESIS_PERMANENT_FAILURE, "SYNTHESIS_PERMANENT_FAILURE"},
    {ErrorCode::SYNTHESIS_RETRIES_EXHAUSTED, "SYNTHESIS_RETRIES_EXHAUSTED"},
    {ErrorCode::SYNTHESIS_INVALID_AUDIO, "SYNTHESIS_INVALID_AUDIO"},

    // Slot fitting
    {ErrorCode::STRETCH_FAILED, "STRETCH_FAILED"},
    {ErrorCode::STRETCH_UNSUPPORTED, "STRETCH_UNSUPPORTED"},
    {ErrorCode::ASSEMBLY_ALREADY_FINALIZED, "ASSEMBLY_ALREADY_FINALIZED"},

    // I/O
    {ErrorCode::IO_WORKDIR_FAILED, "IO_WORKDIR_FAILED"},
    {ErrorCode::IO_SEGMENT_WRITE_FAILED, "IO_SEGMENT_WRITE_FAILED"},
    {ErrorCode::IO_SEGMENT_READ_FAILED, "IO_SEGMENT_READ_FAILED"},
    {ErrorCode::IO_OUTPUT_WRITE_FAILED, "IO_OUTPUT_WRITE_FAILED"},
    {ErrorCode::IO_CANCELLED, "IO_CANCELLED"},

    // Media collaborators
    {ErrorCode::MEDIA_PROBE_FAILED, "MEDIA_PROBE_FAILED"},
    {ErrorCode::MEDIA_SUBTITLE_PARSE_FAILED, "MEDIA_SUBTITLE_PARSE_FAILED"},
    {ErrorCode::MEDIA_SUBTITLE_EMPTY, "MEDIA_SUBTITLE_EMPTY"},

    // Validation
    {ErrorCode::VALIDATION_INVALID_CONFIG, "VALIDATION_INVALID_CONFIG"},
    {ErrorCode::VALIDATION_FILE_NOT_FOUND, "VALIDATION_FILE_NOT_FOUND"},
    {ErrorCode::VALIDATION_NO_TARGET_DURATION, "VALIDATION_NO_TARGET_DURATION"},
    {ErrorCode::VALIDATION_AMBIGUOUS_TARGET, "VALIDATION_AMBIGUOUS_TARGET"},
    {ErrorCode::VALIDATION_INVALID_CUE, "VALIDATION_INVALID_CUE"},
    {ErrorCode::VALIDATION_UNSUPPORTED_FORMAT, "VALIDATION_UNSUPPORTED_FORMAT"},

    // Internal
    {ErrorCode::INTERNAL_UNKNOWN, "INTERNAL_UNKNOWN"},
};

static const std::unordered_map<std::string, ErrorCode> kStringToErrorCode = [] {
    std::unordered_map<std::string, ErrorCode> reverse;
    for (const auto& entry : kErrorCodeStrings) {
        reverse.emplace(entry.second, entry.first);
    }
    return reverse;
}();

const char* errorCodeToString(ErrorCode code) {
    auto it = kErrorCodeStrings.find(code);
    if (it != kErrorCodeStrings.end()) {
        return it->second;
    }
    return "UNKNOWN_ERROR";
}

const char* getErrorCategory(ErrorCode code) {
    if (code == ErrorCode::OK) {
        return "ok";
    }
    if (isSynthesisError(code)) {
        return "synthesis";
    }
    if (isFittingError(code)) {
        return "fitting";
    }
    if (isIoError(code)) {
        return "io";
    }
    if (isMediaError(code)) {
        return "media";
    }
    if (isValidationError(code)) {
        return "validation";
    }
    return "internal";
}

std::string errorCodeToHex(ErrorCode code) {
    std::ostringstream oss;
    oss << "0x" << std::hex << std::setfill('0') << std::setw(4) << static_cast<uint32_t>(code);
    return oss.str();
}

ErrorCode stringToErrorCode(const std::string& str) {
    auto it = kStringToErrorCode.find(str);
    if (it != kStringToErrorCode.end()) {
        return it->second;
    }
    return ErrorCode::INTERNAL_UNKNOWN;
}

}  // namespace subdub
