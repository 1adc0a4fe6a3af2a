/**
 * @file test_error_codes.cpp
 * @brief Unit tests for run error codes
 */

#include "core/error_codes.h"

#include <gtest/gtest.h>

using namespace subdub;

// ============================================================
// ErrorCode to String Tests
// ============================================================

TEST(ErrorCodes, ErrorCodeToString) {
    EXPECT_STREQ(errorCodeToString(ErrorCode::OK), "OK");
    EXPECT_STREQ(errorCodeToString(ErrorCode::SYNTHESIS_TIMEOUT), "SYNTHESIS_TIMEOUT");
    EXPECT_STREQ(errorCodeToString(ErrorCode::IO_SEGMENT_WRITE_FAILED),
                 "IO_SEGMENT_WRITE_FAILED");
    EXPECT_STREQ(errorCodeToString(ErrorCode::VALIDATION_AMBIGUOUS_TARGET),
                 "VALIDATION_AMBIGUOUS_TARGET");
}

TEST(ErrorCodes, UnknownErrorCodeReturnsUnknown) {
    auto unknownCode = static_cast<ErrorCode>(0xFFFF);
    EXPECT_STREQ(errorCodeToString(unknownCode), "UNKNOWN_ERROR");
}

TEST(ErrorCodes, StringRoundTrip) {
    EXPECT_EQ(stringToErrorCode("MEDIA_PROBE_FAILED"), ErrorCode::MEDIA_PROBE_FAILED);
    EXPECT_EQ(stringToErrorCode("OK"), ErrorCode::OK);
    EXPECT_EQ(stringToErrorCode("NO_SUCH_CODE"), ErrorCode::INTERNAL_UNKNOWN);
}

TEST(ErrorCodes, HexFormat) {
    EXPECT_EQ(errorCodeToHex(ErrorCode::SYNTHESIS_TIMEOUT), "0x1002");
    EXPECT_EQ(errorCodeToHex(ErrorCode::OK), "0x0000");
}

// ============================================================
// Error Category Tests
// ============================================================

TEST(ErrorCodes, GetErrorCategory) {
    EXPECT_STREQ(getErrorCategory(ErrorCode::OK), "ok");
    EXPECT_STREQ(getErrorCategory(ErrorCode::SYNTHESIS_PERMANENT_FAILURE), "synthesis");
    EXPECT_STREQ(getErrorCategory(ErrorCode::STRETCH_FAILED), "fitting");
    EXPECT_STREQ(getErrorCategory(ErrorCode::IO_WORKDIR_FAILED), "io");
    EXPECT_STREQ(getErrorCategory(ErrorCode::MEDIA_SUBTITLE_EMPTY), "media");
    EXPECT_STREQ(getErrorCategory(ErrorCode::VALIDATION_INVALID_CONFIG), "validation");
}

TEST(ErrorCodes, UnknownCategoryReturnsInternal) {
    auto unknownCode = static_cast<ErrorCode>(0xFFFF);
    EXPECT_STREQ(getErrorCategory(unknownCode), "internal");
}

// ============================================================
// Retry / fatal classification
// ============================================================

TEST(ErrorCodes, OnlyTransientSynthesisErrorsAreRetryable) {
    EXPECT_TRUE(isRetryable(ErrorCode::SYNTHESIS_TRANSIENT_FAILURE));
    EXPECT_TRUE(isRetryable(ErrorCode::SYNTHESIS_TIMEOUT));
    EXPECT_FALSE(isRetryable(ErrorCode::SYNTHESIS_PERMANENT_FAILURE));
    EXPECT_FALSE(isRetryable(ErrorCode::IO_SEGMENT_WRITE_FAILED));
    EXPECT_FALSE(isRetryable(ErrorCode::OK));
}

TEST(ErrorCodes, PerCueErrorsAreNotFatal) {
    EXPECT_FALSE(isFatal(ErrorCode::OK));
    EXPECT_FALSE(isFatal(ErrorCode::SYNTHESIS_RETRIES_EXHAUSTED));
    EXPECT_FALSE(isFatal(ErrorCode::STRETCH_FAILED));
    EXPECT_FALSE(isFatal(ErrorCode::STRETCH_UNSUPPORTED));

    EXPECT_TRUE(isFatal(ErrorCode::IO_SEGMENT_WRITE_FAILED));
    EXPECT_TRUE(isFatal(ErrorCode::VALIDATION_NO_TARGET_DURATION));
    EXPECT_TRUE(isFatal(ErrorCode::ASSEMBLY_ALREADY_FINALIZED));
}
