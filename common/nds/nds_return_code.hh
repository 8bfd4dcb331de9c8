#pragma once

#include <cstdint>

/**
 * Result of fallible NDS operations. Failures are input errors: the operation left its output untouched and nothing
 * will change by retrying.
 */
enum NDSReturnCode : int {
    kNDSOk = 0,
    kNDSErrorRange = -1,                // A numeric input was outside its declared domain.
    kNDSErrorMalformedIdentifier = -2,  // A packed tile ID contained no level marker bit.
};

static constexpr uint16_t kNumNDSReturnCodes = 3;

/**
 * Returns a human readable name for a return code, e.g. "RANGE_ERROR".
 */
const char *NDSReturnCodeToString(NDSReturnCode code);
