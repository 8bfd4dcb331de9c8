#include "nds_return_code.hh"

static const char kNDSReturnCodeStrs[kNumNDSReturnCodes][30] = {"OK", "RANGE_ERROR", "MALFORMED_IDENTIFIER"};

const char *NDSReturnCodeToString(NDSReturnCode code) {
    int index = -static_cast<int>(code);
    if (index < 0 || index >= kNumNDSReturnCodes) {
        return "UNKNOWN";
    }
    return kNDSReturnCodeStrs[index];
}
