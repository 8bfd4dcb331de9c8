#include "bit_utils.hh"

#include "comms.hh"

// 64 digits + 15 separators + null terminator.
static constexpr uint16_t kBinaryStrMaxLen = kBitsPerWord64 + kBitsPerWord64 / kBitsPerNibble;

uint16_t FormatBinary(char *buf, uint16_t buf_len, uint64_t value) {
    uint16_t num_bits = 1;
    for (uint16_t i = kBitsPerWord64 - 1; i > 0; i--) {
        if (value & (UINT64_C(1) << i)) {
            num_bits = i + 1;
            break;
        }
    }
    uint16_t num_separators = (num_bits - 1) / kBitsPerNibble;
    uint16_t len = num_bits + num_separators;
    if (buf == nullptr || len + 1 > buf_len) {
        return 0;
    }

    // Fill from the LSb at the end of the string so groups line up on nibble boundaries.
    uint16_t pos = len;
    buf[pos] = '\0';
    for (uint16_t bit = 0; bit < num_bits; bit++) {
        if (bit > 0 && bit % kBitsPerNibble == 0) {
            buf[--pos] = ' ';
        }
        buf[--pos] = (value & (UINT64_C(1) << bit)) ? '1' : '0';
    }
    return len;
}

void PrintBinary(uint64_t value, const char *label) {
    if (!console_level_enabled(SettingsManager::LogLevel::kDebug)) {
        return;
    }
    char binary_str[kBinaryStrMaxLen];
    FormatBinary(binary_str, sizeof(binary_str), value);
    CONSOLE_DEBUG("PrintBinary", "%s: %s", label, binary_str);
}
