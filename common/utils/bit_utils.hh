#pragma once

#include <cstdint>

static constexpr uint16_t kBitsPerNibble = 4;
static constexpr uint16_t kBitsPerWord32 = 32;
static constexpr uint16_t kBitsPerWord64 = 64;

/**
 * Reinterprets the low 32 bits of a value as a two's complement signed 32-bit integer. Higher bits are discarded, so
 * values outside the int32_t range wrap around the same way fixed-width 32-bit arithmetic does.
 * @param[in] value Value to wrap.
 * @retval Signed 32-bit value with the same low 32 bits as value.
 */
inline int32_t ToSigned32(int64_t value) {
    uint32_t bits = static_cast<uint32_t>(static_cast<uint64_t>(value) & 0xFFFFFFFFu);
    if (bits & 0x80000000u) {
        return static_cast<int32_t>(static_cast<int64_t>(bits) - (INT64_C(1) << kBitsPerWord32));
    }
    return static_cast<int32_t>(bits);
}

/**
 * Sign-extends a num_bits wide two's complement value to a signed 32-bit integer. Bits above num_bits are ignored.
 * @param[in] value Right-aligned value to extend.
 * @param[in] num_bits Bitlength of value, 1-32. The MSb of the value (bit num_bits-1) is the sign bit.
 * @retval Sign-extended value.
 */
inline int32_t SignExtend(uint32_t value, uint16_t num_bits) {
    if (num_bits >= kBitsPerWord32) {
        return ToSigned32(value);
    }
    uint32_t mask = (1u << num_bits) - 1;
    value &= mask;
    if (value & (1u << (num_bits - 1))) {
        return static_cast<int32_t>(static_cast<int64_t>(value) - (INT64_C(1) << num_bits));
    }
    return static_cast<int32_t>(value);
}

/**
 * Writes the binary representation of a value to a string, grouped into nibbles separated by spaces starting from the
 * LSb. Leading zeros are not printed, so 0x1F becomes "1 1111". Negative values are printed as their 64-bit two's
 * complement bit pattern.
 * @param[out] buf Buffer to write to. Must hold at least 80 characters to fit any 64-bit value.
 * @param[in] buf_len Length of buf, in characters.
 * @param[in] value Value to format.
 * @retval Number of characters written, not including the null terminator. 0 if buf was too small.
 */
uint16_t FormatBinary(char *buf, uint16_t buf_len, uint64_t value);

/**
 * Logs the binary representation of a value at debug level. Skips formatting entirely when debug logging is off.
 * @param[in] value Value to print.
 * @param[in] label Label to print before the bit pattern.
 */
void PrintBinary(uint64_t value, const char *label = "Value");
