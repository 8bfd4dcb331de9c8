#pragma once

#include <cstdint>

/**
 * Interleaves NDS fixed-point coordinates into 64-bit Morton (Z-order) codes and back, following the NDS Format
 * Specification 2.5.4, §7.2.1.
 *
 * Bit layout of a Morton code:
 *   bit 2i   (i = 0..30): longitude bit i
 *   bit 2i+1 (i = 0..30): latitude bit i
 *   bit 61:              latitude sign (coincides with latitude bit 30, the sign bit of the 31-bit latitude)
 *   bit 62:              longitude sign (longitude bit 31)
 *   bit 63:              unused
 */
class MortonCodec {
   public:
    static constexpr uint16_t kPayloadBitsPerAxis = 31;
    static constexpr uint16_t kLatitudeNumBits = 31;  // Latitudes fit in 31-bit two's complement.
    static constexpr uint16_t kLatitudeSignBit = 61;
    static constexpr uint16_t kLongitudeSignBit = 62;

    /**
     * Encodes a longitude/latitude pair into a Morton code.
     * @param[in] longitude Longitude in NDS units.
     * @param[in] latitude Latitude in NDS units, within [-2^30, 2^30-1].
     * @retval Morton code.
     */
    static uint64_t Encode(int32_t longitude, int32_t latitude);

    /**
     * Decodes a Morton code into a longitude/latitude pair. Longitude takes its bit 31 from the longitude sign bit
     * and is read as a 32-bit two's complement value. Latitude is read as a 31-bit two's complement value, so its
     * bit 30 is sign-extended. Bit 63 of the code is ignored.
     * @param[in] morton_code Morton code to decode.
     * @param[out] longitude Decoded longitude in NDS units.
     * @param[out] latitude Decoded latitude in NDS units.
     */
    static void Decode(uint64_t morton_code, int32_t &longitude, int32_t &latitude);

    /**
     * Spreads the low 32 bits of a value onto the even bits of a 64-bit word.
     */
    static uint64_t SpreadBits(uint32_t value);

    /**
     * Gathers the even bits of a 64-bit word into a 32-bit word. Inverse of SpreadBits.
     */
    static uint32_t CompactBits(uint64_t value);
};
