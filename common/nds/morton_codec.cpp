#include "morton_codec.hh"

#include "bit_utils.hh"

static constexpr uint32_t kPayloadMask = (1u << MortonCodec::kPayloadBitsPerAxis) - 1;  // Bits 0-30.

uint64_t MortonCodec::SpreadBits(uint32_t value) {
    uint64_t result = value;
    result = (result | (result << 16)) & 0x0000FFFF0000FFFFULL;
    result = (result | (result << 8)) & 0x00FF00FF00FF00FFULL;
    result = (result | (result << 4)) & 0x0F0F0F0F0F0F0F0FULL;
    result = (result | (result << 2)) & 0x3333333333333333ULL;
    result = (result | (result << 1)) & 0x5555555555555555ULL;
    return result;
}

uint32_t MortonCodec::CompactBits(uint64_t value) {
    value = value & 0x5555555555555555ULL;
    value = (value | (value >> 1)) & 0x3333333333333333ULL;
    value = (value | (value >> 2)) & 0x0F0F0F0F0F0F0F0FULL;
    value = (value | (value >> 4)) & 0x00FF00FF00FF00FFULL;
    value = (value | (value >> 8)) & 0x0000FFFF0000FFFFULL;
    value = (value | (value >> 16)) & 0x00000000FFFFFFFFULL;
    return static_cast<uint32_t>(value);
}

uint64_t MortonCodec::Encode(int32_t longitude, int32_t latitude) {
    // Casting to unsigned keeps the two's complement bit pattern of negative values.
    uint32_t longitude_payload = static_cast<uint32_t>(longitude) & kPayloadMask;
    uint32_t latitude_payload = static_cast<uint32_t>(latitude) & kPayloadMask;

    uint64_t morton_code = SpreadBits(longitude_payload) | (SpreadBits(latitude_payload) << 1);
    if (longitude < 0) {
        morton_code |= UINT64_C(1) << kLongitudeSignBit;
    }
    if (latitude < 0) {
        morton_code |= UINT64_C(1) << kLatitudeSignBit;
    }
    return morton_code;
}

void MortonCodec::Decode(uint64_t morton_code, int32_t &longitude, int32_t &latitude) {
    // Even bits 0-62 hold longitude bits 0-30 followed by the longitude sign flag, which lands in bit 31.
    longitude = ToSigned32(CompactBits(morton_code));
    // Odd bits 1-61 hold latitude bits 0-30. Bit 63 would end up in bit 31 and is dropped by the sign extension.
    latitude = SignExtend(CompactBits(morton_code >> 1), kLatitudeNumBits);
}
