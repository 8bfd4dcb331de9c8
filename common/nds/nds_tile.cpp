#include "nds_tile.hh"

#include "bit_utils.hh"
#include "comms.hh"
#include "morton_codec.hh"

NDSTile::NDSTile(int16_t level, uint32_t tile_number) : level_(level), tile_number_(tile_number) {
    center_ = ComputeCenter();
}

NDSReturnCode NDSTile::FromPackedId(int64_t packed_id, NDSTile &tile_out) {
    if (packed_id < INT32_MIN || packed_id > static_cast<int64_t>(UINT32_MAX)) {
        CONSOLE_ERROR("NDSTile::FromPackedId", "Packed Tile ID %lld does not fit in 32 bits.",
                      static_cast<long long>(packed_id));
        return kNDSErrorRange;
    }
    PrintBinary(static_cast<uint32_t>(packed_id), "Packed ID binary");

    int16_t level = ExtractLevel(packed_id);
    if (level < 0) {
        CONSOLE_ERROR("NDSTile::FromPackedId", "Invalid packed Tile ID %lld: No Level bit present.",
                      static_cast<long long>(packed_id));
        return kNDSErrorMalformedIdentifier;
    }
    uint32_t level_bit = UINT32_C(1) << (kLevelMarkerBitOffset + level);
    uint32_t tile_number = static_cast<uint32_t>(packed_id) ^ level_bit;
    return FromLevelAndNumber(level, tile_number, tile_out);
}

NDSReturnCode NDSTile::FromLevelAndNumber(int16_t level, int64_t tile_number, NDSTile &tile_out) {
    if (level < 0 || level > kMaxLevel) {
        CONSOLE_ERROR("NDSTile::FromLevelAndNumber", "The Tile level %d exceeds the range [0, %d].", level, kMaxLevel);
        return kNDSErrorRange;
    }
    if (tile_number < 0) {
        CONSOLE_ERROR("NDSTile::FromLevelAndNumber", "The Tile number %lld must be positive (Max length is 31 bits).",
                      static_cast<long long>(tile_number));
        return kNDSErrorRange;
    }
    if (tile_number > MaxTileNumber(level)) {
        CONSOLE_ERROR("NDSTile::FromLevelAndNumber",
                      "Invalid Tile number %lld for level %d, numbers 0 .. %u are allowed.",
                      static_cast<long long>(tile_number), level, MaxTileNumber(level));
        return kNDSErrorRange;
    }
    tile_out = NDSTile(level, static_cast<uint32_t>(tile_number));
    return kNDSOk;
}

NDSReturnCode NDSTile::FromLevelAndCoordinate(int16_t level, const NDSCoordinate &coordinate, NDSTile &tile_out) {
    if (level < 0 || level > kMaxLevel) {
        CONSOLE_ERROR("NDSTile::FromLevelAndCoordinate", "The Tile level %d exceeds the range [0, %d].", level,
                      kMaxLevel);
        return kNDSErrorRange;
    }
    uint16_t shift = kMortonBaseShift + (kMaxLevel - level) * 2;
    tile_out = NDSTile(level, static_cast<uint32_t>(coordinate.GetMortonCode() >> shift));
    return kNDSOk;
}

NDSReturnCode NDSTile::FromLevelAndCoordinate(int16_t level, const WGS84Coordinate &coordinate, NDSTile &tile_out) {
    NDSCoordinate nds_coordinate;
    NDSReturnCode code = NDSCoordinate::FromWGS84(coordinate, nds_coordinate);
    if (code != kNDSOk) {
        return code;
    }
    return FromLevelAndCoordinate(level, nds_coordinate, tile_out);
}

int16_t NDSTile::ExtractLevel(int64_t packed_id) {
    // A negative 32-bit ID has bit 31 set, which is the marker bit of kMaxLevel.
    if (packed_id < 0) {
        return kMaxLevel;
    }
    for (int16_t level = kMaxLevel; level >= 0; level--) {
        if (packed_id & (INT64_C(1) << (kLevelMarkerBitOffset + level))) {
            return level;
        }
    }
    return -1;
}

bool NDSTile::Contains(const NDSCoordinate &coordinate) const {
    return tile_number_ == (coordinate.GetMortonCode() >> MortonShift());
}

int32_t NDSTile::PackedId() const {
    return ToSigned32(static_cast<int64_t>(tile_number_) + (INT64_C(1) << (kLevelMarkerBitOffset + level_)));
}

uint64_t NDSTile::SouthWestAsMorton() const { return static_cast<uint64_t>(tile_number_) << MortonShift(); }

NDSCoordinate NDSTile::ComputeCenter() const {
    if (level_ == 0) {
        return NDSCoordinate(tile_number_ == 0 ? NDSCoordinate::kMaxLongitude / 2 : NDSCoordinate::kMinLongitude / 2,
                             0);
    }
    PrintBinary(SouthWestAsMorton(), "South west morton code binary");

    int32_t south_west_longitude, south_west_latitude;
    MortonCodec::Decode(SouthWestAsMorton(), south_west_longitude, south_west_latitude);
    // Negative corners get one extra unit, since the negative half of each axis is one unit longer. The offsets are
    // at most half the tile size, so the center stays inside the tile.
    int64_t center_latitude = south_west_latitude + (NDSCoordinate::kLatitudeRange >> (level_ + 1)) +
                              (south_west_latitude < 0 ? 1 : 0);
    int64_t center_longitude = south_west_longitude + (NDSCoordinate::kLongitudeRange >> (level_ + 2)) +
                               (south_west_longitude < 0 ? 1 : 0);
    return NDSCoordinate(static_cast<int32_t>(center_longitude), static_cast<int32_t>(center_latitude));
}

NDSBBox NDSTile::GetBBox() const {
    if (level_ == 0) {
        return tile_number_ == 0 ? NDSBBox::EastHemisphere() : NDSBBox::WestHemisphere();
    }

    int32_t west, south;
    MortonCodec::Decode(SouthWestAsMorton(), west, south);
    int64_t north = south + (NDSCoordinate::kLatitudeRange >> level_) + (south < 0 ? 1 : 0);
    int64_t east = west + (NDSCoordinate::kLongitudeRange >> (level_ + 1)) + (west < 0 ? 1 : 0);
    return NDSBBox(static_cast<int32_t>(north), static_cast<int32_t>(east), south, west);
}

void NDSTile::GetTileGridCoordinates(int32_t &column, int32_t &row) const {
    if (level_ == 0) {
        column = tile_number_ == 0 ? 0 : -1;
        row = 0;
        return;
    }

    // Even bits of the tile number hold the column, odd bits the row. The top bit pair is the sign.
    uint32_t column_bits = MortonCodec::CompactBits(tile_number_);
    uint32_t row_bits = MortonCodec::CompactBits(static_cast<uint64_t>(tile_number_) >> 1);

    int64_t num_columns_half = INT64_C(1) << level_;
    int64_t num_rows_half = INT64_C(1) << (level_ - 1);
    column = static_cast<int32_t>(column_bits < num_columns_half ? column_bits : column_bits - 2 * num_columns_half);
    row = static_cast<int32_t>(row_bits < num_rows_half ? row_bits : row_bits - 2 * num_rows_half);
}

uint16_t NDSTile::ToGeoJSON(char *buf, uint16_t buf_len) const { return GetBBox().ToGeoJSON(buf, buf_len); }
