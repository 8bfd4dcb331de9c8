#ifndef NDS_TILE_HH_
#define NDS_TILE_HH_

#include <cstdint>

#include "nds_bbox.hh"
#include "nds_coordinate.hh"
#include "nds_return_code.hh"
#include "wgs84_coordinate.hh"

/**
 * Implementation of the NDS tiling scheme, following the NDS Format Specification, Version 2.5.4, §7.3.1.
 *
 * Level 0 splits the globe into two tiles at the prime meridian (0 = east, 1 = west). Each further level splits every
 * tile into four, down to level 15. A tile number is the Morton code of the tile's south-west corner with the bits
 * finer than the tile's level dropped. The packed tile ID adds a level marker bit at position 16 + level.
 *
 *   Level | Tiles       | Tile number bits | Packed ID marker bit
 *   ------+-------------+------------------+---------------------
 *     0   | 2           | 1                | 16
 *     1   | 8           | 3                | 17
 *     n   | 2^(2n+1)    | 2n+1             | 16+n
 *    15   | 2^31        | 31               | 31 (packed ID is negative)
 */
class NDSTile {
   public:
    static constexpr int16_t kMaxLevel = 15;
    static constexpr uint16_t kLevelMarkerBitOffset = 16;  // Marker bit of level n is bit 16+n of the packed ID.
    static constexpr uint16_t kMortonBaseShift = 32;        // Tile numbers at kMaxLevel drop the low 32 Morton bits.

    /**
     * Default constructor. Level 0 tile 0, the eastern hemisphere.
     */
    NDSTile() : NDSTile(0, 0) {}

    /**
     * Creates a tile from its packed ID. Accepts both the signed 32-bit representation (level 15 IDs are negative)
     * and the equivalent unsigned value.
     * @param[in] packed_id Packed tile ID.
     * @param[out] tile_out Created tile. Untouched on failure.
     * @retval kNDSOk on success, kNDSErrorMalformedIdentifier if no level marker bit is set, kNDSErrorRange if the
     * value does not fit in 32 bits or the tile number is invalid for the level.
     */
    static NDSReturnCode FromPackedId(int64_t packed_id, NDSTile &tile_out);

    /**
     * Creates a tile from its level and tile number.
     * @param[in] level Tile level, 0-15.
     * @param[in] tile_number Tile number, 0 to 2^(2*level+1)-1.
     * @param[out] tile_out Created tile. Untouched on failure.
     * @retval kNDSOk on success, kNDSErrorRange if level or tile number are out of range.
     */
    static NDSReturnCode FromLevelAndNumber(int16_t level, int64_t tile_number, NDSTile &tile_out);

    /**
     * Creates the tile of a given level that contains a coordinate.
     * @param[in] level Tile level, 0-15.
     * @param[in] coordinate Coordinate inside the tile.
     * @param[out] tile_out Created tile. Untouched on failure.
     * @retval kNDSOk on success, kNDSErrorRange if the level is out of range.
     */
    static NDSReturnCode FromLevelAndCoordinate(int16_t level, const NDSCoordinate &coordinate, NDSTile &tile_out);
    static NDSReturnCode FromLevelAndCoordinate(int16_t level, const WGS84Coordinate &coordinate, NDSTile &tile_out);

    /**
     * Extracts the level from a packed tile ID by looking for the highest level marker bit. Negative IDs have the
     * level 15 marker (the sign bit) set.
     * @param[in] packed_id Packed tile ID as a 32-bit pattern.
     * @retval Level of the ID, or -1 if no marker bit is present.
     */
    static int16_t ExtractLevel(int64_t packed_id);

    /**
     * Returns the largest valid tile number for a level.
     * @param[in] level Tile level.
     * @retval Largest tile number, or 0 if level is outside [0, kMaxLevel].
     */
    static uint32_t MaxTileNumber(int16_t level) {
        if (level < 0 || level > kMaxLevel) {
            return 0;
        }
        return (UINT32_C(1) << (2 * level + 1)) - 1;
    }

    /**
     * Checks if this tile contains a coordinate. Compares Morton code prefixes, so the check is exact.
     */
    bool Contains(const NDSCoordinate &coordinate) const;

    /**
     * Returns the packed tile ID. Level 15 IDs have bit 31 set and are negative.
     */
    int32_t PackedId() const;

    /**
     * Computes the Morton code of the south-west corner of the tile.
     */
    uint64_t SouthWestAsMorton() const;

    /**
     * Returns the center of the tile. Level 0 centers lie on the equator at ±90°.
     */
    NDSCoordinate GetCenter() const { return center_; }

    /**
     * Creates the bounding box of the tile. Level 0 tiles return the hemisphere boxes.
     */
    NDSBBox GetBBox() const;

    /**
     * Computes the tile's column and row within the grid of its level, counted from the prime meridian and the
     * equator. Columns span [-2^level, 2^level) and rows span [-2^(level-1), 2^(level-1)).
     *
     * For level 1, the grid coordinates look like this for the whole world:
     *   [-2,  0] [-1,  0] [0,  0] [1,  0]
     *   [-2, -1] [-1, -1] [0, -1] [1, -1]
     * with the tile numbers
     *    4,  5,  0,  1,
     *    6,  7,  2,  3
     *
     * For level 2:
     *   [-4,  1] [-3,  1] [-2,  1] [-1,  1] [0,  1] [1,  1] [2,  1] [3,  1]
     *   [-4,  0] [-3,  0] [-2,  0] [-1,  0] [0,  0] [1,  0] [2,  0] [3,  0]
     *   [-4, -1] [-3, -1] [-2, -1] [-1, -1] [0, -1] [1, -1] [2, -1] [3, -1]
     *   [-4, -2] [-3, -2] [-2, -2] [-1, -2] [0, -2] [1, -2] [2, -2] [3, -2]
     * with the tile numbers
     *   18,  19,  22,  23,   2,   3,   6,   7,
     *   16,  17,  20,  21,   0,   1,   4,   5,
     *   26,  27,  30,  31,  10,  11,  14,  15,
     *   24,  25,  28,  29,   8,   9,  12,  13
     *
     * @param[out] column Grid column.
     * @param[out] row Grid row.
     */
    void GetTileGridCoordinates(int32_t &column, int32_t &row) const;

    /**
     * Writes a GeoJSON "Polygon" feature for the tile's bounding box.
     * @param[out] buf Buffer to write to. kGeoJSONPolygonMaxLen is always enough.
     * @param[in] buf_len Length of buf, in characters.
     * @retval Number of characters written, 0 if buf was too small.
     */
    uint16_t ToGeoJSON(char *buf, uint16_t buf_len) const;

    int16_t GetLevel() const { return level_; }
    uint32_t GetTileNumber() const { return tile_number_; }

    bool operator==(const NDSTile &other) const {
        return level_ == other.level_ && tile_number_ == other.tile_number_;
    }
    bool operator!=(const NDSTile &other) const { return !(*this == other); }

   private:
    NDSTile(int16_t level, uint32_t tile_number);

    // Number of low Morton code bits that fall inside a tile of this level.
    uint16_t MortonShift() const { return kMortonBaseShift + (kMaxLevel - level_) * 2; }

    // Called once on construction. The center of a valid tile always lies inside the coordinate domain.
    NDSCoordinate ComputeCenter() const;

    int16_t level_;
    uint32_t tile_number_;
    NDSCoordinate center_;
};

#endif /* NDS_TILE_HH_ */
