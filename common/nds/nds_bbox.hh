#ifndef NDS_BBOX_HH_
#define NDS_BBOX_HH_

#include <cstdint>

#include "nds_coordinate.hh"
#include "nds_return_code.hh"
#include "wgs84_bbox.hh"

/**
 * A bounding box in NDS coordinate units. West may be greater than east, which happens for boxes that cross the
 * antimeridian, and is kept as-is.
 */
class NDSBBox {
   public:
    constexpr NDSBBox() = default;
    constexpr NDSBBox(int32_t north, int32_t east, int32_t south, int32_t west)
        : north_(north), east_(east), south_(south), west_(west) {}

    /**
     * Bounding box of the level 0 tile covering the eastern hemisphere, [0°, 180°] x [-90°, 90°].
     */
    static constexpr NDSBBox EastHemisphere() {
        return NDSBBox(NDSCoordinate::kMaxLatitude, NDSCoordinate::kMaxLongitude, NDSCoordinate::kMinLatitude, 0);
    }

    /**
     * Bounding box of the level 0 tile covering the western hemisphere, [-180°, 0°] x [-90°, 90°].
     */
    static constexpr NDSBBox WestHemisphere() {
        return NDSBBox(NDSCoordinate::kMaxLatitude, 0, NDSCoordinate::kMinLatitude, NDSCoordinate::kMinLongitude);
    }

    constexpr int32_t GetNorth() const { return north_; }
    constexpr int32_t GetEast() const { return east_; }
    constexpr int32_t GetSouth() const { return south_; }
    constexpr int32_t GetWest() const { return west_; }

    NDSReturnCode SouthWest(NDSCoordinate &corner_out) const;
    NDSReturnCode SouthEast(NDSCoordinate &corner_out) const;
    NDSReturnCode NorthWest(NDSCoordinate &corner_out) const;
    NDSReturnCode NorthEast(NDSCoordinate &corner_out) const;

    /**
     * Computes the center of the bounding box, rounding toward negative infinity on both axes.
     * @param[out] center_out Center coordinate. Untouched on failure.
     * @retval kNDSOk on success, kNDSErrorRange if the box holds values outside the coordinate domain.
     */
    NDSReturnCode Center(NDSCoordinate &center_out) const;

    /**
     * Converts this bounding box to WGS84 degrees using the north-east and south-west corners.
     */
    WGS84BBox ToWGS84() const;

    /**
     * Writes a GeoJSON "Polygon" feature for this bounding box.
     * @param[out] buf Buffer to write to. kGeoJSONPolygonMaxLen is always enough.
     * @param[in] buf_len Length of buf, in characters.
     * @retval Number of characters written, 0 if buf was too small.
     */
    uint16_t ToGeoJSON(char *buf, uint16_t buf_len) const;

    bool operator==(const NDSBBox &other) const {
        return north_ == other.north_ && east_ == other.east_ && south_ == other.south_ && west_ == other.west_;
    }

   private:
    int32_t north_ = 0;
    int32_t east_ = 0;
    int32_t south_ = 0;
    int32_t west_ = 0;
};

#endif /* NDS_BBOX_HH_ */
