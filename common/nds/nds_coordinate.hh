#ifndef NDS_COORDINATE_HH_
#define NDS_COORDINATE_HH_

#include <cstdint>

#include "nds_return_code.hh"
#include "wgs84_coordinate.hh"

/**
 * A coordinate in NDS fixed-point units, according to the NDS Format Specification, Version 2.5.4, §7.2.1.
 *
 * The NDS coordinate encoding divides the 360° range into 2^32 steps, so one unit is 360/2^32 = 90/2^30 degrees along
 * both axes. Longitude uses the full signed 32-bit range. Latitude only covers 180°, so it uses half of that range
 * in favor of equally sized units along longitude and latitude.
 *
 * Instances are immutable and always hold values within the valid domain.
 */
class NDSCoordinate {
   public:
    static constexpr int32_t kMaxLongitude = INT32_MAX;
    static constexpr int32_t kMinLongitude = INT32_MIN;
    static constexpr int32_t kMaxLatitude = kMaxLongitude / 2;  // 2^30 - 1
    static constexpr int32_t kMinLatitude = kMinLongitude / 2;  // -2^30

    static constexpr int64_t kLongitudeRange = static_cast<int64_t>(kMaxLongitude) - kMinLongitude;  // 2^32 - 1
    static constexpr int64_t kLatitudeRange = static_cast<int64_t>(kMaxLatitude) - kMinLatitude;     // 2^31 - 1

    /**
     * Default constructor. Places the coordinate at (0, 0).
     */
    NDSCoordinate() = default;

    /**
     * Creates a coordinate from NDS units. Both values are first wrapped to 32-bit two's complement, values above the
     * axis maximum are clamped to the maximum, and the result is checked against the axis domain.
     * @param[in] longitude Longitude in NDS units.
     * @param[in] latitude Latitude in NDS units.
     * @param[out] coordinate_out Created coordinate. Untouched on failure.
     * @retval kNDSOk on success, kNDSErrorRange if a value is below its axis minimum after wrapping.
     */
    static NDSReturnCode FromUnits(int64_t longitude, int64_t latitude, NDSCoordinate &coordinate_out);

    /**
     * Creates a coordinate from WGS84 degrees. Values are scaled by the axis ranges and truncated toward zero.
     * @param[in] longitude_deg Longitude within [-180, 180].
     * @param[in] latitude_deg Latitude within [-90, 90].
     * @param[out] coordinate_out Created coordinate. Untouched on failure.
     * @retval kNDSOk on success, kNDSErrorRange if either value is out of range or NaN.
     */
    static NDSReturnCode FromDegrees(double longitude_deg, double latitude_deg, NDSCoordinate &coordinate_out);

    /**
     * Creates a coordinate from a WGS84Coordinate, which is always in range.
     */
    static NDSReturnCode FromWGS84(const WGS84Coordinate &wgs84, NDSCoordinate &coordinate_out);

    /**
     * Creates a coordinate from its Morton code. See MortonCodec::Decode() for the bit layout.
     * @param[in] morton_code Morton code to decode.
     * @param[out] coordinate_out Created coordinate. Untouched on failure.
     * @retval kNDSOk on success.
     */
    static NDSReturnCode FromMorton(uint64_t morton_code, NDSCoordinate &coordinate_out);

    /**
     * Offsets this coordinate, e.g. when decoding coordinates stored relative to a tile. Applies the same wrapping,
     * clamping and validation as FromUnits().
     * @param[in] delta_longitude Longitude offset in NDS units.
     * @param[in] delta_latitude Latitude offset in NDS units.
     * @param[out] coordinate_out Offset coordinate. Untouched on failure.
     * @retval kNDSOk on success, kNDSErrorRange if the result is out of range.
     */
    NDSReturnCode Add(int64_t delta_longitude, int64_t delta_latitude, NDSCoordinate &coordinate_out) const;

    /**
     * Returns the unique Morton code for this coordinate.
     */
    uint64_t GetMortonCode() const;

    /**
     * Converts this coordinate to WGS84 degrees. Positive and negative values are scaled separately by the axis
     * maximum and minimum, since the integer domain is not symmetric around zero.
     */
    WGS84Coordinate ToWGS84() const;

    static double LongitudeToDegrees(int32_t longitude);
    static double LatitudeToDegrees(int32_t latitude);

    /**
     * Writes a GeoJSON "Point" feature for this coordinate.
     * @param[out] buf Buffer to write to. kGeoJSONPointMaxLen is always enough.
     * @param[in] buf_len Length of buf, in characters.
     * @retval Number of characters written, 0 if buf was too small.
     */
    uint16_t ToGeoJSON(char *buf, uint16_t buf_len) const;

    int32_t GetLongitude() const { return longitude_; }
    int32_t GetLatitude() const { return latitude_; }

    bool operator==(const NDSCoordinate &other) const {
        return longitude_ == other.longitude_ && latitude_ == other.latitude_;
    }
    bool operator!=(const NDSCoordinate &other) const { return !(*this == other); }

   private:
    friend class NDSTile;  // Builds tile centers, which are in range by construction.

    NDSCoordinate(int32_t longitude, int32_t latitude) : longitude_(longitude), latitude_(latitude) {}

    int32_t longitude_ = 0;
    int32_t latitude_ = 0;
};

#endif /* NDS_COORDINATE_HH_ */
