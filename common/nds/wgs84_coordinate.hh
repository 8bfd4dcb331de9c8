#pragma once

#include <cstdint>

#include "nds_return_code.hh"

class NDSCoordinate;

/**
 * A coordinate in WGS84 degrees, using the usual longitude [-180, 180] and latitude [-90, 90] ranges.
 */
class WGS84Coordinate {
   public:
    static constexpr double kMinLongitudeDeg = -180.0;
    static constexpr double kMaxLongitudeDeg = 180.0;
    static constexpr double kMinLatitudeDeg = -90.0;
    static constexpr double kMaxLatitudeDeg = 90.0;

    /**
     * Default constructor. Places the coordinate at (0, 0).
     */
    WGS84Coordinate() = default;

    /**
     * Creates a WGS84 coordinate.
     * @param[in] longitude_deg Longitude within [-180, 180].
     * @param[in] latitude_deg Latitude within [-90, 90].
     * @param[out] coordinate_out Created coordinate. Untouched on failure.
     * @retval kNDSOk on success, kNDSErrorRange if either value is out of range or NaN.
     */
    static NDSReturnCode FromDegrees(double longitude_deg, double latitude_deg, WGS84Coordinate &coordinate_out);

    static bool LongitudeInRange(double longitude_deg) {
        return longitude_deg >= kMinLongitudeDeg && longitude_deg <= kMaxLongitudeDeg;
    }
    static bool LatitudeInRange(double latitude_deg) {
        return latitude_deg >= kMinLatitudeDeg && latitude_deg <= kMaxLatitudeDeg;
    }

    double GetLongitude() const { return longitude_deg_; }
    double GetLatitude() const { return latitude_deg_; }

    /**
     * Writes a GeoJSON "Point" feature for this coordinate.
     * @param[out] buf Buffer to write to. kGeoJSONPointMaxLen is always enough.
     * @param[in] buf_len Length of buf, in characters.
     * @retval Number of characters written, 0 if buf was too small.
     */
    uint16_t ToGeoJSON(char *buf, uint16_t buf_len) const;

    bool operator==(const WGS84Coordinate &other) const {
        return longitude_deg_ == other.longitude_deg_ && latitude_deg_ == other.latitude_deg_;
    }

   private:
    friend class NDSCoordinate;  // Builds already validated coordinates in ToWGS84().

    WGS84Coordinate(double longitude_deg, double latitude_deg)
        : longitude_deg_(longitude_deg), latitude_deg_(latitude_deg) {}

    double longitude_deg_ = 0.0;
    double latitude_deg_ = 0.0;
};
