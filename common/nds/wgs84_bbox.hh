#pragma once

#include <cstdint>

/**
 * A bounding box in WGS84 degrees. West may be greater than east for boxes that cross the antimeridian.
 */
class WGS84BBox {
   public:
    WGS84BBox() = default;
    WGS84BBox(double north_deg, double east_deg, double south_deg, double west_deg)
        : north_deg_(north_deg), east_deg_(east_deg), south_deg_(south_deg), west_deg_(west_deg) {}

    double GetNorth() const { return north_deg_; }
    double GetEast() const { return east_deg_; }
    double GetSouth() const { return south_deg_; }
    double GetWest() const { return west_deg_; }

    /**
     * Writes a GeoJSON "Polygon" feature for this bounding box.
     * @param[out] buf Buffer to write to. kGeoJSONPolygonMaxLen is always enough.
     * @param[in] buf_len Length of buf, in characters.
     * @retval Number of characters written, 0 if buf was too small.
     */
    uint16_t ToGeoJSON(char *buf, uint16_t buf_len) const;

   private:
    double north_deg_ = 0.0;
    double east_deg_ = 0.0;
    double south_deg_ = 0.0;
    double west_deg_ = 0.0;
};
