#include "wgs84_coordinate.hh"

#include "comms.hh"
#include "geojson_utils.hh"

NDSReturnCode WGS84Coordinate::FromDegrees(double longitude_deg, double latitude_deg,
                                           WGS84Coordinate &coordinate_out) {
    // Comparisons are false for NaN, so NaN fails both checks.
    if (!LongitudeInRange(longitude_deg)) {
        CONSOLE_ERROR("WGS84Coordinate::FromDegrees", "The longitude value %f exceeds the valid range of [-180, 180].",
                      longitude_deg);
        return kNDSErrorRange;
    }
    if (!LatitudeInRange(latitude_deg)) {
        CONSOLE_ERROR("WGS84Coordinate::FromDegrees", "The latitude value %f exceeds the valid range of [-90, 90].",
                      latitude_deg);
        return kNDSErrorRange;
    }
    coordinate_out = WGS84Coordinate(longitude_deg, latitude_deg);
    return kNDSOk;
}

uint16_t WGS84Coordinate::ToGeoJSON(char *buf, uint16_t buf_len) const {
    return WriteGeoJSONPoint(buf, buf_len, longitude_deg_, latitude_deg_);
}
