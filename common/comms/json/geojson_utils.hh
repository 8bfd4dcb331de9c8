#ifndef GEOJSON_UTILS_HH_
#define GEOJSON_UTILS_HH_

#include <cstdint>

static constexpr uint16_t kGeoJSONPointMaxLen = 200;
static constexpr uint16_t kGeoJSONPolygonMaxLen = 512;

/**
 * Writes a GeoJSON "Point" feature with empty properties.
 * @param[out] buf Buffer to write to.
 * @param[in] buf_len Length of buf, in characters.
 * @param[in] longitude_deg Longitude of the point, in degrees.
 * @param[in] latitude_deg Latitude of the point, in degrees.
 * @retval Number of characters written, not including the null terminator. 0 if buf was too small.
 */
uint16_t WriteGeoJSONPoint(char *buf, uint16_t buf_len, double longitude_deg, double latitude_deg);

/**
 * Writes a GeoJSON "Polygon" feature with empty properties describing a bounding box. The ring starts and ends at the
 * south-west corner and runs counter-clockwise (SW, SE, NE, NW, SW).
 * @param[out] buf Buffer to write to.
 * @param[in] buf_len Length of buf, in characters.
 * @param[in] north_deg Northern boundary (latitude), in degrees.
 * @param[in] east_deg Eastern boundary (longitude), in degrees.
 * @param[in] south_deg Southern boundary (latitude), in degrees.
 * @param[in] west_deg Western boundary (longitude), in degrees.
 * @retval Number of characters written, not including the null terminator. 0 if buf was too small.
 */
uint16_t WriteGeoJSONPolygon(char *buf, uint16_t buf_len, double north_deg, double east_deg, double south_deg,
                             double west_deg);

#endif /* GEOJSON_UTILS_HH_ */
