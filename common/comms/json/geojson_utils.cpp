#include "geojson_utils.hh"

#include <cstdio>

#include "comms.hh"

// Coordinates are printed with a fixed number of decimals. 1e-10 degrees is well below one NDS unit (~8.4e-8 deg).
#define GEOJSON_COORD_FMT "%.10f"

static uint16_t CheckedLength(int chars_written, uint16_t buf_len, const char *tag) {
    if (chars_written < 0 || chars_written >= buf_len) {
        CONSOLE_ERROR("GeoJSON", "%s needs %d characters but buffer only holds %u.", tag, chars_written, buf_len);
        return 0;
    }
    return static_cast<uint16_t>(chars_written);
}

uint16_t WriteGeoJSONPoint(char *buf, uint16_t buf_len, double longitude_deg, double latitude_deg) {
    int chars_written = snprintf(buf, buf_len,
                                 "{\n"
                                 "  \"type\": \"Feature\",\n"
                                 "  \"properties\": {},\n"
                                 "  \"geometry\": {\n"
                                 "    \"type\": \"Point\",\n"
                                 "    \"coordinates\": [\n"
                                 "      " GEOJSON_COORD_FMT ", " GEOJSON_COORD_FMT "\n"
                                 "    ]\n"
                                 "  }\n"
                                 "}",
                                 longitude_deg, latitude_deg);
    return CheckedLength(chars_written, buf_len, "WriteGeoJSONPoint");
}

uint16_t WriteGeoJSONPolygon(char *buf, uint16_t buf_len, double north_deg, double east_deg, double south_deg,
                             double west_deg) {
    int chars_written = snprintf(buf, buf_len,
                                 "{\n"
                                 "  \"type\": \"Feature\",\n"
                                 "  \"properties\": {},\n"
                                 "  \"geometry\": {\n"
                                 "    \"type\": \"Polygon\",\n"
                                 "    \"coordinates\": [\n"
                                 "      [\n"
                                 "        [" GEOJSON_COORD_FMT ", " GEOJSON_COORD_FMT "],\n"
                                 "        [" GEOJSON_COORD_FMT ", " GEOJSON_COORD_FMT "],\n"
                                 "        [" GEOJSON_COORD_FMT ", " GEOJSON_COORD_FMT "],\n"
                                 "        [" GEOJSON_COORD_FMT ", " GEOJSON_COORD_FMT "],\n"
                                 "        [" GEOJSON_COORD_FMT ", " GEOJSON_COORD_FMT "]\n"
                                 "      ]\n"
                                 "    ]\n"
                                 "  }\n"
                                 "}",
                                 west_deg, south_deg, east_deg, south_deg, east_deg, north_deg, west_deg, north_deg,
                                 west_deg, south_deg);
    return CheckedLength(chars_written, buf_len, "WriteGeoJSONPolygon");
}
