#include "tile_report.hh"

#include <cstdio>

#include "geojson_utils.hh"
#include "settings.hh"

uint16_t WriteTileReport(char *buf, uint16_t buf_len, const NDSTile &tile, bool include_geojson) {
    int32_t column, row;
    tile.GetTileGridCoordinates(column, row);
    NDSCoordinate center = tile.GetCenter();

    int res = snprintf(buf, buf_len,
                       "Tile ID: %d, Level: %d, Tile Number: %u\r\n"
                       "Tile Grid Coordinates: (%d, %d)\r\n"
                       "Center in NDSCoordinates: %d, %d\r\n",
                       tile.PackedId(), tile.GetLevel(), tile.GetTileNumber(), column, row, center.GetLongitude(),
                       center.GetLatitude());
    if (res < 0 || res >= buf_len) {
        CONSOLE_ERROR("WriteTileReport", "Report for tile %d does not fit in %d characters.", tile.PackedId(),
                      buf_len);
        return 0;
    }
    uint16_t report_len = res;
    if (!include_geojson) {
        return report_len;
    }

    char center_geojson[kGeoJSONPointMaxLen];
    char bbox_geojson[kGeoJSONPolygonMaxLen];
    if (center.ToGeoJSON(center_geojson, sizeof(center_geojson)) == 0 ||
        tile.ToGeoJSON(bbox_geojson, sizeof(bbox_geojson)) == 0) {
        CONSOLE_ERROR("WriteTileReport", "Unable to write GeoJSON for tile %d.", tile.PackedId());
        return 0;
    }
    res = snprintf(buf + report_len, buf_len - report_len, "Center: %s\r\nBounding Box: %s\r\n", center_geojson,
                   bbox_geojson);
    if (res < 0 || res >= buf_len - report_len) {
        CONSOLE_ERROR("WriteTileReport", "Report for tile %d does not fit in %d characters.", tile.PackedId(),
                      buf_len);
        return 0;
    }
    return report_len + res;
}

bool PrintTileReport(const NDSTile &tile) {
    char report[kTileReportMaxLen];
    if (WriteTileReport(report, sizeof(report), tile, settings_manager.settings.print_geojson) == 0) {
        return false;
    }
    CONSOLE_PRINTF("%s\r\n", report);
    return true;
}
