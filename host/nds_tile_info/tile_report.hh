#ifndef TILE_REPORT_HH_
#define TILE_REPORT_HH_

#include <cstdint>

#include "comms.hh"
#include "nds_tile.hh"

// Reports are printed with a single console call followed by "\r\n", so they must fit in the console buffer with it.
static constexpr uint16_t kTileReportMaxLen = kPrintfBufferMaxSize - 2;

/**
 * Writes a human readable report of a tile: packed ID, level, tile number, grid coordinates, and the center in NDS
 * units. GeoJSON features for the center point and the bounding box are appended if requested.
 * @param[out] buf Buffer to write to.
 * @param[in] buf_len Length of buf, in characters.
 * @param[in] tile Tile to describe.
 * @param[in] include_geojson Append the center and bounding box GeoJSON features.
 * @retval Number of characters written, not including the null terminator. 0 if buf was too small.
 */
uint16_t WriteTileReport(char *buf, uint16_t buf_len, const NDSTile &tile, bool include_geojson);

/**
 * Prints the report of a tile to the console, honoring settings_manager.settings.print_geojson.
 * @retval True if the report was printed, false if it could not be formatted.
 */
bool PrintTileReport(const NDSTile &tile);

#endif /* TILE_REPORT_HH_ */
