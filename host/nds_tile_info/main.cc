#include <cerrno>
#include <cstdlib>
#include <cstring>

#include "comms.hh"
#include "macros.hh"
#include "nds_return_code.hh"
#include "nds_tile.hh"
#include "settings.hh"
#include "tile_report.hh"
#include "wgs84_coordinate.hh"

static const int64_t kDefaultPackedIds[] = {262154};  // Level 2, tile 10, just south of the equator.

static void PrintUsage(const char *program_name) {
    CONSOLE_PRINTF(
        "Usage: %s [--log_level LEVEL] [--no_geojson] [--at LEVEL LON LAT]... [PACKED_ID...]\r\n"
        "\t--log_level LEVEL   One of SILENT, ERRORS, WARNINGS, INFO, DEBUG.\r\n"
        "\t--no_geojson        Don't print GeoJSON features.\r\n"
        "\t--at LEVEL LON LAT  Describe the tile of LEVEL containing the WGS84 position LON, LAT (degrees).\r\n"
        "\tPACKED_ID           Packed NDS tile ID, decimal or 0x prefixed hex.\r\n",
        program_name);
}

static bool ParseInt64(const char *str, int64_t &value_out) {
    errno = 0;
    char *end = nullptr;
    long long value = strtoll(str, &end, 0);
    if (errno != 0 || end == str || *end != '\0') {
        return false;
    }
    value_out = value;
    return true;
}

static bool ParseDouble(const char *str, double &value_out) {
    errno = 0;
    char *end = nullptr;
    double value = strtod(str, &end);
    if (errno != 0 || end == str || *end != '\0') {
        return false;
    }
    value_out = value;
    return true;
}

static bool ReportPackedId(int64_t packed_id) {
    NDSTile tile;
    NDSReturnCode code = NDSTile::FromPackedId(packed_id, tile);
    if (code != kNDSOk) {
        CONSOLE_ERROR("main", "Unable to decode packed Tile ID %lld: %s.", static_cast<long long>(packed_id),
                      NDSReturnCodeToString(code));
        return false;
    }
    return PrintTileReport(tile);
}

static bool ReportPosition(const char *level_str, const char *longitude_str, const char *latitude_str) {
    int64_t level;
    double longitude_deg, latitude_deg;
    if (!ParseInt64(level_str, level) || level < 0 || level > NDSTile::kMaxLevel) {
        CONSOLE_ERROR("main", "Invalid tile level %s.", level_str);
        return false;
    }
    if (!ParseDouble(longitude_str, longitude_deg) || !ParseDouble(latitude_str, latitude_deg)) {
        CONSOLE_ERROR("main", "Invalid position %s, %s.", longitude_str, latitude_str);
        return false;
    }

    WGS84Coordinate position;
    NDSReturnCode code = WGS84Coordinate::FromDegrees(longitude_deg, latitude_deg, position);
    if (code != kNDSOk) {
        CONSOLE_ERROR("main", "Position %s, %s is not a valid WGS84 coordinate: %s.", longitude_str, latitude_str,
                      NDSReturnCodeToString(code));
        return false;
    }
    NDSTile tile;
    code = NDSTile::FromLevelAndCoordinate(static_cast<int16_t>(level), position, tile);
    if (code != kNDSOk) {
        CONSOLE_ERROR("main", "Unable to find tile for position %s, %s: %s.", longitude_str, latitude_str,
                      NDSReturnCodeToString(code));
        return false;
    }
    return PrintTileReport(tile);
}

int main(int argc, char *argv[]) {
    // Options are applied before any tile is decoded so that the log level covers all output.
    for (int i = 1; i < argc; i++) {
        if (strcmp(argv[i], "--help") == 0 || strcmp(argv[i], "-h") == 0) {
            PrintUsage(argv[0]);
            return EXIT_SUCCESS;
        } else if (strcmp(argv[i], "--log_level") == 0) {
            if (i + 1 >= argc ||
                !SettingsManager::LogLevelFromString(argv[i + 1], settings_manager.settings.log_level)) {
                CONSOLE_ERROR("main", "--log_level requires one of SILENT, ERRORS, WARNINGS, INFO, DEBUG.");
                PrintUsage(argv[0]);
                return EXIT_FAILURE;
            }
            i++;
        } else if (strcmp(argv[i], "--no_geojson") == 0) {
            settings_manager.settings.print_geojson = false;
        }
    }
    if (console_level_enabled(SettingsManager::LogLevel::kDebug)) {
        settings_manager.Print();
    }

    bool success = true;
    uint16_t num_tiles = 0;
    for (int i = 1; i < argc; i++) {
        if (strcmp(argv[i], "--log_level") == 0) {
            i++;  // Already applied.
        } else if (strcmp(argv[i], "--no_geojson") == 0) {
            continue;
        } else if (strcmp(argv[i], "--at") == 0) {
            if (i + 3 >= argc) {
                CONSOLE_ERROR("main", "--at requires LEVEL LON LAT.");
                PrintUsage(argv[0]);
                return EXIT_FAILURE;
            }
            success &= ReportPosition(argv[i + 1], argv[i + 2], argv[i + 3]);
            i += 3;
            num_tiles++;
        } else {
            int64_t packed_id;
            if (!ParseInt64(argv[i], packed_id)) {
                CONSOLE_ERROR("main", "Unrecognized argument %s.", argv[i]);
                success = false;
            } else {
                success &= ReportPackedId(packed_id);
            }
            num_tiles++;
        }
    }

    if (num_tiles == 0) {
        CONSOLE_PRINTF("No packed IDs specified, using default values.\r\n\r\n");
        for (uint16_t i = 0; i < ARRAY_LEN(kDefaultPackedIds); i++) {
            success &= ReportPackedId(kDefaultPackedIds[i]);
        }
    }

    return success ? EXIT_SUCCESS : EXIT_FAILURE;
}
