#include "nds_coordinate.hh"

#include "bit_utils.hh"
#include "comms.hh"
#include "geojson_utils.hh"
#include "macros.hh"
#include "morton_codec.hh"

NDSReturnCode NDSCoordinate::FromUnits(int64_t longitude, int64_t latitude, NDSCoordinate &coordinate_out) {
    int32_t longitude_32 = MIN(ToSigned32(longitude), kMaxLongitude);
    int32_t latitude_32 = MIN(ToSigned32(latitude), kMaxLatitude);

    // Longitude covers the whole int32_t range, so only latitude can still be out of bounds here.
    if (latitude_32 < kMinLatitude || latitude_32 > kMaxLatitude) {
        CONSOLE_ERROR("NDSCoordinate::FromUnits", "Latitude value %d exceeds allowed range [%d, %d].", latitude_32,
                      kMinLatitude, kMaxLatitude);
        return kNDSErrorRange;
    }
    coordinate_out = NDSCoordinate(longitude_32, latitude_32);
    return kNDSOk;
}

NDSReturnCode NDSCoordinate::FromDegrees(double longitude_deg, double latitude_deg, NDSCoordinate &coordinate_out) {
    if (!WGS84Coordinate::LongitudeInRange(longitude_deg)) {
        CONSOLE_ERROR("NDSCoordinate::FromDegrees", "The longitude value %f exceeds the valid range of [-180, 180].",
                      longitude_deg);
        return kNDSErrorRange;
    }
    if (!WGS84Coordinate::LatitudeInRange(latitude_deg)) {
        CONSOLE_ERROR("NDSCoordinate::FromDegrees", "The latitude value %f exceeds the valid range of [-90, 90].",
                      latitude_deg);
        return kNDSErrorRange;
    }
    // Casting truncates toward zero.
    int64_t longitude = static_cast<int64_t>(longitude_deg / 360.0 * kLongitudeRange);
    int64_t latitude = static_cast<int64_t>(latitude_deg / 180.0 * kLatitudeRange);
    return FromUnits(longitude, latitude, coordinate_out);
}

NDSReturnCode NDSCoordinate::FromWGS84(const WGS84Coordinate &wgs84, NDSCoordinate &coordinate_out) {
    return FromDegrees(wgs84.GetLongitude(), wgs84.GetLatitude(), coordinate_out);
}

NDSReturnCode NDSCoordinate::FromMorton(uint64_t morton_code, NDSCoordinate &coordinate_out) {
    int32_t longitude, latitude;
    MortonCodec::Decode(morton_code, longitude, latitude);
    PrintBinary(static_cast<uint32_t>(latitude), "lat binary");
    PrintBinary(static_cast<uint32_t>(longitude), "lon binary");
    CONSOLE_DEBUG("NDSCoordinate::FromMorton", "lat: %d, lon: %d", latitude, longitude);
    return FromUnits(longitude, latitude, coordinate_out);
}

NDSReturnCode NDSCoordinate::Add(int64_t delta_longitude, int64_t delta_latitude,
                                 NDSCoordinate &coordinate_out) const {
    // Unsigned sums wrap instead of overflowing. FromUnits() only keeps the low 32 bits.
    int64_t longitude =
        static_cast<int64_t>(static_cast<uint64_t>(longitude_) + static_cast<uint64_t>(delta_longitude));
    int64_t latitude = static_cast<int64_t>(static_cast<uint64_t>(latitude_) + static_cast<uint64_t>(delta_latitude));
    return FromUnits(longitude, latitude, coordinate_out);
}

uint64_t NDSCoordinate::GetMortonCode() const { return MortonCodec::Encode(longitude_, latitude_); }

double NDSCoordinate::LongitudeToDegrees(int32_t longitude) {
    return longitude >= 0 ? static_cast<double>(longitude) / kMaxLongitude * 180.0
                          : static_cast<double>(longitude) / kMinLongitude * -180.0;
}

double NDSCoordinate::LatitudeToDegrees(int32_t latitude) {
    return latitude >= 0 ? static_cast<double>(latitude) / kMaxLatitude * 90.0
                         : static_cast<double>(latitude) / kMinLatitude * -90.0;
}

WGS84Coordinate NDSCoordinate::ToWGS84() const {
    return WGS84Coordinate(LongitudeToDegrees(longitude_), LatitudeToDegrees(latitude_));
}

uint16_t NDSCoordinate::ToGeoJSON(char *buf, uint16_t buf_len) const {
    WGS84Coordinate wgs84 = ToWGS84();
    return WriteGeoJSONPoint(buf, buf_len, wgs84.GetLongitude(), wgs84.GetLatitude());
}
