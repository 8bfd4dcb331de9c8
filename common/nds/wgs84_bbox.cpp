#include "wgs84_bbox.hh"

#include "geojson_utils.hh"

uint16_t WGS84BBox::ToGeoJSON(char *buf, uint16_t buf_len) const {
    return WriteGeoJSONPolygon(buf, buf_len, north_deg_, east_deg_, south_deg_, west_deg_);
}
