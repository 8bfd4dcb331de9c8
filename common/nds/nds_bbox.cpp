#include "nds_bbox.hh"

NDSReturnCode NDSBBox::SouthWest(NDSCoordinate &corner_out) const {
    return NDSCoordinate::FromUnits(west_, south_, corner_out);
}

NDSReturnCode NDSBBox::SouthEast(NDSCoordinate &corner_out) const {
    return NDSCoordinate::FromUnits(east_, south_, corner_out);
}

NDSReturnCode NDSBBox::NorthWest(NDSCoordinate &corner_out) const {
    return NDSCoordinate::FromUnits(west_, north_, corner_out);
}

NDSReturnCode NDSBBox::NorthEast(NDSCoordinate &corner_out) const {
    return NDSCoordinate::FromUnits(east_, north_, corner_out);
}

// Floor division, so boxes straddling zero round the same way on both sides.
static int64_t FloorHalf(int64_t value) { return value >= 0 ? value / 2 : -((-value + 1) / 2); }

NDSReturnCode NDSBBox::Center(NDSCoordinate &center_out) const {
    int64_t center_longitude = FloorHalf(static_cast<int64_t>(east_) + west_);
    int64_t center_latitude = FloorHalf(static_cast<int64_t>(north_) + south_);
    return NDSCoordinate::FromUnits(center_longitude, center_latitude, center_out);
}

WGS84BBox NDSBBox::ToWGS84() const {
    return WGS84BBox(NDSCoordinate::LatitudeToDegrees(north_), NDSCoordinate::LongitudeToDegrees(east_),
                     NDSCoordinate::LatitudeToDegrees(south_), NDSCoordinate::LongitudeToDegrees(west_));
}

uint16_t NDSBBox::ToGeoJSON(char *buf, uint16_t buf_len) const { return ToWGS84().ToGeoJSON(buf, buf_len); }
