#include <cstring>

#include "geojson_utils.hh"
#include "gtest/gtest.h"
#include "nds_bbox.hh"

static_assert(NDSBBox::EastHemisphere().GetWest() == 0, "East hemisphere starts at the prime meridian.");
static_assert(NDSBBox::WestHemisphere().GetEast() == 0, "West hemisphere ends at the prime meridian.");

TEST(NDSBBox, Hemispheres) {
    NDSBBox east = NDSBBox::EastHemisphere();
    EXPECT_EQ(east.GetNorth(), NDSCoordinate::kMaxLatitude);
    EXPECT_EQ(east.GetEast(), NDSCoordinate::kMaxLongitude);
    EXPECT_EQ(east.GetSouth(), NDSCoordinate::kMinLatitude);
    EXPECT_EQ(east.GetWest(), 0);

    NDSBBox west = NDSBBox::WestHemisphere();
    EXPECT_EQ(west.GetNorth(), NDSCoordinate::kMaxLatitude);
    EXPECT_EQ(west.GetEast(), 0);
    EXPECT_EQ(west.GetSouth(), NDSCoordinate::kMinLatitude);
    EXPECT_EQ(west.GetWest(), NDSCoordinate::kMinLongitude);
}

TEST(NDSBBox, Corners) {
    NDSBBox bbox = NDSBBox::EastHemisphere();
    NDSCoordinate corner;

    EXPECT_EQ(bbox.SouthWest(corner), kNDSOk);
    EXPECT_EQ(corner.GetLongitude(), 0);
    EXPECT_EQ(corner.GetLatitude(), NDSCoordinate::kMinLatitude);

    EXPECT_EQ(bbox.SouthEast(corner), kNDSOk);
    EXPECT_EQ(corner.GetLongitude(), NDSCoordinate::kMaxLongitude);
    EXPECT_EQ(corner.GetLatitude(), NDSCoordinate::kMinLatitude);

    EXPECT_EQ(bbox.NorthWest(corner), kNDSOk);
    EXPECT_EQ(corner.GetLongitude(), 0);
    EXPECT_EQ(corner.GetLatitude(), NDSCoordinate::kMaxLatitude);

    EXPECT_EQ(bbox.NorthEast(corner), kNDSOk);
    EXPECT_EQ(corner.GetLongitude(), NDSCoordinate::kMaxLongitude);
    EXPECT_EQ(corner.GetLatitude(), NDSCoordinate::kMaxLatitude);
}

TEST(NDSBBox, CornerOutsideDomainFails) {
    // Latitudes below the minimum can be stored in a box but can't become a coordinate.
    NDSBBox bbox(0, 10, NDSCoordinate::kMinLatitude - 1, 0);
    NDSCoordinate corner;
    EXPECT_EQ(bbox.SouthWest(corner), kNDSErrorRange);
    EXPECT_EQ(bbox.NorthEast(corner), kNDSOk);
}

TEST(NDSBBox, CenterRoundsDown) {
    NDSCoordinate center;
    EXPECT_EQ(NDSBBox::EastHemisphere().Center(center), kNDSOk);
    EXPECT_EQ(center.GetLongitude(), 1073741823);
    EXPECT_EQ(center.GetLatitude(), -1);

    EXPECT_EQ(NDSBBox::WestHemisphere().Center(center), kNDSOk);
    EXPECT_EQ(center.GetLongitude(), -1073741824);
    EXPECT_EQ(center.GetLatitude(), -1);

    EXPECT_EQ(NDSBBox(10, -5, -10, -6).Center(center), kNDSOk);
    EXPECT_EQ(center.GetLongitude(), -6);
    EXPECT_EQ(center.GetLatitude(), 0);
}

TEST(NDSBBox, AntimeridianCrossingIsPreserved) {
    NDSBBox bbox(10, -100, -10, 100);
    EXPECT_EQ(bbox.GetWest(), 100);
    EXPECT_EQ(bbox.GetEast(), -100);
    WGS84BBox wgs84 = bbox.ToWGS84();
    EXPECT_GT(wgs84.GetWest(), wgs84.GetEast());
}

TEST(NDSBBox, ToWGS84) {
    WGS84BBox wgs84 = NDSBBox::EastHemisphere().ToWGS84();
    EXPECT_DOUBLE_EQ(wgs84.GetNorth(), 90.0);
    EXPECT_DOUBLE_EQ(wgs84.GetEast(), 180.0);
    EXPECT_DOUBLE_EQ(wgs84.GetSouth(), -90.0);
    EXPECT_DOUBLE_EQ(wgs84.GetWest(), 0.0);

    wgs84 = NDSBBox::WestHemisphere().ToWGS84();
    EXPECT_DOUBLE_EQ(wgs84.GetEast(), 0.0);
    EXPECT_DOUBLE_EQ(wgs84.GetWest(), -180.0);
}

TEST(NDSBBox, ToGeoJSON) {
    char buf[kGeoJSONPolygonMaxLen];
    EXPECT_GT(NDSBBox::WestHemisphere().ToGeoJSON(buf, sizeof(buf)), 0);
    EXPECT_NE(strstr(buf, "\"type\": \"Polygon\""), nullptr);
    EXPECT_NE(strstr(buf, "[-180.0000000000, -90.0000000000]"), nullptr);
    EXPECT_NE(strstr(buf, "[0.0000000000, 90.0000000000]"), nullptr);
}

TEST(NDSBBox, Equality) {
    EXPECT_EQ(NDSBBox::EastHemisphere(), NDSBBox(NDSCoordinate::kMaxLatitude, NDSCoordinate::kMaxLongitude,
                                                 NDSCoordinate::kMinLatitude, 0));
    EXPECT_FALSE(NDSBBox::EastHemisphere() == NDSBBox::WestHemisphere());
}
