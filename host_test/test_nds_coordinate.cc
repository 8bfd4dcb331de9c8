#include <cmath>
#include <cstring>

#include "geojson_utils.hh"
#include "gtest/gtest.h"
#include "morton_codec.hh"
#include "nds_coordinate.hh"
#include "wgs84_coordinate.hh"

TEST(NDSCoordinate, DefaultIsOrigin) {
    NDSCoordinate coordinate;
    EXPECT_EQ(coordinate.GetLongitude(), 0);
    EXPECT_EQ(coordinate.GetLatitude(), 0);
    EXPECT_EQ(coordinate.GetMortonCode(), 0u);
}

TEST(NDSCoordinate, FromUnits) {
    NDSCoordinate coordinate;
    EXPECT_EQ(NDSCoordinate::FromUnits(123, -456, coordinate), kNDSOk);
    EXPECT_EQ(coordinate.GetLongitude(), 123);
    EXPECT_EQ(coordinate.GetLatitude(), -456);

    EXPECT_EQ(NDSCoordinate::FromUnits(NDSCoordinate::kMinLongitude, NDSCoordinate::kMinLatitude, coordinate),
              kNDSOk);
    EXPECT_EQ(coordinate.GetLongitude(), NDSCoordinate::kMinLongitude);
    EXPECT_EQ(coordinate.GetLatitude(), NDSCoordinate::kMinLatitude);

    EXPECT_EQ(NDSCoordinate::FromUnits(NDSCoordinate::kMaxLongitude, NDSCoordinate::kMaxLatitude, coordinate),
              kNDSOk);
    EXPECT_EQ(coordinate.GetLongitude(), NDSCoordinate::kMaxLongitude);
    EXPECT_EQ(coordinate.GetLatitude(), NDSCoordinate::kMaxLatitude);
}

TEST(NDSCoordinate, FromUnitsWrapsAndClamps) {
    NDSCoordinate coordinate;
    // Inputs are reduced to 32 bits first, so one past the maximum longitude wraps around to the minimum.
    EXPECT_EQ(NDSCoordinate::FromUnits(static_cast<int64_t>(NDSCoordinate::kMaxLongitude) + 1, 0, coordinate), kNDSOk);
    EXPECT_EQ(coordinate.GetLongitude(), NDSCoordinate::kMinLongitude);

    // Latitudes above the maximum that still fit in 32 bits are clamped.
    EXPECT_EQ(NDSCoordinate::FromUnits(0, static_cast<int64_t>(NDSCoordinate::kMaxLatitude) + 1, coordinate), kNDSOk);
    EXPECT_EQ(coordinate.GetLatitude(), NDSCoordinate::kMaxLatitude);
    EXPECT_EQ(NDSCoordinate::FromUnits(0, INT32_MAX, coordinate), kNDSOk);
    EXPECT_EQ(coordinate.GetLatitude(), NDSCoordinate::kMaxLatitude);
}

TEST(NDSCoordinate, FromUnitsRejectsLatitudeBelowMinimum) {
    NDSCoordinate coordinate;
    ASSERT_EQ(NDSCoordinate::FromUnits(7, 8, coordinate), kNDSOk);
    EXPECT_EQ(NDSCoordinate::FromUnits(0, static_cast<int64_t>(NDSCoordinate::kMinLatitude) - 1, coordinate),
              kNDSErrorRange);
    EXPECT_EQ(NDSCoordinate::FromUnits(0, INT32_MIN, coordinate), kNDSErrorRange);
    // Output is untouched on failure.
    EXPECT_EQ(coordinate.GetLongitude(), 7);
    EXPECT_EQ(coordinate.GetLatitude(), 8);
}

TEST(NDSCoordinate, FromDegrees) {
    NDSCoordinate coordinate;
    EXPECT_EQ(NDSCoordinate::FromDegrees(90.0, 45.0, coordinate), kNDSOk);
    EXPECT_EQ(coordinate.GetLongitude(), 1073741823);
    EXPECT_EQ(coordinate.GetLatitude(), 536870911);

    EXPECT_EQ(NDSCoordinate::FromDegrees(-90.0, 45.0, coordinate), kNDSOk);
    EXPECT_EQ(coordinate.GetLongitude(), -1073741823);
    EXPECT_EQ(coordinate.GetLatitude(), 536870911);

    // Conversion truncates toward zero.
    EXPECT_EQ(NDSCoordinate::FromDegrees(-180.0, -90.0, coordinate), kNDSOk);
    EXPECT_EQ(coordinate.GetLongitude(), -2147483647);
    EXPECT_EQ(coordinate.GetLatitude(), -1073741823);

    EXPECT_EQ(NDSCoordinate::FromDegrees(180.0, 90.0, coordinate), kNDSOk);
    EXPECT_EQ(coordinate.GetLongitude(), 2147483647);
    EXPECT_EQ(coordinate.GetLatitude(), 1073741823);
}

TEST(NDSCoordinate, FromDegreesRejectsOutOfRange) {
    NDSCoordinate coordinate;
    EXPECT_EQ(NDSCoordinate::FromDegrees(181.0, 0.0, coordinate), kNDSErrorRange);
    EXPECT_EQ(NDSCoordinate::FromDegrees(-180.5, 0.0, coordinate), kNDSErrorRange);
    EXPECT_EQ(NDSCoordinate::FromDegrees(0.0, 91.0, coordinate), kNDSErrorRange);
    EXPECT_EQ(NDSCoordinate::FromDegrees(0.0, -90.001, coordinate), kNDSErrorRange);
    EXPECT_EQ(NDSCoordinate::FromDegrees(NAN, 0.0, coordinate), kNDSErrorRange);
    EXPECT_EQ(NDSCoordinate::FromDegrees(0.0, NAN, coordinate), kNDSErrorRange);
    EXPECT_EQ(coordinate, NDSCoordinate());
}

TEST(NDSCoordinate, FromWGS84) {
    WGS84Coordinate wgs84;
    ASSERT_EQ(WGS84Coordinate::FromDegrees(90.0, 45.0, wgs84), kNDSOk);
    NDSCoordinate from_wgs84, from_degrees;
    EXPECT_EQ(NDSCoordinate::FromWGS84(wgs84, from_wgs84), kNDSOk);
    EXPECT_EQ(NDSCoordinate::FromDegrees(90.0, 45.0, from_degrees), kNDSOk);
    EXPECT_EQ(from_wgs84, from_degrees);
}

TEST(NDSCoordinate, FromMorton) {
    NDSCoordinate coordinate;
    EXPECT_EQ(NDSCoordinate::FromMorton(0x6000000000000000u, coordinate), kNDSOk);
    EXPECT_EQ(coordinate.GetLongitude(), NDSCoordinate::kMinLongitude);
    EXPECT_EQ(coordinate.GetLatitude(), NDSCoordinate::kMinLatitude);

    EXPECT_EQ(NDSCoordinate::FromMorton(0x5555555555555555u, coordinate), kNDSOk);
    EXPECT_EQ(coordinate.GetLongitude(), -1);
    EXPECT_EQ(coordinate.GetLatitude(), 0);

    NDSCoordinate original, decoded;
    ASSERT_EQ(NDSCoordinate::FromDegrees(-33.8688, 151.2093 / 2, original), kNDSOk);
    EXPECT_EQ(original.GetMortonCode(), MortonCodec::Encode(original.GetLongitude(), original.GetLatitude()));
    EXPECT_EQ(NDSCoordinate::FromMorton(original.GetMortonCode(), decoded), kNDSOk);
    EXPECT_EQ(decoded, original);
}

TEST(NDSCoordinate, Add) {
    NDSCoordinate start, result;
    ASSERT_EQ(NDSCoordinate::FromUnits(100, -100, start), kNDSOk);
    EXPECT_EQ(start.Add(-50, 250, result), kNDSOk);
    EXPECT_EQ(result.GetLongitude(), 50);
    EXPECT_EQ(result.GetLatitude(), 150);
    // The original is unchanged.
    EXPECT_EQ(start.GetLongitude(), 100);
    EXPECT_EQ(start.GetLatitude(), -100);

    // Deltas of any size wrap like 32-bit arithmetic.
    EXPECT_EQ(start.Add(INT64_MAX, 0, result), kNDSOk);
    EXPECT_EQ(result.GetLongitude(), 99);
    EXPECT_EQ(result.GetLatitude(), -100);
    EXPECT_EQ(start.Add(INT64_MIN, INT64_MIN, result), kNDSOk);
    EXPECT_EQ(result.GetLongitude(), 100);
    EXPECT_EQ(result.GetLatitude(), -100);
    EXPECT_EQ(start.Add(INT64_MIN + 1, 0, result), kNDSOk);
    EXPECT_EQ(result.GetLongitude(), 101);

    // Longitude wraps around the antimeridian.
    ASSERT_EQ(NDSCoordinate::FromUnits(NDSCoordinate::kMinLongitude, 0, start), kNDSOk);
    EXPECT_EQ(start.Add(-1, 0, result), kNDSOk);
    EXPECT_EQ(result.GetLongitude(), NDSCoordinate::kMaxLongitude);

    // Latitude clamps at the north pole and fails past the south pole.
    EXPECT_EQ(start.Add(0, NDSCoordinate::kMaxLatitude + INT64_C(10), result), kNDSOk);
    EXPECT_EQ(result.GetLatitude(), NDSCoordinate::kMaxLatitude);
    EXPECT_EQ(start.Add(0, NDSCoordinate::kMinLatitude - INT64_C(1), result), kNDSErrorRange);
}

TEST(NDSCoordinate, ToWGS84) {
    NDSCoordinate coordinate;
    ASSERT_EQ(NDSCoordinate::FromUnits(NDSCoordinate::kMaxLongitude, NDSCoordinate::kMaxLatitude, coordinate), kNDSOk);
    WGS84Coordinate wgs84 = coordinate.ToWGS84();
    EXPECT_DOUBLE_EQ(wgs84.GetLongitude(), 180.0);
    EXPECT_DOUBLE_EQ(wgs84.GetLatitude(), 90.0);

    ASSERT_EQ(NDSCoordinate::FromUnits(NDSCoordinate::kMinLongitude, NDSCoordinate::kMinLatitude, coordinate), kNDSOk);
    wgs84 = coordinate.ToWGS84();
    EXPECT_DOUBLE_EQ(wgs84.GetLongitude(), -180.0);
    EXPECT_DOUBLE_EQ(wgs84.GetLatitude(), -90.0);

    wgs84 = NDSCoordinate().ToWGS84();
    EXPECT_DOUBLE_EQ(wgs84.GetLongitude(), 0.0);
    EXPECT_DOUBLE_EQ(wgs84.GetLatitude(), 0.0);

    // One unit is 360 / 2^32 degrees.
    ASSERT_EQ(NDSCoordinate::FromDegrees(12.5, -45.25, coordinate), kNDSOk);
    wgs84 = coordinate.ToWGS84();
    EXPECT_NEAR(wgs84.GetLongitude(), 12.5, 2e-7);
    EXPECT_NEAR(wgs84.GetLatitude(), -45.25, 2e-7);
}

TEST(NDSCoordinate, ToGeoJSON) {
    NDSCoordinate coordinate;
    ASSERT_EQ(NDSCoordinate::FromUnits(NDSCoordinate::kMaxLongitude, 0, coordinate), kNDSOk);
    char buf[kGeoJSONPointMaxLen];
    EXPECT_GT(coordinate.ToGeoJSON(buf, sizeof(buf)), 0);
    EXPECT_NE(strstr(buf, "\"type\": \"Point\""), nullptr);
    EXPECT_NE(strstr(buf, "180.0000000000, 0.0000000000"), nullptr);
}

TEST(NDSCoordinate, Equality) {
    NDSCoordinate a, b;
    ASSERT_EQ(NDSCoordinate::FromUnits(1, 2, a), kNDSOk);
    ASSERT_EQ(NDSCoordinate::FromUnits(1, 2, b), kNDSOk);
    EXPECT_EQ(a, b);
    ASSERT_EQ(NDSCoordinate::FromUnits(2, 1, b), kNDSOk);
    EXPECT_NE(a, b);
}
