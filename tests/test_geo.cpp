#include <gtest/gtest.h>
#include "../core/Geo.hpp"
#include "../core/IClock.hpp"
#include <limits>
#include <stdexcept>

using namespace rtsae;

TEST(GeoTest, OneDegreeOfLongitudeAtEquator) {
    EXPECT_NEAR(Geo::distanceMeters(0.0, 0.0, 0.0, 1.0), 111195.0, 10.0);
}

TEST(GeoTest, DistanceIsSymmetric) {
    GeoPoint a{12.9716, 77.5946};
    GeoPoint b{12.980, 77.600};
    EXPECT_DOUBLE_EQ(Geo::distanceMeters(a, b), Geo::distanceMeters(b, a));
    EXPECT_DOUBLE_EQ(Geo::distanceMeters(a, a), 0.0);
}

TEST(GeoTest, DestinationRoundTripsDistance) {
    GeoPoint origin{18.5204, 73.8567};
    GeoPoint target = Geo::destination(origin, 90.0, 250.0);
    EXPECT_NEAR(Geo::distanceMeters(origin, target), 250.0, 0.5);
    // Due east: latitude holds, longitude grows.
    EXPECT_NEAR(target.lat, origin.lat, 1e-4);
    EXPECT_GT(target.lon, origin.lon);
}

TEST(GeoTest, CoordinateRanges) {
    EXPECT_TRUE(Geo::isValidCoordinate(90.0, -180.0));
    EXPECT_FALSE(Geo::isValidCoordinate(90.1, 0.0));
    EXPECT_FALSE(Geo::isValidCoordinate(0.0, 180.5));
    EXPECT_FALSE(Geo::isValidCoordinate(std::numeric_limits<double>::quiet_NaN(), 0.0));
}

TEST(GeoTest, CircleBoundaryCountsAsInside) {
    GeoPoint center{0.0, 0.0};
    GeoPoint edge = Geo::destination(center, 0.0, 100.0);
    double distance = Geo::distanceMeters(center, edge);

    EXPECT_TRUE(Geo::contains(Circle{center, distance}, edge));
    EXPECT_FALSE(Geo::contains(Circle{center, distance - 1.0}, edge));
}

TEST(GeoTest, PolygonContainment) {
    Polygon square{{{0.0, 0.0}, {0.0, 0.01}, {0.01, 0.01}, {0.01, 0.0}}};
    EXPECT_TRUE(Geo::contains(square, GeoPoint{0.005, 0.005}));
    EXPECT_FALSE(Geo::contains(square, GeoPoint{0.02, 0.005}));
}

TEST(GeoTest, DegenerateShapesThrow) {
    Polygon line{{{0.0, 0.0}, {0.0, 0.01}}};
    EXPECT_THROW(Geo::contains(line, GeoPoint{0.0, 0.0}), std::invalid_argument);
    EXPECT_THROW(Geo::contains(Circle{{0.0, 0.0}, 0.0}, GeoPoint{0.0, 0.0}), std::invalid_argument);
}

TEST(GeoTest, BoundingCircleCoversPolygon) {
    Polygon square{{{0.0, 0.0}, {0.0, 0.01}, {0.01, 0.01}, {0.01, 0.0}}};
    Circle bounds = Geo::boundingCircle(square);
    for (const auto& vertex : square.ring) {
        EXPECT_LE(Geo::distanceMeters(bounds.center, vertex), bounds.radiusM + 1e-6);
    }
}

TEST(ClockTest, Iso8601RoundTrip) {
    auto ts = IClock::fromEpochMillis(1714558530250);
    EXPECT_EQ(IClock::formatIso8601(ts), "2024-05-01T10:15:30.250Z");

    auto parsed = IClock::parseIso8601("2024-05-01T10:15:30.250Z");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, ts);
}

TEST(ClockTest, Iso8601Offsets) {
    auto utc = IClock::parseIso8601("2024-05-01T10:15:30Z");
    auto offset = IClock::parseIso8601("2024-05-01T15:45:30+05:30");
    ASSERT_TRUE(utc.has_value());
    ASSERT_TRUE(offset.has_value());
    EXPECT_EQ(*utc, *offset);

    EXPECT_FALSE(IClock::parseIso8601("yesterday").has_value());
    EXPECT_FALSE(IClock::parseIso8601("2024-05-01T10:15:30Zjunk").has_value());
}
