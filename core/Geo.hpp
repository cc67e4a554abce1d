#pragma once

#include "Model.hpp"
#include <vector>

namespace rtsae {

class Geo {
public:
    static double distanceMeters(double lat1, double lon1, double lat2, double lon2);
    static double distanceMeters(const GeoPoint& a, const GeoPoint& b);

    static GeoPoint destination(const GeoPoint& from, double bearingDeg, double distanceMeters);

    static bool isValidCoordinate(double lat, double lon);

    // Planar ray casting over lat/lon. Adequate for zones of a few kilometres.
    static bool pointInPolygon(const GeoPoint& point, const std::vector<GeoPoint>& ring);

    // Throws std::invalid_argument for a shape that cannot be tested.
    static bool contains(const ZoneShape& shape, const GeoPoint& point);

    static Circle boundingCircle(const ZoneShape& shape);

    static double metersToLatDegrees(double meters);
    static double metersToLonDegrees(double meters, double atLat);

private:
    static constexpr double EARTH_RADIUS_METERS = 6371000.0;
    static constexpr double METERS_PER_DEGREE_LAT = 111320.0;
    static double toRadians(double degrees);
    static double toDegrees(double radians);
};

} // namespace rtsae
