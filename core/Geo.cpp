#include "Geo.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace rtsae {

double Geo::distanceMeters(double lat1, double lon1, double lat2, double lon2) {
    double dLat = toRadians(lat2 - lat1);
    double dLon = toRadians(lon2 - lon1);

    double a = std::sin(dLat/2) * std::sin(dLat/2) +
               std::cos(toRadians(lat1)) * std::cos(toRadians(lat2)) *
               std::sin(dLon/2) * std::sin(dLon/2);

    double c = 2 * std::atan2(std::sqrt(a), std::sqrt(1-a));
    return EARTH_RADIUS_METERS * c;
}

double Geo::distanceMeters(const GeoPoint& a, const GeoPoint& b) {
    return distanceMeters(a.lat, a.lon, b.lat, b.lon);
}

GeoPoint Geo::destination(const GeoPoint& from, double bearingDeg, double distanceMeters) {
    double bearing = toRadians(bearingDeg);
    double d = distanceMeters / EARTH_RADIUS_METERS;

    double lat1 = toRadians(from.lat);
    double lon1 = toRadians(from.lon);

    double lat2 = std::asin(std::sin(lat1) * std::cos(d) +
                           std::cos(lat1) * std::sin(d) * std::cos(bearing));

    double lon2 = lon1 + std::atan2(std::sin(bearing) * std::sin(d) * std::cos(lat1),
                                   std::cos(d) - std::sin(lat1) * std::sin(lat2));

    return GeoPoint{toDegrees(lat2), toDegrees(lon2)};
}

bool Geo::isValidCoordinate(double lat, double lon) {
    return std::isfinite(lat) && std::isfinite(lon) &&
           lat >= -90.0 && lat <= 90.0 &&
           lon >= -180.0 && lon <= 180.0;
}

bool Geo::pointInPolygon(const GeoPoint& point, const std::vector<GeoPoint>& ring) {
    if (ring.size() < 3) return false;

    bool inside = false;
    for (std::size_t i = 0, j = ring.size() - 1; i < ring.size(); j = i++) {
        const GeoPoint& a = ring[i];
        const GeoPoint& b = ring[j];

        if ((a.lat > point.lat) != (b.lat > point.lat)) {
            double crossLon = (b.lon - a.lon) * (point.lat - a.lat) / (b.lat - a.lat) + a.lon;
            if (point.lon < crossLon) {
                inside = !inside;
            }
        }
    }
    return inside;
}

bool Geo::contains(const ZoneShape& shape, const GeoPoint& point) {
    if (const auto* circle = std::get_if<Circle>(&shape)) {
        if (!(circle->radiusM > 0.0)) {
            throw std::invalid_argument("circle radius must be positive");
        }
        // boundary counts as inside
        return distanceMeters(point, circle->center) <= circle->radiusM;
    }

    const auto& polygon = std::get<Polygon>(shape);
    if (polygon.ring.size() < 3) {
        throw std::invalid_argument("polygon needs at least 3 vertices, got " +
                                    std::to_string(polygon.ring.size()));
    }
    return pointInPolygon(point, polygon.ring);
}

Circle Geo::boundingCircle(const ZoneShape& shape) {
    if (const auto* circle = std::get_if<Circle>(&shape)) {
        return *circle;
    }

    const auto& ring = std::get<Polygon>(shape).ring;
    if (ring.empty()) {
        return Circle{};
    }

    GeoPoint center;
    for (const auto& vertex : ring) {
        center.lat += vertex.lat;
        center.lon += vertex.lon;
    }
    center.lat /= static_cast<double>(ring.size());
    center.lon /= static_cast<double>(ring.size());

    double radius = 0.0;
    for (const auto& vertex : ring) {
        radius = std::max(radius, distanceMeters(center, vertex));
    }
    return Circle{center, radius};
}

double Geo::metersToLatDegrees(double meters) {
    return meters / METERS_PER_DEGREE_LAT;
}

double Geo::metersToLonDegrees(double meters, double atLat) {
    double scale = std::cos(toRadians(atLat));
    if (scale < 1e-6) {
        return 360.0;
    }
    return meters / (METERS_PER_DEGREE_LAT * scale);
}

double Geo::toRadians(double degrees) {
    return degrees * M_PI / 180.0;
}

double Geo::toDegrees(double radians) {
    return radians * 180.0 / M_PI;
}

} // namespace rtsae
