#pragma once
#include <vector>

struct GeoPoint {
    double lat;
    double lon;
};

inline bool operator==(const GeoPoint& a, const GeoPoint& b) {
    return a.lat == b.lat && a.lon == b.lon;
}

inline bool operator!=(const GeoPoint& a, const GeoPoint& b) {
    return !(a == b);
}

const double EARTH_RADIUS_M = 6371000.0;

// Great-circle distance in meters.
double haversine_m(const GeoPoint& a, const GeoPoint& b);

// Point reached by travelling distance_m from origin along bearing_deg (0 = north).
GeoPoint destination_point(const GeoPoint& origin, double bearing_deg, double distance_m);

double round_to(double value, int decimals);

// Arithmetic mean of the coordinates; callers keep points within one city.
GeoPoint centroid(const std::vector<GeoPoint>& points);

// Finite and inside WGS-84 ranges.
bool is_valid(const GeoPoint& p);
