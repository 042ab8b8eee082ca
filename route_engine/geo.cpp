#include "geo.hpp"
#include <cmath>
using namespace std;

static const double PI = acos(-1.0);

static double to_rad(double deg) { return deg * PI / 180.0; }
static double to_deg(double rad) { return rad * 180.0 / PI; }

double haversine_m(const GeoPoint& a, const GeoPoint& b)
{
    double dlat = to_rad(b.lat - a.lat);
    double dlon = to_rad(b.lon - a.lon);
    double h = sin(dlat / 2) * sin(dlat / 2) +
               cos(to_rad(a.lat)) * cos(to_rad(b.lat)) * sin(dlon / 2) * sin(dlon / 2);
    h = min(1.0, max(0.0, h));
    return EARTH_RADIUS_M * 2 * asin(sqrt(h));
}

GeoPoint destination_point(const GeoPoint& origin, double bearing_deg, double distance_m)
{
    double delta = distance_m / EARTH_RADIUS_M;
    double theta = to_rad(bearing_deg);
    double phi1 = to_rad(origin.lat);
    double lambda1 = to_rad(origin.lon);

    double phi2 = asin(sin(phi1) * cos(delta) + cos(phi1) * sin(delta) * cos(theta));
    double lambda2 = lambda1 + atan2(sin(theta) * sin(delta) * cos(phi1),
                                     cos(delta) - sin(phi1) * sin(phi2));

    double lon = fmod(to_deg(lambda2) + 540.0, 360.0) - 180.0;
    return {to_deg(phi2), lon};
}

double round_to(double value, int decimals)
{
    double scale = pow(10.0, decimals);
    return round(value * scale) / scale;
}

GeoPoint centroid(const vector<GeoPoint>& points)
{
    if (points.empty()) return {0.0, 0.0};
    double lat = 0.0, lon = 0.0;
    for (auto &p : points) {
        lat += p.lat;
        lon += p.lon;
    }
    return {lat / points.size(), lon / points.size()};
}

bool is_valid(const GeoPoint& p)
{
    if (!isfinite(p.lat) || !isfinite(p.lon)) return false;
    return p.lat >= -90.0 && p.lat <= 90.0 && p.lon >= -180.0 && p.lon <= 180.0;
}
