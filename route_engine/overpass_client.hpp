#pragma once
#include "config.hpp"
#include "geo.hpp"
#include "http_client.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct ParkingPoi {
    GeoPoint location;
    std::string name;
    std::string address;
    long long osm_id = 0;
};

// A way carrying one of the parking tags, with its node geometry.
struct StreetSegment {
    long long way_id = 0;
    std::string name;
    std::string address;
    std::vector<GeoPoint> geometry;
};

extern const std::vector<std::string> PARKING_WAY_TAGS;

class OverpassClient {
public:
    OverpassClient(const OverpassConfig& cfg, std::shared_ptr<HttpClient> http);

    bool enabled() const { return cfg_.enabled; }

    std::optional<std::vector<ParkingPoi>> parking_nearby(const GeoPoint& p, int radius_m, int limit);

    // Bulk download for offline sampling; not used on the planning path.
    std::optional<std::vector<StreetSegment>> parking_segments(const BoundingBox& box,
                                                               const std::vector<std::string>& tags);

private:
    std::optional<nlohmann::json> query(const std::string& ql, long timeout_ms);

    OverpassConfig cfg_;
    std::shared_ptr<HttpClient> http_;
};

std::string build_parking_nearby_query(const GeoPoint& p, int radius_m, int limit);
std::string build_parking_segments_query(const BoundingBox& box, const std::vector<std::string>& tags);
std::vector<ParkingPoi> parse_parking_pois(const nlohmann::json& payload, int limit);
std::vector<StreetSegment> parse_street_segments(const nlohmann::json& payload);
