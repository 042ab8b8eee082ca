#pragma once
#include "geo.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <vector>

using Timestamp = std::chrono::system_clock::time_point;

// Depot, delivery or parking point.
struct Stop {
    std::string id;
    GeoPoint location;
    std::string address;
    std::string name;
};

struct Driver {
    int id;
    std::string name;
    bool available = true;
};

enum class DistanceSource { RoadNetwork, GreatCircleEstimate };

enum class ParkingSource { Cached, LivePoi, SyntheticRoadSnap };

struct ParkingCandidate {
    GeoPoint location;
    ParkingSource source = ParkingSource::Cached;
    std::optional<double> distance_m;
    std::string name;
    std::string address;
};

// Indices into the order list handed to the clusterer.
using Cluster = std::vector<int>;

struct RouteAssignment {
    int driver_id;
    std::string driver_name;
    std::vector<int> order_indices;        // cluster membership, not travel order
    std::vector<std::string> order_ids;
    std::string route_name;
    std::string color;
    int route_index;
};

enum class WaypointKind { Depot, Parking, Delivery };

struct Waypoint {
    WaypointKind kind;
    GeoPoint location;
    std::string stop_id;
    std::string name;
    std::string address;
    double cumulative_distance_km = 0.0;
    double cumulative_time_minutes = 0.0;
    std::optional<Timestamp> estimated_arrival;
};

struct RoutePlan {
    std::vector<Waypoint> waypoints;
    double total_distance_km = 0.0;
    double total_time_minutes = 0.0;
    DistanceSource source = DistanceSource::GreatCircleEstimate;
    std::vector<GeoPoint> geometry;
    // One entry per consecutive waypoint pair when directions were requested.
    std::vector<std::vector<std::string>> directions;
};

const char* to_string(DistanceSource s);
const char* to_string(ParkingSource s);
const char* to_string(WaypointKind k);
