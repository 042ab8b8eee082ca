#pragma once
#include "geo.hpp"
#include "model.hpp"
#include "overpass_client.hpp"
#include <string>
#include <vector>

struct SampledParkingPoint {
    GeoPoint location;
    std::string name;
    std::string address;
    long long way_id;
    int point_index;        // position along its way
    double distance_m;      // from the start of the way
};

// Walks each way and emits a point every spacing_m meters (both ends included).
// Points that round to an already emitted coordinate at dedupe_decimals are
// dropped. max_points = 0 means no cap.
std::vector<SampledParkingPoint> sample_segments(const std::vector<StreetSegment>& segments,
                                                 double spacing_m,
                                                 int dedupe_decimals,
                                                 size_t max_points = 0);

std::vector<ParkingCandidate> to_candidates(const std::vector<SampledParkingPoint>& points);
