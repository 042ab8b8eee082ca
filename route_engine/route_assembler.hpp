#pragma once
#include "distance_oracle.hpp"
#include "model.hpp"
#include <optional>
#include <vector>

struct AssembleOptions {
    bool want_geometry = true;
    bool fetch_directions = false;
    size_t max_workers = 4;
};

// depot, then [parking, delivery] per stop in the given order, then depot.
// parking_by_stop is empty or holds one entry per ordered stop.
RoutePlan assemble_route(const Stop& depot,
                         const std::vector<Stop>& ordered_stops,
                         const std::vector<std::optional<ParkingCandidate>>& parking_by_stop,
                         std::optional<Timestamp> start_time,
                         DistanceOracle& oracle,
                         const AssembleOptions& opt = {});

// Fills plan.directions with one instruction list per consecutive waypoint
// pair. Segments the road service cannot answer get an empty list.
void fetch_directions(RoutePlan& plan, DistanceOracle& oracle, size_t max_workers);

struct ImprovementMetrics {
    double original_distance_km = 0.0;
    double optimized_distance_km = 0.0;
    double distance_saved_km = 0.0;
    double improvement_percent = 0.0;
};

// Both orders index into stops; each tour starts and ends at the depot. The
// two tours are priced on one matrix over the same nodes the sequencer sees,
// so a stop with parking is costed at its parking point.
ImprovementMetrics score_improvement(const GeoPoint& depot,
                                     const std::vector<Stop>& stops,
                                     const std::vector<int>& original_order,
                                     const std::vector<int>& optimized_order,
                                     DistanceOracle& oracle,
                                     const std::vector<std::optional<ParkingCandidate>>& parking = {});
