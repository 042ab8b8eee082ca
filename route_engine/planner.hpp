#pragma once
#include "clustering.hpp"
#include "config.hpp"
#include "distance_oracle.hpp"
#include "http_client.hpp"
#include "model.hpp"
#include "parking_resolver.hpp"
#include "route_assembler.hpp"
#include "sequencer.hpp"
#include <optional>
#include <string>
#include <vector>

// Per-request overrides of the configured planning options.
struct PlanOverrides {
    std::optional<int> max_cluster_size;
    std::optional<int> min_cluster_size;
    std::optional<ClusterMethod> method;
    std::optional<AssignmentStrategy> strategy;
    std::optional<bool> parking_aware;
};

struct PlanRequest {
    Stop depot;
    std::vector<Stop> orders;
    std::vector<Driver> drivers;
    std::vector<ParkingCandidate> parking_candidates;
    std::optional<Timestamp> start_time;
    PlanOverrides options;
};

struct PlannedRoute {
    RouteAssignment assignment;
    std::vector<int> sequence;        // indices into PlanRequest::orders, travel order
    SequencerTier tier = SequencerTier::NearestNeighbor;
    std::vector<std::optional<ParkingCandidate>> parking;   // parallel to sequence
    RoutePlan plan;
};

struct RouteStatistics {
    int total_routes = 0;
    int total_orders = 0;
    int unscheduled_orders = 0;
    int drivers_used = 0;
    double total_distance_km = 0.0;
    double total_time_minutes = 0.0;
    double average_orders_per_route = 0.0;
    double average_distance_per_route = 0.0;
};

struct PlanResult {
    bool ok = false;
    std::string error;
    std::vector<PlannedRoute> routes;
    RouteStatistics statistics;
};

struct ReoptimizeResult {
    bool ok = false;
    std::string error;
    std::vector<int> order;           // indices into the stops passed in
    SequencerTier tier = SequencerTier::NearestNeighbor;
    ImprovementMetrics metrics;
    RoutePlan plan;
};

class RoutePlanner {
public:
    RoutePlanner(const EngineConfig& cfg, DistanceOracle& oracle, ParkingResolver& parking);

    // cluster -> assign -> per route: parking, sequence, assemble.
    PlanResult plan(const PlanRequest& req, const CancelToken* cancel = nullptr);

    // Re-sequences one existing route given in its current visiting order.
    ReoptimizeResult reoptimize(const Stop& depot,
                                const std::vector<Stop>& stops,
                                const std::vector<ParkingCandidate>& statics = {},
                                std::optional<Timestamp> start_time = std::nullopt,
                                const CancelToken* cancel = nullptr);

private:
    std::vector<std::optional<ParkingCandidate>> resolve_parking(const std::vector<Stop>& stops,
                                                                 const std::vector<ParkingCandidate>& statics,
                                                                 bool parking_aware);

    EngineConfig cfg_;
    DistanceOracle& oracle_;
    ParkingResolver& parking_;
};

// Empty string when the input can be planned.
std::string validate_plan_input(const Stop& depot,
                                const std::vector<Stop>& orders,
                                const std::vector<Driver>& drivers);

RouteStatistics route_statistics(const std::vector<PlannedRoute>& routes, size_t total_orders);
