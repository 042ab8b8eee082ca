#include "route_assembler.hpp"
#include "parallel.hpp"
#include "sequencer.hpp"
#include <iostream>

using namespace std;

static Waypoint make_waypoint(WaypointKind kind, const GeoPoint& p, const string& id,
                              const string& name, const string& address)
{
    Waypoint w;
    w.kind = kind;
    w.location = p;
    w.stop_id = id;
    w.name = name;
    w.address = address;
    return w;
}

RoutePlan assemble_route(const Stop& depot,
                         const vector<Stop>& ordered_stops,
                         const vector<optional<ParkingCandidate>>& parking_by_stop,
                         optional<Timestamp> start_time,
                         DistanceOracle& oracle,
                         const AssembleOptions& opt)
{
    RoutePlan plan;
    plan.waypoints.push_back(make_waypoint(WaypointKind::Depot, depot.location, depot.id,
                                           depot.name, depot.address));
    for (size_t i = 0; i < ordered_stops.size(); ++i) {
        const Stop& s = ordered_stops[i];
        if (i < parking_by_stop.size() && parking_by_stop[i]) {
            const ParkingCandidate& pc = *parking_by_stop[i];
            plan.waypoints.push_back(make_waypoint(WaypointKind::Parking, pc.location, s.id,
                                                   pc.name.empty() ? "Parking" : pc.name,
                                                   pc.address));
        }
        plan.waypoints.push_back(make_waypoint(WaypointKind::Delivery, s.location, s.id,
                                               s.name, s.address));
    }
    plan.waypoints.push_back(make_waypoint(WaypointKind::Depot, depot.location, depot.id,
                                           depot.name, depot.address));

    vector<GeoPoint> chain;
    chain.reserve(plan.waypoints.size());
    for (auto &w : plan.waypoints) chain.push_back(w.location);

    // Segment costs: one road query for the whole chain, else one matrix.
    size_t segments = chain.size() - 1;
    vector<TravelCost> legs;
    auto road = oracle.path(chain, opt.want_geometry);
    if (road && road->legs.size() == segments) {
        for (auto &leg : road->legs) legs.push_back({leg.distance_m, leg.duration_s});
        plan.source = DistanceSource::RoadNetwork;
        plan.geometry = road->geometry;
    } else {
        DistanceMatrix m = oracle.matrix(chain);
        for (size_t i = 0; i < segments; ++i) legs.push_back(m.at(i, i + 1));
        plan.source = m.source();
    }

    double dist_m = 0.0, time_s = 0.0;
    if (start_time) plan.waypoints[0].estimated_arrival = start_time;
    for (size_t i = 0; i < segments; ++i) {
        dist_m += legs[i].distance_m;
        time_s += legs[i].duration_s;
        Waypoint& w = plan.waypoints[i + 1];
        w.cumulative_distance_km = dist_m / 1000.0;
        w.cumulative_time_minutes = time_s / 60.0;
        if (start_time)
            w.estimated_arrival = *start_time + chrono::duration_cast<Timestamp::duration>(
                                                    chrono::duration<double>(time_s));
    }
    plan.total_distance_km = dist_m / 1000.0;
    plan.total_time_minutes = time_s / 60.0;

    if (opt.fetch_directions) fetch_directions(plan, oracle, opt.max_workers);
    return plan;
}

void fetch_directions(RoutePlan& plan, DistanceOracle& oracle, size_t max_workers)
{
    size_t segments = plan.waypoints.size() < 2 ? 0 : plan.waypoints.size() - 1;
    plan.directions = parallel_map<vector<string>>(segments, max_workers, [&](size_t i) {
        auto steps = oracle.directions(plan.waypoints[i].location, plan.waypoints[i + 1].location);
        return steps ? *steps : vector<string>{};
    });

    size_t missing = 0;
    for (auto &d : plan.directions)
        if (d.empty()) missing++;
    if (missing > 0)
        cerr << "[distance] no directions for " << missing << " of " << segments << " segments\n";
}

ImprovementMetrics score_improvement(const GeoPoint& depot,
                                     const vector<Stop>& stops,
                                     const vector<int>& original_order,
                                     const vector<int>& optimized_order,
                                     DistanceOracle& oracle,
                                     const vector<optional<ParkingCandidate>>& parking)
{
    DistanceMatrix m = oracle.matrix(sequence_nodes(depot, stops, parking));

    ImprovementMetrics r;
    r.original_distance_km = tour_cost(original_order, m) / 1000.0;
    r.optimized_distance_km = tour_cost(optimized_order, m) / 1000.0;
    r.distance_saved_km = r.original_distance_km - r.optimized_distance_km;
    if (r.original_distance_km > 0)
        r.improvement_percent = r.distance_saved_km / r.original_distance_km * 100.0;
    return r;
}
