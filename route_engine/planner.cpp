#include "planner.hpp"
#include "driver_assigner.hpp"
#include <algorithm>
#include <set>

using namespace std;

static bool is_cancelled(const CancelToken* cancel)
{
    return cancel != nullptr && cancel->cancelled();
}

static PlanResult failed(const string& error)
{
    PlanResult r;
    r.ok = false;
    r.error = error;
    return r;
}

string validate_plan_input(const Stop& depot, const vector<Stop>& orders, const vector<Driver>& drivers)
{
    if (!is_valid(depot.location)) return "depot has no valid coordinates";
    if (orders.empty()) return "no orders to plan";
    for (auto &o : orders)
        if (!is_valid(o.location)) return "order " + o.id + " has no valid coordinates";
    if (drivers.empty()) return "no drivers given";

    bool any_available = false;
    for (auto &d : drivers)
        if (d.available) any_available = true;
    if (!any_available) return "no available drivers";
    return "";
}

RoutePlanner::RoutePlanner(const EngineConfig& cfg, DistanceOracle& oracle, ParkingResolver& parking)
    : cfg_(cfg), oracle_(oracle), parking_(parking)
{
}

vector<optional<ParkingCandidate>> RoutePlanner::resolve_parking(const vector<Stop>& stops,
                                                                 const vector<ParkingCandidate>& statics,
                                                                 bool parking_aware)
{
    if (!parking_aware) return {};

    vector<GeoPoint> deliveries;
    deliveries.reserve(stops.size());
    for (auto &s : stops) deliveries.push_back(s.location);
    return parking_.resolve_all(deliveries, statics, parking_options_from(cfg_),
                                max(1, cfg_.planner.max_workers));
}

PlanResult RoutePlanner::plan(const PlanRequest& req, const CancelToken* cancel)
{
    string problem = validate_plan_input(req.depot, req.orders, req.drivers);
    if (!problem.empty()) return failed(problem);

    ClusterOptions copt = cluster_options_from(cfg_.clustering);
    if (req.options.max_cluster_size) copt.max_cluster_size = *req.options.max_cluster_size;
    if (req.options.min_cluster_size) copt.min_cluster_size = *req.options.min_cluster_size;
    if (req.options.method) copt.method = *req.options.method;
    if (copt.max_cluster_size < 1) return failed("maxClusterSize must be at least 1");
    AssignmentStrategy strategy = req.options.strategy.value_or(cfg_.planner.strategy);
    bool parking_aware = req.options.parking_aware.value_or(cfg_.planner.parking_aware);

    vector<GeoPoint> points;
    points.reserve(req.orders.size());
    for (auto &o : req.orders) points.push_back(o.location);

    vector<Cluster> clusters = cluster_points(points, copt, oracle_);
    if (is_cancelled(cancel)) return failed("cancelled");

    vector<RouteAssignment> assignments = assign_drivers(clusters, req.drivers, req.orders, strategy);
    if (assignments.empty()) return failed("no available drivers");

    SequencerOptions sopt = sequencer_options_from(cfg_.sequencer);
    AssembleOptions aopt;
    aopt.want_geometry = cfg_.planner.want_geometry;
    aopt.fetch_directions = cfg_.planner.fetch_directions;
    aopt.max_workers = max(1, cfg_.planner.max_workers);

    PlanResult result;
    for (auto &a : assignments) {
        if (is_cancelled(cancel)) return failed("cancelled");

        vector<Stop> stops;
        for (int idx : a.order_indices) stops.push_back(req.orders[idx]);

        vector<optional<ParkingCandidate>> parking = resolve_parking(stops, req.parking_candidates, parking_aware);
        if (is_cancelled(cancel)) return failed("cancelled");

        SequenceResult seq = sequence_stops(req.depot.location, stops, parking, oracle_, sopt);

        PlannedRoute route;
        route.assignment = a;
        route.tier = seq.tier;
        vector<Stop> ordered;
        for (int k : seq.order) {
            route.sequence.push_back(a.order_indices[k]);
            ordered.push_back(stops[k]);
            route.parking.push_back(parking.empty() ? optional<ParkingCandidate>() : parking[k]);
        }
        route.plan = assemble_route(req.depot, ordered, route.parking, req.start_time, oracle_, aopt);
        result.routes.push_back(move(route));
    }

    result.ok = true;
    result.statistics = route_statistics(result.routes, req.orders.size());
    return result;
}

ReoptimizeResult RoutePlanner::reoptimize(const Stop& depot,
                                          const vector<Stop>& stops,
                                          const vector<ParkingCandidate>& statics,
                                          optional<Timestamp> start_time,
                                          const CancelToken* cancel)
{
    ReoptimizeResult r;
    if (!is_valid(depot.location)) {
        r.error = "depot has no valid coordinates";
        return r;
    }
    if (stops.empty()) {
        r.error = "no orders to plan";
        return r;
    }
    for (auto &s : stops) {
        if (!is_valid(s.location)) {
            r.error = "order " + s.id + " has no valid coordinates";
            return r;
        }
    }

    vector<optional<ParkingCandidate>> parking = resolve_parking(stops, statics, cfg_.planner.parking_aware);
    if (is_cancelled(cancel)) {
        r.error = "cancelled";
        return r;
    }

    SequenceResult seq = sequence_stops(depot.location, stops, parking, oracle_,
                                        sequencer_options_from(cfg_.sequencer));

    vector<int> current(stops.size());
    for (size_t i = 0; i < stops.size(); ++i) current[i] = i;
    r.order = seq.order;
    r.tier = seq.tier;
    r.metrics = score_improvement(depot.location, stops, current, seq.order, oracle_, parking);
    if (r.metrics.distance_saved_km < 0) {
        // keep the current order when it is already the cheaper one
        r.order = current;
        r.metrics = score_improvement(depot.location, stops, current, current, oracle_, parking);
    }

    vector<Stop> ordered;
    vector<optional<ParkingCandidate>> ordered_parking;
    for (int k : r.order) {
        ordered.push_back(stops[k]);
        ordered_parking.push_back(parking.empty() ? optional<ParkingCandidate>() : parking[k]);
    }

    AssembleOptions aopt;
    aopt.want_geometry = cfg_.planner.want_geometry;
    aopt.fetch_directions = cfg_.planner.fetch_directions;
    aopt.max_workers = max(1, cfg_.planner.max_workers);
    r.plan = assemble_route(depot, ordered, ordered_parking, start_time, oracle_, aopt);
    r.ok = true;
    return r;
}

RouteStatistics route_statistics(const vector<PlannedRoute>& routes, size_t total_orders)
{
    RouteStatistics st;
    set<string> scheduled;
    set<int> drivers;
    for (auto &r : routes) {
        scheduled.insert(r.assignment.order_ids.begin(), r.assignment.order_ids.end());
        drivers.insert(r.assignment.driver_id);
        st.total_distance_km += r.plan.total_distance_km;
        st.total_time_minutes += r.plan.total_time_minutes;
    }

    st.total_routes = routes.size();
    st.total_orders = scheduled.size();
    st.unscheduled_orders = max(0, (int)total_orders - st.total_orders);
    st.drivers_used = drivers.size();
    if (!routes.empty()) {
        st.average_orders_per_route = (double)st.total_orders / routes.size();
        st.average_distance_per_route = st.total_distance_km / routes.size();
    }
    return st;
}
