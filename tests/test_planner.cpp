#include <gtest/gtest.h>
#include <atomic>
#include <cmath>
#include <csignal>
#include <limits>
#include <memory>
#include <set>
#include "fake_http.hpp"
#include "planner.hpp"

namespace {

const GeoPoint DEPOT_AT{48.7833, 9.1817};

EngineConfig offline_config()
{
    EngineConfig cfg;
    cfg.osrm.enabled = false;
    cfg.overpass.enabled = false;
    cfg.clustering.radius_km = 2.0;
    cfg.planner.max_workers = 2;
    return cfg;
}

Stop make_stop(const std::string& id, const GeoPoint& p)
{
    Stop s;
    s.id = id;
    s.location = p;
    return s;
}

PlanRequest two_district_request()
{
    PlanRequest req;
    req.depot = make_stop("depot", DEPOT_AT);
    GeoPoint west = destination_point(DEPOT_AT, 270.0, 8000.0);
    GeoPoint east = destination_point(DEPOT_AT, 90.0, 8000.0);
    for (int i = 0; i < 6; i++)
        req.orders.push_back(make_stop("W" + std::to_string(i), destination_point(west, 60.0 * i, 300.0)));
    for (int i = 0; i < 6; i++)
        req.orders.push_back(make_stop("E" + std::to_string(i), destination_point(east, 60.0 * i, 300.0)));
    req.drivers = {{1, "Anna Koch"}, {2, "Jonas Weber"}};
    req.options.max_cluster_size = 8;
    req.options.min_cluster_size = 3;
    return req;
}

struct PlannerFixture {
    EngineConfig cfg = offline_config();
    std::shared_ptr<FakeHttpClient> http = std::make_shared<FakeHttpClient>();
    DistanceOracle oracle{cfg, http};
    ParkingResolver parking{cfg, http, oracle};
    RoutePlanner planner{cfg, oracle, parking};
};

}

TEST(RoutePlanner, PlansTwoDistrictsOffline)
{
    PlannerFixture f;
    PlanResult r = f.planner.plan(two_district_request());
    ASSERT_TRUE(r.ok) << r.error;
    ASSERT_EQ(r.routes.size(), 2u);

    std::set<int> seen;
    for (auto &route : r.routes) {
        EXPECT_EQ(route.sequence.size(), 6u);
        seen.insert(route.sequence.begin(), route.sequence.end());

        const RoutePlan& plan = route.plan;
        EXPECT_EQ(plan.waypoints.front().kind, WaypointKind::Depot);
        EXPECT_EQ(plan.waypoints.back().kind, WaypointKind::Depot);
        int deliveries = 0;
        for (auto &w : plan.waypoints) {
            EXPECT_NE(w.kind, WaypointKind::Parking);
            if (w.kind == WaypointKind::Delivery) deliveries++;
        }
        EXPECT_EQ(deliveries, 6);
        EXPECT_EQ(plan.source, DistanceSource::GreatCircleEstimate);
        EXPECT_GT(plan.total_distance_km, 16.0);
    }
    EXPECT_EQ(seen.size(), 12u);
    EXPECT_EQ(f.http->total_calls(), 0);

    EXPECT_EQ(r.statistics.total_routes, 2);
    EXPECT_EQ(r.statistics.total_orders, 12);
    EXPECT_EQ(r.statistics.unscheduled_orders, 0);
    EXPECT_EQ(r.statistics.drivers_used, 2);
    EXPECT_DOUBLE_EQ(r.statistics.average_orders_per_route, 6.0);
}

TEST(RoutePlanner, ThreadsParkingBeforeDeliveries)
{
    PlannerFixture f;
    PlanRequest req = two_district_request();
    ParkingCandidate lot;
    lot.location = destination_point(req.orders[0].location, 0.0, 50.0);
    lot.name = "Lot West";
    req.parking_candidates = {lot};

    PlanResult r = f.planner.plan(req);
    ASSERT_TRUE(r.ok) << r.error;

    for (auto &route : r.routes) {
        bool west = route.assignment.order_ids.front()[0] == 'W';
        const auto& wps = route.plan.waypoints;
        ASSERT_EQ(wps.size(), 14u);
        for (size_t i = 1; i + 1 < wps.size(); i += 2) {
            EXPECT_EQ(wps[i].kind, WaypointKind::Parking);
            EXPECT_EQ(wps[i + 1].kind, WaypointKind::Delivery);
            EXPECT_EQ(wps[i].stop_id, wps[i + 1].stop_id);
            EXPECT_EQ(wps[i].name, "Lot West");
        }
        for (auto &p : route.parking) {
            ASSERT_TRUE(p.has_value());
            EXPECT_EQ(p->source, ParkingSource::Cached);
            // east orders only get the lot as a last resort
            if (west) EXPECT_LT(*p->distance_m, 2000.0);
            else EXPECT_GT(*p->distance_m, 2000.0);
        }
    }
}

TEST(RoutePlanner, SequenceFollowsClusterMembers)
{
    PlannerFixture f;
    PlanRequest req = two_district_request();
    PlanResult r = f.planner.plan(req);
    ASSERT_TRUE(r.ok);
    for (auto &route : r.routes) {
        std::set<int> members(route.assignment.order_indices.begin(), route.assignment.order_indices.end());
        std::set<int> sequenced(route.sequence.begin(), route.sequence.end());
        EXPECT_EQ(members, sequenced);
        // waypoint 0 is the depot; no parking on this request
        for (size_t k = 0; k < route.sequence.size(); ++k)
            EXPECT_EQ(route.plan.waypoints[k + 1].stop_id, req.orders[route.sequence[k]].id);
    }
}

TEST(RoutePlanner, ReportsInfeasibleInput)
{
    PlannerFixture f;
    double nan = std::numeric_limits<double>::quiet_NaN();

    PlanRequest no_orders = two_district_request();
    no_orders.orders.clear();
    EXPECT_EQ(f.planner.plan(no_orders).error, "no orders to plan");

    PlanRequest no_drivers = two_district_request();
    no_drivers.drivers.clear();
    EXPECT_EQ(f.planner.plan(no_drivers).error, "no drivers given");

    PlanRequest off_duty = two_district_request();
    for (auto &d : off_duty.drivers) d.available = false;
    PlanResult r = f.planner.plan(off_duty);
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.error, "no available drivers");

    PlanRequest bad_depot = two_district_request();
    bad_depot.depot.location = {nan, nan};
    EXPECT_EQ(f.planner.plan(bad_depot).error, "depot has no valid coordinates");

    PlanRequest bad_order = two_district_request();
    bad_order.orders[3].location.lat = 123.0;
    EXPECT_EQ(f.planner.plan(bad_order).error, "order W3 has no valid coordinates");
}

TEST(RoutePlanner, CancelledRequestReportsCancellation)
{
    PlannerFixture f;
    CancelToken token;
    token.cancel();
    PlanResult r = f.planner.plan(two_district_request(), &token);
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.error, "cancelled");
    EXPECT_TRUE(r.routes.empty());
}

namespace {

CancelToken* volatile sigint_token = nullptr;

void cancel_on_sigint(int)
{
    CancelToken* token = sigint_token;
    if (token) token->cancel();
}

}

TEST(RoutePlanner, SigintHandlerCancelsThroughRawToken)
{
    static_assert(std::atomic<bool>::is_always_lock_free, "cancel flag must be signal safe");

    PlannerFixture f;
    CancelToken token;
    sigint_token = &token;
    auto previous = std::signal(SIGINT, cancel_on_sigint);
    std::raise(SIGINT);
    std::signal(SIGINT, previous);
    sigint_token = nullptr;

    EXPECT_TRUE(token.cancelled());
    EXPECT_EQ(f.planner.plan(two_district_request(), &token).error, "cancelled");
}

TEST(RoutePlanner, RequestOptionsOverrideConfig)
{
    PlannerFixture f;
    PlanRequest req = two_district_request();
    req.options.max_cluster_size = 4;
    req.options.strategy = AssignmentStrategy::Sequential;

    PlanResult r = f.planner.plan(req);
    ASSERT_TRUE(r.ok);
    ASSERT_EQ(r.routes.size(), 4u);
    for (auto &route : r.routes) EXPECT_LE(route.sequence.size(), 4u);
    EXPECT_EQ(r.routes[0].assignment.driver_id, 1);
    EXPECT_EQ(r.routes[1].assignment.driver_id, 2);
    EXPECT_EQ(r.routes[2].assignment.driver_id, 1);
}

TEST(RoutePlanner, ReoptimizeScoresTheNewOrder)
{
    PlannerFixture f;
    Stop depot = make_stop("depot", DEPOT_AT);
    std::vector<Stop> current = {
        make_stop("far", destination_point(DEPOT_AT, 45.0, 3000.0)),
        make_stop("near", destination_point(DEPOT_AT, 45.0, 1000.0)),
        make_stop("mid", destination_point(DEPOT_AT, 45.0, 2000.0)),
    };

    ReoptimizeResult r = f.planner.reoptimize(depot, current);
    ASSERT_TRUE(r.ok) << r.error;
    EXPECT_NEAR(r.metrics.original_distance_km, 8.0, 0.01);
    EXPECT_NEAR(r.metrics.optimized_distance_km, 6.0, 0.01);
    EXPECT_NEAR(r.metrics.improvement_percent, 25.0, 0.1);
    EXPECT_NEAR(r.plan.total_distance_km, 6.0, 0.01);
    EXPECT_EQ(r.plan.waypoints.size(), 5u);

    EXPECT_FALSE(f.planner.reoptimize(depot, {}).ok);
}

TEST(RoutePlanner, ReoptimizeWithParkingNeverReportsALoss)
{
    PlannerFixture f;
    Stop depot = make_stop("depot", DEPOT_AT);
    GeoPoint north = destination_point(DEPOT_AT, 0.0, 1000.0);
    std::vector<Stop> current = {
        make_stop("north", north),
        make_stop("east", destination_point(DEPOT_AT, 90.0, 1000.0)),
        make_stop("south", destination_point(DEPOT_AT, 180.0, 1000.0)),
    };
    ParkingCandidate lot;
    lot.location = destination_point(north, 225.0, 1900.0);
    lot.name = "Lot South-West";

    ReoptimizeResult r = f.planner.reoptimize(depot, current, {lot});
    ASSERT_TRUE(r.ok) << r.error;
    EXPECT_GE(r.metrics.distance_saved_km, 0.0);
    EXPECT_GE(r.metrics.improvement_percent, 0.0);
    // every stop parks at the lot, so both tours are two lot legs long
    EXPECT_NEAR(r.metrics.original_distance_km, 2.77, 0.05);
    EXPECT_NEAR(r.metrics.optimized_distance_km, 2.77, 0.05);
    ASSERT_EQ(r.plan.waypoints.size(), 8u);
    EXPECT_EQ(r.plan.waypoints[1].kind, WaypointKind::Parking);
}

TEST(RoutePlanner, StatisticsCountDistinctOrdersAndDrivers)
{
    PlannedRoute a;
    a.assignment.driver_id = 1;
    a.assignment.order_ids = {"O1", "O2"};
    a.plan.total_distance_km = 10.0;
    a.plan.total_time_minutes = 30.0;
    PlannedRoute b = a;
    b.assignment.order_ids = {"O3"};
    b.plan.total_distance_km = 5.0;

    RouteStatistics s = route_statistics({a, b}, 5);
    EXPECT_EQ(s.total_routes, 2);
    EXPECT_EQ(s.total_orders, 3);
    EXPECT_EQ(s.unscheduled_orders, 2);
    EXPECT_EQ(s.drivers_used, 1);
    EXPECT_DOUBLE_EQ(s.total_distance_km, 15.0);
    EXPECT_DOUBLE_EQ(s.total_time_minutes, 60.0);
    EXPECT_DOUBLE_EQ(s.average_orders_per_route, 1.5);
    EXPECT_DOUBLE_EQ(s.average_distance_per_route, 7.5);

    EXPECT_EQ(route_statistics({}, 4).unscheduled_orders, 4);
}
