#include <gtest/gtest.h>
#include <memory>
#include "fake_http.hpp"
#include "route_assembler.hpp"

namespace {

const char* PROBE = "9.21,48.78;9.18,48.77";
const GeoPoint DEPOT_AT{48.7833, 9.1817};

Stop depot()
{
    Stop s;
    s.id = "depot";
    s.name = "Depot Stuttgart";
    s.location = DEPOT_AT;
    return s;
}

Stop stop_at(const std::string& id, const GeoPoint& p)
{
    Stop s;
    s.id = id;
    s.location = p;
    return s;
}

struct AssemblerFixture {
    std::shared_ptr<FakeHttpClient> http = std::make_shared<FakeHttpClient>();
    DistanceOracle oracle;

    explicit AssemblerFixture(bool osrm_enabled)
        : oracle(EstimateConfig(), make_osrm(osrm_enabled), 30) {}

    std::shared_ptr<OsrmClient> make_osrm(bool enabled) {
        OsrmConfig cfg;
        cfg.enabled = enabled;
        return std::make_shared<OsrmClient>(cfg, http);
    }
};

}

TEST(RouteAssembler, StartsAndEndsAtDepot)
{
    AssemblerFixture f(false);
    std::vector<Stop> stops = {
        stop_at("A", destination_point(DEPOT_AT, 0.0, 1000.0)),
        stop_at("B", destination_point(DEPOT_AT, 90.0, 2000.0)),
        stop_at("C", destination_point(DEPOT_AT, 180.0, 1500.0)),
    };
    ParkingCandidate lot;
    lot.location = destination_point(stops[1].location, 0.0, 100.0);
    lot.name = "Lot B";
    std::vector<std::optional<ParkingCandidate>> parking = {std::nullopt, lot, std::nullopt};

    RoutePlan plan = assemble_route(depot(), stops, parking, std::nullopt, f.oracle);

    ASSERT_EQ(plan.waypoints.size(), 6u);
    EXPECT_EQ(plan.waypoints.front().kind, WaypointKind::Depot);
    EXPECT_EQ(plan.waypoints.back().kind, WaypointKind::Depot);
    EXPECT_EQ(plan.waypoints[2].kind, WaypointKind::Parking);
    EXPECT_EQ(plan.waypoints[2].name, "Lot B");
    EXPECT_EQ(plan.waypoints[2].stop_id, "B");
    EXPECT_EQ(plan.waypoints[3].stop_id, "B");

    int deliveries = 0;
    for (auto &w : plan.waypoints)
        if (w.kind == WaypointKind::Delivery) deliveries++;
    EXPECT_EQ(deliveries, 3);

    double expected_m = 0.0;
    for (size_t i = 0; i + 1 < plan.waypoints.size(); ++i) {
        expected_m += haversine_m(plan.waypoints[i].location, plan.waypoints[i + 1].location);
        EXPECT_GE(plan.waypoints[i + 1].cumulative_distance_km, plan.waypoints[i].cumulative_distance_km);
        EXPECT_FALSE(plan.waypoints[i].estimated_arrival.has_value());
    }
    EXPECT_NEAR(plan.total_distance_km, expected_m / 1000.0, 1e-6);
    EXPECT_DOUBLE_EQ(plan.total_distance_km, plan.waypoints.back().cumulative_distance_km);
    EXPECT_NEAR(plan.total_time_minutes, expected_m / (50.0 / 3.6) * 1.3 / 60.0, 1e-6);
    EXPECT_EQ(plan.source, DistanceSource::GreatCircleEstimate);
    EXPECT_TRUE(plan.geometry.empty());
}

TEST(RouteAssembler, StampsArrivalsFromStartTime)
{
    AssemblerFixture f(false);
    std::vector<Stop> stops = {stop_at("A", destination_point(DEPOT_AT, 0.0, 5000.0))};
    Timestamp start = Timestamp() + std::chrono::hours(24 * 365 * 50);

    RoutePlan plan = assemble_route(depot(), stops, {}, start, f.oracle);
    ASSERT_EQ(plan.waypoints.size(), 3u);
    ASSERT_TRUE(plan.waypoints[0].estimated_arrival.has_value());
    EXPECT_EQ(*plan.waypoints[0].estimated_arrival, start);

    auto leg = std::chrono::duration_cast<std::chrono::seconds>(*plan.waypoints[1].estimated_arrival - start);
    EXPECT_NEAR((double)leg.count(), 5000.0 / (50.0 / 3.6) * 1.3, 1.0);
    EXPECT_GT(*plan.waypoints[2].estimated_arrival, *plan.waypoints[1].estimated_arrival);
}

TEST(RouteAssembler, PrefersSingleRoadQuery)
{
    AssemblerFixture f(true);
    f.http->reply(PROBE, osrm_probe_body());
    f.http->reply("/route/v1/", R"({"code":"Ok","routes":[{"distance":2000,"duration":240,
        "geometry":{"type":"LineString","coordinates":[[9.18,48.78],[9.19,48.79],[9.18,48.78]]},
        "legs":[{"distance":1000,"duration":120},{"distance":1000,"duration":120}]}]})");

    std::vector<Stop> stops = {stop_at("A", destination_point(DEPOT_AT, 0.0, 900.0))};
    RoutePlan plan = assemble_route(depot(), stops, {}, std::nullopt, f.oracle);

    EXPECT_EQ(plan.source, DistanceSource::RoadNetwork);
    EXPECT_DOUBLE_EQ(plan.total_distance_km, 2.0);
    EXPECT_DOUBLE_EQ(plan.total_time_minutes, 4.0);
    EXPECT_DOUBLE_EQ(plan.waypoints[1].cumulative_distance_km, 1.0);
    EXPECT_EQ(plan.geometry.size(), 3u);
    EXPECT_EQ(f.http->calls("/table/v1/"), 0);
}

TEST(RouteAssembler, DirectionsPerSegment)
{
    AssemblerFixture f(true);
    f.http->reply(PROBE, osrm_probe_body());
    f.http->reply("steps=true", R"({"code":"Ok","routes":[{"distance":500,"duration":60,
        "legs":[{"distance":500,"duration":60,"steps":[
            {"name":"Marktplatz","maneuver":{"type":"depart"}},
            {"name":"","maneuver":{"type":"arrive"}}]}]}]})");

    std::vector<Stop> stops = {stop_at("A", destination_point(DEPOT_AT, 0.0, 500.0)),
                               stop_at("B", destination_point(DEPOT_AT, 0.0, 1000.0))};
    AssembleOptions opt;
    opt.fetch_directions = true;
    opt.max_workers = 3;
    RoutePlan plan = assemble_route(depot(), stops, {}, std::nullopt, f.oracle, opt);

    ASSERT_EQ(plan.directions.size(), 3u);
    for (auto &d : plan.directions) {
        ASSERT_EQ(d.size(), 2u);
        EXPECT_EQ(d[0], "Head out onto Marktplatz");
    }
}

TEST(RouteAssembler, ImprovementScoring)
{
    AssemblerFixture f(false);
    std::vector<Stop> stops = {
        stop_at("far", destination_point(DEPOT_AT, 45.0, 3000.0)),
        stop_at("near", destination_point(DEPOT_AT, 45.0, 1000.0)),
        stop_at("mid", destination_point(DEPOT_AT, 45.0, 2000.0)),
    };

    ImprovementMetrics same = score_improvement(DEPOT_AT, stops, {0, 1, 2}, {0, 1, 2}, f.oracle);
    EXPECT_DOUBLE_EQ(same.distance_saved_km, 0.0);
    EXPECT_DOUBLE_EQ(same.improvement_percent, 0.0);

    ImprovementMetrics better = score_improvement(DEPOT_AT, stops, {0, 1, 2}, {1, 2, 0}, f.oracle);
    EXPECT_NEAR(better.original_distance_km, 8.0, 0.01);
    EXPECT_NEAR(better.optimized_distance_km, 6.0, 0.01);
    EXPECT_NEAR(better.distance_saved_km, 2.0, 0.01);
    EXPECT_NEAR(better.improvement_percent, 25.0, 0.1);

    ImprovementMetrics empty = score_improvement(DEPOT_AT, {}, {}, {}, f.oracle);
    EXPECT_DOUBLE_EQ(empty.improvement_percent, 0.0);
}

TEST(RouteAssembler, ImprovementScoringUsesParkingPoints)
{
    AssemblerFixture f(false);
    GeoPoint north = destination_point(DEPOT_AT, 0.0, 1000.0);
    std::vector<Stop> stops = {
        stop_at("north", north),
        stop_at("east", destination_point(DEPOT_AT, 90.0, 1000.0)),
        stop_at("south", destination_point(DEPOT_AT, 180.0, 1000.0)),
    };
    ParkingCandidate lot;
    lot.location = destination_point(north, 225.0, 1900.0);
    std::vector<std::optional<ParkingCandidate>> parking = {lot, std::nullopt, std::nullopt};

    // On delivery coordinates {0, 2, 1} is the longer tour; from the lot it is shorter.
    ImprovementMetrics raw = score_improvement(DEPOT_AT, stops, {0, 1, 2}, {0, 2, 1}, f.oracle);
    EXPECT_LT(raw.distance_saved_km, 0.0);

    ImprovementMetrics parked = score_improvement(DEPOT_AT, stops, {0, 1, 2}, {0, 2, 1}, f.oracle, parking);
    EXPECT_NEAR(parked.original_distance_km, 6.17, 0.05);
    EXPECT_NEAR(parked.optimized_distance_km, 5.30, 0.05);
    EXPECT_GT(parked.distance_saved_km, 0.8);
    EXPECT_GT(parked.improvement_percent, 0.0);
}
