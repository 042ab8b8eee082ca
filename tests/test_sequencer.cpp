#include <gtest/gtest.h>
#include <algorithm>
#include <memory>
#include "sequencer.hpp"

namespace {

const GeoPoint DEPOT{48.7833, 9.1817};

DistanceMatrix gc_matrix(const std::vector<GeoPoint>& points)
{
    GreatCircleTier tier{EstimateConfig()};
    return *tier.attempt(points, {}, false);
}

DistanceOracle offline_oracle()
{
    OsrmConfig cfg;
    cfg.enabled = false;
    return DistanceOracle(EstimateConfig(), std::make_shared<OsrmClient>(cfg, nullptr), 30);
}

Stop stop_at(const std::string& id, const GeoPoint& p)
{
    Stop s;
    s.id = id;
    s.location = p;
    return s;
}

// depot first, then scattered stops
std::vector<GeoPoint> scattered(int n)
{
    std::vector<GeoPoint> pts = {DEPOT};
    for (int i = 0; i < n; i++)
        pts.push_back(destination_point(DEPOT, (i * 149) % 360, 500.0 + (i * 977) % 6000));
    return pts;
}

bool is_permutation_of_stops(std::vector<int> tour, int n)
{
    std::sort(tour.begin(), tour.end());
    for (int i = 0; i < n; i++)
        if (i >= (int)tour.size() || tour[i] != i) return false;
    return (int)tour.size() == n;
}

}

TEST(Sequencer, CollinearStopsVisitedNearestFirst)
{
    auto oracle = offline_oracle();
    std::vector<Stop> stops = {
        stop_at("far", destination_point(DEPOT, 45.0, 3000.0)),
        stop_at("near", destination_point(DEPOT, 45.0, 1000.0)),
        stop_at("mid", destination_point(DEPOT, 45.0, 2000.0)),
    };

    SequencerOptions local;
    local.use_solver = false;
    SequenceResult r = sequence_stops(DEPOT, stops, {}, oracle, local);
    EXPECT_EQ(r.tier, SequencerTier::TwoOpt);
    EXPECT_EQ(r.order, (std::vector<int>{1, 2, 0}));
    EXPECT_NEAR(r.distance_m, 6000.0, 1.0);
    EXPECT_EQ(r.source, DistanceSource::GreatCircleEstimate);

    SequenceResult solved = sequence_stops(DEPOT, stops, {}, oracle, SequencerOptions());
    EXPECT_EQ(solved.tier, SequencerTier::GuidedLocalSearch);
    EXPECT_NEAR(solved.distance_m, 6000.0, 1.0);
}

TEST(Sequencer, NearestNeighborBreaksTiesByLowestIndex)
{
    std::vector<GeoPoint> pts = {DEPOT,
                                 destination_point(DEPOT, 90.0, 1000.0),
                                 destination_point(DEPOT, 90.0, 1000.0),
                                 destination_point(DEPOT, 0.0, 5000.0)};
    auto tour = nearest_neighbor_tour(gc_matrix(pts));
    EXPECT_EQ(tour, (std::vector<int>{0, 1, 2}));
}

TEST(Sequencer, TwoOptRemovesCrossing)
{
    GeoPoint north = destination_point(DEPOT, 0.0, 1000.0);
    GeoPoint north_east = destination_point(north, 90.0, 1000.0);
    GeoPoint east = destination_point(DEPOT, 90.0, 1000.0);
    DistanceMatrix m = gc_matrix({DEPOT, north, north_east, east});

    std::vector<int> tour = {0, 2, 1};
    double crossed = tour_cost(tour, m);
    EXPECT_TRUE(two_opt(tour, m, 1000));
    EXPECT_LT(tour_cost(tour, m), crossed);
    EXPECT_NEAR(tour_cost(tour, m), tour_cost({0, 1, 2}, m), 1e-6);
}

TEST(Sequencer, TwoOptIsIdempotent)
{
    DistanceMatrix m = gc_matrix(scattered(20));
    auto tour = nearest_neighbor_tour(m);
    two_opt(tour, m, 1000);
    double cost = tour_cost(tour, m);

    auto again = tour;
    EXPECT_FALSE(two_opt(again, m, 1000));
    EXPECT_EQ(again, tour);
    EXPECT_DOUBLE_EQ(tour_cost(again, m), cost);
}

TEST(Sequencer, CheapestInsertionVisitsEveryStop)
{
    DistanceMatrix m = gc_matrix(scattered(12));
    EXPECT_TRUE(is_permutation_of_stops(cheapest_insertion_tour(m), 12));
    EXPECT_TRUE(cheapest_insertion_tour(gc_matrix({DEPOT})).empty());
}

TEST(Sequencer, GuidedLocalSearchImprovesOnInsertion)
{
    DistanceMatrix m = gc_matrix(scattered(25));
    auto start = cheapest_insertion_tour(m);

    auto gls = guided_local_search(m, std::chrono::milliseconds(10000), 200);
    ASSERT_TRUE(gls.has_value());
    EXPECT_TRUE(is_permutation_of_stops(*gls, 25));
    EXPECT_LE(tour_cost(*gls, m), tour_cost(start, m) + 1e-6);

    // a GLS tour is also 2-opt optimal
    auto polished = *gls;
    EXPECT_FALSE(two_opt(polished, m, 1000));
}

TEST(Sequencer, GuidedLocalSearchIsReproducible)
{
    DistanceMatrix m = gc_matrix(scattered(15));
    auto a = guided_local_search(m, std::chrono::milliseconds(10000), 50);
    auto b = guided_local_search(m, std::chrono::milliseconds(10000), 50);
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(*a, *b);
}

TEST(Sequencer, ExhaustedSolverBudgetFallsThrough)
{
    DistanceMatrix m = gc_matrix(scattered(8));
    SequencerOptions opt;
    opt.solver_time_limit = std::chrono::milliseconds(0);

    SequenceResult r = sequence_matrix(m, opt);
    EXPECT_EQ(r.tier, SequencerTier::TwoOpt);
    EXPECT_TRUE(is_permutation_of_stops(r.order, 8));
}

TEST(Sequencer, ParkingPointDrivesTheCost)
{
    auto oracle = offline_oracle();
    std::vector<Stop> stops = {
        stop_at("a", destination_point(DEPOT, 0.0, 4000.0)),
        stop_at("b", destination_point(DEPOT, 180.0, 1000.0)),
    };
    ParkingCandidate near_depot;
    near_depot.location = destination_point(DEPOT, 0.0, 200.0);

    SequencerOptions opt;
    opt.use_solver = false;
    std::vector<std::optional<ParkingCandidate>> parking = {near_depot, std::nullopt};
    SequenceResult with_parking = sequence_stops(DEPOT, stops, parking, oracle, opt);
    EXPECT_EQ(with_parking.order.front(), 0);
    EXPECT_NEAR(with_parking.distance_m, 200.0 + 1200.0 + 1000.0, 1.0);

    SequenceResult without = sequence_stops(DEPOT, stops, {}, oracle, opt);
    EXPECT_EQ(without.order.front(), 1);
}

TEST(Sequencer, EmptyRoute)
{
    auto oracle = offline_oracle();
    SequenceResult r = sequence_stops(DEPOT, {}, {}, oracle, SequencerOptions());
    EXPECT_TRUE(r.order.empty());
    EXPECT_DOUBLE_EQ(r.distance_m, 0.0);
}

TEST(Sequencer, TierNames)
{
    EXPECT_STREQ(to_string(SequencerTier::GuidedLocalSearch), "guided-local-search");
    EXPECT_STREQ(to_string(SequencerTier::TwoOpt), "two-opt");
    EXPECT_STREQ(to_string(SequencerTier::NearestNeighbor), "nearest-neighbor");
}
