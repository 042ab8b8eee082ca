#include <gtest/gtest.h>
#include <cstdlib>
#include "config.hpp"

using json = nlohmann::json;

TEST(Config, DefaultsMatchDocumentedValues)
{
    EngineConfig cfg;
    EXPECT_TRUE(cfg.osrm.enabled);
    EXPECT_EQ(cfg.osrm.base_url, "http://localhost:5000");
    EXPECT_EQ(cfg.osrm.probe_ttl_s, 30);
    EXPECT_EQ(cfg.overpass.radius_m, 600);
    EXPECT_EQ(cfg.overpass.cache_ttl_s, 300);
    EXPECT_DOUBLE_EQ(cfg.estimate.avg_speed_kmh, 50.0);
    EXPECT_DOUBLE_EQ(cfg.estimate.urban_buffer, 1.3);
    EXPECT_DOUBLE_EQ(cfg.parking.max_radius_m, 2000.0);
    EXPECT_EQ(cfg.clustering.method, ClusterMethod::Density);
    EXPECT_EQ(cfg.clustering.max_cluster_size, 40);
    EXPECT_EQ(cfg.planner.strategy, AssignmentStrategy::Balanced);
}

TEST(Config, LoadKeepsMissingKeys)
{
    EngineConfig cfg;
    json j = {
        {"osrm", {{"base_url", "http://osrm:5000"}, {"enabled", false}}},
        {"clustering", {{"method", "kmeans"}, {"max_cluster_size", 8}}},
        {"sequencer", {{"solver_time_limit_ms", 250}}},
        {"planner", {{"strategy", "round_robin"}, {"max_workers", 0}}}
    };
    load_config(j, cfg);

    EXPECT_EQ(cfg.osrm.base_url, "http://osrm:5000");
    EXPECT_FALSE(cfg.osrm.enabled);
    EXPECT_EQ(cfg.osrm.profile, "driving");
    EXPECT_EQ(cfg.clustering.method, ClusterMethod::Centroid);
    EXPECT_EQ(cfg.clustering.max_cluster_size, 8);
    EXPECT_EQ(cfg.clustering.min_cluster_size, 3);
    EXPECT_EQ(cfg.sequencer.solver_time_limit_ms, 250);
    EXPECT_TRUE(cfg.sequencer.use_solver);
    EXPECT_EQ(cfg.planner.strategy, AssignmentStrategy::Sequential);
    EXPECT_EQ(cfg.planner.max_workers, 1);
}

TEST(Config, UnknownMethodKeepsPrevious)
{
    EngineConfig cfg;
    load_config(json{{"clustering", {{"method", "spectral"}}}}, cfg);
    EXPECT_EQ(cfg.clustering.method, ClusterMethod::Density);
}

TEST(Config, MissingFileFails)
{
    EngineConfig cfg;
    EXPECT_FALSE(load_config_file("/nonexistent/route_engine_config.json", cfg));
}

TEST(Config, EnvironmentOverrides)
{
    setenv("OSRM_BASE_URL", "http://router:5001", 1);
    setenv("OSRM_ENABLED", "false", 1);
    setenv("OSM_PARKING_RADIUS_METERS", "750", 1);
    setenv("OSM_PARKING_DEDUPE_DECIMALS", "6", 1);
    setenv("OSM_PARKING_LIMIT", "many", 1);

    EngineConfig cfg;
    apply_env_overrides(cfg);

    unsetenv("OSRM_BASE_URL");
    unsetenv("OSRM_ENABLED");
    unsetenv("OSM_PARKING_RADIUS_METERS");
    unsetenv("OSM_PARKING_DEDUPE_DECIMALS");
    unsetenv("OSM_PARKING_LIMIT");

    EXPECT_EQ(cfg.osrm.base_url, "http://router:5001");
    EXPECT_FALSE(cfg.osrm.enabled);
    EXPECT_EQ(cfg.overpass.radius_m, 750);
    EXPECT_EQ(cfg.parking.dedupe_decimals, 6);
    EXPECT_EQ(cfg.overpass.limit, 10);
}

TEST(Config, EnumParsing)
{
    ClusterMethod m;
    EXPECT_TRUE(parse_cluster_method("DBSCAN", m));
    EXPECT_EQ(m, ClusterMethod::Density);
    EXPECT_TRUE(parse_cluster_method("centroid", m));
    EXPECT_EQ(m, ClusterMethod::Centroid);
    EXPECT_FALSE(parse_cluster_method("", m));

    AssignmentStrategy s;
    EXPECT_TRUE(parse_assignment_strategy("sequential", s));
    EXPECT_EQ(s, AssignmentStrategy::Sequential);
    EXPECT_FALSE(parse_assignment_strategy("random", s));
    EXPECT_STREQ(to_string(AssignmentStrategy::Balanced), "balanced");
}
