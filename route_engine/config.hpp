#pragma once
#include <string>
#include "nlohmann/json.hpp"

enum class ClusterMethod { Density, Centroid };
enum class AssignmentStrategy { Balanced, Sequential };

struct OsrmConfig {
    bool enabled = true;
    std::string base_url = "http://localhost:5000";
    std::string profile = "driving";
    long probe_timeout_ms = 2000;
    long route_timeout_ms = 5000;
    long table_timeout_ms = 10000;
    long nearest_timeout_ms = 3000;
    int probe_ttl_s = 30;
};

struct OverpassConfig {
    bool enabled = true;
    std::string url = "https://overpass-api.de/api/interpreter";
    int radius_m = 600;
    int limit = 10;
    int cache_ttl_s = 300;
    long timeout_ms = 30000;
    long segments_timeout_ms = 180000;
};

struct EstimateConfig {
    double avg_speed_kmh = 50.0;
    double urban_buffer = 1.3;
};

struct BoundingBox {
    double south;
    double west;
    double north;
    double east;
};

struct ParkingConfig {
    double max_radius_m = 2000.0;
    double synthetic_radius_m = 500.0;
    int synthetic_count = 8;
    double spacing_m = 10.0;
    int dedupe_decimals = 5;
    int max_points = 0;                          // 0 = unlimited
    BoundingBox region{47.5, 7.5, 49.8, 10.5};   // Baden-Wuerttemberg
};

struct ClusteringConfig {
    ClusterMethod method = ClusterMethod::Density;
    double radius_km = 10.0;
    int max_cluster_size = 40;
    int min_cluster_size = 3;
    int num_clusters = 0;                        // 0 = ceil(n / max_cluster_size)
    int max_iterations = 100;
    double convergence_m = 10.0;
};

struct SequencerConfig {
    bool use_solver = true;
    long solver_time_limit_ms = 5000;
    int solver_max_iterations = 200;
    int two_opt_max_passes = 1000;
};

struct PlannerConfig {
    AssignmentStrategy strategy = AssignmentStrategy::Balanced;
    bool parking_aware = true;
    bool fetch_directions = false;
    bool want_geometry = true;
    int max_workers = 4;
};

struct EngineConfig {
    OsrmConfig osrm;
    OverpassConfig overpass;
    EstimateConfig estimate;
    ParkingConfig parking;
    ClusteringConfig clustering;
    SequencerConfig sequencer;
    PlannerConfig planner;
};

// Keys missing from j keep the values already in cfg.
void load_config(const nlohmann::json& j, EngineConfig& cfg);
bool load_config_file(const std::string& filename, EngineConfig& cfg);
void apply_env_overrides(EngineConfig& cfg);

bool parse_cluster_method(const std::string& s, ClusterMethod& out);
bool parse_assignment_strategy(const std::string& s, AssignmentStrategy& out);
const char* to_string(ClusterMethod m);
const char* to_string(AssignmentStrategy s);
