#include "config.hpp"
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iostream>

using json = nlohmann::json;
using namespace std;

bool parse_cluster_method(const string& s_in, ClusterMethod& out)
{
    string s = s_in;
    transform(s.begin(), s.end(), s.begin(), ::tolower);
    if (s == "density" || s == "dbscan") { out = ClusterMethod::Density; return true; }
    if (s == "centroid" || s == "kmeans") { out = ClusterMethod::Centroid; return true; }
    return false;
}

bool parse_assignment_strategy(const string& s_in, AssignmentStrategy& out)
{
    string s = s_in;
    transform(s.begin(), s.end(), s.begin(), ::tolower);
    if (s == "balanced") { out = AssignmentStrategy::Balanced; return true; }
    if (s == "sequential" || s == "round_robin") { out = AssignmentStrategy::Sequential; return true; }
    return false;
}

const char* to_string(ClusterMethod m)
{
    return m == ClusterMethod::Density ? "density" : "centroid";
}

const char* to_string(AssignmentStrategy s)
{
    return s == AssignmentStrategy::Balanced ? "balanced" : "sequential";
}

void load_config(const json& j, EngineConfig& cfg)
{
    if (j.contains("osrm")) {
        auto &o = j["osrm"];
        auto &c = cfg.osrm;
        c.enabled = o.value("enabled", c.enabled);
        c.base_url = o.value("base_url", c.base_url);
        c.profile = o.value("profile", c.profile);
        c.probe_timeout_ms = o.value("probe_timeout_ms", c.probe_timeout_ms);
        c.route_timeout_ms = o.value("route_timeout_ms", c.route_timeout_ms);
        c.table_timeout_ms = o.value("table_timeout_ms", c.table_timeout_ms);
        c.nearest_timeout_ms = o.value("nearest_timeout_ms", c.nearest_timeout_ms);
        c.probe_ttl_s = o.value("probe_ttl_s", c.probe_ttl_s);
    }

    if (j.contains("overpass")) {
        auto &o = j["overpass"];
        auto &c = cfg.overpass;
        c.enabled = o.value("enabled", c.enabled);
        c.url = o.value("url", c.url);
        c.radius_m = o.value("radius_m", c.radius_m);
        c.limit = o.value("limit", c.limit);
        c.cache_ttl_s = o.value("cache_ttl_s", c.cache_ttl_s);
        c.timeout_ms = o.value("timeout_ms", c.timeout_ms);
        c.segments_timeout_ms = o.value("segments_timeout_ms", c.segments_timeout_ms);
    }

    if (j.contains("estimate")) {
        auto &o = j["estimate"];
        cfg.estimate.avg_speed_kmh = o.value("avg_speed_kmh", cfg.estimate.avg_speed_kmh);
        cfg.estimate.urban_buffer = o.value("urban_buffer", cfg.estimate.urban_buffer);
    }

    if (j.contains("parking")) {
        auto &o = j["parking"];
        auto &c = cfg.parking;
        c.max_radius_m = o.value("max_radius_m", c.max_radius_m);
        c.synthetic_radius_m = o.value("synthetic_radius_m", c.synthetic_radius_m);
        c.synthetic_count = o.value("synthetic_count", c.synthetic_count);
        c.spacing_m = o.value("spacing_m", c.spacing_m);
        c.dedupe_decimals = o.value("dedupe_decimals", c.dedupe_decimals);
        c.max_points = o.value("max_points", c.max_points);
        if (o.contains("region")) {
            auto &r = o["region"];
            c.region.south = r.value("south", c.region.south);
            c.region.west = r.value("west", c.region.west);
            c.region.north = r.value("north", c.region.north);
            c.region.east = r.value("east", c.region.east);
        }
    }

    if (j.contains("clustering")) {
        auto &o = j["clustering"];
        auto &c = cfg.clustering;
        if (o.contains("method")) {
            string m = o["method"];
            if (!parse_cluster_method(m, c.method))
                cerr << "[config] unknown clustering method '" << m << "', keeping "
                     << to_string(c.method) << "\n";
        }
        c.radius_km = o.value("radius_km", c.radius_km);
        c.max_cluster_size = o.value("max_cluster_size", c.max_cluster_size);
        c.min_cluster_size = o.value("min_cluster_size", c.min_cluster_size);
        c.num_clusters = o.value("num_clusters", c.num_clusters);
        c.max_iterations = o.value("max_iterations", c.max_iterations);
        c.convergence_m = o.value("convergence_m", c.convergence_m);
    }

    if (j.contains("sequencer")) {
        auto &o = j["sequencer"];
        auto &c = cfg.sequencer;
        c.use_solver = o.value("use_solver", c.use_solver);
        c.solver_time_limit_ms = o.value("solver_time_limit_ms", c.solver_time_limit_ms);
        c.solver_max_iterations = o.value("solver_max_iterations", c.solver_max_iterations);
        c.two_opt_max_passes = o.value("two_opt_max_passes", c.two_opt_max_passes);
    }

    if (j.contains("planner")) {
        auto &o = j["planner"];
        auto &c = cfg.planner;
        if (o.contains("strategy")) {
            string s = o["strategy"];
            if (!parse_assignment_strategy(s, c.strategy))
                cerr << "[config] unknown assignment strategy '" << s << "', keeping "
                     << to_string(c.strategy) << "\n";
        }
        c.parking_aware = o.value("parking_aware", c.parking_aware);
        c.fetch_directions = o.value("fetch_directions", c.fetch_directions);
        c.want_geometry = o.value("want_geometry", c.want_geometry);
        c.max_workers = max(1, o.value("max_workers", c.max_workers));
    }
}

bool load_config_file(const string& filename, EngineConfig& cfg)
{
    ifstream fin(filename);
    if (!fin) {
        cerr << "Could not open config file: " << filename << "\n";
        return false;
    }

    json j;
    try {
        fin >> j;
        load_config(j, cfg);
    } catch (const exception& e) {
        cerr << "Error parsing config JSON: " << e.what() << "\n";
        return false;
    }
    return true;
}

static bool env_flag(const char* name, bool fallback)
{
    const char* v = getenv(name);
    if (!v) return fallback;
    string s = v;
    transform(s.begin(), s.end(), s.begin(), ::tolower);
    return s == "true" || s == "1" || s == "yes";
}

template <typename T>
static T env_number(const char* name, T fallback)
{
    const char* v = getenv(name);
    if (!v) return fallback;
    try {
        return static_cast<T>(stod(v));
    } catch (const exception&) {
        cerr << "[config] ignoring non-numeric " << name << "=" << v << "\n";
        return fallback;
    }
}

void apply_env_overrides(EngineConfig& cfg)
{
    if (const char* v = getenv("OSRM_BASE_URL")) cfg.osrm.base_url = v;
    cfg.osrm.enabled = env_flag("OSRM_ENABLED", cfg.osrm.enabled);

    if (const char* v = getenv("OVERPASS_URL")) cfg.overpass.url = v;
    cfg.overpass.enabled = env_flag("OSM_PARKING_ENABLED", cfg.overpass.enabled);
    cfg.overpass.radius_m = env_number("OSM_PARKING_RADIUS_METERS", cfg.overpass.radius_m);
    cfg.overpass.limit = env_number("OSM_PARKING_LIMIT", cfg.overpass.limit);
    cfg.overpass.cache_ttl_s = env_number("OSM_PARKING_CACHE_TTL", cfg.overpass.cache_ttl_s);

    cfg.parking.spacing_m = env_number("OSM_PARKING_POINT_SPACING_METERS", cfg.parking.spacing_m);
    cfg.parking.dedupe_decimals = env_number("OSM_PARKING_DEDUPE_DECIMALS", cfg.parking.dedupe_decimals);
}
