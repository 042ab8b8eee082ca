#pragma once
#include "config.hpp"
#include "geo.hpp"
#include "http_client.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct RouteLeg {
    double distance_m;
    double duration_s;
    std::vector<std::string> instructions;
};

struct RouteResult {
    double distance_m;
    double duration_s;
    std::vector<GeoPoint> geometry;
    std::vector<RouteLeg> legs;
};

struct TableResult {
    std::vector<std::vector<double>> distances;   // meters, [source][destination]
    std::vector<std::vector<double>> durations;   // seconds
};

// Thin client for an OSRM server. Every call returns nullopt when the server is
// disabled, unreachable, slow or answers with something we cannot use.
class OsrmClient {
public:
    OsrmClient(const OsrmConfig& cfg, std::shared_ptr<HttpClient> http);

    bool enabled() const { return cfg_.enabled; }
    const std::string& base_url() const { return cfg_.base_url; }

    // Tiny fixed route query in Stuttgart.
    bool probe();

    std::optional<RouteResult> route(const std::vector<GeoPoint>& points,
                                     bool with_geometry,
                                     bool with_steps);

    // Empty destinations means destinations == sources.
    std::optional<TableResult> table(const std::vector<GeoPoint>& sources,
                                     const std::vector<GeoPoint>& destinations = {});

    std::optional<GeoPoint> nearest(const GeoPoint& p);

private:
    std::string service_url(const std::string& service, const std::vector<GeoPoint>& points) const;

    OsrmConfig cfg_;
    std::shared_ptr<HttpClient> http_;
};

std::string format_coordinates(const std::vector<GeoPoint>& points);
std::optional<RouteResult> parse_route_response(const nlohmann::json& j);
std::optional<TableResult> parse_table_response(const nlohmann::json& j, size_t rows, size_t cols);
std::optional<GeoPoint> parse_nearest_response(const nlohmann::json& j);
std::string describe_step(const nlohmann::json& step);
