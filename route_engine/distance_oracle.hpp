#pragma once
#include "config.hpp"
#include "model.hpp"
#include "osrm_client.hpp"
#include "ttl_cache.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct TravelCost {
    double distance_m;
    double duration_s;
};

struct PairCost {
    double distance_m;
    double duration_s;
    DistanceSource source;
};

// rows x cols table built once per query; every cell shares one provenance.
class DistanceMatrix {
public:
    DistanceMatrix(size_t rows, size_t cols, std::vector<TravelCost> cells, DistanceSource source);

    size_t rows() const { return rows_; }
    size_t cols() const { return cols_; }
    DistanceSource source() const { return source_; }

    const TravelCost& at(size_t i, size_t j) const;
    double distance(size_t i, size_t j) const { return at(i, j).distance_m; }
    double duration(size_t i, size_t j) const { return at(i, j).duration_s; }

private:
    size_t rows_;
    size_t cols_;
    std::vector<TravelCost> cells_;
    DistanceSource source_;
};

// One way of producing a whole matrix. attempt() returns nullopt when the tier
// cannot answer; it never throws.
class DistanceTier {
public:
    virtual ~DistanceTier() = default;
    virtual DistanceSource source() const = 0;
    // Empty destinations means a square matrix over sources.
    virtual std::optional<DistanceMatrix> attempt(const std::vector<GeoPoint>& sources,
                                                  const std::vector<GeoPoint>& destinations,
                                                  bool force_live) = 0;
};

class RoadNetworkTier : public DistanceTier {
public:
    RoadNetworkTier(std::shared_ptr<OsrmClient> osrm, std::function<bool()> available);

    DistanceSource source() const override { return DistanceSource::RoadNetwork; }
    std::optional<DistanceMatrix> attempt(const std::vector<GeoPoint>& sources,
                                          const std::vector<GeoPoint>& destinations,
                                          bool force_live) override;

private:
    std::shared_ptr<OsrmClient> osrm_;
    std::function<bool()> available_;
};

class GreatCircleTier : public DistanceTier {
public:
    explicit GreatCircleTier(const EstimateConfig& cfg) : cfg_(cfg) {}

    DistanceSource source() const override { return DistanceSource::GreatCircleEstimate; }
    std::optional<DistanceMatrix> attempt(const std::vector<GeoPoint>& sources,
                                          const std::vector<GeoPoint>& destinations,
                                          bool force_live) override;

    TravelCost estimate(const GeoPoint& a, const GeoPoint& b) const;

private:
    EstimateConfig cfg_;
};

class DistanceOracle {
public:
    using NowFn = TtlCache<std::string, bool>::NowFn;

    DistanceOracle(const EngineConfig& cfg, std::shared_ptr<HttpClient> http);
    DistanceOracle(const EstimateConfig& estimate,
                   std::shared_ptr<OsrmClient> osrm,
                   int probe_ttl_s,
                   NowFn now = [] { return std::chrono::steady_clock::now(); });

    // Cached availability probe. Advisory: force_live bypasses it.
    bool available();

    DistanceMatrix matrix(const std::vector<GeoPoint>& points, bool force_live = false);
    DistanceMatrix matrix(const std::vector<GeoPoint>& sources,
                          const std::vector<GeoPoint>& destinations,
                          bool force_live = false);
    PairCost pair(const GeoPoint& a, const GeoPoint& b, bool force_live = false);

    // Unsnapped point when the road service cannot answer.
    GeoPoint snap_to_road(const GeoPoint& p);
    std::optional<GeoPoint> try_snap_to_road(const GeoPoint& p);

    // Multi-point road query with per-leg costs and optional polyline.
    std::optional<RouteResult> path(const std::vector<GeoPoint>& points, bool with_geometry);
    std::optional<std::vector<std::string>> directions(const GeoPoint& a, const GeoPoint& b);

    TravelCost estimate(const GeoPoint& a, const GeoPoint& b) const { return great_circle_.estimate(a, b); }

private:
    DistanceMatrix run_tiers(const std::vector<GeoPoint>& sources,
                             const std::vector<GeoPoint>& destinations,
                             bool force_live);

    std::shared_ptr<OsrmClient> osrm_;
    GreatCircleTier great_circle_;
    std::vector<std::unique_ptr<DistanceTier>> tiers_;
    TtlCache<std::string, bool> probe_cache_;
};
